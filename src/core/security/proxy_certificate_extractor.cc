#include <core/model/enrollment_error.h>
#include <core/security/proxy_certificate_extractor.h>
#include <core/util/base64.h>
#include <optional>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <string>

namespace edgegate::core {

namespace {

constexpr std::string_view kBeginMarker = "-----BEGIN ";
constexpr std::string_view kDashes = "-----";
constexpr std::string_view kCertificateType = "CERTIFICATE";

struct PemBlock {
    std::string_view type;
    std::string_view body;
};

// Finds the next complete "-----BEGIN T-----" ... "-----END T-----" block at or after `pos`.
// A malformed or unterminated BEGIN line is skipped and the scan goes on after it.
std::optional<PemBlock> nextPemBlock(std::string_view text, std::size_t& pos) {
    std::size_t search = pos;
    while (true) {
        std::size_t begin = text.find(kBeginMarker, search);
        if (begin == std::string_view::npos) {
            return std::nullopt;
        }
        search = begin + 1;

        std::size_t type_start = begin + kBeginMarker.size();
        std::size_t type_end = text.find(kDashes, type_start);
        if (type_end == std::string_view::npos) {
            return std::nullopt;
        }
        std::string_view type = text.substr(type_start, type_end - type_start);
        if (type.find('\n') != std::string_view::npos) {
            continue;
        }

        std::string end_marker = fmt::format("-----END {}-----", type);
        std::size_t body_start = type_end + kDashes.size();
        std::size_t body_end = text.find(end_marker, body_start);
        if (body_end == std::string_view::npos) {
            continue;
        }

        pos = body_end + end_marker.size();
        return PemBlock{type, text.substr(body_start, body_end - body_start)};
    }
}

X509Ptr parseDer(const BinaryData& der) {
    try {
        return OpenSSLProvider::ParseCertificateDer(der);
    } catch (const std::exception& e) {
        throw ParseError(e.what());
    }
}

} // namespace

X509Ptr ProxyCertificateExtractor::Extract(std::string_view header_value) {
    auto decoded = base64::Decode(header_value);
    if (!decoded) {
        throw ParseError("illegal base64 data in forwarded client certificate");
    }

    std::string_view text = AsStringView(*decoded);
    std::size_t pos = 0;
    bool found_block = false;
    while (auto block = nextPemBlock(text, pos)) {
        found_block = true;
        if (block->type != kCertificateType) {
            spdlog::debug("Skipping PEM block of type {} in forwarded certificate", block->type);
            continue;
        }
        // base64::Decode skips the whitespace a proxy may have folded into the body
        auto der = base64::Decode(block->body);
        if (!der) {
            throw ParseError("illegal base64 data in forwarded CERTIFICATE block");
        }
        return parseDer(*der);
    }

    if (found_block) {
        throw ParseError("no CERTIFICATE block in forwarded client certificate");
    }
    return parseDer(*decoded);
}

} // namespace edgegate::core
