#include <chrono>
#include <cstdint>
#include <core/security/open_ssl_provider.h>
#include <core/security/token.h>
#include <core/util/base64.h>
#include <nlohmann/json.hpp>
#include <openssl/hmac.h>
#include <spdlog/fmt/fmt.h>
#include <vector>

using json = nlohmann::json;

namespace edgegate::core {

namespace token {

namespace {

const EVP_MD* digestFor(std::string_view alg) {
    if (alg == "HS256") {
        return EVP_sha256();
    }
    if (alg == "HS384") {
        return EVP_sha384();
    }
    if (alg == "HS512") {
        return EVP_sha512();
    }
    return nullptr;
}

BinaryData sign(const EVP_MD* md, const BinaryData& key, std::string_view signing_input) {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    if (!HMAC(md,
              key.data(),
              static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(signing_input.data()),
              signing_input.size(),
              mac,
              &mac_len)) {
        throw TokenError("failed to compute token signature: " + OpenSSLProvider::LastError());
    }
    return BinaryData(mac, mac + mac_len);
}

json decodeSegment(std::string_view segment, std::string_view what) {
    auto raw = base64::DecodeUrl(segment);
    if (!raw) {
        throw TokenError(fmt::format("token is malformed: illegal base64 data in {}", what));
    }
    json value = json::parse(raw->begin(), raw->end(), nullptr, false);
    if (value.is_discarded() || !value.is_object()) {
        throw TokenError(fmt::format("token is malformed: {} is not a JSON object", what));
    }
    return value;
}

std::int64_t unixNow() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

std::string Create(const BinaryData& key, std::chrono::seconds ttl) {
    std::int64_t now = unixNow();
    json header = {{"alg", "HS256"}, {"typ", "JWT"}};
    json claims = {{"iat", now}, {"exp", now + ttl.count()}};

    std::string signing_input = base64::EncodeUrl(ToBinary(header.dump())) + "."
                                + base64::EncodeUrl(ToBinary(claims.dump()));
    BinaryData signature = sign(EVP_sha256(), key, signing_input);
    return signing_input + "." + base64::EncodeUrl(signature);
}

std::string CreateBootstrapToken(const RootOfTrust& root, std::chrono::hours ttl) {
    return root.certificate_hash() + "." + Create(root.private_key_der(), ttl);
}

bool Verify(std::string_view token, const BinaryData& key) {
    std::size_t first = token.find('.');
    std::size_t second = first == std::string_view::npos ? first : token.find('.', first + 1);
    if (second == std::string_view::npos || token.find('.', second + 1) != std::string_view::npos) {
        throw TokenError("token contains an invalid number of segments");
    }

    json header = decodeSegment(token.substr(0, first), "header");
    json claims = decodeSegment(token.substr(first + 1, second - first - 1), "claims");
    auto signature = base64::DecodeUrl(token.substr(second + 1));
    if (!signature) {
        throw TokenError("token is malformed: illegal base64 data in signature");
    }

    std::string alg;
    if (header.contains("alg") && header["alg"].is_string()) {
        alg = header["alg"].get<std::string>();
    }
    const EVP_MD* md = digestFor(alg);
    if (!md) {
        throw TokenError(fmt::format("unexpected signing method: {}", alg));
    }

    BinaryData expected = sign(md, key, token.substr(0, second));
    if (expected.size() != signature->size()
        || CRYPTO_memcmp(expected.data(), signature->data(), expected.size()) != 0) {
        return false;
    }

    std::int64_t now = unixNow();
    if (claims.contains("exp")) {
        if (!claims["exp"].is_number() || claims["exp"].get<std::int64_t>() < now) {
            return false;
        }
    }
    if (claims.contains("nbf")) {
        if (!claims["nbf"].is_number() || claims["nbf"].get<std::int64_t>() > now) {
            return false;
        }
    }
    return true;
}

} // namespace token

} // namespace edgegate::core
