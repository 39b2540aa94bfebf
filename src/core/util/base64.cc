#include <cctype>
#include <core/util/base64.h>
#include <openssl/evp.h>

namespace edgegate::core {

namespace base64 {

namespace {

bool isAlphabet(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

} // namespace

std::optional<BinaryData> Decode(std::string_view input) {
    std::string clean;
    clean.reserve(input.size());
    for (char c : input) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        clean.push_back(c);
    }
    if (clean.empty()) {
        return BinaryData{};
    }
    if (clean.size() % 4 != 0) {
        return std::nullopt;
    }

    std::size_t padding = 0;
    for (std::size_t i = 0; i < clean.size(); ++i) {
        char c = clean[i];
        if (c == '=') {
            // '=' may only appear in the last two positions of the final quantum
            if (i < clean.size() - 2) {
                return std::nullopt;
            }
            ++padding;
        } else if (padding > 0 || !isAlphabet(c)) {
            return std::nullopt;
        }
    }

    BinaryData out(clean.size() / 4 * 3);
    int len = EVP_DecodeBlock(out.data(),
                              reinterpret_cast<const unsigned char*>(clean.data()),
                              static_cast<int>(clean.size()));
    if (len < 0 || static_cast<std::size_t>(len) < padding) {
        return std::nullopt;
    }
    out.resize(static_cast<std::size_t>(len) - padding);
    return out;
}

std::string Encode(const BinaryData& data) {
    if (data.empty()) {
        return {};
    }
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                              data.data(),
                              static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(len));
    return out;
}

std::optional<BinaryData> DecodeUrl(std::string_view input) {
    std::string standard;
    standard.reserve(input.size() + 2);
    for (char c : input) {
        switch (c) {
        case '-':
            standard.push_back('+');
            break;
        case '_':
            standard.push_back('/');
            break;
        case '+':
        case '/':
        case '=':
            return std::nullopt;
        default:
            if (std::isspace(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
            standard.push_back(c);
        }
    }
    if (standard.size() % 4 == 1) {
        return std::nullopt;
    }
    while (standard.size() % 4 != 0) {
        standard.push_back('=');
    }
    return Decode(standard);
}

std::string EncodeUrl(const BinaryData& data) {
    std::string out = Encode(data);
    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    for (char& c : out) {
        if (c == '+') {
            c = '-';
        } else if (c == '/') {
            c = '_';
        }
    }
    return out;
}

} // namespace base64

} // namespace edgegate::core
