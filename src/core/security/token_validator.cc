#include <core/model/enrollment_error.h>
#include <core/security/token.h>
#include <core/security/token_validator.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace edgegate::core {

TokenValidator::TokenValidator(const RootOfTrust& root)
    : root_(root) {}

void TokenValidator::Verify(std::string_view authorization) const {
    if (authorization.empty()) {
        throw AuthError("token validation failure, token is empty");
    }

    // Split on every single space, so "Bearer  token" has three parts and is rejected.
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        std::size_t space = authorization.find(' ', start);
        parts.push_back(authorization.substr(start, space - start));
        if (space == std::string_view::npos) {
            break;
        }
        start = space + 1;
    }
    if (parts.size() != 2) {
        throw AuthError("token validation failure, token cannot be splited");
    }
    spdlog::debug("Validating bearer token with scheme {}", parts[0]);

    bool valid = false;
    try {
        valid = token::Verify(parts[1], root_.private_key_der());
    } catch (const token::TokenError& e) {
        throw AuthError(std::string("token validation failure, err: ") + e.what());
    }
    if (!valid) {
        throw AuthError("token validation failure, valid is false");
    }
}

} // namespace edgegate::core
