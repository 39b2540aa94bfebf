#pragma once

#include <chrono>
#include <core/model/root_of_trust.h>
#include <core/util/binary_data.h>
#include <stdexcept>
#include <string>
#include <string_view>

namespace edgegate::core {

namespace token {

class TokenError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Create an HMAC-signed JWT whose only claims are iat and exp
 *
 * @param key HMAC secret
 * @param ttl lifetime counted from now
 */
std::string Create(const BinaryData& key, std::chrono::seconds ttl);

/**
 * @brief Create a bootstrap token "<ca-hash>.<jwt>" for a new edge node
 *
 * The node pins the CA by hash and sends only the JWT part as its bearer token.
 */
std::string CreateBootstrapToken(const RootOfTrust& root, std::chrono::hours ttl);

/**
 * @brief Verify an HMAC-signed JWT (HS256, HS384 or HS512)
 *
 * @return false when the signature does not match or the token is outside its
 *         validity window
 * @throws TokenError when the token is malformed or uses a non-HMAC algorithm
 */
bool Verify(std::string_view token, const BinaryData& key);

} // namespace token

} // namespace edgegate::core
