#pragma once

#include <core/model/root_of_trust.h>
#include <string_view>

namespace edgegate::core {

// Bearer-token path, taken when the request carries no client certificate.
class TokenValidator {
public:
    explicit TokenValidator(const RootOfTrust& root);

    /**
     * @brief Validate an Authorization header of the form "<scheme> <token>"
     *
     * The token is checked against the CA private key.
     *
     * @throws AuthError (401) when the header is empty, malformed or the token is invalid
     */
    void Verify(std::string_view authorization) const;

private:
    const RootOfTrust& root_;
};

} // namespace edgegate::core
