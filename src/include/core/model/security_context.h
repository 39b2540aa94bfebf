#pragma once

#include <string>

namespace edgegate::core {

// The gateway's own TLS serving identity, issued by the root of trust.
struct SecurityContext {
    std::string private_key_pem;
    std::string certificate_pem;
    std::string certificate_hash; // SHA-256 fingerprint of the certificate DER
};

} // namespace edgegate::core
