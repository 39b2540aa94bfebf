#pragma once

#include <core/security/open_ssl_provider.h>
#include <vector>

namespace edgegate::core {

// Security state of the transport a request arrived on. Copied into every request,
// so a filter that rewrites it affects that request only.
struct ConnectionState {
    std::vector<X509Ptr> peer_certificates; // leaf first
};

} // namespace edgegate::core
