#pragma once

#include <boost/asio/ip/address.hpp>
#include <core/network/server/http_server.h>
#include <core/util/config.h>
#include <string_view>
#include <vector>

namespace edgegate::core {

/**
 * @brief Turns a proxy-forwarded client certificate into the request's peer certificate
 *
 * Used when a TLS-terminating proxy sits in front of the gateway and passes the
 * client certificate in the X-Forwarded-Client-Cert header. The filter never
 * rejects a request: a value that cannot be decoded leaves the request without
 * any peer certificate, so it has to fall back to the token path.
 */
class ForwardedCertFilter {
public:
    explicit ForwardedCertFilter(const ProxySettings& settings);

    void Apply(RequestContext& context) const;

    // True when headers from `remote_address` may be trusted.
    bool IsTrustedSource(std::string_view remote_address) const;

    void InstallFilter(HttpServer& server);

private:
    bool trust_forwarded_client_cert_;
    std::vector<boost::asio::ip::address> trusted_sources_;
};

} // namespace edgegate::core
