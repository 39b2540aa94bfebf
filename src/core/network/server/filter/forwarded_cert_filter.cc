#include <algorithm>
#include <core/constant/header.h>
#include <core/model/enrollment_error.h>
#include <core/network/server/filter/forwarded_cert_filter.h>
#include <core/security/proxy_certificate_extractor.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace net = boost::asio;

namespace edgegate::core {

namespace {

// Maps ::ffff:a.b.c.d to a.b.c.d so IPv4 allow-list entries match dual-stack peers.
net::ip::address normalize(const net::ip::address& address) {
    if (address.is_v6() && address.to_v6().is_v4_mapped()) {
        return net::ip::make_address_v4(net::ip::v4_mapped, address.to_v6());
    }
    return address;
}

} // namespace

ForwardedCertFilter::ForwardedCertFilter(const ProxySettings& settings)
    : trust_forwarded_client_cert_(settings.trust_forwarded_client_cert) {
    for (const auto& source : settings.trusted_sources) {
        boost::system::error_code ec;
        auto address = net::ip::make_address(source, ec);
        if (ec) {
            throw std::runtime_error("invalid proxy.trusted-sources entry: " + source);
        }
        trusted_sources_.push_back(normalize(address));
    }
    if (trust_forwarded_client_cert_) {
        spdlog::info("Forwarded client certificates trusted from {}",
                     trusted_sources_.empty() ? "any source"
                                              : std::to_string(trusted_sources_.size())
                                                    + " source(s)");
    }
}

bool ForwardedCertFilter::IsTrustedSource(std::string_view remote_address) const {
    if (!trust_forwarded_client_cert_) {
        return false;
    }
    if (trusted_sources_.empty()) {
        return true;
    }
    boost::system::error_code ec;
    auto address = net::ip::make_address(std::string(remote_address), ec);
    if (ec) {
        return false;
    }
    return std::find(trusted_sources_.begin(), trusted_sources_.end(), normalize(address))
           != trusted_sources_.end();
}

void ForwardedCertFilter::Apply(RequestContext& context) const {
    // An empty value is a proxy placeholder for "no client certificate".
    auto it = context.request.find(header::kForwardedClientCert);
    if (it == context.request.end() || it->value().empty()) {
        return;
    }

    if (!IsTrustedSource(context.remote_address)) {
        spdlog::warn("Ignoring {} header from untrusted source {}",
                     header::kForwardedClientCert,
                     context.remote_address);
        return;
    }

    try {
        X509Ptr cert = ProxyCertificateExtractor::Extract(
            std::string_view(it->value().data(), it->value().size()));
        if (!context.tls) {
            context.tls.emplace();
        }
        context.tls->peer_certificates = {std::move(cert)};
        spdlog::debug("Using forwarded client certificate for request from {}",
                      context.remote_address);
    } catch (const ParseError& e) {
        spdlog::warn("Failed to parse forwarded client certificate from {}: {}",
                     context.remote_address,
                     e.what());
        context.tls = ConnectionState{};
    }
}

void ForwardedCertFilter::InstallFilter(HttpServer& server) {
    server.AddFilter([this](RequestContext& context) { Apply(context); });
}

} // namespace edgegate::core
