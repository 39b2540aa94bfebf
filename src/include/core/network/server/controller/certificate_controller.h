#pragma once

#include <boost/asio.hpp>
#include <core/model/root_of_trust.h>
#include <core/network/server/http_server.h>
#include <core/security/certificate_signer.h>
#include <core/security/token_validator.h>
#include <core/security/trust_verifier.h>
#include <core/util/binary_data.h>
#include <core/util/config.h>
#include <memory>
#include <string_view>

namespace edgegate::core {

// Serves the CA certificate and issues edge node certificates.
class CertificateController {
public:
    CertificateController(const RootOfTrust& root,
                          const Settings& settings,
                          std::unique_ptr<CsrSigner> signer = std::make_unique<X509CsrSigner>());
    ~CertificateController() = default;

    void InstallRoutes(HttpServer& server);

    /**
     * @brief Authenticate the caller and sign the CSR in the request body
     *
     * A peer certificate, when present, is the only evidence considered; the bearer
     * token is checked only for requests that carry no certificate at all.
     *
     * @return 200 with the PEM certificate, 401 when authentication fails, 500 when
     *         signing fails
     */
    HttpResponse Enroll(const RequestContext& context) const;

    // DER of the CA certificate. No authentication.
    HttpResponse GetCaCertificate(const HttpRequest& req) const;

    // Body as bytes, or SignError when it exceeds `limit`.
    static BinaryData ReadBoundedBody(std::string_view body, std::size_t limit);

private:
    boost::asio::awaitable<HttpResponse> onEdgeCertificate(RequestContext&& context);

    boost::asio::awaitable<HttpResponse> onCaCertificate(RequestContext&& context);

    const RootOfTrust& root_;
    TrustVerifier trust_verifier_;
    TokenValidator token_validator_;
    CertificateSigner signer_;
    std::size_t max_csr_bytes_;
};

} // namespace edgegate::core
