#include <core/constant/header.h>
#include <core/constant/route.h>
#include <core/model/enrollment_error.h>
#include <core/network/server/controller/certificate_controller.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;
namespace http = boost::beast::http;

namespace edgegate::core {

namespace {

std::string_view headerValue(const HttpRequest& req, std::string_view name) {
    auto it = req.find(name);
    if (it == req.end()) {
        return {};
    }
    return std::string_view(it->value().data(), it->value().size());
}

} // namespace

CertificateController::CertificateController(const RootOfTrust& root,
                                             const Settings& settings,
                                             std::unique_ptr<CsrSigner> signer)
    : root_(root)
    , trust_verifier_(root, settings.policy.allow_legacy_subject)
    , token_validator_(root)
    , signer_(root, settings.enrollment, std::move(signer))
    , max_csr_bytes_(settings.enrollment.max_csr_bytes) {}

BinaryData CertificateController::ReadBoundedBody(std::string_view body, std::size_t limit) {
    if (body.size() > limit) {
        throw SignError("http: request body too large");
    }
    return ToBinary(body);
}

HttpResponse CertificateController::Enroll(const RequestContext& context) const {
    const HttpRequest& req = context.request;
    std::string node_name(headerValue(req, header::kNodeName));

    bool has_peer_certificate = context.tls && !context.tls->peer_certificates.empty();
    if (has_peer_certificate) {
        try {
            trust_verifier_.Verify(context.tls->peer_certificates.front().get(), node_name);
        } catch (const AuthError& e) {
            spdlog::warn("Rejected edge node {} from {}: certificate verification failed",
                         node_name,
                         context.remote_address);
            return HttpServer::Unauthorized(
                req.version(),
                req.keep_alive(),
                fmt::format("failed to verify the certificate for edgenode: {}, err: {}",
                            node_name,
                            e.what()));
        }
        spdlog::info("Edge node {} from {} authenticated by client certificate",
                     node_name,
                     context.remote_address);
    } else {
        try {
            token_validator_.Verify(headerValue(req, header::kAuthorization));
        } catch (const AuthError& e) {
            spdlog::warn("Rejected edge node {} from {}: {}",
                         node_name,
                         context.remote_address,
                         e.what());
            return HttpServer::Error(e.status(), req.version(), req.keep_alive(), e.what());
        }
        spdlog::info("Edge node {} from {} authenticated by token",
                     node_name,
                     context.remote_address);
    }

    try {
        BinaryData csr = ReadBoundedBody(req.body(), max_csr_bytes_);
        std::string certificate = signer_.Sign(csr, headerValue(req, header::kExtKeyUsages));
        spdlog::info("Issued certificate for edge node {}, valid for {}h",
                     node_name,
                     signer_.validity().count());
        return HttpServer::Ok(req.version(),
                              req.keep_alive(),
                              certificate,
                              "application/x-pem-file");
    } catch (const SignError& e) {
        spdlog::error("Failed to sign certificate for edge node {}: {}", node_name, e.what());
        return HttpServer::InternalServerError(
            req.version(),
            req.keep_alive(),
            fmt::format("failed to sign certs for edgenode {}, err: {}", node_name, e.what()));
    }
}

HttpResponse CertificateController::GetCaCertificate(const HttpRequest& req) const {
    return HttpServer::Ok(req.version(),
                          req.keep_alive(),
                          AsStringView(root_.certificate_der()),
                          "application/octet-stream");
}

net::awaitable<HttpResponse> CertificateController::onEdgeCertificate(RequestContext&& context) {
    spdlog::debug("CertificateController::onEdgeCertificate");
    co_return Enroll(context);
}

net::awaitable<HttpResponse> CertificateController::onCaCertificate(RequestContext&& context) {
    spdlog::debug("CertificateController::onCaCertificate");
    co_return GetCaCertificate(context.request);
}

void CertificateController::InstallRoutes(HttpServer& server) {
    server.AddRoute(ApiRoute::kCaCertificate.data(),
                    http::verb::get,
                    std::bind(&CertificateController::onCaCertificate, this, std::placeholders::_1));
    server.AddRoute(ApiRoute::kEdgeCertificate.data(),
                    http::verb::post,
                    std::bind(&CertificateController::onEdgeCertificate,
                              this,
                              std::placeholders::_1));
}

} // namespace edgegate::core
