#include <core/constant/header.h>
#include <core/network/server/controller/certificate_controller.h>
#include <core/security/token.h>
#include <gtest/gtest.h>
#include <test_pki.h>

using namespace edgegate;
using namespace edgegate::core;
namespace http = boost::beast::http;

namespace {

class CountingCsrSigner : public CsrSigner {
public:
    explicit CountingCsrSigner(std::shared_ptr<int> calls)
        : calls_(std::move(calls)) {}

    BinaryData Sign(const BinaryData& csr,
                    X509* ca_cert,
                    EVP_PKEY* ca_key,
                    const ExtKeyUsages& usages,
                    std::chrono::seconds validity) const override {
        ++*calls_;
        return X509CsrSigner().Sign(csr, ca_cert, ca_key, usages, validity);
    }

private:
    std::shared_ptr<int> calls_;
};

} // namespace

class CertificateControllerTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() { ca_ = std::make_unique<pki::TestCa>(pki::MakeCa()); }

    static void TearDownTestSuite() { ca_.reset(); }

    void SetUp() override {
        settings_.enrollment.edge_cert_signing_duration_days = 365;
        calls_ = std::make_shared<int>(0);
        controller_ = std::make_unique<CertificateController>(
            *ca_->root, settings_, std::make_unique<CountingCsrSigner>(calls_));
    }

    static RequestContext makeRequest(const std::string& node_name,
                                      std::string body = pki::MakeCsr("system:nodes",
                                                                      "system:node:edge1")) {
        RequestContext context;
        context.request = HttpRequest{http::verb::post, "/edge.crt", 11};
        context.request.set(header::kNodeName, node_name);
        context.request.body() = std::move(body);
        context.request.prepare_payload();
        context.remote_address = "10.0.0.1";
        return context;
    }

    static void withCertificate(RequestContext& context, X509Ptr cert) {
        context.tls = ConnectionState{{std::move(cert)}};
    }

    std::string validAuthorization() const {
        return "Bearer " + token::Create(ca_->root->private_key_der(), std::chrono::hours(1));
    }

    static std::unique_ptr<pki::TestCa> ca_;
    Settings settings_;
    std::shared_ptr<int> calls_;
    std::unique_ptr<CertificateController> controller_;
};

std::unique_ptr<pki::TestCa> CertificateControllerTest::ca_;

TEST_F(CertificateControllerTest, ClientCertificateEnrollmentReturnsPem) {
    RequestContext context = makeRequest("edge1");
    withCertificate(context, pki::IssueNodeCertificate(*ca_, "edge1"));

    HttpResponse res = controller_->Enroll(context);

    ASSERT_EQ(res.result(), http::status::ok) << res.body();
    EXPECT_EQ(res[http::field::content_type], "application/x-pem-file");
    X509Ptr cert = OpenSSLProvider::ParseCertificatePem(res.body());
    EXPECT_EQ(X509_check_issued(ca_->certificate.get(), cert.get()), X509_V_OK);
    EXPECT_EQ(X509_check_purpose(cert.get(), X509_PURPOSE_SSL_CLIENT, 0), 1);
    int days = 0;
    int seconds = 0;
    ASN1_TIME_diff(&days, &seconds, X509_get0_notBefore(cert.get()), X509_get0_notAfter(cert.get()));
    EXPECT_EQ(days, 365);
    EXPECT_EQ(seconds, 0);
    EXPECT_EQ(*calls_, 1);
}

TEST_F(CertificateControllerTest, CertificateForOtherNodeIsUnauthorized) {
    RequestContext context = makeRequest("beta");
    withCertificate(context, pki::IssueNodeCertificate(*ca_, "alpha"));

    HttpResponse res = controller_->Enroll(context);

    EXPECT_EQ(res.result(), http::status::unauthorized);
    EXPECT_EQ(res.body(),
              "failed to verify the certificate for edgenode: beta, err: request node name is not "
              "match with the certificate");
    EXPECT_EQ(*calls_, 0);
}

TEST_F(CertificateControllerTest, RejectedCertificateDoesNotFallBackToToken) {
    pki::TestCa other = pki::MakeCa("other-ca");
    RequestContext context = makeRequest("edge1");
    withCertificate(context, pki::IssueNodeCertificate(other, "edge1"));
    context.request.set(header::kAuthorization, validAuthorization());

    HttpResponse res = controller_->Enroll(context);

    EXPECT_EQ(res.result(), http::status::unauthorized);
    EXPECT_EQ(res.body().rfind("failed to verify the certificate for edgenode: edge1, err: "
                               "failed to verify edge certificate: ",
                               0),
              0u)
        << res.body();
    EXPECT_EQ(*calls_, 0);
}

TEST_F(CertificateControllerTest, TokenEnrollmentReturnsPem) {
    RequestContext context = makeRequest("edge1");
    context.request.set(header::kAuthorization, validAuthorization());

    HttpResponse res = controller_->Enroll(context);

    ASSERT_EQ(res.result(), http::status::ok) << res.body();
    EXPECT_NO_THROW(OpenSSLProvider::ParseCertificatePem(res.body()));
}

TEST_F(CertificateControllerTest, EmptyConnectionStateUsesToken) {
    RequestContext context = makeRequest("edge1");
    context.tls = ConnectionState{};
    context.request.set(header::kAuthorization, validAuthorization());

    HttpResponse res = controller_->Enroll(context);

    EXPECT_EQ(res.result(), http::status::ok) << res.body();
}

TEST_F(CertificateControllerTest, SchemeOnlyAuthorizationIsUnauthorized) {
    RequestContext context = makeRequest("edge1");
    context.request.set(header::kAuthorization, "Bearer");

    HttpResponse res = controller_->Enroll(context);

    EXPECT_EQ(res.result(), http::status::unauthorized);
    EXPECT_EQ(res.body(), "token validation failure, token cannot be splited");
}

TEST_F(CertificateControllerTest, MissingAuthorizationIsUnauthorized) {
    RequestContext context = makeRequest("edge1");

    HttpResponse res = controller_->Enroll(context);

    EXPECT_EQ(res.result(), http::status::unauthorized);
    EXPECT_EQ(res.body(), "token validation failure, token is empty");
    EXPECT_EQ(*calls_, 0);
}

TEST_F(CertificateControllerTest, OversizedBodyIsRejectedBeforeSigning) {
    settings_.enrollment.max_csr_bytes = 64;
    controller_ = std::make_unique<CertificateController>(
        *ca_->root, settings_, std::make_unique<CountingCsrSigner>(calls_));
    RequestContext context = makeRequest("edge1", std::string(65, 'x'));
    withCertificate(context, pki::IssueNodeCertificate(*ca_, "edge1"));

    HttpResponse res = controller_->Enroll(context);

    EXPECT_EQ(res.result(), http::status::internal_server_error);
    EXPECT_EQ(res.body(),
              "failed to sign certs for edgenode edge1, err: http: request body too large");
    EXPECT_EQ(*calls_, 0);
}

TEST_F(CertificateControllerTest, BodyAtLimitIsAccepted) {
    EXPECT_EQ(CertificateController::ReadBoundedBody("abcd", 4), ToBinary("abcd"));
    EXPECT_THROW(CertificateController::ReadBoundedBody("abcde", 4), SignError);
}

TEST_F(CertificateControllerTest, InvalidUsagesHeaderIsServerError) {
    RequestContext context = makeRequest("edge1");
    withCertificate(context, pki::IssueNodeCertificate(*ca_, "edge1"));
    context.request.set(header::kExtKeyUsages, "not-json");

    HttpResponse res = controller_->Enroll(context);

    EXPECT_EQ(res.result(), http::status::internal_server_error);
    EXPECT_EQ(res.body().rfind("failed to sign certs for edgenode edge1, err: unmarshal http "
                               "header ExtKeyUsages fail, err: ",
                               0),
              0u)
        << res.body();
    EXPECT_EQ(*calls_, 0);
}

TEST_F(CertificateControllerTest, CaCertificateIsServedAsDer) {
    HttpRequest req{http::verb::get, "/ca.crt", 11};

    HttpResponse res = controller_->GetCaCertificate(req);

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/octet-stream");
    EXPECT_EQ(ToBinary(res.body()), ca_->root->certificate_der());
}
