#include <core/constant/header.h>
#include <core/network/server/filter/forwarded_cert_filter.h>
#include <gtest/gtest.h>
#include <test_pki.h>

using namespace edgegate;
using namespace edgegate::core;
namespace http = boost::beast::http;

class ForwardedCertFilterTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        ca_ = std::make_unique<pki::TestCa>(pki::MakeCa());
        forwarded_ = pki::IssueNodeCertificate(*ca_, "edge1");
        direct_ = pki::IssueNodeCertificate(*ca_, "edge2");
    }

    static void TearDownTestSuite() {
        forwarded_.reset();
        direct_.reset();
        ca_.reset();
    }

    static RequestContext makeContext(std::optional<std::string> forwarded_header,
                                      std::string remote_address = "10.0.0.1") {
        RequestContext context;
        context.request = HttpRequest{http::verb::post, "/edge.crt", 11};
        if (forwarded_header) {
            context.request.set(header::kForwardedClientCert, *forwarded_header);
        }
        context.remote_address = std::move(remote_address);
        return context;
    }

    static ProxySettings trusted(std::vector<std::string> sources = {}) {
        ProxySettings settings;
        settings.trust_forwarded_client_cert = true;
        settings.trusted_sources = std::move(sources);
        return settings;
    }

    static std::unique_ptr<pki::TestCa> ca_;
    static X509Ptr forwarded_;
    static X509Ptr direct_;
};

std::unique_ptr<pki::TestCa> ForwardedCertFilterTest::ca_;
X509Ptr ForwardedCertFilterTest::forwarded_;
X509Ptr ForwardedCertFilterTest::direct_;

TEST_F(ForwardedCertFilterTest, RequestWithoutHeaderIsUnchanged) {
    ForwardedCertFilter filter(trusted());
    RequestContext context = makeContext(std::nullopt);

    filter.Apply(context);

    EXPECT_FALSE(context.tls.has_value());
}

TEST_F(ForwardedCertFilterTest, ForwardedCertificateCreatesConnectionState) {
    ForwardedCertFilter filter(trusted());
    RequestContext context = makeContext(pki::ForwardedHeaderFor(forwarded_.get()));

    filter.Apply(context);

    ASSERT_TRUE(context.tls.has_value());
    ASSERT_EQ(context.tls->peer_certificates.size(), 1u);
    EXPECT_TRUE(pki::SameCertificate(context.tls->peer_certificates.front().get(),
                                     forwarded_.get()));
}

TEST_F(ForwardedCertFilterTest, ForwardedCertificateReplacesPeerCertificates) {
    ForwardedCertFilter filter(trusted());
    RequestContext context = makeContext(pki::ForwardedHeaderFor(forwarded_.get()));
    context.tls = ConnectionState{{direct_, ca_->certificate}};

    filter.Apply(context);

    ASSERT_EQ(context.tls->peer_certificates.size(), 1u);
    EXPECT_TRUE(pki::SameCertificate(context.tls->peer_certificates.front().get(),
                                     forwarded_.get()));
}

TEST_F(ForwardedCertFilterTest, MalformedHeaderClearsPeerCertificates) {
    ForwardedCertFilter filter(trusted());
    RequestContext context = makeContext("%%% not a certificate %%%");
    context.tls = ConnectionState{{direct_}};

    filter.Apply(context);

    ASSERT_TRUE(context.tls.has_value());
    EXPECT_TRUE(context.tls->peer_certificates.empty());
}

TEST_F(ForwardedCertFilterTest, MalformedHeaderWithoutTlsLeavesEmptyState) {
    ForwardedCertFilter filter(trusted());
    RequestContext context = makeContext(base64::Encode(ToBinary("garbage")));

    filter.Apply(context);

    ASSERT_TRUE(context.tls.has_value());
    EXPECT_TRUE(context.tls->peer_certificates.empty());
}

TEST_F(ForwardedCertFilterTest, HeaderIgnoredWhenForwardingNotTrusted) {
    ForwardedCertFilter filter(ProxySettings{});
    RequestContext context = makeContext(pki::ForwardedHeaderFor(forwarded_.get()));
    context.tls = ConnectionState{{direct_}};

    filter.Apply(context);

    ASSERT_EQ(context.tls->peer_certificates.size(), 1u);
    EXPECT_TRUE(pki::SameCertificate(context.tls->peer_certificates.front().get(), direct_.get()));
}

TEST_F(ForwardedCertFilterTest, HeaderIgnoredFromUntrustedSource) {
    ForwardedCertFilter filter(trusted({"192.168.1.10"}));
    RequestContext context = makeContext(pki::ForwardedHeaderFor(forwarded_.get()), "10.0.0.1");

    filter.Apply(context);

    EXPECT_FALSE(context.tls.has_value());
}

TEST_F(ForwardedCertFilterTest, HeaderUsedFromTrustedSource) {
    ForwardedCertFilter filter(trusted({"192.168.1.10"}));
    RequestContext context = makeContext(pki::ForwardedHeaderFor(forwarded_.get()),
                                         "192.168.1.10");

    filter.Apply(context);

    ASSERT_TRUE(context.tls.has_value());
    EXPECT_EQ(context.tls->peer_certificates.size(), 1u);
}

TEST_F(ForwardedCertFilterTest, TrustedSourceMatchesV4MappedAddress) {
    ForwardedCertFilter filter(trusted({"192.168.1.10"}));

    EXPECT_TRUE(filter.IsTrustedSource("::ffff:192.168.1.10"));
    EXPECT_FALSE(filter.IsTrustedSource("::ffff:192.168.1.11"));
    EXPECT_FALSE(filter.IsTrustedSource("unknown"));
}

TEST_F(ForwardedCertFilterTest, InvalidTrustedSourceIsRejected) {
    EXPECT_THROW({ ForwardedCertFilter filter(trusted({"not-an-ip"})); }, std::runtime_error);
}

TEST_F(ForwardedCertFilterTest, EmptyHeaderKeepsDirectCertificate) {
    ForwardedCertFilter filter(trusted());
    RequestContext context = makeContext("");
    context.tls = ConnectionState{{direct_}};

    filter.Apply(context);

    ASSERT_TRUE(context.tls.has_value());
    ASSERT_EQ(context.tls->peer_certificates.size(), 1u);
    EXPECT_TRUE(pki::SameCertificate(context.tls->peer_certificates.front().get(), direct_.get()));
}

TEST_F(ForwardedCertFilterTest, EmptyHeaderWithoutTlsIsUnchanged) {
    ForwardedCertFilter filter(trusted());
    RequestContext context = makeContext("");

    filter.Apply(context);

    EXPECT_FALSE(context.tls.has_value());
}
