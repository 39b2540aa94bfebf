#include <core/util/config.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string_view>

using namespace edgegate::core;

namespace {

Settings parse(std::string_view text) {
    return ParseSettings(toml::parse(text));
}

} // namespace

TEST(ConfigTest, EmptyDocumentYieldsDefaults) {
    Settings settings = parse("");

    EXPECT_EQ(settings.server.address, "0.0.0.0");
    EXPECT_EQ(settings.server.port, 10002);
    EXPECT_TRUE(settings.server.tls);
    EXPECT_EQ(settings.server.threads, 4u);
    EXPECT_EQ(settings.server.max_request_bytes, 8u * 1024 * 1024);
    EXPECT_EQ(settings.ca.cert_file.string(), "/etc/edgegate/ca/rootCA.crt");
    EXPECT_EQ(settings.enrollment.edge_cert_signing_duration_days, 365);
    EXPECT_EQ(settings.enrollment.max_csr_bytes, 1024u * 1024);
    EXPECT_EQ(settings.enrollment.token_refresh_duration_hours, 12);
    EXPECT_FALSE(settings.proxy.trust_forwarded_client_cert);
    EXPECT_TRUE(settings.proxy.trusted_sources.empty());
    EXPECT_TRUE(settings.policy.allow_legacy_subject);
    EXPECT_EQ(settings.log.level, "info");
}

TEST(ConfigTest, ReadsEverySection) {
    Settings settings = parse(R"(
[server]
address = "127.0.0.1"
port = 8443
tls = false
threads = 2
max-request-bytes = 4096

[ca]
cert-file = "/tmp/ca.crt"
key-file = "/tmp/ca.key"
server-cert-file = "/tmp/server.crt"
server-key-file = "/tmp/server.key"

[enrollment]
edge-cert-signing-duration = 30
max-csr-bytes = 2048
token-refresh-duration = 6

[proxy]
trust-forwarded-client-cert = true
trusted-sources = ["10.0.0.1", "10.0.0.2"]

[policy]
allow-legacy-subject = false

[log]
level = "debug"
dir = "/tmp/edgegate-logs"
)");

    EXPECT_EQ(settings.server.address, "127.0.0.1");
    EXPECT_EQ(settings.server.port, 8443);
    EXPECT_FALSE(settings.server.tls);
    EXPECT_EQ(settings.server.threads, 2u);
    EXPECT_EQ(settings.server.max_request_bytes, 4096u);
    EXPECT_EQ(settings.ca.cert_file.string(), "/tmp/ca.crt");
    EXPECT_EQ(settings.ca.key_file.string(), "/tmp/ca.key");
    EXPECT_EQ(settings.ca.server_cert_file.string(), "/tmp/server.crt");
    EXPECT_EQ(settings.ca.server_key_file.string(), "/tmp/server.key");
    EXPECT_EQ(settings.enrollment.edge_cert_signing_duration_days, 30);
    EXPECT_EQ(settings.enrollment.max_csr_bytes, 2048u);
    EXPECT_EQ(settings.enrollment.token_refresh_duration_hours, 6);
    EXPECT_TRUE(settings.proxy.trust_forwarded_client_cert);
    EXPECT_EQ(settings.proxy.trusted_sources, (std::vector<std::string>{"10.0.0.1", "10.0.0.2"}));
    EXPECT_FALSE(settings.policy.allow_legacy_subject);
    EXPECT_EQ(settings.log.level, "debug");
    EXPECT_EQ(settings.log.dir.string(), "/tmp/edgegate-logs");
}

TEST(ConfigTest, PortOutOfRangeIsRejected) {
    EXPECT_THROW(parse("[server]\nport = 70000\n"), std::runtime_error);
    EXPECT_THROW(parse("[server]\nport = 0\n"), std::runtime_error);
}

TEST(ConfigTest, MissingFileYieldsDefaults) {
    Settings settings = LoadSettings("/nonexistent/edgegate.toml");

    EXPECT_EQ(settings.server.port, 10002);
}
