/*
    config.h
    This header provides the gateway's settings, read once from a TOML file at
    startup and passed by const reference into every component afterwards.

    Example usage:

    - Load from file (a missing file yields the defaults):
        edgegate::core::Settings settings = edgegate::core::LoadSettings(path);
    - Load from an in-memory document:
        edgegate::core::Settings settings = edgegate::core::ParseSettings(toml::parse(text));
    - Read a setting:
        std::uint16_t port = settings.server.port;
        int days = settings.enrollment.edge_cert_signing_duration_days;
*/

#pragma once

#include <core/constant/enrollment.h>
#include <core/constant/path.h>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <toml++/toml.h>
#include <vector>

namespace edgegate::core {

struct ServerSettings {
    std::string address = "0.0.0.0";
    std::uint16_t port = 10002;
    bool tls = true; // false when a TLS-terminating proxy sits in front
    std::size_t threads = 4;
    std::size_t max_request_bytes = enrollment::kMaxRequestBodyBytes;
};

struct CaSettings {
    std::filesystem::path cert_file = path::kCaDir / "rootCA.crt";
    std::filesystem::path key_file = path::kCaDir / "rootCA.key";
    std::filesystem::path server_cert_file = path::kCertificateDir / "server.crt";
    std::filesystem::path server_key_file = path::kCertificateDir / "server.key";
};

struct EnrollmentSettings {
    int edge_cert_signing_duration_days = enrollment::kDefaultSigningDurationDays;
    std::size_t max_csr_bytes = enrollment::kMaxCsrBodyBytes;
    int token_refresh_duration_hours = enrollment::kDefaultTokenRefreshHours;
};

struct ProxySettings {
    bool trust_forwarded_client_cert = false;
    std::vector<std::string> trusted_sources; // empty: any source once trusted
};

struct PolicySettings {
    bool allow_legacy_subject = true;
};

struct LogSettings {
    std::string level = "info";
    std::filesystem::path dir = path::kLogDir;
};

struct Settings {
    ServerSettings server;
    CaSettings ca;
    EnrollmentSettings enrollment;
    ProxySettings proxy;
    PolicySettings policy;
    LogSettings log;
};

Settings ParseSettings(const toml::table& config);

Settings LoadSettings(const std::filesystem::path& path);

} // namespace edgegate::core
