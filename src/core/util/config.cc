#include <core/util/config.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace edgegate::core {

static void LoadServer(const toml::table& config, ServerSettings& server) {
    const auto* section = config["server"].as_table();
    if (!section) {
        return;
    }
    const auto& s = *section;
    server.address = s["address"].value_or(server.address);

    auto port = s["port"].value_or<std::int64_t>(static_cast<std::int64_t>(server.port));
    if (port <= 0 || port > 65535) {
        throw std::runtime_error("server.port out of range: " + std::to_string(port));
    }
    server.port = static_cast<std::uint16_t>(port);

    server.tls = s["tls"].value_or(server.tls);

    auto threads = s["threads"].value_or<std::int64_t>(static_cast<std::int64_t>(server.threads));
    server.threads = threads > 0 ? static_cast<std::size_t>(threads) : 1;

    auto max_request = s["max-request-bytes"].value_or<std::int64_t>(
        static_cast<std::int64_t>(server.max_request_bytes));
    if (max_request > 0) {
        server.max_request_bytes = static_cast<std::size_t>(max_request);
    }
}

static void LoadCa(const toml::table& config, CaSettings& ca) {
    const auto* section = config["ca"].as_table();
    if (!section) {
        return;
    }
    const auto& s = *section;
    ca.cert_file = s["cert-file"].value_or(ca.cert_file.string());
    ca.key_file = s["key-file"].value_or(ca.key_file.string());
    ca.server_cert_file = s["server-cert-file"].value_or(ca.server_cert_file.string());
    ca.server_key_file = s["server-key-file"].value_or(ca.server_key_file.string());
}

static void LoadEnrollment(const toml::table& config, EnrollmentSettings& enrollment) {
    const auto* section = config["enrollment"].as_table();
    if (!section) {
        return;
    }
    const auto& s = *section;
    // Not range checked: a non-positive duration is the operator's decision.
    enrollment.edge_cert_signing_duration_days = static_cast<int>(
        s["edge-cert-signing-duration"].value_or<std::int64_t>(
            static_cast<std::int64_t>(enrollment.edge_cert_signing_duration_days)));

    auto max_csr = s["max-csr-bytes"].value_or<std::int64_t>(
        static_cast<std::int64_t>(enrollment.max_csr_bytes));
    if (max_csr > 0) {
        enrollment.max_csr_bytes = static_cast<std::size_t>(max_csr);
    }

    enrollment.token_refresh_duration_hours = static_cast<int>(
        s["token-refresh-duration"].value_or<std::int64_t>(
            static_cast<std::int64_t>(enrollment.token_refresh_duration_hours)));
}

static void LoadProxy(const toml::table& config, ProxySettings& proxy) {
    const auto* section = config["proxy"].as_table();
    if (!section) {
        return;
    }
    const auto& s = *section;
    proxy.trust_forwarded_client_cert = s["trust-forwarded-client-cert"].value_or(
        proxy.trust_forwarded_client_cert);

    if (const auto* sources = s["trusted-sources"].as_array()) {
        proxy.trusted_sources.clear();
        for (const auto& source : *sources) {
            if (auto value = source.value<std::string>()) {
                proxy.trusted_sources.push_back(*value);
            } else {
                spdlog::warn("Ignoring non-string entry in proxy.trusted-sources");
            }
        }
    }
}

Settings ParseSettings(const toml::table& config) {
    Settings settings;
    LoadServer(config, settings.server);
    LoadCa(config, settings.ca);
    LoadEnrollment(config, settings.enrollment);
    LoadProxy(config, settings.proxy);

    if (const auto* policy = config["policy"].as_table()) {
        settings.policy.allow_legacy_subject = (*policy)["allow-legacy-subject"].value_or(
            settings.policy.allow_legacy_subject);
    }
    if (const auto* log = config["log"].as_table()) {
        settings.log.level = (*log)["level"].value_or(settings.log.level);
        settings.log.dir = (*log)["dir"].value_or(settings.log.dir.string());
    }
    return settings;
}

Settings LoadSettings(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::info("Config file \"{}\" does not exist, using defaults", path.string());
        return Settings{};
    }
    try {
        return ParseSettings(toml::parse_file(path.string()));
    } catch (const toml::parse_error& err) {
        throw std::runtime_error("\"" + path.string()
                                 + "\" could not be parsed: " + std::string(err.description()));
    }
}

} // namespace edgegate::core
