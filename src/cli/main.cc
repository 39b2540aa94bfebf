#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <cli/argument_parser.h>
#include <core/constant/path.h>
#include <core/network/server/controller/certificate_controller.h>
#include <core/network/server/filter/forwarded_cert_filter.h>
#include <core/network/server/http_server.h>
#include <core/security/certificate_manager.h>
#include <core/security/open_ssl_provider.h>
#include <core/security/token.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <csignal>
#include <iostream>
#include <thread>
#include <vector>

using namespace edgegate;
using namespace edgegate::core;
namespace net = boost::asio;

namespace {

int runServer(const Settings& settings, const CertificateManager& cert_manager) {
    net::io_context ioc(static_cast<int>(settings.server.threads));

    HttpServer server(ioc, settings.server, cert_manager.security_context());
    ForwardedCertFilter forwarded_cert_filter(settings.proxy);
    forwarded_cert_filter.InstallFilter(server);
    CertificateController certificate_controller(cert_manager.root_of_trust(), settings);
    certificate_controller.InstallRoutes(server);

    if (!server.Start()) {
        return 1;
    }

    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, shutting down", signal_number);
        server.Stop();
        ioc.stop();
    });

    std::vector<std::thread> threads;
    for (std::size_t i = 1; i < settings.server.threads; ++i) {
        threads.emplace_back([&ioc]() {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                spdlog::error("IO thread exception: {}", e.what());
            }
        });
    }

    ioc.run();

    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    spdlog::info("edgegate stopped");
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    try {
        options = ArgumentParser(argc, argv).Parse();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        ArgumentParser::ShowHelp();
        return 1;
    }
    if (options.show_help) {
        ArgumentParser::ShowHelp();
        return 0;
    }

    Settings settings;
    try {
        settings = LoadSettings(options.config_path.value_or(path::kConfigFile.string()));
    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return 1;
    }
    if (options.port) {
        settings.server.port = *options.port;
    }
    if (options.log_level) {
        settings.log.level = *options.log_level;
    }

    // Commands that print to stdout keep the console quiet.
    Logger::Level level = options.command == "serve" ? Logger::ParseLevel(settings.log.level)
                                                     : Logger::Level::warn;
#ifdef EDGEGATE_DEBUG
    if (options.command == "serve") {
        level = Logger::Level::debug;
    }
#endif

    try {
        Logger logger(level, settings.log.dir);
        OpenSSLProvider::InitOpenSSL();

        CertificateManager cert_manager(settings.ca);
        if (!cert_manager.InitSecurityContext()) {
            spdlog::error("Unable to initialize the security context");
            return 1;
        }

        if (options.command == "token") {
            std::cout << token::CreateBootstrapToken(
                cert_manager.root_of_trust(),
                std::chrono::hours(settings.enrollment.token_refresh_duration_hours))
                      << std::endl;
            return 0;
        }
        if (options.command == "ca-hash") {
            std::cout << cert_manager.root_of_trust().certificate_hash() << std::endl;
            return 0;
        }

        spdlog::info("edgegate starting on {}:{} ({} threads)",
                     settings.server.address,
                     settings.server.port,
                     settings.server.threads);
        return runServer(settings, cert_manager);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
