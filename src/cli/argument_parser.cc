#include <algorithm>
#include <array>
#include <cctype>
#include <cli/argument_parser.h>
#include <iostream>

namespace edgegate {

namespace {

constexpr std::array<const char*, 3> kCommands = {"serve", "token", "ca-hash"};
constexpr std::array<const char*, 7> kLogLevels
    = {"trace", "debug", "info", "warn", "error", "critical", "off"};

} // namespace

ArgumentParser::ArgumentParser(int argc, char* argv[])
    : argc_(argc)
    , argv_(argv)
    , i(1) {}

CliOptions ArgumentParser::Parse() {
    CliOptions options;

    while (i < argc_) {
        std::string arg = argv_[i];

        if (arg.empty() || arg[0] != '-') {
            // first non-option argument starts the command
            parseCommand(options);
            break;
        }

        parseOptions(arg, options);
        if (options.show_help) {
            return options;
        }
        i++;
    }

    validateOptions(options);
    return options;
}

void ArgumentParser::parseOptions(const std::string& arg, CliOptions& options) {
    if (arg == "-p" || arg == "--port") {
        if (++i >= argc_) {
            throw std::invalid_argument("Missing port number");
        }
        int port = 0;
        try {
            port = std::stoi(argv_[i]);
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid port number: " + std::string(argv_[i]));
        }
        if (port < 1 || port > 65535) {
            throw std::invalid_argument("Port must be between 1 and 65535");
        }
        options.port = static_cast<uint16_t>(port);
    } else if (arg == "-c" || arg == "--config") {
        if (++i >= argc_) {
            throw std::invalid_argument("Missing config path");
        }
        options.config_path = argv_[i];
    } else if (arg == "-l" || arg == "--log-level") {
        if (++i >= argc_) {
            throw std::invalid_argument("Missing log level");
        }
        std::string level = argv_[i];
        std::transform(level.begin(), level.end(), level.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        options.log_level = level;
    } else if (arg == "-h" || arg == "--help") {
        options.show_help = true;
    } else {
        throw std::invalid_argument("Unknown option: " + arg);
    }
}

void ArgumentParser::parseCommand(CliOptions& options) {
    if (i >= argc_) {
        return;
    }

    options.command = argv_[i++];

    while (i < argc_) {
        options.command_args.push_back(argv_[i++]);
    }
}

void ArgumentParser::validateOptions(const CliOptions& options) {
    if (std::find(kCommands.begin(), kCommands.end(), options.command) == kCommands.end()) {
        throw std::invalid_argument("Unknown command: " + options.command);
    }
    if (!options.command_args.empty()) {
        throw std::invalid_argument("Command " + options.command + " takes no arguments");
    }
    if (options.log_level
        && std::find(kLogLevels.begin(), kLogLevels.end(), *options.log_level)
               == kLogLevels.end()) {
        throw std::invalid_argument("Invalid log level: " + *options.log_level);
    }
}

void ArgumentParser::ShowHelp() {
    std::cout << "Usage: edgegate [options] [command]\n\n"
              << "Options:\n"
              << "  -c, --config PATH    Set config file path (default: /etc/edgegate/edgegate.toml)\n"
              << "  -p, --port PORT      Override server port\n"
              << "  -l, --log-level LVL  Set log level (trace|debug|info|warn|error|critical|off)\n"
              << "  -h, --help           Show this help message\n\n"
              << "Commands:\n"
              << "  serve                Run the enrollment gateway (default)\n"
              << "  token                Print a new bootstrap token\n"
              << "  ca-hash              Print the SHA-256 digest of the CA certificate\n";
}

} // namespace edgegate
