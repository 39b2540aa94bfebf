#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace edgegate {

struct CliOptions {
    std::optional<uint16_t> port;
    std::optional<std::string> config_path;
    std::optional<std::string> log_level;
    std::string command = "serve";
    std::vector<std::string> command_args;
    bool show_help = false;
};

class ArgumentParser {
public:
    ArgumentParser(int argc, char* argv[]);

    // Parse command line arguments. Throws std::invalid_argument on bad input.
    CliOptions Parse();

    static void ShowHelp();

private:
    int argc_;
    char** argv_;
    int i; // index of the argument being parsed

    void parseOptions(const std::string& arg, CliOptions& options);
    void parseCommand(CliOptions& options);

    static void validateOptions(const CliOptions& options);
};

} // namespace edgegate
