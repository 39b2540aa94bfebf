#include <cli/argument_parser.h>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace edgegate;

namespace {

CliOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "edgegate");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return ArgumentParser(static_cast<int>(argv.size()), argv.data()).Parse();
}

} // namespace

TEST(ArgumentParserTest, DefaultsToServe) {
    CliOptions options = parse({});

    EXPECT_EQ(options.command, "serve");
    EXPECT_FALSE(options.port.has_value());
    EXPECT_FALSE(options.config_path.has_value());
    EXPECT_FALSE(options.show_help);
}

TEST(ArgumentParserTest, ParsesOptionsAndCommand) {
    CliOptions options = parse({"-c", "/tmp/edgegate.toml", "--port", "8443", "-l", "DEBUG", "token"});

    EXPECT_EQ(options.config_path.value_or(""), "/tmp/edgegate.toml");
    EXPECT_EQ(options.port.value_or(0), 8443);
    EXPECT_EQ(options.log_level.value_or(""), "debug");
    EXPECT_EQ(options.command, "token");
}

TEST(ArgumentParserTest, HelpStopsParsing) {
    CliOptions options = parse({"--help", "--bogus"});

    EXPECT_TRUE(options.show_help);
}

TEST(ArgumentParserTest, RejectsBadInput) {
    EXPECT_THROW(parse({"--bogus"}), std::invalid_argument);
    EXPECT_THROW(parse({"-p"}), std::invalid_argument);
    EXPECT_THROW(parse({"-p", "abc"}), std::invalid_argument);
    EXPECT_THROW(parse({"-p", "70000"}), std::invalid_argument);
    EXPECT_THROW(parse({"-l", "loud"}), std::invalid_argument);
    EXPECT_THROW(parse({"launch"}), std::invalid_argument);
    EXPECT_THROW(parse({"ca-hash", "extra"}), std::invalid_argument);
}

TEST(ArgumentParserTest, LogLevelWithNonAsciiBytesIsRejected) {
    EXPECT_EQ(parse({"-l", "WaRn"}).log_level.value_or(""), "warn");
    EXPECT_THROW(parse({"-l", "\xC3\x89RROR"}), std::invalid_argument);
}
