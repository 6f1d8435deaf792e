#include <gtest/gtest.h>

#include <daemux/cli/daemux_cli.h>

#include <string>
#include <vector>

using namespace daemux;
using namespace daemux::cli;

namespace {

ParseResult parse(std::vector<std::string> args) {
    args.insert(args.begin(), "daemux");
    std::vector<char*> argv;
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);
    return parse_options(static_cast<int>(args.size()), argv.data());
}

} // namespace

TEST(CliOptionsTest, CommandAndArgumentsAreTakenVerbatim) {
    auto r = parse({"tail", "-f", "--lines=10", "--kill", "/var/log/syslog"});
    ASSERT_FALSE(r.exitCode.has_value());
    EXPECT_EQ(r.options.command.path, "tail");
    EXPECT_EQ(r.options.command.args,
              (std::vector<std::string>{"-f", "--lines=10", "--kill", "/var/log/syslog"}));
    // --kill after the command path belongs to the command
    EXPECT_EQ(r.options.mode(), Mode::Stream);
}

TEST(CliOptionsTest, ModeFlags) {
    EXPECT_EQ(parse({"--kill", "echo"}).options.mode(), Mode::Kill);
    EXPECT_EQ(parse({"--restart", "echo"}).options.mode(), Mode::Restart);
    EXPECT_EQ(parse({"--status", "echo"}).options.mode(), Mode::Status);
    EXPECT_EQ(parse({"--daemon", "echo"}).options.mode(), Mode::Daemon);
    EXPECT_EQ(parse({"echo"}).options.mode(), Mode::Stream);
}

TEST(CliOptionsTest, ModePrecedence) {
    EXPECT_EQ(parse({"--restart", "--kill", "echo"}).options.mode(), Mode::Kill);
    EXPECT_EQ(parse({"--kill", "--daemon", "echo"}).options.mode(), Mode::Daemon);
    EXPECT_EQ(parse({"--status", "--restart", "echo"}).options.mode(), Mode::Restart);
    EXPECT_STREQ(modeName(Mode::Restart), "restart");
}

TEST(CliOptionsTest, OptionsWithValues) {
    auto r = parse({"--log-level", "debug", "--log-file", "/tmp/d.log", "--config", "/tmp/c.toml",
                    "--runtime-dir", "/tmp/rt", "sleep", "5"});
    ASSERT_FALSE(r.exitCode.has_value());
    EXPECT_EQ(r.options.logLevel, "debug");
    EXPECT_EQ(r.options.logFile, "/tmp/d.log");
    EXPECT_EQ(r.options.configFile, "/tmp/c.toml");
    EXPECT_EQ(r.options.runtimeDir, "/tmp/rt");
    EXPECT_EQ(r.options.command, (ipc::CommandIdentity{"sleep", {"5"}}));
}

TEST(CliOptionsTest, UnknownFlagsBeforeCommandAreIgnored) {
    auto r = parse({"--verbose", "echo", "hi"});
    ASSERT_FALSE(r.exitCode.has_value());
    EXPECT_EQ(r.options.ignoredFlags, std::vector<std::string>{"--verbose"});
    EXPECT_EQ(r.options.command, (ipc::CommandIdentity{"echo", {"hi"}}));
}

TEST(CliOptionsTest, MissingCommandIsUsageError) {
    auto r = parse({"--kill"});
    ASSERT_TRUE(r.exitCode.has_value());
    EXPECT_EQ(*r.exitCode, 1);

    auto empty = parse({});
    ASSERT_TRUE(empty.exitCode.has_value());
    EXPECT_EQ(*empty.exitCode, 1);
}

TEST(CliOptionsTest, HelpExitsZero) {
    auto r = parse({"--help"});
    ASSERT_TRUE(r.exitCode.has_value());
    EXPECT_EQ(*r.exitCode, 0);
}

TEST(CliOptionsTest, InvalidLogLevelIsRejected) {
    auto r = parse({"--log-level", "loud", "echo"});
    ASSERT_TRUE(r.exitCode.has_value());
    EXPECT_EQ(*r.exitCode, 1);
}

TEST(CliOptionsTest, OverridesReplaceSettings) {
    config::Settings settings;
    settings.runtimeDir = "/from/file";
    settings.logLevel = "info";

    Options options;
    options.runtimeDir = "/from/cli";
    options.logFile = "/tmp/cli.log";
    apply_overrides(settings, options);

    EXPECT_EQ(settings.runtimeDir, std::filesystem::path("/from/cli"));
    EXPECT_EQ(settings.logLevel, "info");
    EXPECT_EQ(settings.logFile, "/tmp/cli.log");
}
