#include <gtest/gtest.h>

#include "common/test_helpers.h"
#include <daemux/config/config_helpers.h>

using namespace daemux::config;
using daemux::tests::ScopedEnvVar;
using daemux::tests::TempDir;
using daemux::tests::write_file;

TEST(ConfigHelpersTest, TrimAndUnquote) {
    std::string s = "  value \t";
    trim(s);
    EXPECT_EQ(s, "value");
    EXPECT_EQ(unquote(" \"quoted\" "), "quoted");
    EXPECT_EQ(unquote("'single'"), "single");
    EXPECT_EQ(unquote("bare"), "bare");
}

TEST(ConfigHelpersTest, ParseMilliseconds) {
    EXPECT_EQ(parse_ms("250")->count(), 250);
    EXPECT_EQ(parse_ms(" 0 ")->count(), 0);
    EXPECT_FALSE(parse_ms("").has_value());
    EXPECT_FALSE(parse_ms("-5").has_value());
    EXPECT_FALSE(parse_ms("12ms").has_value());
}

TEST(ConfigHelpersTest, ParsesSectionsCommentsAndQuotes) {
    TempDir dir;
    auto path = write_file(dir.path() / "config.toml", R"(# daemux settings
top = 1

[daemon]
spawn_grace_ms = 300   # inline comment
runtime_dir = "/run/user/1000/daemux"

[logging]
level = 'debug'
)");

    auto values = parse_config_file(path);
    EXPECT_EQ(values["top"], "1");
    EXPECT_EQ(values["daemon.spawn_grace_ms"], "300");
    EXPECT_EQ(values["daemon.runtime_dir"], "/run/user/1000/daemux");
    EXPECT_EQ(values["logging.level"], "debug");
    EXPECT_EQ(values.count("logging.file"), 0u);
}

TEST(ConfigHelpersTest, MissingFileYieldsNothing) {
    EXPECT_TRUE(parse_config_file("/nonexistent/daemux/config.toml").empty());
}

TEST(ConfigHelpersTest, ConfigPathPrecedence) {
    ScopedEnvVar cfg("DAEMUX_CONFIG", std::nullopt);
    ScopedEnvVar xdg("XDG_CONFIG_HOME", std::string("/xdg"));
    ScopedEnvVar home("HOME", std::string("/home/someone"));

    EXPECT_EQ(get_config_path("/explicit.toml"), std::filesystem::path("/explicit.toml"));
    EXPECT_EQ(get_config_path(), std::filesystem::path("/xdg/daemux/config.toml"));

    {
        ScopedEnvVar env("DAEMUX_CONFIG", std::string("/from/env.toml"));
        EXPECT_EQ(get_config_path(), std::filesystem::path("/from/env.toml"));
    }
    {
        ScopedEnvVar noXdg("XDG_CONFIG_HOME", std::nullopt);
        EXPECT_EQ(get_config_path(),
                  std::filesystem::path("/home/someone/.config/daemux/config.toml"));
    }
}
