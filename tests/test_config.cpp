/*
 * Config tests - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <reqline/config/config.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace reqline;
using namespace std::chrono_literals;

TEST(Config, Defaults) {
    Config c;
    EXPECT_TRUE(c.color);
    EXPECT_EQ(c.timeout, 30000ms);
    EXPECT_EQ(c.connect_timeout, 10000ms);
    EXPECT_EQ(c.user_agent.rfind("reqline/", 0), 0u);
}

TEST(Config, ParseKnownKeys) {
    std::istringstream in(
        "# reqline settings\n"
        "color = off\n"
        "session_dir = /tmp/rq\n"
        "timeout = 5s\n"
        "connect_timeout=500ms\n"
        "user_agent = probe/1.0\n");
    std::vector<std::string> warnings;
    Config c = parse_config(in, Config{}, &warnings);
    EXPECT_TRUE(warnings.empty());
    EXPECT_FALSE(c.color);
    EXPECT_EQ(c.session_dir, "/tmp/rq");
    EXPECT_EQ(c.timeout, 5000ms);
    EXPECT_EQ(c.connect_timeout, 500ms);
    EXPECT_EQ(c.user_agent, "probe/1.0");
}

TEST(Config, BadLinesWarnAndKeepDefaults) {
    std::istringstream in(
        "color = sometimes\n"
        "timeout = 0\n"
        "\n"
        "colour = on\n"
        "just words\n");
    std::vector<std::string> warnings;
    Config c = parse_config(in, Config{}, &warnings);
    ASSERT_EQ(warnings.size(), 4u);
    EXPECT_EQ(warnings[0].rfind("line 1: ", 0), 0u);
    EXPECT_EQ(warnings[1].rfind("line 2: ", 0), 0u);
    EXPECT_EQ(warnings[2], "line 4: unknown key 'colour'");
    EXPECT_EQ(warnings[3], "line 5: expected key=value");
    EXPECT_TRUE(c.color);
    EXPECT_EQ(c.timeout, 30000ms);
    EXPECT_NO_THROW(parse_config(in, Config{}));
}

TEST(Config, LoadFromEnvironment) {
    namespace fs = std::filesystem;
    fs::path rc = fs::temp_directory_path() / ("reqlinerc_" + std::to_string(::getpid()));
    {
        std::ofstream f(rc);
        f << "timeout = 12s\nbogus = 1\n";
    }
    ::setenv("REQLINE_CONFIG", rc.c_str(), 1);
    ::setenv("REQLINE_SESSION_DIR", "/tmp/reqline-env-sessions", 1);
    std::vector<std::string> warnings;
    Config c = load_config(&warnings);
    ::unsetenv("REQLINE_CONFIG");
    ::unsetenv("REQLINE_SESSION_DIR");
    fs::remove(rc);

    EXPECT_EQ(c.timeout, 12000ms);
    EXPECT_EQ(c.session_dir, "/tmp/reqline-env-sessions");
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0], rc.string() + ": line 2: unknown key 'bogus'");
}

TEST(Config, DefaultSessionDirUsesHome) {
    const char* home = std::getenv("HOME");
    std::string saved = home ? home : "";
    ::setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(default_session_dir(), "/home/tester/.config/reqline");
    ::unsetenv("HOME");
    EXPECT_EQ(default_session_dir(), ".reqline");
    if (home) ::setenv("HOME", saved.c_str(), 1);
}
