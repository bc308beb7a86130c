/*
 * Session store tests - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <reqline/session/session_store.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace reqline;
namespace fs = std::filesystem;

namespace {

class SessionStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_dir = fs::temp_directory_path() / ("reqline_sessions_" + std::to_string(::getpid()));
        fs::remove_all(m_dir);
    }
    void TearDown() override { fs::remove_all(m_dir); }
    fs::path m_dir;
};

} // namespace

TEST(SessionHost, ExtractHost) {
    EXPECT_EQ(extract_host("https://API.Example.com/login"), "api.example.com");
    EXPECT_EQ(extract_host("http://localhost:8080/x"), "localhost:8080");
    EXPECT_THROW(extract_host("not a url"), SessionError);
}

TEST_F(SessionStoreTest, MissingSessionIsNullopt) {
    SessionStore store(m_dir);
    EXPECT_FALSE(store.load("api.example.com").has_value());
    EXPECT_NO_THROW(store.remove("api.example.com"));
    EXPECT_TRUE(store.list().empty());
}

TEST_F(SessionStoreTest, SaveLoadAndPermissions) {
    SessionStore store(m_dir);
    Session s;
    s.host = "localhost:8080";
    s.cookies["sid"] = "abc";
    s.authorization = "Bearer tok";
    store.save(s);

    fs::path file = store.path_for("localhost:8080");
    EXPECT_EQ(file.filename().string(), "session_localhost_8080.json");
    ASSERT_TRUE(fs::exists(file));
    EXPECT_FALSE(fs::exists(file.string() + ".tmp"));
    auto perms = fs::status(file).permissions();
    EXPECT_EQ(perms & fs::perms::all, fs::perms::owner_read | fs::perms::owner_write);
    EXPECT_EQ(fs::status(m_dir).permissions() & fs::perms::all, fs::perms::owner_all);

    auto loaded = store.load("localhost:8080");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->host, "localhost:8080");
    EXPECT_EQ(loaded->cookies.at("sid"), "abc");
    EXPECT_EQ(loaded->authorization, "Bearer tok");
    EXPECT_EQ(store.list(), std::vector<std::string>{"localhost:8080"});

    store.remove("localhost:8080");
    EXPECT_FALSE(store.load("localhost:8080").has_value());
}

TEST_F(SessionStoreTest, RefusesReadableByOthers) {
    SessionStore store(m_dir);
    Session s;
    s.host = "h.test";
    s.authorization = "Bearer x";
    store.save(s);
    fs::permissions(store.path_for("h.test"), fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read |
                    fs::perms::others_read, fs::perm_options::replace);
    try {
        store.load("h.test");
        FAIL() << "expected SessionError";
    } catch (const SessionError& e) {
        EXPECT_NE(std::string(e.what()).find("group or world readable"), std::string::npos);
    }
}

TEST_F(SessionStoreTest, CorruptFileIsAnError) {
    fs::create_directories(m_dir);
    SessionStore store(m_dir);
    fs::path file = store.path_for("h.test");
    {
        std::ofstream f(file);
        f << "{not json";
    }
    fs::permissions(file, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
    EXPECT_THROW(store.load("h.test"), SessionError);
}

TEST(SessionData, RedactHidesSecrets) {
    Session s;
    s.host = "h.test";
    s.cookies["sid"] = "secret-cookie";
    s.authorization = "Bearer secret-token";
    Session r = redact(s);
    EXPECT_EQ(r.host, "h.test");
    EXPECT_EQ(r.cookies.at("sid"), "***");
    EXPECT_EQ(r.authorization, "Bearer ***");
    EXPECT_TRUE(redact(Session{"h", {}, ""}).authorization.empty());
}

TEST(SessionData, UpdateMergesCookiesAndToken) {
    Session base;
    base.host = "h.test";
    base.cookies["old"] = "1";
    base.cookies["sid"] = "stale";
    Session s = update_session(base, {"sid=fresh; Path=/; HttpOnly", "theme = dark", "=bad", "novalue"},
                               R"({"access_token":"abc123","expires_in":3600})");
    EXPECT_EQ(s.cookies.size(), 3u);
    EXPECT_EQ(s.cookies.at("old"), "1");
    EXPECT_EQ(s.cookies.at("sid"), "fresh");
    EXPECT_EQ(s.cookies.at("theme"), "dark");
    EXPECT_EQ(s.authorization, "Bearer abc123");

    Session kept = update_session(s, {}, "not json");
    EXPECT_EQ(kept.authorization, "Bearer abc123");
    Session empty_token = update_session(s, {}, R"({"access_token":""})");
    EXPECT_EQ(empty_token.authorization, "Bearer abc123");
}

TEST(SessionData, JsonShape) {
    Session s;
    s.host = "h.test";
    s.cookies["a"] = "1";
    auto j = session_to_json(s);
    EXPECT_EQ(j["host"], "h.test");
    EXPECT_EQ(j["cookies"]["a"], "1");
    EXPECT_FALSE(j.contains("authorization"));
    Session back = session_from_json(j);
    EXPECT_EQ(back.cookies, s.cookies);
}
