/*
 * Redirect follower tests - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <reqline/exec/redirect.hpp>
#include "fake_transport.hpp"
#include <sstream>

using namespace reqline;
using namespace reqline::test_support;

namespace {

std::size_t count_lines_with(const std::string& text, const std::string& needle) {
    std::size_t n = 0;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) if (line.find(needle) != std::string::npos) ++n;
    return n;
}

net::Request request(const std::string& method, const std::string& url, const std::string& body = {}) {
    net::Request r;
    r.method = method;
    r.url = url;
    r.body = body;
    return r;
}

} // namespace

TEST(RedirectPolicy, Matrix) {
    EXPECT_EQ(redirect_policy(Verb::Read, "GET", FollowPolicy::Default, 301), RedirectAction::Follow);
    EXPECT_EQ(redirect_policy(Verb::Save, "GET", FollowPolicy::Default, 302), RedirectAction::Follow);
    EXPECT_EQ(redirect_policy(Verb::Authenticate, "POST", FollowPolicy::Default, 302), RedirectAction::Follow);
    EXPECT_EQ(redirect_policy(Verb::Send, "POST", FollowPolicy::Default, 301), RedirectAction::Advise);
    EXPECT_EQ(redirect_policy(Verb::Send, "POST", FollowPolicy::Default, 307), RedirectAction::Stop);
    EXPECT_EQ(redirect_policy(Verb::Inspect, "HEAD", FollowPolicy::Default, 301), RedirectAction::Stop);
    EXPECT_EQ(redirect_policy(Verb::Send, "POST", FollowPolicy::Smart, 307), RedirectAction::Follow);
    EXPECT_EQ(redirect_policy(Verb::Send, "PUT", FollowPolicy::Smart, 308), RedirectAction::Follow);
    EXPECT_EQ(redirect_policy(Verb::Send, "POST", FollowPolicy::Smart, 302), RedirectAction::Reject);
    EXPECT_EQ(redirect_policy(Verb::Read, "GET", FollowPolicy::Smart, 302), RedirectAction::Follow);
}

TEST(RedirectPolicy, WriteRequests) {
    EXPECT_TRUE(is_write_request(Verb::Send, "GET"));
    EXPECT_TRUE(is_write_request(Verb::Upload, "POST"));
    EXPECT_TRUE(is_write_request(Verb::Read, "DELETE"));
    EXPECT_FALSE(is_write_request(Verb::Read, "GET"));
    EXPECT_TRUE(is_redirect_status(308));
    EXPECT_FALSE(is_redirect_status(304));
}

TEST(RedirectFollow, ReadFollowsTwoHops) {
    FakeTransport t;
    t.push_redirect(301, "https://h.test/b");
    t.push_redirect(301, "/c");
    t.push(make_response(200, {}, "done"));
    std::ostringstream trace;
    RedirectFollower f(t, trace);
    auto out = f.run(request("GET", "https://h.test/a"), {}, Verb::Read, FollowPolicy::Default);
    EXPECT_EQ(out.response.status, 200);
    EXPECT_EQ(out.hops, 2);
    EXPECT_EQ(out.final_url, "https://h.test/c");
    EXPECT_EQ(count_lines_with(trace.str(), "→"), 2u);
    EXPECT_EQ(f.state(), RedirectState::Done);
    ASSERT_EQ(t.requests.size(), 3u);
    EXPECT_EQ(t.requests[2].url, "https://h.test/c");
}

TEST(RedirectFollow, SendAdvisesAndStops) {
    FakeTransport t;
    t.push_redirect(301, "https://h.test/moved");
    std::ostringstream trace;
    RedirectFollower f(t, trace);
    auto out = f.run(request("POST", "https://h.test/a", "{}"), {}, Verb::Send, FollowPolicy::Default);
    EXPECT_EQ(out.response.status, 301);
    EXPECT_EQ(out.hops, 0);
    EXPECT_EQ(count_lines_with(trace.str(), "Advisory"), 1u);
    EXPECT_EQ(count_lines_with(trace.str(), "→"), 0u);
    EXPECT_EQ(t.requests.size(), 1u);
}

TEST(RedirectFollow, SmartFollowKeepsMethodAndBodyOn307) {
    FakeTransport t;
    t.push_redirect(307, "https://h.test/b");
    t.push_redirect(308, "https://h.test/c");
    t.push(make_response(201));
    std::ostringstream trace;
    RedirectFollower f(t, trace);
    net::Request req = request("POST", "https://h.test/a", "{\"x\":1}");
    req.headers.push_back({"Content-Type", "application/json"});
    auto out = f.run(req, {}, Verb::Send, FollowPolicy::Smart);
    EXPECT_EQ(out.response.status, 201);
    EXPECT_EQ(out.final_method, "POST");
    ASSERT_EQ(t.requests.size(), 3u);
    for (auto &r : t.requests) {
        EXPECT_EQ(r.method, "POST");
        EXPECT_EQ(r.body, "{\"x\":1}");
        ASSERT_EQ(r.headers.size(), 1u);
    }
}

TEST(RedirectFollow, SmartFollowRejectsMethodChangingRedirect) {
    FakeTransport t;
    t.push_redirect(302, "https://h.test/b");
    std::ostringstream trace;
    RedirectFollower f(t, trace);
    EXPECT_THROW(f.run(request("POST", "https://h.test/a", "x"), {}, Verb::Send, FollowPolicy::Smart), RedirectError);
    EXPECT_EQ(f.state(), RedirectState::Error);
}

TEST(RedirectFollow, SeeOtherBecomesGetWithoutBody) {
    FakeTransport t;
    t.push_redirect(303, "https://h.test/result");
    t.push(make_response(200));
    std::ostringstream trace;
    RedirectFollower f(t, trace);
    net::Request req = request("POST", "https://h.test/login", "user=a");
    req.headers.push_back({"Content-Type", "application/x-www-form-urlencoded"});
    req.headers.push_back({"Accept", "*/*"});
    auto out = f.run(req, {}, Verb::Authenticate, FollowPolicy::Default);
    EXPECT_EQ(out.final_method, "GET");
    ASSERT_EQ(t.requests.size(), 2u);
    EXPECT_EQ(t.requests[1].method, "GET");
    EXPECT_TRUE(t.requests[1].body.empty());
    ASSERT_EQ(t.requests[1].headers.size(), 1u);
    EXPECT_EQ(t.requests[1].headers[0].name, "Accept");
}

TEST(RedirectFollow, CredentialsDroppedAcrossHosts) {
    FakeTransport t;
    t.push_redirect(302, "https://other.test/x");
    t.push(make_response(200));
    std::ostringstream trace;
    RedirectFollower f(t, trace);
    net::Request req = request("GET", "https://h.test/a");
    req.headers.push_back({"Authorization", "Bearer secret"});
    req.headers.push_back({"Cookie", "sid=1"});
    req.headers.push_back({"Accept", "*/*"});
    f.run(req, {}, Verb::Read, FollowPolicy::Default);
    ASSERT_EQ(t.requests.size(), 2u);
    EXPECT_EQ(t.requests[0].headers.size(), 3u);
    ASSERT_EQ(t.requests[1].headers.size(), 1u);
    EXPECT_EQ(t.requests[1].headers[0].name, "Accept");
}

TEST(RedirectFollow, HopLimit) {
    FakeTransport t;
    for (int i = 0; i < 6; ++i) t.push_redirect(302, "https://h.test/" + std::to_string(i));
    std::ostringstream trace;
    RedirectFollower f(t, trace);
    try {
        f.run(request("GET", "https://h.test/start"), {}, Verb::Read, FollowPolicy::Default);
        FAIL() << "expected RedirectError";
    } catch (const RedirectError& e) {
        EXPECT_STREQ(e.what(), "stopped after 5 redirects");
    }
    EXPECT_EQ(t.requests.size(), 6u);
}

TEST(RedirectFollow, MissingLocationEndsChain) {
    FakeTransport t;
    t.push(make_response(302));
    std::ostringstream trace;
    RedirectFollower f(t, trace);
    auto out = f.run(request("GET", "https://h.test/a"), {}, Verb::Read, FollowPolicy::Default);
    EXPECT_EQ(out.response.status, 302);
}

TEST(RedirectFollow, TransportErrorPropagates) {
    FakeTransport t;
    t.push_error(net::TransportError::Kind::Connect, "connection failed: refused");
    std::ostringstream trace;
    RedirectFollower f(t, trace);
    EXPECT_THROW(f.run(request("GET", "https://h.test/a"), {}, Verb::Read, FollowPolicy::Default), net::TransportError);
    EXPECT_EQ(f.state(), RedirectState::Error);
}

TEST(RedirectFollow, CollectsCookiesAcrossHopsAndJar) {
    FakeTransport t;
    t.push(make_response(302, {{"Location", "/home"}, {"Set-Cookie", "sid=abc; Path=/"}}));
    t.push(make_response(200, {{"Set-Cookie", "theme=dark"}}));
    t.jar = {"sid=abc"};
    std::ostringstream trace;
    RedirectFollower f(t, trace);
    RedirectOptions ro;
    ro.collect_cookies = true;
    auto out = f.run(request("POST", "https://h.test/login"), {}, Verb::Authenticate, FollowPolicy::Default, ro);
    ASSERT_EQ(out.set_cookies.size(), 3u);
    EXPECT_EQ(out.set_cookies[0], "sid=abc; Path=/");
    EXPECT_EQ(out.set_cookies[1], "theme=dark");
    EXPECT_EQ(out.set_cookies[2], "sid=abc");
}

TEST(RedirectFollow, EachHopGetsRemainingBudget) {
    FakeTransport t;
    t.push_redirect(302, "https://h.test/b");
    t.push(make_response(200));
    std::ostringstream trace;
    RedirectFollower f(t, trace);
    net::TransportOptions opts;
    opts.timeout = std::chrono::milliseconds{60000};
    f.run(request("GET", "https://h.test/a"), opts, Verb::Read, FollowPolicy::Default);
    ASSERT_EQ(t.options.size(), 2u);
    EXPECT_LE(t.options[0].timeout.count(), 60000);
    EXPECT_GT(t.options[1].timeout.count(), 0);
    EXPECT_LE(t.options[1].timeout, t.options[0].timeout);
}
