/*
 * Expectation tests - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <reqline/exec/expect.hpp>
#include <reqline/parse/parser.hpp>
#include "fake_transport.hpp"

using namespace reqline;
using namespace reqline::test_support;

namespace {

std::optional<std::string> check(const std::string& text, const net::Response& resp) {
    return evaluate_check(parse_expect_check(text), resp, resp.body);
}

} // namespace

TEST(Expect, Status) {
    auto resp = make_response(200);
    EXPECT_FALSE(check("status:200", resp));
    auto failure = check("status:201", resp);
    ASSERT_TRUE(failure);
    EXPECT_EQ(*failure, "expected status 201, got 200");
}

TEST(Expect, HeaderCaseInsensitiveName) {
    auto resp = make_response(200, {{"Content-Type", "application/json"}, {"X-Tag", "a"}, {"X-Tag", "b"}});
    EXPECT_FALSE(check("header:content-type=application/json", resp));
    EXPECT_FALSE(check("header:X-Tag=b", resp));
    EXPECT_EQ(*check("header:X-Tag=c", resp), "expected header X-Tag: c, got a");
    EXPECT_EQ(*check("header:X-Missing=1", resp), "expected header X-Missing: 1, header not present");
}

TEST(Expect, Contains) {
    auto resp = make_response(200, {}, "hello world");
    EXPECT_FALSE(check("contains:world", resp));
    EXPECT_EQ(*check("contains:mars", resp), "expected body to contain 'mars'");
}

TEST(Expect, JsonPathIsEvaluated) {
    auto resp = make_response(200, {}, R"({"data":{"id":7,"name":"Ada","tags":["x","y"],"ok":true}})");
    EXPECT_FALSE(check("jsonpath:$.data.id=7", resp));
    EXPECT_FALSE(check("jsonpath:$.data.name=Ada", resp));
    EXPECT_FALSE(check("jsonpath:$.data.tags[1]=y", resp));
    EXPECT_FALSE(check("jsonpath:$.data.ok=true", resp));
    EXPECT_FALSE(check("jsonpath:$.data.tags", resp));
    EXPECT_EQ(*check("jsonpath:$.data.id=8", resp), "expected jsonpath $.data.id = 8, got 7");
    EXPECT_EQ(*check("jsonpath:$.data.missing", resp), "expected jsonpath $.data.missing to exist, not found");
}

TEST(Expect, JsonPathOnNonJsonBody) {
    auto resp = make_response(200, {}, "<html></html>");
    auto failure = check("jsonpath:$.a", resp);
    ASSERT_TRUE(failure);
    EXPECT_NE(failure->find("not valid JSON"), std::string::npos);
}

TEST(Expect, Matches) {
    auto resp = make_response(200, {}, "order-1234 created");
    EXPECT_FALSE(check("matches:/order-[0-9]+/", resp));
    EXPECT_EQ(*check("matches:/^created/", resp), "expected body to match /^created/");
}

TEST(Expect, FirstFailureWins) {
    auto resp = make_response(404, {}, "missing");
    std::vector<ExpectCheck> checks = {parse_expect_check("contains:missing"), parse_expect_check("status:200"),
                                       parse_expect_check("contains:nope")};
    auto failure = evaluate_checks(checks, resp, resp.body);
    ASSERT_TRUE(failure);
    EXPECT_EQ(*failure, "expected status 200, got 404");
    EXPECT_FALSE(evaluate_checks({}, resp, resp.body));
}
