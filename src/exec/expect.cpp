/*
 * Expectations - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <reqline/exec/expect.hpp>
#include <reqline/util/jsonpath.hpp>
#include <nlohmann/json.hpp>
#include <regex>

namespace reqline {

std::optional<std::string> evaluate_check(const ExpectCheck& c, const net::Response& resp, const std::string& body) {
    switch (c.kind) {
        case ExpectCheck::Kind::Status: {
            std::string got = std::to_string(resp.status);
            if (got == c.value) return std::nullopt;
            return "expected status " + c.value + ", got " + got;
        }
        case ExpectCheck::Kind::Header: {
            auto values = resp.header_values(c.name);
            if (values.empty()) return "expected header " + c.name + ": " + c.value + ", header not present";
            for (auto &v : values) if (v == c.value) return std::nullopt;
            return "expected header " + c.name + ": " + c.value + ", got " + values.front();
        }
        case ExpectCheck::Kind::Contains:
            if (body.find(c.value) != std::string::npos) return std::nullopt;
            return "expected body to contain '" + c.value + "'";
        case ExpectCheck::Kind::JsonPath: {
            auto doc = nlohmann::json::parse(body, nullptr, false);
            if (doc.is_discarded()) return "expected JSON body for jsonpath " + c.path + ", response is not valid JSON";
            const nlohmann::json* v = nullptr;
            try {
                v = select_jsonpath(doc, c.path);
            } catch (const JsonPathError& e) {
                return std::string(e.what());
            }
            if (!v) return "expected jsonpath " + c.path + " to exist, not found";
            if (!c.has_value) return std::nullopt;
            std::string got = json_scalar_text(*v);
            if (got == c.value) return std::nullopt;
            return "expected jsonpath " + c.path + " = " + c.value + ", got " + got;
        }
        case ExpectCheck::Kind::Matches: {
            try {
                if (std::regex_search(body, std::regex(c.value))) return std::nullopt;
            } catch (const std::regex_error& e) {
                return "invalid pattern /" + c.value + "/: " + e.what();
            }
            return "expected body to match /" + c.value + "/";
        }
    }
    return std::string("unknown check");
}

std::optional<std::string> evaluate_checks(const std::vector<ExpectCheck>& checks, const net::Response& resp, const std::string& body) {
    for (auto &c : checks) {
        if (auto failure = evaluate_check(c, resp, body)) return failure;
    }
    return std::nullopt;
}

} // namespace reqline
