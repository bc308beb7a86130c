/*
 * Expectations - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>
#include <vector>
#include "reqline/net/transport.hpp"
#include "reqline/parse/ast.hpp"

namespace reqline {

// std::nullopt when the check holds, otherwise expected vs actual.
// body is the decoded response body.
std::optional<std::string> evaluate_check(const ExpectCheck& check, const net::Response& resp, const std::string& body);

// First failing check, in order.
std::optional<std::string> evaluate_checks(const std::vector<ExpectCheck>& checks, const net::Response& resp, const std::string& body);

} // namespace reqline
