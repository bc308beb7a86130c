/*
 * JSONPath subset - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Supported: $  .name  ['name']  ["name"]  [index]. A leading "$" is optional.
 * Wildcards, recursive descent, slices and filters are rejected.
 */
#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace reqline {

class JsonPathError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Member names / indices in order. Throws JsonPathError on syntax outside the subset.
std::vector<std::string> compile_jsonpath(const std::string& path);

// nullptr when the path does not resolve.
const nlohmann::json* select_jsonpath(const nlohmann::json& doc, const std::string& path);

// Strings without quotes; everything else as compact JSON.
std::string json_scalar_text(const nlohmann::json& v);

} // namespace reqline
