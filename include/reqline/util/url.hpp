/*
 * URL helpers - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Thin layer over libcurl's URL API (CURLU).
 */
#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace reqline {

class UrlError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;   // empty when not given explicitly
    std::string path;   // still percent-encoded
    std::string query;
};

bool looks_like_url(const std::string& s);

UrlParts parse_url(const std::string& url);

// host[:port] of an absolute http(s) URL.
std::string url_authority(const std::string& url);

// Appends k=v pairs (form-encoded) after any query already present, in order.
std::string append_query(const std::string& url, const std::vector<std::pair<std::string, std::string>>& params);

// Resolves a Location header against the URL it came from.
std::string resolve_url(const std::string& base, const std::string& location);

std::string percent_decode(const std::string& s);

} // namespace reqline
