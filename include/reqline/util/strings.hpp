/*
 * String helpers - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <vector>

namespace reqline {

std::string to_lower(std::string s);
std::string to_upper(std::string s);
std::string trim(const std::string& s);
bool iequals(const std::string& a, const std::string& b);

// Splits on sep only outside single/double quotes; quotes stay in the pieces.
std::vector<std::string> split_top_level(const std::string& s, char sep);

// If s is exactly one quoted region ('...' or "..."), returns its content with
// \<quote> and \\ unescaped and sets *was_quoted. Otherwise returns s unchanged.
std::string unquote(const std::string& s, bool* was_quoted = nullptr);

// Header-name ordering for std::map.
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

} // namespace reqline
