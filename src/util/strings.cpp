/*
 * String helpers - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <reqline/util/strings.hpp>
#include <algorithm>
#include <cctype>

namespace reqline {

std::string to_lower(std::string s) {
    for (auto &c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string to_upper(std::string s) {
    for (auto &c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
    return s.substr(b, e - b);
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i)
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
    return true;
}

std::vector<std::string> split_top_level(const std::string& s, char sep) {
    std::vector<std::string> parts; std::string cur; char quote = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (quote) {
            if (c == '\\' && i + 1 < s.size() && (s[i+1] == quote || s[i+1] == '\\')) { cur.push_back(c); cur.push_back(s[++i]); continue; }
            if (c == quote) quote = 0;
            cur.push_back(c);
            continue;
        }
        if (c == '\'' || c == '"') { quote = c; cur.push_back(c); continue; }
        if (c == sep) { parts.push_back(cur); cur.clear(); continue; }
        cur.push_back(c);
    }
    parts.push_back(cur);
    return parts;
}

std::string unquote(const std::string& s, bool* was_quoted) {
    if (was_quoted) *was_quoted = false;
    if (s.size() < 2) return s;
    char q = s.front();
    if ((q != '\'' && q != '"') || s.back() != q) return s;
    std::string out;
    for (std::size_t i = 1; i + 1 < s.size(); ++i) {
        char c = s[i];
        if (c == '\\' && i + 2 < s.size() && (s[i+1] == q || s[i+1] == '\\')) { out.push_back(s[++i]); continue; }
        // an unescaped quote before the end means this is not a single quoted region
        if (c == q) return s;
        out.push_back(c);
    }
    if (was_quoted) *was_quoted = true;
    return out;
}

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) < std::tolower(static_cast<unsigned char>(y));
    });
}

} // namespace reqline
