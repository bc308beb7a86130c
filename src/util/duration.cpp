/*
 * Durations and byte sizes - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <reqline/util/duration.hpp>
#include <reqline/util/strings.hpp>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace reqline {

namespace {

// Reads "123" or "1.25" at s[i]; returns false when no digits are present.
bool read_number(const std::string& s, std::size_t& i, double& out) {
    std::size_t start = i; bool digits = false, dot = false;
    while (i < s.size()) {
        char c = s[i];
        if (std::isdigit(static_cast<unsigned char>(c))) { digits = true; ++i; }
        else if (c == '.' && !dot) { dot = true; ++i; }
        else break;
    }
    if (!digits) { i = start; return false; }
    try {
        out = std::stod(s.substr(start, i - start));
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

// Half the steady clock range, so now() + timeout cannot wrap.
const double kMaxDurationNs = static_cast<double>(std::chrono::steady_clock::duration::max().count()) / 2;
// 2^63
const double kMaxSizeBytes = 9223372036854775808.0;

} // namespace

std::optional<std::chrono::milliseconds> parse_duration(const std::string& raw) {
    std::string s = trim(raw);
    if (s.empty()) return std::nullopt;
    if (s == "0") return std::chrono::milliseconds{0};
    double total_ns = 0; std::size_t i = 0;
    while (i < s.size()) {
        double n = 0;
        if (!read_number(s, i, n)) return std::nullopt;
        std::size_t u = i;
        while (i < s.size() && std::isalpha(static_cast<unsigned char>(s[i]))) ++i;
        std::string unit = s.substr(u, i - u);
        double scale = 0;
        if (unit == "ns") scale = 1;
        else if (unit == "us") scale = 1e3;
        else if (unit == "ms") scale = 1e6;
        else if (unit == "s") scale = 1e9;
        else if (unit == "m") scale = 60e9;
        else if (unit == "h") scale = 3600e9;
        else return std::nullopt;
        total_ns += n * scale;
        if (!std::isfinite(total_ns) || total_ns >= kMaxDurationNs) return std::nullopt;
    }
    return std::chrono::milliseconds{static_cast<std::int64_t>(total_ns / 1e6)};
}

std::optional<std::uint64_t> parse_size(const std::string& raw) {
    std::string s = trim(raw);
    std::size_t i = 0; double n = 0;
    if (!read_number(s, i, n)) return std::nullopt;
    std::string unit = to_upper(trim(s.substr(i)));
    double mult = 0;
    if (unit == "B") mult = 1;
    else if (unit == "KB") mult = 1024.0;
    else if (unit == "MB") mult = 1024.0 * 1024;
    else if (unit == "GB") mult = 1024.0 * 1024 * 1024;
    else if (unit == "TB") mult = 1024.0 * 1024 * 1024 * 1024;
    else return std::nullopt;
    double bytes = std::round(n * mult);
    if (!(bytes < kMaxSizeBytes)) return std::nullopt;
    return static_cast<std::uint64_t>(bytes);
}

std::string format_duration(std::chrono::milliseconds d) {
    auto ms = d.count();
    if (ms == 0) return "0s";
    if (ms % 1000 != 0) return std::to_string(ms) + "ms";
    auto secs = ms / 1000;
    std::string out;
    if (secs >= 3600) { out += std::to_string(secs / 3600) + "h"; secs %= 3600; }
    if (secs >= 60) { out += std::to_string(secs / 60) + "m"; secs %= 60; }
    if (secs > 0) out += std::to_string(secs) + "s";
    return out;
}

} // namespace reqline
