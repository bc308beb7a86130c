/*
 * Durations and byte sizes - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace reqline {

// "300ms", "1.5s", "2m30s", "1h" (units ns, us, ms, s, m, h). A bare "0" is zero.
// Results are truncated to whole milliseconds. Values beyond half the
// steady_clock range are rejected.
std::optional<std::chrono::milliseconds> parse_duration(const std::string& s);

// "512B", "10KB", "1.5MB", "2GB", "1TB"; 1024-based, case-insensitive units.
// Sizes of 2^63 bytes or more are rejected.
std::optional<std::uint64_t> parse_size(const std::string& s);

// Shortest unit spelling, e.g. 200ms, 5s, 1m30s.
std::string format_duration(std::chrono::milliseconds d);

} // namespace reqline
