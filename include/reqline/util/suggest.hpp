/*
 * Nearest-match suggestions - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace reqline {

std::size_t levenshtein(const std::string& a, const std::string& b);

// Closest vocabulary entry within max_distance edits, or "" when nothing is close.
// Ties keep the first entry in vocabulary order.
std::string suggest(const std::string& input, const std::vector<std::string>& vocabulary, std::size_t max_distance = 2);

} // namespace reqline
