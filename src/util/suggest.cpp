/*
 * Nearest-match suggestions - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <reqline/util/suggest.hpp>
#include <algorithm>
#include <limits>

namespace reqline {

std::size_t levenshtein(const std::string& a, const std::string& b) {
    if (a.empty()) return b.size();
    if (b.empty()) return a.size();
    // two rolling rows are enough
    std::vector<std::size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (std::size_t j = 0; j <= b.size(); ++j) prev[j] = j;
    for (std::size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (std::size_t j = 1; j <= b.size(); ++j) {
            std::size_t cost = (a[i-1] == b[j-1]) ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j-1] + 1, prev[j-1] + cost});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

std::string suggest(const std::string& input, const std::vector<std::string>& vocabulary, std::size_t max_distance) {
    std::string best;
    std::size_t best_dist = std::numeric_limits<std::size_t>::max();
    for (auto &candidate : vocabulary) {
        std::size_t d = levenshtein(input, candidate);
        if (d < best_dist) { best_dist = d; best = candidate; }
    }
    return best_dist <= max_distance ? best : std::string{};
}

} // namespace reqline
