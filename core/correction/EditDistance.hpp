#pragma once
#include <algorithm>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace st {

// Levenshtein distance between two sequences. Works on any random-access
// container with comparable elements (std::string, std::u32string, ...).
template <typename Seq>
size_t levenshteinDistance(const Seq& s1, const Seq& s2) {
    const size_t m = s1.size();
    const size_t n = s2.size();
    if (m == 0) return n;
    if (n == 0) return m;

    // Two rows of the (m+1)x(n+1) matrix are enough.
    std::vector<size_t> prev(n + 1);
    std::vector<size_t> curr(n + 1);
    for (size_t j = 0; j <= n; ++j)
        prev[j] = j;

    for (size_t i = 1; i <= m; ++i) {
        curr[0] = i;
        for (size_t j = 1; j <= n; ++j) {
            const size_t cost = s1[i - 1] == s2[j - 1] ? 0 : 1;
            curr[j] = std::min({prev[j] + 1,          // deletion
                                curr[j - 1] + 1,      // insertion
                                prev[j - 1] + cost}); // substitution
        }
        std::swap(prev, curr);
    }
    return prev[n];
}

// Same result as levenshteinDistance() whenever the distance is <= maxDistance.
// Otherwise returns maxDistance + 1 as soon as a whole row exceeds the cap.
// A cap of SIZE_MAX means no cap.
template <typename Seq>
size_t boundedLevenshteinDistance(const Seq& s1, const Seq& s2, size_t maxDistance) {
    if (maxDistance == std::numeric_limits<size_t>::max())
        return levenshteinDistance(s1, s2);
    const size_t m = s1.size();
    const size_t n = s2.size();
    const size_t lengthGap = m > n ? m - n : n - m;
    if (lengthGap > maxDistance) return maxDistance + 1;
    if (m == 0) return n;
    if (n == 0) return m;

    std::vector<size_t> prev(n + 1);
    std::vector<size_t> curr(n + 1);
    for (size_t j = 0; j <= n; ++j)
        prev[j] = j;

    for (size_t i = 1; i <= m; ++i) {
        curr[0] = i;
        size_t rowMin = curr[0];
        for (size_t j = 1; j <= n; ++j) {
            const size_t cost = s1[i - 1] == s2[j - 1] ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
            rowMin = std::min(rowMin, curr[j]);
        }
        if (rowMin > maxDistance)
            return maxDistance + 1;
        std::swap(prev, curr);
    }
    return std::min(prev[n], maxDistance + 1);
}

inline size_t editDistance(const std::string& a, const std::string& b) {
    return levenshteinDistance(a, b);
}

} // namespace st
