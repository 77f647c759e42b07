/// @file lcs.hpp
/// @brief Longest common subsequence over two sequences.
///
/// Internal header, not installed.

#pragma once

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace jd_cpp::detail {

/// Aligned (lhs index, rhs index) pairs of one longest common subsequence.
///
/// Uses an explicit (n+1) x (m+1) table. On ties the backtrack decrements
/// the left index first, so the result is deterministic and matches the
/// earliest-available left elements.
template <typename T, typename Match>
auto longest_common_subsequence(const std::vector<T>& lhs,
                                const std::vector<T>& rhs,
                                Match match)
    -> std::vector<std::pair<std::size_t, std::size_t>> {
    const auto n = lhs.size();
    const auto m = rhs.size();
    const auto width = m + 1;
    auto table = std::vector<std::size_t>((n + 1) * width, 0);
    auto at = [&](std::size_t i, std::size_t j) -> std::size_t& { return table[i * width + j]; };

    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = 0; j < m; ++j) {
            if (match(lhs[i], rhs[j])) {
                at(i + 1, j + 1) = at(i, j) + 1;
            } else {
                at(i + 1, j + 1) = std::max(at(i, j + 1), at(i + 1, j));
            }
        }
    }

    auto pairs = std::vector<std::pair<std::size_t, std::size_t>>{};
    pairs.reserve(at(n, m));
    auto i = n;
    auto j = m;
    while (i > 0 && j > 0) {
        if (match(lhs[i - 1], rhs[j - 1])) {
            pairs.emplace_back(i - 1, j - 1);
            --i;
            --j;
        } else if (at(i - 1, j) >= at(i, j - 1)) {
            --i;
        } else {
            --j;
        }
    }
    return std::vector<std::pair<std::size_t, std::size_t>>(pairs.rbegin(), pairs.rend());
}

}  // namespace jd_cpp::detail
