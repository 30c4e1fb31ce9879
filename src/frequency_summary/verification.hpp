#pragma once

#include "frequency_errors.hpp"

#include <cstdint>
#include <iterator>
#include <string>
#include <unordered_map>
#include <unordered_set>

template <typename T, typename Hash = std::hash<T>, typename KeyEqual = std::equal_to<T>> using ExactCounts = std::unordered_map<T, uint64_t, Hash, KeyEqual>;

// Verification threshold for a summary with capacity parameter k. The divisor is k + 1, not k.
inline uint64_t frequency_threshold(uint64_t n, uint32_t k) { return n / (static_cast<uint64_t>(k) + 1); }

inline uint64_t majority_threshold(uint64_t n) { return n / 2; }

// Counts only the candidates in one pass over the sequence, then keeps those whose exact
// count is strictly above the threshold.
template <typename Sequence, typename T, typename Hash, typename KeyEqual>
ExactCounts<T, Hash, KeyEqual> verify_above(const Sequence &sequence, const std::unordered_set<T, Hash, KeyEqual> &candidates, uint64_t threshold)
{
    if (std::empty(sequence)) throw EmptyInput();

    ExactCounts<T, Hash, KeyEqual> counts;
    counts.reserve(candidates.size());
    for (const auto &c : candidates) counts.emplace(c, 0);

    for (const auto &item : sequence)
    {
        auto it = counts.find(item);
        if (it != counts.end()) it->second++;
    }

    for (auto it = counts.begin(); it != counts.end();)
    {
        if (it->second <= threshold)
            it = counts.erase(it);
        else
            ++it;
    }
    return counts;
}

template <typename Sequence, typename T, typename Hash, typename KeyEqual>
ExactCounts<T, Hash, KeyEqual> verify(const Sequence &sequence, const std::unordered_set<T, Hash, KeyEqual> &candidates, int64_t k)
{
    uint32_t checked = checked_k(k);
    if (std::empty(sequence)) throw EmptyInput();

    uint64_t n = static_cast<uint64_t>(std::size(sequence));
    return verify_above(sequence, candidates, frequency_threshold(n, checked));
}
