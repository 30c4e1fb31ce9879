#pragma once

#include "frequency_errors.hpp"
#include "frequency_summary.hpp"
#include "verification.hpp"

#include <iterator>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>

template <typename Sequence> using SequenceElement = std::decay_t<decltype(*std::begin(std::declval<const Sequence &>()))>;

// Summary pass followed by the exact verification pass. Returns every candidate whose exact
// count exceeds floor(n / (k + 1)), with that count. The result may be empty.
//
// Only elements above floor(n / k) are guaranteed to survive the summary. An element whose
// count lies in (n / (k + 1), n / k] passes verification only if it happened to hold a
// counter at the end, so for those elements the result depends on input order.
template <typename Sequence, typename T = SequenceElement<Sequence>, typename Hash = std::hash<T>, typename KeyEqual = std::equal_to<T>>
ExactCounts<T, Hash, KeyEqual> frequent_element_counts(const Sequence &sequence, int64_t k, EvictionPolicy policy = EvictionPolicy::GroupDecrement)
{
    if (std::empty(sequence)) throw EmptyInput();
    uint32_t checked = checked_k(k);

    using Summary = FrequencySummary<T, Hash, KeyEqual>;
    typename Summary::CandidateSet candidates;

    uint64_t n = static_cast<uint64_t>(std::size(sequence));
    if (static_cast<uint64_t>(checked) > n)
    {
        // k - 1 >= n counters can never fill up, the summary would keep every distinct element.
        candidates.insert(std::begin(sequence), std::end(sequence));
    }
    else
    {
        candidates = Summary::from_sequence(sequence, checked, policy).candidates();
    }

    return verify(sequence, candidates, checked);
}

template <typename Sequence, typename T = SequenceElement<Sequence>, typename Hash = std::hash<T>, typename KeyEqual = std::equal_to<T>>
std::unordered_set<T, Hash, KeyEqual> most_frequent(const Sequence &sequence, int64_t k, EvictionPolicy policy = EvictionPolicy::GroupDecrement)
{
    auto counts = frequent_element_counts<Sequence, T, Hash, KeyEqual>(sequence, k, policy);

    std::unordered_set<T, Hash, KeyEqual> out;
    out.reserve(counts.size());
    for (const auto &[item, count] : counts) out.insert(item);
    return out;
}

// Same as most_frequent(), for callers that need at least one element.
template <typename Sequence, typename T = SequenceElement<Sequence>, typename Hash = std::hash<T>, typename KeyEqual = std::equal_to<T>>
std::unordered_set<T, Hash, KeyEqual> require_most_frequent(const Sequence &sequence, int64_t k, EvictionPolicy policy = EvictionPolicy::GroupDecrement)
{
    auto out = most_frequent<Sequence, T, Hash, KeyEqual>(sequence, k, policy);
    if (out.empty()) throw NoFrequentElements("No element occurs more than " + std::to_string(frequency_threshold(std::size(sequence), static_cast<uint32_t>(k))) + " times.");
    return out;
}

// Boyer-Moore majority vote: the element occurring more than floor(n / 2) times.
template <typename Sequence, typename T = SequenceElement<Sequence>, typename Hash = std::hash<T>, typename KeyEqual = std::equal_to<T>>
T majority_element(const Sequence &sequence, EvictionPolicy policy = EvictionPolicy::GroupDecrement)
{
    if (std::empty(sequence)) throw EmptyInput();

    auto summary = FrequencySummary<T, Hash, KeyEqual>::from_sequence(sequence, 2, policy);
    auto counts = verify_above(sequence, summary.candidates(), majority_threshold(std::size(sequence)));
    if (counts.size() != 1) throw NoMajorityElement();
    return counts.begin()->first;
}
