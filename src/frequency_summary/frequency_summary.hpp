#pragma once

#include "bounded_counter_map.hpp"
#include "eviction_policy.hpp"
#include "frequency_errors.hpp"
#include "frequency_summary_config.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <iterator>
#include <stdexcept>
#include <string>
#include <unordered_set>

// Misra-Gries summary: at most k-1 counters, and every element occurring more than n/k
// times in the observed stream is guaranteed to hold one at the end. Candidates may still
// be infrequent, run them through verify() before trusting them.
//
// k = 2 is the Boyer-Moore majority vote. k = 1 leaves no counters at all, so nothing is
// ever retained and candidates() is always empty.
template <typename T, typename Hash = std::hash<T>, typename KeyEqual = std::equal_to<T>>
class FrequencySummary
{
public:
    using CandidateSet = std::unordered_set<T, Hash, KeyEqual>;

    explicit FrequencySummary(int64_t k, EvictionPolicy policy = EvictionPolicy::GroupDecrement) : m_k(checked_k(k)), m_policy(policy), m_counters(m_k - 1) {}

    explicit FrequencySummary(const FrequencySummaryConfig &config) : FrequencySummary(config.k, config.get_policy()) {}

    template <typename Sequence> static FrequencySummary from_sequence(const Sequence &elements, int64_t k, EvictionPolicy policy = EvictionPolicy::GroupDecrement)
    {
        FrequencySummary summary(k, policy);
        summary.observe_all(std::begin(elements), std::end(elements));
        return summary;
    }

    void observe(const T &item)
    {
        m_n++;

        if (auto *slot = m_counters.find(item))
        {
            if (slot->count == 0) m_reclaimable_count--;   // revived before anyone reclaimed it
            slot->count++;
            return;
        }

        if (!m_counters.full())
        {
            m_counters.insert(item, 1);
            return;
        }

        if (m_policy == EvictionPolicy::SingleEvict && m_reclaimable_count > 0)
        {
            _reclaim_slot(item);
            return;
        }

        _fight();
    }

    template <typename Iterator> void observe_all(Iterator first, Iterator last)
    {
        for (; first != last; ++first) observe(*first);
    }

    CandidateSet candidates() const
    {
        CandidateSet out;
        out.reserve(size());
        for_each_candidate([&out](const T &item, uint64_t) { out.insert(item); });
        return out;
    }

    void for_each_candidate(const std::function<void(const T &item, uint64_t count)> &func) const
    {
        m_counters.for_each(
            [&func](const T &item, uint64_t count)
            {
                if (count > 0) func(item, count);
            });
    }

    // Lower bound on the true count, off by at most get_error_bound().
    uint64_t estimate(const T &item) const
    {
        const auto *slot = m_counters.find(item);
        return slot == nullptr ? 0 : slot->count;
    }

    uint64_t get_error_bound() const { return m_n / m_k; }

    uint32_t size() const { return m_counters.size() - m_reclaimable_count; }
    uint64_t get_n() const { return m_n; }
    uint32_t get_k() const { return m_k; }
    uint32_t get_capacity() const { return m_counters.capacity(); }
    EvictionPolicy get_policy() const { return m_policy; }

    uint64_t get_max_memory_usage() const { return m_counters.get_max_memory_usage() + m_counters.capacity() * sizeof(T); }

private:
    using Counters = BoundedCounterMap<T, Hash, KeyEqual>;

    // The untracked item and one occurrence of every tracked item cancel each other out.
    void _fight()
    {
        if (m_policy == EvictionPolicy::GroupDecrement)
        {
            m_counters.decrement_all();
            m_counters.erase_zero_slots();
            return;
        }

        // No reclaimable slot is left at this point, whatever is still queued is stale.
        m_reclaimable.clear();
        m_reclaimable_count += m_counters.decrement_all([this](typename Counters::Slot &slot) { m_reclaimable.push_back(*slot.key); });
    }

    void _reclaim_slot(const T &item)
    {
        while (!m_reclaimable.empty())
        {
            T victim = m_reclaimable.front();
            m_reclaimable.pop_front();

            auto *slot = m_counters.find(victim);
            if (slot == nullptr || slot->count != 0) continue;   // revived since the fight

            m_counters.erase(*slot);
            m_reclaimable_count--;
            m_counters.insert(item, 1);
            return;
        }
        throw std::logic_error("Reclaimable slot count is out of sync with the reclaim queue.");
    }

    uint32_t m_k;
    EvictionPolicy m_policy;
    Counters m_counters;
    uint64_t m_n = 0;

    // SingleEvict only: zero-count slots in the order the last fight produced them.
    std::deque<T> m_reclaimable;
    uint32_t m_reclaimable_count = 0;
};
