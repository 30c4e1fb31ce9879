#include <doctest/doctest.h>

#include "frequency_summary/frequency_summary.hpp"

#include <algorithm>
#include <map>
#include <random>
#include <string>
#include <unordered_set>
#include <vector>

namespace
{
const EvictionPolicy kPolicies[] = {EvictionPolicy::GroupDecrement, EvictionPolicy::SingleEvict};

std::map<int, uint64_t> count_all(const std::vector<int> &data)
{
    std::map<int, uint64_t> counts;
    for (int x : data) counts[x]++;
    return counts;
}

// `planted` occurs exactly `planted_count` times, the rest are background items 1000.. drawn uniformly.
std::vector<int> planted_stream(std::mt19937_64 &rng, size_t n, int planted, size_t planted_count, int background_diversity)
{
    std::vector<int> data(planted_count, planted);
    std::uniform_int_distribution<int> background(1000, 1000 + background_diversity - 1);
    while (data.size() < n) data.push_back(background(rng));
    std::shuffle(data.begin(), data.end(), rng);
    return data;
}
}   // namespace

TEST_CASE("FrequencySummary rejects k < 1")
{
    CHECK_THROWS_AS(FrequencySummary<int>(0), InvalidArgument);
    CHECK_THROWS_AS(FrequencySummary<int>(0, EvictionPolicy::SingleEvict), std::invalid_argument);
    CHECK_NOTHROW(FrequencySummary<int>(1));
}

TEST_CASE("FrequencySummary rejects a negative k instead of wrapping it")
{
    CHECK_THROWS_AS(FrequencySummary<int>(-1), InvalidArgument);
    CHECK_THROWS_AS(FrequencySummary<int>::from_sequence(std::vector<int>{1, 2}, -3), InvalidArgument);
    CHECK_THROWS_AS(FrequencySummary<int>(int64_t{1} << 40), InvalidArgument);
}

TEST_CASE("FrequencySummary with k = 1 never retains anything")
{
    for (auto policy : kPolicies)
    {
        CAPTURE(policy);
        FrequencySummary<int> summary(1, policy);
        CHECK(summary.get_capacity() == 0);
        for (int x : {7, 7, 7, 7, 3}) summary.observe(x);
        CHECK(summary.candidates().empty());
        CHECK(summary.size() == 0);
        CHECK(summary.estimate(7) == 0);
        CHECK(summary.get_n() == 5);
    }
}

TEST_CASE("FrequencySummary with k = 2 behaves as a majority vote")
{
    for (auto policy : kPolicies)
    {
        CAPTURE(policy);
        auto majority = FrequencySummary<int>::from_sequence(std::vector<int>{1, 1, 1, 2, 2}, 2, policy);
        CHECK(majority.candidates() == std::unordered_set<int>{1});
        CHECK(majority.estimate(1) == 1);
        CHECK(majority.estimate(2) == 0);

        // Every 1 is cancelled by a 2.
        auto tied = FrequencySummary<int>::from_sequence(std::vector<int>{1, 1, 2, 2, 1, 2}, 2, policy);
        CHECK(tied.candidates().empty());
        CHECK(tied.get_n() == 6);
    }
}

TEST_CASE("FrequencySummary fight decrements every tracked counter and drops the newcomer")
{
    for (auto policy : kPolicies)
    {
        CAPTURE(policy);
        FrequencySummary<int> summary(3, policy);
        for (int x : {1, 1, 1, 2, 2, 2}) summary.observe(x);
        CHECK(summary.estimate(1) == 3);
        CHECK(summary.estimate(2) == 3);

        summary.observe(3);
        CHECK(summary.candidates() == std::unordered_set<int>{1, 2});
        CHECK(summary.estimate(1) == 2);
        CHECK(summary.estimate(2) == 2);
        CHECK(summary.estimate(3) == 0);
    }
}

TEST_CASE("FrequencySummary SingleEvict keeps zeroed slots until a newcomer claims one")
{
    FrequencySummary<int> summary(3, EvictionPolicy::SingleEvict);
    for (int x : {1, 2, 3}) summary.observe(x);
    // 1 and 2 sit at zero: resident but not candidates.
    CHECK(summary.size() == 0);
    CHECK(summary.candidates().empty());

    // A revived slot counts again without a new insert.
    summary.observe(2);
    CHECK(summary.candidates() == std::unordered_set<int>{2});
    CHECK(summary.estimate(2) == 1);

    // The newcomer takes 1's slot instead of starting another fight.
    summary.observe(4);
    CHECK(summary.candidates() == std::unordered_set<int>{2, 4});
    CHECK(summary.estimate(2) == 1);
    CHECK(summary.estimate(4) == 1);

    // Full again with no reclaimable slot: fight.
    summary.observe(5);
    CHECK(summary.candidates().empty());
    CHECK(summary.get_n() == 6);
}

TEST_CASE("FrequencySummary GroupDecrement evicts zeroed counters immediately")
{
    FrequencySummary<int> summary(3, EvictionPolicy::GroupDecrement);
    for (int x : {1, 2, 3, 2, 4}) summary.observe(x);
    CHECK(summary.candidates() == std::unordered_set<int>{2, 4});
    summary.observe(5);
    CHECK(summary.candidates().empty());
}

TEST_CASE("FrequencySummary never tracks more than k - 1 candidates")
{
    std::mt19937_64 rng(7);
    std::uniform_int_distribution<int> dist(0, 50);
    for (uint32_t k : {2u, 3u, 5u, 17u})
    {
        for (auto policy : kPolicies)
        {
            CAPTURE(k);
            CAPTURE(policy);
            FrequencySummary<int> summary(k, policy);
            for (int i = 0; i < 2000; ++i)
            {
                summary.observe(dist(rng));
                REQUIRE(summary.size() <= k - 1);
                REQUIRE(summary.candidates().size() <= k - 1);
            }
        }
    }
}

TEST_CASE("FrequencySummary keeps every element above n/k")
{
    std::mt19937_64 rng(12345);
    for (int round = 0; round < 50; ++round)
    {
        for (uint32_t k : {2u, 3u, 5u, 10u})
        {
            for (auto policy : kPolicies)
            {
                const size_t n = 1000;
                auto data = planted_stream(rng, n, 42, n / k + 1, 300);
                auto summary = FrequencySummary<int>::from_sequence(data, k, policy);

                CAPTURE(round);
                CAPTURE(k);
                CAPTURE(policy);
                CHECK(summary.candidates().count(42) == 1);
                for (const auto &[item, count] : count_all(data))
                {
                    if (count > n / k) CHECK(summary.candidates().count(item) == 1);
                }
            }
        }
    }
}

TEST_CASE("FrequencySummary estimates undercount by at most n/k")
{
    std::mt19937_64 rng(99);
    std::geometric_distribution<int> skewed(0.05);
    for (uint32_t k : {2u, 4u, 16u})
    {
        for (auto policy : kPolicies)
        {
            std::vector<int> data;
            for (int i = 0; i < 5000; ++i) data.push_back(skewed(rng));
            auto summary = FrequencySummary<int>::from_sequence(data, k, policy);
            CHECK(summary.get_error_bound() == data.size() / k);

            for (const auto &[item, count] : count_all(data))
            {
                CAPTURE(item);
                uint64_t estimate = summary.estimate(item);
                CHECK(estimate <= count);
                CHECK(estimate + summary.get_error_bound() >= count);
            }
        }
    }
}

TEST_CASE("FrequencySummary intermediate candidates depend on order")
{
    std::vector<int> a = {1, 1, 2, 3};
    std::vector<int> b = {2, 3, 1, 1};

    FrequencySummary<int> sa(3);
    FrequencySummary<int> sb(3);
    for (size_t i = 0; i < 2; ++i)
    {
        sa.observe(a[i]);
        sb.observe(b[i]);
    }
    CHECK(sa.candidates() == std::unordered_set<int>{1});
    CHECK(sb.candidates() == std::unordered_set<int>{2, 3});

    sa.observe_all(a.begin() + 2, a.end());
    sb.observe_all(b.begin() + 2, b.end());
    CHECK(sa.candidates() == std::unordered_set<int>{1});
    CHECK(sb.candidates() == std::unordered_set<int>{1});
}

TEST_CASE("FrequencySummary::from_sequence matches observing one by one")
{
    std::vector<std::string> words = {"to", "be", "or", "not", "to", "be", "to"};
    for (auto policy : kPolicies)
    {
        FrequencySummary<std::string> manual(3, policy);
        for (const auto &w : words) manual.observe(w);
        auto batch = FrequencySummary<std::string>::from_sequence(words, 3, policy);

        CHECK(batch.candidates() == manual.candidates());
        CHECK(batch.get_n() == manual.get_n());
        CHECK(batch.estimate("to") == manual.estimate("to"));
        CHECK(batch.candidates().count("to") == 1);
    }
}

TEST_CASE("FrequencySummary is built from a config")
{
    FrequencySummaryConfig config{4, "single_evict"};
    FrequencySummary<int> summary(config);
    CHECK(summary.get_k() == 4);
    CHECK(summary.get_capacity() == 3);
    CHECK(summary.get_policy() == EvictionPolicy::SingleEvict);
    CHECK(summary.get_max_memory_usage() > 0);

    FrequencySummaryConfig bad{4, "lru"};
    CHECK_THROWS_AS(FrequencySummary<int>{bad}, InvalidArgument);
}

TEST_CASE("FrequencySummary for_each_candidate skips zeroed slots")
{
    FrequencySummary<int> summary(4, EvictionPolicy::SingleEvict);
    for (int x : {1, 1, 2, 3, 4}) summary.observe(x);

    std::map<int, uint64_t> seen;
    summary.for_each_candidate([&seen](const int &item, uint64_t count) { seen[item] = count; });
    CHECK(seen == std::map<int, uint64_t>{{1, 1}});
}
