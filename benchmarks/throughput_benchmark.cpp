/**
 * Observe Throughput Benchmark for the Misra-Gries summary
 * Measures update throughput of both eviction policies across k on a zipf stream,
 * plus the cost of the verification pass.
 * Test:  ./build/bin/throughput_benchmark --trials 5 --items 1000000 --diversity 100000 --zipf 1.1
 */

#include "frequency_summary/frequency_summary.hpp"
#include "frequency_summary/verification.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <vector>

using json = nlohmann::json;

std::vector<uint64_t> generate_zipf_stream(uint64_t num_items, uint64_t diversity, double a, std::mt19937_64 &rng)
{
    std::vector<double> pdf(diversity);
    for (uint64_t i = 1; i <= diversity; ++i) { pdf[i - 1] = 1.0 / std::pow(static_cast<double>(i), a); }
    std::discrete_distribution<uint64_t> dist(pdf.begin(), pdf.end());

    std::vector<uint64_t> data;
    data.reserve(num_items);
    for (uint64_t i = 0; i < num_items; ++i) { data.push_back(dist(rng)); }
    return data;
}

struct TrialResult
{
    double observe_mops;
    double verify_mops;
    uint32_t candidates;
    uint32_t verified;
};

TrialResult measure_trial(const std::vector<uint64_t> &data, uint32_t k, EvictionPolicy policy)
{
    auto start = std::chrono::high_resolution_clock::now();
    FrequencySummary<uint64_t> summary(k, policy);
    for (const auto &item : data) summary.observe(item);
    double observe_s = std::chrono::duration<double>(std::chrono::high_resolution_clock::now() - start).count();

    start = std::chrono::high_resolution_clock::now();
    auto verified = verify(data, summary.candidates(), k);
    double verify_s = std::chrono::duration<double>(std::chrono::high_resolution_clock::now() - start).count();

    double n = static_cast<double>(data.size());
    return {observe_s > 0 ? n / observe_s / 1e6 : 0.0, verify_s > 0 ? n / verify_s / 1e6 : 0.0, summary.size(), static_cast<uint32_t>(verified.size())};
}

int main(int argc, char *argv[])
{
    std::cout << "Observe Throughput Benchmark\n" << std::string(80, '=') << std::endl;

    uint64_t num_items = 1000000;
    uint64_t diversity = 100000;
    double zipf = 1.1;
    uint32_t num_trials = 5;
    uint64_t seed = 42;
    std::string output_file;
    std::vector<uint32_t> ks = {2, 10, 100, 1000, 10000};

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--items" && i + 1 < argc) { num_items = std::stoull(argv[++i]); }
        else if (arg == "--diversity" && i + 1 < argc) { diversity = std::stoull(argv[++i]); }
        else if (arg == "--zipf" && i + 1 < argc) { zipf = std::stod(argv[++i]); }
        else if (arg == "--trials" && i + 1 < argc) { num_trials = std::stoul(argv[++i]); }
        else if (arg == "--seed" && i + 1 < argc) { seed = std::stoull(argv[++i]); }
        else if (arg == "--output" && i + 1 < argc) { output_file = argv[++i]; }
        else if (arg == "--help")
        {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  --items N      Stream length (default: 1000000)\n"
                      << "  --diversity N  Distinct items (default: 100000)\n"
                      << "  --zipf A       Zipf skew (default: 1.1)\n"
                      << "  --trials N     Number of trials (default: 5)\n"
                      << "  --seed N       Stream seed (default: 42)\n"
                      << "  --output PATH  Optional JSON output\n";
            return 0;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << " (see --help)" << std::endl;
            return 1;
        }
    }
    if (num_trials == 0 || num_items == 0 || diversity == 0)
    {
        std::cerr << "Error: --trials, --items and --diversity must be positive." << std::endl;
        return 1;
    }

    std::cout << "Config: items=" << num_items << ", diversity=" << diversity << ", zipf=" << zipf << ", trials=" << num_trials << "\n" << std::endl;

    std::mt19937_64 rng(seed);
    std::vector<uint64_t> data = generate_zipf_stream(num_items, diversity, zipf, rng);

    json results = json::array();
    std::cout << std::left << std::setw(8) << "k" << std::setw(18) << "policy" << std::right << std::setw(14) << "observe Mops" << std::setw(14) << "median Mops" << std::setw(14)
              << "verify Mops" << std::setw(12) << "candidates" << std::setw(10) << "verified" << std::endl;

    for (uint32_t k : ks)
    {
        for (EvictionPolicy policy : {EvictionPolicy::GroupDecrement, EvictionPolicy::SingleEvict})
        {
            std::vector<double> observe_mops;
            std::vector<double> verify_mops;
            TrialResult last{};
            for (uint32_t trial = 0; trial < num_trials; ++trial)
            {
                last = measure_trial(data, k, policy);
                observe_mops.push_back(last.observe_mops);
                verify_mops.push_back(last.verify_mops);
            }

            std::sort(observe_mops.begin(), observe_mops.end());
            double avg_observe = std::accumulate(observe_mops.begin(), observe_mops.end(), 0.0) / num_trials;
            double median_observe = observe_mops[num_trials / 2];
            double avg_verify = std::accumulate(verify_mops.begin(), verify_mops.end(), 0.0) / num_trials;

            std::cout << std::left << std::setw(8) << k << std::setw(18) << to_string(policy) << std::right << std::fixed << std::setprecision(2) << std::setw(14) << avg_observe
                      << std::setw(14) << median_observe << std::setw(14) << avg_verify << std::setw(12) << last.candidates << std::setw(10) << last.verified << std::endl;

            results.push_back({{"k", k},
                               {"eviction_policy", to_string(policy)},
                               {"avg_observe_mops", avg_observe},
                               {"median_observe_mops", median_observe},
                               {"avg_verify_mops", avg_verify},
                               {"candidates", last.candidates},
                               {"verified", last.verified}});
        }
    }

    if (!output_file.empty())
    {
        std::ofstream out(output_file);
        if (!out.is_open())
        {
            std::cerr << "Error: Cannot open output file: " << output_file << std::endl;
            return 1;
        }
        out << json{{"items", num_items}, {"diversity", diversity}, {"zipf", zipf}, {"trials", num_trials}, {"results", results}}.dump(2) << std::endl;
        std::cout << "\nResults exported to: " << output_file << std::endl;
    }

    return 0;
}
