#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <random>
#include <sstream>
#include <string>
#include <vector>

// Library
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

// Summary Headers
#include "frequency_summary/eviction_policy.hpp"
#include "frequency_summary/frequency_summary.hpp"
#include "frequency_summary/verification.hpp"

// Common utilities
#include "common.hpp"

using namespace std;
using json = nlohmann::json;

// Dataset configuration
struct DatasetConfig {
    string name;
    string dataset_type;
    string input_path;
    uint64_t stream_size = 0;
    uint64_t stream_diversity = 0;
    double zipf_param = 1.1;
    uint32_t heavy_items = 1;
    double heavy_fraction = 0.5;
};

// One grid of runs: every k crossed with every policy on one dataset
struct RunConfig {
    string dataset_name;
    vector<uint32_t> ks;
    vector<EvictionPolicy> policies;
};

struct ExperimentConfig {
    string name;
    uint32_t repetitions;
    string output_file;
    uint32_t master_seed;

    map<string, DatasetConfig> datasets;
    vector<RunConfig> runs;
};

struct RunResult {
    string dataset_name;
    uint32_t repetition_id;
    uint32_t k;
    EvictionPolicy policy;
    uint64_t stream_size;
    uint64_t threshold;
    uint32_t candidates;
    uint32_t spurious_candidates;   // candidates not above n/k
    uint32_t missed_guaranteed;     // items above n/k without a counter, must stay 0
    uint32_t verified;
    uint64_t max_estimate_error;
    uint64_t error_bound;
    double throughput_mops;
    double verify_s;
    uint64_t memory_bytes;
};

ExperimentConfig parse_yaml(const string &yaml_file) {
    YAML::Node root = YAML::LoadFile(yaml_file);
    ExperimentConfig config;

    // Parse metadata
    auto metadata = root["metadata"];
    config.name = metadata["name"].as<string>();
    config.repetitions = metadata["repetitions"].as<uint32_t>(1);
    config.output_file = metadata["output_file"].as<string>("output/experiment.json");

    // Parse datasets
    auto datasets_node = root["datasets"];
    for (auto it = datasets_node.begin(); it != datasets_node.end(); ++it) {
        string dataset_name = it->first.as<string>();
        auto ds = it->second;

        DatasetConfig dataset;
        dataset.name = dataset_name;
        dataset.dataset_type = ds["dataset_type"].as<string>();
        dataset.stream_size = ds["stream_size"].as<uint64_t>();

        if (dataset.dataset_type == "file") {
            dataset.input_path = ds["input_path"].as<string>();
        } else if (dataset.dataset_type == "zipf") {
            dataset.stream_diversity = ds["stream_diversity"].as<uint64_t>();
            dataset.zipf_param = ds["zipf_param"].as<double>();
        } else if (dataset.dataset_type == "planted") {
            dataset.stream_diversity = ds["stream_diversity"].as<uint64_t>();
            dataset.heavy_items = ds["heavy_items"].as<uint32_t>(1);
            dataset.heavy_fraction = ds["heavy_fraction"].as<double>();
        } else {
            throw std::invalid_argument("Dataset '" + dataset_name + "' has unknown type '" + dataset.dataset_type + "'.");
        }

        config.datasets[dataset_name] = dataset;
    }

    // Parse runs
    for (const auto &run_node : root["runs"]) {
        RunConfig run;
        run.dataset_name = run_node["dataset"].as<string>();
        if (!config.datasets.count(run.dataset_name)) throw std::invalid_argument("Run refers to unknown dataset '" + run.dataset_name + "'.");

        for (const auto &k : run_node["k"]) { run.ks.push_back(k.as<uint32_t>()); }
        if (run_node["policies"]) {
            for (const auto &p : run_node["policies"]) { run.policies.push_back(parse_eviction_policy(p.as<string>())); }
        } else {
            run.policies = {EvictionPolicy::GroupDecrement, EvictionPolicy::SingleEvict};
        }
        config.runs.push_back(run);
    }

    // Parse other options
    auto other_options = root["other_options"];
    config.master_seed = other_options ? other_options["master_seed"].as<uint32_t>(0) : 0;

    return config;
}

vector<uint64_t> load_or_generate_dataset(const DatasetConfig &dataset, uint64_t seed) {
    if (dataset.dataset_type == "zipf") return generate_zipf_data(dataset.stream_size, dataset.stream_diversity, dataset.zipf_param, seed);
    if (dataset.dataset_type == "planted") return generate_planted_data(dataset.stream_size, dataset.stream_diversity, dataset.heavy_items, dataset.heavy_fraction, seed);

    vector<uint64_t> data = read_stream_file(dataset.input_path, dataset.stream_size);
    if (data.size() < dataset.stream_size) { cerr << "Warning: stream file has fewer items than requested. Using full file." << endl; }
    return data;
}

RunResult run_single(const vector<uint64_t> &data, const map<uint64_t, uint64_t> &ground_truth, uint32_t k, EvictionPolicy policy) {
    RunResult result{};
    result.k = k;
    result.policy = policy;
    result.stream_size = data.size();
    result.threshold = frequency_threshold(data.size(), k);

    Timer timer;
    timer.start();
    FrequencySummary<uint64_t> summary(k, policy);
    for (const auto &item : data) summary.observe(item);
    double elapsed = timer.stop_s();
    result.throughput_mops = (elapsed > 0) ? (data.size() / elapsed / 1e6) : 0;

    uint64_t guarantee = data.size() / k;
    summary.for_each_candidate(
        [&](const uint64_t &item, uint64_t estimate) {
            uint64_t exact = ground_truth.at(item);
            if (exact <= guarantee) result.spurious_candidates++;
            result.max_estimate_error = max(result.max_estimate_error, exact - estimate);
        });
    for (const auto &item : get_items_above(ground_truth, guarantee)) {
        if (summary.estimate(item) == 0) result.missed_guaranteed++;
    }

    timer.start();
    auto verified = verify(data, summary.candidates(), k);
    result.verify_s = timer.stop_s();

    result.candidates = summary.size();
    result.verified = static_cast<uint32_t>(verified.size());
    result.error_bound = summary.get_error_bound();
    result.memory_bytes = summary.get_max_memory_usage();
    return result;
}

void export_to_json(const string &filename, const ExperimentConfig &config, const vector<RunResult> &results) {
    json j;

    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_now;
    gmtime_r(&now_time_t, &tm_now);
    std::ostringstream timestamp;
    timestamp << std::put_time(&tm_now, "%Y-%m-%dT%H:%M:%SZ");

    j["metadata"] = {{"experiment_type", "frequent_elements"}, {"name", config.name}, {"timestamp", timestamp.str()}};
    j["config"]["experiment"] = {{"repetitions", config.repetitions}, {"master_seed", config.master_seed}};

    json datasets_json;
    for (const auto &[name, ds] : config.datasets) {
        datasets_json[name] = {{"dataset_type", ds.dataset_type}, {"stream_size", ds.stream_size}};
        if (ds.dataset_type == "zipf") {
            datasets_json[name]["stream_diversity"] = ds.stream_diversity;
            datasets_json[name]["zipf_param"] = ds.zipf_param;
        } else if (ds.dataset_type == "planted") {
            datasets_json[name]["stream_diversity"] = ds.stream_diversity;
            datasets_json[name]["heavy_items"] = ds.heavy_items;
            datasets_json[name]["heavy_fraction"] = ds.heavy_fraction;
        } else {
            datasets_json[name]["input_path"] = ds.input_path;
        }
    }
    j["config"]["datasets"] = datasets_json;

    j["results"] = json::array();
    for (const auto &r : results) {
        j["results"].push_back({{"dataset", r.dataset_name},
                                {"repetition_id", r.repetition_id},
                                {"k", r.k},
                                {"eviction_policy", to_string(r.policy)},
                                {"stream_size", r.stream_size},
                                {"threshold", r.threshold},
                                {"candidates", r.candidates},
                                {"spurious_candidates", r.spurious_candidates},
                                {"missed_guaranteed", r.missed_guaranteed},
                                {"verified", r.verified},
                                {"max_estimate_error", r.max_estimate_error},
                                {"error_bound", r.error_bound},
                                {"throughput_mops", r.throughput_mops},
                                {"verify_s", r.verify_s},
                                {"memory_bytes", r.memory_bytes}});
    }

    write_json(filename, j);
}

void print_result_row(const RunResult &r) {
    cout << "| " << left << setw(6) << r.k << " | " << setw(15) << to_string(r.policy) << " | " << right << setw(10) << r.candidates << " | " << setw(9) << r.spurious_candidates << " | "
         << setw(8) << r.verified << " | " << setw(6) << r.missed_guaranteed << " | " << setw(12) << r.max_estimate_error << " / " << left << setw(10) << r.error_bound << " | " << right
         << fixed << setprecision(2) << setw(8) << r.throughput_mops << " |" << endl;
}

int run_experiment(const ExperimentConfig &config) {
    cout << "\n=== Experiment: " << config.name << " ===" << endl;
    cout << "Repetitions: " << config.repetitions << endl;
    cout << "Master Seed: " << config.master_seed << endl;

    vector<RunResult> all_results;
    uint32_t violations = 0;

    for (uint32_t rep = 0; rep < config.repetitions; ++rep) {
        cout << "\n========================================" << endl;
        cout << "Repetition " << (rep + 1) << "/" << config.repetitions << endl;
        cout << "========================================" << endl;

        std::mt19937_64 rng(config.master_seed + rep);
        std::uniform_int_distribution<uint64_t> dist(1, std::numeric_limits<uint64_t>::max());

        // Load all datasets once per repetition
        map<string, vector<uint64_t>> loaded_datasets;
        map<string, map<uint64_t, uint64_t>> ground_truths;
        for (const auto &[name, ds_config] : config.datasets) {
            loaded_datasets[name] = load_or_generate_dataset(ds_config, config.master_seed == 0 ? 0 : dist(rng));
            ground_truths[name] = get_true_freqs(loaded_datasets[name]);
            cout << "Loaded dataset '" << name << "': " << loaded_datasets[name].size() << " items, " << ground_truths[name].size() << " distinct" << endl;
        }

        for (const auto &run : config.runs) {
            const auto &data = loaded_datasets.at(run.dataset_name);
            if (data.empty()) {
                cerr << "Skipping dataset '" << run.dataset_name << "': stream is empty." << endl;
                continue;
            }

            cout << "\n--- Dataset " << run.dataset_name << " ---" << endl;
            cout << "| k      | policy          | candidates | spurious  | verified | missed | max err / bound           | Mops     |" << endl;
            for (uint32_t k : run.ks) {
                for (EvictionPolicy policy : run.policies) {
                    RunResult r = run_single(data, ground_truths.at(run.dataset_name), k, policy);
                    r.dataset_name = run.dataset_name;
                    r.repetition_id = rep;
                    print_result_row(r);

                    if (r.missed_guaranteed > 0 || r.max_estimate_error > r.error_bound) violations++;
                    all_results.push_back(r);
                }
            }
        }
    }

    export_to_json(config.output_file, config, all_results);

    if (violations > 0) {
        cerr << "Error: " << violations << " runs broke the Misra-Gries guarantee." << endl;
        return 2;
    }
    return 0;
}

int main(int argc, char **argv) {
    if (argc < 2) {
        cerr << "Usage: " << argv[0] << " <yaml_file>" << endl;
        return 1;
    }

    string yaml_file = argv[1];

    try {
        ExperimentConfig config = parse_yaml(yaml_file);
        return run_experiment(config);
    } catch (const YAML::Exception &e) {
        cerr << "YAML parsing error: " << e.what() << endl;
        return 1;
    } catch (const exception &e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }
}
