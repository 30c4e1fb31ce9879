#include <cstdio>
#include <exception>
#include <iostream>
#include <map>
#include <string>
#include <vector>

// Utils
#include "utils/ConfigParser.hpp"
#include "utils/ConfigPrinter.hpp"

// Summary Headers
#include "frequency_summary/frequency_summary.hpp"
#include "frequency_summary/frequency_summary_config.hpp"
#include "frequency_summary/frequent_elements.hpp"
#include "frequency_summary/verification.hpp"

// Common utilities
#include "common.hpp"

using namespace std;

// App Config
struct AppConfig {
    string dataset_type = "planted";
    string input_path;
    uint64_t stream_size = 1000000;
    uint64_t stream_diversity = 100000;
    float zipf_param = 1.1;
    uint32_t heavy_items = 1;
    float heavy_fraction = 0.55;
    uint64_t seed = 0;
    string output_file;

    static void add_params_to_config_parser(AppConfig &config, ConfigParser &parser) {
        parser.AddParameter(new StringParameter("app.dataset_type", "planted", &config.dataset_type, false, "Stream source: planted, zipf or file"));
        parser.AddParameter(new StringParameter("app.input_path", "", &config.input_path, false, "Stream file, one item per line (dataset_type=file)"));
        parser.AddParameter(new UnsignedInt64Parameter("app.stream_size", "1000000", &config.stream_size, false, "Total items in stream (max items read for file)"));
        parser.AddParameter(new UnsignedInt64Parameter("app.stream_diversity", "100000", &config.stream_diversity, false, "Unique background items in stream"));
        parser.AddParameter(new FloatParameter("app.zipf", "1.1", &config.zipf_param, false, "Zipfian param 'a'"));
        parser.AddParameter(new UnsignedInt32Parameter("app.heavy_items", "1", &config.heavy_items, false, "Number of planted heavy items"));
        parser.AddParameter(new FloatParameter("app.heavy_fraction", "0.55", &config.heavy_fraction, false, "Share of the stream taken by the planted heavy items"));
        parser.AddParameter(new UnsignedInt64Parameter("app.seed", "0", &config.seed, false, "RNG seed, 0 picks a random one"));
        parser.AddParameter(new StringParameter("app.output_file", "", &config.output_file, false, "Optional JSON output path"));
    }
    friend std::ostream &operator<<(std::ostream &os, const AppConfig &config) {
        ConfigPrinter<AppConfig>::print(os, config);
        return os;
    }
    auto to_tuple() const {
        return std::make_tuple("dataset_type", dataset_type, "input_path", input_path, "stream_size", stream_size, "stream_diversity", stream_diversity, "zipf_param", zipf_param,
                               "heavy_items", heavy_items, "heavy_fraction", heavy_fraction, "seed", seed, "output_file", output_file);
    }
};

vector<uint64_t> load_stream(const AppConfig &config) {
    if (config.dataset_type == "planted") {
        return generate_planted_data(config.stream_size, config.stream_diversity, config.heavy_items, config.heavy_fraction, config.seed);
    } else if (config.dataset_type == "zipf") {
        return generate_zipf_data(config.stream_size, config.stream_diversity, config.zipf_param, config.seed);
    } else if (config.dataset_type == "file") {
        return read_stream_file(config.input_path, config.stream_size);
    }
    throw std::invalid_argument("Unknown dataset type '" + config.dataset_type + "'. Use planted, zipf or file.");
}

json run(const AppConfig &app_config, const FrequencySummaryConfig &summary_config) {
    vector<uint64_t> data = load_stream(app_config);
    if (data.empty()) throw EmptyInput("Stream is empty, nothing to summarize.");

    auto true_freqs = get_true_freqs(data);
    uint64_t n = data.size();
    uint32_t k = summary_config.k;
    EvictionPolicy policy = summary_config.get_policy();
    uint64_t threshold = frequency_threshold(n, k);

    // Phase 1: summary
    Timer timer;
    timer.start();
    FrequencySummary<uint64_t> summary(summary_config);
    for (const auto &item : data) summary.observe(item);
    double observe_s = timer.stop_s();

    // Phase 2: verification
    timer.start();
    auto verified = verify(data, summary.candidates(), k);
    double verify_s = timer.stop_s();

    print_candidate_table("Candidates", summary, true_freqs, threshold);

    // Guarantee check against ground truth: every item above n/k must have survived.
    uint64_t guaranteed_missing = 0;
    for (const auto &item : get_items_above(true_freqs, n / k)) {
        if (summary.estimate(item) == 0) guaranteed_missing++;
    }

    cout << "\nStream length          : " << n << endl;
    cout << "Distinct items         : " << true_freqs.size() << endl;
    cout << "Candidates (<= k-1)    : " << summary.size() << " / " << summary.get_capacity() << endl;
    cout << "Verified frequent      : " << verified.size() << endl;
    cout << "Missed n/k items       : " << guaranteed_missing << endl;
    cout << "Summary memory (bytes) : " << summary.get_max_memory_usage() << endl;
    cout << "Observe throughput     : " << fixed << setprecision(2) << (observe_s > 0 ? n / observe_s / 1e6 : 0.0) << " Mops" << endl;
    cout << "Verify time            : " << verify_s << " s" << endl;

    json j;
    j["config"] = {{"dataset_type", app_config.dataset_type}, {"stream_size", n}, {"k", k}, {"eviction_policy", to_string(policy)}};
    j["summary"] = {{"candidates", summary.size()}, {"capacity", summary.get_capacity()}, {"error_bound", summary.get_error_bound()}, {"memory_bytes", summary.get_max_memory_usage()}};
    j["timing"] = {{"observe_s", observe_s}, {"verify_s", verify_s}};
    j["threshold"] = threshold;
    j["missed_guaranteed"] = guaranteed_missing;
    for (const auto &[item, count] : verified) { j["frequent"].push_back({{"item", item}, {"count", count}}); }

    if (k == 2) {
        try {
            uint64_t majority = majority_element(data, policy);
            cout << "Majority element       : " << majority << " (" << true_freqs[majority] << " occurrences)" << endl;
            j["majority"] = majority;
        } catch (const NoMajorityElement &e) {
            cout << "Majority element       : none (" << e.what() << ")" << endl;
            j["majority"] = nullptr;
        }
    }
    return j;
}

int main(int argc, char **argv) {
    ConfigParser parser;
    AppConfig app_configs;
    FrequencySummaryConfig summary_configs;

    AppConfig::add_params_to_config_parser(app_configs, parser);
    FrequencySummaryConfig::add_params_to_config_parser(summary_configs, parser);

    if (argc > 1 && (string(argv[1]) == "--help" || string(argv[1]) == "-h")) {
        parser.PrintUsage();
        return 0;
    }
    if (argc > 1 && (string(argv[1]) == "--generate-doc")) {
        parser.PrintMarkdown();
        return 0;
    }

    Status s = parser.ParseCommandLine(argc, argv);
    if (!s.IsOK()) {
        fprintf(stderr, "%s\n", s.ToString().c_str());
        return -1;
    }

    cout << app_configs;
    cout << summary_configs;

    try {
        json j = run(app_configs, summary_configs);
        if (!app_configs.output_file.empty()) write_json(app_configs.output_file, j);
    } catch (const std::invalid_argument &e) {
        cerr << "Error: " << e.what() << endl;
        return -1;
    } catch (const std::exception &e) {
        cerr << "Fatal: " << e.what() << endl;
        return 1;
    }
    return 0;
}
