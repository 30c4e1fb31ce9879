#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

// JSON Library
#include <nlohmann/json.hpp>

// Summary Headers
#include "frequency_summary/frequency_summary.hpp"
#include "frequency_summary/frequent_elements.hpp"

using json = nlohmann::json;

// Timer class to measure execution time
class Timer {
  public:
    void start() { m_start = std::chrono::high_resolution_clock::now(); }
    double stop_s() const {
        auto end = std::chrono::high_resolution_clock::now();
        return std::chrono::duration<double>(end - m_start).count();
    }

  private:
    std::chrono::time_point<std::chrono::high_resolution_clock> m_start;
};

// Data generation functions. seed == 0 draws a fresh seed from std::random_device.
std::vector<uint64_t> generate_zipf_data(uint64_t size, uint64_t diversity, double a, uint64_t seed = 0);
// `heavy_items` elements share `heavy_fraction` of the stream, the rest is uniform over `diversity` other items.
std::vector<uint64_t> generate_planted_data(uint64_t size, uint64_t diversity, uint32_t heavy_items, double heavy_fraction, uint64_t seed = 0);
// Parses one stream line: a dotted IPv4 address or an unsigned decimal integer, surrounding
// whitespace allowed. Signed, fractional and out-of-range values are rejected.
bool parse_stream_item(const std::string &line, uint64_t &item);
// One item per line, see parse_stream_item(). Unparseable lines are skipped and counted.
std::vector<uint64_t> read_stream_file(const std::string &path, uint64_t max_items);

// Frequency analysis functions
std::map<uint64_t, uint64_t> get_true_freqs(const std::vector<uint64_t> &data);
std::vector<uint64_t> get_items_above(const std::map<uint64_t, uint64_t> &freqs, uint64_t threshold);

// Candidate table: summary estimate next to the exact count and the verification verdict
void print_candidate_table(const std::string &title, const FrequencySummary<uint64_t> &summary, const std::map<uint64_t, uint64_t> &true_freqs, uint64_t threshold);

// File utilities
void create_directory(const std::string &path);
void write_json(const std::string &path, const json &j);
