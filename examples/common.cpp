#include "common.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>
#include <sys/stat.h>

namespace
{
std::mt19937_64 make_rng(uint64_t seed) { return std::mt19937_64(seed == 0 ? std::random_device{}() : seed); }
}   // namespace

std::vector<uint64_t> generate_zipf_data(uint64_t size, uint64_t diversity, double a, uint64_t seed)
{
    if (diversity == 0) throw std::invalid_argument("Zipf stream needs a diversity of at least 1.");

    std::vector<double> pdf(diversity);
    double sum = 0.0;
    for (uint64_t i = 1; i <= diversity; ++i)
    {
        pdf[i - 1] = 1.0 / std::pow(static_cast<double>(i), a);
        sum += pdf[i - 1];
    }
    for (uint64_t i = 0; i < diversity; ++i) { pdf[i] /= sum; }
    std::discrete_distribution<uint64_t> dist(pdf.begin(), pdf.end());
    std::mt19937_64 rng = make_rng(seed);
    std::vector<uint64_t> data;
    data.reserve(size);
    for (uint64_t i = 0; i < size; ++i) { data.push_back(dist(rng)); }
    return data;
}

std::vector<uint64_t> generate_planted_data(uint64_t size, uint64_t diversity, uint32_t heavy_items, double heavy_fraction, uint64_t seed)
{
    if (heavy_fraction < 0.0 || heavy_fraction > 1.0) throw std::invalid_argument("Heavy fraction must lie in [0, 1].");
    if (heavy_items == 0 && heavy_fraction > 0.0) throw std::invalid_argument("A positive heavy fraction needs at least one heavy item.");
    if (diversity == 0 && heavy_fraction < 1.0) throw std::invalid_argument("Background items need a diversity of at least 1.");

    uint64_t heavy_total = static_cast<uint64_t>(std::llround(heavy_fraction * static_cast<double>(size)));

    // Heavy items are 0 .. heavy_items-1, background items follow them.
    std::vector<uint64_t> data;
    data.reserve(size);
    for (uint64_t i = 0; i < heavy_total; ++i) { data.push_back(i % heavy_items); }

    std::mt19937_64 rng = make_rng(seed);
    if (heavy_total < size)
    {
        std::uniform_int_distribution<uint64_t> background(heavy_items, heavy_items + diversity - 1);
        for (uint64_t i = heavy_total; i < size; ++i) { data.push_back(background(rng)); }
    }
    std::shuffle(data.begin(), data.end(), rng);
    return data;
}

bool parse_stream_item(const std::string &line, uint64_t &item)
{
    size_t begin = line.find_first_not_of(" \t\r");
    if (begin == std::string::npos) return false;
    std::string token = line.substr(begin, line.find_last_not_of(" \t\r") + 1 - begin);
    // Signs are rejected up front, stoull would silently wrap "-5".
    if (!std::isdigit(static_cast<unsigned char>(token[0]))) return false;

    unsigned int a, b, c, d;
    char tail;
    if (token.find('.') != std::string::npos && sscanf(token.c_str(), "%u.%u.%u.%u%c", &a, &b, &c, &d, &tail) == 4)
    {
        if (a > 255 || b > 255 || c > 255 || d > 255) return false;
        item = ((uint64_t) a << 24) | ((uint64_t) b << 16) | ((uint64_t) c << 8) | (uint64_t) d;
        return true;
    }

    size_t pos = 0;
    try
    {
        item = std::stoull(token, &pos, 10);
    }
    catch (const std::out_of_range &)
    {
        return false;
    }
    return pos == token.size();
}

std::vector<uint64_t> read_stream_file(const std::string &path, uint64_t max_items)
{
    std::ifstream file(path);
    if (!file.is_open()) throw std::runtime_error("Cannot open stream file: " + path);

    std::vector<uint64_t> data;
    std::string line;
    uint64_t skipped = 0;
    while (data.size() < max_items && std::getline(file, line))
    {
        uint64_t item = 0;
        if (parse_stream_item(line, item)) { data.push_back(item); }
        else { skipped++; }
    }
    std::cout << "Read " << data.size() << " items from " << path;
    if (skipped > 0) std::cout << " (" << skipped << " unparseable lines skipped)";
    std::cout << "." << std::endl;
    return data;
}

std::map<uint64_t, uint64_t> get_true_freqs(const std::vector<uint64_t> &data)
{
    std::map<uint64_t, uint64_t> freqs;
    for (const auto &item : data) { freqs[item]++; }
    return freqs;
}

std::vector<uint64_t> get_items_above(const std::map<uint64_t, uint64_t> &freqs, uint64_t threshold)
{
    std::vector<uint64_t> items;
    for (const auto &[item, freq] : freqs)
    {
        if (freq > threshold) items.push_back(item);
    }
    return items;
}

void print_candidate_table(const std::string &title, const FrequencySummary<uint64_t> &summary, const std::map<uint64_t, uint64_t> &true_freqs, uint64_t threshold)
{
    std::vector<std::pair<uint64_t, uint64_t>> rows;
    summary.for_each_candidate([&rows](const uint64_t &item, uint64_t count) { rows.emplace_back(item, count); });
    std::sort(
        rows.begin(), rows.end(),
        [](const auto &a, const auto &b)
        {
            return a.second > b.second;
        });

    std::cout << "\n--- " << title << " (threshold " << threshold << ") ---\n\n";
    std::cout << "+----------------------+--------------+--------------+----------+" << std::endl;
    std::cout << "| Item                 | Estimate     | Exact        | Verdict  |" << std::endl;
    std::cout << "+----------------------+--------------+--------------+----------+" << std::endl;
    for (const auto &[item, estimate] : rows)
    {
        auto it = true_freqs.find(item);
        uint64_t exact = it == true_freqs.end() ? 0 : it->second;
        std::cout << "| " << std::left << std::setw(20) << item << " | " << std::right << std::setw(12) << estimate << " | " << std::setw(12) << exact << " | " << std::left
                  << std::setw(8) << (exact > threshold ? "frequent" : "spurious") << " |" << std::endl;
    }
    std::cout << "+----------------------+--------------+--------------+----------+" << std::endl;
}

void create_directory(const std::string &path)
{
    size_t pos = path.find_last_of('/');
    if (pos != std::string::npos)
    {
        std::string dir = path.substr(0, pos);
        mkdir(dir.c_str(), 0755);
    }
}

void write_json(const std::string &path, const json &j)
{
    create_directory(path);
    std::ofstream out(path);
    if (!out.is_open()) throw std::runtime_error("Cannot open output file: " + path);
    out << j.dump(2) << std::endl;
    std::cout << "Results written to " << path << std::endl;
}
