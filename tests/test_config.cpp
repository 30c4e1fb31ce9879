#include <doctest/doctest.h>

#include "frequency_summary/eviction_policy.hpp"
#include "frequency_summary/frequency_summary_config.hpp"
#include "utils/ConfigParser.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace
{
Status parse(ConfigParser &parser, std::vector<std::string> args)
{
    args.insert(args.begin(), "prog");
    std::vector<char *> argv;
    for (auto &a : args) argv.push_back(a.data());
    return parser.ParseCommandLine(static_cast<int>(argv.size()), argv.data());
}
}   // namespace

TEST_CASE("Eviction policy names round-trip")
{
    for (auto policy : {EvictionPolicy::GroupDecrement, EvictionPolicy::SingleEvict}) { CHECK(parse_eviction_policy(to_string(policy)) == policy); }
    CHECK(parse_eviction_policy("GROUP_DECREMENT") == EvictionPolicy::GroupDecrement);
    CHECK(parse_eviction_policy("single") == EvictionPolicy::SingleEvict);
    CHECK_THROWS_AS(parse_eviction_policy("lru"), InvalidArgument);
}

TEST_CASE("FrequencySummaryConfig picks up defaults on registration")
{
    ConfigParser parser;
    FrequencySummaryConfig config;
    FrequencySummaryConfig::add_params_to_config_parser(config, parser);

    CHECK(config.k == 2);
    CHECK(config.get_policy() == EvictionPolicy::GroupDecrement);
    CHECK(parse(parser, {}).IsOK());
    CHECK(config.k == 2);
}

TEST_CASE("ConfigParser reads --name=value and --name value")
{
    ConfigParser parser;
    FrequencySummaryConfig config;
    FrequencySummaryConfig::add_params_to_config_parser(config, parser);

    Status s = parse(parser, {"--summary.k=16", "--summary.eviction_policy", "single_evict"});
    CHECK(s.IsOK());
    CHECK(config.k == 16);
    CHECK(config.get_policy() == EvictionPolicy::SingleEvict);
}

TEST_CASE("ConfigParser reports bad command lines")
{
    ConfigParser parser;
    FrequencySummaryConfig config;
    FrequencySummaryConfig::add_params_to_config_parser(config, parser);

    CHECK(parse(parser, {"--summary.width=3"}).code() == Status::Code::kNotFound);
    CHECK(parse(parser, {"--summary.k=abc"}).code() == Status::Code::kInvalidArgument);
    CHECK(parse(parser, {"--summary.k=-1"}).code() == Status::Code::kInvalidArgument);
    CHECK(parse(parser, {"--summary.k=99999999999"}).code() == Status::Code::kInvalidArgument);
    CHECK(parse(parser, {"--summary.k"}).code() == Status::Code::kInvalidArgument);
    CHECK(parse(parser, {"summary.k=3"}).code() == Status::Code::kInvalidArgument);
    CHECK(config.k == 2);
}

TEST_CASE("ConfigParser handles flags, floats and required parameters")
{
    ConfigParser parser;
    bool verbose = false;
    float fraction = 0.0f;
    uint64_t size = 0;
    parser.AddParameter(new BooleanParameter("app.verbose", "false", &verbose, false, "Verbose output"));
    parser.AddParameter(new FloatParameter("app.fraction", "0.5", &fraction, false, "Fraction"));
    parser.AddParameter(new UnsignedInt64Parameter("app.size", "0", &size, true, "Stream size"));

    CHECK(fraction == doctest::Approx(0.5));
    CHECK(parse(parser, {"--app.verbose"}).code() == Status::Code::kInvalidArgument);   // app.size missing

    CHECK(parse(parser, {"--app.verbose", "--app.size=10000000000", "--app.fraction=0.25"}).IsOK());
    CHECK(verbose);
    CHECK(size == 10000000000ULL);
    CHECK(fraction == doctest::Approx(0.25));

    CHECK(parse(parser, {"--app.fraction=half"}).code() == Status::Code::kInvalidArgument);
    CHECK_THROWS_AS(parser.AddParameter(new FloatParameter("app.fraction", "1.0", &fraction, false, "Again")), std::invalid_argument);
}

TEST_CASE("ConfigParser prints usage and markdown")
{
    ConfigParser parser;
    FrequencySummaryConfig config;
    FrequencySummaryConfig::add_params_to_config_parser(config, parser);

    std::ostringstream usage;
    parser.PrintUsage(usage);
    CHECK(usage.str().find("--summary.k") != std::string::npos);
    CHECK(usage.str().find("[default: group_decrement]") != std::string::npos);

    std::ostringstream markdown;
    parser.PrintMarkdown(markdown);
    CHECK(markdown.str().find("| `--summary.eviction_policy` | string | `group_decrement` | no |") != std::string::npos);
}

TEST_CASE("FrequencySummaryConfig prints as a boxed table")
{
    FrequencySummaryConfig config{8, "single_evict"};
    std::ostringstream os;
    os << config;
    CHECK(os.str().find("FrequencySummaryConfig") != std::string::npos);
    CHECK(os.str().find("single_evict") != std::string::npos);
    CHECK(os.str().find("| k ") != std::string::npos);
}
