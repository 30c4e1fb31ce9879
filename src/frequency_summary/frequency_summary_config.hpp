#pragma once

#include "eviction_policy.hpp"

#include "utils/ConfigParser.hpp"
#include "utils/ConfigPrinter.hpp"

#include <string>
#include <tuple>

struct FrequencySummaryConfig
{
    uint32_t k;
    std::string eviction_policy;

    static void add_params_to_config_parser(FrequencySummaryConfig &c, ConfigParser &p)
    {
        p.AddParameter(new UnsignedInt32Parameter("summary.k", "2", &c.k, false, "Capacity parameter k, the summary tracks at most k-1 candidates"));
        p.AddParameter(new StringParameter("summary.eviction_policy", "group_decrement", &c.eviction_policy, false, "Fight policy: group_decrement or single_evict"));
    }
    EvictionPolicy get_policy() const { return parse_eviction_policy(eviction_policy); }
    auto to_tuple() const { return std::make_tuple("k", k, "eviction_policy", eviction_policy); }
    friend std::ostream &operator<<(std::ostream &os, const FrequencySummaryConfig &c)
    {
        ConfigPrinter<FrequencySummaryConfig>::print(os, c);
        return os;
    }
};
