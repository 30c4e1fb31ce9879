#pragma once

#include "frequency_errors.hpp"

#include <algorithm>
#include <cctype>
#include <ostream>
#include <string>

// What happens when a full summary meets an untracked element.
//  - GroupDecrement: every counter loses one, counters reaching zero are evicted at once.
//  - SingleEvict:    every counter loses one, but zero counters stay resident as reclaimable
//                    slots. The next untracked element evicts only the first such slot and
//                    takes it over instead of starting another fight.
enum class EvictionPolicy
{
    GroupDecrement,
    SingleEvict
};

inline std::string to_string(EvictionPolicy policy)
{
    switch (policy)
    {
    case EvictionPolicy::GroupDecrement: return "group_decrement";
    case EvictionPolicy::SingleEvict: return "single_evict";
    }
    return "unknown";
}

inline EvictionPolicy parse_eviction_policy(std::string name)
{
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "group_decrement" || name == "group") return EvictionPolicy::GroupDecrement;
    if (name == "single_evict" || name == "single") return EvictionPolicy::SingleEvict;
    throw InvalidArgument("Unknown eviction policy '" + name + "'. Use group_decrement or single_evict.");
}

inline std::ostream &operator<<(std::ostream &os, EvictionPolicy policy) { return os << to_string(policy); }
