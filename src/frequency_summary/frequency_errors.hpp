#pragma once

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

// Malformed calls derive from std::invalid_argument, "nothing found" outcomes from std::runtime_error.

class InvalidArgument : public std::invalid_argument
{
public:
    explicit InvalidArgument(const std::string &what) : std::invalid_argument(what) {}
};

class EmptyInput : public std::invalid_argument
{
public:
    EmptyInput() : std::invalid_argument("Input sequence is empty.") {}
    explicit EmptyInput(const std::string &what) : std::invalid_argument(what) {}
};

class NoFrequentElements : public std::runtime_error
{
public:
    NoFrequentElements() : std::runtime_error("No element exceeds the frequency threshold.") {}
    explicit NoFrequentElements(const std::string &what) : std::runtime_error(what) {}
};

class NoMajorityElement : public NoFrequentElements
{
public:
    NoMajorityElement() : NoFrequentElements("No element occurs more than n/2 times.") {}
};

// k is taken signed at the public entry points so that a negative value is caught here
// instead of wrapping around to a huge capacity.
inline uint32_t checked_k(int64_t k)
{
    if (k < 1) throw InvalidArgument("k must be a positive integer, got " + std::to_string(k) + ".");
    if (k > std::numeric_limits<uint32_t>::max()) throw InvalidArgument("k must fit in 32 bits, got " + std::to_string(k) + ".");
    return static_cast<uint32_t>(k);
}
