#include <doctest/doctest.h>

#include "common.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

TEST_CASE("parse_stream_item accepts integers and dotted IPv4 addresses")
{
    uint64_t item = 0;
    CHECK(parse_stream_item("42", item));
    CHECK(item == 42);
    CHECK(parse_stream_item("  7\r", item));
    CHECK(item == 7);
    CHECK(parse_stream_item("18446744073709551615", item));
    CHECK(item == 18446744073709551615ULL);
    CHECK(parse_stream_item("10.0.0.1", item));
    CHECK(item == 167772161);
}

TEST_CASE("parse_stream_item rejects signed, fractional and malformed lines")
{
    uint64_t item = 99;
    CHECK_FALSE(parse_stream_item("-5", item));
    CHECK_FALSE(parse_stream_item("+5", item));
    CHECK_FALSE(parse_stream_item("1.2", item));
    CHECK_FALSE(parse_stream_item("12 34", item));
    CHECK_FALSE(parse_stream_item("abc", item));
    CHECK_FALSE(parse_stream_item("", item));
    CHECK_FALSE(parse_stream_item("18446744073709551616", item));
    CHECK_FALSE(parse_stream_item("10.0.0.256", item));
    CHECK_FALSE(parse_stream_item("1.-2.3.4", item));
    CHECK_FALSE(parse_stream_item("10.0.0.1.5", item));
    CHECK(item == 99);
}

TEST_CASE("read_stream_file keeps only the parseable lines")
{
    const std::string path = "mgsketch_stream_file_test.txt";
    {
        std::ofstream out(path);
        out << "7\n1.2\n-5\n10.0.0.1\nabc\n\n 42 \n";
    }

    CHECK(read_stream_file(path, 100) == std::vector<uint64_t>{7, 167772161, 42});
    CHECK(read_stream_file(path, 2) == std::vector<uint64_t>{7, 167772161});
    std::remove(path.c_str());

    CHECK_THROWS_AS(read_stream_file("does/not/exist.txt", 10), std::runtime_error);
}
