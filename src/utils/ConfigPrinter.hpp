#pragma once
#include <algorithm>
#include <cstdlib>
#include <cxxabi.h>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeinfo>

// Prints a config struct as a boxed table. T must expose to_tuple() returning
// ("label", value, "label", value, ...).
template <typename T> class ConfigPrinter {
  private:
    static constexpr size_t LABEL_WIDTH = 24;
    static constexpr size_t PADDING = 4;

    template <typename U> static std::string value_to_string(const U &value) {
        if constexpr (std::is_same_v<U, bool>) {
            return value ? "true" : "false";
        } else if constexpr (std::is_floating_point_v<U>) {
            std::ostringstream out;
            out << std::fixed << std::setprecision(4) << value;
            return out.str();
        } else if constexpr (std::is_arithmetic_v<U>) {
            return std::to_string(value);
        } else if constexpr (std::is_convertible_v<U, std::string>) {
            return std::string(value);
        } else {
            std::ostringstream out;
            out << value;
            return out.str();
        }
    }

    template <typename Tuple, size_t... Is> static void print_fields(std::ostream &os, const Tuple &t, size_t box_width, std::index_sequence<Is...>) {
        (print_field(os, std::get<Is * 2>(t), value_to_string(std::get<Is * 2 + 1>(t)), box_width), ...);
    }

    static void print_field(std::ostream &os, const std::string &name, const std::string &value, size_t box_width) {
        os << "| " << std::left << std::setw(LABEL_WIDTH) << name << ": " << std::left << std::setw(box_width - LABEL_WIDTH - PADDING) << value << "|" << std::endl;
    }

    template <typename Tuple, size_t... Is> static size_t calculate_box_width(const Tuple &t, std::index_sequence<Is...>) {
        return std::max({LABEL_WIDTH + PADDING, (LABEL_WIDTH + value_to_string(std::get<Is * 2 + 1>(t)).length() + PADDING)...});
    }

  public:
    static std::string demangle(const char *name) {
        int status = 0;
        std::unique_ptr<char, void (*)(void *)> res{abi::__cxa_demangle(name, NULL, NULL, &status), std::free};
        return (status == 0) ? res.get() : name;
    }

    static void print(std::ostream &os, const T &config) {
        std::string class_name = demangle(typeid(T).name());
        auto tuple = config.to_tuple();
        constexpr size_t num_fields = std::tuple_size_v<decltype(tuple)> / 2;

        size_t box_width = std::max(calculate_box_width(tuple, std::make_index_sequence<num_fields>{}), class_name.length() + PADDING);
        std::string horizontal_line("+" + std::string(box_width - 1, '-') + "+");

        os << horizontal_line << std::endl;
        os << "| " << std::left << std::setw(box_width - 2) << class_name << "|" << std::endl;
        os << horizontal_line << std::endl;
        print_fields(os, tuple, box_width, std::make_index_sequence<num_fields>{});
        os << horizontal_line << std::endl << std::endl;
    }
};
