// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/duration.hpp"
#include "sigroute/errors.hpp"

#include <cctype>
#include <cmath>

namespace sigroute {

namespace {

double unit_nanos(const std::string& unit) {
    if (unit == "ns") return 1.0;
    if (unit == "us" || unit == "µs") return 1e3;
    if (unit == "ms") return 1e6;
    if (unit == "s") return 1e9;
    if (unit == "m") return 60e9;
    if (unit == "h") return 3600e9;
    return -1.0;
}

}  // namespace

std::chrono::nanoseconds parse_duration(const std::string& text) {
    if (text.empty()) {
        throw ConfigError("empty duration");
    }
    if (text == "0") {
        return std::chrono::nanoseconds(0);
    }

    double total = 0.0;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t start = pos;
        while (pos < text.size() &&
               (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) {
            ++pos;
        }
        if (start == pos) {
            throw ConfigError("invalid duration '" + text + "': expected number");
        }

        double number = 0.0;
        try {
            number = std::stod(text.substr(start, pos - start));
        } catch (const std::exception&) {
            throw ConfigError("invalid duration '" + text + "'");
        }

        size_t unit_start = pos;
        while (pos < text.size() &&
               !std::isdigit(static_cast<unsigned char>(text[pos])) && text[pos] != '.') {
            ++pos;
        }
        if (unit_start == pos) {
            throw ConfigError("invalid duration '" + text + "': missing unit");
        }

        double factor = unit_nanos(text.substr(unit_start, pos - unit_start));
        if (factor < 0) {
            throw ConfigError("invalid duration '" + text + "': unknown unit '" +
                              text.substr(unit_start, pos - unit_start) + "'");
        }
        total += number * factor;
    }

    return std::chrono::nanoseconds(static_cast<int64_t>(std::llround(total)));
}

std::string format_duration(std::chrono::nanoseconds duration) {
    int64_t ns = duration.count();
    if (ns == 0) return "0s";
    if (ns % 3600000000000LL == 0) return std::to_string(ns / 3600000000000LL) + "h";
    if (ns % 60000000000LL == 0) return std::to_string(ns / 60000000000LL) + "m";
    if (ns % 1000000000LL == 0) return std::to_string(ns / 1000000000LL) + "s";
    if (ns % 1000000LL == 0) return std::to_string(ns / 1000000LL) + "ms";
    if (ns % 1000LL == 0) return std::to_string(ns / 1000LL) + "us";
    return std::to_string(ns) + "ns";
}

}  // namespace sigroute
