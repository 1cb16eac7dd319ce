/*
* Copyright (C) 2025 ByteDance and/or its affiliates
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#include "proglog/lib/units.h"

#include <iomanip>
#include <sstream>

#include "proglog/lib/error.h"

namespace proglog {

const char* label(time_unit unit) {
    switch (unit) {
        case NANOSECONDS:  return "ns";
        case MICROSECONDS: return "μs";
        case MILLISECONDS: return "ms";
        case SECONDS:      return "s";
        case MINUTES:      return "m";
        case HOURS:        return "h";
        case DAYS:         return "d";
        default:           return "?";
    };
}

double as_seconds(time_unit unit) {
    switch (unit) {
        case NANOSECONDS:  return 1.0e-9;
        case MICROSECONDS: return 1.0e-6;
        case MILLISECONDS: return 1.0e-3;
        case SECONDS:      return 1.0;
        case MINUTES:      return 60.0;
        case HOURS:        return 3600.0;
        case DAYS:         return 86400.0;
        default:           return 1.0;
    };
}

time_unit parse_time_unit(const std::string& text) {
    for (size_t i = 0; i < TIME_UNIT_COUNT; i++) {
        auto unit = static_cast<time_unit>(i);
        if (text == label(unit)) return unit;
    }
    if (text == "us") return MICROSECONDS;  // ASCII spelling
    throw failed_conf_error("Unknown time unit: " + text);
}

time_unit nice_time_unit(double seconds) {
    for (size_t i = TIME_UNIT_COUNT; i > 0; i--) {
        auto unit = static_cast<time_unit>(i - 1);
        if (seconds >= as_seconds(unit)) return unit;
    }
    return NANOSECONDS;
}

time_unit nice_speed_unit(double seconds) {
    for (size_t i = SECONDS; i < TIME_UNIT_COUNT; i++) {
        auto unit = static_cast<time_unit>(i);
        if (seconds <= as_seconds(unit)) return unit;
    }
    return DAYS;
}

std::string pretty_print(uint64_t milliseconds) {
    std::ostringstream oss;
    if (milliseconds < 1000) {
        oss << milliseconds << "ms";
        return oss.str();
    }

    uint64_t seconds = milliseconds / 1000;
    for (auto unit : {DAYS, HOURS, MINUTES}) {
        uint64_t to_seconds = static_cast<uint64_t>(as_seconds(unit));
        if (seconds >= to_seconds) {
            oss << seconds / to_seconds << label(unit) << " ";
            seconds %= to_seconds;
        }
    }
    oss << seconds << "s";
    return oss.str();
}

std::pair<double, const char*> scale(double value) {
    static const char* prefixes[] = {"", "k", "M", "G", "T", "P", "E", "Z", "Y"};
    for (auto prefix : prefixes) {
        if (value < 1000.0) return std::make_pair(value, prefix);
        value /= 1000.0;
    }
    return std::make_pair(value, "Y");
}

std::string humanize(double value) {
    auto scaled = scale(value);
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << scaled.first << scaled.second;
    return oss.str();
}

}
