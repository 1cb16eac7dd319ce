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

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace proglog {

enum time_unit {
    NANOSECONDS,
    MICROSECONDS,
    MILLISECONDS,
    SECONDS,
    MINUTES,
    HOURS,
    DAYS,
    TIME_UNIT_COUNT  // Only used as the upper limit
};

const char* label(time_unit unit);

double as_seconds(time_unit unit);

// Throw failed_conf_error if the label is unknown
time_unit parse_time_unit(const std::string& text);

// Largest unit not exceeding the given span
time_unit nice_time_unit(double seconds);

/**
 * Smallest unit from seconds upwards in which at least one item is done,
 * given `seconds` spent per item.
 */
time_unit nice_speed_unit(double seconds);

// E.g. "950ms", "4s", "1d 2h 3m 4s"
std::string pretty_print(uint64_t milliseconds);

// Scale a value with SI prefixes: 12345 -> (12.345, "k")
std::pair<double, const char*> scale(double value);

// Two decimals plus the SI prefix: 12345 -> "12.35k"
std::string humanize(double value);

}
