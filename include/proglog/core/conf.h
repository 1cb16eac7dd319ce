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

#include <chrono>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>

#include "proglog/lib/units.h"

namespace proglog {

constexpr uint64_t kLightUpdateMask = (1 << 20) - 1;
constexpr uint32_t kConcurrentThreshold = 1 << 15;
constexpr uint32_t kConcurrentLightUpdateMask = (1 << 10) - 1;

struct progress_config {
    std::string item_name = "item";
    std::chrono::milliseconds log_interval = std::chrono::seconds(10);
    std::optional<uint64_t> expected_updates;
    std::optional<time_unit> fixed_time_unit;  // Chosen per line if empty
    bool local_speed = false;                  // Also show speed since last line
    bool display_memory = false;
    std::string log_target;                    // Executable name if empty
    uint64_t light_update_mask = kLightUpdateMask;
};

struct concurrent_config {
    uint32_t threshold = kConcurrentThreshold;
    uint32_t light_update_mask = kConcurrentLightUpdateMask;
};

// Log target used when none is configured
std::string default_log_target();

std::string to_string(const progress_config& conf, const std::string& prefix = "");

std::string to_string(const concurrent_config& conf, const std::string& prefix = "");

/**
 * Read "key = value" lines. Recognized keys are:
 * - item_name, log_interval_ms, expected_updates, time_unit, local_speed,
 *   display_memory, log_target, light_update_mask
 * - threshold, concurrent_light_update_mask
 * Missing keys leave the given structs untouched. Unknown keys or bad values
 * raise failed_conf_error. Either pointer could be null.
 */
void parse_progress_config(std::istream& in, progress_config* conf,
                           concurrent_config* cconf = nullptr);

}
