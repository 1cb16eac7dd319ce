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
#include <optional>
#include <string>

#include "proglog/ext/clock.h"
#include "proglog/ext/memory.h"
#include "proglog/lib/units.h"

namespace proglog {

// Everything needed to render one line, copied out of a logger
struct progress_snapshot {
    std::string item_name;
    std::string plural_item_name;
    std::string log_target;
    std::optional<uint64_t> expected_updates;
    std::optional<time_unit> fixed_time_unit;
    bool local_speed;
    bool display_memory;

    uint64_t count;
    uint64_t last_count;
    std::optional<time_point_t> start_time;
    std::optional<time_point_t> stop_time;
    time_point_t last_log_time;
    time_point_t now;

    std::optional<memory_info> memory;  // Rendered only if display_memory
};

/**
 * Running:  "1,234 items, 5s, 246.80 items/s, 4.05 ms/item; 12.34% done, 35s to end"
 * Stopped:  "Elapsed: 5s [1,234 items, 246.80 items/s, 4.05 ms/item]"
 * Speed and time to end are left out while nothing can be measured.
 */
std::string render(const progress_snapshot& snap);

// Emit one rendered line at info severity on the snapshot's target
void emit(const progress_snapshot& snap);

}
