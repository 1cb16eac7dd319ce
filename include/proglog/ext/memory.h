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

namespace proglog {

// All values are in bytes
struct memory_info {
    std::optional<uint64_t> resident;      // Of current process
    std::optional<uint64_t> virtual_size;  // Of current process
    uint64_t available;
    uint64_t free;
    uint64_t total;
};

/**
 * Read process figures from "/proc/self/statm" and system figures from
 * "/proc/meminfo", falling back to sysinfo(2) where the latter is missing.
 * It takes no lock of this library.
 */
memory_info sample_memory();

// E.g. "; res/vir/avail/free/total mem 1.20MB/3.40MB/1.00GB/500.00MB/2.00GB"
std::string to_string(const memory_info& info);

}
