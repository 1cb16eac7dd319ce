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

#include "proglog/ext/memory.h"

#include <fstream>
#include <sstream>

#include <sys/sysinfo.h>
#include <unistd.h>

#include "proglog/lib/units.h"

namespace proglog {

static void read_statm(memory_info* info) {
    std::ifstream in("/proc/self/statm");
    uint64_t size_pages, resident_pages;
    if (!(in >> size_pages >> resident_pages)) return;
    long page_size = sysconf(_SC_PAGESIZE);
    if (page_size <= 0) return;
    info->virtual_size = size_pages * static_cast<uint64_t>(page_size);
    info->resident = resident_pages * static_cast<uint64_t>(page_size);
}

// Return false if "MemAvailable" is not reported
static bool read_meminfo(memory_info* info) {
    std::ifstream in("/proc/meminfo");
    if (!in.good()) return false;
    bool found_available = false;
    std::string key, unit;
    uint64_t value;
    while (in >> key >> value) {
        std::getline(in, unit);  // " kB"
        if (key == "MemTotal:") {
            info->total = value * 1024;
        } else if (key == "MemFree:") {
            info->free = value * 1024;
        } else if (key == "MemAvailable:") {
            info->available = value * 1024;
            found_available = true;
        }
    }
    return found_available;
}

memory_info sample_memory() {
    memory_info info{std::nullopt, std::nullopt, 0, 0, 0};
    read_statm(&info);
    if (!read_meminfo(&info)) {
        struct sysinfo si;
        if (sysinfo(&si) == 0) {
            uint64_t unit = si.mem_unit;
            info.total = si.totalram * unit;
            info.free = si.freeram * unit;
            info.available = (si.freeram + si.bufferram) * unit;
        }
    }
    return info;
}

static std::string humanize_bytes(const std::optional<uint64_t>& value) {
    if (!value) return "N/A";
    return humanize(static_cast<double>(*value)) + "B";
}

std::string to_string(const memory_info& info) {
    std::ostringstream oss;
    oss << "; res/vir/avail/free/total mem "
        << humanize_bytes(info.resident) << "/"
        << humanize_bytes(info.virtual_size) << "/"
        << humanize(static_cast<double>(info.available)) << "B/"
        << humanize(static_cast<double>(info.free)) << "B/"
        << humanize(static_cast<double>(info.total)) << "B";
    return oss.str();
}

}
