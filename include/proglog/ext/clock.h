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
#include <memory>

namespace proglog {

using time_point_t = std::chrono::steady_clock::time_point;
using duration_t = std::chrono::steady_clock::duration;

// Source of monotonic timestamps shared by all loggers of one run
class clock_source {
public:
    virtual ~clock_source() = default;
    virtual time_point_t now() const = 0;
};

class steady_clock_source : public clock_source {
public:
    time_point_t now() const override {
        return std::chrono::steady_clock::now();
    }
};

// Process-wide instance backed by std::chrono::steady_clock
std::shared_ptr<const clock_source> default_clock();

inline double to_seconds(duration_t span) {
    return std::chrono::duration<double>(span).count();
}

inline uint64_t to_milliseconds(duration_t span) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(span).count();
    return ms > 0 ? static_cast<uint64_t>(ms) : 0;
}

}
