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

#include <memory>
#include <optional>
#include <string>

#include "proglog/core/conf.h"
#include "proglog/core/display.h"
#include "proglog/ext/clock.h"
#include "proglog/ext/memory.h"
#include "proglog/lib/utility.h"

namespace proglog {

enum progress_state {
    FRESH_STATE,
    RUNNING_STATE,
    STOPPED_STATE
};

const char* to_string(progress_state state);

/**
 * Count processed items and log a status line at most once per log interval,
 * however fast items are processed. No thread safety! Share it among threads
 * with concurrent_progress_logger.
 *
 * Demo code snippet is shared as below:
 * ```c++
 *   progress_logger pl;
 *   pl.item_name("pumpkin").expected_updates(100);
 *   pl.start("Smashing pumpkins...");
 *   for (size_t i = 0; i < 100; i++) {
 *       smash(i);
 *       pl.update();
 *   }
 *   pl.done();
 * ```
 *
 * Counting calls are ignored unless the logger is running, i.e. between
 * start(...) and stop(...) or done().
 */
class progress_logger {
public:
    progress_logger();
    explicit progress_logger(const progress_config& conf,
                             std::shared_ptr<const clock_source> clock = default_clock());
    DISABLE_COPY_AND_ASSIGN(progress_logger);
    ENABLE_MOVE_AND_ASSIGN(progress_logger);

    // Configuration can be changed at any time, even while running
    progress_logger& item_name(const std::string& name);
    progress_logger& log_interval(std::chrono::milliseconds interval);
    progress_logger& expected_updates(std::optional<uint64_t> expected);
    progress_logger& fixed_time_unit(std::optional<time_unit> unit);
    progress_logger& local_speed(bool enabled);
    progress_logger& display_memory(bool enabled);
    progress_logger& log_target(const std::string& target);
    // Throw failed_conf_error if `mask` is not a power of two minus one
    progress_logger& light_update_mask(uint64_t mask);

    const progress_config& config() const { return conf_; }
    const std::string& plural_item_name() const { return plural_; }
    const std::shared_ptr<const clock_source>& clock() const { return clock_; }

    // Reset counters and log `message` if not empty
    void start(const std::string& message = "");

    void update() { update_with_count_and_time(1, clock_->now()); }
    void update_with_count(uint64_t count) { update_with_count_and_time(count, clock_->now()); }
    void update_with_count_and_time(uint64_t count, time_point_t now);

    // Read the clock only once per (light_update_mask + 1) calls
    void light_update();

    // Count one item and log at once, ignoring the interval
    void update_and_display();

    // Log `message` if not empty
    void stop(const std::string& message = "");
    void done();
    void done_with_count(uint64_t count);

    // Sample memory for the next line, if memory is displayed
    void refresh();
    void refresh(const memory_info& memory);

    void log(time_point_t now);
    bool log_if() { return log_if(clock_->now()); }
    bool log_if(time_point_t now);

    void info(const std::string& message) const;

    // Same configuration in the fresh state
    progress_logger clone() const;

    std::optional<duration_t> elapsed() const;
    uint64_t count() const { return count_; }
    progress_state state() const;
    std::string to_string() const;

    /**
     * Low-level methods to split logging into a cheap part, which has to be
     * protected by the owner's lock, and the rendering part, which does not.
     * accumulate(...) returns true if a line is due at `now`. set_count(...)
     * replaces the count unless the logger is fresh.
     */
    bool accumulate(uint64_t count, time_point_t now);
    void set_count(uint64_t count);
    progress_snapshot snapshot(time_point_t now) const;
    void mark_logged(time_point_t now);

private:
    bool is_running() const { return start_time_.has_value() && !stop_time_.has_value(); }

    progress_config conf_;
    std::string plural_;  // Cached since pluralization is slow
    std::shared_ptr<const clock_source> clock_;

    std::optional<time_point_t> start_time_;
    std::optional<time_point_t> stop_time_;
    time_point_t last_log_time_;
    time_point_t next_log_time_;
    uint64_t count_;
    uint64_t last_count_;
    uint64_t light_calls_;
    std::optional<memory_info> memory_;
};

}
