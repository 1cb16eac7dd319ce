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

#include <cassert>
#include <memory>
#include <mutex>

#include "proglog/core/logger.h"

namespace proglog {

/**
 * A progress logger whose instances are local handles on one shared
 * progress_logger. Each handle buffers its own count without any
 * synchronization and merges it into the shared logger, under a lock, once
 * the buffer reaches the threshold. Every thread should get its own handle
 * from spawn().
 *
 * Demo code snippet is shared as below:
 * ```c++
 *   concurrent_progress_logger cpl;
 *   cpl.item_name("pumpkin");
 *   cpl.start("Smashing pumpkins (using many threads)...");
 *   std::vector<std::thread> workers;
 *   for (size_t i = 0; i < nthreads; ++i) {
 *       workers.emplace_back([handle = cpl.spawn()]() mutable {
 *           for (size_t j = 0; j < nitems; ++j) handle.update();
 *       });  // Buffered items are flushed when the handle is destroyed
 *   }
 *   for (auto& t : workers) t.join();
 *   cpl.done();
 * ```
 *
 * Queries only see merged counts. After all handles are flushed, the shared
 * count is exactly the number of items reported through all handles.
 *
 * A moved-from handle may only be destroyed or assigned to.
 */
class concurrent_progress_logger {
public:
    concurrent_progress_logger();
    explicit concurrent_progress_logger(progress_logger&& inner,
                                        const concurrent_config& conf = concurrent_config());
    ~concurrent_progress_logger();
    DISABLE_COPY_AND_ASSIGN(concurrent_progress_logger);
    concurrent_progress_logger(concurrent_progress_logger&& other) noexcept;
    concurrent_progress_logger& operator=(concurrent_progress_logger&& other);

    // Take a configured but not yet started logger
    static concurrent_progress_logger wrap(progress_logger&& inner,
                                           const concurrent_config& conf = concurrent_config());

    // New handle on the same shared logger with an empty buffer
    concurrent_progress_logger spawn() const;
    concurrent_progress_logger clone() const { return spawn(); }

    // Settings of this handle only
    concurrent_progress_logger& threshold(uint32_t threshold);
    // Throw failed_conf_error if `mask` is not a power of two minus one
    concurrent_progress_logger& light_update_mask(uint32_t mask);
    const concurrent_config& local_config() const { return conf_; }
    uint64_t local_count() const { return local_count_; }

    // Settings of the shared logger
    concurrent_progress_logger& item_name(const std::string& name);
    concurrent_progress_logger& log_interval(std::chrono::milliseconds interval);
    concurrent_progress_logger& expected_updates(std::optional<uint64_t> expected);
    concurrent_progress_logger& fixed_time_unit(std::optional<time_unit> unit);
    concurrent_progress_logger& local_speed(bool enabled);
    concurrent_progress_logger& display_memory(bool enabled);
    concurrent_progress_logger& log_target(const std::string& target);
    progress_config config() const;

    /**
     * Reset the shared logger and the buffer of this handle only. Items still
     * buffered by other handles are merged into the new run when they flush.
     */
    void start(const std::string& message = "");

    void update() { update_with_count(1); }
    void update_with_count(uint64_t count);

    // Merge once per (light_update_mask + 1) calls or at the threshold
    void light_update();

    void update_and_display();

    // Merge the buffer, even an empty one, and run the throttle check
    void flush();

    void stop(const std::string& message = "");
    void done();
    void done_with_count(uint64_t count);

    void refresh();
    bool log_if();
    void info(const std::string& message) const;

    std::optional<duration_t> elapsed() const;
    uint64_t count() const;
    progress_state state() const;
    std::string to_string() const;

private:
    struct shared_state {
        shared_state(progress_logger&& logger)
            : clock(logger.clock()), inner(std::move(logger)) {}

        const std::shared_ptr<const clock_source> clock;  // Readable without lock
        mutable std::mutex mtx;
        progress_logger inner;
    };

    concurrent_progress_logger(std::shared_ptr<shared_state> state,
                               const concurrent_config& conf);

    shared_state& shared() const {
        assert(state_);
        return *state_;
    }

    // Add `count` to the shared logger, rendering any due line after unlocking
    bool merge(uint64_t count, bool force_display = false);

    // Stop, optionally overriding the count, and log the summary after unlocking
    void finish(std::optional<uint64_t> count);

    std::shared_ptr<shared_state> state_;  // Null after being moved
    concurrent_config conf_;
    uint64_t local_count_;
    uint64_t update_calls_;
};

}
