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

#include "proglog/core/concurrent.h"

#include <limits>

#include "proglog/ext/logging.h"
#include "proglog/lib/error.h"

namespace proglog {

static void check_light_update_mask(uint32_t mask) {
    if ((mask & (mask + 1)) != 0) {
        throw failed_conf_error("Light update mask must be a power of two minus one: "
                                + std::to_string(mask));
    }
}

concurrent_progress_logger::concurrent_progress_logger()
    : concurrent_progress_logger(progress_logger()) {}

concurrent_progress_logger::concurrent_progress_logger(progress_logger&& inner,
                                                       const concurrent_config& conf)
    : concurrent_progress_logger(std::make_shared<shared_state>(std::move(inner)), conf) {}

concurrent_progress_logger::concurrent_progress_logger(std::shared_ptr<shared_state> state,
                                                       const concurrent_config& conf)
        : state_(std::move(state)), conf_(conf), local_count_(0), update_calls_(0) {
    check_light_update_mask(conf_.light_update_mask);
}

concurrent_progress_logger::~concurrent_progress_logger() {
    if (!state_ || local_count_ == 0) return;
    try {
        flush();
    } catch (const std::exception& e) {
        LOG_ERROR << "Failed to flush " << local_count_ << " buffered items: " << e.what();
    }
}

concurrent_progress_logger::concurrent_progress_logger(concurrent_progress_logger&& other) noexcept
        : state_(std::move(other.state_)), conf_(other.conf_),
          local_count_(other.local_count_), update_calls_(other.update_calls_) {
    other.local_count_ = 0;
}

concurrent_progress_logger& concurrent_progress_logger::operator=(
    concurrent_progress_logger&& other
) {
    if (this == &other) return *this;
    if (state_ && local_count_ > 0) flush();
    state_ = std::move(other.state_);
    conf_ = other.conf_;
    local_count_ = other.local_count_;
    update_calls_ = other.update_calls_;
    other.local_count_ = 0;
    return *this;
}

concurrent_progress_logger concurrent_progress_logger::wrap(progress_logger&& inner,
                                                            const concurrent_config& conf) {
    return concurrent_progress_logger(std::move(inner), conf);
}

concurrent_progress_logger concurrent_progress_logger::spawn() const {
    // Never copy the buffer, or items would be counted twice
    return concurrent_progress_logger(state_, conf_);
}

concurrent_progress_logger& concurrent_progress_logger::threshold(uint32_t threshold) {
    conf_.threshold = threshold;
    if (state_ && local_count_ > 0 && local_count_ >= conf_.threshold) flush();
    return *this;
}

concurrent_progress_logger& concurrent_progress_logger::light_update_mask(uint32_t mask) {
    check_light_update_mask(mask);
    conf_.light_update_mask = mask;
    return *this;
}

concurrent_progress_logger& concurrent_progress_logger::item_name(const std::string& name) {
    std::lock_guard<std::mutex> lock(shared().mtx);
    shared().inner.item_name(name);
    return *this;
}

concurrent_progress_logger& concurrent_progress_logger::log_interval(
    std::chrono::milliseconds interval
) {
    std::lock_guard<std::mutex> lock(shared().mtx);
    shared().inner.log_interval(interval);
    return *this;
}

concurrent_progress_logger& concurrent_progress_logger::expected_updates(
    std::optional<uint64_t> expected
) {
    std::lock_guard<std::mutex> lock(shared().mtx);
    shared().inner.expected_updates(expected);
    return *this;
}

concurrent_progress_logger& concurrent_progress_logger::fixed_time_unit(
    std::optional<time_unit> unit
) {
    std::lock_guard<std::mutex> lock(shared().mtx);
    shared().inner.fixed_time_unit(unit);
    return *this;
}

concurrent_progress_logger& concurrent_progress_logger::local_speed(bool enabled) {
    std::lock_guard<std::mutex> lock(shared().mtx);
    shared().inner.local_speed(enabled);
    return *this;
}

concurrent_progress_logger& concurrent_progress_logger::display_memory(bool enabled) {
    std::lock_guard<std::mutex> lock(shared().mtx);
    shared().inner.display_memory(enabled);
    return *this;
}

concurrent_progress_logger& concurrent_progress_logger::log_target(const std::string& target) {
    std::lock_guard<std::mutex> lock(shared().mtx);
    shared().inner.log_target(target);
    return *this;
}

progress_config concurrent_progress_logger::config() const {
    std::lock_guard<std::mutex> lock(shared().mtx);
    return shared().inner.config();
}

void concurrent_progress_logger::start(const std::string& message) {
    std::string target;
    {
        std::lock_guard<std::mutex> lock(shared().mtx);
        shared().inner.start();
        target = shared().inner.config().log_target;
    }
    local_count_ = 0;
    update_calls_ = 0;
    if (!message.empty()) LOG_CHANNEL_INFO(target) << message;
}

bool concurrent_progress_logger::merge(uint64_t count, bool force_display) {
    // Read the clock before locking to keep the critical section short
    auto now = shared().clock->now();
    std::optional<progress_snapshot> snap;
    {
        std::lock_guard<std::mutex> lock(shared().mtx);
        auto& inner = shared().inner;
        bool due = inner.accumulate(count, now);
        if (due || (force_display && inner.state() == RUNNING_STATE)) {
            snap = inner.snapshot(now);
            inner.mark_logged(now);
        }
    }
    if (!snap) return false;
    if (snap->display_memory) snap->memory = sample_memory();
    emit(*snap);
    return true;
}

void concurrent_progress_logger::update_with_count(uint64_t count) {
    if (count < conf_.threshold - local_count_) {
        local_count_ += count;
        return;
    }
    uint64_t buffered = local_count_;
    if (count > std::numeric_limits<uint64_t>::max() - buffered) {
        // Sum overflows, merge in two steps
        merge(buffered);
        local_count_ = 0;
        merge(count);
    } else {
        merge(buffered + count);
        local_count_ = 0;
    }
}

void concurrent_progress_logger::light_update() {
    ++local_count_;
    if ((update_calls_++ & conf_.light_update_mask) == 0 || local_count_ >= conf_.threshold) {
        merge(local_count_);
        local_count_ = 0;
    }
}

void concurrent_progress_logger::update_and_display() {
    merge(local_count_ + 1, true);
    local_count_ = 0;
}

void concurrent_progress_logger::flush() {
    merge(local_count_);
    local_count_ = 0;
}

void concurrent_progress_logger::stop(const std::string& message) {
    auto now = shared().clock->now();
    bool stopped = false;
    std::string target;
    {
        std::lock_guard<std::mutex> lock(shared().mtx);
        auto& inner = shared().inner;
        inner.accumulate(local_count_, now);
        if (inner.state() == RUNNING_STATE) {
            inner.stop();
            stopped = true;
        }
        target = inner.config().log_target;
    }
    local_count_ = 0;
    if (stopped && !message.empty()) LOG_CHANNEL_INFO(target) << message;
}

void concurrent_progress_logger::done() {
    finish(std::nullopt);
}

void concurrent_progress_logger::done_with_count(uint64_t count) {
    finish(count);
}

void concurrent_progress_logger::finish(std::optional<uint64_t> count) {
    std::optional<memory_info> memory;
    if (config().display_memory) memory = sample_memory();  // Outside of the lock
    auto now = shared().clock->now();
    std::optional<progress_snapshot> snap;
    std::string target;
    {
        std::lock_guard<std::mutex> lock(shared().mtx);
        auto& inner = shared().inner;
        target = inner.config().log_target;
        if (inner.state() != FRESH_STATE) {
            inner.accumulate(local_count_, now);
            if (count) inner.set_count(*count);
            inner.stop();
            if (memory) inner.refresh(*memory);
            snap = inner.snapshot(now);
        }
    }
    local_count_ = 0;
    if (!snap) {
        LOG_WARNING << "Progress logger of \"" << target << "\" is done before being started.";
        return;
    }
    LOG_CHANNEL_INFO(target) << "Completed.";
    LOG_CHANNEL_INFO(target) << render(*snap);
}

void concurrent_progress_logger::refresh() {
    if (!config().display_memory) return;
    auto memory = sample_memory();  // Outside of the lock
    std::lock_guard<std::mutex> lock(shared().mtx);
    shared().inner.refresh(memory);
}

bool concurrent_progress_logger::log_if() {
    return merge(0);
}

void concurrent_progress_logger::info(const std::string& message) const {
    std::string target = config().log_target;
    LOG_CHANNEL_INFO(target) << message;
}

std::optional<duration_t> concurrent_progress_logger::elapsed() const {
    std::lock_guard<std::mutex> lock(shared().mtx);
    return shared().inner.elapsed();
}

uint64_t concurrent_progress_logger::count() const {
    std::lock_guard<std::mutex> lock(shared().mtx);
    return shared().inner.count();
}

progress_state concurrent_progress_logger::state() const {
    std::lock_guard<std::mutex> lock(shared().mtx);
    return shared().inner.state();
}

std::string concurrent_progress_logger::to_string() const {
    auto now = shared().clock->now();
    progress_snapshot snap;
    {
        std::lock_guard<std::mutex> lock(shared().mtx);
        snap = shared().inner.snapshot(now);
    }
    return render(snap);
}

}
