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

#include "proglog/core/logger.h"

#include "proglog/ext/logging.h"
#include "proglog/lib/error.h"
#include "proglog/lib/inflect.h"

namespace proglog {

const char* to_string(progress_state state) {
    switch (state) {
        case FRESH_STATE:   return "fresh";
        case RUNNING_STATE: return "running";
        case STOPPED_STATE: return "stopped";
        default:            return "unknown";
    };
}

static void check_light_update_mask(uint64_t mask) {
    if ((mask & (mask + 1)) != 0) {
        throw failed_conf_error("Light update mask must be a power of two minus one: "
                                + std::to_string(mask));
    }
}

progress_logger::progress_logger() : progress_logger(progress_config()) {}

progress_logger::progress_logger(const progress_config& conf,
                                 std::shared_ptr<const clock_source> clock)
        : conf_(conf), plural_(pluralize(conf.item_name)), clock_(std::move(clock)),
          count_(0), last_count_(0), light_calls_(0) {
    check_light_update_mask(conf_.light_update_mask);
    if (!clock_) clock_ = default_clock();
    if (conf_.log_target.empty()) conf_.log_target = default_log_target();
    last_log_time_ = clock_->now();
    next_log_time_ = last_log_time_;
}

progress_logger& progress_logger::item_name(const std::string& name) {
    conf_.item_name = name;
    plural_ = pluralize(name);
    return *this;
}

progress_logger& progress_logger::log_interval(std::chrono::milliseconds interval) {
    conf_.log_interval = interval;
    next_log_time_ = last_log_time_ + conf_.log_interval;
    return *this;
}

progress_logger& progress_logger::expected_updates(std::optional<uint64_t> expected) {
    conf_.expected_updates = expected;
    return *this;
}

progress_logger& progress_logger::fixed_time_unit(std::optional<time_unit> unit) {
    conf_.fixed_time_unit = unit;
    return *this;
}

progress_logger& progress_logger::local_speed(bool enabled) {
    conf_.local_speed = enabled;
    return *this;
}

progress_logger& progress_logger::display_memory(bool enabled) {
    conf_.display_memory = enabled;
    if (!enabled) memory_.reset();
    return *this;
}

progress_logger& progress_logger::log_target(const std::string& target) {
    conf_.log_target = target.empty() ? default_log_target() : target;
    return *this;
}

progress_logger& progress_logger::light_update_mask(uint64_t mask) {
    check_light_update_mask(mask);
    conf_.light_update_mask = mask;
    return *this;
}

void progress_logger::start(const std::string& message) {
    auto now = clock_->now();
    start_time_ = now;
    stop_time_.reset();
    count_ = 0;
    last_count_ = 0;
    light_calls_ = 0;
    last_log_time_ = now;
    next_log_time_ = now + conf_.log_interval;
    if (!message.empty()) info(message);
}

bool progress_logger::accumulate(uint64_t count, time_point_t now) {
    if (!is_running()) return false;
    count_ += count;
    return next_log_time_ <= now;
}

void progress_logger::update_with_count_and_time(uint64_t count, time_point_t now) {
    if (accumulate(count, now)) log(now);
}

void progress_logger::light_update() {
    if (!is_running()) return;
    ++count_;
    // Index 0 is checked, so the very first call could log
    if ((light_calls_++ & conf_.light_update_mask) == 0) {
        log_if(clock_->now());
    }
}

void progress_logger::update_and_display() {
    if (!is_running()) return;
    ++count_;
    log(clock_->now());
}

void progress_logger::stop(const std::string& message) {
    if (!is_running()) return;
    stop_time_ = clock_->now();
    if (!message.empty()) info(message);
}

void progress_logger::done() {
    if (!start_time_) {
        LOG_WARNING << "Progress logger of \"" << conf_.log_target
                    << "\" is done before being started.";
        return;
    }
    stop();
    info("Completed.");
    refresh();
    info(to_string());
}

void progress_logger::done_with_count(uint64_t count) {
    set_count(count);
    done();
}

void progress_logger::set_count(uint64_t count) {
    if (start_time_) count_ = count;
}

void progress_logger::refresh() {
    if (conf_.display_memory) memory_ = sample_memory();
}

void progress_logger::refresh(const memory_info& memory) {
    if (conf_.display_memory) memory_ = memory;
}

void progress_logger::log(time_point_t now) {
    refresh();
    emit(snapshot(now));
    mark_logged(now);
}

bool progress_logger::log_if(time_point_t now) {
    if (next_log_time_ > now) return false;
    log(now);
    return true;
}

void progress_logger::mark_logged(time_point_t now) {
    last_count_ = count_;
    last_log_time_ = now;
    next_log_time_ = now + conf_.log_interval;
}

void progress_logger::info(const std::string& message) const {
    LOG_CHANNEL_INFO(conf_.log_target) << message;
}

progress_logger progress_logger::clone() const {
    return progress_logger(conf_, clock_);
}

std::optional<duration_t> progress_logger::elapsed() const {
    if (!start_time_) return std::nullopt;
    time_point_t end = stop_time_ ? *stop_time_ : clock_->now();
    return end - *start_time_;
}

progress_state progress_logger::state() const {
    if (!start_time_) return FRESH_STATE;
    return stop_time_ ? STOPPED_STATE : RUNNING_STATE;
}

std::string progress_logger::to_string() const {
    return render(snapshot(clock_->now()));
}

progress_snapshot progress_logger::snapshot(time_point_t now) const {
    progress_snapshot snap;
    snap.item_name = conf_.item_name;
    snap.plural_item_name = plural_;
    snap.log_target = conf_.log_target;
    snap.expected_updates = conf_.expected_updates;
    snap.fixed_time_unit = conf_.fixed_time_unit;
    snap.local_speed = conf_.local_speed;
    snap.display_memory = conf_.display_memory;
    snap.count = count_;
    snap.last_count = last_count_;
    snap.start_time = start_time_;
    snap.stop_time = stop_time_;
    snap.last_log_time = last_log_time_;
    snap.now = now;
    snap.memory = memory_;
    return snap;
}

}
