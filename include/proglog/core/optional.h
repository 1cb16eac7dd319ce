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

#include <optional>
#include <string>
#include <utility>

#include "proglog/core/concurrent.h"
#include "proglog/core/logger.h"

namespace proglog {

/**
 * Accept the calls of progress_logger and concurrent_progress_logger and do
 * nothing. Passed to a function template, it compiles to nothing.
 */
class no_logging {
public:
    no_logging& item_name(const std::string&) { return *this; }
    no_logging& log_interval(std::chrono::milliseconds) { return *this; }
    no_logging& expected_updates(std::optional<uint64_t>) { return *this; }
    no_logging& fixed_time_unit(std::optional<time_unit>) { return *this; }
    no_logging& local_speed(bool) { return *this; }
    no_logging& display_memory(bool) { return *this; }
    no_logging& log_target(const std::string&) { return *this; }

    void start(const std::string& = "") {}
    void update() {}
    void update_with_count(uint64_t) {}
    void light_update() {}
    void update_and_display() {}
    void stop(const std::string& = "") {}
    void done() {}
    void done_with_count(uint64_t) {}
    void refresh() {}
    bool log_if() { return false; }
    void info(const std::string&) const {}
    no_logging clone() const { return no_logging(); }

    std::optional<duration_t> elapsed() const { return std::nullopt; }
    uint64_t count() const { return 0; }
    progress_state state() const { return FRESH_STATE; }
    std::string to_string() const { return ""; }
};

/**
 * Either a logger of type P or nothing, decided at runtime. Every call costs
 * a single branch when disabled.
 */
template <class P>
class optional_logger {
public:
    optional_logger() {}
    optional_logger(std::nullopt_t) {}
    optional_logger(P&& logger) : pl_(std::move(logger)) {}

    bool enabled() const { return pl_.has_value(); }
    P* get() { return pl_ ? &*pl_ : nullptr; }
    const P* get() const { return pl_ ? &*pl_ : nullptr; }

    optional_logger& item_name(const std::string& name) {
        if (pl_) pl_->item_name(name);
        return *this;
    }

    optional_logger& log_interval(std::chrono::milliseconds interval) {
        if (pl_) pl_->log_interval(interval);
        return *this;
    }

    optional_logger& expected_updates(std::optional<uint64_t> expected) {
        if (pl_) pl_->expected_updates(expected);
        return *this;
    }

    optional_logger& fixed_time_unit(std::optional<time_unit> unit) {
        if (pl_) pl_->fixed_time_unit(unit);
        return *this;
    }

    optional_logger& local_speed(bool enabled) {
        if (pl_) pl_->local_speed(enabled);
        return *this;
    }

    optional_logger& display_memory(bool enabled) {
        if (pl_) pl_->display_memory(enabled);
        return *this;
    }

    optional_logger& log_target(const std::string& target) {
        if (pl_) pl_->log_target(target);
        return *this;
    }

    void start(const std::string& message = "") { if (pl_) pl_->start(message); }
    void update() { if (pl_) pl_->update(); }
    void update_with_count(uint64_t count) { if (pl_) pl_->update_with_count(count); }
    void light_update() { if (pl_) pl_->light_update(); }
    void update_and_display() { if (pl_) pl_->update_and_display(); }
    void stop(const std::string& message = "") { if (pl_) pl_->stop(message); }
    void done() { if (pl_) pl_->done(); }
    void done_with_count(uint64_t count) { if (pl_) pl_->done_with_count(count); }
    void refresh() { if (pl_) pl_->refresh(); }
    bool log_if() { return pl_ ? pl_->log_if() : false; }
    void info(const std::string& message) const { if (pl_) pl_->info(message); }

    optional_logger clone() const {
        if (!pl_) return optional_logger();
        return optional_logger(pl_->clone());
    }

    std::optional<duration_t> elapsed() const {
        if (!pl_) return std::nullopt;
        return pl_->elapsed();
    }

    uint64_t count() const { return pl_ ? pl_->count() : 0; }
    progress_state state() const { return pl_ ? pl_->state() : FRESH_STATE; }
    std::string to_string() const { return pl_ ? pl_->to_string() : ""; }

private:
    std::optional<P> pl_;
};

}
