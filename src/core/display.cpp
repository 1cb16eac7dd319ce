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

#include "proglog/core/display.h"

#include <iomanip>
#include <sstream>

#include "proglog/ext/logging.h"
#include "proglog/lib/inflect.h"
#include "proglog/lib/utility.h"

namespace proglog {

static void write_speed(std::ostringstream& oss, const progress_snapshot& snap,
                        double seconds_per_item) {
    double items_per_second = 1. / seconds_per_item;
    time_unit speed_unit = snap.fixed_time_unit ? *snap.fixed_time_unit
                                                : nice_speed_unit(seconds_per_item);
    time_unit timing_unit = snap.fixed_time_unit ? *snap.fixed_time_unit
                                                 : nice_time_unit(seconds_per_item);
    oss << std::fixed << std::setprecision(2)
        << items_per_second * as_seconds(speed_unit) << " "
        << snap.plural_item_name << "/" << label(speed_unit) << ", "
        << seconds_per_item / as_seconds(timing_unit) << " "
        << label(timing_unit) << "/" << snap.item_name;
}

// Below 2^64, so the time to end always fits in uint64_t
constexpr double kMaxMillisecondsToEnd = 1.8e19;

inline duration_t non_negative(duration_t span) {
    return span.count() > 0 ? span : duration_t::zero();
}

std::string render(const progress_snapshot& snap) {
    if (!snap.start_time) return "Progress logger not started";

    std::ostringstream oss;
    // Thousands separators would be confusing next to a fixed unit
    std::string count_text = snap.fixed_time_unit ? std::to_string(snap.count)
                                                  : format_count(snap.count);
    const std::string& noun = snap.count == 1 ? snap.item_name : snap.plural_item_name;

    if (snap.stop_time) {
        duration_t elapsed = non_negative(*snap.stop_time - *snap.start_time);
        double seconds = to_seconds(elapsed);
        oss << "Elapsed: " << pretty_print(to_milliseconds(elapsed));
        if (snap.count != 0) {
            oss << " [" << count_text << " " << noun;
            if CHECK_PARAMETER_POSITIVE(seconds) {
                oss << ", ";
                write_speed(oss, snap, seconds / snap.count);
            }
            oss << "]";
        }
    } else {
        duration_t elapsed = non_negative(snap.now - *snap.start_time);
        double seconds = to_seconds(elapsed);
        bool measurable = snap.count > 0 && CHECK_PARAMETER_POSITIVE(seconds);
        oss << count_text << " " << noun << ", " << pretty_print(to_milliseconds(elapsed));
        if (measurable) {
            oss << ", ";
            write_speed(oss, snap, seconds / snap.count);
        }

        if (snap.expected_updates) {
            uint64_t expected = *snap.expected_updates;
            double percentage = expected > 0 ? 100. * snap.count / expected : 100.;
            oss << "; " << std::fixed << std::setprecision(2) << percentage << "% done";
            if (measurable) {
                uint64_t remaining = expected > snap.count ? expected - snap.count : 0;
                double ms_to_end = remaining * (seconds * 1000.) / snap.count;
                if (ms_to_end < kMaxMillisecondsToEnd) {
                    oss << ", " << pretty_print(static_cast<uint64_t>(ms_to_end)) << " to end";
                } else {
                    oss << ", unknown to end";
                }
            }
        }

        if (snap.local_speed && snap.count > snap.last_count) {
            double local_seconds = to_seconds(non_negative(snap.now - snap.last_log_time));
            if CHECK_PARAMETER_POSITIVE(local_seconds) {
                oss << " [";
                write_speed(oss, snap, local_seconds / (snap.count - snap.last_count));
                oss << "]";
            }
        }
    }

    if (snap.display_memory && snap.memory) {
        oss << to_string(*snap.memory);
    }
    return oss.str();
}

void emit(const progress_snapshot& snap) {
    LOG_CHANNEL_INFO(snap.log_target) << render(snap);
}

}
