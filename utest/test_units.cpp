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

#include "proglog/lib/error.h"
#include "proglog/lib/inflect.h"
#include "proglog/lib/units.h"

#include "test_lib.h"

namespace proglog {

TEST(UnitsTest, PrettyPrint) {
    EXPECT_EQ("0ms", pretty_print(0));
    EXPECT_EQ("950ms", pretty_print(950));
    EXPECT_EQ("1s", pretty_print(1000));
    EXPECT_EQ("1m 5s", pretty_print(65 * 1000));
    EXPECT_EQ("2h 0s", pretty_print(2 * 3600 * 1000));
    EXPECT_EQ("1d 2h 3m 4s", pretty_print((86400 + 2 * 3600 + 3 * 60 + 4) * 1000ULL + 999));
}

TEST(UnitsTest, NiceUnits) {
    EXPECT_EQ(NANOSECONDS, nice_time_unit(5e-10));
    EXPECT_EQ(MICROSECONDS, nice_time_unit(2.5e-6));
    EXPECT_EQ(MILLISECONDS, nice_time_unit(0.3));
    EXPECT_EQ(SECONDS, nice_time_unit(59.));
    EXPECT_EQ(HOURS, nice_time_unit(7200.));
    EXPECT_EQ(DAYS, nice_time_unit(1e7));

    // Spent per item, so fast items are counted per second
    EXPECT_EQ(SECONDS, nice_speed_unit(1e-3));
    EXPECT_EQ(MINUTES, nice_speed_unit(30.));
    EXPECT_EQ(HOURS, nice_speed_unit(600.));
    EXPECT_EQ(DAYS, nice_speed_unit(1e6));
}

TEST(UnitsTest, ParseTimeUnit) {
    EXPECT_EQ(MILLISECONDS, parse_time_unit("ms"));
    EXPECT_EQ(MICROSECONDS, parse_time_unit("us"));
    EXPECT_EQ(MICROSECONDS, parse_time_unit(label(MICROSECONDS)));
    EXPECT_EQ(DAYS, parse_time_unit("d"));
    EXPECT_THROW(parse_time_unit("fortnight"), failed_conf_error);
}

TEST(UnitsTest, Humanize) {
    auto scaled = scale(1000.);
    EXPECT_DOUBLE_EQ(1., scaled.first);
    EXPECT_STREQ("k", scaled.second);
    scaled = scale(300000.);
    EXPECT_DOUBLE_EQ(300., scaled.first);
    EXPECT_STREQ("k", scaled.second);
    scaled = scale(1e9);
    EXPECT_DOUBLE_EQ(1., scaled.first);
    EXPECT_STREQ("G", scaled.second);

    EXPECT_EQ("999.00", humanize(999.));
    EXPECT_EQ("1.00k", humanize(1000.));
    EXPECT_EQ("12.35k", humanize(12346.));
    EXPECT_EQ("1.23G", humanize(1234567890.));
}

TEST(InflectTest, Pluralize) {
    EXPECT_EQ("pumpkins", pluralize("pumpkin"));
    EXPECT_EQ("boxes", pluralize("box"));
    EXPECT_EQ("batches", pluralize("batch"));
    EXPECT_EQ("entries", pluralize("entry"));
    EXPECT_EQ("days", pluralize("day"));
    EXPECT_EQ("children", pluralize("child"));
    EXPECT_EQ("sheep", pluralize("sheep"));
    EXPECT_EQ("Entries", pluralize("Entry"));
    EXPECT_EQ("URLS", pluralize("URL"));
    EXPECT_EQ("web pages", pluralize("web page"));
    EXPECT_EQ("", pluralize(""));
}

TEST(InflectTest, FormatCount) {
    EXPECT_EQ("0", format_count(0));
    EXPECT_EQ("999", format_count(999));
    EXPECT_EQ("1,000", format_count(1000));
    EXPECT_EQ("12,345", format_count(12345));
    EXPECT_EQ("1,234,567", format_count(1234567));
    EXPECT_EQ("18,446,744,073,709,551,615", format_count(UINT64_MAX));
}

}
