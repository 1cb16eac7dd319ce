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
#include "proglog/lib/error.h"

#include "test_lib.h"

namespace proglog {

class ProgressLoggerTest : public CapturedLogTest {
protected:
    progress_logger make_logger(std::chrono::milliseconds interval) {
        progress_config conf;
        conf.log_interval = interval;
        conf.log_target = target;
        return progress_logger(conf, clock);
    }
};

TEST_F(ProgressLoggerTest, ThrottledByInterval) {
    auto pl = make_logger(std::chrono::milliseconds(10));
    pl.start("Smashing...");
    for (int i = 0; i < 55; i++) {
        clock->advance(std::chrono::milliseconds(1));
        pl.update();
    }
    auto out = lines();
    ASSERT_EQ(6, out.size());
    EXPECT_EQ("Smashing...", out[0]);
    EXPECT_EQ("10 items, 10ms, 1000.00 items/s, 1.00 ms/item", out[1]);
    EXPECT_EQ(0, out[5].find("50 items, 50ms, "));
    EXPECT_EQ(55, pl.count());
}

TEST_F(ProgressLoggerTest, ZeroIntervalLogsEveryUpdate) {
    auto pl = make_logger(std::chrono::milliseconds(0));
    pl.start("Smashing...");
    pl.update();
    pl.update();
    pl.update();
    auto out = lines();
    ASSERT_EQ(4, out.size());
    EXPECT_EQ("1 item, 0ms", out[1]);
    EXPECT_EQ("2 items, 0ms", out[2]);
    EXPECT_EQ("3 items, 0ms", out[3]);
}

TEST_F(ProgressLoggerTest, LightUpdateSamplesClock) {
    auto pl = make_logger(std::chrono::milliseconds(0));
    pl.light_update_mask(3);
    pl.start();
    for (int i = 0; i < 10; i++) pl.light_update();
    auto out = lines();
    ASSERT_EQ(3, out.size());
    EXPECT_EQ("1 item, 0ms", out[0]);
    EXPECT_EQ("5 items, 0ms", out[1]);
    EXPECT_EQ("9 items, 0ms", out[2]);
    EXPECT_EQ(10, pl.count());
}

TEST_F(ProgressLoggerTest, RejectBadLightUpdateMask) {
    auto pl = make_logger(std::chrono::milliseconds(0));
    EXPECT_THROW(pl.light_update_mask(1000), failed_conf_error);
    EXPECT_NO_THROW(pl.light_update_mask(0));
    EXPECT_NO_THROW(pl.light_update_mask(1023));
}

TEST_F(ProgressLoggerTest, IgnoreCountingUnlessRunning) {
    auto pl = make_logger(std::chrono::milliseconds(0));
    pl.update();
    pl.light_update();
    pl.update_and_display();
    EXPECT_EQ(FRESH_STATE, pl.state());
    EXPECT_EQ(0, pl.count());
    EXPECT_FALSE(pl.elapsed().has_value());
    EXPECT_EQ("Progress logger not started", pl.to_string());

    pl.log_interval(std::chrono::seconds(10));
    pl.start();
    pl.update();
    pl.stop();
    pl.update_with_count(5);
    EXPECT_EQ(STOPPED_STATE, pl.state());
    EXPECT_EQ(1, pl.count());
    EXPECT_TRUE(lines().empty());
}

TEST_F(ProgressLoggerTest, RestartResetsCounters) {
    auto pl = make_logger(std::chrono::seconds(10));
    pl.start();
    pl.update_with_count(7);
    pl.stop("Paused.");
    pl.start("Again...");
    EXPECT_EQ(RUNNING_STATE, pl.state());
    EXPECT_EQ(0, pl.count());
    auto out = lines();
    ASSERT_EQ(2, out.size());
    EXPECT_EQ("Paused.", out[0]);
    EXPECT_EQ("Again...", out[1]);
}

TEST_F(ProgressLoggerTest, ElapsedFrozenAfterStop) {
    auto pl = make_logger(std::chrono::seconds(10));
    pl.start();
    clock->advance(std::chrono::milliseconds(500));
    ASSERT_TRUE(pl.elapsed().has_value());
    EXPECT_EQ(std::chrono::milliseconds(500), *pl.elapsed());
    pl.stop();
    clock->advance(std::chrono::milliseconds(1000));
    EXPECT_EQ(std::chrono::milliseconds(500), *pl.elapsed());
}

TEST_F(ProgressLoggerTest, DoneReportsSummary) {
    auto pl = make_logger(std::chrono::seconds(10));
    pl.start();
    clock->advance(std::chrono::seconds(2));
    pl.update_with_count(1000);
    pl.done();
    auto out = lines();
    ASSERT_EQ(2, out.size());
    EXPECT_EQ("Completed.", out[0]);
    EXPECT_EQ("Elapsed: 2s [1,000 items, 500.00 items/s, 2.00 ms/item]", out[1]);
    EXPECT_EQ(STOPPED_STATE, pl.state());
}

TEST_F(ProgressLoggerTest, DoneWithCountOverrides) {
    auto pl = make_logger(std::chrono::seconds(10));
    pl.start();
    clock->advance(std::chrono::seconds(1));
    pl.update_with_count(5);
    pl.done_with_count(42);
    auto out = lines();
    ASSERT_EQ(2, out.size());
    EXPECT_EQ("Elapsed: 1s [42 items, 42.00 items/s, 23.81 ms/item]", out[1]);
    EXPECT_EQ(42, pl.count());
}

TEST_F(ProgressLoggerTest, DoneBeforeStart) {
    auto pl = make_logger(std::chrono::seconds(10));
    pl.done();
    EXPECT_EQ(FRESH_STATE, pl.state());
    EXPECT_TRUE(lines().empty());
}

TEST_F(ProgressLoggerTest, ExpectedUpdates) {
    auto pl = make_logger(std::chrono::seconds(10));
    pl.expected_updates(100);
    pl.start();
    pl.update_with_count(5);
    // Nothing measurable yet
    EXPECT_EQ("5 items, 0ms; 5.00% done", pl.to_string());
    clock->advance(std::chrono::seconds(1));
    pl.update_with_count(20);
    EXPECT_EQ("25 items, 1s, 25.00 items/s, 40.00 ms/item; 25.00% done, 3s to end",
              pl.to_string());
}

TEST_F(ProgressLoggerTest, UnknownTimeToEnd) {
    auto pl = make_logger(std::chrono::milliseconds(0));
    pl.expected_updates(UINT64_MAX);
    pl.start("go");
    clock->advance(std::chrono::seconds(10));
    pl.update();
    auto out = lines();
    ASSERT_EQ(2, out.size());
    EXPECT_EQ("1 item, 10s, 6.00 items/m, 10.00 s/item; 0.00% done, unknown to end", out[1]);
}

TEST_F(ProgressLoggerTest, FixedTimeUnit) {
    auto pl = make_logger(std::chrono::seconds(10));
    pl.fixed_time_unit(MILLISECONDS);
    pl.start();
    clock->advance(std::chrono::seconds(1));
    pl.update_with_count(2000);
    EXPECT_EQ("2000 items, 1s, 2.00 items/ms, 0.50 ms/item", pl.to_string());
}

TEST_F(ProgressLoggerTest, LocalSpeed) {
    auto pl = make_logger(std::chrono::seconds(1));
    pl.local_speed(true);
    pl.start();
    clock->advance(std::chrono::seconds(1));
    pl.update_with_count(100);
    clock->advance(std::chrono::seconds(1));
    pl.update_with_count(300);
    auto out = lines();
    ASSERT_EQ(2, out.size());
    EXPECT_EQ("100 items, 1s, 100.00 items/s, 10.00 ms/item [100.00 items/s, 10.00 ms/item]",
              out[0]);
    EXPECT_EQ("400 items, 2s, 200.00 items/s, 5.00 ms/item [300.00 items/s, 3.33 ms/item]",
              out[1]);
}

TEST_F(ProgressLoggerTest, DisplayMemory) {
    auto pl = make_logger(std::chrono::milliseconds(0));
    pl.display_memory(true);
    pl.start();
    pl.update();
    auto out = lines();
    ASSERT_EQ(1, out.size());
    EXPECT_NE(std::string::npos, out[0].find("; res/vir/avail/free/total mem "));
}

TEST_F(ProgressLoggerTest, ItemNameChangesPlural) {
    auto pl = make_logger(std::chrono::seconds(10));
    pl.item_name("entry");
    EXPECT_EQ("entries", pl.plural_item_name());
    pl.item_name("box");
    EXPECT_EQ("boxes", pl.plural_item_name());
    pl.start();
    pl.update_with_count(2);
    EXPECT_EQ("2 boxes, 0ms", pl.to_string());
    pl.update_with_count(999);
    EXPECT_EQ("1,001 boxes, 0ms", pl.to_string());
}

TEST_F(ProgressLoggerTest, UpdateAndDisplayIgnoresInterval) {
    auto pl = make_logger(std::chrono::seconds(10));
    pl.start();
    pl.update_and_display();
    pl.update_and_display();
    auto out = lines();
    ASSERT_EQ(2, out.size());
    EXPECT_EQ("1 item, 0ms", out[0]);
    EXPECT_EQ("2 items, 0ms", out[1]);
}

TEST_F(ProgressLoggerTest, LogIfDue) {
    auto pl = make_logger(std::chrono::milliseconds(10));
    pl.start();
    pl.update();
    EXPECT_FALSE(pl.log_if());
    clock->advance(std::chrono::milliseconds(10));
    EXPECT_TRUE(pl.log_if());
    EXPECT_FALSE(pl.log_if());
    EXPECT_EQ(1, lines().size());
}

TEST_F(ProgressLoggerTest, CloneStartsFresh) {
    auto pl = make_logger(std::chrono::milliseconds(0));
    pl.item_name("pumpkin");
    pl.start();
    pl.update_with_count(3);

    auto copy = pl.clone();
    EXPECT_EQ(FRESH_STATE, copy.state());
    EXPECT_EQ(0, copy.count());
    EXPECT_EQ("pumpkin", copy.config().item_name);
    EXPECT_EQ(target, copy.config().log_target);

    copy.start();
    copy.update();
    EXPECT_EQ(3, pl.count());
    EXPECT_EQ(1, copy.count());
    auto out = lines();
    ASSERT_EQ(2, out.size());
    EXPECT_EQ("3 pumpkins, 0ms", out[0]);
    EXPECT_EQ("1 pumpkin, 0ms", out[1]);
}

TEST_F(ProgressLoggerTest, DefaultTarget) {
    progress_logger pl;
    EXPECT_EQ(default_log_target(), pl.config().log_target);
    pl.log_target("");
    EXPECT_EQ(default_log_target(), pl.config().log_target);
}

TEST_F(ProgressLoggerTest, InfoOnTarget) {
    auto pl = make_logger(std::chrono::seconds(10));
    pl.info("Hello pumpkins");
    auto out = lines();
    ASSERT_EQ(1, out.size());
    EXPECT_EQ("Hello pumpkins", out[0]);
}

}
