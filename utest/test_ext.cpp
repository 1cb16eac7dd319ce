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

#include <algorithm>
#include <thread>
#include <vector>

#include "proglog/core/conf.h"
#include "proglog/ext/memory.h"
#include "proglog/ext/pfile.h"
#include "proglog/lib/error.h"

#include "test_lib.h"

namespace proglog {

TEST(MemoryTest, SampleMemory) {
    auto info = sample_memory();
    EXPECT_GT(info.total, 0);
    EXPECT_LE(info.free, info.total);
    EXPECT_LE(info.available, info.total);
    ASSERT_TRUE(info.resident.has_value());
    ASSERT_TRUE(info.virtual_size.has_value());
    EXPECT_GT(*info.resident, 0);
    EXPECT_LE(*info.resident, *info.virtual_size);
}

TEST(MemoryTest, ToString) {
    memory_info info;
    info.resident = 1200;
    info.available = 1000000000;
    info.free = 500000000;
    info.total = 2000000000;
    EXPECT_EQ("; res/vir/avail/free/total mem 1.20kB/N/A/1.00GB/500.00MB/2.00GB",
              to_string(info));
}

TEST(LoggingTest, SequentialIds) {
    size_t first = get_sequential_id("utest.LoggingTest");
    EXPECT_EQ(first + 1, get_sequential_id("utest.LoggingTest"));

    std::vector<size_t> ids(8);
    std::vector<std::thread> workers;
    for (size_t i = 0; i < ids.size(); i++) {
        workers.emplace_back([&ids, i]() { ids[i] = get_sequential_id("utest.LoggingTest"); });
    }
    for (auto& worker : workers) worker.join();
    std::sort(ids.begin(), ids.end());
    for (size_t i = 0; i < ids.size(); i++) EXPECT_EQ(first + 2 + i, ids[i]);
}

TEST_F(CapturedLogTest, CaptureOneChannel) {
    LOG_CHANNEL_INFO(target) << "kept";
    LOG_CHANNEL_INFO(target + ".other") << "dropped";
    LOG_INFO << "dropped too";
    LOG_CHANNEL_WARNING(target) << "kept " << 2;
    auto out = lines();
    ASSERT_EQ(2, out.size());
    EXPECT_EQ("kept", out[0]);
    EXPECT_EQ("kept 2", out[1]);
}

TEST(PfileTest, ExecutableName) {
    EXPECT_EQ("proglog_utest", get_executable_name());
    EXPECT_EQ("proglog_utest", default_log_target());
    EXPECT_TRUE(is_file(get_executable_path()));
}

TEST(PfileTest, OpenForRead) {
    EXPECT_THROW(open_for_read("/nonexistent/proglog.conf"), file_system_error);
    EXPECT_THROW(open_for_read("/proc"), file_system_error);
    auto in = open_for_read(get_executable_path());
    EXPECT_TRUE(in->good());
}

}
