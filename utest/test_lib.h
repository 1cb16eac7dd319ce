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

#include <atomic>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "proglog/ext/clock.h"
#include "proglog/ext/logging.h"

namespace proglog {

// Time only moves when told to
class manual_clock : public clock_source {
public:
    manual_clock() : ticks_(0) {}

    time_point_t now() const override {
        return time_point_t(std::chrono::milliseconds(ticks_.load()));
    }

    void advance(std::chrono::milliseconds span) { ticks_ += span.count(); }

private:
    std::atomic<int64_t> ticks_;  // In milliseconds
};

// Collect lines logged on one channel, unique per test
class CapturedLogTest : public testing::Test {
protected:
    void SetUp() override {
        auto info = testing::UnitTest::GetInstance()->current_test_info();
        target = std::string(info->test_suite_name()) + "." + info->name();
        stream_ = std::make_shared<std::stringstream>();
        sink_ = enable_channel_capture(stream_, target);
        clock = std::make_shared<manual_clock>();
    }

    void TearDown() override {
        disable_sink(sink_);
    }

    std::vector<std::string> lines() const {
        sink_->flush();
        std::vector<std::string> out;
        std::istringstream in(stream_->str());
        std::string line;
        while (std::getline(in, line)) out.push_back(line);
        return out;
    }

    std::string target;
    std::shared_ptr<manual_clock> clock;

private:
    std::shared_ptr<std::stringstream> stream_;
    boost::shared_ptr<capture_sink_t> sink_;
};

}
