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
#include <string>

#include <boost/log/common.hpp>
#include <boost/log/sinks.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/trivial.hpp>

namespace proglog {

namespace sinks = boost::log::sinks;
namespace src = boost::log::sources;
namespace trivial = boost::log::trivial;

using backend_t = sinks::text_ostream_backend;
using sink_t = sinks::asynchronous_sink<backend_t>;
using capture_sink_t = sinks::synchronous_sink<backend_t>;

BOOST_LOG_INLINE_GLOBAL_LOGGER_DEFAULT(global_logger, src::severity_logger_mt<trivial::severity_level>)

// Records carry the log target as attribute "Channel"
using channel_logger_t = src::severity_channel_logger_mt<trivial::severity_level, std::string>;
BOOST_LOG_INLINE_GLOBAL_LOGGER_DEFAULT(channel_logger, channel_logger_t)

#define LOG_TRACE BOOST_LOG_SEV(::proglog::global_logger::get(), ::proglog::trivial::trace)
#define LOG_DEBUG BOOST_LOG_SEV(::proglog::global_logger::get(), ::proglog::trivial::debug)
#define LOG_INFO BOOST_LOG_SEV(::proglog::global_logger::get(), ::proglog::trivial::info)
#define LOG_WARNING BOOST_LOG_SEV(::proglog::global_logger::get(), ::proglog::trivial::warning)
#define LOG_ERROR BOOST_LOG_SEV(::proglog::global_logger::get(), ::proglog::trivial::error)
#define LOG_FATAL BOOST_LOG_SEV(::proglog::global_logger::get(), ::proglog::trivial::fatal)

#define LOG_CHANNEL_DEBUG(target) BOOST_LOG_CHANNEL_SEV(::proglog::channel_logger::get(), (target), ::proglog::trivial::debug)
#define LOG_CHANNEL_INFO(target) BOOST_LOG_CHANNEL_SEV(::proglog::channel_logger::get(), (target), ::proglog::trivial::info)
#define LOG_CHANNEL_WARNING(target) BOOST_LOG_CHANNEL_SEV(::proglog::channel_logger::get(), (target), ::proglog::trivial::warning)

size_t get_sequential_id(const std::string& category);

#define LOG_TELL_COUNTER(category) BOOST_LOG_SCOPED_THREAD_TAG((category), ::proglog::get_sequential_id((category)));
#define LOG_TELL_THREAD_ID(...) LOG_TELL_COUNTER("ThreadID")

// Verbosity: 0=warning, 1=info, 2=debug
boost::shared_ptr<sink_t> enable_global_logging(const std::string& path, int verbosity);

void disable_sink(boost::shared_ptr<sink_t> sink, bool deregister = true);

/**
 * Copy every record of one channel to `stream` as "<message>\n". The core
 * filter set up by enable_global_logging(...) still applies.
 */
boost::shared_ptr<capture_sink_t> enable_channel_capture(std::shared_ptr<std::ostream> stream,
                                                         const std::string& channel);

void disable_sink(boost::shared_ptr<capture_sink_t> sink);

}
