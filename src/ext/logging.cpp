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

#include "proglog/ext/logging.h"

#include <iomanip>
#include <iostream>
#include <mutex>
#include <unordered_map>

#include <boost/log/expressions.hpp>
#include <boost/log/attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include "proglog/ext/pfile.h"
#include "proglog/lib/error.h"

namespace proglog {

namespace attrs = boost::log::attributes;
namespace expr = boost::log::expressions;

static std::mutex mtx;
static std::unordered_map<std::string, size_t> id_counters;

size_t get_sequential_id(const std::string& category) {
    std::lock_guard<std::mutex> lock(mtx);
    if (id_counters.count(category) == 0) {
        id_counters.emplace(category, 0);
    }
    return ++(id_counters[category]);
}

boost::shared_ptr<sink_t> enable_global_logging(const std::string& path, int verbosity) {
    auto backend = boost::make_shared<backend_t>();
    if (path == "-") {
        boost::shared_ptr<std::ostream> cerr(&std::clog, [](auto* p){});
        backend->add_stream(cerr);
    } else {
        boost::shared_ptr<std::ostream> flog(open_for_append(path).release());
        if (!flog->good()) {
            throw file_system_error("Failed to open a text file for logging: " + path);
        }
        backend->add_stream(flog);
    }
    backend->auto_flush(true);

    auto sink = boost::make_shared<sink_t>(backend);
    sink->set_formatter(expr::stream
        << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S")
        << " - " << std::setw(3) << std::setfill('0') << expr::attr<size_t>("ThreadID")
        << " - " << expr::attr<trivial::severity_level>("Severity")
        << "] "
        << expr::if_(expr::has_attr<std::string>("Channel"))[
               expr::stream << expr::attr<std::string>("Channel") << ": "
           ]
        << expr::smessage);

    auto core = boost::log::core::get();
    core->add_global_attribute("TimeStamp", attrs::local_clock());
    // Atribute "ThreadID" must be told by macro LOG_TELL_THREAD_ID()
    core->reset_filter();
    core->set_filter(trivial::severity > static_cast<trivial::severity_level>(2 - verbosity));
    core->add_sink(sink);
    return sink;
}

void disable_sink(boost::shared_ptr<sink_t> sink, bool deregister) {
    if (deregister) boost::log::core::get()->remove_sink(sink);
    sink->stop();
    sink->flush();
    sink.reset();
}

boost::shared_ptr<capture_sink_t> enable_channel_capture(std::shared_ptr<std::ostream> stream,
                                                         const std::string& channel) {
    auto backend = boost::make_shared<backend_t>();
    // The backend shares ownership of the stream with the caller
    boost::shared_ptr<std::ostream> out(stream.get(), [stream](std::ostream*) {});
    backend->add_stream(out);
    backend->auto_flush(true);

    auto sink = boost::make_shared<capture_sink_t>(backend);
    sink->set_filter(expr::attr<std::string>("Channel") == channel);
    sink->set_formatter(expr::stream << expr::smessage);
    boost::log::core::get()->add_sink(sink);
    return sink;
}

void disable_sink(boost::shared_ptr<capture_sink_t> sink) {
    boost::log::core::get()->remove_sink(sink);
    sink->flush();
    sink.reset();
}

}
