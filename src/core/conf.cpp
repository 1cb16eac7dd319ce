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

#include "proglog/core/conf.h"

#include <limits>
#include <sstream>

#include <boost/program_options.hpp>

#include "proglog/ext/pfile.h"
#include "proglog/lib/error.h"

namespace proglog {

namespace po = boost::program_options;

std::string default_log_target() {
    return get_executable_name("main");
}

std::string to_string(const progress_config& conf, const std::string& prefix) {
    std::ostringstream oss;
    oss << "{" << std::endl;
    oss << prefix << "  \"item_name\": \"" << conf.item_name << "\"," << std::endl;
    oss << prefix << "  \"log_interval_ms\": " << conf.log_interval.count() << "," << std::endl;
    oss << prefix << "  \"expected_updates\": ";
    if (conf.expected_updates) {
        oss << *conf.expected_updates;
    } else {
        oss << "null";
    }
    oss << "," << std::endl;
    oss << prefix << "  \"time_unit\": ";
    if (conf.fixed_time_unit) {
        oss << "\"" << label(*conf.fixed_time_unit) << "\"";
    } else {
        oss << "null";
    }
    oss << "," << std::endl;
    oss << prefix << "  \"local_speed\": " << std::boolalpha << conf.local_speed << "," << std::endl;
    oss << prefix << "  \"display_memory\": " << std::boolalpha << conf.display_memory << "," << std::endl;
    oss << prefix << "  \"log_target\": \"" << conf.log_target << "\"," << std::endl;
    oss << prefix << "  \"light_update_mask\": " << conf.light_update_mask << std::endl;
    oss << prefix << "}";
    return oss.str();
}

std::string to_string(const concurrent_config& conf, const std::string& prefix) {
    std::ostringstream oss;
    oss << "{" << std::endl;
    oss << prefix << "  \"threshold\": " << conf.threshold << "," << std::endl;
    oss << prefix << "  \"light_update_mask\": " << conf.light_update_mask << std::endl;
    oss << prefix << "}";
    return oss.str();
}

static int64_t require_range(const po::variables_map& vm, const char* key,
                             int64_t min_val, int64_t max_val) {
    int64_t value = vm[key].as<int64_t>();
    if (value < min_val || value > max_val) {
        std::ostringstream oss;
        oss << "Option \"" << key << "\" is out of range [" << min_val << ", "
            << max_val << "]: " << value;
        throw failed_conf_error(oss.str());
    }
    return value;
}

static uint64_t require_mask(const po::variables_map& vm, const char* key, int64_t max_val) {
    auto mask = static_cast<uint64_t>(require_range(vm, key, 0, max_val));
    if ((mask & (mask + 1)) != 0) {
        throw failed_conf_error(std::string("Option \"") + key
                                + "\" must be a power of two minus one");
    }
    return mask;
}

void parse_progress_config(std::istream& in, progress_config* conf,
                           concurrent_config* cconf) {
    const int64_t max_int64 = std::numeric_limits<int64_t>::max();
    const int64_t max_uint32 = std::numeric_limits<uint32_t>::max();

    po::options_description desc;
    desc.add_options()
        ("item_name", po::value<std::string>())
        ("log_interval_ms", po::value<int64_t>())
        ("expected_updates", po::value<int64_t>())
        ("time_unit", po::value<std::string>())
        ("local_speed", po::value<bool>())
        ("display_memory", po::value<bool>())
        ("log_target", po::value<std::string>())
        ("light_update_mask", po::value<int64_t>())
        ("threshold", po::value<int64_t>())
        ("concurrent_light_update_mask", po::value<int64_t>())
    ;

    po::variables_map vm;
    try {
        po::store(po::parse_config_file(in, desc, false), vm);
        po::notify(vm);
    } catch (po::error& e) {
        throw failed_conf_error(std::string("Invalid progress configuration: ") + e.what());
    }

    if (conf != nullptr) {
        if (vm.count("item_name") > 0) {
            conf->item_name = vm["item_name"].as<std::string>();
        }
        if (vm.count("log_interval_ms") > 0) {
            conf->log_interval = std::chrono::milliseconds(
                require_range(vm, "log_interval_ms", 0, max_int64));
        }
        if (vm.count("expected_updates") > 0) {
            conf->expected_updates = static_cast<uint64_t>(
                require_range(vm, "expected_updates", 0, max_int64));
        }
        if (vm.count("time_unit") > 0) {
            conf->fixed_time_unit = parse_time_unit(vm["time_unit"].as<std::string>());
        }
        if (vm.count("local_speed") > 0) {
            conf->local_speed = vm["local_speed"].as<bool>();
        }
        if (vm.count("display_memory") > 0) {
            conf->display_memory = vm["display_memory"].as<bool>();
        }
        if (vm.count("log_target") > 0) {
            conf->log_target = vm["log_target"].as<std::string>();
        }
        if (vm.count("light_update_mask") > 0) {
            conf->light_update_mask = require_mask(vm, "light_update_mask", max_int64);
        }
    }

    if (cconf != nullptr) {
        if (vm.count("threshold") > 0) {
            cconf->threshold = static_cast<uint32_t>(
                require_range(vm, "threshold", 0, max_uint32));
        }
        if (vm.count("concurrent_light_update_mask") > 0) {
            cconf->light_update_mask = static_cast<uint32_t>(
                require_mask(vm, "concurrent_light_update_mask", max_uint32));
        }
    }
}

}
