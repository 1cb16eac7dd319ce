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

#include <chrono>
#include <iostream>
#include <limits>
#include <thread>
#include <vector>

#include <boost/program_options.hpp>

#include "proglog/core/concurrent.h"
#include "proglog/ext/logging.h"
#include "proglog/ext/pfile.h"
#include "proglog/lib/error.h"
#include "proglog/lib/inflect.h"
#include "proglog/version.h"

namespace pl = proglog;
namespace po = boost::program_options;

// Stand-in for real work on one item
static uint64_t smash(uint64_t item, int delay_us) {
    if (delay_us > 0) {
        std::this_thread::sleep_for(std::chrono::microseconds(delay_us));
        return item;
    }
    uint64_t hash = item;
    for (int i = 0; i < 16; i++) hash = hash * 6364136223846793005ULL + 1442695040888963407ULL;
    return hash;
}

static void run_single(const pl::progress_config& conf, uint64_t nitems, int delay_us) {
    pl::progress_logger logger(conf);
    logger.start("Smashing " + pl::format_count(nitems) + " " + logger.plural_item_name()
                 + " (single thread)...");
    volatile uint64_t sink = 0;
    for (uint64_t i = 0; i < nitems; ++i) {
        sink = sink + smash(i, delay_us);
        logger.update();
    }
    logger.done();
}

static void run_threads(const pl::progress_config& conf, const pl::concurrent_config& cconf,
                        uint64_t nitems, size_t nthreads, int delay_us, bool light) {
    pl::concurrent_progress_logger cpl(pl::progress_logger(conf), cconf);
    cpl.start("Smashing " + pl::format_count(nitems * nthreads) + " "
              + pl::pluralize(conf.item_name) + " (using " + std::to_string(nthreads)
              + " threads)...");
    std::vector<std::thread> workers;
    for (size_t t = 0; t < nthreads; ++t) {
        workers.emplace_back([&, t, handle = cpl.spawn()]() mutable {
            LOG_TELL_THREAD_ID();
            LOG_DEBUG << "Smasher has started...";
            volatile uint64_t sink = 0;
            for (uint64_t i = t * nitems; i < (t + 1) * nitems; ++i) {
                sink = sink + smash(i, delay_us);
                if (light) {
                    handle.light_update();
                } else {
                    handle.update();
                }
            }
            LOG_DEBUG << "Smasher has finished.";
        });  // Remaining items are flushed as the handle is destroyed
    }
    for (auto& worker : workers) worker.join();
    cpl.done();
}

int main(int argc, char* argv[]) {
    po::options_description work_args("Workload");
    std::string mode;
    int64_t nitems;
    int nthreads, delay_us;
    work_args.add_options()
        ("mode", po::value<std::string>(&mode)->default_value("threads"), "One of \"single\", \"threads\" or \"light\".")
        ("nitems", po::value<int64_t>(&nitems)->default_value(100000000), "Item count per thread.")
        ("nthreads", po::value<int>(&nthreads)->default_value(0), "Thread count for smashing. 0 means all available cores.")
        ("delay_us", po::value<int>(&delay_us)->default_value(0), "Time cost of smashing one item. 0 means a few multiplications.")
    ;

    po::options_description progress_args("Progress");
    std::string item_name, time_unit, log_target;
    int64_t log_interval_ms;
    int64_t threshold;
    bool with_expected, local_speed, display_memory;
    progress_args.add_options()
        ("item_name", po::value<std::string>(&item_name)->default_value("pumpkin"), "Name of one item.")
        ("log_interval_ms", po::value<int64_t>(&log_interval_ms)->default_value(10000), "Minimum time between two progress lines.")
        ("time_unit", po::value<std::string>(&time_unit), "Fixed unit (ns, us, ms, s, m, h, d) for speed. If empty, it is chosen per line.")
        ("log_target", po::value<std::string>(&log_target), "Target shown in progress lines. If empty, the executable name is used.")
        ("threshold", po::value<int64_t>(&threshold)->default_value(pl::kConcurrentThreshold), "Items buffered by each thread before merging.")
        ("expected", po::bool_switch(&with_expected)->default_value(false), "Show percentage done and time to end.")
        ("local_speed", po::bool_switch(&local_speed)->default_value(false), "Also show speed since the previous line.")
        ("display_memory", po::bool_switch(&display_memory)->default_value(false), "Show memory usage.")
    ;

    po::options_description out_args("Outputs");
    std::string log_file;
    int verbosity;
    out_args.add_options()
        ("log_file", po::value<std::string>(&log_file)->default_value("-"), "Text file for log messages. \"-\" is short for STDERR.")
        ("verbosity", po::value<int>(&verbosity)->default_value(1), "Verbosity level. (0=warning, 1=info, 2=debug)")
    ;

    po::options_description config_args("Configuration file (optional)");
    std::string config_file;
    config_args.add_options()
        ("config", po::value<std::string>(&config_file), "The above options can be put here.")
    ;

    po::options_description info_args("Information");
    bool help, version;
    info_args.add_options()
        ("help", po::bool_switch(&help)->default_value(false), "Display usage summary.")
        ("version", po::bool_switch(&version)->default_value(false), "Display program version.")
    ;

    po::options_description args;
    args.add(work_args).add(progress_args).add(out_args).add(config_args).add(info_args);

    // Remain empty to prevent any positional option being provided
    po::positional_options_description positional_args;

    pl::progress_config conf;
    pl::concurrent_config cconf;
    try {
        // variable_map tells whether an option is explicity set in argv
        po::variables_map vm;
        po::store(
            po::command_line_parser(argc, argv)
                .options(args)
                .style(po::command_line_style::default_style ^ po::command_line_style::allow_guessing)
                .positional(positional_args)
                .run(),
            vm);
        po::notify(vm);

        if (version) {
            std::cout << pl::VERSION_STR << std::endl;
            return 0;
        } else if (help) {
            std::cout << pl::VERSION_STR << '\n';
            std::cout << args << '\n';
            return 0;
        }

        // Read options set in config file
        if (vm.count("config") > 0) {
            po::options_description shared_args;
            shared_args.add(work_args).add(progress_args).add(out_args);
            auto in = pl::open_for_read(config_file);
            po::store(po::parse_config_file(*in, shared_args), vm);
            po::notify(vm);
        }

        // Check workload
        if (mode != "single" && mode != "threads" && mode != "light") {
            throw po::invalid_option_value("mode");
        }
        if (nitems < 0) {
            throw po::invalid_option_value("nitems");
        }
        if (nthreads < 0) {
            throw po::invalid_option_value("nthreads");
        }
        if (delay_us < 0) {
            throw po::invalid_option_value("delay_us");
        }

        // Check progress
        if (item_name.empty()) {
            throw po::invalid_option_value("item_name");
        }
        if (log_interval_ms < 0) {
            throw po::invalid_option_value("log_interval_ms");
        }
        if (threshold < 0 || threshold > std::numeric_limits<uint32_t>::max()) {
            throw po::invalid_option_value("threshold");
        }
        if (vm.count("time_unit") > 0) {
            try {
                conf.fixed_time_unit = pl::parse_time_unit(time_unit);
            } catch (pl::failed_conf_error&) {
                throw po::invalid_option_value("time_unit");
            }
        }

        // Check outputs
        if (log_file.empty()) {
            throw po::invalid_option_value("log_file");
        }
        if (verbosity < 0 || verbosity > 2) {
            throw po::invalid_option_value("verbosity");
        }
    } catch (po::error_with_option_name & e) {
        std::cerr << e.what() << std::endl;
        std::cout << args << std::endl;
        return 1;
    } catch (std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    // Let's smash pumpkins here
    try {
        auto sink = pl::enable_global_logging(log_file, verbosity);
        size_t nworkers = nthreads > 0 ? nthreads : std::thread::hardware_concurrency();
        if (nworkers < 1) nworkers = 1;

        conf.item_name = item_name;
        conf.log_interval = std::chrono::milliseconds(log_interval_ms);
        conf.local_speed = local_speed;
        conf.display_memory = display_memory;
        conf.log_target = log_target;
        if (with_expected) {
            conf.expected_updates = mode == "single" ? nitems : nitems * nworkers;
        }
        cconf.threshold = static_cast<uint32_t>(threshold);
        LOG_DEBUG << "Progress configuration is: " << pl::to_string(conf);
        LOG_DEBUG << "Concurrent configuration is: " << pl::to_string(cconf);

        if (mode == "single") {
            run_single(conf, nitems, delay_us);
        } else {
            LOG_INFO << "CPU threads is set to: " << nworkers;
            run_threads(conf, cconf, nitems, nworkers, delay_us, mode == "light");
        }
        pl::disable_sink(sink);
        return 0;
    } catch (std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
}
