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

#include "proglog/ext/pfile.h"

#include <fstream>
#include <limits.h>
#include <unistd.h>

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>

#include "proglog/lib/error.h"

namespace proglog {

namespace fs = boost::filesystem;

std::shared_ptr<std::istream> open_for_read(const std::string& path) {
    if (!is_file(path)) {
        throw file_system_error("Not a regular file: " + path);
    }
    auto in = std::make_shared<std::ifstream>(path);
    if (!in->good()) {
        throw file_system_error("Failed to open file for read: " + path);
    }
    return std::static_pointer_cast<std::istream>(in);
}

std::unique_ptr<std::ostream> open_for_append(const std::string& path) {
    auto raw = new std::ofstream(path, std::ios_base::app);
    return std::unique_ptr<std::ostream>(raw);
}

bool is_file(const std::string& path) {
    boost::system::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::string get_executable_path() {
    char buffer[PATH_MAX];
    ssize_t count = readlink( "/proc/self/exe", buffer, PATH_MAX);
    if (count < 0 || count >= PATH_MAX) return "";
    buffer[count] = '\0';
    return std::string(buffer);
}

std::string get_executable_name(const std::string& fallback) {
    std::string path = get_executable_path();
    if (path.empty()) return fallback;
    std::string name = fs::path(path).filename().string();
    return name.empty() ? fallback : name;
}

}
