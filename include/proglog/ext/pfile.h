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

#include <iostream>
#include <memory>
#include <string>

namespace proglog {

std::shared_ptr<std::istream> open_for_read(const std::string& path);

/**
 * Characters in buffer are auto flushed before destructed. The stream is
 * not checked here, so callers must test `good()` themselves.
 */
std::unique_ptr<std::ostream> open_for_append(const std::string& path);

bool is_file(const std::string& path);

// Empty if "/proc/self/exe" cannot be resolved
std::string get_executable_path();

// File name of the running executable, or `fallback` if unknown
std::string get_executable_name(const std::string& fallback = "main");

}
