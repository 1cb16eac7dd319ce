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

#include <cstdint>
#include <string>

namespace proglog {

/**
 * English plural form of a noun, e.g. "pumpkin" -> "pumpkins",
 * "entry" -> "entries", "child" -> "children". The case of the first
 * letter is kept. Only the last word of a phrase is inflected.
 */
std::string pluralize(const std::string& noun);

// Decimal digits grouped by thousands, e.g. 1234567 -> "1,234,567"
std::string format_count(uint64_t value);

}
