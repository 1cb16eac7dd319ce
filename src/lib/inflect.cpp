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

#include "proglog/lib/inflect.h"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace proglog {

static const std::unordered_map<std::string, std::string> irregular_nouns = {
    {"person", "people"}, {"child", "children"}, {"man", "men"},
    {"woman", "women"}, {"mouse", "mice"}, {"goose", "geese"},
    {"foot", "feet"}, {"tooth", "teeth"}, {"ox", "oxen"},
    {"datum", "data"}, {"index", "indices"}, {"matrix", "matrices"},
    {"vertex", "vertices"}, {"leaf", "leaves"}, {"life", "lives"},
    {"knife", "knives"}, {"wife", "wives"}, {"half", "halves"},
    {"wolf", "wolves"}, {"shelf", "shelves"}, {"analysis", "analyses"},
    {"axis", "axes"}, {"criterion", "criteria"}, {"phenomenon", "phenomena"},
    {"potato", "potatoes"}, {"tomato", "tomatoes"}, {"hero", "heroes"},
    {"echo", "echoes"}, {"veto", "vetoes"}
};

static const std::unordered_set<std::string> uninflected_nouns = {
    "sheep", "fish", "deer", "moose", "bison", "salmon", "aircraft",
    "series", "species", "data", "information", "equipment", "news"
};

inline bool is_vowel(char c) {
    switch (std::tolower(static_cast<unsigned char>(c))) {
        case 'a': case 'e': case 'i': case 'o': case 'u': return true;
        default: return false;
    }
}

inline bool endswith(const std::string& value, const std::string& suffix) {
    if (value.size() < suffix.size()) return false;
    return value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static std::string apply_case(const std::string& original, std::string inflected) {
    bool all_upper = original.size() > 1 && std::all_of(
        original.begin(), original.end(),
        [](unsigned char c) { return !std::isalpha(c) || std::isupper(c); }
    );
    if (all_upper) {
        for (auto& c : inflected) c = std::toupper(static_cast<unsigned char>(c));
    } else if (std::isupper(static_cast<unsigned char>(original[0]))) {
        inflected[0] = std::toupper(static_cast<unsigned char>(inflected[0]));
    }
    return inflected;
}

static std::string pluralize_word(const std::string& word) {
    std::string lower(word);
    for (auto& c : lower) c = std::tolower(static_cast<unsigned char>(c));

    if (uninflected_nouns.count(lower) > 0) return word;
    auto iter = irregular_nouns.find(lower);
    if (iter != irregular_nouns.end()) return apply_case(word, iter->second);

    std::string stem(lower), suffix;
    if (endswith(lower, "s") || endswith(lower, "x") || endswith(lower, "z") ||
        endswith(lower, "ch") || endswith(lower, "sh")) {
        suffix = "es";
    } else if (lower.size() > 1 && endswith(lower, "y") && !is_vowel(lower[lower.size() - 2])) {
        stem.pop_back();
        suffix = "ies";
    } else {
        suffix = "s";
    }
    std::string inflected = apply_case(word, stem + suffix);
    // Keep the original spelling of the stem
    return word.substr(0, stem.size()) + inflected.substr(stem.size());
}

std::string pluralize(const std::string& noun) {
    if (noun.empty()) return noun;
    size_t last_space = noun.find_last_of(' ');
    if (last_space == std::string::npos) return pluralize_word(noun);
    if (last_space + 1 == noun.size()) return noun;  // Trailing space
    return noun.substr(0, last_space + 1) + pluralize_word(noun.substr(last_space + 1));
}

std::string format_count(uint64_t value) {
    std::string digits = std::to_string(value);
    std::string grouped;
    grouped.reserve(digits.size() + digits.size() / 3);
    size_t head = digits.size() % 3;
    if (head == 0) head = 3;
    grouped.append(digits, 0, head);
    for (size_t i = head; i < digits.size(); i += 3) {
        grouped.push_back(',');
        grouped.append(digits, i, 3);
    }
    return grouped;
}

}
