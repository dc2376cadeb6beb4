/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace mdk {

/**
 * @param text The text to test.
 * @param starts_with The prefix to look for.
 * @return True if text starts with given prefix.
 */
inline bool string_starts_with(const std::string_view text, const std::string_view starts_with) {
    if (text.size() < starts_with.size()) {
        return false;
    }
    return text.substr(0, starts_with.size()) == starts_with;
}

/**
 * @param text The text to test.
 * @param ends_with The suffix to look for.
 * @return True if text ends with given suffix.
 */
inline bool string_ends_with(const std::string_view text, const std::string_view ends_with) {
    if (text.size() < ends_with.size()) {
        return false;
    }
    return text.substr(text.size() - ends_with.size()) == ends_with;
}

/**
 * Splits a string into a vector of strings based on a delimiter. Empty parts are kept, so "a..b" yields three parts.
 * @param string The string to split.
 * @param delimiter The delimiter to split the string by.
 * @return A vector of strings.
 */
inline std::vector<std::string> string_split(const std::string_view string, const char delimiter) {
    std::vector<std::string> results;

    size_t prev = 0;
    size_t next = 0;

    while ((next = string.find(delimiter, prev)) != std::string_view::npos) {
        results.emplace_back(string.substr(prev, next - prev));
        prev = next + 1;
    }

    results.emplace_back(string.substr(prev));
    return results;
}

/**
 * Compares 2 strings case-insensitively.
 * @param lhs Left hand side
 * @param rhs Right hand side
 * @return True if strings are equal, false otherwise.
 */
inline bool string_compare_case_insensitive(const std::string_view lhs, const std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }

    for (size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }

    return true;
}

/**
 * Converts the first `count` characters of a string to lower case.
 * @param str The string to convert.
 * @param count The number of leading characters to convert to lower case.
 * @return A new string with the first `count` characters converted to lower case.
 */
inline std::string string_to_lower(const std::string_view str, std::size_t count = std::numeric_limits<size_t>::max()) {
    std::string result(str);
    count = std::min(count, result.size());
    for (std::size_t i = 0; i < count; ++i) {
        result[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(result[i])));
    }
    return result;
}

}  // namespace mdk
