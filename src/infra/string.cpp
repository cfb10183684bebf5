/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file string.cpp
 * @brief Implementation of the text primitives.
 */

#include "audex/infra/string.hpp"

#include <algorithm>
#include <cctype>

namespace audex::infra {

namespace {

bool is_continuation(char c)
{
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

/**
 * @brief Returns the byte offset at which the `count`-th code point starts.
 *
 * Returns `s.size()` when the string has `count` code points or fewer.
 */
std::size_t byte_offset_of(const std::string& s, std::size_t count)
{
    std::size_t seen = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (is_continuation(s[i]))
            continue;
        if (seen == count)
            return i;
        seen++;
    }
    return s.size();
}

} // namespace

std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

std::string String::to_lower(const std::string& s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::size_t String::char_length(const std::string& s)
{
    return static_cast<std::size_t>(
        std::count_if(s.begin(), s.end(), [](char c) { return !is_continuation(c); }));
}

/**
 * @brief Width-bounded truncation.
 *
 * Mirrors the usual "strimwidth" contract: the marker counts against the width.
 * If the marker alone is wider than `width`, the marker is returned cut to `width`.
 */
std::string String::truncate(const std::string& s, std::size_t width, const std::string& marker)
{
    if (char_length(s) <= width)
        return s;

    std::size_t marker_len = char_length(marker);
    if (marker_len >= width)
        return marker.substr(0, byte_offset_of(marker, width));

    std::size_t keep = width - marker_len;
    return s.substr(0, byte_offset_of(s, keep)) + marker;
}

} // namespace audex::infra
