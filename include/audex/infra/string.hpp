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
 * @file string.hpp
 * @brief Text primitives used when sanitizing audit payloads.
 *
 * @details
 * Audit values are UTF-8. Length limits are expressed in characters (code
 * points), not bytes, so a truncated value never ends in a partial sequence.
 */

#pragma once

#include <cstddef>
#include <string>

namespace audex::infra {

/**
 * @class String
 * @brief A static container for stateless text operations.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace.
     *
     * @param s The source string.
     * @return std::string The trimmed copy, empty if `s` is blank.
     */
    static std::string trim(const std::string& s);

    /// @brief ASCII lower-case copy.
    static std::string to_lower(const std::string& s);

    /**
     * @brief Counts UTF-8 code points.
     *
     * Continuation bytes (`10xxxxxx`) are not counted. Invalid sequences are
     * counted byte by byte.
     */
    static std::size_t char_length(const std::string& s);

    /**
     * @brief Cuts a string to at most `width` characters, ending with `marker` when cut.
     *
     * A string of `width` characters or fewer is returned unchanged. Otherwise
     * the result is the first `width - char_length(marker)` characters followed by
     * `marker`, so the result is exactly `width` characters long.
     *
     * @code
     * String::truncate("abcdefgh", 6, "..."); // "abc..."
     * String::truncate("abc", 6, "...");      // "abc"
     * @endcode
     */
    static std::string truncate(const std::string& s, std::size_t width, const std::string& marker);
};

} // namespace audex::infra
