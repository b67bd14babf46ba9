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
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * Static helpers shared by the configuration loader, the raw-value codecs and
 * the label deriver: whitespace trimming, ASCII case folding, strict integer
 * parsing, and splitting on a delimiter.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tagid::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * **Whitespace Definitions:** space, `\t`, `\n`, `\r`, `\v`, `\f`.
     *
     * @param s The source string to process.
     * @return std::string The trimmed copy; empty if @p s is all whitespace.
     */
    static std::string trim(const std::string& s);

    /// @brief ASCII lower-case copy of @p s.
    static std::string to_lower(std::string s);

    /**
     * @brief Parses a base-10 signed 64-bit integer that spans the whole input.
     *
     * A leading `+` is accepted. Surrounding whitespace, trailing garbage and
     * out-of-range values are rejected.
     *
     * @return The value, or `std::nullopt` if @p text is not exactly one integer.
     */
    static std::optional<int64_t> parse_int64(std::string_view text);

    /// @brief Unsigned counterpart of `parse_int64`; a leading `-` is rejected.
    static std::optional<uint64_t> parse_uint64(std::string_view text);

    /**
     * @brief Splits @p s on every occurrence of @p delimiter.
     *
     * Empty fields are preserved, so `split("a--b", "-")` yields `{"a", "", "b"}`.
     * An empty input yields a single empty field.
     */
    static std::vector<std::string> split(std::string_view s, std::string_view delimiter);
};

} // namespace tagid::infra
