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
 * @file raw_codec.hpp
 * @brief Text and JSON conversion of raw identifier values.
 *
 * @details
 * `RawCodec<R>` is the single place that knows how a raw value looks outside the
 * process. It is provided for:
 *
 * - `std::string`: text is the string itself, JSON is a JSON string.
 * - Integral types (except `bool`): decimal text. JSON is a number while the
 *   magnitude fits a double exactly (`|v| <= 2^53`), otherwise a decimal string,
 *   because cJSON stores every number as `double`. Both forms are accepted on input.
 * - Any type with a `to_string()` member and a static `parse(std::string_view)`
 *   (`gen::Uuid`, `gen::Ulid`, `gen::PrettySnowflakeId`): JSON is a string.
 *
 * Malformed input always raises `tagid::FormatError`; no default is substituted.
 * A string holding a NUL byte is refused on output rather than truncated.
 * JSON nodes returned by `to_json` are owned by the caller (`JsonPtr` helps).
 */

#pragma once

#include "tagid/core/error.hpp"

#include <cJSON.h>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

namespace tagid {

/// @brief Deleter releasing a whole cJSON tree.
struct JsonDeleter {
    void operator()(cJSON* node) const noexcept { cJSON_Delete(node); }
};

using JsonPtr = std::unique_ptr<cJSON, JsonDeleter>;

/// @brief Serializes @p node without whitespace.
inline std::string print_json(const cJSON* node)
{
    char* raw_output = cJSON_PrintUnformatted(node);
    if (raw_output == nullptr) {
        throw FormatError("Json: failed to serialize node");
    }
    std::string result(raw_output);
    free(raw_output);
    return result;
}

/// @brief Parses JSON text into an owned tree.
/// @throws tagid::FormatError If @p text is not valid JSON.
inline JsonPtr parse_json(std::string_view text)
{
    std::string buffer(text);
    JsonPtr root(cJSON_Parse(buffer.c_str()));
    if (!root) {
        throw FormatError("Json: malformed document '" + buffer + "'");
    }
    return root;
}

/**
 * @brief Returns @p text unchanged if cJSON can store it losslessly.
 *
 * cJSON strings are NUL-terminated, so an embedded `'\0'` would silently cut the value short.
 *
 * @throws tagid::FormatError If @p text contains a NUL byte.
 */
inline const std::string& checked_json_text(const std::string& text, const char* what)
{
    if (text.find('\0') != std::string::npos) {
        throw FormatError(std::string("Json: ") + what + " contains a NUL byte");
    }
    return text;
}

namespace detail {

template <typename R, typename = void>
struct is_textual : std::false_type {};

template <typename R>
struct is_textual<R, std::void_t<decltype(std::declval<const R&>().to_string()),
                                 decltype(R::parse(std::declval<std::string_view>()))>>
    : std::is_same<decltype(R::parse(std::declval<std::string_view>())), R> {};

template <typename R>
inline constexpr bool is_textual_v = is_textual<R>::value;

template <typename R>
inline constexpr bool is_integer_v = std::is_integral_v<R> && !std::is_same_v<R, bool>;

/// @brief Largest magnitude a double represents without rounding.
inline constexpr int64_t kMaxSafeJsonInteger = int64_t(1) << 53;

} // namespace detail

/**
 * @struct RawCodec
 * @brief Conversion of raw type @p R; undefined for unsupported types.
 */
template <typename R, typename = void>
struct RawCodec;

template <>
struct RawCodec<std::string> {
    static std::string to_text(const std::string& raw) { return raw; }

    static std::string from_text(std::string_view text) { return std::string(text); }

    /// @throws tagid::FormatError If @p raw holds a NUL byte, which a JSON string node cannot carry.
    static cJSON* to_json(const std::string& raw)
    {
        return cJSON_CreateString(checked_json_text(raw, "identifier").c_str());
    }

    static std::string from_json(const cJSON* node)
    {
        if (!cJSON_IsString(node) || node->valuestring == nullptr) {
            throw FormatError("Json: expected a string identifier");
        }
        return node->valuestring;
    }
};

template <typename R>
struct RawCodec<R, std::enable_if_t<detail::is_integer_v<R>>> {
    static std::string to_text(R raw) { return std::to_string(raw); }

    static R from_text(std::string_view text)
    {
        R value{};
        const char* first = text.data();
        const char* last = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (text.empty() || ec != std::errc() || ptr != last) {
            throw FormatError("Codec: '" + std::string(text) + "' is not a valid integer identifier");
        }
        return value;
    }

    static cJSON* to_json(R raw)
    {
        if (fits_double(raw)) {
            return cJSON_CreateNumber(static_cast<double>(raw));
        }
        return cJSON_CreateString(to_text(raw).c_str());
    }

    static R from_json(const cJSON* node)
    {
        if (cJSON_IsString(node) && node->valuestring != nullptr) {
            return from_text(node->valuestring);
        }
        if (!cJSON_IsNumber(node)) {
            throw FormatError("Json: expected an integer identifier");
        }

        const double d = node->valuedouble;
        const double limit = static_cast<double>(detail::kMaxSafeJsonInteger);
        if (!std::isfinite(d) || std::trunc(d) != d || d > limit || d < -limit) {
            throw FormatError("Json: number is not an exactly representable integer");
        }
        if (d < static_cast<double>(std::numeric_limits<R>::min()) ||
            d > static_cast<double>(std::numeric_limits<R>::max())) {
            throw FormatError("Json: integer identifier out of range");
        }
        return static_cast<R>(d);
    }

  private:
    static bool fits_double(R raw)
    {
        if constexpr (std::is_signed_v<R>) {
            const int64_t v = static_cast<int64_t>(raw);
            return v <= detail::kMaxSafeJsonInteger && v >= -detail::kMaxSafeJsonInteger;
        } else {
            return static_cast<uint64_t>(raw) <= static_cast<uint64_t>(detail::kMaxSafeJsonInteger);
        }
    }
};

template <typename R>
struct RawCodec<R, std::enable_if_t<detail::is_textual_v<R>>> {
    static std::string to_text(const R& raw) { return raw.to_string(); }

    static R from_text(std::string_view text) { return R::parse(text); }

    static cJSON* to_json(const R& raw) { return cJSON_CreateString(raw.to_string().c_str()); }

    static R from_json(const cJSON* node)
    {
        if (!cJSON_IsString(node) || node->valuestring == nullptr) {
            throw FormatError("Json: expected a string identifier");
        }
        return R::parse(node->valuestring);
    }
};

} // namespace tagid
