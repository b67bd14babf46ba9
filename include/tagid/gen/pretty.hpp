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
 * @file pretty.hpp
 * @brief Human-readable rendering of Snowflake values, e.g. `ARPJ-27036-GVQS-07849`.
 *
 * @details
 * Rendering of a Snowflake `id`:
 *
 * 1. Append a Damm check digit to the decimal text of `id`.
 * 2. Split the digits from the right into groups of five.
 * 3. Prepend `0` groups until there are four.
 * 4. Alternate groups: every other group stays as zero-padded digits, the rest
 *    are re-encoded in an alphabet (base 23 by default) and padded to four letters.
 *    The last group is always kept as digits.
 * 5. Join with `-`.
 *
 * The check digit detects every single-digit error and every swap of adjacent
 * digits, so mistyped ids are rejected when converted back.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tagid::gen {

/// @brief Damm checksum over the decimal digits of a string (other characters are skipped).
namespace damm {

/// @brief Interim digit after consuming @p rep; 0 means @p rep carries a valid check digit.
int checksum(std::string_view rep) noexcept;

/// @brief @p rep followed by its check digit.
std::string encode(std::string_view rep);

bool is_valid(std::string_view rep) noexcept;

/// @brief @p rep without its check digit, or `std::nullopt` if the check fails.
std::optional<std::string> decode(std::string_view rep);

} // namespace damm

/**
 * @struct Alphabet
 * @brief An ordered set of symbols; its size is the numeric base.
 */
struct Alphabet {
    std::string elements;

    size_t base() const noexcept { return elements.size(); }

    /// @brief `ABCDEFGHJKLMNPQRSTUVXYZ`: no I, O or W, which are easily misread.
    static const Alphabet& base23();
};

/**
 * @class AlphabetCodec
 * @brief Positional encoding of non-negative integers in an `Alphabet`.
 */
class AlphabetCodec {
  public:
    explicit AlphabetCodec(Alphabet alphabet = Alphabet::base23());

    /// @throws tagid::FormatError If @p number is negative.
    std::string encode(int64_t number) const;

    /// @throws tagid::FormatError On a symbol outside the alphabet or on overflow.
    int64_t decode(std::string_view rep) const;

    const Alphabet& alphabet() const noexcept { return alphabet_; }

  private:
    Alphabet alphabet_;
};

/**
 * @class IdPrettifier
 * @brief Converts between Snowflake values and their pretty text.
 */
class IdPrettifier {
  public:
    explicit IdPrettifier(Alphabet alphabet = Alphabet::base23());

    /// @throws tagid::FormatError If @p id_seed is negative.
    std::string prettify(int64_t id_seed) const;

    /**
     * @brief Recovers the Snowflake value.
     * @throws tagid::FormatError On a bad checksum, unknown symbol, or malformed shape.
     */
    int64_t to_id_seed(std::string_view pretty) const;

    /// @brief True when @p pretty decodes and its check digit matches.
    bool is_valid(std::string_view pretty) const;

    /**
     * @brief Installs the process-wide prettifier; only the first call takes effect.
     */
    static const IdPrettifier& global_initialize(const Alphabet& alphabet);

    /// @brief The process-wide prettifier, installed with base 23 if nobody did earlier.
    static const IdPrettifier& summon();

    size_t parts_size() const noexcept { return parts_size_; }
    const std::string& delimiter() const noexcept { return delimiter_; }
    char zero_char() const noexcept { return zero_char_; }
    size_t max_encoder_length() const noexcept { return max_encoder_length_; }

  private:
    std::vector<std::string> divide(const std::string& rep) const;
    std::vector<std::string> add_leading_zero_parts(std::vector<std::string> parts) const;
    std::string convert_parts(const std::vector<std::string>& parts) const;
    std::string decode_with_check_digit(std::string_view pretty) const;

    AlphabetCodec encoder_;
    size_t parts_size_ = 5;
    std::string delimiter_ = "-";
    bool leading_zeros_ = true;
    char zero_char_;
    size_t max_encoder_length_;
};

/**
 * @class PrettySnowflakeId
 * @brief A Snowflake value held in its pretty text form.
 *
 * Ordering is textual, which differs from the numeric order of the underlying values.
 */
class PrettySnowflakeId {
  public:
    PrettySnowflakeId() = default;

    static PrettySnowflakeId from_snowflake(int64_t snowflake);

    /// @throws tagid::FormatError Unless @p text is a valid pretty id.
    static PrettySnowflakeId parse(std::string_view text);

    /// @brief The numeric Snowflake value.
    int64_t to_snowflake() const;

    const std::string& to_string() const noexcept { return text_; }

    bool operator==(const PrettySnowflakeId& o) const noexcept { return text_ == o.text_; }
    bool operator!=(const PrettySnowflakeId& o) const noexcept { return text_ != o.text_; }
    bool operator<(const PrettySnowflakeId& o) const noexcept { return text_ < o.text_; }

  private:
    explicit PrettySnowflakeId(std::string text) : text_(std::move(text)) {}

    std::string text_;
};

inline std::ostream& operator<<(std::ostream& os, const PrettySnowflakeId& id)
{
    return os << id.to_string();
}

/**
 * @class PrettySnowflakeGenerator
 * @brief Draws from the process-wide `SnowflakeGenerator` and prettifies the result.
 */
class PrettySnowflakeGenerator {
  public:
    using value_type = PrettySnowflakeId;

    static PrettySnowflakeId generate();
};

} // namespace tagid::gen

namespace std {

template <>
struct hash<tagid::gen::PrettySnowflakeId> {
    size_t operator()(const tagid::gen::PrettySnowflakeId& id) const noexcept
    {
        return std::hash<std::string>{}(id.to_string());
    }
};

} // namespace std
