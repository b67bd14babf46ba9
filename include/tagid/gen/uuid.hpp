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
 * @file uuid.hpp
 * @brief RFC 4122 version 4 UUID value type and its generator.
 *
 * @details
 * `Uuid` is 16 raw bytes, compared byte-wise, rendered in the canonical
 * lower-case `xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx` form.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace tagid::gen {

/**
 * @class Uuid
 * @brief A 128-bit universally unique identifier.
 */
class Uuid {
  public:
    using Bytes = std::array<uint8_t, 16>;

    /// @brief The nil UUID (all zero bits).
    Uuid() : bytes_{} {}

    explicit Uuid(const Bytes& bytes) : bytes_(bytes) {}

    /// @brief Builds a UUID from its high and low 64-bit halves (big-endian order).
    static Uuid from_u64_pair(uint64_t high, uint64_t low);

    /**
     * @brief Parses the hyphenated 36-character form or the bare 32 hex digits.
     *
     * Hex digits may be upper or lower case.
     *
     * @throws tagid::FormatError On any other input.
     */
    static Uuid parse(std::string_view text);

    const Bytes& bytes() const noexcept { return bytes_; }

    /// @brief Version nibble (4 for generated values, 0 for nil).
    int version() const noexcept { return bytes_[6] >> 4; }

    bool is_nil() const noexcept;

    /// @brief Canonical lower-case hyphenated text.
    std::string to_string() const;

    bool operator==(const Uuid& o) const noexcept { return bytes_ == o.bytes_; }
    bool operator!=(const Uuid& o) const noexcept { return bytes_ != o.bytes_; }
    bool operator<(const Uuid& o) const noexcept { return bytes_ < o.bytes_; }

  private:
    Bytes bytes_;
};

inline std::ostream& operator<<(std::ostream& os, const Uuid& uuid)
{
    return os << uuid.to_string();
}

/**
 * @class UuidGenerator
 * @brief Stateless generator of random (version 4) UUIDs.
 */
class UuidGenerator {
  public:
    using value_type = Uuid;

    /**
     * @brief Draws 122 random bits and sets the version and variant fields.
     *
     * @throws tagid::GenerationFailure If the thread's entropy source is unavailable.
     */
    static Uuid generate();
};

} // namespace tagid::gen

namespace std {

template <>
struct hash<tagid::gen::Uuid> {
    size_t operator()(const tagid::gen::Uuid& uuid) const noexcept
    {
        uint64_t h = 0;
        uint64_t l = 0;
        const auto& b = uuid.bytes();
        for (int i = 0; i < 8; ++i) {
            h = (h << 8) | b[i];
            l = (l << 8) | b[i + 8];
        }
        return std::hash<uint64_t>{}(h ^ (l * 0x9E3779B97F4A7C15ULL));
    }
};

} // namespace std
