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
 * @file ulid.hpp
 * @brief Universally unique lexicographically sortable identifiers.
 *
 * @details
 * A ULID packs a 48-bit millisecond timestamp and 80 random bits into 128 bits,
 * written as 26 Crockford base-32 characters. Values from one generator sort in
 * generation order both numerically and as text.
 */

#pragma once

#include "tagid/infra/clock.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace tagid::gen {

class Ulid {
  public:
    static constexpr size_t kEncodedLength = 26;
    static constexpr uint64_t kMaxTimestamp = (uint64_t(1) << 48) - 1;

    /// @brief The nil ULID (all zero bits).
    Ulid() = default;

    /// @brief @p high holds the timestamp and the top 16 random bits.
    static Ulid from_u64_pair(uint64_t high, uint64_t low) { return Ulid(high, low); }

    /// @brief Timestamp bits above 48 are discarded.
    static Ulid from_parts(uint64_t timestamp_ms, uint16_t random_high, uint64_t random_low);

    /**
     * @brief Decodes 26 Crockford base-32 characters, in either case.
     * @throws tagid::FormatError On a wrong length, invalid symbol, or a value above 128 bits.
     */
    static Ulid parse(std::string_view text);

    uint64_t timestamp_ms() const noexcept { return high_ >> 16; }
    uint64_t high() const noexcept { return high_; }
    uint64_t low() const noexcept { return low_; }
    bool is_nil() const noexcept { return high_ == 0 && low_ == 0; }

    /// @brief Same timestamp, random part plus one; `std::nullopt` if the random part is all ones.
    std::optional<Ulid> increment() const noexcept;

    std::string to_string() const;

    bool operator==(const Ulid& o) const noexcept { return high_ == o.high_ && low_ == o.low_; }
    bool operator!=(const Ulid& o) const noexcept { return !(*this == o); }
    bool operator<(const Ulid& o) const noexcept
    {
        return high_ != o.high_ ? high_ < o.high_ : low_ < o.low_;
    }

  private:
    Ulid(uint64_t high, uint64_t low) : high_(high), low_(low) {}

    uint64_t high_ = 0;
    uint64_t low_ = 0;
};

inline std::ostream& operator<<(std::ostream& os, const Ulid& ulid)
{
    return os << ulid.to_string();
}

/**
 * @class UlidGenerator
 * @brief Monotonic ULID source.
 *
 * Within one millisecond each value is the previous one plus one, so ordering
 * holds even for bursts. A new millisecond draws fresh random bits.
 */
class UlidGenerator {
  public:
    using value_type = Ulid;

    explicit UlidGenerator(infra::ClockPolicy policy = infra::ClockPolicy(),
                           infra::ClockFn clock = infra::system_clock());

    UlidGenerator(const UlidGenerator&) = delete;
    UlidGenerator& operator=(const UlidGenerator&) = delete;

    /**
     * @throws tagid::ClockRegression When the clock moved backward and the policy gives up.
     * @throws tagid::GenerationFailure When the random part overflows within one millisecond,
     * the clock is outside the 48-bit range, or entropy is unavailable.
     */
    Ulid next_value();

    /// @brief Generator contract entry point; draws from a process-wide instance on the system clock.
    static Ulid generate();

  private:
    const infra::ClockPolicy policy_;
    const infra::ClockFn clock_;

    std::mutex mutex_;
    std::optional<Ulid> last_;
};

} // namespace tagid::gen

namespace std {

template <>
struct hash<tagid::gen::Ulid> {
    size_t operator()(const tagid::gen::Ulid& ulid) const noexcept
    {
        return std::hash<uint64_t>{}(ulid.high() ^ (ulid.low() * 0x9E3779B97F4A7C15ULL));
    }
};

} // namespace std
