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
 * @file timestamp.hpp
 * @brief UTC instant with millisecond precision and its ISO-8601 text form.
 */

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace tagid::infra {

/**
 * @class Timestamp
 * @brief Milliseconds since the UNIX epoch, rendered as `YYYY-MM-DDTHH:MM:SS.mmmZ`.
 *
 * Years past 9999 keep every digit and years before 0000 carry a leading '-', so
 * the whole int64 range renders and parses back.
 */
class Timestamp {
  public:
    Timestamp() = default;

    static Timestamp now();
    static Timestamp from_millis(int64_t millis) { return Timestamp(millis); }

    /**
     * @brief Parses `YYYY-MM-DDTHH:MM:SS[.fffffffff]Z`.
     *
     * The year may carry a leading '-' and has 4 to 9 digits. A fraction, when
     * present, has one to nine digits; anything past milliseconds is truncated.
     * The trailing `Z` is required.
     *
     * @throws tagid::FormatError On any other shape or an out-of-range field.
     */
    static Timestamp parse(std::string_view text);

    int64_t millis() const noexcept { return millis_; }

    /// @brief Canonical text, always with three fractional digits.
    std::string to_iso() const;

    bool operator==(const Timestamp& o) const noexcept { return millis_ == o.millis_; }
    bool operator!=(const Timestamp& o) const noexcept { return millis_ != o.millis_; }
    bool operator<(const Timestamp& o) const noexcept { return millis_ < o.millis_; }
    bool operator<=(const Timestamp& o) const noexcept { return millis_ <= o.millis_; }
    bool operator>(const Timestamp& o) const noexcept { return millis_ > o.millis_; }
    bool operator>=(const Timestamp& o) const noexcept { return millis_ >= o.millis_; }

  private:
    explicit Timestamp(int64_t millis) : millis_(millis) {}

    int64_t millis_ = 0;
};

inline std::ostream& operator<<(std::ostream& os, const Timestamp& ts)
{
    return os << ts.to_iso();
}

} // namespace tagid::infra
