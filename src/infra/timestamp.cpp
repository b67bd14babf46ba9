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
 * @file timestamp.cpp
 * @brief ISO-8601 formatting and parsing without relying on the C locale or time zone.
 *
 * @details
 * Calendar arithmetic uses the proleptic Gregorian day-count algorithms
 * (`days_from_civil` / `civil_from_days`), so results never depend on the
 * process time zone the way `std::gmtime`/`std::mktime` round trips can.
 */

#include "tagid/infra/timestamp.hpp"

#include "tagid/core/error.hpp"
#include "tagid/infra/clock.hpp"

#include <cctype>
#include <cstdio>
#include <limits>
#include <optional>

namespace tagid::infra {

namespace {

constexpr int64_t kMillisPerDay = 86400000;

int64_t days_from_civil(int64_t y, unsigned m, unsigned d)
{
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d)
{
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2;
}

bool is_leap(int64_t y)
{
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(int64_t y, unsigned m)
{
    static const unsigned table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : table[m - 1];
}

/// Enough for every year an int64 millisecond count can reach.
constexpr size_t kMaxYearDigits = 9;

/// `days * kMillisPerDay + time_of_day` without overflow; @p time_of_day is in [0, kMillisPerDay).
std::optional<int64_t> combine(int64_t days, int64_t time_of_day)
{
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
    if (days >= 0) {
        if (days > (kMax - time_of_day) / kMillisPerDay) {
            return std::nullopt;
        }
        return days * kMillisPerDay + time_of_day;
    }
    // Step back from the next day so the product never drops below kMin on its own.
    if (days + 1 < kMin / kMillisPerDay) {
        return std::nullopt;
    }
    const int64_t base = (days + 1) * kMillisPerDay;
    const int64_t offset = time_of_day - kMillisPerDay;
    if (offset < kMin - base) {
        return std::nullopt;
    }
    return base + offset;
}

[[noreturn]] void reject(std::string_view text, const char* why)
{
    throw FormatError("Timestamp: cannot parse '" + std::string(text) + "': " + why);
}

/// Reads exactly @p width digits at @p pos.
unsigned read_digits(std::string_view text, size_t pos, size_t width)
{
    if (pos + width > text.size()) {
        reject(text, "too short");
    }
    unsigned value = 0;
    for (size_t i = pos; i < pos + width; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            reject(text, "expected digit");
        }
        value = value * 10 + static_cast<unsigned>(text[i] - '0');
    }
    return value;
}

void expect(std::string_view text, size_t pos, char c)
{
    if (pos >= text.size() || text[pos] != c) {
        reject(text, "unexpected separator");
    }
}

} // namespace

Timestamp Timestamp::now()
{
    return Timestamp(system_millis());
}

std::string Timestamp::to_iso() const
{
    int64_t days = millis_ / kMillisPerDay;
    int64_t rem = millis_ % kMillisPerDay;
    if (rem < 0) {
        rem += kMillisPerDay;
        days -= 1;
    }

    int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    civil_from_days(days, year, month, day);

    const int64_t hour = rem / 3600000;
    const int64_t minute = (rem / 60000) % 60;
    const int64_t second = (rem / 1000) % 60;
    const int64_t milli = rem % 1000;

    // Years outside 0000..9999 keep their extra digits and a leading '-' when negative.
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%s%04lld-%02u-%02uT%02lld:%02lld:%02lld.%03lldZ",
                  year < 0 ? "-" : "", static_cast<long long>(year < 0 ? -year : year), month, day,
                  static_cast<long long>(hour), static_cast<long long>(minute),
                  static_cast<long long>(second), static_cast<long long>(milli));
    return buf;
}

Timestamp Timestamp::parse(std::string_view text)
{
    size_t pos = 0;
    const bool negative_year = !text.empty() && text[0] == '-';
    if (negative_year) {
        ++pos;
    }

    size_t year_end = pos;
    while (year_end < text.size() && std::isdigit(static_cast<unsigned char>(text[year_end]))) {
        ++year_end;
    }
    const size_t year_digits = year_end - pos;
    if (year_digits < 4 || year_digits > kMaxYearDigits) {
        reject(text, "year must have 4 to 9 digits");
    }
    const int64_t magnitude = read_digits(text, pos, year_digits);
    const int64_t year = negative_year ? -magnitude : magnitude;

    pos = year_end;
    expect(text, pos, '-');
    const unsigned month = read_digits(text, pos + 1, 2);
    expect(text, pos + 3, '-');
    const unsigned day = read_digits(text, pos + 4, 2);
    expect(text, pos + 6, 'T');
    const unsigned hour = read_digits(text, pos + 7, 2);
    expect(text, pos + 9, ':');
    const unsigned minute = read_digits(text, pos + 10, 2);
    expect(text, pos + 12, ':');
    const unsigned second = read_digits(text, pos + 13, 2);
    pos += 15;

    unsigned milli = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) {
                milli = milli * 10 + static_cast<unsigned>(text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            reject(text, "empty fraction");
        }
        if (digits > 9) {
            reject(text, "more than nine fractional digits");
        }
        for (size_t i = digits; i < 3; ++i) {
            milli *= 10;
        }
    }

    if (pos + 1 != text.size() || text[pos] != 'Z') {
        reject(text, "expected trailing 'Z'");
    }

    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        reject(text, "date out of range");
    }
    if (hour > 23 || minute > 59 || second > 59) {
        reject(text, "time out of range");
    }

    const int64_t time_of_day = hour * 3600000LL + minute * 60000LL + second * 1000LL + milli;
    auto millis = combine(days_from_civil(year, month, day), time_of_day);
    if (!millis) {
        reject(text, "outside the 64-bit millisecond range");
    }
    return Timestamp(*millis);
}

} // namespace tagid::infra
