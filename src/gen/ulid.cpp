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
 * @file ulid.cpp
 * @brief Crockford base-32 coding and monotonic ULID generation.
 */

#include "tagid/gen/ulid.hpp"

#include "tagid/core/error.hpp"
#include "tagid/infra/random.hpp"

namespace tagid::gen {

namespace {

const char* const kCrockford = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
const std::string kName = "Ulid";

int crockford_value(char c)
{
    if (c >= 'a' && c <= 'z') {
        c = static_cast<char>(c - 'a' + 'A');
    }
    for (int i = 0; i < 32; ++i) {
        if (kCrockford[i] == c) {
            return i;
        }
    }
    return -1;
}

} // namespace

Ulid Ulid::from_parts(uint64_t timestamp_ms, uint16_t random_high, uint64_t random_low)
{
    return Ulid(((timestamp_ms & kMaxTimestamp) << 16) | random_high, random_low);
}

Ulid Ulid::parse(std::string_view text)
{
    if (text.size() != kEncodedLength) {
        throw FormatError("Ulid: expected 26 characters, got " + std::to_string(text.size()));
    }

    uint64_t high = 0;
    uint64_t low = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        int v = crockford_value(text[i]);
        if (v < 0) {
            throw FormatError("Ulid: invalid character in '" + std::string(text) + "'");
        }
        // 26 * 5 = 130 bits, so the leading symbol may only carry 3.
        if (i == 0 && v > 7) {
            throw FormatError("Ulid: value of '" + std::string(text) + "' exceeds 128 bits");
        }
        high = (high << 5) | (low >> 59);
        low = (low << 5) | static_cast<uint64_t>(v);
    }
    return Ulid(high, low);
}

std::optional<Ulid> Ulid::increment() const noexcept
{
    const uint64_t random_high = high_ & 0xFFFF;
    if (low_ != UINT64_MAX) {
        return Ulid(high_, low_ + 1);
    }
    if (random_high != 0xFFFF) {
        return Ulid(high_ + 1, 0);
    }
    return std::nullopt;
}

std::string Ulid::to_string() const
{
    std::string out(kEncodedLength, '0');
    uint64_t high = high_;
    uint64_t low = low_;
    for (size_t i = kEncodedLength; i-- > 0;) {
        out[i] = kCrockford[low & 0x1F];
        low = (low >> 5) | (high << 59);
        high >>= 5;
    }
    return out;
}

UlidGenerator::UlidGenerator(infra::ClockPolicy policy, infra::ClockFn clock)
    : policy_(policy), clock_(std::move(clock))
{
}

Ulid UlidGenerator::next_value()
{
    std::lock_guard<std::mutex> lock(mutex_);

    int64_t now = clock_();
    if (last_) {
        now = infra::settle_clock(clock_, now, static_cast<int64_t>(last_->timestamp_ms()), policy_,
                                  kName);
    }
    if (now < 0 || static_cast<uint64_t>(now) > Ulid::kMaxTimestamp) {
        throw GenerationFailure(kName + ": clock reading " + std::to_string(now) +
                                " is outside the 48-bit timestamp range");
    }

    if (last_ && static_cast<uint64_t>(now) == last_->timestamp_ms()) {
        auto next = last_->increment();
        if (!next) {
            throw GenerationFailure(kName + ": random component exhausted within millisecond " +
                                    std::to_string(now));
        }
        last_ = *next;
        return *last_;
    }

    auto& rng = infra::thread_rng();
    std::uniform_int_distribution<uint64_t> dis;
    const auto random_high = static_cast<uint16_t>(dis(rng) & 0xFFFF);
    const uint64_t random_low = dis(rng);

    last_ = Ulid::from_parts(static_cast<uint64_t>(now), random_high, random_low);
    return *last_;
}

Ulid UlidGenerator::generate()
{
    static UlidGenerator instance;
    return instance.next_value();
}

} // namespace tagid::gen
