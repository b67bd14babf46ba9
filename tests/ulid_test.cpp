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
 * @file ulid_test.cpp
 * @brief Unit tests for the ULID value type and its monotonic generator.
 */

#include "fake_clock.hpp"
#include "framework.hpp"
#include "tagid/core/error.hpp"
#include "tagid/gen/ulid.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

using tagid::gen::Ulid;
using tagid::gen::UlidGenerator;
using tagid::infra::ClockPolicy;
using tagid::test::FakeClock;

void test_ulid_encoding()
{
    ASSERT_EQ(Ulid().to_string(), std::string("00000000000000000000000000"));
    ASSERT_TRUE(Ulid().is_nil());
    ASSERT_EQ(Ulid::from_parts(1, 0, 0).to_string(), std::string("00000000010000000000000000"));
    ASSERT_EQ(Ulid::from_u64_pair(UINT64_MAX, UINT64_MAX).to_string(),
              std::string("7ZZZZZZZZZZZZZZZZZZZZZZZZZ"));

    Ulid sample = Ulid::from_parts(1669779798068, 0xBEEF, 42);
    ASSERT_EQ(sample.timestamp_ms(), uint64_t(1669779798068));
    ASSERT_EQ(sample.high() & 0xFFFF, uint64_t(0xBEEF));
    ASSERT_EQ(sample.low(), uint64_t(42));
    ASSERT_EQ(sample.to_string().size(), Ulid::kEncodedLength);
}

void test_ulid_parse()
{
    Ulid known = Ulid::parse("01ARZ3NDEKTSV4RRFFQ69G5FAV");
    ASSERT_EQ(known.timestamp_ms(), uint64_t(1469922850259));
    ASSERT_EQ(known.to_string(), std::string("01ARZ3NDEKTSV4RRFFQ69G5FAV"));
    ASSERT_EQ(Ulid::parse("01arz3ndektsv4rrffq69g5fav"), known);

    ASSERT_THROWS(Ulid::parse("8ZZZZZZZZZZZZZZZZZZZZZZZZZ"), tagid::FormatError);
    ASSERT_THROWS(Ulid::parse("01ARZ3NDEKTSV4RRFFQ69G5FA"), tagid::FormatError);
    ASSERT_THROWS(Ulid::parse("01ARZ3NDEKTSV4RRFFQ69G5FAVX"), tagid::FormatError);
    ASSERT_THROWS(Ulid::parse("01ARZ3NDEKTSV4RRFFQ69G5FAU"), tagid::FormatError);
    ASSERT_THROWS(Ulid::parse(""), tagid::FormatError);
}

void test_ulid_increment()
{
    Ulid base = Ulid::from_parts(1000, 0, 7);
    auto next = base.increment();
    ASSERT_TRUE(next.has_value());
    ASSERT_EQ(next->low(), uint64_t(8));
    ASSERT_EQ(next->timestamp_ms(), uint64_t(1000));

    // Carry from the low word into the 16 random bits of the high word.
    auto carried = Ulid::from_parts(1000, 0, UINT64_MAX).increment();
    ASSERT_TRUE(carried.has_value());
    ASSERT_EQ(carried->low(), uint64_t(0));
    ASSERT_EQ(carried->high() & 0xFFFF, uint64_t(1));
    ASSERT_EQ(carried->timestamp_ms(), uint64_t(1000));

    ASSERT_FALSE(Ulid::from_parts(1000, 0xFFFF, UINT64_MAX).increment().has_value());
}

void test_ulid_monotonic_within_millisecond()
{
    FakeClock clock({1000});
    UlidGenerator gen(ClockPolicy(), clock.fn());

    Ulid first = gen.next_value();
    Ulid previous = first;
    for (int i = 0; i < 1000; ++i) {
        Ulid current = gen.next_value();
        ASSERT_TRUE(previous < current);
        ASSERT_TRUE(previous.to_string() < current.to_string());
        ASSERT_EQ(current.timestamp_ms(), uint64_t(1000));
        previous = current;
    }
    ASSERT_EQ(*first.increment(), Ulid::from_u64_pair(first.high(), first.low() + 1));
}

void test_ulid_new_millisecond()
{
    FakeClock clock({1000, 1001});
    UlidGenerator gen(ClockPolicy(), clock.fn());

    Ulid a = gen.next_value();
    Ulid b = gen.next_value();
    ASSERT_EQ(a.timestamp_ms(), uint64_t(1000));
    ASSERT_EQ(b.timestamp_ms(), uint64_t(1001));
    ASSERT_TRUE(a < b);
}

void test_ulid_clock_regression()
{
    FakeClock clock({1000, 990});
    UlidGenerator gen(ClockPolicy::fail(), clock.fn());

    gen.next_value();
    ASSERT_THROWS(gen.next_value(), tagid::ClockRegression);
}

void test_ulid_clock_out_of_range()
{
    FakeClock clock({-1});
    UlidGenerator gen(ClockPolicy(), clock.fn());
    ASSERT_THROWS(gen.next_value(), tagid::GenerationFailure);
}

void test_ulid_generated_values_sort()
{
    std::vector<Ulid> minted;
    for (int i = 0; i < 2000; ++i) {
        minted.push_back(UlidGenerator::generate());
    }
    ASSERT_TRUE(std::is_sorted(minted.begin(), minted.end()));
    ASSERT_TRUE(std::adjacent_find(minted.begin(), minted.end()) == minted.end());
}
