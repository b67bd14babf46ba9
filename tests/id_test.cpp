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
 * @file id_test.cpp
 * @brief Unit tests for the typed identifier and the entity contract.
 *
 * @details
 * Type isolation is a compile-time property, so most of it is checked with
 * `static_assert`: if any of them regresses, this file stops compiling.
 */

#include "framework.hpp"
#include "tagid/core/entity.hpp"
#include "tagid/core/error.hpp"
#include "tagid/core/id.hpp"

#include <atomic>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>

namespace {

std::atomic<int64_t> g_sequence{0};

struct SequenceGenerator {
    using value_type = int64_t;
    static int64_t generate() { return ++g_sequence; }
};

struct BrokenGenerator {
    using value_type = int64_t;
    static int64_t generate() { throw std::runtime_error("entropy pool drained"); }
};

struct RegressingGenerator {
    using value_type = int64_t;
    static int64_t generate() { throw tagid::ClockRegression("Test", 10, 5); }
};

struct User {
    using id_generator = SequenceGenerator;
};

struct Order {
    using id_generator = SequenceGenerator;
};

struct Broken {
    using id_generator = BrokenGenerator;
};

struct Regressing {
    using id_generator = RegressingGenerator;
};

struct Anonymous {
    static constexpr const char* id_label = "";
};

struct NotAnEntity {};

struct ThirdParty {};

template <typename A, typename B, typename = void>
struct is_eq_comparable : std::false_type {};

template <typename A, typename B>
struct is_eq_comparable<A, B, std::void_t<decltype(std::declval<A>() == std::declval<B>())>>
    : std::true_type {};

template <typename A, typename B, typename = void>
struct is_lt_comparable : std::false_type {};

template <typename A, typename B>
struct is_lt_comparable<A, B, std::void_t<decltype(std::declval<A>() < std::declval<B>())>>
    : std::true_type {};

} // namespace

namespace tagid {

template <>
struct EntityTraits<ThirdParty> {
    using generator = SequenceGenerator;
    using value_type = int64_t;
};

} // namespace tagid

using UserId = tagid::Id<User, std::string>;
using OrderId = tagid::Id<Order, std::string>;

// Zero-size tag: the label lives in the type, not in the instance.
static_assert(sizeof(UserId) == sizeof(std::string));
static_assert(sizeof(tagid::Id<User, int64_t>) == sizeof(int64_t));

// No implicit or explicit conversion between entities, no cross-type comparison.
static_assert(!std::is_convertible_v<UserId, OrderId>);
static_assert(!std::is_constructible_v<OrderId, UserId>);
static_assert(!std::is_assignable_v<OrderId&, UserId>);
static_assert(!is_eq_comparable<UserId, OrderId>::value);
static_assert(!is_lt_comparable<UserId, OrderId>::value);
static_assert(is_eq_comparable<UserId, UserId>::value);

// Construction from a raw value is explicit.
static_assert(!std::is_convertible_v<std::string, UserId>);
static_assert(std::is_constructible_v<UserId, std::string>);

// Entity contract.
static_assert(tagid::is_generator_v<SequenceGenerator>);
static_assert(!tagid::is_generator_v<NotAnEntity>);
static_assert(tagid::is_entity_v<User>);
static_assert(tagid::is_entity_v<ThirdParty>);
static_assert(!tagid::is_entity_v<NotAnEntity>);
static_assert(std::is_same_v<tagid::IdOf<User>, tagid::Id<User, int64_t>>);
static_assert(std::is_same_v<tagid::IdOf<ThirdParty>, tagid::Id<ThirdParty, int64_t>>);

void test_id_from_raw_and_value()
{
    UserId id = UserId::from_raw("abc");
    ASSERT_EQ(id.value(), std::string("abc"));

    UserId same("abc");
    ASSERT_TRUE(id == same);
    ASSERT_FALSE(id != same);

    const std::string* borrowed = &id.value();
    ASSERT_TRUE(borrowed == &id.value());

    std::string owned = std::move(id).into_raw();
    ASSERT_EQ(owned, std::string("abc"));
}

void test_id_next_uses_entity_generator()
{
    auto a = tagid::next_id<User>();
    auto b = tagid::IdOf<User>::next();
    auto c = tagid::next_id<ThirdParty>();
    ASSERT_TRUE(a < b);
    ASSERT_TRUE(b.value() < c.value());
    ASSERT_NE(a, b);
}

void test_id_next_wraps_foreign_failures()
{
    bool caught = false;
    try {
        (void)tagid::next_id<Broken>();
    } catch (const tagid::GenerationFailure& e) {
        caught = true;
        ASSERT_EQ(std::string(e.what()), std::string("Broken: entropy pool drained"));
    }
    ASSERT_TRUE(caught);
}

void test_id_next_propagates_library_errors()
{
    bool caught = false;
    try {
        (void)tagid::next_id<Regressing>();
    } catch (const tagid::ClockRegression& e) {
        caught = true;
        ASSERT_EQ(e.last_ms(), static_cast<int64_t>(10));
        ASSERT_EQ(e.observed_ms(), static_cast<int64_t>(5));
    }
    ASSERT_TRUE(caught);
}

void test_id_display()
{
    UserId id = UserId::from_raw("abc");
    ASSERT_EQ(id.to_string(), std::string("User::abc"));
    ASSERT_EQ(id.raw_string(), std::string("abc"));
    ASSERT_EQ(UserId::label(), std::string("User"));

    std::ostringstream os;
    os << id;
    ASSERT_EQ(os.str(), std::string("User::abc"));

    auto numeric = tagid::Id<User, int64_t>::from_raw(-17);
    ASSERT_EQ(numeric.to_string(), std::string("User::-17"));

    auto bare = tagid::Id<Anonymous, std::string>::from_raw("xyz");
    ASSERT_EQ(bare.to_string(), std::string("xyz"));
    auto unit = tagid::Id<void, int64_t>::from_raw(5);
    ASSERT_EQ(unit.to_string(), std::string("5"));
}

void test_id_relabel()
{
    UserId user = UserId::from_raw("shared");
    OrderId order = user.relabel<Order>();
    ASSERT_EQ(order.value(), user.value());
    ASSERT_EQ(order.to_string(), std::string("Order::shared"));

    OrderId moved = UserId::from_raw("moved").relabel<Order>();
    ASSERT_EQ(moved.value(), std::string("moved"));
}

void test_id_ordering_and_hash()
{
    using NumId = tagid::Id<User, int64_t>;
    NumId one = NumId::from_raw(1);
    NumId two = NumId::from_raw(2);
    ASSERT_TRUE(one < two);
    ASSERT_TRUE(one <= two);
    ASSERT_TRUE(two > one);
    ASSERT_TRUE(two >= one);
    ASSERT_FALSE(two < one);

    ASSERT_EQ(std::hash<NumId>{}(one), std::hash<int64_t>{}(1));

    std::unordered_set<UserId> set;
    set.insert(UserId::from_raw("a"));
    set.insert(UserId::from_raw("b"));
    set.insert(UserId::from_raw("a"));
    ASSERT_EQ(set.size(), static_cast<size_t>(2));
    ASSERT_TRUE(set.count(UserId::from_raw("b")) == 1);
}
