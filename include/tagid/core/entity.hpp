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
 * @file entity.hpp
 * @brief The entity contract: binding an entity type to exactly one generator.
 *
 * @details
 * An entity names its generator with a member alias:
 *
 * @code
 * struct User {
 *     using id_generator = tagid::gen::UuidGenerator;
 * };
 * tagid::IdOf<User> id = tagid::next_id<User>();
 * @endcode
 *
 * Types that cannot be modified are bound by specializing `EntityTraits`:
 *
 * @code
 * template <> struct tagid::EntityTraits<vendor::Invoice> {
 *     using generator = tagid::gen::SnowflakeGenerator;
 *     using value_type = int64_t;
 * };
 * @endcode
 *
 * `next_id` and `IdOf` need the full definition of `Id`; include
 * `tagid/core/id.hpp` (or `tagid/tagid.hpp`) before calling them.
 */

#pragma once

#include "tagid/core/generator.hpp"

#include <type_traits>

namespace tagid {

template <typename T, typename Raw>
class Id;

/**
 * @struct EntityTraits
 * @brief Maps an entity type to its generator and raw value type.
 *
 * The primary template is empty, so `is_entity_v` is false for unbound types and
 * `Id<T, Raw>::next()` fails to compile for them.
 */
template <typename E, typename = void>
struct EntityTraits {};

template <typename E>
struct EntityTraits<E, std::void_t<typename E::id_generator>> {
    using generator = typename E::id_generator;
    using value_type = typename generator::value_type;
};

template <typename E, typename = void>
struct is_entity : std::false_type {};

template <typename E>
struct is_entity<E, std::void_t<typename EntityTraits<E>::generator>>
    : std::bool_constant<is_generator_v<typename EntityTraits<E>::generator>> {};

/// @brief True when @p E is bound to a type satisfying the generator contract.
template <typename E>
inline constexpr bool is_entity_v = is_entity<E>::value;

/// @brief The identifier type of entity @p E.
template <typename E>
using IdOf = Id<E, typename EntityTraits<E>::value_type>;

/// @brief Generates a fresh identifier for @p E; same as `IdOf<E>::next()`.
template <typename E>
IdOf<E> next_id()
{
    return IdOf<E>::next();
}

} // namespace tagid
