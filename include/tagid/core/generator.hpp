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
 * @file generator.hpp
 * @brief The generator contract: how a raw identifier value comes into existence.
 *
 * @details
 * A generator is any type `G` with
 *
 * @code
 * struct G {
 *     using value_type = R;
 *     static R generate();
 * };
 * @endcode
 *
 * `generate()` must either return a value never returned before for the lifetime
 * the generator guarantees, or throw (`tagid::GenerationFailure` and subclasses).
 * It is invoked concurrently from arbitrary threads, so stateful generators keep
 * their state behind a mutex or atomics. Uniqueness is entirely the generator's
 * responsibility; the identifier core never retries or deduplicates.
 */

#pragma once

#include <type_traits>

namespace tagid {

template <typename G, typename = void>
struct is_generator : std::false_type {};

template <typename G>
struct is_generator<G, std::void_t<typename G::value_type, decltype(G::generate())>>
    : std::is_convertible<decltype(G::generate()), typename G::value_type> {};

/// @brief True when @p G satisfies the generator contract.
template <typename G>
inline constexpr bool is_generator_v = is_generator<G>::value;

} // namespace tagid
