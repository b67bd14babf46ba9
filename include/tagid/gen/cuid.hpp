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
 * @file cuid.hpp
 * @brief Collision-resistant, URL-safe string identifiers.
 *
 * @details
 * A CUID is 24 characters: a random lower-case letter (so the value is always a
 * valid identifier in most languages and never starts with a digit) followed by
 * 23 base-36 characters mixed from the wall clock, a per-process fingerprint, a
 * process-wide counter and the thread's random engine.
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace tagid::gen {

class CuidGenerator {
  public:
    using value_type = std::string;

    static constexpr size_t kLength = 24;

    /// @throws tagid::GenerationFailure If the thread's entropy source is unavailable.
    static std::string generate();
};

/**
 * @brief True if @p text has the CUID shape: 2 to 32 characters, a leading `a`-`z`,
 * the rest `a`-`z` or `0`-`9`.
 */
bool is_cuid(std::string_view text) noexcept;

} // namespace tagid::gen
