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
 * @file random.cpp
 * @brief Lazy, failure-aware seeding of the per-thread engine.
 */

#include "tagid/infra/random.hpp"

#include "tagid/core/error.hpp"

#include <array>
#include <memory>
#include <string>

namespace tagid::infra {

/**
 * Implementation Strategy:
 * 1. **Thread Safety**: `thread_local` storage, so no engine is ever shared.
 * 2. **Seeding**: eight `random_device` words through `std::seed_seq`; a single
 *    32-bit word would leave most of the Mersenne Twister state predictable.
 * 3. **Failure**: `random_device` may throw when no entropy source exists. The
 *    engine stays unset in that case and the next call tries again.
 */
std::mt19937_64& thread_rng()
{
    thread_local std::unique_ptr<std::mt19937_64> engine;
    if (!engine) {
        try {
            std::random_device rd;
            std::array<std::random_device::result_type, 8> words{};
            for (auto& w : words) {
                w = rd();
            }
            std::seed_seq seq(words.begin(), words.end());
            engine = std::make_unique<std::mt19937_64>(seq);
        } catch (const std::exception& e) {
            throw GenerationFailure(std::string("Random: entropy source unavailable: ") + e.what());
        }
    }
    return *engine;
}

} // namespace tagid::infra
