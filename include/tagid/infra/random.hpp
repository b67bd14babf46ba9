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
 * @file random.hpp
 * @brief Per-thread pseudo-random engine shared by the random-based generators.
 *
 * @details
 * Each thread owns one `std::mt19937_64`, seeded on first use from
 * `std::random_device`, so generation never contends on a lock.
 */

#pragma once

#include <random>

namespace tagid::infra {

/**
 * @brief The calling thread's engine.
 * @throws tagid::GenerationFailure If the entropy source cannot be opened or read.
 */
std::mt19937_64& thread_rng();

} // namespace tagid::infra
