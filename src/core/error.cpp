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
 * @file error.cpp
 * @brief Out-of-line pieces of the exception hierarchy.
 */

#include "tagid/core/error.hpp"

namespace tagid {

ClockRegression::ClockRegression(const std::string& generator, int64_t last_ms,
                                 int64_t observed_ms)
    : GenerationFailure(generator + ": clock moved backward by " +
                        std::to_string(last_ms - observed_ms) + " ms (last " +
                        std::to_string(last_ms) + ", observed " + std::to_string(observed_ms) +
                        ")"),
      last_ms_(last_ms), observed_ms_(observed_ms)
{
}

} // namespace tagid
