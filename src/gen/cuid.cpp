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
 * @file cuid.cpp
 * @brief CUID generation.
 */

#include "tagid/gen/cuid.hpp"

#include "tagid/infra/clock.hpp"
#include "tagid/infra/random.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <unistd.h>

namespace tagid::gen {

namespace {

const char* const kBase36 = "0123456789abcdefghijklmnopqrstuvwxyz";

uint64_t splitmix64(uint64_t x)
{
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

/// Host name and pid, so two processes started in the same millisecond still diverge.
uint64_t fingerprint()
{
    static const uint64_t value = [] {
        char host[256] = {};
        if (gethostname(host, sizeof(host) - 1) != 0) {
            host[0] = '\0';
        }
        uint64_t h = std::hash<std::string>{}(host);
        h ^= splitmix64(static_cast<uint64_t>(getpid()));
        return splitmix64(h);
    }();
    return value;
}

std::atomic<uint64_t> g_counter{0};

} // namespace

std::string CuidGenerator::generate()
{
    auto& rng = infra::thread_rng();

    const uint64_t count = g_counter.fetch_add(1, std::memory_order_relaxed);
    const auto now = static_cast<uint64_t>(infra::system_millis());
    const uint64_t salt = rng();

    // Three independent words; eight base-36 symbols from each.
    uint64_t words[3] = {
        splitmix64(now ^ salt),
        splitmix64(fingerprint() ^ splitmix64(count)),
        rng(),
    };

    std::string out;
    out.reserve(kLength);
    out.push_back(static_cast<char>('a' + rng() % 26));
    for (size_t i = 0; out.size() < kLength; ++i) {
        uint64_t& w = words[i % 3];
        out.push_back(kBase36[w % 36]);
        w /= 36;
    }
    return out;
}

bool is_cuid(std::string_view text) noexcept
{
    if (text.size() < 2 || text.size() > 32) {
        return false;
    }
    if (text[0] < 'a' || text[0] > 'z') {
        return false;
    }
    for (char c : text.substr(1)) {
        const bool lower = c >= 'a' && c <= 'z';
        const bool digit = c >= '0' && c <= '9';
        if (!lower && !digit) {
            return false;
        }
    }
    return true;
}

} // namespace tagid::gen
