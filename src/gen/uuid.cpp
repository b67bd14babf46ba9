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
 * @file uuid.cpp
 * @brief Formatting, parsing and random generation of UUIDs.
 *
 * @details
 * Generation follows RFC 4122 for version 4 (random) UUIDs:
 * - Version bits `0100` in the high nibble of byte 6.
 * - Variant bits `10` in the top of byte 8, so the 17th hex digit is one of `{8, 9, a, b}`.
 */

#include "tagid/gen/uuid.hpp"

#include "tagid/core/error.hpp"
#include "tagid/infra/random.hpp"

namespace tagid::gen {

namespace {

const char* const kHexDigits = "0123456789abcdef";

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

Uuid Uuid::from_u64_pair(uint64_t high, uint64_t low)
{
    Bytes bytes{};
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>(high >> (56 - 8 * i));
        bytes[i + 8] = static_cast<uint8_t>(low >> (56 - 8 * i));
    }
    return Uuid(bytes);
}

Uuid Uuid::parse(std::string_view text)
{
    const bool hyphenated = text.size() == 36;
    if (!hyphenated && text.size() != 32) {
        throw FormatError("Uuid: expected 32 hex digits or the 36-character form, got '" +
                          std::string(text) + "'");
    }

    Bytes bytes{};
    size_t nibble = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (hyphenated && (i == 8 || i == 13 || i == 18 || i == 23)) {
            if (text[i] != '-') {
                throw FormatError("Uuid: misplaced separator in '" + std::string(text) + "'");
            }
            continue;
        }
        int v = hex_value(text[i]);
        if (v < 0) {
            throw FormatError("Uuid: invalid hex digit in '" + std::string(text) + "'");
        }
        bytes[nibble / 2] = static_cast<uint8_t>(bytes[nibble / 2] | (v << (nibble % 2 == 0 ? 4 : 0)));
        ++nibble;
    }
    return Uuid(bytes);
}

bool Uuid::is_nil() const noexcept
{
    for (uint8_t b : bytes_) {
        if (b != 0)
            return false;
    }
    return true;
}

std::string Uuid::to_string() const
{
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes_.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(kHexDigits[bytes_[i] >> 4]);
        out.push_back(kHexDigits[bytes_[i] & 0x0F]);
    }
    return out;
}

Uuid UuidGenerator::generate()
{
    auto& rng = infra::thread_rng();
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t p1 = dis(rng);
    uint64_t p2 = dis(rng);

    // Version 4: high nibble of time_hi_and_version.
    p1 = (p1 & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    // Variant 1: top two bits of clock_seq_hi_and_reserved.
    p2 = (p2 & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return Uuid::from_u64_pair(p1, p2);
}

} // namespace tagid::gen
