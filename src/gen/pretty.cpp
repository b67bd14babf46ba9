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
 * @file pretty.cpp
 * @brief Damm checksum, alphabet codec and the pretty Snowflake conversion.
 */

#include "tagid/gen/pretty.hpp"

#include "tagid/core/error.hpp"
#include "tagid/gen/snowflake.hpp"
#include "tagid/infra/logger.hpp"
#include "tagid/infra/string.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <limits>
#include <memory>
#include <mutex>

namespace tagid::gen {

namespace damm {

namespace {

// Totally anti-symmetric quasigroup of order 10.
constexpr int kMatrix[10][10] = {
    {0, 3, 1, 7, 5, 9, 8, 6, 4, 2}, {7, 0, 9, 2, 1, 5, 4, 8, 6, 3}, {4, 2, 0, 6, 8, 7, 1, 3, 5, 9},
    {1, 7, 5, 0, 9, 8, 3, 4, 2, 6}, {6, 1, 2, 3, 0, 4, 5, 9, 7, 8}, {3, 6, 7, 4, 2, 0, 9, 5, 8, 1},
    {5, 8, 6, 9, 7, 2, 0, 1, 3, 4}, {8, 9, 4, 5, 3, 6, 2, 0, 1, 7}, {9, 4, 3, 8, 6, 1, 7, 2, 0, 5},
    {2, 5, 8, 1, 4, 3, 6, 7, 9, 0},
};

} // namespace

int checksum(std::string_view rep) noexcept
{
    int interim = 0;
    for (char c : rep) {
        if (c >= '0' && c <= '9') {
            interim = kMatrix[interim][c - '0'];
        }
    }
    return interim;
}

std::string encode(std::string_view rep)
{
    std::string out(rep);
    out.push_back(static_cast<char>('0' + checksum(rep)));
    return out;
}

bool is_valid(std::string_view rep) noexcept
{
    return checksum(rep) == 0;
}

std::optional<std::string> decode(std::string_view rep)
{
    if (rep.empty() || !is_valid(rep)) {
        return std::nullopt;
    }
    return std::string(rep.substr(0, rep.size() - 1));
}

} // namespace damm

namespace {

std::string pad_left(std::string part, char zero, size_t width)
{
    if (part.size() < width) {
        part.insert(part.begin(), width - part.size(), zero);
    }
    return part;
}

std::once_flag g_prettifier_once;
std::unique_ptr<IdPrettifier> g_prettifier_owner;
std::atomic<const IdPrettifier*> g_prettifier{nullptr};

} // namespace

const Alphabet& Alphabet::base23()
{
    static const Alphabet alphabet{"ABCDEFGHJKLMNPQRSTUVXYZ"};
    return alphabet;
}

AlphabetCodec::AlphabetCodec(Alphabet alphabet) : alphabet_(std::move(alphabet))
{
    if (alphabet_.base() < 2) {
        throw ConfigError("Pretty: alphabet needs at least two symbols");
    }
    std::string sorted = alphabet_.elements;
    std::sort(sorted.begin(), sorted.end());
    if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
        throw ConfigError("Pretty: alphabet '" + alphabet_.elements + "' repeats a symbol");
    }
}

std::string AlphabetCodec::encode(int64_t number) const
{
    if (number < 0) {
        throw FormatError("Pretty: cannot encode negative value " + std::to_string(number));
    }

    const auto base = static_cast<int64_t>(alphabet_.base());
    std::string out;
    do {
        out.push_back(alphabet_.elements[static_cast<size_t>(number % base)]);
        number /= base;
    } while (number > 0);
    std::reverse(out.begin(), out.end());
    return out;
}

int64_t AlphabetCodec::decode(std::string_view rep) const
{
    if (rep.empty()) {
        throw FormatError("Pretty: empty encoded part");
    }

    const auto base = static_cast<int64_t>(alphabet_.base());
    int64_t result = 0;
    for (char c : rep) {
        size_t pos = alphabet_.elements.find(c);
        if (pos == std::string::npos) {
            throw FormatError("Pretty: symbol '" + std::string(1, c) + "' is not in the alphabet");
        }
        const auto digit = static_cast<int64_t>(pos);
        if (result > (std::numeric_limits<int64_t>::max() - digit) / base) {
            throw FormatError("Pretty: encoded part '" + std::string(rep) + "' overflows");
        }
        result = result * base + digit;
    }
    return result;
}

IdPrettifier::IdPrettifier(Alphabet alphabet) : encoder_(std::move(alphabet))
{
    zero_char_ = encoder_.encode(0).front();

    int64_t largest_part = 1;
    for (size_t i = 0; i < parts_size_; ++i) {
        largest_part *= 10;
    }
    max_encoder_length_ = encoder_.encode(largest_part - 1).size();
}

std::string IdPrettifier::prettify(int64_t id_seed) const
{
    if (id_seed < 0) {
        throw FormatError("Pretty: cannot prettify negative id " + std::to_string(id_seed));
    }

    auto parts = divide(damm::encode(std::to_string(id_seed)));
    if (leading_zeros_) {
        parts = add_leading_zero_parts(std::move(parts));
    }
    return convert_parts(parts);
}

int64_t IdPrettifier::to_id_seed(std::string_view pretty) const
{
    if (pretty.empty()) {
        throw FormatError("Pretty: empty id");
    }

    std::string with_check = decode_with_check_digit(pretty);
    auto digits = damm::decode(with_check);
    if (!digits || digits->empty()) {
        throw FormatError("Pretty: not a valid id '" + std::string(pretty) + "'");
    }
    for (char c : *digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw FormatError("Pretty: not a valid id '" + std::string(pretty) + "'");
        }
    }

    auto value = infra::String::parse_int64(*digits);
    if (!value) {
        throw FormatError("Pretty: id '" + std::string(pretty) + "' is out of range");
    }
    return *value;
}

bool IdPrettifier::is_valid(std::string_view pretty) const
{
    if (pretty.empty()) {
        return false;
    }
    try {
        return damm::is_valid(decode_with_check_digit(pretty));
    } catch (const FormatError&) {
        return false;
    }
}

std::vector<std::string> IdPrettifier::divide(const std::string& rep) const
{
    std::vector<std::string> parts;
    size_t end = rep.size();
    while (end > 0) {
        size_t start = end > parts_size_ ? end - parts_size_ : 0;
        parts.push_back(rep.substr(start, end - start));
        end = start;
    }
    std::reverse(parts.begin(), parts.end());
    return parts;
}

std::vector<std::string> IdPrettifier::add_leading_zero_parts(std::vector<std::string> parts) const
{
    // Twenty digits hold any int64 plus its check digit.
    const size_t max_parts = (20 + parts_size_ - 1) / parts_size_;
    if (parts.size() < max_parts) {
        parts.insert(parts.begin(), max_parts - parts.size(), "0");
    }
    return parts;
}

std::string IdPrettifier::convert_parts(const std::vector<std::string>& parts) const
{
    // The last part always stays numeric: with an even count the odd indices do.
    const bool encode_odd = parts.size() % 2 == 0;

    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        const bool is_odd = i % 2 != 0;
        const bool direct = encode_odd ? is_odd : !is_odd;

        std::string converted;
        if (direct) {
            converted = leading_zeros_ ? pad_left(parts[i], '0', parts_size_) : parts[i];
        } else {
            auto value = infra::String::parse_int64(parts[i]);
            if (!value) {
                throw FormatError("Pretty: part '" + parts[i] + "' is not numeric");
            }
            std::string encoded = encoder_.encode(*value);
            converted = leading_zeros_ ? pad_left(encoded, zero_char_, max_encoder_length_) : encoded;
        }

        if (i > 0) {
            out += delimiter_;
        }
        out += converted;
    }
    return out;
}

std::string IdPrettifier::decode_with_check_digit(std::string_view pretty) const
{
    auto parts = infra::String::split(pretty, delimiter_);
    const bool raw_even = parts.size() % 2 != 0;

    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        const bool is_even = i % 2 == 0;
        const bool keep_raw = raw_even ? is_even : !is_even;
        if (keep_raw) {
            out += parts[i];
        } else {
            out += pad_left(std::to_string(encoder_.decode(parts[i])), '0', parts_size_);
        }
    }
    return out;
}

const IdPrettifier& IdPrettifier::global_initialize(const Alphabet& alphabet)
{
    std::call_once(g_prettifier_once, [&] {
        g_prettifier_owner = std::make_unique<IdPrettifier>(alphabet);
        g_prettifier.store(g_prettifier_owner.get(), std::memory_order_release);
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Pretty: prettifier initialized with alphabet " + alphabet.elements);
    });
    return *g_prettifier.load(std::memory_order_acquire);
}

const IdPrettifier& IdPrettifier::summon()
{
    const IdPrettifier* prettifier = g_prettifier.load(std::memory_order_acquire);
    if (prettifier != nullptr) {
        return *prettifier;
    }
    return global_initialize(Alphabet::base23());
}

PrettySnowflakeId PrettySnowflakeId::from_snowflake(int64_t snowflake)
{
    return PrettySnowflakeId(IdPrettifier::summon().prettify(snowflake));
}

PrettySnowflakeId PrettySnowflakeId::parse(std::string_view text)
{
    const IdPrettifier& prettifier = IdPrettifier::summon();
    return PrettySnowflakeId(prettifier.prettify(prettifier.to_id_seed(text)));
}

int64_t PrettySnowflakeId::to_snowflake() const
{
    return IdPrettifier::summon().to_id_seed(text_);
}

PrettySnowflakeId PrettySnowflakeGenerator::generate()
{
    return PrettySnowflakeId::from_snowflake(SnowflakeGenerator::generate());
}

} // namespace tagid::gen
