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
 * @file codec.hpp
 * @brief Identifier-level parsing and JSON conversion.
 *
 * @details
 * An identifier serializes exactly as its raw value: no label, no wrapper object.
 * The target identifier type is always named by the caller, so decoding an
 * `Order` id where a `User` id is expected is a compile error rather than a
 * runtime surprise.
 *
 * @code
 * std::string json = tagid::to_json_string(user_id);            // "\"c0a1...\""
 * auto back = tagid::from_json_string<tagid::IdOf<User>>(json);
 * @endcode
 */

#pragma once

#include "tagid/core/id.hpp"
#include "tagid/core/raw_codec.hpp"

#include <string>
#include <string_view>

namespace tagid {

/// @brief New cJSON node holding the raw value. Caller owns it.
template <typename T, typename Raw>
cJSON* to_json(const Id<T, Raw>& id)
{
    return RawCodec<Raw>::to_json(id.value());
}

template <typename T, typename Raw>
std::string to_json_string(const Id<T, Raw>& id)
{
    JsonPtr node(to_json(id));
    return print_json(node.get());
}

/// @throws tagid::FormatError If @p node is not a valid raw value.
template <typename IdT>
IdT from_json(const cJSON* node)
{
    if (node == nullptr) {
        throw FormatError("Json: missing identifier");
    }
    return IdT::from_raw(RawCodec<typename IdT::raw_type>::from_json(node));
}

/// @throws tagid::FormatError On malformed JSON or a malformed raw value.
template <typename IdT>
IdT from_json_string(std::string_view text)
{
    JsonPtr root = parse_json(text);
    return from_json<IdT>(root.get());
}

/// @brief Parses the raw text form (as printed by `raw_string()`).
template <typename IdT>
IdT parse_raw(std::string_view text)
{
    return IdT::from_raw(RawCodec<typename IdT::raw_type>::from_text(text));
}

} // namespace tagid
