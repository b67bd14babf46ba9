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
 * @file metadata.hpp
 * @brief Audit data carried alongside a message or entity.
 *
 * @details
 * `MetaData<T, Raw>` bundles a correlation identifier, the instant the item was
 * received or created, and free-form string attributes. Two metadata values are
 * equal when their correlation ids are; they are ordered by timestamp.
 *
 * Flat-map form (for headers, queue attributes, and similar string maps):
 *
 * | Key | Value |
 * |---|---|
 * | `correlation_id` | raw id text |
 * | `recv_timestamp` | `YYYY-MM-DDTHH:MM:SS.mmmZ` |
 * | anything else | kept in `custom()` |
 *
 * JSON form: `{"correlation_id": <raw>, "recv_timestamp": "<iso>", "custom": {...}}`.
 */

#pragma once

#include "tagid/core/codec.hpp"
#include "tagid/core/id.hpp"
#include "tagid/infra/timestamp.hpp"

#include <cJSON.h>

#include <cstddef>
#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace tagid::envelope {

inline constexpr const char* kCorrelationIdKey = "correlation_id";
inline constexpr const char* kRecvTimestampKey = "recv_timestamp";
inline constexpr const char* kCustomKey = "custom";

using CustomMap = std::map<std::string, std::string>;

template <typename T, typename Raw>
class MetaData {
  public:
    using id_type = Id<T, Raw>;

    MetaData(id_type correlation_id, infra::Timestamp recv_timestamp, CustomMap custom = {})
        : correlation_id_(std::move(correlation_id)), recv_timestamp_(recv_timestamp),
          custom_(std::move(custom))
    {
    }

    static MetaData from_parts(id_type correlation_id, infra::Timestamp recv_timestamp,
                               CustomMap custom = {})
    {
        return MetaData(std::move(correlation_id), recv_timestamp, std::move(custom));
    }

    /**
     * @brief Generates a correlation id for entity `T` and stamps the current time.
     * @throws tagid::GenerationFailure If the entity's generator fails.
     */
    static MetaData create()
    {
        id_type id = id_type::next();
        return MetaData(std::move(id), infra::Timestamp::now());
    }

    const id_type& correlation_id() const noexcept { return correlation_id_; }
    infra::Timestamp recv_timestamp() const noexcept { return recv_timestamp_; }
    const CustomMap& custom() const noexcept { return custom_; }

    MetaData with_recv_timestamp(infra::Timestamp ts) const
    {
        MetaData copy = *this;
        copy.recv_timestamp_ = ts;
        return copy;
    }

    MetaData with_custom(std::string key, std::string value) const
    {
        MetaData copy = *this;
        copy.custom_[std::move(key)] = std::move(value);
        return copy;
    }

    template <typename U>
    MetaData<U, Raw> relabel() const
    {
        return MetaData<U, Raw>(correlation_id_.template relabel<U>(), recv_timestamp_, custom_);
    }

    /// @brief `Label::raw @ timestamp`, followed by `{k=v, ...}` when custom entries exist.
    std::string to_string() const
    {
        std::string out = correlation_id_.to_string() + " @ " + recv_timestamp_.to_iso();
        if (!custom_.empty()) {
            out += " {";
            bool first = true;
            for (const auto& [key, value] : custom_) {
                if (!first) {
                    out += ", ";
                }
                out += key + "=" + value;
                first = false;
            }
            out += "}";
        }
        return out;
    }

    /// @brief Flat map with the two reserved keys plus every custom entry.
    CustomMap to_map() const
    {
        CustomMap out = custom_;
        out[kCorrelationIdKey] = correlation_id_.raw_string();
        out[kRecvTimestampKey] = recv_timestamp_.to_iso();
        return out;
    }

    /**
     * @brief New JSON object. Caller owns it.
     * @throws tagid::FormatError If the id or a custom entry holds a NUL byte.
     */
    cJSON* to_json() const
    {
        JsonPtr root(cJSON_CreateObject());
        cJSON_AddItemToObject(root.get(), kCorrelationIdKey, tagid::to_json(correlation_id_));
        cJSON_AddStringToObject(root.get(), kRecvTimestampKey, recv_timestamp_.to_iso().c_str());
        cJSON* custom = cJSON_CreateObject();
        cJSON_AddItemToObject(root.get(), kCustomKey, custom);
        for (const auto& [key, value] : custom_) {
            cJSON_AddStringToObject(custom, checked_json_text(key, "custom key").c_str(),
                                    checked_json_text(value, "custom value").c_str());
        }
        return root.release();
    }

    std::string to_json_string() const
    {
        JsonPtr node(to_json());
        return print_json(node.get());
    }

    /**
     * @brief Reads the JSON form. `custom` may be absent.
     * @throws tagid::FormatError On a missing or malformed field.
     */
    static MetaData from_json(const cJSON* node)
    {
        if (!cJSON_IsObject(node)) {
            throw FormatError("MetaData: expected a JSON object");
        }

        const cJSON* id_node = cJSON_GetObjectItemCaseSensitive(node, kCorrelationIdKey);
        if (id_node == nullptr) {
            throw FormatError("MetaData: missing correlation_id");
        }
        id_type id = tagid::from_json<id_type>(id_node);

        const cJSON* ts_node = cJSON_GetObjectItemCaseSensitive(node, kRecvTimestampKey);
        if (!cJSON_IsString(ts_node) || ts_node->valuestring == nullptr) {
            throw FormatError("MetaData: missing or non-string recv_timestamp");
        }
        infra::Timestamp ts = infra::Timestamp::parse(ts_node->valuestring);

        CustomMap custom;
        const cJSON* custom_node = cJSON_GetObjectItemCaseSensitive(node, kCustomKey);
        if (custom_node != nullptr && !cJSON_IsNull(custom_node)) {
            if (!cJSON_IsObject(custom_node)) {
                throw FormatError("MetaData: custom must be an object");
            }
            const cJSON* item = nullptr;
            cJSON_ArrayForEach(item, custom_node)
            {
                if (!cJSON_IsString(item) || item->valuestring == nullptr) {
                    throw FormatError("MetaData: custom value '" + std::string(item->string) +
                                      "' is not a string");
                }
                custom[item->string] = item->valuestring;
            }
        }

        return MetaData(std::move(id), ts, std::move(custom));
    }

    static MetaData from_json_string(std::string_view text)
    {
        JsonPtr root = parse_json(text);
        return from_json(root.get());
    }

    bool operator==(const MetaData& o) const { return correlation_id_ == o.correlation_id_; }
    bool operator!=(const MetaData& o) const { return !(*this == o); }
    bool operator<(const MetaData& o) const { return recv_timestamp_ < o.recv_timestamp_; }
    bool operator>(const MetaData& o) const { return o < *this; }
    bool operator<=(const MetaData& o) const { return !(o < *this); }
    bool operator>=(const MetaData& o) const { return !(*this < o); }

    /// @brief The later of the two; the left operand wins a tie.
    friend MetaData operator+(const MetaData& lhs, const MetaData& rhs)
    {
        return lhs < rhs ? rhs : lhs;
    }

  private:
    id_type correlation_id_;
    infra::Timestamp recv_timestamp_;
    CustomMap custom_;
};

template <typename T, typename Raw>
std::ostream& operator<<(std::ostream& os, const MetaData<T, Raw>& meta)
{
    return os << meta.to_string();
}

/**
 * @brief Rebuilds metadata from its flat-map form.
 *
 * A missing `correlation_id` is freshly generated with @p G; a missing
 * `recv_timestamp` becomes now. Present but malformed values are rejected.
 *
 * @tparam G Generator whose raw type the correlation id uses.
 * @tparam T Tag of the resulting id; unlabeled by default.
 * @throws tagid::FormatError On a malformed id or timestamp.
 */
template <typename G, typename T = void>
MetaData<T, typename G::value_type> from_map(CustomMap map)
{
    using Raw = typename G::value_type;
    static_assert(is_generator_v<G>, "from_map requires a generator");

    auto id_it = map.find(kCorrelationIdKey);
    Raw raw = id_it != map.end() ? RawCodec<Raw>::from_text(id_it->second) : G::generate();
    if (id_it != map.end()) {
        map.erase(id_it);
    }

    auto ts_it = map.find(kRecvTimestampKey);
    infra::Timestamp ts =
        ts_it != map.end() ? infra::Timestamp::parse(ts_it->second) : infra::Timestamp::now();
    if (ts_it != map.end()) {
        map.erase(ts_it);
    }

    return MetaData<T, Raw>(Id<T, Raw>(std::move(raw)), ts, std::move(map));
}

} // namespace tagid::envelope

namespace std {

template <typename T, typename Raw>
struct hash<tagid::envelope::MetaData<T, Raw>> {
    size_t operator()(const tagid::envelope::MetaData<T, Raw>& meta) const
    {
        return std::hash<tagid::Id<T, Raw>>{}(meta.correlation_id());
    }
};

} // namespace std
