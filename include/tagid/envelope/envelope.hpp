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
 * @file envelope.hpp
 * @brief An entity or message travelling together with its `MetaData`.
 *
 * @details
 * The metadata's correlation id is tagged with the content type, so an
 * `Envelope<Order, R>` carries an `Id<Order, R>`. Transformations of the content
 * (`map`, `flat_map`) relabel the metadata to the new content type and keep its
 * id, timestamp and custom entries.
 *
 * @code
 * auto env = tagid::envelope::Envelope<Order, std::string>::from_entity(order);
 * auto summary = std::move(env).map([](Order o) { return Summary{o}; });
 * std::cout << summary; // [Summary::c1... @ 2026-...Z](...)
 * @endcode
 */

#pragma once

#include "tagid/core/label.hpp"
#include "tagid/envelope/metadata.hpp"

#include <cJSON.h>

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace tagid::envelope {

template <typename T, typename Raw>
class Envelope {
  public:
    using content_type = T;
    using metadata_type = MetaData<T, Raw>;

    Envelope(metadata_type metadata, T content)
        : metadata_(std::move(metadata)), content_(std::move(content))
    {
    }

    static Envelope from_parts(metadata_type metadata, T content)
    {
        return Envelope(std::move(metadata), std::move(content));
    }

    /// @brief Wraps an entity, generating its correlation id through the entity contract.
    static Envelope from_entity(T content)
    {
        return Envelope(metadata_type::create(), std::move(content));
    }

    /// @brief Wraps any content, generating the correlation id with @p G.
    template <typename G>
    static Envelope create(T content)
    {
        static_assert(std::is_same_v<typename G::value_type, Raw>,
                      "generator does not produce the envelope's raw type");
        Id<T, Raw> id(G::generate());
        return Envelope(metadata_type(std::move(id), infra::Timestamp::now()), std::move(content));
    }

    const metadata_type& metadata() const noexcept { return metadata_; }
    const T& content() const noexcept { return content_; }
    T& content() noexcept { return content_; }

    const T* operator->() const noexcept { return &content_; }
    T* operator->() noexcept { return &content_; }

    T into_inner() && { return std::move(content_); }

    std::pair<metadata_type, T> into_parts() &&
    {
        return {std::move(metadata_), std::move(content_)};
    }

    /**
     * @brief Replaces the metadata with @p metadata relabeled to `T`.
     * @return The previous metadata.
     */
    template <typename U>
    metadata_type adopt_metadata(const MetaData<U, Raw>& metadata)
    {
        metadata_type old = metadata_;
        metadata_ = metadata.template relabel<T>();
        return old;
    }

    /// @brief Applies @p f to the content, keeping the metadata.
    template <typename F>
    auto map(F&& f) && -> Envelope<std::invoke_result_t<F, T>, Raw>
    {
        using U = std::invoke_result_t<F, T>;
        auto metadata = metadata_.template relabel<U>();
        return Envelope<U, Raw>(std::move(metadata), std::invoke(std::forward<F>(f), std::move(content_)));
    }

    /// @brief Like `map`, but @p f sees the whole envelope.
    template <typename F>
    auto flat_map(F&& f) && -> Envelope<std::invoke_result_t<F, Envelope>, Raw>
    {
        using U = std::invoke_result_t<F, Envelope>;
        auto metadata = metadata_.template relabel<U>();
        return Envelope<U, Raw>(std::move(metadata), std::invoke(std::forward<F>(f), std::move(*this)));
    }

    /**
     * @brief JSON object `{"metadata": {...}, "content": ...}`.
     *
     * @param encode_content Returns a new cJSON node for the content; ownership moves to the result.
     */
    template <typename Encode>
    cJSON* to_json(Encode&& encode_content) const
    {
        JsonPtr root(cJSON_CreateObject());
        cJSON_AddItemToObject(root.get(), "metadata", metadata_.to_json());
        cJSON* content = std::invoke(std::forward<Encode>(encode_content), content_);
        if (content == nullptr) {
            throw FormatError("Envelope: content encoder returned no node");
        }
        cJSON_AddItemToObject(root.get(), "content", content);
        return root.release();
    }

    template <typename Encode>
    std::string to_json_string(Encode&& encode_content) const
    {
        JsonPtr node(to_json(std::forward<Encode>(encode_content)));
        return print_json(node.get());
    }

    /**
     * @param decode_content Turns the `content` node into a `T`; may throw `FormatError`.
     * @throws tagid::FormatError On a missing field or malformed metadata.
     */
    template <typename Decode>
    static Envelope from_json(const cJSON* node, Decode&& decode_content)
    {
        if (!cJSON_IsObject(node)) {
            throw FormatError("Envelope: expected a JSON object");
        }
        const cJSON* meta = cJSON_GetObjectItemCaseSensitive(node, "metadata");
        const cJSON* content = cJSON_GetObjectItemCaseSensitive(node, "content");
        if (meta == nullptr || content == nullptr) {
            throw FormatError("Envelope: missing metadata or content");
        }
        return Envelope(metadata_type::from_json(meta),
                        std::invoke(std::forward<Decode>(decode_content), content));
    }

    template <typename Decode>
    static Envelope from_json_string(std::string_view text, Decode&& decode_content)
    {
        JsonPtr root = parse_json(text);
        return from_json(root.get(), std::forward<Decode>(decode_content));
    }

  private:
    metadata_type metadata_;
    T content_;
};

/// @brief Later metadata, combined content. Only available when `T` supports `+`.
template <typename T, typename Raw, typename = decltype(std::declval<T>() + std::declval<T>())>
Envelope<T, Raw> operator+(const Envelope<T, Raw>& lhs, const Envelope<T, Raw>& rhs)
{
    return Envelope<T, Raw>(lhs.metadata() + rhs.metadata(), lhs.content() + rhs.content());
}

/// @brief An envelope of nothing becomes nothing; otherwise the envelope of the value.
template <typename T, typename Raw>
std::optional<Envelope<T, Raw>> transpose(Envelope<std::optional<T>, Raw> envelope)
{
    auto [metadata, content] = std::move(envelope).into_parts();
    if (!content) {
        return std::nullopt;
    }
    return Envelope<T, Raw>(metadata.template relabel<T>(), std::move(*content));
}

/// @brief `[metadata](content)`.
template <typename T, typename Raw>
std::ostream& operator<<(std::ostream& os, const Envelope<T, Raw>& envelope)
{
    return os << "[" << envelope.metadata() << "](" << envelope.content() << ")";
}

} // namespace tagid::envelope

namespace tagid {

/// @brief An envelope is labeled like its content.
template <typename T, typename Raw>
struct Label<envelope::Envelope<T, Raw>> : Label<T> {};

} // namespace tagid
