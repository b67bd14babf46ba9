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
 * @file id.hpp
 * @brief The typed identifier `tagid::Id<T, Raw>`.
 *
 * @details
 * `Id<T, Raw>` holds one raw value and nothing else: `T` is a phantom tag that
 * makes identifiers of different entities distinct types even when their raw
 * representation is the same. There is no implicit conversion between them, no
 * cross-type comparison, and no construction of one from another; `relabel<U>()`
 * is the one explicit, visible conversion.
 *
 * @code
 * struct User  { using id_generator = tagid::gen::CuidGenerator; };
 * struct Order { using id_generator = tagid::gen::CuidGenerator; };
 *
 * auto u = tagid::IdOf<User>::next();
 * std::cout << u;            // User::c0a1b2...
 * // tagid::IdOf<Order> o = u;   does not compile
 * @endcode
 */

#pragma once

#include "tagid/core/entity.hpp"
#include "tagid/core/error.hpp"
#include "tagid/core/label.hpp"
#include "tagid/core/raw_codec.hpp"

#include <cstddef>
#include <exception>
#include <functional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace tagid {

template <typename T, typename Raw = std::string>
class Id {
  public:
    using tag_type = T;
    using raw_type = Raw;

    /// @brief Wraps @p raw as-is. Never fails and performs no validation.
    explicit Id(Raw raw) : raw_(std::move(raw)) {}

    static Id from_raw(Raw raw) { return Id(std::move(raw)); }

    /**
     * @brief Produces a fresh identifier from the generator bound to `T`.
     *
     * `tagid::Error` subclasses thrown by the generator propagate unchanged. Any
     * other `std::exception` is reported as `GenerationFailure` prefixed with the
     * label. Nothing is retried.
     */
    static Id next()
    {
        static_assert(is_entity_v<T>, "Id::next() requires an entity bound to a generator");
        using Generator = typename EntityTraits<T>::generator;
        static_assert(std::is_same_v<typename Generator::value_type, Raw>,
                      "the entity's generator does not produce this raw type");

        try {
            return Id(Generator::generate());
        } catch (const Error&) {
            throw;
        } catch (const std::exception& e) {
            throw GenerationFailure(label() + ": " + e.what());
        }
    }

    /// @brief Borrowed raw value for persistence or comparison.
    const Raw& value() const noexcept { return raw_; }

    /// @brief Releases the raw value.
    Raw into_raw() && { return std::move(raw_); }

    static const std::string& label() { return Label<T>::label(); }

    /// @brief `Label::raw`, or only the raw text when the label is empty.
    std::string to_string() const
    {
        const std::string& l = label();
        if (l.empty()) {
            return raw_string();
        }
        return l + "::" + raw_string();
    }

    /// @brief The raw value's text alone, without the label.
    std::string raw_string() const { return RawCodec<Raw>::to_text(raw_); }

    /// @brief Same raw value, different entity.
    template <typename U>
    Id<U, Raw> relabel() const&
    {
        return Id<U, Raw>(raw_);
    }

    template <typename U>
    Id<U, Raw> relabel() &&
    {
        return Id<U, Raw>(std::move(raw_));
    }

    bool operator==(const Id& o) const { return raw_ == o.raw_; }
    bool operator!=(const Id& o) const { return !(raw_ == o.raw_); }
    bool operator<(const Id& o) const { return raw_ < o.raw_; }
    bool operator>(const Id& o) const { return o.raw_ < raw_; }
    bool operator<=(const Id& o) const { return !(o.raw_ < raw_); }
    bool operator>=(const Id& o) const { return !(raw_ < o.raw_); }

  private:
    Raw raw_;
};

template <typename T, typename Raw>
std::ostream& operator<<(std::ostream& os, const Id<T, Raw>& id)
{
    return os << id.to_string();
}

} // namespace tagid

namespace std {

template <typename T, typename Raw>
struct hash<tagid::Id<T, Raw>> {
    size_t operator()(const tagid::Id<T, Raw>& id) const { return std::hash<Raw>{}(id.value()); }
};

} // namespace std
