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
 * @file label.hpp
 * @brief Human-readable, per-type label used when displaying identifiers.
 *
 * @details
 * Every tag type `T` has exactly one label, resolved in this order:
 *
 * 1. A full specialization of `tagid::Label<T>` (the route for third-party types).
 * 2. A static member `T::id_label` convertible to `std::string_view`. An empty
 *    string means "no label": identifiers then display as the bare raw value.
 * 3. The type's own name, demangled, with every namespace qualifier removed,
 *    including inside template arguments (`app::Box<app::Order>` becomes `Box<Order>`).
 *
 * The label is computed once per process and cached; it never takes part in
 * equality, ordering or hashing of identifiers.
 *
 * @code
 * struct Order { static constexpr const char* id_label = "ord"; };
 * tagid::label_of<Order>(); // "ord"
 * @endcode
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>

namespace tagid {

namespace detail {

/// @brief Demangles an ABI type name; returns the input unchanged if that fails.
std::string demangle(const char* mangled);

/**
 * @brief Removes namespace and enclosing-scope qualifiers from a demangled name.
 *
 * Also drops the space the demangler puts after each `,` and before each `>`.
 */
std::string short_type_name(std::string_view demangled);

template <typename T, typename = void>
struct has_id_label : std::false_type {};

template <typename T>
struct has_id_label<T, std::void_t<decltype(T::id_label)>>
    : std::is_convertible<decltype(T::id_label), std::string_view> {};

template <typename T>
std::string derive_label()
{
    if constexpr (has_id_label<T>::value) {
        return std::string(std::string_view(T::id_label));
    } else {
        return short_type_name(demangle(typeid(T).name()));
    }
}

} // namespace detail

/**
 * @struct Label
 * @brief The label contract. Specialize it to label a type you cannot modify.
 */
template <typename T>
struct Label {
    static const std::string& label()
    {
        static const std::string value = detail::derive_label<T>();
        return value;
    }
};

/// @brief `void` is the "unlabeled" tag.
template <>
struct Label<void> {
    static const std::string& label()
    {
        static const std::string value;
        return value;
    }
};

template <>
struct Label<std::string> {
    static const std::string& label()
    {
        static const std::string value = "string";
        return value;
    }
};

/// @brief An optional entity is labeled like the entity itself.
template <typename T>
struct Label<std::optional<T>> : Label<T> {};

template <typename T>
const std::string& label_of()
{
    return Label<T>::label();
}

} // namespace tagid
