/*
 * type_tag.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Closed set of leaf type tags and their runtime predicates

**************************************************/

#ifndef VIGIL_SCHEMA_TYPE_TAG_HPP
#define VIGIL_SCHEMA_TYPE_TAG_HPP

#include <cstdint>
#include <optional>
#include <string_view>

#include "vigil/type/value.hpp"

namespace vigil::schema {

/**
 * @brief Type a leaf descriptor expects.
 *
 * Every tag but Custom maps to a fixed predicate over type::ValueKind.
 * Custom defers to a predicate registered under the leaf's customType.
 */
enum class TypeTag : std::uint8_t {
    String,
    Number,
    Boolean,
    Object,
    Array,
    Null,
    Undefined,
    Function,
    Date,
    RegExp,
    Promise,
    Error,
    Map,
    Set,
    WeakMap,
    WeakSet,
    ArrayBuffer,
    TypedArray,
    DataView,
    Url,
    FormData,
    File,
    Blob,
    Event,
    Element,
    Node,
    NodeList,
    HTMLCollection,
    Window,
    Document,
    Custom
};

/**
 * @brief Lower-case name of a tag, as written in JSON schema descriptors.
 */
[[nodiscard]] auto tagName(TypeTag tag) noexcept -> std::string_view;

/**
 * @brief Parses a tag name.
 * @return The tag, or std::nullopt when the name is not a leaf tag
 */
[[nodiscard]] auto parseTypeTag(std::string_view name) noexcept
    -> std::optional<TypeTag>;

/**
 * @brief Checks a value against a built-in tag.
 *
 * Number and Date reject NaN. Object accepts any object-like value (every
 * kind except the primitives, arrays and functions). Blob accepts files and
 * Node accepts elements and documents. Custom always returns false here;
 * custom tags are resolved through the registries.
 */
[[nodiscard]] auto matchesTag(TypeTag tag, const type::Value& value) noexcept
    -> bool;

}  // namespace vigil::schema

#endif  // VIGIL_SCHEMA_TYPE_TAG_HPP
