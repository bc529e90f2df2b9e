/*
 * type_guards.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Boolean narrowing predicates over dynamic values

**************************************************/

#ifndef VIGIL_GUARD_TYPE_GUARDS_HPP
#define VIGIL_GUARD_TYPE_GUARDS_HPP

#include <algorithm>
#include <concepts>
#include <initializer_list>
#include <string_view>

#include "vigil/type/value.hpp"

namespace vigil::guard {

using type::Value;

// Primitives

[[nodiscard]] auto isString(const Value& value) noexcept -> bool;
/// A number that is not NaN.
[[nodiscard]] auto isNumber(const Value& value) noexcept -> bool;
[[nodiscard]] auto isFiniteNumber(const Value& value) noexcept -> bool;
[[nodiscard]] auto isInteger(const Value& value) noexcept -> bool;
[[nodiscard]] auto isBoolean(const Value& value) noexcept -> bool;
[[nodiscard]] auto isNull(const Value& value) noexcept -> bool;
[[nodiscard]] auto isUndefined(const Value& value) noexcept -> bool;
[[nodiscard]] auto isNullish(const Value& value) noexcept -> bool;
/// A plain keyed object, not an array or a special runtime object.
[[nodiscard]] auto isPlainObject(const Value& value) noexcept -> bool;
[[nodiscard]] auto isArray(const Value& value) noexcept -> bool;
[[nodiscard]] auto isFunction(const Value& value) noexcept -> bool;

// Runtime objects

/// A date holding a valid time.
[[nodiscard]] auto isDate(const Value& value) noexcept -> bool;
[[nodiscard]] auto isRegExp(const Value& value) noexcept -> bool;
[[nodiscard]] auto isPromise(const Value& value) noexcept -> bool;
[[nodiscard]] auto isError(const Value& value) noexcept -> bool;
[[nodiscard]] auto isMap(const Value& value) noexcept -> bool;
[[nodiscard]] auto isSet(const Value& value) noexcept -> bool;
[[nodiscard]] auto isWeakMap(const Value& value) noexcept -> bool;
[[nodiscard]] auto isWeakSet(const Value& value) noexcept -> bool;
[[nodiscard]] auto isArrayBuffer(const Value& value) noexcept -> bool;
[[nodiscard]] auto isTypedArray(const Value& value) noexcept -> bool;
[[nodiscard]] auto isDataView(const Value& value) noexcept -> bool;
[[nodiscard]] auto isUrl(const Value& value) noexcept -> bool;
[[nodiscard]] auto isFormData(const Value& value) noexcept -> bool;
[[nodiscard]] auto isFile(const Value& value) noexcept -> bool;
/// Files are blobs too.
[[nodiscard]] auto isBlob(const Value& value) noexcept -> bool;
[[nodiscard]] auto isEvent(const Value& value) noexcept -> bool;
[[nodiscard]] auto isElement(const Value& value) noexcept -> bool;
/// Elements and documents are nodes too.
[[nodiscard]] auto isNode(const Value& value) noexcept -> bool;
[[nodiscard]] auto isNodeList(const Value& value) noexcept -> bool;
[[nodiscard]] auto isHtmlCollection(const Value& value) noexcept -> bool;
[[nodiscard]] auto isWindow(const Value& value) noexcept -> bool;
[[nodiscard]] auto isDocument(const Value& value) noexcept -> bool;

// String formats; false for anything that is not a string.

[[nodiscard]] auto isEmail(const Value& value) -> bool;
[[nodiscard]] auto isUrlString(const Value& value) -> bool;
[[nodiscard]] auto isUuid(const Value& value) -> bool;
[[nodiscard]] auto isCpf(const Value& value) -> bool;
[[nodiscard]] auto isCnpj(const Value& value) -> bool;
[[nodiscard]] auto isPhone(const Value& value) -> bool;
[[nodiscard]] auto isCep(const Value& value) -> bool;
[[nodiscard]] auto isDateString(const Value& value) -> bool;
/// A string with at least one non-whitespace character.
[[nodiscard]] auto isNonEmptyString(const Value& value) -> bool;

/**
 * @brief An array whose every element satisfies @p guard.
 *
 * @code
 * guard::isArrayOf(tags, guard::isNonEmptyString);
 * @endcode
 */
template <typename Guard>
    requires std::predicate<Guard&, const Value&>
[[nodiscard]] auto isArrayOf(const Value& value, Guard&& guard) -> bool {
    if (!value.isArray()) {
        return false;
    }
    const auto& items = value.asArray();
    return std::all_of(items.begin(), items.end(),
                       [&guard](const Value& item) { return guard(item); });
}

/**
 * @brief A plain object holding every key in @p keys.
 */
[[nodiscard]] auto hasKeys(const Value& value,
                           std::initializer_list<std::string_view> keys)
    -> bool;

}  // namespace vigil::guard

#endif  // VIGIL_GUARD_TYPE_GUARDS_HPP
