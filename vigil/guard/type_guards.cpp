/*
 * type_guards.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Boolean narrowing predicates over dynamic values

**************************************************/

#include "type_guards.hpp"

#include <cmath>

#include "vigil/schema/builtin.hpp"
#include "vigil/utils/string.hpp"

namespace vigil::guard {

using type::ValueKind;

namespace {
template <typename Check>
auto stringMatches(const Value& value, Check check) -> bool {
    return value.isString() && check(value.asString());
}
}  // namespace

auto isString(const Value& value) noexcept -> bool { return value.isString(); }

auto isNumber(const Value& value) noexcept -> bool {
    return value.isNumber() && !std::isnan(value.asNumber());
}

auto isFiniteNumber(const Value& value) noexcept -> bool {
    return value.isNumber() && std::isfinite(value.asNumber());
}

auto isInteger(const Value& value) noexcept -> bool {
    if (!isFiniteNumber(value)) {
        return false;
    }
    double n = value.asNumber();
    return n == std::trunc(n);
}

auto isBoolean(const Value& value) noexcept -> bool { return value.isBool(); }

auto isNull(const Value& value) noexcept -> bool { return value.isNull(); }

auto isUndefined(const Value& value) noexcept -> bool {
    return value.isUndefined();
}

auto isNullish(const Value& value) noexcept -> bool {
    return value.isNullish();
}

auto isPlainObject(const Value& value) noexcept -> bool {
    return value.isObject();
}

auto isArray(const Value& value) noexcept -> bool { return value.isArray(); }

auto isFunction(const Value& value) noexcept -> bool {
    return value.is(ValueKind::Function);
}

auto isDate(const Value& value) noexcept -> bool {
    return value.is(ValueKind::Date) && !std::isnan(value.epochMillis());
}

auto isRegExp(const Value& value) noexcept -> bool {
    return value.is(ValueKind::RegExp);
}

auto isPromise(const Value& value) noexcept -> bool {
    return value.is(ValueKind::Promise);
}

auto isError(const Value& value) noexcept -> bool {
    return value.is(ValueKind::Error);
}

auto isMap(const Value& value) noexcept -> bool {
    return value.is(ValueKind::Map);
}

auto isSet(const Value& value) noexcept -> bool {
    return value.is(ValueKind::Set);
}

auto isWeakMap(const Value& value) noexcept -> bool {
    return value.is(ValueKind::WeakMap);
}

auto isWeakSet(const Value& value) noexcept -> bool {
    return value.is(ValueKind::WeakSet);
}

auto isArrayBuffer(const Value& value) noexcept -> bool {
    return value.is(ValueKind::ArrayBuffer);
}

auto isTypedArray(const Value& value) noexcept -> bool {
    return value.is(ValueKind::TypedArray);
}

auto isDataView(const Value& value) noexcept -> bool {
    return value.is(ValueKind::DataView);
}

auto isUrl(const Value& value) noexcept -> bool {
    return value.is(ValueKind::Url);
}

auto isFormData(const Value& value) noexcept -> bool {
    return value.is(ValueKind::FormData);
}

auto isFile(const Value& value) noexcept -> bool {
    return value.is(ValueKind::File);
}

auto isBlob(const Value& value) noexcept -> bool {
    return value.is(ValueKind::Blob) || value.is(ValueKind::File);
}

auto isEvent(const Value& value) noexcept -> bool {
    return value.is(ValueKind::Event);
}

auto isElement(const Value& value) noexcept -> bool {
    return value.is(ValueKind::Element);
}

auto isNode(const Value& value) noexcept -> bool {
    return value.is(ValueKind::Node) || value.is(ValueKind::Element) ||
           value.is(ValueKind::Document);
}

auto isNodeList(const Value& value) noexcept -> bool {
    return value.is(ValueKind::NodeList);
}

auto isHtmlCollection(const Value& value) noexcept -> bool {
    return value.is(ValueKind::HTMLCollection);
}

auto isWindow(const Value& value) noexcept -> bool {
    return value.is(ValueKind::Window);
}

auto isDocument(const Value& value) noexcept -> bool {
    return value.is(ValueKind::Document);
}

auto isEmail(const Value& value) -> bool {
    return stringMatches(value, schema::builtin::isEmail);
}

auto isUrlString(const Value& value) -> bool {
    return stringMatches(value, schema::builtin::isUrl);
}

auto isUuid(const Value& value) -> bool {
    return stringMatches(value, schema::builtin::isUuid);
}

auto isCpf(const Value& value) -> bool {
    return stringMatches(value, schema::builtin::isCpf);
}

auto isCnpj(const Value& value) -> bool {
    return stringMatches(value, schema::builtin::isCnpj);
}

auto isPhone(const Value& value) -> bool {
    return stringMatches(value, schema::builtin::isPhone);
}

auto isCep(const Value& value) -> bool {
    return stringMatches(value, schema::builtin::isCep);
}

auto isDateString(const Value& value) -> bool {
    return stringMatches(value, schema::builtin::isDate);
}

auto isNonEmptyString(const Value& value) -> bool {
    return stringMatches(value, [](std::string_view str) {
        return !utils::trim(str).empty();
    });
}

auto hasKeys(const Value& value, std::initializer_list<std::string_view> keys)
    -> bool {
    return value.isObject() &&
           std::all_of(keys.begin(), keys.end(), [&value](std::string_view key) {
               return value.contains(key);
           });
}

}  // namespace vigil::guard
