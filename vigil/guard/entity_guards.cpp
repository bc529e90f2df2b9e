/*
 * entity_guards.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Guards for the domain records crossing the trust boundary

**************************************************/

#include "entity_guards.hpp"

#include <algorithm>
#include <array>
#include <string_view>

namespace vigil::guard {

namespace {
constexpr std::array<std::string_view, 5> K_EXECUTION_STATUSES = {
    "pending", "running", "completed", "failed", "cancelled"};
constexpr std::array<std::string_view, 4> K_NOTIFICATION_TYPES = {
    "info", "success", "warning", "error"};

// Absent or undefined fields pass; anything else must satisfy the guard.
template <typename Guard>
auto optionalField(const Value& value, std::string_view key, Guard guard)
    -> bool {
    const Value* field = value.find(key);
    return field == nullptr || field->isUndefined() || guard(*field);
}

template <std::size_t N>
auto isOneOf(const Value& value,
             const std::array<std::string_view, N>& choices) -> bool {
    if (!value.isString()) {
        return false;
    }
    const auto& str = value.asString();
    return std::find(choices.begin(), choices.end(), str) != choices.end();
}

auto isIdentifier(const Value& value) -> bool {
    return isNonEmptyString(value) || isInteger(value);
}

auto isTimestamp(const Value& value) -> bool {
    return isDate(value) || isDateString(value);
}
}  // namespace

auto isUser(const Value& value) -> bool {
    return isPlainObject(value) && isIdentifier(value.get("id")) &&
           isNonEmptyString(value.get("name")) &&
           isEmail(value.get("email")) &&
           optionalField(value, "role", isString) &&
           optionalField(value, "active", isBoolean) &&
           optionalField(value, "createdAt", isTimestamp);
}

auto isAddress(const Value& value) -> bool {
    return isPlainObject(value) && isNonEmptyString(value.get("street")) &&
           isNonEmptyString(value.get("city")) &&
           isNonEmptyString(value.get("state")) &&
           isCep(value.get("zipCode")) &&
           optionalField(value, "number",
                         [](const Value& number) {
                             return isString(number) || isInteger(number);
                         }) &&
           optionalField(value, "complement", isString);
}

auto isApiResponse(const Value& value) -> bool {
    if (!isPlainObject(value) || !isBoolean(value.get("success"))) {
        return false;
    }
    if (!optionalField(value, "error", isString) ||
        !optionalField(value, "message", isString)) {
        return false;
    }
    if (!value.get("success").asBool()) {
        return isString(value.get("error")) || isString(value.get("message"));
    }
    return true;
}

auto isPaginatedResponse(const Value& value) -> bool {
    if (!isPlainObject(value) || !isArray(value.get("items"))) {
        return false;
    }
    auto total = value.get("total");
    auto page = value.get("page");
    auto pageSize = value.get("pageSize");
    return isInteger(total) && total.asNumber() >= 0 && isInteger(page) &&
           page.asNumber() >= 1 && isInteger(pageSize) &&
           pageSize.asNumber() >= 1;
}

auto isExecution(const Value& value) -> bool {
    return isPlainObject(value) && isIdentifier(value.get("id")) &&
           isOneOf(value.get("status"), K_EXECUTION_STATUSES) &&
           isTimestamp(value.get("startedAt")) &&
           optionalField(value, "finishedAt", isTimestamp) &&
           optionalField(value, "progress", [](const Value& progress) {
               return isFiniteNumber(progress) && progress.asNumber() >= 0 &&
                      progress.asNumber() <= 100;
           });
}

auto isNotification(const Value& value) -> bool {
    return isPlainObject(value) && isIdentifier(value.get("id")) &&
           isOneOf(value.get("type"), K_NOTIFICATION_TYPES) &&
           isNonEmptyString(value.get("title")) &&
           isString(value.get("message")) && isBoolean(value.get("read")) &&
           optionalField(value, "createdAt", isTimestamp);
}

auto isCredential(const Value& value) -> bool {
    return isPlainObject(value) && isIdentifier(value.get("id")) &&
           isNonEmptyString(value.get("name")) &&
           isNonEmptyString(value.get("type")) &&
           optionalField(value, "createdAt", isTimestamp) &&
           optionalField(value, "expiresAt", isTimestamp);
}

}  // namespace vigil::guard
