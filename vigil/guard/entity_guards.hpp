/*
 * entity_guards.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Guards for the domain records crossing the trust boundary

**************************************************/

#ifndef VIGIL_GUARD_ENTITY_GUARDS_HPP
#define VIGIL_GUARD_ENTITY_GUARDS_HPP

#include <concepts>
#include <utility>

#include "vigil/guard/type_guards.hpp"

namespace vigil::guard {

/**
 * @brief `{id, name, email, role?, active?, createdAt?}`.
 *
 * `id` is a non-empty string or an integer, `name` a non-empty string and
 * `email` a valid address. `createdAt` is a date or a date string.
 */
[[nodiscard]] auto isUser(const Value& value) -> bool;

/**
 * @brief `{street, city, state, zipCode, number?, complement?}` with a valid
 * CEP as zip code.
 */
[[nodiscard]] auto isAddress(const Value& value) -> bool;

/**
 * @brief `{success, data?, error?, message?}`. A failed response carries an
 * `error` or a `message`.
 */
[[nodiscard]] auto isApiResponse(const Value& value) -> bool;

/**
 * @brief An API response whose `data`, when present, satisfies @p dataGuard.
 */
template <typename Guard>
    requires std::predicate<Guard&, const Value&>
[[nodiscard]] auto isApiResponse(const Value& value, Guard&& dataGuard)
    -> bool {
    if (!isApiResponse(value)) {
        return false;
    }
    const Value* data = value.find("data");
    return data == nullptr || data->isUndefined() || dataGuard(*data);
}

/**
 * @brief `{items, total, page, pageSize}` with a non-negative integer total
 * and positive integer page and page size.
 */
[[nodiscard]] auto isPaginatedResponse(const Value& value) -> bool;

/// A paginated response whose items all satisfy @p itemGuard.
template <typename Guard>
    requires std::predicate<Guard&, const Value&>
[[nodiscard]] auto isPaginatedResponse(const Value& value, Guard&& itemGuard)
    -> bool {
    return isPaginatedResponse(value) &&
           isArrayOf(value.get("items"), std::forward<Guard>(itemGuard));
}

/**
 * @brief `{id, status, startedAt, finishedAt?, progress?}`.
 *
 * `status` is one of pending, running, completed, failed or cancelled, and
 * `progress` a number between 0 and 100.
 */
[[nodiscard]] auto isExecution(const Value& value) -> bool;

/**
 * @brief `{id, type, title, message, read, createdAt?}` where `type` is
 * info, success, warning or error.
 */
[[nodiscard]] auto isNotification(const Value& value) -> bool;

/**
 * @brief `{id, name, type, createdAt?, expiresAt?}` describing a stored
 * credential.
 */
[[nodiscard]] auto isCredential(const Value& value) -> bool;

}  // namespace vigil::guard

#endif  // VIGIL_GUARD_ENTITY_GUARDS_HPP
