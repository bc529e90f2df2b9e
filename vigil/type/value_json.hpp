/*
 * value_json.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Conversion between nlohmann::json and Value

**************************************************/

#ifndef VIGIL_TYPE_VALUE_JSON_HPP
#define VIGIL_TYPE_VALUE_JSON_HPP

#include <cstddef>

#include <nlohmann/json.hpp>

#include "vigil/type/value.hpp"

namespace vigil::type {

using json = nlohmann::json;

/// Nesting limit applied when converting untrusted JSON documents.
inline constexpr std::size_t K_DEFAULT_JSON_DEPTH = 64;

/**
 * @brief Builds a Value from a JSON document.
 *
 * Objects take the member order of the document, numbers become doubles and a JSON null
 * becomes a null Value. A document nested deeper than @p maxDepth throws
 * ValueTypeError.
 */
[[nodiscard]] auto fromJson(const json& doc,
                            std::size_t maxDepth = K_DEFAULT_JSON_DEPTH)
    -> Value;

/**
 * @brief Exports a Value as JSON.
 *
 * JSON-native kinds map one to one. Undefined members are omitted from
 * objects and become null inside arrays. Dates export as epoch milliseconds,
 * URLs as their href, sequence kinds as arrays and record kinds as objects
 * tagged with a "$kind" member. Non-finite numbers export as null.
 */
[[nodiscard]] auto toJson(const Value& value,
                          std::size_t maxDepth = K_DEFAULT_JSON_DEPTH) -> json;

}  // namespace vigil::type

#endif  // VIGIL_TYPE_VALUE_JSON_HPP
