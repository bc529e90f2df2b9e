/*
 * schema_loader.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Builds schema descriptors from JSON documents

**************************************************/

#ifndef VIGIL_SCHEMA_SCHEMA_LOADER_HPP
#define VIGIL_SCHEMA_SCHEMA_LOADER_HPP

#include <cstddef>

#include <nlohmann/json.hpp>

#include "vigil/schema/schema.hpp"

namespace vigil::schema {

using json = nlohmann::json;

/**
 * @brief Builds a schema from a JSON descriptor.
 *
 * Each node is classified in this order:
 *  1. `"type": "array"` is an array descriptor (`items`, `minLength`,
 *     `maxLength`, `unique`, `optional`, `nullable`);
 *  2. `"type"` naming a leaf tag is a leaf descriptor (`required`,
 *     `optional`, `nullable`, `default`, `customType`);
 *  3. anything else is an object descriptor whose members are field
 *     schemas.
 *
 * Nothing throws: a node that fits none of these, a member that is not a
 * JSON object, a custom leaf without `customType` or malformed attributes
 * become invalid nodes that report INVALID_SCHEMA when validated.
 *
 * @code
 * auto schema = schemaFromJson(R"({
 *     "name": {"type": "string", "required": true},
 *     "tags": {"type": "array", "items": {"type": "string"}, "unique": true}
 * })"_json);
 * @endcode
 */
[[nodiscard]] auto schemaFromJson(const json& doc, std::size_t maxDepth = 32)
    -> SchemaNode;

}  // namespace vigil::schema

#endif  // VIGIL_SCHEMA_SCHEMA_LOADER_HPP
