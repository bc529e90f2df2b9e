/*
 * schema_loader.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Builds schema descriptors from JSON documents

**************************************************/

#include "schema_loader.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "vigil/error/exception.hpp"
#include "vigil/type/value_json.hpp"

namespace vigil::schema {

namespace {
auto invalid(std::string reason) -> SchemaNode {
    spdlog::warn("Invalid schema node: {}", reason);
    return Schema::invalid(std::move(reason));
}

/// Reads an optional boolean attribute; a wrong type yields its reason.
auto readFlag(const json& doc, const char* key, bool& out)
    -> std::optional<std::string> {
    auto it = doc.find(key);
    if (it == doc.end()) {
        return std::nullopt;
    }
    if (!it->is_boolean()) {
        return fmt::format("'{}' must be a boolean", key);
    }
    out = it->get<bool>();
    return std::nullopt;
}

auto readLength(const json& doc, const char* key,
                std::optional<std::size_t>& out) -> std::optional<std::string> {
    auto it = doc.find(key);
    if (it == doc.end()) {
        return std::nullopt;
    }
    if (!it->is_number_integer() || it->get<std::int64_t>() < 0) {
        return fmt::format("'{}' must be a non-negative integer", key);
    }
    out = it->get<std::size_t>();
    return std::nullopt;
}

auto load(const json& doc, std::size_t depth, std::size_t maxDepth)
    -> SchemaNode;

auto loadArray(const json& doc, std::size_t depth, std::size_t maxDepth)
    -> SchemaNode {
    auto items = doc.find("items");
    if (items == doc.end()) {
        return invalid("array schema without 'items'");
    }
    bool unique = false;
    bool optional = false;
    bool nullable = false;
    std::optional<std::size_t> minLength;
    std::optional<std::size_t> maxLength;
    for (auto reason :
         {readFlag(doc, "unique", unique), readFlag(doc, "optional", optional),
          readFlag(doc, "nullable", nullable),
          readLength(doc, "minLength", minLength),
          readLength(doc, "maxLength", maxLength)}) {
        if (reason) {
            return invalid(*reason);
        }
    }

    try {
        ArraySchema array(load(*items, depth + 1, maxDepth));
        if (minLength) {
            array.minLength(*minLength);
        }
        if (maxLength) {
            array.maxLength(*maxLength);
        }
        array.unique(unique).nullable(nullable);
        if (optional) {
            array.optional();
        }
        return array;
    } catch (const error::SchemaError& e) {
        return invalid(e.getMessage());
    }
}

auto loadLeaf(const json& doc, TypeTag tag) -> SchemaNode {
    LeafSchema leaf(tag);
    bool required = false;
    bool optional = false;
    bool nullable = false;
    for (auto reason : {readFlag(doc, "required", required),
                        readFlag(doc, "optional", optional),
                        readFlag(doc, "nullable", nullable)}) {
        if (reason) {
            return invalid(*reason);
        }
    }
    if (required && optional) {
        return invalid("leaf cannot be both required and optional");
    }
    if (required) {
        leaf.required();
    } else if (optional) {
        leaf.optional();
    }
    leaf.nullable(nullable);

    if (auto it = doc.find("customType"); it != doc.end()) {
        if (!it->is_string() || it->get<std::string>().empty()) {
            return invalid("'customType' must be a non-empty string");
        }
        leaf.customType(it->get<std::string>());
    } else if (tag == TypeTag::Custom) {
        return invalid("custom leaf without 'customType'");
    }

    if (auto it = doc.find("default"); it != doc.end()) {
        try {
            leaf.withDefault(type::fromJson(*it));
        } catch (const error::ValueTypeError& e) {
            return invalid(e.getMessage());
        }
    }
    return leaf;
}

auto loadObject(const json& doc, std::size_t depth, std::size_t maxDepth)
    -> SchemaNode {
    std::vector<Field> fields;
    fields.reserve(doc.size());
    for (const auto& [name, member] : doc.items()) {
        if (!member.is_object()) {
            fields.emplace_back(
                name, invalid(fmt::format("field '{}' is not a schema", name)));
            continue;
        }
        fields.emplace_back(name, load(member, depth + 1, maxDepth));
    }
    return ObjectSchema(std::move(fields));
}

auto load(const json& doc, std::size_t depth, std::size_t maxDepth)
    -> SchemaNode {
    if (depth > maxDepth) {
        return invalid(
            fmt::format("schema nested deeper than {} levels", maxDepth));
    }
    if (!doc.is_object()) {
        return invalid("schema node must be a JSON object");
    }
    auto type = doc.find("type");
    if (type != doc.end() && type->is_string()) {
        const auto& name = type->get_ref<const std::string&>();
        if (name == "array") {
            return loadArray(doc, depth, maxDepth);
        }
        if (auto tag = parseTypeTag(name)) {
            return loadLeaf(doc, *tag);
        }
    }
    return loadObject(doc, depth, maxDepth);
}
}  // namespace

auto schemaFromJson(const json& doc, std::size_t maxDepth) -> SchemaNode {
    return load(doc, 0, maxDepth);
}

}  // namespace vigil::schema
