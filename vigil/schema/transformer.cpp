/*
 * transformer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Reshaping of validated data and default filling

**************************************************/

#include "transformer.hpp"

#include <exception>

#include <fmt/format.h>

#include "vigil/error/exception.hpp"

namespace vigil::schema {

using type::Array;
using type::Object;
using type::Value;

auto Transformer::transform(const Value& value, const SchemaNode& schema) const
    -> Value {
    std::string path;
    return transformAt(value, schema, path);
}

auto Transformer::transformAt(const Value& value, const SchemaNode& schema,
                              std::string& path) const -> Value {
    if (const auto* leaf = schema.leaf()) {
        return transformLeaf(value, *leaf, path);
    }
    if (const auto* object = schema.object()) {
        if (!value.isObject()) {
            return value;
        }
        Object out;
        for (const auto& field : object->fields()) {
            const Value* member = value.find(field.name);
            if (member == nullptr) {
                continue;
            }
            std::size_t previous = path.size();
            path += path.empty() ? field.name : "." + field.name;
            out.set(field.name, transformAt(*member, *field.node, path));
            path.resize(previous);
        }
        return Value(std::move(out));
    }
    if (const auto* array = schema.array()) {
        if (!value.isArray()) {
            return value;
        }
        Array out;
        out.reserve(value.size());
        std::size_t index = 0;
        for (const auto& item : value.asArray()) {
            std::size_t previous = path.size();
            path += fmt::format("[{}]", index++);
            out.push_back(transformAt(item, array->items(), path));
            path.resize(previous);
        }
        return Value(std::move(out));
    }
    return value;
}

auto Transformer::transformLeaf(const Value& value, const LeafSchema& leaf,
                                const std::string& path) const -> Value {
    if (value.isNullish()) {
        return value;
    }
    const TransformFn* fn = nullptr;
    if (leaf.getTransformer()) {
        fn = &leaf.getTransformer();
    } else if (const auto& name = leaf.getCustomType()) {
        fn = registries_.transformers.find(*name);
    }
    if (fn == nullptr) {
        return value;
    }
    try {
        return (*fn)(value);
    } catch (const std::exception& e) {
        THROW_TRANSFORM_ERROR("Transform failed at '", path, "': ", e.what());
    }
}

auto Transformer::applyDefaults(const Value& value,
                                const SchemaNode& schema) const -> Value {
    if (const auto* leaf = schema.leaf()) {
        if (value.isUndefined() && leaf->getDefault()) {
            return *leaf->getDefault();
        }
        return value;
    }
    if (const auto* object = schema.object()) {
        if (!value.isObject()) {
            return value;
        }
        Object out = value.asObject();
        for (const auto& field : object->fields()) {
            Value filled = applyDefaults(value.get(field.name), *field.node);
            if (!filled.isUndefined()) {
                out.set(field.name, std::move(filled));
            }
        }
        return Value(std::move(out));
    }
    if (const auto* array = schema.array()) {
        if (!value.isArray()) {
            return value;
        }
        Array out;
        out.reserve(value.size());
        for (const auto& item : value.asArray()) {
            out.push_back(applyDefaults(item, array->items()));
        }
        return Value(std::move(out));
    }
    return value;
}

}  // namespace vigil::schema
