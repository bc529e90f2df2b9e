/*
 * value_json.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Conversion between nlohmann::json and Value

**************************************************/

#include "value_json.hpp"

#include <cmath>
#include <cstdint>
#include <string>

#include "vigil/error/exception.hpp"

namespace vigil::type {

namespace {
auto convertIn(const json& doc, std::size_t depth, std::size_t maxDepth)
    -> Value {
    if (depth > maxDepth) {
        THROW_VALUE_TYPE_ERROR("JSON document nested deeper than ", maxDepth,
                               " levels");
    }
    switch (doc.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            return Value::null();
        case json::value_t::boolean:
            return Value(doc.get<bool>());
        case json::value_t::number_integer:
            return Value(doc.get<std::int64_t>());
        case json::value_t::number_unsigned:
            return Value(doc.get<std::uint64_t>());
        case json::value_t::number_float:
            return Value(doc.get<double>());
        case json::value_t::string:
            return Value(doc.get<std::string>());
        case json::value_t::array: {
            Array items;
            items.reserve(doc.size());
            for (const auto& item : doc) {
                items.push_back(convertIn(item, depth + 1, maxDepth));
            }
            return Value(std::move(items));
        }
        case json::value_t::object: {
            Object fields;
            for (const auto& [key, member] : doc.items()) {
                fields.set(key, convertIn(member, depth + 1, maxDepth));
            }
            return Value(std::move(fields));
        }
        case json::value_t::binary: {
            const auto& binary = doc.get_binary();
            return Value::arrayBuffer(Bytes(binary.begin(), binary.end()));
        }
    }
    return Value::null();
}

auto convertOut(const Value& value, std::size_t depth, std::size_t maxDepth)
    -> json;

auto convertRecord(const Value& value, std::size_t depth, std::size_t maxDepth)
    -> json {
    json out = json::object();
    for (const auto& [key, member] : value.asObject()) {
        if (member.isUndefined()) {
            continue;
        }
        out[key] = convertOut(member, depth + 1, maxDepth);
    }
    return out;
}

auto convertOut(const Value& value, std::size_t depth, std::size_t maxDepth)
    -> json {
    if (depth > maxDepth) {
        THROW_VALUE_TYPE_ERROR("Value nested deeper than ", maxDepth,
                               " levels");
    }
    switch (value.kind()) {
        case ValueKind::Undefined:
        case ValueKind::Null:
            return nullptr;
        case ValueKind::Boolean:
            return value.asBool();
        case ValueKind::Number: {
            double n = value.asNumber();
            if (!std::isfinite(n)) {
                return nullptr;
            }
            if (n == std::trunc(n) && std::fabs(n) < 9007199254740992.0) {
                return static_cast<std::int64_t>(n);
            }
            return n;
        }
        case ValueKind::String:
        case ValueKind::Url:
            return value.asString();
        case ValueKind::Date: {
            double ms = value.epochMillis();
            if (std::isnan(ms)) {
                return nullptr;
            }
            return static_cast<std::int64_t>(ms);
        }
        case ValueKind::Array:
        case ValueKind::Set:
        case ValueKind::Map:
        case ValueKind::FormData:
        case ValueKind::NodeList:
        case ValueKind::HTMLCollection: {
            json out = json::array();
            for (const auto& item : value.asArray()) {
                out.push_back(convertOut(item, depth + 1, maxDepth));
            }
            return out;
        }
        case ValueKind::Object:
            return convertRecord(value, depth, maxDepth);
        case ValueKind::ArrayBuffer:
            return json::binary(value.asBytes());
        case ValueKind::Function:
            return {{"$kind", "function"}, {"name", value.asFunction().name}};
        case ValueKind::RegExp:
        case ValueKind::Promise:
        case ValueKind::Error:
        case ValueKind::WeakMap:
        case ValueKind::WeakSet:
        case ValueKind::TypedArray:
        case ValueKind::DataView:
        case ValueKind::File:
        case ValueKind::Blob:
        case ValueKind::Event:
        case ValueKind::Element:
        case ValueKind::Node:
        case ValueKind::Window:
        case ValueKind::Document: {
            json out = convertRecord(value, depth, maxDepth);
            out["$kind"] = std::string(value.kindName());
            return out;
        }
    }
    return nullptr;
}
}  // namespace

auto fromJson(const json& doc, std::size_t maxDepth) -> Value {
    return convertIn(doc, 0, maxDepth);
}

auto toJson(const Value& value, std::size_t maxDepth) -> json {
    return convertOut(value, 0, maxDepth);
}

}  // namespace vigil::type
