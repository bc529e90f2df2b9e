/*
 * type_tag.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Closed set of leaf type tags and their runtime predicates

**************************************************/

#include "type_tag.hpp"

#include <array>
#include <cmath>
#include <utility>

namespace vigil::schema {

using type::Value;
using type::ValueKind;

namespace {
constexpr std::array<std::pair<std::string_view, TypeTag>, 31> K_TAG_NAMES{{
    {"string", TypeTag::String},
    {"number", TypeTag::Number},
    {"boolean", TypeTag::Boolean},
    {"object", TypeTag::Object},
    {"array", TypeTag::Array},
    {"null", TypeTag::Null},
    {"undefined", TypeTag::Undefined},
    {"function", TypeTag::Function},
    {"date", TypeTag::Date},
    {"regexp", TypeTag::RegExp},
    {"promise", TypeTag::Promise},
    {"error", TypeTag::Error},
    {"map", TypeTag::Map},
    {"set", TypeTag::Set},
    {"weakmap", TypeTag::WeakMap},
    {"weakset", TypeTag::WeakSet},
    {"arraybuffer", TypeTag::ArrayBuffer},
    {"typedarray", TypeTag::TypedArray},
    {"dataview", TypeTag::DataView},
    {"url", TypeTag::Url},
    {"formdata", TypeTag::FormData},
    {"file", TypeTag::File},
    {"blob", TypeTag::Blob},
    {"event", TypeTag::Event},
    {"element", TypeTag::Element},
    {"node", TypeTag::Node},
    {"nodelist", TypeTag::NodeList},
    {"htmlcollection", TypeTag::HTMLCollection},
    {"window", TypeTag::Window},
    {"document", TypeTag::Document},
    {"custom", TypeTag::Custom},
}};

auto isObjectLike(ValueKind kind) noexcept -> bool {
    switch (kind) {
        case ValueKind::Undefined:
        case ValueKind::Null:
        case ValueKind::Boolean:
        case ValueKind::Number:
        case ValueKind::String:
        case ValueKind::Array:
        case ValueKind::Function:
            return false;
        default:
            return true;
    }
}
}  // namespace

auto tagName(TypeTag tag) noexcept -> std::string_view {
    for (const auto& [name, candidate] : K_TAG_NAMES) {
        if (candidate == tag) {
            return name;
        }
    }
    return "unknown";
}

auto parseTypeTag(std::string_view name) noexcept -> std::optional<TypeTag> {
    for (const auto& [candidateName, tag] : K_TAG_NAMES) {
        if (candidateName == name) {
            return tag;
        }
    }
    return std::nullopt;
}

auto matchesTag(TypeTag tag, const Value& value) noexcept -> bool {
    const ValueKind kind = value.kind();
    switch (tag) {
        case TypeTag::String:
            return kind == ValueKind::String;
        case TypeTag::Number:
            return kind == ValueKind::Number && !std::isnan(value.asNumber());
        case TypeTag::Boolean:
            return kind == ValueKind::Boolean;
        case TypeTag::Object:
            return isObjectLike(kind);
        case TypeTag::Array:
            return kind == ValueKind::Array;
        case TypeTag::Null:
            return kind == ValueKind::Null;
        case TypeTag::Undefined:
            return kind == ValueKind::Undefined;
        case TypeTag::Function:
            return kind == ValueKind::Function;
        case TypeTag::Date:
            return kind == ValueKind::Date && !std::isnan(value.epochMillis());
        case TypeTag::RegExp:
            return kind == ValueKind::RegExp;
        case TypeTag::Promise:
            return kind == ValueKind::Promise;
        case TypeTag::Error:
            return kind == ValueKind::Error;
        case TypeTag::Map:
            return kind == ValueKind::Map;
        case TypeTag::Set:
            return kind == ValueKind::Set;
        case TypeTag::WeakMap:
            return kind == ValueKind::WeakMap;
        case TypeTag::WeakSet:
            return kind == ValueKind::WeakSet;
        case TypeTag::ArrayBuffer:
            return kind == ValueKind::ArrayBuffer;
        case TypeTag::TypedArray:
            return kind == ValueKind::TypedArray;
        case TypeTag::DataView:
            return kind == ValueKind::DataView;
        case TypeTag::Url:
            return kind == ValueKind::Url;
        case TypeTag::FormData:
            return kind == ValueKind::FormData;
        case TypeTag::File:
            return kind == ValueKind::File;
        case TypeTag::Blob:
            return kind == ValueKind::Blob || kind == ValueKind::File;
        case TypeTag::Event:
            return kind == ValueKind::Event;
        case TypeTag::Element:
            return kind == ValueKind::Element;
        case TypeTag::Node:
            return kind == ValueKind::Node || kind == ValueKind::Element ||
                   kind == ValueKind::Document;
        case TypeTag::NodeList:
            return kind == ValueKind::NodeList;
        case TypeTag::HTMLCollection:
            return kind == ValueKind::HTMLCollection;
        case TypeTag::Window:
            return kind == ValueKind::Window;
        case TypeTag::Document:
            return kind == ValueKind::Document;
        case TypeTag::Custom:
            return false;
    }
    return false;
}

}  // namespace vigil::schema
