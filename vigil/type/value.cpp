/*
 * value.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Immutable dynamic value used for untrusted input

**************************************************/

#include "value.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "vigil/error/exception.hpp"
#include "vigil/utils/string.hpp"

namespace vigil::type {

namespace {
const Value K_UNDEFINED;

auto makeArray(Array items) -> std::shared_ptr<const Array> {
    return std::make_shared<const Array>(std::move(items));
}

auto makeObject(Object fields) -> std::shared_ptr<const Object> {
    return std::make_shared<const Object>(std::move(fields));
}
}  // namespace

auto kindName(ValueKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ValueKind::Undefined:
            return "undefined";
        case ValueKind::Null:
            return "null";
        case ValueKind::Boolean:
            return "boolean";
        case ValueKind::Number:
            return "number";
        case ValueKind::String:
            return "string";
        case ValueKind::Array:
            return "array";
        case ValueKind::Object:
            return "object";
        case ValueKind::Function:
            return "function";
        case ValueKind::Date:
            return "date";
        case ValueKind::RegExp:
            return "regexp";
        case ValueKind::Promise:
            return "promise";
        case ValueKind::Error:
            return "error";
        case ValueKind::Map:
            return "map";
        case ValueKind::Set:
            return "set";
        case ValueKind::WeakMap:
            return "weakmap";
        case ValueKind::WeakSet:
            return "weakset";
        case ValueKind::ArrayBuffer:
            return "arraybuffer";
        case ValueKind::TypedArray:
            return "typedarray";
        case ValueKind::DataView:
            return "dataview";
        case ValueKind::Url:
            return "url";
        case ValueKind::FormData:
            return "formdata";
        case ValueKind::File:
            return "file";
        case ValueKind::Blob:
            return "blob";
        case ValueKind::Event:
            return "event";
        case ValueKind::Element:
            return "element";
        case ValueKind::Node:
            return "node";
        case ValueKind::NodeList:
            return "nodelist";
        case ValueKind::HTMLCollection:
            return "htmlcollection";
        case ValueKind::Window:
            return "window";
        case ValueKind::Document:
            return "document";
    }
    return "unknown";
}

// -------------------------------------------------------------------
// Value construction
// -------------------------------------------------------------------

Value::Value(ValueKind kind, Payload payload) noexcept
    : kind_(kind), payload_(std::move(payload)) {}

Value::Value(std::nullptr_t) noexcept : kind_(ValueKind::Null) {}

Value::Value(bool b) noexcept
    : kind_(ValueKind::Boolean), payload_(std::in_place_type<bool>, b) {}

Value::Value(const char* s)
    : kind_(ValueKind::String),
      payload_(std::in_place_type<std::string>, s == nullptr ? "" : s) {}

Value::Value(std::string s)
    : kind_(ValueKind::String),
      payload_(std::in_place_type<std::string>, std::move(s)) {}

Value::Value(std::string_view s)
    : kind_(ValueKind::String), payload_(std::in_place_type<std::string>, s) {}

Value::Value(Array items)
    : kind_(ValueKind::Array), payload_(makeArray(std::move(items))) {}

Value::Value(Object fields)
    : kind_(ValueKind::Object), payload_(makeObject(std::move(fields))) {}

auto Value::undefined() noexcept -> Value { return Value(); }

auto Value::null() noexcept -> Value { return Value(nullptr); }

auto Value::date(double epochMillis) -> Value {
    return {ValueKind::Date, Payload(std::in_place_type<double>, epochMillis)};
}

auto Value::regex(std::string source, std::string flags) -> Value {
    return {ValueKind::RegExp,
            makeObject(Object{{"source", std::move(source)},
                              {"flags", std::move(flags)}})};
}

auto Value::error(std::string name, std::string message) -> Value {
    return {ValueKind::Error,
            makeObject(Object{{"name", std::move(name)},
                              {"message", std::move(message)}})};
}

auto Value::map(std::vector<std::pair<Value, Value>> entries) -> Value {
    Array pairs;
    pairs.reserve(entries.size());
    for (auto& [key, value] : entries) {
        pairs.emplace_back(Array{std::move(key), std::move(value)});
    }
    return {ValueKind::Map, makeArray(std::move(pairs))};
}

auto Value::set(Array items) -> Value {
    Array unique;
    unique.reserve(items.size());
    for (auto& item : items) {
        if (std::find(unique.begin(), unique.end(), item) == unique.end()) {
            unique.push_back(std::move(item));
        }
    }
    return {ValueKind::Set, makeArray(std::move(unique))};
}

auto Value::weakMap() -> Value { return {ValueKind::WeakMap, makeObject({})}; }

auto Value::weakSet() -> Value { return {ValueKind::WeakSet, makeObject({})}; }

auto Value::promise() -> Value { return {ValueKind::Promise, makeObject({})}; }

auto Value::arrayBuffer(Bytes bytes) -> Value {
    return {ValueKind::ArrayBuffer,
            std::make_shared<const Bytes>(std::move(bytes))};
}

auto Value::typedArray(std::string elementType, Bytes bytes) -> Value {
    return {ValueKind::TypedArray,
            makeObject(Object{{"elementType", std::move(elementType)},
                              {"buffer", arrayBuffer(std::move(bytes))}})};
}

auto Value::dataView(Bytes bytes, std::size_t byteOffset,
                     std::size_t byteLength) -> Value {
    if (byteOffset > bytes.size() || byteLength > bytes.size() - byteOffset) {
        THROW_VALUE_TYPE_ERROR("DataView range [", byteOffset, ", ",
                               byteOffset + byteLength,
                               ") exceeds buffer of ", bytes.size(), " bytes");
    }
    return {ValueKind::DataView,
            makeObject(Object{{"buffer", arrayBuffer(std::move(bytes))},
                              {"byteOffset", byteOffset},
                              {"byteLength", byteLength}})};
}

auto Value::url(std::string href) -> Value {
    return {ValueKind::Url,
            Payload(std::in_place_type<std::string>, std::move(href))};
}

auto Value::formData(std::vector<std::pair<std::string, Value>> entries)
    -> Value {
    Array pairs;
    pairs.reserve(entries.size());
    for (auto& [name, value] : entries) {
        pairs.emplace_back(Array{Value(std::move(name)), std::move(value)});
    }
    return {ValueKind::FormData, makeArray(std::move(pairs))};
}

auto Value::file(std::string name, double size, std::string mimeType,
                 double lastModified) -> Value {
    return {ValueKind::File, makeObject(Object{{"name", std::move(name)},
                                               {"size", size},
                                               {"type", std::move(mimeType)},
                                               {"lastModified", lastModified}})};
}

auto Value::blob(double size, std::string mimeType) -> Value {
    return {ValueKind::Blob,
            makeObject(Object{{"size", size}, {"type", std::move(mimeType)}})};
}

auto Value::event(std::string type) -> Value {
    return {ValueKind::Event, makeObject(Object{{"type", std::move(type)}})};
}

auto Value::element(std::string tagName, Object attributes) -> Value {
    return {ValueKind::Element,
            makeObject(Object{{"tagName", utils::toUpper(tagName)},
                              {"nodeType", 1},
                              {"attributes", std::move(attributes)}})};
}

auto Value::node(std::string nodeName, int nodeType) -> Value {
    return {ValueKind::Node, makeObject(Object{{"nodeName", std::move(nodeName)},
                                               {"nodeType", nodeType}})};
}

auto Value::nodeList(Array nodes) -> Value {
    return {ValueKind::NodeList, makeArray(std::move(nodes))};
}

auto Value::htmlCollection(Array elements) -> Value {
    return {ValueKind::HTMLCollection, makeArray(std::move(elements))};
}

auto Value::window() -> Value { return {ValueKind::Window, makeObject({})}; }

auto Value::document(std::string title) -> Value {
    return {ValueKind::Document,
            makeObject(Object{{"nodeType", 9}, {"title", std::move(title)}})};
}

auto Value::function(std::string name, std::function<Value(const Array&)> call)
    -> Value {
    return {ValueKind::Function,
            std::make_shared<const Function>(
                Function{std::move(name), std::move(call)})};
}

// -------------------------------------------------------------------
// Accessors
// -------------------------------------------------------------------

auto Value::hasItems() const noexcept -> bool {
    return std::holds_alternative<std::shared_ptr<const Array>>(payload_);
}

auto Value::hasFields() const noexcept -> bool {
    return std::holds_alternative<std::shared_ptr<const Object>>(payload_);
}

auto Value::asBool() const -> bool {
    if (kind_ != ValueKind::Boolean) {
        THROW_VALUE_TYPE_ERROR("Expected boolean, got ", kindName());
    }
    return std::get<bool>(payload_);
}

auto Value::asNumber() const -> double {
    if (kind_ != ValueKind::Number) {
        THROW_VALUE_TYPE_ERROR("Expected number, got ", kindName());
    }
    return std::get<double>(payload_);
}

auto Value::epochMillis() const -> double {
    if (kind_ != ValueKind::Date) {
        THROW_VALUE_TYPE_ERROR("Expected date, got ", kindName());
    }
    return std::get<double>(payload_);
}

auto Value::asString() const -> const std::string& {
    if (const auto* str = std::get_if<std::string>(&payload_)) {
        return *str;
    }
    THROW_VALUE_TYPE_ERROR("Expected string, got ", kindName());
}

auto Value::asArray() const -> const Array& {
    if (const auto* items = std::get_if<std::shared_ptr<const Array>>(&payload_)) {
        return **items;
    }
    THROW_VALUE_TYPE_ERROR("Expected a sequence, got ", kindName());
}

auto Value::asObject() const -> const Object& {
    if (const auto* fields =
            std::get_if<std::shared_ptr<const Object>>(&payload_)) {
        return **fields;
    }
    THROW_VALUE_TYPE_ERROR("Expected a record, got ", kindName());
}

auto Value::asBytes() const -> const Bytes& {
    if (const auto* bytes = std::get_if<std::shared_ptr<const Bytes>>(&payload_)) {
        return **bytes;
    }
    THROW_VALUE_TYPE_ERROR("Expected an array buffer, got ", kindName());
}

auto Value::asFunction() const -> const Function& {
    if (const auto* fn =
            std::get_if<std::shared_ptr<const Function>>(&payload_)) {
        return **fn;
    }
    THROW_VALUE_TYPE_ERROR("Expected a function, got ", kindName());
}

auto Value::find(std::string_view key) const noexcept -> const Value* {
    if (const auto* fields =
            std::get_if<std::shared_ptr<const Object>>(&payload_)) {
        return (*fields)->find(key);
    }
    return nullptr;
}

auto Value::get(std::string_view key) const -> Value {
    const Value* found = find(key);
    return found != nullptr ? *found : K_UNDEFINED;
}

auto Value::size() const noexcept -> std::size_t {
    return std::visit(
        [](const auto& payload) -> std::size_t {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, std::shared_ptr<const Array>> ||
                          std::is_same_v<T, std::shared_ptr<const Object>> ||
                          std::is_same_v<T, std::shared_ptr<const Bytes>>) {
                return payload->size();
            } else if constexpr (std::is_same_v<T, std::string>) {
                return payload.size();
            } else {
                return 0;
            }
        },
        payload_);
}

// -------------------------------------------------------------------
// Rendering and comparison
// -------------------------------------------------------------------

auto Value::canonical(std::size_t maxDepth) const -> std::string {
    std::string out;
    renderCanonical(out, 0, maxDepth);
    return out;
}

void Value::renderCanonical(std::string& out, std::size_t depth,
                            std::size_t maxDepth) const {
    if (depth > maxDepth) {
        out += "<max-depth>";
        return;
    }
    switch (kind_) {
        case ValueKind::Undefined:
            out += "undefined";
            return;
        case ValueKind::Null:
            out += "null";
            return;
        case ValueKind::Boolean:
            out += std::get<bool>(payload_) ? "true" : "false";
            return;
        case ValueKind::Number:
            out += utils::formatNumber(std::get<double>(payload_));
            return;
        case ValueKind::String:
            out += utils::quote(std::get<std::string>(payload_));
            return;
        case ValueKind::Array: {
            out.push_back('[');
            bool first = true;
            for (const auto& item : asArray()) {
                if (!first) {
                    out.push_back(',');
                }
                item.renderCanonical(out, depth + 1, maxDepth);
                first = false;
            }
            out.push_back(']');
            return;
        }
        case ValueKind::Object: {
            std::vector<const Object::Entry*> entries;
            for (const auto& entry : asObject()) {
                entries.push_back(&entry);
            }
            std::sort(entries.begin(), entries.end(),
                      [](const Object::Entry* a, const Object::Entry* b) {
                          return a->first < b->first;
                      });
            out.push_back('{');
            bool first = true;
            for (const auto* entry : entries) {
                if (!first) {
                    out.push_back(',');
                }
                out += utils::quote(entry->first);
                out.push_back(':');
                entry->second.renderCanonical(out, depth + 1, maxDepth);
                first = false;
            }
            out.push_back('}');
            return;
        }
        case ValueKind::Date:
            out += fmt::format("date({})",
                               utils::formatNumber(std::get<double>(payload_)));
            return;
        case ValueKind::Url:
            out += fmt::format("url({})",
                               utils::quote(std::get<std::string>(payload_)));
            return;
        case ValueKind::ArrayBuffer: {
            out += "arraybuffer(";
            for (auto byte : asBytes()) {
                out += fmt::format("{:02x}", byte);
            }
            out.push_back(')');
            return;
        }
        case ValueKind::Function:
            out += fmt::format("function({})", asFunction().name);
            return;
        case ValueKind::Map:
        case ValueKind::Set:
        case ValueKind::FormData:
        case ValueKind::NodeList:
        case ValueKind::HTMLCollection: {
            out += kindName();
            Value(asArray()).renderCanonical(out, depth, maxDepth);
            return;
        }
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
            out += kindName();
            Value(asObject()).renderCanonical(out, depth, maxDepth);
            return;
        }
    }
}

auto Value::toDisplayString() const -> std::string {
    switch (kind_) {
        case ValueKind::String:
            return utils::quote(asString());
        case ValueKind::Array:
            return fmt::format("array({})", size());
        case ValueKind::Object:
            return fmt::format("object({})", size());
        default:
            break;
    }
    if (hasItems() || hasFields()) {
        return std::string(kindName());
    }
    return canonical(0);
}

auto operator==(const Value& lhs, const Value& rhs) -> bool {
    if (lhs.kind_ != rhs.kind_) {
        return false;
    }
    if (lhs.payload_.index() != rhs.payload_.index()) {
        return false;
    }
    return std::visit(
        [&rhs](const auto& left) -> bool {
            using T = std::decay_t<decltype(left)>;
            const auto& right = std::get<T>(rhs.payload_);
            if constexpr (std::is_same_v<T, std::monostate>) {
                return true;
            } else if constexpr (std::is_same_v<T, bool> ||
                                 std::is_same_v<T, double> ||
                                 std::is_same_v<T, std::string>) {
                return left == right;
            } else if constexpr (std::is_same_v<T,
                                                std::shared_ptr<const Function>>) {
                return left == right;
            } else {
                return left == right || *left == *right;
            }
        },
        lhs.payload_);
}

// -------------------------------------------------------------------
// Object
// -------------------------------------------------------------------

Object::Object(std::initializer_list<Entry> entries) {
    entries_.reserve(entries.size());
    for (const auto& [key, value] : entries) {
        set(key, value);
    }
}

void Object::set(std::string key, Value value) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&key](const Entry& e) { return e.first == key; });
    if (it != entries_.end()) {
        it->second = std::move(value);
        return;
    }
    entries_.emplace_back(std::move(key), std::move(value));
}

auto Object::erase(std::string_view key) -> bool {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [key](const Entry& e) { return e.first == key; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

auto Object::find(std::string_view key) const noexcept -> const Value* {
    for (const auto& [name, value] : entries_) {
        if (name == key) {
            return &value;
        }
    }
    return nullptr;
}

auto Object::keys() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.first);
    }
    return out;
}

auto operator==(const Object& lhs, const Object& rhs) -> bool {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (const auto& [key, value] : lhs) {
        const Value* other = rhs.find(key);
        if (other == nullptr || !(*other == value)) {
            return false;
        }
    }
    return true;
}

}  // namespace vigil::type
