/*
 * value.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Immutable dynamic value used for untrusted input

**************************************************/

#ifndef VIGIL_TYPE_VALUE_HPP
#define VIGIL_TYPE_VALUE_HPP

#include <concepts>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "vigil/macro.hpp"

namespace vigil::type {

/**
 * @brief Closed set of runtime kinds a Value can hold.
 *
 * Mirrors what a browser-side payload can carry across a trust boundary:
 * JSON-like kinds plus the special runtime objects (dates, buffers, DOM
 * handles, ...) that forms and upload handlers hand over.
 */
enum class ValueKind : std::uint8_t {
    Undefined,
    Null,
    Boolean,
    Number,
    String,
    Array,
    Object,
    Function,
    Date,
    RegExp,
    Promise,
    Error,
    Map,
    Set,
    WeakMap,
    WeakSet,
    ArrayBuffer,
    TypedArray,
    DataView,
    Url,
    FormData,
    File,
    Blob,
    Event,
    Element,
    Node,
    NodeList,
    HTMLCollection,
    Window,
    Document
};

/**
 * @brief Lower-case name of a kind ("number", "weakmap", ...).
 */
[[nodiscard]] auto kindName(ValueKind kind) noexcept -> std::string_view;

class Value;
class Object;

using Array = std::vector<Value>;
using Bytes = std::vector<std::uint8_t>;

/**
 * @brief A named callable stored in a Value of kind Function.
 */
struct Function {
    std::string name;
    std::function<Value(const Array&)> call;
};

template <typename T>
concept NumberLike = std::is_arithmetic_v<T> && !std::same_as<T, bool> &&
                     !std::same_as<T, char>;

/**
 * @brief Immutable dynamic value.
 *
 * Composite payloads are shared and never modified after construction, so
 * copying a Value is cheap and every operation that "changes" data returns a
 * new Value. Default construction yields `undefined`.
 */
class Value {
public:
    Value() noexcept = default;
    Value(std::nullptr_t) noexcept;
    Value(bool b) noexcept;
    template <NumberLike T>
    Value(T n) noexcept
        : Value(ValueKind::Number,
                Payload(std::in_place_type<double>, static_cast<double>(n))) {}
    Value(const char* s);
    Value(std::string s);
    Value(std::string_view s);
    Value(Array items);
    Value(Object fields);

    [[nodiscard]] static auto undefined() noexcept -> Value;
    [[nodiscard]] static auto null() noexcept -> Value;

    /// Date from milliseconds since the Unix epoch. NaN is an invalid date.
    [[nodiscard]] static auto date(double epochMillis) -> Value;
    [[nodiscard]] static auto regex(std::string source,
                                    std::string flags = "") -> Value;
    [[nodiscard]] static auto error(std::string name,
                                    std::string message) -> Value;
    [[nodiscard]] static auto map(std::vector<std::pair<Value, Value>> entries)
        -> Value;
    [[nodiscard]] static auto set(Array items) -> Value;
    [[nodiscard]] static auto weakMap() -> Value;
    [[nodiscard]] static auto weakSet() -> Value;
    [[nodiscard]] static auto promise() -> Value;
    [[nodiscard]] static auto arrayBuffer(Bytes bytes) -> Value;
    [[nodiscard]] static auto typedArray(std::string elementType, Bytes bytes)
        -> Value;
    [[nodiscard]] static auto dataView(Bytes bytes, std::size_t byteOffset,
                                       std::size_t byteLength) -> Value;
    [[nodiscard]] static auto url(std::string href) -> Value;
    [[nodiscard]] static auto formData(
        std::vector<std::pair<std::string, Value>> entries) -> Value;
    [[nodiscard]] static auto file(std::string name, double size,
                                   std::string mimeType,
                                   double lastModified = 0) -> Value;
    [[nodiscard]] static auto blob(double size, std::string mimeType) -> Value;
    [[nodiscard]] static auto event(std::string type) -> Value;
    [[nodiscard]] static auto element(std::string tagName,
                                      Object attributes) -> Value;
    [[nodiscard]] static auto node(std::string nodeName, int nodeType) -> Value;
    [[nodiscard]] static auto nodeList(Array nodes) -> Value;
    [[nodiscard]] static auto htmlCollection(Array elements) -> Value;
    [[nodiscard]] static auto window() -> Value;
    [[nodiscard]] static auto document(std::string title = "") -> Value;
    [[nodiscard]] static auto function(std::string name,
                                       std::function<Value(const Array&)> call)
        -> Value;

    [[nodiscard]] auto kind() const noexcept -> ValueKind { return kind_; }
    [[nodiscard]] auto kindName() const noexcept -> std::string_view {
        return type::kindName(kind_);
    }

    [[nodiscard]] auto is(ValueKind k) const noexcept -> bool {
        return kind_ == k;
    }
    [[nodiscard]] auto isUndefined() const noexcept -> bool {
        return kind_ == ValueKind::Undefined;
    }
    [[nodiscard]] auto isNull() const noexcept -> bool {
        return kind_ == ValueKind::Null;
    }
    [[nodiscard]] auto isNullish() const noexcept -> bool {
        return isUndefined() || isNull();
    }
    [[nodiscard]] auto isBool() const noexcept -> bool {
        return kind_ == ValueKind::Boolean;
    }
    [[nodiscard]] auto isNumber() const noexcept -> bool {
        return kind_ == ValueKind::Number;
    }
    [[nodiscard]] auto isString() const noexcept -> bool {
        return kind_ == ValueKind::String;
    }
    [[nodiscard]] auto isArray() const noexcept -> bool {
        return kind_ == ValueKind::Array;
    }
    [[nodiscard]] auto isObject() const noexcept -> bool {
        return kind_ == ValueKind::Object;
    }

    /// True for kinds whose payload is an ordered list of Values.
    [[nodiscard]] auto hasItems() const noexcept -> bool;
    /// True for kinds whose payload is a keyed record.
    [[nodiscard]] auto hasFields() const noexcept -> bool;

    [[nodiscard]] auto asBool() const -> bool;
    [[nodiscard]] auto asNumber() const -> double;
    [[nodiscard]] auto asString() const -> const std::string&;
    [[nodiscard]] auto asArray() const -> const Array&;
    [[nodiscard]] auto asObject() const -> const Object&;
    [[nodiscard]] auto asBytes() const -> const Bytes&;
    [[nodiscard]] auto asFunction() const -> const Function&;

    /// Milliseconds since epoch of a Date value.
    [[nodiscard]] auto epochMillis() const -> double;

    /**
     * @brief Looks up a field of an object-like value.
     * @return Pointer to the field, or nullptr when absent or not keyed
     */
    [[nodiscard]] auto find(std::string_view key) const noexcept
        -> const Value*;

    /**
     * @brief Looks up a field, yielding undefined when it is absent.
     */
    [[nodiscard]] auto get(std::string_view key) const -> Value;

    [[nodiscard]] auto contains(std::string_view key) const noexcept -> bool {
        return find(key) != nullptr;
    }

    /// Number of items, fields or bytes; 0 for scalars.
    [[nodiscard]] auto size() const noexcept -> std::size_t;

    /**
     * @brief Stable textual rendering used to compare content.
     *
     * Object keys are sorted, so two objects with the same entries in a
     * different insertion order render identically.
     */
    [[nodiscard]] auto canonical(std::size_t maxDepth = 64) const
        -> std::string;

    /// Short human-readable rendering for diagnostics.
    [[nodiscard]] auto toDisplayString() const -> std::string;

    friend auto operator==(const Value& lhs, const Value& rhs) -> bool;

private:
    using Payload =
        std::variant<std::monostate, bool, double, std::string,
                     std::shared_ptr<const Array>, std::shared_ptr<const Object>,
                     std::shared_ptr<const Bytes>,
                     std::shared_ptr<const Function>>;

    Value(ValueKind kind, Payload payload) noexcept;

    void renderCanonical(std::string& out, std::size_t depth,
                         std::size_t maxDepth) const;

    ValueKind kind_{ValueKind::Undefined};
    Payload payload_;
};

/**
 * @brief Insertion-ordered record of named Values.
 *
 * Keys are unique; setting an existing key replaces its value in place.
 */
class Object {
public:
    using Entry = std::pair<std::string, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Object() = default;
    Object(std::initializer_list<Entry> entries);

    void set(std::string key, Value value);
    auto erase(std::string_view key) -> bool;

    [[nodiscard]] auto find(std::string_view key) const noexcept
        -> const Value*;
    [[nodiscard]] auto contains(std::string_view key) const noexcept -> bool {
        return find(key) != nullptr;
    }
    [[nodiscard]] auto keys() const -> std::vector<std::string>;

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return entries_.size();
    }
    [[nodiscard]] auto empty() const noexcept -> bool {
        return entries_.empty();
    }
    [[nodiscard]] auto begin() const noexcept -> const_iterator {
        return entries_.begin();
    }
    [[nodiscard]] auto end() const noexcept -> const_iterator {
        return entries_.end();
    }

    friend auto operator==(const Object& lhs, const Object& rhs) -> bool;

private:
    std::vector<Entry> entries_;
};

}  // namespace vigil::type

#endif  // VIGIL_TYPE_VALUE_HPP
