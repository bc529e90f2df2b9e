/*
 * schema.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Schema model: leaf, object and array descriptors

**************************************************/

#ifndef VIGIL_SCHEMA_SCHEMA_HPP
#define VIGIL_SCHEMA_SCHEMA_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "vigil/schema/type_tag.hpp"
#include "vigil/type/value.hpp"

namespace vigil::schema {

class ValidationContext;
class SchemaNode;

/**
 * @brief Outcome of a custom validator.
 *
 * Converts implicitly from `bool` (pass or generic failure) and from a
 * string, which is a failure carrying that message.
 */
struct Verdict {
    Verdict(bool passed) : ok(passed) {}
    Verdict(std::string failure) : ok(false), message(std::move(failure)) {}
    Verdict(const char* failure) : ok(false), message(failure) {}

    [[nodiscard]] static auto pass() -> Verdict { return Verdict(true); }

    bool ok;
    std::optional<std::string> message;
};

using ValidatorFn =
    std::function<Verdict(const type::Value&, const ValidationContext&)>;
using TransformFn = std::function<type::Value(const type::Value&)>;
using TypePredicate = std::function<bool(const type::Value&)>;

/**
 * @brief How a leaf treats a missing (undefined) value.
 */
enum class Presence : std::uint8_t {
    Unspecified,  ///< Missing values go on to the type check.
    Required,     ///< Missing values are a REQUIRED_FIELD error.
    Optional      ///< Missing values are accepted.
};

/**
 * @brief Descriptor of a single scalar or special-kind value.
 */
class LeafSchema {
public:
    explicit LeafSchema(TypeTag tag) noexcept : tag_(tag) {}

    auto required() -> LeafSchema&;
    auto optional() -> LeafSchema&;
    auto nullable(bool allow = true) -> LeafSchema&;
    auto withDefault(type::Value value) -> LeafSchema&;
    auto validator(ValidatorFn fn) -> LeafSchema&;
    auto transformer(TransformFn fn) -> LeafSchema&;
    auto customType(std::string name) -> LeafSchema&;

    [[nodiscard]] auto getTag() const noexcept -> TypeTag { return tag_; }
    [[nodiscard]] auto getPresence() const noexcept -> Presence {
        return presence_;
    }
    /// The null tag accepts null whatever the flag says.
    [[nodiscard]] auto isNullable() const noexcept -> bool {
        return nullable_ || tag_ == TypeTag::Null;
    }
    [[nodiscard]] auto getDefault() const noexcept
        -> const std::optional<type::Value>& {
        return default_;
    }
    [[nodiscard]] auto getValidator() const noexcept -> const ValidatorFn& {
        return validator_;
    }
    [[nodiscard]] auto getTransformer() const noexcept -> const TransformFn& {
        return transformer_;
    }
    [[nodiscard]] auto getCustomType() const noexcept
        -> const std::optional<std::string>& {
        return customType_;
    }

private:
    TypeTag tag_;
    Presence presence_{Presence::Unspecified};
    bool nullable_{false};
    std::optional<type::Value> default_;
    ValidatorFn validator_;
    TransformFn transformer_;
    std::optional<std::string> customType_;
};

/**
 * @brief A named member of an object descriptor.
 */
struct Field {
    Field(std::string fieldName, SchemaNode fieldNode);

    std::string name;
    std::shared_ptr<const SchemaNode> node;
};

/**
 * @brief Descriptor of a keyed record. Fields keep declaration order.
 */
class ObjectSchema {
public:
    /// @throws error::SchemaError when a field name is declared twice
    explicit ObjectSchema(std::vector<Field> fields);

    auto optional() -> ObjectSchema&;
    auto nullable(bool allow = true) -> ObjectSchema&;

    [[nodiscard]] auto fields() const noexcept -> const std::vector<Field>& {
        return fields_;
    }
    [[nodiscard]] auto field(std::string_view name) const noexcept
        -> const SchemaNode*;
    [[nodiscard]] auto isOptional() const noexcept -> bool {
        return optional_;
    }
    [[nodiscard]] auto isNullable() const noexcept -> bool {
        return nullable_;
    }

private:
    std::vector<Field> fields_;
    bool optional_{false};
    bool nullable_{false};
};

/**
 * @brief Descriptor of a homogeneous sequence.
 */
class ArraySchema {
public:
    explicit ArraySchema(SchemaNode items);

    /// @throws error::SchemaError when it contradicts the maximum length
    auto minLength(std::size_t length) -> ArraySchema&;
    /// @throws error::SchemaError when it contradicts the minimum length
    auto maxLength(std::size_t length) -> ArraySchema&;
    auto unique(bool enabled = true) -> ArraySchema&;
    auto optional() -> ArraySchema&;
    auto nullable(bool allow = true) -> ArraySchema&;

    [[nodiscard]] auto items() const noexcept -> const SchemaNode&;
    [[nodiscard]] auto getMinLength() const noexcept
        -> std::optional<std::size_t> {
        return minLength_;
    }
    [[nodiscard]] auto getMaxLength() const noexcept
        -> std::optional<std::size_t> {
        return maxLength_;
    }
    [[nodiscard]] auto isUnique() const noexcept -> bool { return unique_; }
    [[nodiscard]] auto isOptional() const noexcept -> bool {
        return optional_;
    }
    [[nodiscard]] auto isNullable() const noexcept -> bool {
        return nullable_;
    }

private:
    std::shared_ptr<const SchemaNode> items_;
    std::optional<std::size_t> minLength_;
    std::optional<std::size_t> maxLength_;
    bool unique_{false};
    bool optional_{false};
    bool nullable_{false};
};

/**
 * @brief A descriptor that could not be classified. Validates to
 * INVALID_SCHEMA.
 */
struct InvalidSchema {
    std::string reason;
};

/**
 * @brief Tagged union of the descriptor kinds.
 *
 * Nodes are immutable once built and share their children, so a schema can
 * be defined once and reused across threads.
 */
class SchemaNode {
public:
    enum class Kind : std::uint8_t { Invalid, Leaf, Object, Array };

    SchemaNode(InvalidSchema node) : node_(std::move(node)) {}
    SchemaNode(LeafSchema node) : node_(std::move(node)) {}
    SchemaNode(ObjectSchema node) : node_(std::move(node)) {}
    SchemaNode(ArraySchema node) : node_(std::move(node)) {}

    [[nodiscard]] auto kind() const noexcept -> Kind {
        return static_cast<Kind>(node_.index());
    }

    [[nodiscard]] auto invalid() const noexcept -> const InvalidSchema* {
        return std::get_if<InvalidSchema>(&node_);
    }
    [[nodiscard]] auto leaf() const noexcept -> const LeafSchema* {
        return std::get_if<LeafSchema>(&node_);
    }
    [[nodiscard]] auto object() const noexcept -> const ObjectSchema* {
        return std::get_if<ObjectSchema>(&node_);
    }
    [[nodiscard]] auto array() const noexcept -> const ArraySchema* {
        return std::get_if<ArraySchema>(&node_);
    }

    /// Number of nested descriptor levels, 1 for a leaf.
    [[nodiscard]] auto depth() const noexcept -> std::size_t;

private:
    std::variant<InvalidSchema, LeafSchema, ObjectSchema, ArraySchema> node_;
};

/**
 * @brief Builders for schema descriptors.
 *
 * @code
 * auto user = Schema::object({
 *     {"name", Schema::string().required()},
 *     {"email", Schema::string().customType("email")},
 *     {"tags", Schema::array(Schema::string()).maxLength(5).unique()},
 * });
 * @endcode
 */
struct Schema {
    [[nodiscard]] static auto leaf(TypeTag tag) -> LeafSchema {
        return LeafSchema(tag);
    }
    [[nodiscard]] static auto string() -> LeafSchema {
        return LeafSchema(TypeTag::String);
    }
    [[nodiscard]] static auto number() -> LeafSchema {
        return LeafSchema(TypeTag::Number);
    }
    [[nodiscard]] static auto boolean() -> LeafSchema {
        return LeafSchema(TypeTag::Boolean);
    }
    [[nodiscard]] static auto date() -> LeafSchema {
        return LeafSchema(TypeTag::Date);
    }
    [[nodiscard]] static auto file() -> LeafSchema {
        return LeafSchema(TypeTag::File);
    }
    [[nodiscard]] static auto custom(std::string name) -> LeafSchema {
        return std::move(LeafSchema(TypeTag::Custom).customType(std::move(name)));
    }
    [[nodiscard]] static auto object(std::vector<Field> fields)
        -> ObjectSchema {
        return ObjectSchema(std::move(fields));
    }
    [[nodiscard]] static auto array(SchemaNode items) -> ArraySchema {
        return ArraySchema(std::move(items));
    }
    [[nodiscard]] static auto invalid(std::string reason) -> InvalidSchema {
        return InvalidSchema{std::move(reason)};
    }
};

}  // namespace vigil::schema

#endif  // VIGIL_SCHEMA_SCHEMA_HPP
