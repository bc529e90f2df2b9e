/*
 * schema.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Schema model: leaf, object and array descriptors

**************************************************/

#include "schema.hpp"

#include <algorithm>
#include <iterator>

#include "vigil/error/exception.hpp"

namespace vigil::schema {

auto LeafSchema::required() -> LeafSchema& {
    presence_ = Presence::Required;
    return *this;
}

auto LeafSchema::optional() -> LeafSchema& {
    presence_ = Presence::Optional;
    return *this;
}

auto LeafSchema::nullable(bool allow) -> LeafSchema& {
    nullable_ = allow;
    return *this;
}

auto LeafSchema::withDefault(type::Value value) -> LeafSchema& {
    default_ = std::move(value);
    return *this;
}

auto LeafSchema::validator(ValidatorFn fn) -> LeafSchema& {
    validator_ = std::move(fn);
    return *this;
}

auto LeafSchema::transformer(TransformFn fn) -> LeafSchema& {
    transformer_ = std::move(fn);
    return *this;
}

auto LeafSchema::customType(std::string name) -> LeafSchema& {
    if (name.empty()) {
        THROW_SCHEMA_ERROR("Custom type name must not be empty");
    }
    customType_ = std::move(name);
    return *this;
}

Field::Field(std::string fieldName, SchemaNode fieldNode)
    : name(std::move(fieldName)),
      node(std::make_shared<const SchemaNode>(std::move(fieldNode))) {}

ObjectSchema::ObjectSchema(std::vector<Field> fields)
    : fields_(std::move(fields)) {
    for (auto it = fields_.begin(); it != fields_.end(); ++it) {
        auto duplicate =
            std::find_if(std::next(it), fields_.end(), [&it](const Field& f) {
                return f.name == it->name;
            });
        if (duplicate != fields_.end()) {
            THROW_SCHEMA_ERROR("Field '", it->name, "' is declared twice");
        }
    }
}

auto ObjectSchema::optional() -> ObjectSchema& {
    optional_ = true;
    return *this;
}

auto ObjectSchema::nullable(bool allow) -> ObjectSchema& {
    nullable_ = allow;
    return *this;
}

auto ObjectSchema::field(std::string_view name) const noexcept
    -> const SchemaNode* {
    for (const auto& f : fields_) {
        if (f.name == name) {
            return f.node.get();
        }
    }
    return nullptr;
}

ArraySchema::ArraySchema(SchemaNode items)
    : items_(std::make_shared<const SchemaNode>(std::move(items))) {}

auto ArraySchema::items() const noexcept -> const SchemaNode& {
    return *items_;
}

auto ArraySchema::minLength(std::size_t length) -> ArraySchema& {
    if (maxLength_ && length > *maxLength_) {
        THROW_SCHEMA_ERROR("minLength ", length, " exceeds maxLength ",
                           *maxLength_);
    }
    minLength_ = length;
    return *this;
}

auto ArraySchema::maxLength(std::size_t length) -> ArraySchema& {
    if (minLength_ && length < *minLength_) {
        THROW_SCHEMA_ERROR("maxLength ", length, " is below minLength ",
                           *minLength_);
    }
    maxLength_ = length;
    return *this;
}

auto ArraySchema::unique(bool enabled) -> ArraySchema& {
    unique_ = enabled;
    return *this;
}

auto ArraySchema::optional() -> ArraySchema& {
    optional_ = true;
    return *this;
}

auto ArraySchema::nullable(bool allow) -> ArraySchema& {
    nullable_ = allow;
    return *this;
}

auto SchemaNode::depth() const noexcept -> std::size_t {
    if (const auto* obj = object()) {
        std::size_t deepest = 0;
        for (const auto& f : obj->fields()) {
            deepest = std::max(deepest, f.node->depth());
        }
        return deepest + 1;
    }
    if (const auto* arr = array()) {
        return arr->items().depth() + 1;
    }
    return 1;
}

}  // namespace vigil::schema
