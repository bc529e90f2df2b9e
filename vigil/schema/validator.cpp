/*
 * validator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Recursive schema validator

**************************************************/

#include "validator.hpp"

#include <exception>
#include <string>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "vigil/utils/string.hpp"

namespace vigil::schema {

using type::Value;
using type::ValueKind;

namespace {
constexpr std::string_view K_GENERIC_FAILURE = "Custom validation failed";

void applyVerdict(const ValidatorFn& fn, const Value& value,
                  ValidationContext& ctx, std::string_view fallback) {
    try {
        Verdict verdict = fn(value, ctx);
        if (!verdict.ok) {
            ctx.addError(DiagnosticCode::CustomValidationFailed,
                         verdict.message.value_or(std::string(fallback)));
        }
    } catch (const std::exception& e) {
        spdlog::debug("Validator threw at '{}': {}", ctx.path(), e.what());
        ctx.addError(DiagnosticCode::CustomValidationFailed, e.what());
    }
}

void typeMismatch(ValidationContext& ctx, std::string_view expected,
                  const Value& value) {
    ctx.addError(DiagnosticCode::TypeMismatch,
                 fmt::format("Expected {}, received {}", expected,
                             value.kindName()),
                 std::string(expected), std::string(value.kindName()));
}
}  // namespace

void Validator::validate(const Value& value, const SchemaNode& schema,
                         ValidationContext& ctx) const {
    switch (schema.kind()) {
        case SchemaNode::Kind::Invalid:
            ctx.addError(DiagnosticCode::InvalidSchema,
                         fmt::format("Invalid schema: {}",
                                     schema.invalid()->reason));
            return;
        case SchemaNode::Kind::Leaf:
            validateLeaf(value, *schema.leaf(), ctx);
            return;
        case SchemaNode::Kind::Object:
            validateObject(value, *schema.object(), ctx);
            return;
        case SchemaNode::Kind::Array:
            validateArray(value, *schema.array(), ctx);
            return;
    }
}

void Validator::validateLeaf(const Value& value, const LeafSchema& leaf,
                             ValidationContext& ctx) const {
    if (value.isUndefined()) {
        if (leaf.getPresence() == Presence::Required) {
            ctx.addError(DiagnosticCode::RequiredField, "Field is required");
            return;
        }
        if (leaf.getPresence() == Presence::Optional) {
            return;
        }
    }

    if (value.isNull() && leaf.getTag() != TypeTag::Null) {
        if (!leaf.isNullable()) {
            ctx.addError(DiagnosticCode::NullNotAllowed, "Null is not allowed",
                         std::string(tagName(leaf.getTag())), "null");
        }
        return;
    }

    const auto& customType = leaf.getCustomType();
    if (leaf.getTag() == TypeTag::Custom) {
        if (!customType) {
            ctx.addError(DiagnosticCode::InvalidSchema,
                         "Invalid schema: custom tag without a custom type");
            return;
        }
        if (!checkCustomType(value, *customType, ctx)) {
            return;
        }
    } else if (!matchesTag(leaf.getTag(), value)) {
        typeMismatch(ctx, tagName(leaf.getTag()), value);
        return;
    }

    if (leaf.getValidator()) {
        applyVerdict(leaf.getValidator(), value, ctx, K_GENERIC_FAILURE);
    }
    if (customType) {
        runNamedValidator(value, leaf, ctx);
    }
}

auto Validator::checkCustomType(const Value& value, const std::string& name,
                                ValidationContext& ctx) const -> bool {
    const auto* predicate = registries_.customTypes.find(name);
    if (predicate == nullptr) {
        ctx.addError(DiagnosticCode::TypeMismatch,
                     fmt::format("Unknown custom type '{}'", name), name,
                     std::string(value.kindName()));
        return false;
    }
    try {
        if (!(*predicate)(value)) {
            typeMismatch(ctx, name, value);
            return false;
        }
    } catch (const std::exception& e) {
        ctx.addError(DiagnosticCode::CustomValidationFailed, e.what());
        return false;
    }
    return true;
}

void Validator::runNamedValidator(const Value& value, const LeafSchema& leaf,
                                  ValidationContext& ctx) const {
    const std::string& name = *leaf.getCustomType();
    if (const auto* named = registries_.validators.find(name)) {
        applyVerdict(*named, value, ctx,
                     fmt::format("Validation '{}' failed", name));
        return;
    }
    if (leaf.getTag() == TypeTag::Custom) {
        return;
    }
    const auto* predicate = registries_.customTypes.find(name);
    if (predicate == nullptr) {
        ctx.addError(DiagnosticCode::CustomValidationFailed,
                     fmt::format("Unknown custom type '{}'", name));
        return;
    }
    try {
        if (!(*predicate)(value)) {
            ctx.addError(DiagnosticCode::CustomValidationFailed,
                         fmt::format("Value is not a valid {}", name));
        }
    } catch (const std::exception& e) {
        ctx.addError(DiagnosticCode::CustomValidationFailed, e.what());
    }
}

void Validator::validateObject(const Value& value, const ObjectSchema& object,
                               ValidationContext& ctx) const {
    if ((value.isUndefined() && object.isOptional()) ||
        (value.isNull() && object.isNullable())) {
        return;
    }
    if (!value.isObject()) {
        ctx.addError(DiagnosticCode::NotObject,
                     fmt::format("Expected object, received {}",
                                 value.kindName()),
                     "object", std::string(value.kindName()));
        return;
    }

    for (const auto& field : object.fields()) {
        if (ctx.shouldStop()) {
            return;
        }
        auto scope = ctx.enterField(field.name);
        validate(value.get(field.name), *field.node, ctx);
    }

    if (ctx.isStrict()) {
        std::vector<std::string> extras;
        for (const auto& [key, member] : value.asObject()) {
            if (object.field(key) == nullptr) {
                extras.push_back(key);
            }
        }
        if (!extras.empty()) {
            ctx.addWarning(DiagnosticCode::ExtraProperties,
                           fmt::format("Unexpected properties: {}",
                                       utils::joinStrings(extras, ", ")));
        }
    }
}

void Validator::validateArray(const Value& value, const ArraySchema& array,
                              ValidationContext& ctx) const {
    if ((value.isUndefined() && array.isOptional()) ||
        (value.isNull() && array.isNullable())) {
        return;
    }
    if (!value.isArray()) {
        ctx.addError(DiagnosticCode::NotArray,
                     fmt::format("Expected array, received {}",
                                 value.kindName()),
                     "array", std::string(value.kindName()));
        return;
    }

    const auto& items = value.asArray();
    if (auto min = array.getMinLength(); min && items.size() < *min) {
        ctx.addError(DiagnosticCode::ArrayTooShort,
                     fmt::format("Array must contain at least {} items", *min),
                     fmt::format("at least {} items", *min),
                     fmt::format("{} items", items.size()));
    }
    if (auto max = array.getMaxLength(); max && items.size() > *max) {
        ctx.addError(DiagnosticCode::ArrayTooLong,
                     fmt::format("Array must contain at most {} items", *max),
                     fmt::format("at most {} items", *max),
                     fmt::format("{} items", items.size()));
    }

    if (array.isUnique()) {
        std::unordered_map<std::string, std::vector<std::size_t>> groups;
        for (std::size_t i = 0; i < items.size(); ++i) {
            groups[items[i].canonical()].push_back(i);
        }
        // Canonical text is depth-bounded and names functions only, so equal
        // keys are confirmed with a full comparison.
        std::vector<bool> duplicate(items.size(), false);
        for (const auto& [key, indices] : groups) {
            if (indices.size() < 2) {
                continue;
            }
            for (std::size_t a = 0; a < indices.size(); ++a) {
                for (std::size_t b = a + 1; b < indices.size(); ++b) {
                    if (items[indices[a]] == items[indices[b]]) {
                        duplicate[indices[a]] = true;
                        duplicate[indices[b]] = true;
                    }
                }
            }
        }
        for (std::size_t i = 0; i < items.size() && !ctx.shouldStop(); ++i) {
            if (duplicate[i]) {
                auto scope = ctx.enterIndex(i);
                ctx.addError(DiagnosticCode::DuplicateItem, "Duplicate item",
                             std::nullopt, items[i].toDisplayString());
            }
        }
    }

    for (std::size_t i = 0; i < items.size(); ++i) {
        if (ctx.shouldStop()) {
            return;
        }
        auto scope = ctx.enterIndex(i);
        validate(items[i], array.items(), ctx);
    }
}

}  // namespace vigil::schema
