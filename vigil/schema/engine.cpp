/*
 * engine.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Validation engine facade owning the sealed registries

**************************************************/

#include "engine.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "vigil/schema/context.hpp"
#include "vigil/schema/transformer.hpp"
#include "vigil/schema/validator.hpp"

namespace vigil::schema {

using type::Value;

namespace {
auto readBool(const json& doc, const char* key, bool fallback) -> bool {
    auto it = doc.find(key);
    if (it == doc.end()) {
        return fallback;
    }
    if (!it->is_boolean()) {
        throw std::invalid_argument(std::string("Option '") + key +
                                    "' must be a boolean");
    }
    return it->get<bool>();
}

auto readCount(const json& doc, const char* key, std::size_t fallback)
    -> std::size_t {
    auto it = doc.find(key);
    if (it == doc.end()) {
        return fallback;
    }
    if (!it->is_number_integer() || it->get<std::int64_t>() < 0) {
        throw std::invalid_argument(std::string("Option '") + key +
                                    "' must be a non-negative integer");
    }
    return it->get<std::size_t>();
}

auto sealed(Registries registries) -> std::shared_ptr<const Registries> {
    registries.seal();
    return std::make_shared<const Registries>(std::move(registries));
}
}  // namespace

auto ValidateOptions::fromJson(const json& doc) -> ValidateOptions {
    if (!doc.is_object()) {
        throw std::invalid_argument("Validation options must be an object");
    }
    ValidateOptions options;
    options.strict = readBool(doc, "strict", options.strict);
    options.transform = readBool(doc, "transform", options.transform);
    options.failFast = readBool(doc, "failFast", options.failFast);
    options.applyDefaults =
        readBool(doc, "applyDefaults", options.applyDefaults);
    options.maxErrors = readCount(doc, "maxErrors", options.maxErrors);
    return options;
}

auto ValidateOptions::toJson() const -> json {
    return {{"strict", strict},
            {"transform", transform},
            {"failFast", failFast},
            {"applyDefaults", applyDefaults},
            {"maxErrors", maxErrors}};
}

Engine::Engine() : Engine(Registries::withDefaults()) {}

Engine::Engine(Registries registries)
    : registries_(sealed(std::move(registries))) {}

auto Engine::validate(const Value& data, const SchemaNode& schema,
                      const ValidateOptions& options) const
    -> ValidationResult {
    const Value subject =
        options.applyDefaults ? applyDefaults(data, schema) : data;

    ValidationContext ctx(options.strict, options.failFast, options.maxErrors);
    Validator(*registries_).validate(subject, schema, ctx);

    ValidationResult result;
    result.errors = ctx.takeErrors();
    result.warnings = ctx.takeWarnings();
    result.valid = result.errors.empty();

    if (result.valid) {
        if (options.transform) {
            result.transformed = transform(subject, schema);
        } else if (options.applyDefaults) {
            result.transformed = subject;
        }
    }

    spdlog::debug("Validation finished: valid={}, {} errors, {} warnings",
                  result.valid, result.errors.size(), result.warnings.size());
    return result;
}

auto Engine::transform(const Value& data, const SchemaNode& schema) const
    -> Value {
    return Transformer(*registries_).transform(data, schema);
}

auto Engine::applyDefaults(const Value& data, const SchemaNode& schema) const
    -> Value {
    return Transformer(*registries_).applyDefaults(data, schema);
}

}  // namespace vigil::schema
