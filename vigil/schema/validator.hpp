/*
 * validator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Recursive schema validator

**************************************************/

#ifndef VIGIL_SCHEMA_VALIDATOR_HPP
#define VIGIL_SCHEMA_VALIDATOR_HPP

#include "vigil/schema/context.hpp"
#include "vigil/schema/registry.hpp"
#include "vigil/schema/schema.hpp"
#include "vigil/type/value.hpp"

namespace vigil::schema {

/**
 * @brief Walks a value alongside a schema and records every violation.
 *
 * Data problems never throw: they end up as diagnostics in the context.
 * Custom validators and type predicates that throw are recorded as
 * CUSTOM_VALIDATION_FAILED.
 */
class Validator {
public:
    explicit Validator(const Registries& registries) noexcept
        : registries_(registries) {}

    /**
     * @brief Validates @p value against @p schema at the context's path.
     */
    void validate(const type::Value& value, const SchemaNode& schema,
                  ValidationContext& ctx) const;

private:
    void validateLeaf(const type::Value& value, const LeafSchema& leaf,
                      ValidationContext& ctx) const;
    void validateObject(const type::Value& value, const ObjectSchema& object,
                        ValidationContext& ctx) const;
    void validateArray(const type::Value& value, const ArraySchema& array,
                       ValidationContext& ctx) const;

    auto checkCustomType(const type::Value& value, const std::string& name,
                         ValidationContext& ctx) const -> bool;
    void runNamedValidator(const type::Value& value, const LeafSchema& leaf,
                           ValidationContext& ctx) const;

    const Registries& registries_;
};

}  // namespace vigil::schema

#endif  // VIGIL_SCHEMA_VALIDATOR_HPP
