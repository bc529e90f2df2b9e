/*
 * transformer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Reshaping of validated data and default filling

**************************************************/

#ifndef VIGIL_SCHEMA_TRANSFORMER_HPP
#define VIGIL_SCHEMA_TRANSFORMER_HPP

#include <string>

#include "vigil/schema/registry.hpp"
#include "vigil/schema/schema.hpp"
#include "vigil/type/value.hpp"

namespace vigil::schema {

/**
 * @brief Produces new values shaped by a schema. Inputs are never modified.
 */
class Transformer {
public:
    explicit Transformer(const Registries& registries) noexcept
        : registries_(registries) {}

    /**
     * @brief Applies leaf transforms and drops undeclared object keys.
     *
     * Meant for data that already validated. Leaves use their inline
     * transform, else the transformer named by their custom type, else pass
     * through; null and undefined always pass through. Objects keep only the
     * declared keys present in the input, in declaration order.
     *
     * @throws error::TransformError when a transform throws, with the path
     * of the offending value in the message
     */
    [[nodiscard]] auto transform(const type::Value& value,
                                 const SchemaNode& schema) const
        -> type::Value;

    /**
     * @brief Fills missing object fields from leaf defaults.
     *
     * Present nested objects and array elements are recursed into. Values
     * that do not have the shape the schema expects are returned unchanged.
     */
    [[nodiscard]] auto applyDefaults(const type::Value& value,
                                     const SchemaNode& schema) const
        -> type::Value;

private:
    auto transformAt(const type::Value& value, const SchemaNode& schema,
                     std::string& path) const -> type::Value;
    auto transformLeaf(const type::Value& value, const LeafSchema& leaf,
                       const std::string& path) const -> type::Value;

    const Registries& registries_;
};

}  // namespace vigil::schema

#endif  // VIGIL_SCHEMA_TRANSFORMER_HPP
