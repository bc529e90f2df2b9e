/*
 * engine.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Validation engine facade owning the sealed registries

**************************************************/

#ifndef VIGIL_SCHEMA_ENGINE_HPP
#define VIGIL_SCHEMA_ENGINE_HPP

#include <cstddef>
#include <memory>

#include <nlohmann/json.hpp>

#include "vigil/schema/diagnostic.hpp"
#include "vigil/schema/registry.hpp"
#include "vigil/schema/schema.hpp"
#include "vigil/type/value.hpp"

namespace vigil::schema {

/**
 * @brief Options of a validation call
 */
struct ValidateOptions {
    bool strict{false};         ///< Warn about undeclared object keys.
    bool transform{false};      ///< Fill `transformed` when valid.
    bool failFast{false};       ///< Stop at the first error.
    bool applyDefaults{false};  ///< Fill leaf defaults before validating.
    std::size_t maxErrors{0};   ///< Error budget, 0 for unlimited.

    /**
     * @brief Reads options from JSON. Unknown keys are ignored.
     * @throws std::invalid_argument when a known key has the wrong type
     */
    [[nodiscard]] static auto fromJson(const json& doc) -> ValidateOptions;
    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief Entry point for validation and transformation.
 *
 * Construction seals the registries it is given; from then on they are read
 * only, and the engine can be shared freely between threads.
 *
 * @code
 * Engine engine;  // built-in formats
 * auto result = engine.validate(data, schema, {.strict = true});
 * @endcode
 */
class Engine {
public:
    /// Engine over Registries::withDefaults().
    Engine();
    explicit Engine(Registries registries);

    /**
     * @brief Validates @p data against @p schema.
     *
     * Never throws for problems with the data. When `transform` is set and
     * the data is valid, `transformed` holds the transformed copy; when only
     * `applyDefaults` is set it holds the default-filled copy.
     *
     * @throws error::TransformError when a transform function throws
     */
    [[nodiscard]] auto validate(const type::Value& data,
                                const SchemaNode& schema,
                                const ValidateOptions& options = {}) const
        -> ValidationResult;

    /// @see Transformer::transform
    [[nodiscard]] auto transform(const type::Value& data,
                                 const SchemaNode& schema) const
        -> type::Value;

    /// @see Transformer::applyDefaults
    [[nodiscard]] auto applyDefaults(const type::Value& data,
                                     const SchemaNode& schema) const
        -> type::Value;

    [[nodiscard]] auto registries() const noexcept -> const Registries& {
        return *registries_;
    }

private:
    std::shared_ptr<const Registries> registries_;
};

}  // namespace vigil::schema

#endif  // VIGIL_SCHEMA_ENGINE_HPP
