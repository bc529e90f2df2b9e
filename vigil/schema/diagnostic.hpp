/*
 * diagnostic.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Validation diagnostics and results

**************************************************/

#ifndef VIGIL_SCHEMA_DIAGNOSTIC_HPP
#define VIGIL_SCHEMA_DIAGNOSTIC_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "vigil/type/value.hpp"

namespace vigil::schema {

using json = nlohmann::json;

/**
 * @brief Closed set of diagnostic codes.
 *
 * ExtraProperties is only ever reported as a warning.
 */
enum class DiagnosticCode : std::uint8_t {
    RequiredField,
    NullNotAllowed,
    TypeMismatch,
    CustomValidationFailed,
    InvalidSchema,
    NotArray,
    ArrayTooShort,
    ArrayTooLong,
    DuplicateItem,
    NotObject,
    ExtraProperties
};

/**
 * @brief Stable wire name of a code ("REQUIRED_FIELD", ...).
 */
[[nodiscard]] auto codeName(DiagnosticCode code) noexcept -> std::string_view;

/**
 * @brief A single error or warning, located by its path in the data.
 */
struct Diagnostic {
    std::string path;
    DiagnosticCode code;
    std::string message;
    std::optional<std::string> expected;
    std::optional<std::string> received;

    /**
     * @brief Converts the diagnostic to JSON format
     * @return JSON object with path, code, message and, when known, the
     * expected and received descriptions
     */
    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief Outcome of a validation call.
 */
struct ValidationResult {
    bool valid{true};
    std::vector<Diagnostic> errors;
    std::vector<Diagnostic> warnings;
    std::optional<type::Value> transformed;

    [[nodiscard]] auto toJson() const -> json;
};

}  // namespace vigil::schema

#endif  // VIGIL_SCHEMA_DIAGNOSTIC_HPP
