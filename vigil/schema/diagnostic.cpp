/*
 * diagnostic.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Validation diagnostics and results

**************************************************/

#include "diagnostic.hpp"

#include "vigil/type/value_json.hpp"

namespace vigil::schema {

auto codeName(DiagnosticCode code) noexcept -> std::string_view {
    switch (code) {
        case DiagnosticCode::RequiredField:
            return "REQUIRED_FIELD";
        case DiagnosticCode::NullNotAllowed:
            return "NULL_NOT_ALLOWED";
        case DiagnosticCode::TypeMismatch:
            return "TYPE_MISMATCH";
        case DiagnosticCode::CustomValidationFailed:
            return "CUSTOM_VALIDATION_FAILED";
        case DiagnosticCode::InvalidSchema:
            return "INVALID_SCHEMA";
        case DiagnosticCode::NotArray:
            return "NOT_ARRAY";
        case DiagnosticCode::ArrayTooShort:
            return "ARRAY_TOO_SHORT";
        case DiagnosticCode::ArrayTooLong:
            return "ARRAY_TOO_LONG";
        case DiagnosticCode::DuplicateItem:
            return "DUPLICATE_ITEM";
        case DiagnosticCode::NotObject:
            return "NOT_OBJECT";
        case DiagnosticCode::ExtraProperties:
            return "EXTRA_PROPERTIES";
    }
    return "UNKNOWN";
}

auto Diagnostic::toJson() const -> json {
    json out = {{"path", path},
                {"code", std::string(codeName(code))},
                {"message", message}};
    if (expected) {
        out["expected"] = *expected;
    }
    if (received) {
        out["received"] = *received;
    }
    return out;
}

auto ValidationResult::toJson() const -> json {
    json errorArray = json::array();
    for (const auto& error : errors) {
        errorArray.push_back(error.toJson());
    }
    json warningArray = json::array();
    for (const auto& warning : warnings) {
        warningArray.push_back(warning.toJson());
    }
    json out = {{"valid", valid},
                {"errors", std::move(errorArray)},
                {"warnings", std::move(warningArray)}};
    if (transformed) {
        out["transformed"] = type::toJson(*transformed);
    }
    return out;
}

}  // namespace vigil::schema
