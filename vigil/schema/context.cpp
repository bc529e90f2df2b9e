/*
 * context.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Per-call validation state: path and accumulated diagnostics

**************************************************/

#include "context.hpp"

#include <fmt/format.h>

namespace vigil::schema {

auto ValidationContext::enterField(std::string_view name) -> PathScope {
    std::size_t previous = path_.size();
    if (!path_.empty()) {
        path_.push_back('.');
    }
    path_.append(name);
    return {*this, previous};
}

auto ValidationContext::enterIndex(std::size_t index) -> PathScope {
    std::size_t previous = path_.size();
    path_ += fmt::format("[{}]", index);
    return {*this, previous};
}

void ValidationContext::addError(DiagnosticCode code, std::string message,
                                 std::optional<std::string> expected,
                                 std::optional<std::string> received) {
    if (maxErrors_ > 0 && errors_.size() >= maxErrors_) {
        return;
    }
    errors_.push_back(Diagnostic{path_, code, std::move(message),
                                 std::move(expected), std::move(received)});
}

void ValidationContext::addWarning(DiagnosticCode code, std::string message) {
    warnings_.push_back(
        Diagnostic{path_, code, std::move(message), std::nullopt, std::nullopt});
}

auto ValidationContext::shouldStop() const noexcept -> bool {
    if (failFast_ && !errors_.empty()) {
        return true;
    }
    return maxErrors_ > 0 && errors_.size() >= maxErrors_;
}

}  // namespace vigil::schema
