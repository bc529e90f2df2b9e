/*
 * context.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Per-call validation state: path and accumulated diagnostics

**************************************************/

#ifndef VIGIL_SCHEMA_CONTEXT_HPP
#define VIGIL_SCHEMA_CONTEXT_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "vigil/schema/diagnostic.hpp"

namespace vigil::schema {

/**
 * @brief State of one validation call.
 *
 * Tracks the path of the value under inspection and collects errors and
 * warnings. A context lives for a single call and is not shared.
 */
class ValidationContext {
public:
    /**
     * @brief Restores the path when it goes out of scope.
     */
    class PathScope {
    public:
        PathScope(ValidationContext& ctx, std::size_t restoreTo) noexcept
            : ctx_(&ctx), restoreTo_(restoreTo) {}
        PathScope(const PathScope&) = delete;
        auto operator=(const PathScope&) -> PathScope& = delete;
        PathScope(PathScope&& other) noexcept
            : ctx_(other.ctx_), restoreTo_(other.restoreTo_) {
            other.ctx_ = nullptr;
        }
        auto operator=(PathScope&&) -> PathScope& = delete;
        ~PathScope() {
            if (ctx_ != nullptr) {
                ctx_->path_.resize(restoreTo_);
            }
        }

    private:
        ValidationContext* ctx_;
        std::size_t restoreTo_;
    };

    ValidationContext(bool strict, bool failFast,
                      std::size_t maxErrors) noexcept
        : strict_(strict), failFast_(failFast), maxErrors_(maxErrors) {}

    /// Appends a field segment (`a.b`) until the returned scope ends.
    [[nodiscard]] auto enterField(std::string_view name) -> PathScope;
    /// Appends an index segment (`a[3]`) until the returned scope ends.
    [[nodiscard]] auto enterIndex(std::size_t index) -> PathScope;

    /// Current path; empty at the root.
    [[nodiscard]] auto path() const noexcept -> const std::string& {
        return path_;
    }

    void addError(DiagnosticCode code, std::string message,
                  std::optional<std::string> expected = std::nullopt,
                  std::optional<std::string> received = std::nullopt);
    void addWarning(DiagnosticCode code, std::string message);

    [[nodiscard]] auto isStrict() const noexcept -> bool { return strict_; }

    /// True once fail-fast or the error budget ends the walk.
    [[nodiscard]] auto shouldStop() const noexcept -> bool;

    [[nodiscard]] auto errors() const noexcept
        -> const std::vector<Diagnostic>& {
        return errors_;
    }
    [[nodiscard]] auto warnings() const noexcept
        -> const std::vector<Diagnostic>& {
        return warnings_;
    }

    [[nodiscard]] auto takeErrors() noexcept -> std::vector<Diagnostic> {
        return std::move(errors_);
    }
    [[nodiscard]] auto takeWarnings() noexcept -> std::vector<Diagnostic> {
        return std::move(warnings_);
    }

private:
    std::string path_;
    bool strict_;
    bool failFast_;
    std::size_t maxErrors_;
    std::vector<Diagnostic> errors_;
    std::vector<Diagnostic> warnings_;
};

}  // namespace vigil::schema

#endif  // VIGIL_SCHEMA_CONTEXT_HPP
