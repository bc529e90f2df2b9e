/*
 * sanitizer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Schema-independent sanitization pipeline

**************************************************/

#ifndef VIGIL_SANITIZE_SANITIZER_HPP
#define VIGIL_SANITIZE_SANITIZER_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "vigil/type/value.hpp"

namespace vigil::sanitize {

using json = nlohmann::json;

/**
 * @brief Toggles and limits of the sanitization pipeline.
 */
struct SanitizationConfig {
    bool removeScripts{true};
    bool removeStyles{true};
    bool removeComments{true};
    bool escapeHtml{true};
    bool normalizeWhitespace{true};
    bool stripNonAlphanumeric{false};
    bool stripControlCharacters{true};
    /// Maximum length in code points, applied last.
    std::optional<std::size_t> maxLength;
    /// When non-empty, tags outside this list are dropped (text kept).
    std::vector<std::string> allowedTags;
    /// Attributes kept on allowed tags.
    std::vector<std::string> allowedAttributes;
    /// Deeper nesting is replaced by null.
    std::size_t maxDepth{64};
    /// Upper bound on the markup removal passes.
    std::size_t maxPasses{32};
    /// Caller stages, run in order after the built-in stages and before
    /// truncation. Not part of the JSON form.
    std::vector<std::function<std::string(std::string_view)>> extraStages;

    [[nodiscard]] static auto defaults() -> SanitizationConfig { return {}; }

    /**
     * @brief Reads a configuration from JSON, starting from the defaults.
     * Unknown keys are ignored.
     * @throws std::invalid_argument when a known key has the wrong type
     */
    [[nodiscard]] static auto fromJson(const json& doc) -> SanitizationConfig;
    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief Output of the pipeline.
 */
struct SanitizationResult {
    type::Value sanitized;
    /// Every removed fragment, in removal order.
    std::vector<std::string> removed;
    std::vector<std::string> warnings;

    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief Sanitizes every string reachable in @p data.
 *
 * Strings go through the stages below, each behind its toggle:
 *  1. control characters are stripped (tab, newline and carriage return
 *     are kept);
 *  2. whitespace runs collapse to one space and the ends are trimmed;
 *  3. script, iframe, object and embed blocks, link, meta and base tags,
 *     `on*` handlers and `javascript:`/`vbscript:` URIs are removed;
 *  4. style blocks and inline style attributes are removed;
 *  5. comments are removed;
 *  6. tags outside a non-empty `allowedTags` are dropped;
 *  7. `& < > " ' /` are escaped;
 *  8. everything but ASCII letters, digits and whitespace is stripped;
 *  9. `extraStages` run in order;
 * 10. the text is truncated to `maxLength` code points.
 *
 * Stages 3 to 6 repeat until nothing more is removed, at most `maxPasses`
 * times; a string still changing on the last pass gets a warning. Arrays are mapped and
 * object keys and values are sanitized; other kinds pass through. Nesting
 * beyond `maxDepth` becomes null with a warning.
 *
 * Never throws. If a stage fails the string is returned unchanged and a
 * warning says so.
 *
 * Escaping is not idempotent: sanitizing escaped output escapes the
 * ampersands again.
 */
[[nodiscard]] auto sanitize(const type::Value& data,
                            const SanitizationConfig& config = {})
    -> SanitizationResult;

/**
 * @brief Runs the string stages on one string.
 *
 * Removed fragments are appended to @p removed and problems that do not
 * stop the pipeline to @p warnings. A failing stage throws.
 */
[[nodiscard]] auto sanitizeString(std::string_view text,
                                  const SanitizationConfig& config,
                                  std::vector<std::string>& removed,
                                  std::vector<std::string>& warnings)
    -> std::string;

}  // namespace vigil::sanitize

#endif  // VIGIL_SANITIZE_SANITIZER_HPP
