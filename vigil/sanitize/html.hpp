/*
 * html.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: HTML escaping, tag scanning and allow-list filtering

**************************************************/

#ifndef VIGIL_SANITIZE_HTML_HPP
#define VIGIL_SANITIZE_HTML_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vigil::sanitize {

/**
 * @brief Escapes `& < > " ' /` as HTML entities.
 *
 * Not idempotent: escaping `&amp;` again yields `&amp;amp;`.
 */
[[nodiscard]] auto escapeHtml(std::string_view text) -> std::string;

/**
 * @brief Filters markup through tag and attribute allow-lists.
 *
 * Script and style blocks are removed with their content unless their tag
 * is allowed. Other tags outside @p allowedTags are dropped while their text
 * is kept. Allowed tags are rebuilt with only the attributes listed in
 * @p allowedAttributes, minus event handlers (`on*`) and `javascript:` or
 * `vbscript:` URIs; attribute values are escaped. Comments are removed and
 * a `<` that does not start a tag is escaped.
 *
 * @code
 * sanitizeHtml("<p onclick=x()>Hi <b>there</b></p><script>x()</script>",
 *              {"p", "b"}, {});
 * // "<p>Hi <b>there</b></p>"
 * @endcode
 */
[[nodiscard]] auto sanitizeHtml(std::string_view html,
                                const std::vector<std::string>& allowedTags,
                                const std::vector<std::string>& allowedAttributes)
    -> std::string;

namespace detail {

struct HtmlAttribute {
    std::string name;  ///< Lower-cased.
    std::optional<std::string> value;
    std::string raw;  ///< Source text, for reporting removals.
};

struct HtmlTag {
    std::string name;  ///< Lower-cased.
    bool closing{false};
    bool selfClosing{false};
    std::vector<HtmlAttribute> attributes;
};

/**
 * @brief Parses the tag starting at `text[pos] == '<'`.
 * @return The tag and the offset just past its `>`, or std::nullopt when no
 * complete tag starts there
 */
[[nodiscard]] auto parseTag(std::string_view text, std::size_t pos)
    -> std::optional<std::pair<HtmlTag, std::size_t>>;

/// Serializes a tag with escaped, double-quoted attribute values.
[[nodiscard]] auto renderTag(const HtmlTag& tag) -> std::string;

/// `javascript:`, `vbscript:` or `data:text/html`, ignoring case and
/// embedded whitespace or control characters.
[[nodiscard]] auto isDangerousUri(std::string_view value) -> bool;

/// `on*` event handler attribute.
[[nodiscard]] auto isEventHandler(const HtmlAttribute& attribute) -> bool;

/**
 * @brief Removal rules of one markup pass.
 */
struct MarkupRules {
    /// Removed together with everything up to their closing tag.
    std::vector<std::string_view> blockTags;
    /// Removed on their own; their content is kept.
    std::vector<std::string_view> droppedTags;
    /// Attributes to strip from the tags that remain.
    std::function<bool(const HtmlAttribute&)> dropAttribute;
};

/**
 * @brief Applies one pass of @p rules, appending each removed fragment to
 * @p removed.
 * @return The filtered text
 */
[[nodiscard]] auto applyRules(std::string_view text, const MarkupRules& rules,
                              std::vector<std::string>& removed)
    -> std::string;

/**
 * @brief Removes `<!-- ... -->` comments. An unterminated comment runs to
 * the end of the text.
 */
[[nodiscard]] auto removeComments(std::string_view text,
                                  std::vector<std::string>& removed)
    -> std::string;

/**
 * @brief Removes `javascript:` and `vbscript:` scheme tokens from text.
 */
[[nodiscard]] auto removeScriptSchemes(std::string_view text,
                                       std::vector<std::string>& removed)
    -> std::string;

/**
 * @brief Drops every tag outside @p allowedTags and rebuilds the others
 * with the allowed, harmless attributes only.
 *
 * @param escapeStray Escape a `<` that does not start a tag
 */
[[nodiscard]] auto filterTags(std::string_view text,
                              const std::vector<std::string>& allowedTags,
                              const std::vector<std::string>& allowedAttributes,
                              bool escapeStray,
                              std::vector<std::string>& removed) -> std::string;

}  // namespace detail

}  // namespace vigil::sanitize

#endif  // VIGIL_SANITIZE_HTML_HPP
