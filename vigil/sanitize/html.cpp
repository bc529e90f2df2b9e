/*
 * html.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: HTML escaping, tag scanning and allow-list filtering

**************************************************/

#include "html.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include "vigil/utils/string.hpp"

namespace vigil::sanitize {

namespace detail {

namespace {
auto isAlpha(char c) -> bool {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

auto isSpace(char c) -> bool {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

auto isNameChar(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' ||
           c == ':';
}

auto isSafeAttributeName(std::string_view name) -> bool {
    return !name.empty() && std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' ||
               c == '_' || c == ':' || c == '.';
    });
}

auto escapeAttribute(std::string_view value) -> std::string {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&#x27;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            default:
                out.push_back(c);
        }
    }
    return out;
}

auto contains(const std::vector<std::string_view>& names,
              std::string_view name) -> bool {
    return std::find(names.begin(), names.end(), name) != names.end();
}

auto contains(const std::vector<std::string>& names, std::string_view name)
    -> bool {
    return std::find(names.begin(), names.end(), name) != names.end();
}

struct ScannedTag {
    HtmlTag tag;
    std::size_t end;
    bool terminated;
};

/// Scans a tag. Running out of input yields an unterminated tag that spans
/// the rest of the text.
auto scanTag(std::string_view text, std::size_t pos)
    -> std::optional<ScannedTag> {
    const std::size_t n = text.size();
    std::size_t i = pos + 1;
    ScannedTag scanned{HtmlTag{}, n, false};
    HtmlTag& tag = scanned.tag;
    if (i < n && text[i] == '/') {
        tag.closing = true;
        ++i;
    }
    if (i >= n || !isAlpha(text[i])) {
        return std::nullopt;
    }
    std::size_t start = i;
    while (i < n && isNameChar(text[i])) {
        ++i;
    }
    tag.name = utils::toLower(text.substr(start, i - start));

    while (true) {
        while (i < n && isSpace(text[i])) {
            ++i;
        }
        if (i >= n) {
            return scanned;
        }
        if (text[i] == '>') {
            scanned.end = i + 1;
            scanned.terminated = true;
            return scanned;
        }
        if (text[i] == '/') {
            if (i + 1 < n && text[i + 1] == '>') {
                tag.selfClosing = true;
                scanned.end = i + 2;
                scanned.terminated = true;
                return scanned;
            }
            ++i;
            continue;
        }

        std::size_t attrStart = i;
        while (i < n && !isSpace(text[i]) && text[i] != '=' &&
               text[i] != '>' && text[i] != '/') {
            ++i;
        }
        if (i == attrStart) {
            ++i;
            continue;
        }
        HtmlAttribute attr;
        attr.name = utils::toLower(text.substr(attrStart, i - attrStart));

        std::size_t j = i;
        while (j < n && isSpace(text[j])) {
            ++j;
        }
        if (j < n && text[j] == '=') {
            ++j;
            while (j < n && isSpace(text[j])) {
                ++j;
            }
            if (j < n && (text[j] == '"' || text[j] == '\'')) {
                std::size_t close = text.find(text[j], j + 1);
                if (close == std::string_view::npos) {
                    attr.value = std::string(text.substr(j + 1));
                    attr.raw = std::string(text.substr(attrStart));
                    tag.attributes.push_back(std::move(attr));
                    return scanned;
                }
                attr.value = std::string(text.substr(j + 1, close - j - 1));
                i = close + 1;
            } else {
                std::size_t valueStart = j;
                while (j < n && !isSpace(text[j]) && text[j] != '>') {
                    ++j;
                }
                attr.value = std::string(text.substr(valueStart, j - valueStart));
                i = j;
            }
        }
        attr.raw = std::string(text.substr(attrStart, i - attrStart));
        tag.attributes.push_back(std::move(attr));
    }
}

/// Finds `</name` followed by a non-name character, from @p from on.
auto findClosingTag(std::string_view text, std::string_view name,
                    std::size_t from) -> std::size_t {
    std::string needle = "</" + std::string(name);
    while (true) {
        std::size_t pos = utils::ifind(text, needle, from);
        if (pos == std::string_view::npos) {
            return pos;
        }
        std::size_t after = pos + needle.size();
        if (after >= text.size() || !isNameChar(text[after])) {
            return pos;
        }
        from = pos + 1;
    }
}

auto lowered(const std::vector<std::string>& names)
    -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(names.size());
    for (const auto& name : names) {
        out.push_back(utils::toLower(utils::trim(name)));
    }
    return out;
}
}  // namespace

auto parseTag(std::string_view text, std::size_t pos)
    -> std::optional<std::pair<HtmlTag, std::size_t>> {
    auto scanned = scanTag(text, pos);
    if (!scanned || !scanned->terminated) {
        return std::nullopt;
    }
    return std::make_pair(std::move(scanned->tag), scanned->end);
}

auto renderTag(const HtmlTag& tag) -> std::string {
    std::string out = "<";
    if (tag.closing) {
        out += '/';
        out += tag.name;
        out += '>';
        return out;
    }
    out += tag.name;
    for (const auto& attr : tag.attributes) {
        if (!isSafeAttributeName(attr.name)) {
            continue;
        }
        out += ' ';
        out += attr.name;
        if (attr.value) {
            out += "=\"";
            out += escapeAttribute(*attr.value);
            out += '"';
        }
    }
    out += tag.selfClosing ? " />" : ">";
    return out;
}

auto isDangerousUri(std::string_view value) -> bool {
    std::string compact;
    compact.reserve(std::min<std::size_t>(value.size(), 32));
    for (char c : value) {
        if (static_cast<unsigned char>(c) <= 0x20) {
            continue;
        }
        compact.push_back(static_cast<char>(
            std::tolower(static_cast<unsigned char>(c))));
        if (compact.size() >= 32) {
            break;
        }
    }
    return compact.starts_with("javascript:") ||
           compact.starts_with("vbscript:") ||
           compact.starts_with("data:text/html");
}

auto isEventHandler(const HtmlAttribute& attribute) -> bool {
    return attribute.name.size() > 2 && attribute.name.starts_with("on");
}

auto applyRules(std::string_view text, const MarkupRules& rules,
                std::vector<std::string>& removed) -> std::string {
    std::string out;
    out.reserve(text.size());
    const std::size_t n = text.size();
    std::size_t i = 0;
    while (i < n) {
        std::size_t lt = text.find('<', i);
        if (lt == std::string_view::npos) {
            out.append(text.substr(i));
            break;
        }
        out.append(text.substr(i, lt - i));

        auto scanned = scanTag(text, lt);
        if (!scanned) {
            out.push_back('<');
            i = lt + 1;
            continue;
        }
        HtmlTag& tag = scanned->tag;
        const bool isBlock = contains(rules.blockTags, tag.name);

        if (isBlock && !tag.closing) {
            std::size_t end = scanned->end;
            if (scanned->terminated && !tag.selfClosing) {
                std::size_t close = findClosingTag(text, tag.name, end);
                if (close != std::string_view::npos) {
                    std::size_t gt = text.find('>', close);
                    end = gt == std::string_view::npos ? n : gt + 1;
                }
            }
            removed.emplace_back(text.substr(lt, end - lt));
            i = end;
            continue;
        }
        if (isBlock || contains(rules.droppedTags, tag.name)) {
            removed.emplace_back(text.substr(lt, scanned->end - lt));
            i = scanned->end;
            continue;
        }

        std::vector<HtmlAttribute> kept;
        std::vector<std::string> dropped;
        if (rules.dropAttribute && !tag.closing) {
            for (auto& attr : tag.attributes) {
                if (rules.dropAttribute(attr)) {
                    dropped.push_back(attr.raw);
                } else {
                    kept.push_back(std::move(attr));
                }
            }
        }

        if (!scanned->terminated) {
            if (dropped.empty()) {
                out.push_back('<');
                i = lt + 1;
            } else {
                removed.emplace_back(text.substr(lt));
                i = n;
            }
            continue;
        }
        if (dropped.empty()) {
            out.append(text.substr(lt, scanned->end - lt));
        } else {
            removed.insert(removed.end(), dropped.begin(), dropped.end());
            tag.attributes = std::move(kept);
            out += renderTag(tag);
        }
        i = scanned->end;
    }
    return out;
}

auto removeComments(std::string_view text, std::vector<std::string>& removed)
    -> std::string {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        std::size_t start = text.find("<!--", i);
        if (start == std::string_view::npos) {
            out.append(text.substr(i));
            break;
        }
        out.append(text.substr(i, start - i));
        std::size_t close = text.find("-->", start + 4);
        std::size_t end =
            close == std::string_view::npos ? text.size() : close + 3;
        removed.emplace_back(text.substr(start, end - start));
        i = end;
    }
    return out;
}

auto removeScriptSchemes(std::string_view text,
                         std::vector<std::string>& removed) -> std::string {
    static constexpr std::array<std::string_view, 2> K_SCHEMES{"javascript:",
                                                               "vbscript:"};
    std::string out(text);
    for (auto scheme : K_SCHEMES) {
        std::size_t pos = 0;
        while ((pos = utils::ifind(out, scheme, pos)) !=
               std::string_view::npos) {
            removed.push_back(out.substr(pos, scheme.size()));
            out.erase(pos, scheme.size());
        }
    }
    return out;
}

auto filterTags(std::string_view text,
                const std::vector<std::string>& allowedTags,
                const std::vector<std::string>& allowedAttributes,
                bool escapeStray, std::vector<std::string>& removed)
    -> std::string {
    const auto tags = lowered(allowedTags);
    const auto attributes = lowered(allowedAttributes);
    const std::string_view strayLt = escapeStray ? "&lt;" : "<";

    std::string out;
    out.reserve(text.size());
    const std::size_t n = text.size();
    std::size_t i = 0;
    while (i < n) {
        std::size_t lt = text.find('<', i);
        if (lt == std::string_view::npos) {
            out.append(text.substr(i));
            break;
        }
        out.append(text.substr(i, lt - i));

        if (lt + 1 < n && (text[lt + 1] == '!' || text[lt + 1] == '?')) {
            std::size_t gt = text.find('>', lt);
            std::size_t end = gt == std::string_view::npos ? n : gt + 1;
            removed.emplace_back(text.substr(lt, end - lt));
            i = end;
            continue;
        }

        auto scanned = scanTag(text, lt);
        if (!scanned || !scanned->terminated) {
            out.append(strayLt);
            i = lt + 1;
            continue;
        }
        HtmlTag& tag = scanned->tag;
        if (!contains(tags, tag.name)) {
            removed.emplace_back(text.substr(lt, scanned->end - lt));
            i = scanned->end;
            continue;
        }

        std::vector<HtmlAttribute> kept;
        for (auto& attr : tag.attributes) {
            bool allowed = contains(attributes, attr.name) &&
                           !isEventHandler(attr) &&
                           !(attr.value && isDangerousUri(*attr.value));
            if (allowed) {
                kept.push_back(std::move(attr));
            } else {
                removed.push_back(attr.raw);
            }
        }
        tag.attributes = std::move(kept);
        out += renderTag(tag);
        i = scanned->end;
    }
    return out;
}

}  // namespace detail

auto escapeHtml(std::string_view text) -> std::string {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':
                result += "&amp;";
                break;
            case '<':
                result += "&lt;";
                break;
            case '>':
                result += "&gt;";
                break;
            case '"':
                result += "&quot;";
                break;
            case '\'':
                result += "&#x27;";
                break;
            case '/':
                result += "&#x2F;";
                break;
            default:
                result += c;
        }
    }
    return result;
}

auto sanitizeHtml(std::string_view html,
                  const std::vector<std::string>& allowedTags,
                  const std::vector<std::string>& allowedAttributes)
    -> std::string {
    std::vector<std::string> removed;
    const bool keepScript = std::any_of(
        allowedTags.begin(), allowedTags.end(),
        [](const std::string& t) { return utils::iequals(t, "script"); });
    const bool keepStyle = std::any_of(
        allowedTags.begin(), allowedTags.end(),
        [](const std::string& t) { return utils::iequals(t, "style"); });

    detail::MarkupRules rules;
    if (!keepScript) {
        rules.blockTags.emplace_back("script");
    }
    if (!keepStyle) {
        rules.blockTags.emplace_back("style");
    }

    std::string text = detail::removeComments(html, removed);
    text = detail::applyRules(text, rules, removed);
    return detail::filterTags(text, allowedTags, allowedAttributes, true,
                              removed);
}

}  // namespace vigil::sanitize
