/*
 * sanitizer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Schema-independent sanitization pipeline

**************************************************/

#include "sanitizer.hpp"

#include <cctype>
#include <cstdint>
#include <exception>
#include <iterator>
#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "vigil/sanitize/html.hpp"
#include "vigil/type/value_json.hpp"
#include "vigil/utils/string.hpp"

namespace vigil::sanitize {

using type::Array;
using type::Object;
using type::Value;

namespace {
auto scriptRules() -> const detail::MarkupRules& {
    static const detail::MarkupRules rules{
        {"script", "iframe", "object", "embed"},
        {"link", "meta", "base", "frame", "frameset", "applet"},
        [](const detail::HtmlAttribute& attr) {
            return detail::isEventHandler(attr) ||
                   (attr.value && detail::isDangerousUri(*attr.value));
        }};
    return rules;
}

auto styleRules() -> const detail::MarkupRules& {
    static const detail::MarkupRules rules{
        {"style"}, {}, [](const detail::HtmlAttribute& attr) {
            return attr.name == "style";
        }};
    return rules;
}

auto stripControlCharacters(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        auto byte = static_cast<unsigned char>(c);
        if ((byte < 0x20 && c != '\t' && c != '\n' && c != '\r') ||
            byte == 0x7F) {
            continue;
        }
        out.push_back(c);
    }
    return out;
}

auto stripNonAlphanumeric(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        auto byte = static_cast<unsigned char>(c);
        if (byte < 0x80 && (std::isalnum(byte) != 0 || std::isspace(byte) != 0)) {
            out.push_back(c);
        }
    }
    return out;
}

auto readBool(const json& doc, const char* key, bool fallback) -> bool {
    auto it = doc.find(key);
    if (it == doc.end()) {
        return fallback;
    }
    if (!it->is_boolean()) {
        throw std::invalid_argument(
            fmt::format("Option '{}' must be a boolean", key));
    }
    return it->get<bool>();
}

auto readCount(const json& value, const char* key) -> std::size_t {
    if (!value.is_number_integer() || value.get<std::int64_t>() < 0) {
        throw std::invalid_argument(
            fmt::format("Option '{}' must be a non-negative integer", key));
    }
    return value.get<std::size_t>();
}

auto readNames(const json& doc, const char* key) -> std::vector<std::string> {
    std::vector<std::string> names;
    auto it = doc.find(key);
    if (it == doc.end()) {
        return names;
    }
    if (!it->is_array()) {
        throw std::invalid_argument(
            fmt::format("Option '{}' must be an array of strings", key));
    }
    for (const auto& name : *it) {
        if (!name.is_string()) {
            throw std::invalid_argument(
                fmt::format("Option '{}' must be an array of strings", key));
        }
        names.push_back(utils::toLower(name.get<std::string>()));
    }
    return names;
}

class Walker {
public:
    Walker(const SanitizationConfig& config, SanitizationResult& result)
        : config_(config), result_(result) {}

    auto walk(const Value& value, std::size_t depth, const std::string& path)
        -> Value {
        if (depth > config_.maxDepth) {
            warn(fmt::format("Maximum depth {} exceeded at '{}', value replaced "
                             "by null",
                             config_.maxDepth, path));
            return Value::null();
        }
        if (value.isString()) {
            return Value(cleanString(value.asString(), path));
        }
        if (value.isArray()) {
            Array out;
            out.reserve(value.size());
            std::size_t index = 0;
            for (const auto& item : value.asArray()) {
                out.push_back(
                    walk(item, depth + 1, fmt::format("{}[{}]", path, index++)));
            }
            return Value(std::move(out));
        }
        if (value.isObject()) {
            Object out;
            for (const auto& [key, member] : value.asObject()) {
                std::string childPath = path.empty() ? key : path + "." + key;
                std::string cleanKey = cleanString(key, childPath);
                if (out.contains(cleanKey)) {
                    warn(fmt::format("Key '{}' collides with '{}' after "
                                     "sanitization, value dropped",
                                     key, cleanKey));
                    continue;
                }
                out.set(std::move(cleanKey),
                        walk(member, depth + 1, childPath));
            }
            return Value(std::move(out));
        }
        return value;
    }

private:
    auto cleanString(const std::string& text, const std::string& path)
        -> std::string {
        std::vector<std::string> removed;
        std::vector<std::string> warnings;
        try {
            std::string clean =
                sanitizeString(text, config_, removed, warnings);
            result_.removed.insert(result_.removed.end(),
                                   std::make_move_iterator(removed.begin()),
                                   std::make_move_iterator(removed.end()));
            for (auto& message : warnings) {
                warn(path.empty() ? std::move(message)
                                  : fmt::format("{} at '{}'", message, path));
            }
            return clean;
        } catch (const std::exception& e) {
            spdlog::warn("Sanitization failed at '{}': {}", path, e.what());
            result_.warnings.push_back(
                fmt::format("Sanitization failed at '{}', value left "
                            "unsanitized: {}",
                            path, e.what()));
            return text;
        }
    }

    void warn(std::string message) {
        spdlog::debug("{}", message);
        result_.warnings.push_back(std::move(message));
    }

    const SanitizationConfig& config_;
    SanitizationResult& result_;
};
}  // namespace

auto SanitizationConfig::fromJson(const json& doc) -> SanitizationConfig {
    if (!doc.is_object()) {
        throw std::invalid_argument("Sanitization config must be an object");
    }
    SanitizationConfig config;
    config.removeScripts = readBool(doc, "removeScripts", config.removeScripts);
    config.removeStyles = readBool(doc, "removeStyles", config.removeStyles);
    config.removeComments =
        readBool(doc, "removeComments", config.removeComments);
    config.escapeHtml = readBool(doc, "escapeHtml", config.escapeHtml);
    config.normalizeWhitespace =
        readBool(doc, "normalizeWhitespace", config.normalizeWhitespace);
    config.stripNonAlphanumeric =
        readBool(doc, "stripNonAlphanumeric", config.stripNonAlphanumeric);
    config.stripControlCharacters =
        readBool(doc, "stripControlCharacters", config.stripControlCharacters);
    if (auto it = doc.find("maxLength"); it != doc.end() && !it->is_null()) {
        config.maxLength = readCount(*it, "maxLength");
    }
    if (auto it = doc.find("maxDepth"); it != doc.end()) {
        config.maxDepth = readCount(*it, "maxDepth");
    }
    if (auto it = doc.find("maxPasses"); it != doc.end()) {
        config.maxPasses = readCount(*it, "maxPasses");
    }
    config.allowedTags = readNames(doc, "allowedTags");
    config.allowedAttributes = readNames(doc, "allowedAttributes");
    return config;
}

auto SanitizationConfig::toJson() const -> json {
    json out = {{"removeScripts", removeScripts},
                {"removeStyles", removeStyles},
                {"removeComments", removeComments},
                {"escapeHtml", escapeHtml},
                {"normalizeWhitespace", normalizeWhitespace},
                {"stripNonAlphanumeric", stripNonAlphanumeric},
                {"stripControlCharacters", stripControlCharacters},
                {"allowedTags", allowedTags},
                {"allowedAttributes", allowedAttributes},
                {"maxDepth", maxDepth},
                {"maxPasses", maxPasses}};
    out["maxLength"] = maxLength ? json(*maxLength) : json(nullptr);
    return out;
}

auto SanitizationResult::toJson() const -> json {
    return {{"sanitized", type::toJson(sanitized)},
            {"removed", removed},
            {"warnings", warnings}};
}

auto sanitizeString(std::string_view input, const SanitizationConfig& config,
                    std::vector<std::string>& removed,
                    std::vector<std::string>& warnings) -> std::string {
    std::string text(input);
    if (config.stripControlCharacters) {
        text = stripControlCharacters(text);
    }
    if (config.normalizeWhitespace) {
        text = utils::collapseWhitespace(text);
    }

    std::size_t pass = 0;
    for (; pass < config.maxPasses; ++pass) {
        std::string before = text;
        if (config.removeScripts) {
            text = detail::applyRules(text, scriptRules(), removed);
            text = detail::removeScriptSchemes(text, removed);
        }
        if (config.removeStyles) {
            text = detail::applyRules(text, styleRules(), removed);
        }
        if (config.removeComments) {
            text = detail::removeComments(text, removed);
        }
        if (!config.allowedTags.empty()) {
            text = detail::filterTags(text, config.allowedTags,
                                      config.allowedAttributes, false, removed);
        }
        if (text == before) {
            break;
        }
    }
    if (pass == config.maxPasses && config.maxPasses > 0) {
        spdlog::warn("Markup removal did not settle after {} passes",
                     config.maxPasses);
        warnings.push_back(fmt::format(
            "Markup removal did not settle after {} passes", config.maxPasses));
    }

    if (config.normalizeWhitespace) {
        text = utils::collapseWhitespace(text);
    }
    if (config.escapeHtml) {
        text = escapeHtml(text);
    }
    if (config.stripNonAlphanumeric) {
        text = stripNonAlphanumeric(text);
        if (config.normalizeWhitespace) {
            text = utils::collapseWhitespace(text);
        }
    }
    for (const auto& stage : config.extraStages) {
        text = stage(text);
    }
    if (config.maxLength) {
        text = utils::utf8Truncate(text, *config.maxLength);
        if (config.normalizeWhitespace) {
            text = utils::trim(text);
        }
    }
    return text;
}

auto sanitize(const Value& data, const SanitizationConfig& config)
    -> SanitizationResult {
    SanitizationResult result;
    Walker walker(config, result);
    result.sanitized = walker.walk(data, 0, "");
    return result;
}

}  // namespace vigil::sanitize
