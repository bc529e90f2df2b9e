/*
 * string.cpp
 *
 * Copyright (C) 2023-2024 Max Q. <contact@lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: String helpers shared by validation and sanitization

**************************************************/

#include "string.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>

#include <fmt/format.h>

namespace vigil::utils {

namespace {
constexpr double K_MAX_SAFE_INTEGER = 9007199254740991.0;

auto isSpace(unsigned char c) noexcept -> bool { return std::isspace(c) != 0; }

auto isContinuationByte(unsigned char c) noexcept -> bool {
    return (c & 0xC0) == 0x80;
}
}  // namespace

auto trim(std::string_view str) -> std::string {
    auto begin = std::find_if_not(str.begin(), str.end(), [](char c) {
        return isSpace(static_cast<unsigned char>(c));
    });
    auto end = std::find_if_not(str.rbegin(), str.rend(), [](char c) {
                   return isSpace(static_cast<unsigned char>(c));
               }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

auto toLower(std::string_view str) -> std::string {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

auto toUpper(std::string_view str) -> std::string {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

auto collapseWhitespace(std::string_view str) -> std::string {
    std::string result;
    result.reserve(str.size());
    bool pendingSpace = false;
    for (char c : str) {
        if (isSpace(static_cast<unsigned char>(c))) {
            pendingSpace = !result.empty();
            continue;
        }
        if (pendingSpace) {
            result.push_back(' ');
            pendingSpace = false;
        }
        result.push_back(c);
    }
    return result;
}

auto digitsOnly(std::string_view str) -> std::string {
    std::string result;
    result.reserve(str.size());
    std::copy_if(str.begin(), str.end(), std::back_inserter(result),
                 [](unsigned char c) { return std::isdigit(c) != 0; });
    return result;
}

auto iequals(std::string_view lhs, std::string_view rhs) noexcept -> bool {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(),
                      [](unsigned char a, unsigned char b) {
                          return std::tolower(a) == std::tolower(b);
                      });
}

auto ifind(std::string_view haystack, std::string_view needle,
           std::size_t from) noexcept -> std::size_t {
    if (needle.empty()) {
        return from <= haystack.size() ? from : std::string_view::npos;
    }
    if (from >= haystack.size() || needle.size() > haystack.size() - from) {
        return std::string_view::npos;
    }
    auto it = std::search(haystack.begin() + static_cast<std::ptrdiff_t>(from),
                          haystack.end(), needle.begin(), needle.end(),
                          [](unsigned char a, unsigned char b) {
                              return std::tolower(a) == std::tolower(b);
                          });
    if (it == haystack.end()) {
        return std::string_view::npos;
    }
    return static_cast<std::size_t>(it - haystack.begin());
}

auto joinStrings(std::span<const std::string> strings,
                 std::string_view delimiter) -> std::string {
    std::string result;
    bool first = true;
    for (const auto& str : strings) {
        if (!first) {
            result.append(delimiter);
        }
        result.append(str);
        first = false;
    }
    return result;
}

auto utf8Truncate(std::string_view str, std::size_t maxCodePoints)
    -> std::string {
    std::size_t count = 0;
    for (std::size_t i = 0; i < str.size(); ++i) {
        auto c = static_cast<unsigned char>(str[i]);
        if (isContinuationByte(c) && i != 0) {
            continue;
        }
        if (count == maxCodePoints) {
            return std::string(str.substr(0, i));
        }
        ++count;
    }
    return std::string(str);
}

auto formatNumber(double value) -> std::string {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Infinity" : "-Infinity";
    }
    if (value == std::trunc(value) && std::fabs(value) <= K_MAX_SAFE_INTEGER) {
        return fmt::format("{}", static_cast<long long>(value));
    }
    return fmt::format("{}", value);
}

auto quote(std::string_view str) -> std::string {
    std::string result;
    result.reserve(str.size() + 2);
    result.push_back('"');
    for (char c : str) {
        switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    result += fmt::format("\\u{:04x}",
                                          static_cast<unsigned char>(c));
                } else {
                    result.push_back(c);
                }
        }
    }
    result.push_back('"');
    return result;
}

}  // namespace vigil::utils
