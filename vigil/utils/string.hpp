/*
 * string.hpp
 *
 * Copyright (C) 2023-2024 Max Q. <contact@lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: String helpers shared by validation and sanitization

**************************************************/

#ifndef VIGIL_UTILS_STRING_HPP
#define VIGIL_UTILS_STRING_HPP

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::utils {

/**
 * @brief Removes leading and trailing ASCII whitespace.
 *
 * @param str The string to trim.
 * @return The trimmed string.
 */
[[nodiscard]] auto trim(std::string_view str) -> std::string;

/**
 * @brief Converts the given string to lower case (ASCII only).
 */
[[nodiscard]] auto toLower(std::string_view str) -> std::string;

/**
 * @brief Converts the given string to upper case (ASCII only).
 */
[[nodiscard]] auto toUpper(std::string_view str) -> std::string;

/**
 * @brief Collapses every run of whitespace into a single space and trims.
 *
 * @param str The string to normalize.
 * @return The normalized string.
 */
[[nodiscard]] auto collapseWhitespace(std::string_view str) -> std::string;

/**
 * @brief Keeps only the ASCII digits of a string.
 */
[[nodiscard]] auto digitsOnly(std::string_view str) -> std::string;

/**
 * @brief Case-insensitive (ASCII) equality.
 */
[[nodiscard]] auto iequals(std::string_view lhs, std::string_view rhs) noexcept
    -> bool;

/**
 * @brief Case-insensitive (ASCII) search.
 *
 * @param haystack The text to search in.
 * @param needle The text to look for.
 * @param from Offset to start searching at.
 * @return Offset of the first match, or std::string_view::npos.
 */
[[nodiscard]] auto ifind(std::string_view haystack, std::string_view needle,
                         std::size_t from = 0) noexcept -> std::size_t;

/**
 * @brief Joins strings with a delimiter.
 */
[[nodiscard]] auto joinStrings(std::span<const std::string> strings,
                               std::string_view delimiter) -> std::string;

/**
 * @brief Truncates to at most @p maxCodePoints code points without splitting
 * a multi-byte sequence.
 */
[[nodiscard]] auto utf8Truncate(std::string_view str, std::size_t maxCodePoints)
    -> std::string;

/**
 * @brief Renders a number the way a script runtime prints it: integers
 * without a fraction, NaN and Infinity spelled out.
 */
[[nodiscard]] auto formatNumber(double value) -> std::string;

/**
 * @brief Quotes a string as a JSON string literal.
 */
[[nodiscard]] auto quote(std::string_view str) -> std::string;

}  // namespace vigil::utils

#endif  // VIGIL_UTILS_STRING_HPP
