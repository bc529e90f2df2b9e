/*
 * builtin.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Built-in string formats, validators and transformers

**************************************************/

#ifndef VIGIL_SCHEMA_BUILTIN_HPP
#define VIGIL_SCHEMA_BUILTIN_HPP

#include <optional>
#include <string>
#include <string_view>

namespace vigil::schema {
struct Registries;
}

namespace vigil::schema::builtin {

/// Address of the form `local@domain.tld`.
[[nodiscard]] auto isEmail(std::string_view str) -> bool;
/// Absolute http or https URL.
[[nodiscard]] auto isUrl(std::string_view str) -> bool;
/// Hyphenated 8-4-4-4-12 hexadecimal UUID.
[[nodiscard]] auto isUuid(std::string_view str) -> bool;

/**
 * @brief Brazilian individual taxpayer id, bare (11 digits) or formatted
 * (`000.000.000-00`), with valid check digits.
 */
[[nodiscard]] auto isCpf(std::string_view str) -> bool;

/**
 * @brief Brazilian company id, bare (14 digits) or formatted
 * (`00.000.000/0000-00`), with valid check digits.
 */
[[nodiscard]] auto isCnpj(std::string_view str) -> bool;

/**
 * @brief Brazilian phone number (area code plus 8 or 9 digits, mobiles
 * starting with 9) or an international E.164 number.
 */
[[nodiscard]] auto isPhone(std::string_view str) -> bool;

/// Brazilian postal code, `00000-000` or 8 digits.
[[nodiscard]] auto isCep(std::string_view str) -> bool;

/**
 * @brief Parses an ISO-8601 date or date-time, or a `DD/MM/YYYY` date.
 *
 * The calendar date must exist (no February 30th).
 *
 * @return Milliseconds since the Unix epoch (UTC), or std::nullopt
 */
[[nodiscard]] auto parseDate(std::string_view str) -> std::optional<double>;

[[nodiscard]] auto isDate(std::string_view str) -> bool;

/// `52998224725` -> `529.982.247-25`; other input is returned unchanged.
[[nodiscard]] auto formatCpf(std::string_view str) -> std::string;
/// `11222333000181` -> `11.222.333/0001-81`; other input unchanged.
[[nodiscard]] auto formatCnpj(std::string_view str) -> std::string;
/// `01310100` -> `01310-100`; other input unchanged.
[[nodiscard]] auto formatCep(std::string_view str) -> std::string;
/// `11987654321` -> `(11) 98765-4321`; other input reduced to its digits.
[[nodiscard]] auto formatPhone(std::string_view str) -> std::string;

/**
 * @brief Seeds custom types and validators for email, url, uuid, cpf, cnpj,
 * date, phone and cep, and the transformers trim, lowercase, uppercase,
 * email, digits, phone, cpf, cnpj, cep and date.
 */
void registerBuiltins(Registries& registries);

}  // namespace vigil::schema::builtin

#endif  // VIGIL_SCHEMA_BUILTIN_HPP
