/*
 * builtin.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Built-in string formats, validators and transformers

**************************************************/

#include "builtin.hpp"

#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <regex>
#include <span>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "vigil/schema/registry.hpp"
#include "vigil/utils/string.hpp"

namespace vigil::schema::builtin {

using type::Value;
using type::ValueKind;

namespace {
constexpr std::size_t K_MAX_EMAIL_LENGTH = 254;
constexpr std::size_t K_MAX_URL_LENGTH = 2048;
constexpr std::size_t K_MAX_FORMAT_LENGTH = 64;

constexpr std::int64_t K_MS_PER_SECOND = 1000;
constexpr std::int64_t K_MS_PER_MINUTE = 60 * K_MS_PER_SECOND;
constexpr std::int64_t K_MS_PER_HOUR = 60 * K_MS_PER_MINUTE;
constexpr std::int64_t K_MS_PER_DAY = 24 * K_MS_PER_HOUR;

auto matches(std::string_view str, const std::regex& pattern) -> bool {
    try {
        return std::regex_match(str.begin(), str.end(), pattern);
    } catch (const std::regex_error& e) {
        spdlog::warn("Regex evaluation failed: {}", e.what());
        return false;
    }
}

auto toInt(std::string_view digits) -> int {
    int value = 0;
    for (char c : digits) {
        value = value * 10 + (c - '0');
    }
    return value;
}

auto allSameDigit(std::string_view digits) -> bool {
    return digits.find_first_not_of(digits.front()) == std::string_view::npos;
}

auto checkDigit(std::string_view digits, std::span<const int> weights) -> int {
    int sum = 0;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        sum += (digits[i] - '0') * weights[i];
    }
    int remainder = sum % 11;
    return remainder < 2 ? 0 : 11 - remainder;
}

auto isBrazilianNational(std::string_view digits) -> bool {
    if (digits.size() != 10 && digits.size() != 11) {
        return false;
    }
    if (digits[0] == '0' || digits[1] == '0') {
        return false;
    }
    return digits.size() == 10 || digits[2] == '9';
}

/// Value check shared by the custom type and the validator of a format.
struct Format {
    std::string_view name;
    bool (*check)(std::string_view);
    std::string_view message;
    ValueKind nativeKind;
};

auto acceptsValue(const Format& format, const Value& value) -> bool {
    if (value.isString()) {
        return format.check(value.asString());
    }
    if (value.is(ValueKind::Url) && format.nativeKind == ValueKind::Url) {
        return format.check(value.asString());
    }
    if (value.is(ValueKind::Date) && format.nativeKind == ValueKind::Date) {
        return !std::isnan(value.epochMillis());
    }
    return false;
}

auto stringTransform(std::string (*fn)(std::string_view)) -> TransformFn {
    return [fn](const Value& value) -> Value {
        return value.isString() ? Value(fn(value.asString())) : value;
    };
}
}  // namespace

auto isEmail(std::string_view str) -> bool {
    static const std::regex emailRegex(
        R"(^[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}$)");
    return str.size() <= K_MAX_EMAIL_LENGTH && matches(str, emailRegex);
}

auto isUrl(std::string_view str) -> bool {
    static const std::regex urlRegex(
        R"(^https?://[^\s/$.?#][^\s]*$)", std::regex::icase);
    return str.size() <= K_MAX_URL_LENGTH && matches(str, urlRegex);
}

auto isUuid(std::string_view str) -> bool {
    static const std::regex uuidRegex(
        R"(^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$)");
    return str.size() == 36 && matches(str, uuidRegex);
}

auto isCpf(std::string_view str) -> bool {
    static const std::regex cpfRegex(R"(^\d{3}\.?\d{3}\.?\d{3}-?\d{2}$)");
    if (str.size() > K_MAX_FORMAT_LENGTH || !matches(str, cpfRegex)) {
        return false;
    }
    std::string digits = utils::digitsOnly(str);
    if (allSameDigit(digits)) {
        return false;
    }
    static constexpr std::array<int, 9> K_FIRST{10, 9, 8, 7, 6, 5, 4, 3, 2};
    static constexpr std::array<int, 10> K_SECOND{11, 10, 9, 8, 7,
                                                  6,  5,  4, 3, 2};
    return checkDigit(digits, K_FIRST) == digits[9] - '0' &&
           checkDigit(digits, K_SECOND) == digits[10] - '0';
}

auto isCnpj(std::string_view str) -> bool {
    static const std::regex cnpjRegex(
        R"(^\d{2}\.?\d{3}\.?\d{3}/?\d{4}-?\d{2}$)");
    if (str.size() > K_MAX_FORMAT_LENGTH || !matches(str, cnpjRegex)) {
        return false;
    }
    std::string digits = utils::digitsOnly(str);
    if (allSameDigit(digits)) {
        return false;
    }
    static constexpr std::array<int, 12> K_FIRST{5, 4, 3, 2, 9, 8,
                                                 7, 6, 5, 4, 3, 2};
    static constexpr std::array<int, 13> K_SECOND{6, 5, 4, 3, 2, 9, 8,
                                                  7, 6, 5, 4, 3, 2};
    return checkDigit(digits, K_FIRST) == digits[12] - '0' &&
           checkDigit(digits, K_SECOND) == digits[13] - '0';
}

auto isPhone(std::string_view str) -> bool {
    static const std::regex phoneRegex(R"(^\+?[0-9\s().-]+$)");
    if (str.size() > K_MAX_FORMAT_LENGTH || !matches(str, phoneRegex)) {
        return false;
    }
    std::string digits = utils::digitsOnly(str);
    if (str.front() == '+') {
        if (digits.starts_with("55") &&
            isBrazilianNational(std::string_view(digits).substr(2))) {
            return true;
        }
        return digits.size() >= 8 && digits.size() <= 15 && digits[0] != '0';
    }
    return isBrazilianNational(digits);
}

auto isCep(std::string_view str) -> bool {
    static const std::regex cepRegex(R"(^\d{5}-?\d{3}$)");
    return str.size() <= 9 && matches(str, cepRegex);
}

auto parseDate(std::string_view str) -> std::optional<double> {
    static const std::regex isoRegex(
        R"(^(\d{4})-(\d{2})-(\d{2})(?:[T ](\d{2}):(\d{2})(?::(\d{2})(?:\.(\d{1,9}))?)?(Z|[+-]\d{2}:?\d{2})?)?$)");
    static const std::regex brRegex(R"(^(\d{2})/(\d{2})/(\d{4})$)");

    if (str.size() > K_MAX_FORMAT_LENGTH) {
        return std::nullopt;
    }
    std::string text(str);
    std::smatch match;
    int year = 0;
    int month = 0;
    int day = 0;
    std::int64_t timeMs = 0;
    try {
        if (std::regex_match(text, match, isoRegex)) {
            year = toInt(match.str(1));
            month = toInt(match.str(2));
            day = toInt(match.str(3));
            if (match[4].matched) {
                int hours = toInt(match.str(4));
                int minutes = toInt(match.str(5));
                int seconds = match[6].matched ? toInt(match.str(6)) : 0;
                if (hours > 23 || minutes > 59 || seconds > 59) {
                    return std::nullopt;
                }
                int millis = 0;
                if (match[7].matched) {
                    std::string fraction = match.str(7);
                    fraction.resize(3, '0');
                    millis = toInt(fraction);
                }
                timeMs = hours * K_MS_PER_HOUR + minutes * K_MS_PER_MINUTE +
                         seconds * K_MS_PER_SECOND + millis;
                if (match[8].matched && match.str(8) != "Z") {
                    std::string offset = utils::digitsOnly(match.str(8));
                    int offHours = toInt(offset.substr(0, 2));
                    int offMinutes = toInt(offset.substr(2, 2));
                    if (offHours > 23 || offMinutes > 59) {
                        return std::nullopt;
                    }
                    std::int64_t offsetMs =
                        offHours * K_MS_PER_HOUR + offMinutes * K_MS_PER_MINUTE;
                    timeMs -= match.str(8)[0] == '-' ? -offsetMs : offsetMs;
                }
            }
        } else if (std::regex_match(text, match, brRegex)) {
            day = toInt(match.str(1));
            month = toInt(match.str(2));
            year = toInt(match.str(3));
        } else {
            return std::nullopt;
        }
    } catch (const std::regex_error& e) {
        spdlog::warn("Date parsing failed: {}", e.what());
        return std::nullopt;
    }

    const std::chrono::year_month_day ymd{
        std::chrono::year{year},
        std::chrono::month{static_cast<unsigned>(month)},
        std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    const auto days =
        std::chrono::sys_days{ymd}.time_since_epoch().count();
    return static_cast<double>(days * K_MS_PER_DAY + timeMs);
}

auto isDate(std::string_view str) -> bool { return parseDate(str).has_value(); }

auto formatCpf(std::string_view str) -> std::string {
    std::string digits = utils::digitsOnly(str);
    if (digits.size() != 11) {
        return std::string(str);
    }
    return fmt::format("{}.{}.{}-{}", digits.substr(0, 3), digits.substr(3, 3),
                       digits.substr(6, 3), digits.substr(9, 2));
}

auto formatCnpj(std::string_view str) -> std::string {
    std::string digits = utils::digitsOnly(str);
    if (digits.size() != 14) {
        return std::string(str);
    }
    return fmt::format("{}.{}.{}/{}-{}", digits.substr(0, 2),
                       digits.substr(2, 3), digits.substr(5, 3),
                       digits.substr(8, 4), digits.substr(12, 2));
}

auto formatCep(std::string_view str) -> std::string {
    std::string digits = utils::digitsOnly(str);
    if (digits.size() != 8) {
        return std::string(str);
    }
    return fmt::format("{}-{}", digits.substr(0, 5), digits.substr(5, 3));
}

auto formatPhone(std::string_view str) -> std::string {
    std::string digits = utils::digitsOnly(str);
    if (digits.size() == 11) {
        return fmt::format("({}) {}-{}", digits.substr(0, 2),
                           digits.substr(2, 5), digits.substr(7, 4));
    }
    if (digits.size() == 10) {
        return fmt::format("({}) {}-{}", digits.substr(0, 2),
                           digits.substr(2, 4), digits.substr(6, 4));
    }
    return digits;
}

void registerBuiltins(Registries& registries) {
    static constexpr std::array<Format, 8> K_FORMATS{{
        {"email", &isEmail, "Invalid email address", ValueKind::String},
        {"url", &isUrl, "Invalid URL", ValueKind::Url},
        {"uuid", &isUuid, "Invalid UUID", ValueKind::String},
        {"cpf", &isCpf, "Invalid CPF", ValueKind::String},
        {"cnpj", &isCnpj, "Invalid CNPJ", ValueKind::String},
        {"date", &isDate, "Invalid date", ValueKind::Date},
        {"phone", &isPhone, "Invalid phone number", ValueKind::String},
        {"cep", &isCep, "Invalid CEP", ValueKind::String},
    }};

    spdlog::debug("Registering {} built-in formats", K_FORMATS.size());
    for (const auto& format : K_FORMATS) {
        registries.customTypes.add(
            std::string(format.name),
            [&format](const Value& value) { return acceptsValue(format, value); });
        registries.validators.add(
            std::string(format.name),
            [&format](const Value& value, const ValidationContext&) -> Verdict {
                if (acceptsValue(format, value)) {
                    return Verdict::pass();
                }
                return Verdict(std::string(format.message));
            });
    }

    registries.transformers.add("trim", stringTransform(&utils::trim));
    registries.transformers.add("lowercase", stringTransform(&utils::toLower));
    registries.transformers.add("uppercase", stringTransform(&utils::toUpper));
    registries.transformers.add("digits", stringTransform(&utils::digitsOnly));
    registries.transformers.add("phone", stringTransform(&formatPhone));
    registries.transformers.add("cpf", stringTransform(&formatCpf));
    registries.transformers.add("cnpj", stringTransform(&formatCnpj));
    registries.transformers.add("cep", stringTransform(&formatCep));
    registries.transformers.add("email", [](const Value& value) -> Value {
        if (!value.isString()) {
            return value;
        }
        return Value(utils::toLower(utils::trim(value.asString())));
    });
    registries.transformers.add("date", [](const Value& value) -> Value {
        if (!value.isString()) {
            return value;
        }
        if (auto millis = parseDate(utils::trim(value.asString()))) {
            return Value::date(*millis);
        }
        return value;
    });
}

}  // namespace vigil::schema::builtin
