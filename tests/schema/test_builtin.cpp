#include <gtest/gtest.h>

#include <cmath>
#include <string>

#include "vigil/schema/builtin.hpp"
#include "vigil/schema/registry.hpp"

using namespace vigil::schema;
using namespace vigil::schema::builtin;
using vigil::type::Value;
using vigil::type::ValueKind;

TEST(BuiltinFormatTest, Email) {
    EXPECT_TRUE(isEmail("ana.silva+news@example.com.br"));
    EXPECT_FALSE(isEmail("ana@"));
    EXPECT_FALSE(isEmail("@example.com"));
    EXPECT_FALSE(isEmail("ana@example"));
    EXPECT_FALSE(isEmail(std::string(250, 'a') + "@example.com"));
}

TEST(BuiltinFormatTest, Url) {
    EXPECT_TRUE(isUrl("https://example.com/path?q=1"));
    EXPECT_TRUE(isUrl("HTTP://EXAMPLE.COM"));
    EXPECT_FALSE(isUrl("ftp://example.com"));
    EXPECT_FALSE(isUrl("javascript:alert(1)"));
    EXPECT_FALSE(isUrl("https://exa mple.com"));
}

TEST(BuiltinFormatTest, Uuid) {
    EXPECT_TRUE(isUuid("123e4567-e89b-12d3-a456-426614174000"));
    EXPECT_FALSE(isUuid("123e4567e89b12d3a456426614174000"));
    EXPECT_FALSE(isUuid("123e4567-e89b-12d3-a456-42661417400g"));
}

TEST(BuiltinFormatTest, Cpf) {
    EXPECT_TRUE(isCpf("52998224725"));
    EXPECT_TRUE(isCpf("529.982.247-25"));
    EXPECT_TRUE(isCpf("111.444.777-35"));
    EXPECT_FALSE(isCpf("52998224724"));
    EXPECT_FALSE(isCpf("11111111111"));
    EXPECT_FALSE(isCpf("5299822472"));
}

TEST(BuiltinFormatTest, Cnpj) {
    EXPECT_TRUE(isCnpj("11222333000181"));
    EXPECT_TRUE(isCnpj("11.222.333/0001-81"));
    EXPECT_TRUE(isCnpj("45723174000110"));
    EXPECT_FALSE(isCnpj("11222333000180"));
    EXPECT_FALSE(isCnpj("00000000000000"));
}

TEST(BuiltinFormatTest, Phone) {
    EXPECT_TRUE(isPhone("(11) 98765-4321"));
    EXPECT_TRUE(isPhone("1133334444"));
    EXPECT_TRUE(isPhone("+55 11 98765-4321"));
    EXPECT_TRUE(isPhone("+14155552671"));
    EXPECT_FALSE(isPhone("11 88765-4321"));
    EXPECT_FALSE(isPhone("12345"));
    EXPECT_FALSE(isPhone("call me"));
}

TEST(BuiltinFormatTest, Cep) {
    EXPECT_TRUE(isCep("01310-100"));
    EXPECT_TRUE(isCep("01310100"));
    EXPECT_FALSE(isCep("0131-0100"));
    EXPECT_FALSE(isCep("013101000"));
}

TEST(BuiltinFormatTest, ParseDate) {
    EXPECT_EQ(parseDate("1970-01-01").value_or(-1), 0.0);
    EXPECT_EQ(parseDate("2024-01-01T00:00:00Z").value_or(-1), 1704067200000.0);
    EXPECT_EQ(parseDate("2024-01-01T03:00:00+03:00").value_or(-1), 1704067200000.0);
    EXPECT_EQ(parseDate("01/01/2024").value_or(-1), 1704067200000.0);
    EXPECT_EQ(parseDate("1970-01-01T00:00:01.5Z").value_or(-1), 1500.0);
    EXPECT_FALSE(parseDate("2023-02-29").has_value());
    EXPECT_TRUE(parseDate("2024-02-29").has_value());
    EXPECT_FALSE(parseDate("2024-13-01").has_value());
    EXPECT_FALSE(parseDate("2024-01-01T24:00").has_value());
    EXPECT_FALSE(parseDate("yesterday").has_value());
}

TEST(BuiltinFormatTest, Formatting) {
    EXPECT_EQ(formatCpf("52998224725"), "529.982.247-25");
    EXPECT_EQ(formatCpf("123"), "123");
    EXPECT_EQ(formatCnpj("11222333000181"), "11.222.333/0001-81");
    EXPECT_EQ(formatCep("01310100"), "01310-100");
    EXPECT_EQ(formatPhone("11987654321"), "(11) 98765-4321");
    EXPECT_EQ(formatPhone("1133334444"), "(11) 3333-4444");
    EXPECT_EQ(formatPhone("+1 415"), "1415");
}

TEST(BuiltinRegistrationTest, SeedsAllTables) {
    Registries registries;
    registerBuiltins(registries);
    for (const char* name :
         {"email", "url", "uuid", "cpf", "cnpj", "date", "phone", "cep"}) {
        EXPECT_TRUE(registries.customTypes.contains(name)) << name;
        EXPECT_TRUE(registries.validators.contains(name)) << name;
    }
    for (const char* name : {"trim", "lowercase", "uppercase", "digits",
                             "email", "phone", "cpf", "cnpj", "cep", "date"}) {
        EXPECT_TRUE(registries.transformers.contains(name)) << name;
    }
}

TEST(BuiltinRegistrationTest, NativeKindsSatisfyFormats) {
    Registries registries;
    registerBuiltins(registries);
    const auto* url = registries.customTypes.find("url");
    ASSERT_NE(url, nullptr);
    EXPECT_TRUE((*url)(Value::url("https://example.com")));
    EXPECT_FALSE((*url)(Value(42)));

    const auto* date = registries.customTypes.find("date");
    ASSERT_NE(date, nullptr);
    EXPECT_TRUE((*date)(Value::date(0)));
    EXPECT_TRUE((*date)(Value("2024-05-01")));
    EXPECT_FALSE((*date)(Value::date(std::nan(""))));
}

TEST(BuiltinRegistrationTest, Transformers) {
    auto registries = Registries::withDefaults();
    auto apply = [&registries](const char* name, const Value& value) {
        return (*registries.transformers.find(name))(value);
    };
    EXPECT_EQ(apply("email", Value("  Ana@Example.COM ")),
              Value("ana@example.com"));
    EXPECT_EQ(apply("digits", Value("(11) 9876")), Value("119876"));
    EXPECT_EQ(apply("cpf", Value("52998224725")), Value("529.982.247-25"));
    EXPECT_EQ(apply("trim", Value(5)), Value(5));

    Value date = apply("date", Value("1970-01-02"));
    ASSERT_TRUE(date.is(ValueKind::Date));
    EXPECT_DOUBLE_EQ(date.epochMillis(), 86400000.0);
}
