#include <gtest/gtest.h>

#include <limits>

#include "vigil/guard/type_guards.hpp"

using namespace vigil::guard;
using vigil::type::Array;
using vigil::type::Object;

namespace {
constexpr double K_NAN = std::numeric_limits<double>::quiet_NaN();
constexpr double K_INF = std::numeric_limits<double>::infinity();
}  // namespace

TEST(TypeGuardsTest, Primitives) {
    EXPECT_TRUE(isString(Value("")));
    EXPECT_FALSE(isString(Value(1)));

    EXPECT_TRUE(isNumber(Value(1.5)));
    EXPECT_TRUE(isNumber(Value(K_INF)));
    EXPECT_FALSE(isNumber(Value(K_NAN)));
    EXPECT_FALSE(isNumber(Value("1")));

    EXPECT_TRUE(isFiniteNumber(Value(-3)));
    EXPECT_FALSE(isFiniteNumber(Value(K_INF)));

    EXPECT_TRUE(isInteger(Value(42)));
    EXPECT_FALSE(isInteger(Value(4.2)));
    EXPECT_FALSE(isInteger(Value(K_INF)));

    EXPECT_TRUE(isBoolean(Value(false)));
    EXPECT_TRUE(isNull(Value(nullptr)));
    EXPECT_TRUE(isUndefined(Value()));
    EXPECT_TRUE(isNullish(Value()));
    EXPECT_TRUE(isNullish(Value(nullptr)));
    EXPECT_FALSE(isNullish(Value(0)));
}

TEST(TypeGuardsTest, Containers) {
    EXPECT_TRUE(isPlainObject(Value(Object{})));
    EXPECT_FALSE(isPlainObject(Value(Array{})));
    EXPECT_FALSE(isPlainObject(Value::date(0)));
    EXPECT_TRUE(isArray(Value(Array{})));
    EXPECT_FALSE(isArray(Value::set(Array{})));
    EXPECT_TRUE(isFunction(
        Value::function("f", [](const Array&) { return Value(); })));
}

TEST(TypeGuardsTest, RuntimeObjects) {
    EXPECT_TRUE(isDate(Value::date(0)));
    EXPECT_FALSE(isDate(Value::date(K_NAN)));
    EXPECT_FALSE(isDate(Value("2024-01-01")));
    EXPECT_TRUE(isRegExp(Value::regex("a+", "g")));
    EXPECT_TRUE(isPromise(Value::promise()));
    EXPECT_TRUE(isError(Value::error("TypeError", "bad")));
    EXPECT_TRUE(isMap(Value::map({})));
    EXPECT_TRUE(isSet(Value::set(Array{})));
    EXPECT_TRUE(isWeakMap(Value::weakMap()));
    EXPECT_TRUE(isWeakSet(Value::weakSet()));
    EXPECT_TRUE(isArrayBuffer(Value::arrayBuffer({1, 2})));
    EXPECT_TRUE(isTypedArray(Value::typedArray("Uint8Array", {1})));
    EXPECT_TRUE(isDataView(Value::dataView({1, 2, 3}, 1, 2)));
    EXPECT_TRUE(isUrl(Value::url("https://example.com")));
    EXPECT_FALSE(isUrl(Value("https://example.com")));
    EXPECT_TRUE(isFormData(Value::formData({{"a", Value(1)}})));
    EXPECT_TRUE(isEvent(Value::event("click")));
    EXPECT_TRUE(isWindow(Value::window()));
    EXPECT_TRUE(isNodeList(Value::nodeList({})));
    EXPECT_TRUE(isHtmlCollection(Value::htmlCollection({})));
}

TEST(TypeGuardsTest, FileIsBlobAndElementIsNode) {
    Value file = Value::file("a.txt", 3, "text/plain");
    EXPECT_TRUE(isFile(file));
    EXPECT_TRUE(isBlob(file));
    EXPECT_FALSE(isFile(Value::blob(3, "text/plain")));

    Value element = Value::element("div", {});
    EXPECT_TRUE(isElement(element));
    EXPECT_TRUE(isNode(element));
    EXPECT_TRUE(isNode(Value::document()));
    EXPECT_TRUE(isNode(Value::node("#text", 3)));
    EXPECT_FALSE(isElement(Value::node("#text", 3)));
    EXPECT_TRUE(isDocument(Value::document("Home")));
}

TEST(TypeGuardsTest, StringFormats) {
    EXPECT_TRUE(isEmail(Value("ana@example.com")));
    EXPECT_FALSE(isEmail(Value(1)));
    EXPECT_TRUE(isUrlString(Value("https://example.com")));
    EXPECT_FALSE(isUrlString(Value::url("https://example.com")));
    EXPECT_TRUE(isUuid(Value("123e4567-e89b-12d3-a456-426614174000")));
    EXPECT_TRUE(isCpf(Value("529.982.247-25")));
    EXPECT_TRUE(isCnpj(Value("11.222.333/0001-81")));
    EXPECT_TRUE(isPhone(Value("(11) 98765-4321")));
    EXPECT_TRUE(isCep(Value("01310-100")));
    EXPECT_TRUE(isDateString(Value("2024-05-01")));
    EXPECT_FALSE(isDateString(Value("2024-05-32")));
    EXPECT_TRUE(isNonEmptyString(Value(" x ")));
    EXPECT_FALSE(isNonEmptyString(Value("   ")));
    EXPECT_FALSE(isNonEmptyString(Value()));
}

TEST(TypeGuardsTest, ArrayOf) {
    EXPECT_TRUE(isArrayOf(Value(Array{"a", "b"}), isString));
    EXPECT_TRUE(isArrayOf(Value(Array{}), isString));
    EXPECT_FALSE(isArrayOf(Value(Array{"a", 1}), isString));
    EXPECT_FALSE(isArrayOf(Value("ab"), isString));
    EXPECT_TRUE(isArrayOf(Value(Array{1, 2}), [](const Value& item) {
        return isInteger(item) && item.asNumber() > 0;
    }));
}

TEST(TypeGuardsTest, HasKeys) {
    Value user(Object{{"id", 1}, {"name", "Ana"}});
    EXPECT_TRUE(hasKeys(user, {"id", "name"}));
    EXPECT_FALSE(hasKeys(user, {"id", "email"}));
    EXPECT_TRUE(hasKeys(user, {}));
    EXPECT_FALSE(hasKeys(Value(Array{}), {}));
}
