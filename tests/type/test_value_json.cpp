#include <gtest/gtest.h>

#include <limits>

#include "vigil/error/exception.hpp"
#include "vigil/type/value_json.hpp"

using namespace vigil::type;

TEST(ValueJsonTest, FromJsonMapsNativeTypes) {
    json doc = {{"name", "Ana"},
                {"age", 31},
                {"score", 9.5},
                {"active", true},
                {"tags", {"a", "b"}},
                {"manager", nullptr}};
    Value value = fromJson(doc);
    ASSERT_TRUE(value.isObject());
    EXPECT_EQ(value.get("name"), Value("Ana"));
    EXPECT_EQ(value.get("age"), Value(31));
    EXPECT_EQ(value.get("score"), Value(9.5));
    EXPECT_EQ(value.get("active"), Value(true));
    EXPECT_EQ(value.get("tags").size(), 2U);
    EXPECT_TRUE(value.get("manager").isNull());
}

TEST(ValueJsonTest, FromJsonRejectsDeepDocuments) {
    json doc = json::array();
    for (int i = 0; i < 10; ++i) {
        doc = json::array({doc});
    }
    EXPECT_THROW((void)fromJson(doc, 5), vigil::error::ValueTypeError);
    EXPECT_NO_THROW((void)fromJson(doc, 20));
}

TEST(ValueJsonTest, ToJsonDropsUndefinedMembers) {
    Value value(Object{{"a", 1}, {"b", Value::undefined()}});
    json out = toJson(value);
    EXPECT_TRUE(out.contains("a"));
    EXPECT_FALSE(out.contains("b"));
    EXPECT_TRUE(toJson(Value(Array{Value::undefined()}))[0].is_null());
}

TEST(ValueJsonTest, ToJsonNumbers) {
    EXPECT_TRUE(toJson(Value(3)).is_number_integer());
    EXPECT_TRUE(toJson(Value(0.25)).is_number_float());
    EXPECT_TRUE(
        toJson(Value(std::numeric_limits<double>::infinity())).is_null());
}

TEST(ValueJsonTest, ToJsonRuntimeKinds) {
    EXPECT_EQ(toJson(Value::date(1000)), 1000);
    EXPECT_EQ(toJson(Value::url("https://x.y")), "https://x.y");
    EXPECT_EQ(toJson(Value::set(Array{1, 2})), json::array({1, 2}));

    json file = toJson(Value::file("a.txt", 3, "text/plain"));
    EXPECT_EQ(file["$kind"], "file");
    EXPECT_EQ(file["name"], "a.txt");

    json fn = toJson(Value::function("f", [](const Array&) { return Value(); }));
    EXPECT_EQ(fn["$kind"], "function");
    EXPECT_EQ(fn["name"], "f");
}

TEST(ValueJsonTest, RoundTripOfPlainData) {
    json doc = {{"items", {1, 2, 3}}, {"meta", {{"page", 1}}}};
    EXPECT_EQ(toJson(fromJson(doc)), doc);
}
