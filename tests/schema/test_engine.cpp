#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>
#include <vector>

#include "vigil/schema/context.hpp"
#include "vigil/schema/engine.hpp"

using namespace vigil::schema;
using vigil::error::SchemaError;
using vigil::type::Array;
using vigil::type::Object;
using vigil::type::Value;
using ::testing::ElementsAre;

TEST(ValidateOptionsTest, FromJson) {
    auto options = ValidateOptions::fromJson(
        {{"strict", true}, {"failFast", true}, {"maxErrors", 5}, {"other", 1}});
    EXPECT_TRUE(options.strict);
    EXPECT_TRUE(options.failFast);
    EXPECT_FALSE(options.transform);
    EXPECT_FALSE(options.applyDefaults);
    EXPECT_EQ(options.maxErrors, 5U);
    EXPECT_EQ(options.toJson()["maxErrors"], 5);
}

TEST(ValidateOptionsTest, RejectsWrongTypes) {
    EXPECT_THROW((void)ValidateOptions::fromJson({{"strict", "yes"}}),
                 std::invalid_argument);
    EXPECT_THROW((void)ValidateOptions::fromJson({{"maxErrors", -1}}),
                 std::invalid_argument);
    EXPECT_THROW((void)ValidateOptions::fromJson(json::array()),
                 std::invalid_argument);
}

TEST(ValidationContextTest, PathScopesRestore) {
    ValidationContext ctx(false, false, 0);
    {
        auto users = ctx.enterField("users");
        {
            auto index = ctx.enterIndex(2);
            auto email = ctx.enterField("email");
            EXPECT_EQ(ctx.path(), "users[2].email");
        }
        EXPECT_EQ(ctx.path(), "users");
    }
    EXPECT_EQ(ctx.path(), "");
}

TEST(ValidationContextTest, ErrorBudget) {
    ValidationContext ctx(false, false, 2);
    ctx.addError(DiagnosticCode::TypeMismatch, "one");
    EXPECT_FALSE(ctx.shouldStop());
    ctx.addError(DiagnosticCode::TypeMismatch, "two");
    ctx.addError(DiagnosticCode::TypeMismatch, "three");
    EXPECT_TRUE(ctx.shouldStop());
    EXPECT_EQ(ctx.errors().size(), 2U);
}

TEST(SchemaBuilderTest, RejectsContradictions) {
    EXPECT_THROW(
        (void)Schema::array(Schema::number()).minLength(5).maxLength(2),
        SchemaError);
    EXPECT_THROW((void)Schema::object(
                     {{"a", Schema::string()}, {"a", Schema::number()}}),
                 SchemaError);
    EXPECT_THROW((void)Schema::string().customType(""), SchemaError);
}

TEST(SchemaBuilderTest, Depth) {
    SchemaNode leaf = Schema::string();
    SchemaNode nested = Schema::object(
        {{"a", Schema::array(Schema::object({{"b", Schema::string()}}))}});
    EXPECT_EQ(leaf.depth(), 1U);
    EXPECT_EQ(nested.depth(), 4U);
}

TEST(EngineTest, WorksOnUntrustedShapes) {
    Engine engine;
    SchemaNode schema = Schema::object(
        {{"name", Schema::string().required()},
         {"tags", Schema::array(Schema::string()).optional()}});
    for (const Value& data :
         {Value(), Value(nullptr), Value(1), Value("x"), Value(Array{}),
          Value(Object{{"tags", "no"}}), Value::date(0)}) {
        EXPECT_NO_THROW({
            auto result = engine.validate(data, schema);
            EXPECT_FALSE(result.valid);
        });
    }
}

TEST(EngineTest, SharedAcrossThreads) {
    const Engine engine;
    SchemaNode schema = Schema::object(
        {{"email", Schema::string().required().customType("email")}});
    std::vector<int> validCounts(4, 0);
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < 100; ++i) {
                Value data(Object{
                    {"email", i % 2 == 0 ? "a@b.com" : "broken"}});
                if (engine.validate(data, schema).valid) {
                    ++validCounts[t];
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    EXPECT_THAT(validCounts, ElementsAre(50, 50, 50, 50));
}
