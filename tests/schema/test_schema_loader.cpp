#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "vigil/schema/engine.hpp"
#include "vigil/schema/schema_loader.hpp"
#include "vigil/type/value_json.hpp"

using namespace vigil::schema;
using vigil::type::fromJson;
using ::testing::HasSubstr;

TEST(SchemaLoaderTest, LoadsLeaf) {
    SchemaNode node = schemaFromJson(
        {{"type", "string"}, {"required", true}, {"customType", "email"}});
    ASSERT_EQ(node.kind(), SchemaNode::Kind::Leaf);
    const auto* leaf = node.leaf();
    EXPECT_EQ(leaf->getTag(), TypeTag::String);
    EXPECT_EQ(leaf->getPresence(), Presence::Required);
    EXPECT_EQ(leaf->getCustomType().value_or(""), "email");
}

TEST(SchemaLoaderTest, LoadsObjectAndArray) {
    json doc = {
        {"name", {{"type", "string"}, {"required", true}}},
        {"tags",
         {{"type", "array"},
          {"items", {{"type", "string"}}},
          {"minLength", 1},
          {"maxLength", 5},
          {"unique", true}}},
        {"address", {{"city", {{"type", "string"}}}}}};
    SchemaNode node = schemaFromJson(doc);
    ASSERT_EQ(node.kind(), SchemaNode::Kind::Object);
    const auto* object = node.object();
    EXPECT_EQ(object->fields().size(), 3U);

    const auto* tags = object->field("tags");
    ASSERT_NE(tags, nullptr);
    ASSERT_EQ(tags->kind(), SchemaNode::Kind::Array);
    EXPECT_EQ(tags->array()->getMinLength().value_or(0), 1U);
    EXPECT_EQ(tags->array()->getMaxLength().value_or(0), 5U);
    EXPECT_TRUE(tags->array()->isUnique());

    const auto* address = object->field("address");
    ASSERT_NE(address, nullptr);
    EXPECT_EQ(address->kind(), SchemaNode::Kind::Object);
}

TEST(SchemaLoaderTest, LoadsDefault) {
    SchemaNode node =
        schemaFromJson({{"type", "number"}, {"default", 10}});
    ASSERT_NE(node.leaf(), nullptr);
    ASSERT_TRUE(node.leaf()->getDefault().has_value());
    EXPECT_EQ(*node.leaf()->getDefault(), vigil::type::Value(10));
}

TEST(SchemaLoaderTest, MalformedNodesBecomeInvalid) {
    EXPECT_EQ(schemaFromJson(json("string")).kind(), SchemaNode::Kind::Invalid);
    EXPECT_EQ(schemaFromJson({{"type", "array"}}).kind(),
              SchemaNode::Kind::Invalid);
    EXPECT_EQ(schemaFromJson({{"type", "custom"}}).kind(),
              SchemaNode::Kind::Invalid);
    EXPECT_EQ(
        schemaFromJson({{"type", "string"}, {"required", "yes"}}).kind(),
        SchemaNode::Kind::Invalid);
    EXPECT_EQ(schemaFromJson({{"type", "string"},
                              {"required", true},
                              {"optional", true}})
                  .kind(),
              SchemaNode::Kind::Invalid);
    EXPECT_EQ(schemaFromJson({{"type", "array"},
                              {"items", {{"type", "number"}}},
                              {"minLength", 4},
                              {"maxLength", 2}})
                  .kind(),
              SchemaNode::Kind::Invalid);
}

TEST(SchemaLoaderTest, DeepSchemaIsRejected) {
    json doc = {{"type", "string"}};
    for (int i = 0; i < 10; ++i) {
        doc = json{{"child", doc}};
    }
    SchemaNode root = schemaFromJson(doc, 4);
    const SchemaNode* node = &root;
    while (node->kind() == SchemaNode::Kind::Object) {
        node = node->object()->field("child");
        ASSERT_NE(node, nullptr);
    }
    ASSERT_EQ(node->kind(), SchemaNode::Kind::Invalid);
    EXPECT_THAT(node->invalid()->reason, HasSubstr("deeper than 4"));
}

TEST(SchemaLoaderTest, InvalidFieldReportsDuringValidation) {
    SchemaNode node = schemaFromJson(
        {{"name", {{"type", "string"}}}, {"age", 3}});
    Engine engine;
    auto result = engine.validate(fromJson({{"name", "Ana"}, {"age", 3}}), node);
    ASSERT_EQ(result.errors.size(), 1U);
    EXPECT_EQ(result.errors[0].code, DiagnosticCode::InvalidSchema);
    EXPECT_EQ(result.errors[0].path, "age");
    EXPECT_THAT(result.errors[0].message, HasSubstr("not a schema"));
}

TEST(SchemaLoaderTest, LoadedSchemaValidates) {
    SchemaNode node = schemaFromJson(
        {{"users",
          {{"type", "array"},
           {"items",
            {{"email",
              {{"type", "string"}, {"required", true}, {"customType", "email"}}}}}}}});
    Engine engine;
    auto result = engine.validate(
        fromJson({{"users", {{{"email", "a@b.com"}}, {{"email", "bad"}}}}}),
        node);
    ASSERT_EQ(result.errors.size(), 1U);
    EXPECT_EQ(result.errors[0].path, "users[1].email");
}
