/**
 * test_schema.cpp - Tests for the sub-schema value
 */

#include <gtest/gtest.h>
#include <xschema/schema.hpp>
#include <string>

using xschema::Schema;
using xschema::ordered_json;

TEST(SchemaTest, DefaultIsEmptyObject) {
    Schema s;
    EXPECT_EQ(s.to_json().dump(), "{}");
    EXPECT_EQ(s.type(), "");
    EXPECT_FALSE(s.order().has_value());
}

TEST(SchemaTest, OfType) {
    auto s = Schema::of_type("string");
    EXPECT_EQ(s.type(), "string");
    EXPECT_EQ(s.to_json().dump(), R"({"type":"string"})");
}

TEST(SchemaTest, KeywordsKeepOrderExtensionsLast) {
    auto s = Schema()
        .with_extension("x-nullable", true)
        .with("type", "object")
        .with_description("A widget")
        .with_order(1)
        .with("minProperties", 1);

    EXPECT_EQ(s.to_json().dump(),
              R"({"type":"object","description":"A widget","minProperties":1,"x-nullable":true,"x-order":1})");
}

TEST(SchemaTest, WithRoutesExtensionKeys) {
    auto s = Schema().with("X-Order", 4).with("title", "t");

    EXPECT_FALSE(s.body().contains("X-Order"));
    EXPECT_TRUE(s.extensions().contains("x-order"));
    ASSERT_TRUE(s.order().has_value());
    EXPECT_EQ(s.order()->integer, 4);
}

TEST(SchemaTest, LvalueBuilders) {
    Schema s;
    s.with("type", "integer");
    s.with_order("b");
    EXPECT_EQ(s.to_json().dump(), R"({"type":"integer","x-order":"b"})");
}

TEST(SchemaTest, FromJsonSplitsExtensions) {
    auto j = ordered_json::parse(R"({"type":"string","X-Order":"2","minLength":1})");
    auto s = Schema::from_json(j);

    EXPECT_EQ(s.body().dump(), R"({"type":"string","minLength":1})");
    ASSERT_TRUE(s.order().has_value());
    EXPECT_EQ(s.order()->string, "2");
    EXPECT_EQ(s.to_json().dump(), R"({"type":"string","minLength":1,"x-order":"2"})");
}

TEST(SchemaTest, FromJsonKeepsNestedValues) {
    auto j = ordered_json::parse(
        R"({"type":"object","properties":{"z":{"type":"string"},"a":{"type":"integer"}}})");
    auto s = Schema::from_json(j);
    EXPECT_EQ(s.to_json(), j);
    EXPECT_EQ(s.to_json().dump(), j.dump());
}

TEST(SchemaTest, FromJsonRejectsNonObject) {
    EXPECT_THROW(Schema::from_json(ordered_json::array()), xschema::SerializationError);
    EXPECT_THROW(Schema::from_json(ordered_json("string")), xschema::SerializationError);
    EXPECT_THROW(Schema::from_json(ordered_json(nullptr)), xschema::SerializationError);
}

TEST(SchemaTest, Equality) {
    auto a = Schema::of_type("string").with_order(1);
    auto b = Schema::of_type("string").with_order(1);
    auto c = Schema::of_type("string").with_order(2);

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, Schema::of_type("string"));
}

TEST(SchemaTest, NlohmannConversions) {
    auto s = Schema::of_type("number").with_description("price").with_order(3);

    ordered_json j = s;
    EXPECT_EQ(j.dump(), R"({"type":"number","description":"price","x-order":3})");

    auto back = j.get<Schema>();
    EXPECT_EQ(back, s);
}

TEST(SchemaTest, WithExtensionWithoutPrefixIsKeyword) {
    auto s = Schema::of_type("string").with_extension("type", 5);

    EXPECT_TRUE(s.extensions().empty());
    EXPECT_EQ(s.to_json().dump(), R"({"type":5})");
    EXPECT_EQ(Schema::from_json(s.to_json()), s);
}

TEST(SchemaTest, KeywordsAndExtensionsNeverCollide) {
    Schema s = Schema::of_type("string").with_extension("x-type", "uuid");
    EXPECT_FALSE(s.extensions().add("type", 5));
    EXPECT_FALSE(s.extensions().add("nullable", true));

    EXPECT_EQ(s.to_json().dump(), R"({"type":"string","x-type":"uuid"})");
    EXPECT_EQ(Schema::from_json(s.to_json()), s);
}

TEST(SchemaTest, PrintsAsJson) {
    auto s = Schema::of_type("integer").with_order(2);
    EXPECT_EQ(::testing::PrintToString(s), R"({"type":"integer","x-order":2})");
}
