//
// Created by gregorian-rayne on 1/24/26.
//

#include "sdkir/analyzers/composition_analyzer.hpp"

#include <gtest/gtest.h>

namespace sdkir::analyzers::composition
{
    TEST(CompositionAnalyzerTest, PlainSchemaIsNotComposition) {
        const auto schema = json::parse(R"({"type": "object", "properties": {"id": {"type": "integer"}}})");

        EXPECT_FALSE(is_composition(schema));
        EXPECT_FALSE(analyze(schema).has_value());
        EXPECT_FALSE(is_composition(json("string")));
    }

    TEST(CompositionAnalyzerTest, DetectsEachKeyword) {
        EXPECT_EQ(composition_kind(json::parse(R"({"allOf": [{}]})")), CompositionKind::AllOf);
        EXPECT_EQ(composition_kind(json::parse(R"({"oneOf": [{}]})")), CompositionKind::OneOf);
        EXPECT_EQ(composition_kind(json::parse(R"({"anyOf": [{}]})")), CompositionKind::AnyOf);
    }

    TEST(CompositionAnalyzerTest, EmptyArrayIsNotComposition) {
        const auto schema = json::parse(R"({"allOf": []})");

        EXPECT_FALSE(composition_kind(schema).has_value());
        EXPECT_FALSE(is_composition(schema));
        EXPECT_FALSE(analyze(schema).has_value());
    }

    TEST(CompositionAnalyzerTest, EmptyArrayFallsThroughToNextKeyword) {
        const auto schema = json::parse(R"({"allOf": [], "oneOf": [{"$ref": "#/components/schemas/Cat"}]})");

        EXPECT_EQ(composition_kind(schema), CompositionKind::OneOf);

        const auto composition = analyze(schema);
        ASSERT_TRUE(composition.has_value());
        ASSERT_EQ(composition->members.size(), 1u);
        EXPECT_EQ(composition->members[0].schema_name(), "Cat");
    }

    TEST(CompositionAnalyzerTest, AllOfTakesPrecedence) {
        const auto schema = json::parse(R"({
            "anyOf": [{"type": "string"}],
            "oneOf": [{"type": "integer"}],
            "allOf": [{"type": "object"}]
        })");

        EXPECT_EQ(composition_kind(schema), CompositionKind::AllOf);

        const auto without_all = json::parse(R"({"anyOf": [{}], "oneOf": [{}]})");
        EXPECT_EQ(composition_kind(without_all), CompositionKind::OneOf);
    }

    TEST(CompositionAnalyzerTest, NonArrayKeywordIsIgnored) {
        const auto schema = json::parse(R"({"allOf": {"type": "object"}, "oneOf": [{"type": "string"}]})");

        EXPECT_EQ(composition_kind(schema), CompositionKind::OneOf);
    }

    TEST(CompositionAnalyzerTest, SchemaNameFromRef) {
        EXPECT_EQ(schema_name_from_ref("#/components/schemas/Pet"), "Pet");
        EXPECT_EQ(schema_name_from_ref("common.yaml#/Error"), "Error");
        EXPECT_EQ(schema_name_from_ref("Plain"), "Plain");
    }

    TEST(CompositionAnalyzerTest, ClassifiesReferenceAndInlineMembers) {
        const auto schema = json::parse(R"({
            "oneOf": [
                {"$ref": "#/components/schemas/Cat"},
                {"type": "object", "properties": {"bark": {"type": "boolean"}}},
                {"$circular_ref": "#/components/schemas/Node"}
            ]
        })");

        const auto composition = analyze(schema);
        ASSERT_TRUE(composition.has_value());
        EXPECT_EQ(composition->kind, CompositionKind::OneOf);
        ASSERT_EQ(composition->members.size(), 3u);

        ASSERT_TRUE(composition->members[0].is_reference());
        EXPECT_EQ(composition->members[0].schema_name(), "Cat");

        ASSERT_FALSE(composition->members[1].is_reference());
        EXPECT_EQ(composition->members[1].schema(), schema["oneOf"][1]);

        ASSERT_TRUE(composition->members[2].is_reference());
        EXPECT_EQ(composition->members[2].schema_name(), "Node");

        EXPECT_FALSE(composition->discriminator.has_value());
    }

    TEST(CompositionAnalyzerTest, ExtractsDiscriminator) {
        const auto schema = json::parse(R"({
            "oneOf": [{"$ref": "#/components/schemas/Cat"}, {"$ref": "#/components/schemas/Dog"}],
            "discriminator": {
                "propertyName": "petType",
                "mapping": {"cat": "#/components/schemas/Cat", "dog": "#/components/schemas/Dog"}
            }
        })");

        const auto composition = analyze(schema);
        ASSERT_TRUE(composition.has_value());
        ASSERT_TRUE(composition->discriminator.has_value());
        EXPECT_EQ(composition->discriminator->property_name, "petType");
        ASSERT_EQ(composition->discriminator->mapping.size(), 2u);
        EXPECT_EQ(composition->discriminator->mapping.at("cat"), "#/components/schemas/Cat");
    }

    TEST(CompositionAnalyzerTest, DiscriminatorPropertyDefaultsToType) {
        const auto discriminator = extract_discriminator(json::object());

        EXPECT_EQ(discriminator.property_name, "type");
        EXPECT_TRUE(discriminator.mapping.empty());
    }

    TEST(CompositionAnalyzerTest, MergeAllOfCombinesPropertiesAndRequired) {
        const std::vector<json> members = {
            json::parse(R"({"type": "object", "properties": {"id": {"type": "integer"}}})"),
            json::parse(R"({"type": "object", "properties": {"name": {"type": "string"}}, "required": ["name"]})")
        };

        const json merged = merge_all_of(members);

        EXPECT_EQ(merged["type"], "object");
        EXPECT_TRUE(merged["properties"].contains("id"));
        EXPECT_TRUE(merged["properties"].contains("name"));
        EXPECT_EQ(merged["required"], json::array({"name"}));
    }

    TEST(CompositionAnalyzerTest, MergeAllOfLaterPropertyWins) {
        const std::vector<json> members = {
            json::parse(R"({"properties": {"id": {"type": "integer"}}, "required": ["id"]})"),
            json::parse(R"({"properties": {"id": {"type": "string"}}, "required": ["id", "kind"]})")
        };

        const json merged = merge_all_of(members);

        EXPECT_EQ(merged["properties"]["id"]["type"], "string");
        EXPECT_EQ(merged["required"], json::array({"id", "kind"}));
    }

    TEST(CompositionAnalyzerTest, MergeAllOfKeepsFirstDescription) {
        const std::vector<json> members = {
            json::parse(R"({"description": "base"})"),
            json::parse(R"({"description": "extension", "title": "Extended"})"),
            json("not a schema")
        };

        const json merged = merge_all_of(members);

        EXPECT_EQ(merged["description"], "base");
        EXPECT_EQ(merged["title"], "Extended");
        EXPECT_TRUE(merged["properties"].empty());
        EXPECT_TRUE(merged["required"].empty());
    }

}
