//
// Created by gregorian-rayne on 1/24/26.
//

#include "sdkir/analyzers/naming_analyzer.hpp"

#include <gtest/gtest.h>

namespace sdkir::analyzers::naming
{
    TEST(NamingAnalyzerTest, FieldNamingSnakeCase) {
        const auto schema = json::parse(R"({"properties": {"first_name": {}, "last_name": {}, "id": {}}})");

        EXPECT_EQ(detect_field_naming(schema), "snake_case");
    }

    TEST(NamingAnalyzerTest, FieldNamingCamelCase) {
        const auto schema = json::parse(R"({"properties": {"firstName": {}, "lastName": {}, "created_at": {}}})");

        EXPECT_EQ(detect_field_naming(schema), "camelCase");
    }

    TEST(NamingAnalyzerTest, FieldNamingOriginalWithoutSignal) {
        EXPECT_EQ(detect_field_naming(json::parse(R"({"properties": {"id": {}, "name": {}}})")), "original");
        EXPECT_EQ(detect_field_naming(json::parse(R"({"type": "string"})")), "original");
    }

    TEST(NamingAnalyzerTest, FieldNamingSamplesLeadingProperties) {
        json schema = json::object();
        for (int i = 0; i < 10; ++i) {
            schema["properties"]["field_" + std::to_string(i)] = json::object();
        }
        for (int i = 0; i < 15; ++i) {
            schema["properties"]["fieldNumber" + std::to_string(i)] = json::object();
        }

        EXPECT_EQ(detect_field_naming(schema), "snake_case");
    }

    TEST(NamingAnalyzerTest, ParameterNaming) {
        EXPECT_EQ(detect_parameter_naming(json::parse(R"([{"name": "page_size"}, {"name": "sort_by"}])")), "snake_case");
        EXPECT_EQ(detect_parameter_naming(json::parse(R"([{"name": "pageSize"}, {"name": "limit"}])")), "camelCase");
        EXPECT_EQ(detect_parameter_naming(json::parse(R"([{"name": "limit"}])")), "original");
        EXPECT_EQ(detect_parameter_naming(json::array()), "original");
    }

    TEST(NamingAnalyzerTest, ConventionsDefaults) {
        const auto conventions = analyze_conventions(json::object());

        EXPECT_EQ(conventions.request, "snake_case");
        EXPECT_EQ(conventions.response, "camelCase");
        EXPECT_EQ(conventions.parameter, "camelCase");
    }

    TEST(NamingAnalyzerTest, ConventionsFromDocument) {
        const auto spec = json::parse(R"({
            "components": {"schemas": {
                "User": {"properties": {"user_id": {}, "display_name": {}}},
                "Other": {"properties": {"someField": {}}}
            }},
            "paths": {
                "/users": {"get": {"parameters": [{"name": "page_size"}, {"name": "order_by"}]}}
            }
        })");

        const auto conventions = analyze_conventions(spec);
        EXPECT_EQ(conventions.request, "snake_case");
        EXPECT_EQ(conventions.response, "snake_case");
        EXPECT_EQ(conventions.parameter, "snake_case");
    }

}
