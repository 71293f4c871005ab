//
// Created by gregorian-rayne on 1/24/26.
//

#include "sdkir/analyzers/namespace_analyzer.hpp"

#include <gtest/gtest.h>

namespace sdkir::analyzers::namespaces
{
    TEST(NamespaceAnalyzerTest, ExtractFromPath) {
        EXPECT_EQ(extract_namespace_from_path("/api/v1/users"), "v1");
        EXPECT_EQ(extract_namespace_from_path("/beta/features"), "beta");
        EXPECT_EQ(extract_namespace_from_path("/v2/orders/{id}"), "v2");
        EXPECT_EQ(extract_namespace_from_path("/preview/things"), "preview");
        EXPECT_FALSE(extract_namespace_from_path("/users").has_value());
    }

    TEST(NamespaceAnalyzerTest, VersionTokenNeedsDigits) {
        EXPECT_FALSE(extract_namespace_from_path("/videos").has_value());
        EXPECT_FALSE(extract_namespace_from_path("/v/items").has_value());
        EXPECT_EQ(extract_namespace_from_path("/api/v10/items"), "v10");
    }

    TEST(NamespaceAnalyzerTest, ExtractFromServerUrl) {
        EXPECT_EQ(extract_namespace_from_url("https://api.example.com/v1"), "v1");
        EXPECT_EQ(extract_namespace_from_url("https://api.example.com/api/v3/"), "v3");
        EXPECT_FALSE(extract_namespace_from_url("https://api.example.com").has_value());
        EXPECT_FALSE(extract_namespace_from_url("https://api.example.com/rest").has_value());
    }

    TEST(NamespaceAnalyzerTest, DetectsDistinctNamespacesInOrder) {
        const auto spec = json::parse(R"({
            "paths": {
                "/v1/users": {},
                "/beta/features": {},
                "/v1/orders": {},
                "/health": {}
            }
        })");

        const auto namespaces = detect_namespaces(spec);
        ASSERT_EQ(namespaces.size(), 2u);
        EXPECT_EQ(namespaces[0].name, "v1");
        EXPECT_EQ(namespaces[0].path_prefix, "/v1");
        EXPECT_EQ(namespaces[1].name, "beta");
        EXPECT_EQ(namespaces[1].path_prefix, "/beta");
        EXPECT_TRUE(namespaces[0].resources.empty());
    }

    TEST(NamespaceAnalyzerTest, FallsBackToFirstServer) {
        const auto spec = json::parse(R"({
            "servers": [{"url": "https://api.example.com/v2"}, {"url": "https://api.example.com/v3"}],
            "paths": {"/users": {}}
        })");

        const auto namespaces = detect_namespaces(spec);
        ASSERT_EQ(namespaces.size(), 1u);
        EXPECT_EQ(namespaces[0].name, "v2");
    }

    TEST(NamespaceAnalyzerTest, PathTokensTakePrecedenceOverServers) {
        const auto spec = json::parse(R"({
            "servers": [{"url": "https://api.example.com/v2"}],
            "paths": {"/beta/users": {}}
        })");

        const auto namespaces = detect_namespaces(spec);
        ASSERT_EQ(namespaces.size(), 1u);
        EXPECT_EQ(namespaces[0].name, "beta");
    }

    TEST(NamespaceAnalyzerTest, NoNamespaces) {
        EXPECT_TRUE(detect_namespaces(json::parse(R"({"paths": {"/users": {}}})")).empty());
        EXPECT_TRUE(detect_namespaces(json::object()).empty());
    }

    TEST(NamespaceAnalyzerTest, GroupsPathsByNamespace) {
        const auto groups = group_paths_by_namespace({"/v1/users", "/users", "/v1/orders", "/beta/x"});

        ASSERT_EQ(groups.size(), 3u);
        EXPECT_EQ(groups[0].name, "v1");
        EXPECT_EQ(groups[0].paths, (std::vector<std::string>{"/v1/users", "/v1/orders"}));
        EXPECT_EQ(groups[1].name, DEFAULT_GROUP);
        EXPECT_EQ(groups[1].paths, (std::vector<std::string>{"/users"}));
        EXPECT_EQ(groups[2].name, "beta");
    }

}
