//
// Created by gregorian-rayne on 1/24/26.
//

#include "sdkir/analyzers/endpoint_analyzer.hpp"

#include <gtest/gtest.h>

namespace sdkir::analyzers::endpoint
{
    namespace {
        json array_response() {
            return json::parse(R"({"200": {"content": {"application/json": {"schema": {"type": "array"}}}}})");
        }

        json object_response() {
            return json::parse(R"({"200": {"content": {"application/json": {"schema": {"type": "object"}}}}})");
        }
    }

    // ========================================================================
    // Path helpers
    // ========================================================================

    TEST(EndpointAnalyzerTest, ExtractResourceSkipsVersionAndStageTokens) {
        EXPECT_EQ(extract_resource_from_path("/api/v1/users"), "users");
        EXPECT_EQ(extract_resource_from_path("/beta/features/{id}"), "features");
        EXPECT_EQ(extract_resource_from_path("/{tenant}/orders"), "orders");
        EXPECT_EQ(extract_resource_from_path("/v2"), "default");
        EXPECT_EQ(extract_resource_from_path("/"), "default");
    }

    TEST(EndpointAnalyzerTest, PathPrefixForSinglePath) {
        EXPECT_EQ(detect_path_prefix({"/api/v1/users/{id}"}), "/api/v1");
        EXPECT_EQ(detect_path_prefix({"/users"}), "/users");
        EXPECT_FALSE(detect_path_prefix({"/{id}"}).has_value());
        EXPECT_FALSE(detect_path_prefix({}).has_value());
    }

    TEST(EndpointAnalyzerTest, PathPrefixForSharedFirstSegment) {
        EXPECT_EQ(detect_path_prefix({"/users", "/users/{id}", "/users/{id}/posts"}), "/users");
    }

    TEST(EndpointAnalyzerTest, PathPrefixAbsentWhenFirstSegmentsDiffer) {
        EXPECT_FALSE(detect_path_prefix({"/users", "/products"}).has_value());
    }

    TEST(EndpointAnalyzerTest, RequiresResourceIdWithSingleIdParameter) {
        const auto id = requires_resource_id({"/users/{user_id}", "/users/{user_id}/posts"});

        EXPECT_TRUE(id.required);
        EXPECT_EQ(id.param_name, "user_id");
    }

    TEST(EndpointAnalyzerTest, NoResourceIdWithoutParameters) {
        const auto id = requires_resource_id({"/users", "/products"});

        EXPECT_FALSE(id.required);
        EXPECT_FALSE(id.param_name.has_value());
    }

    TEST(EndpointAnalyzerTest, NoResourceIdWithSeveralIdParameters) {
        const auto id = requires_resource_id({"/users/{user_id}", "/users/{user_id}/posts/{post_id}"});

        EXPECT_FALSE(id.required);
        EXPECT_FALSE(id.param_name.has_value());
    }

    TEST(EndpointAnalyzerTest, ResourceIdMatchIsCaseInsensitive) {
        const auto id = requires_resource_id({"/projects/{projectID}", "/projects/{slug}/files"});

        EXPECT_TRUE(id.required);
        EXPECT_EQ(id.param_name, "projectID");
    }

    // ========================================================================
    // Response shape
    // ========================================================================

    TEST(EndpointAnalyzerTest, ArrayResponseDetected) {
        EXPECT_TRUE(response_is_array(array_response()));
        EXPECT_FALSE(response_is_array(object_response()));
        EXPECT_FALSE(response_is_array(json::object()));
    }

    TEST(EndpointAnalyzerTest, CreatedResponseConsultedWhenOkMissing) {
        const auto responses = json::parse(R"({
            "201": {"content": {"application/json": {"schema": {"type": "array"}}}}
        })");

        EXPECT_TRUE(response_is_array(responses));
    }

    TEST(EndpointAnalyzerTest, OkResponseDecidesBeforeCreated) {
        const auto responses = json::parse(R"({
            "200": {"content": {"application/json": {"schema": {"type": "object"}}}},
            "201": {"content": {"application/json": {"schema": {"type": "array"}}}}
        })");

        EXPECT_FALSE(response_is_array(responses));
    }

    // ========================================================================
    // Operation naming
    // ========================================================================

    TEST(EndpointAnalyzerTest, CleanOperationIdStripsGeneratedSuffix) {
        EXPECT_EQ(clean_operation_id("list_users_api_v1_users_get"), "list_users");
        EXPECT_EQ(clean_operation_id("create_v1_api_items_post"), "create");
        EXPECT_EQ(clean_operation_id("get_beta_api_flags"), "get");
        EXPECT_EQ(clean_operation_id("getUser"), "getUser");
    }

    TEST(EndpointAnalyzerTest, DeclaredVerbWins) {
        const auto inferred = infer_operation_name(HttpMethod::Post, "/users", std::string("create"), json::object());

        EXPECT_EQ(inferred.name, "create");
        EXPECT_EQ(inferred.tier, NamingTier::DeclaredId);
    }

    TEST(EndpointAnalyzerTest, DeclaredVerbAfterCleaning) {
        const auto inferred = infer_operation_name(
            HttpMethod::Get, "/users", std::string("list_v1_api_users_get"), array_response()
        );

        EXPECT_EQ(inferred.name, "list");
        EXPECT_EQ(inferred.tier, NamingTier::DeclaredId);
    }

    TEST(EndpointAnalyzerTest, RpcActionFromTrailingSegment) {
        const auto inferred = infer_operation_name(HttpMethod::Get, "/files/{id}/download", std::nullopt, json::object());

        EXPECT_EQ(inferred.name, "download");
        EXPECT_EQ(inferred.tier, NamingTier::RpcAction);
    }

    TEST(EndpointAnalyzerTest, RpcActionNeedsMoreThanOneSegment) {
        const auto inferred = infer_operation_name(HttpMethod::Get, "/health", std::nullopt, object_response());

        EXPECT_EQ(inferred.name, "health");
        EXPECT_EQ(inferred.tier, NamingTier::MethodShape);
    }

    TEST(EndpointAnalyzerTest, UnrecognizedOperationIdFallsThrough) {
        const auto inferred = infer_operation_name(HttpMethod::Post, "/jobs/{id}/cancel", std::string("cancelJob"), json::object());

        EXPECT_EQ(inferred.name, "cancel");
        EXPECT_EQ(inferred.tier, NamingTier::RpcAction);
    }

    TEST(EndpointAnalyzerTest, MethodShapeNames) {
        EXPECT_EQ(infer_operation_name(HttpMethod::Get, "/users", std::nullopt, array_response()).name, "list");
        EXPECT_EQ(infer_operation_name(HttpMethod::Get, "/users/{id}", std::nullopt, json::object()).name, "get");
        EXPECT_EQ(infer_operation_name(HttpMethod::Get, "/", std::nullopt, json::object()).name, "get");
        EXPECT_EQ(infer_operation_name(HttpMethod::Post, "/users", std::nullopt, json::object()).name, "create");
        EXPECT_EQ(infer_operation_name(HttpMethod::Put, "/users/{id}", std::nullopt, json::object()).name, "update");
        EXPECT_EQ(infer_operation_name(HttpMethod::Patch, "/users/{id}", std::nullopt, json::object()).name, "update");
        EXPECT_EQ(infer_operation_name(HttpMethod::Delete, "/users/{id}", std::nullopt, json::object()).name, "delete");
        EXPECT_EQ(infer_operation_name(HttpMethod::Head, "/users", std::nullopt, json::object()).name, "head");
    }

    // ========================================================================
    // Grouping
    // ========================================================================

    TEST(EndpointAnalyzerTest, GroupsOperationsByTag) {
        const auto spec = json::parse(R"({
            "paths": {
                "/users": {
                    "get": {"tags": ["users"], "responses": {"200": {"content": {"application/json": {"schema": {"type": "array"}}}}}},
                    "post": {"tags": ["users"], "operationId": "create"}
                },
                "/users/{id}": {
                    "delete": {"tags": ["users"], "operationId": "delete"}
                }
            }
        })");

        const auto groups = group_by_tags(spec);
        ASSERT_EQ(groups.size(), 1u);
        EXPECT_EQ(groups[0].name, "users");
        ASSERT_EQ(groups[0].operations.size(), 3u);

        EXPECT_EQ(groups[0].operations[0]->method, HttpMethod::Get);
        EXPECT_EQ(groups[0].operations[0]->name, "list");
        EXPECT_EQ(groups[0].operations[1]->name, "create");
        EXPECT_EQ(groups[0].operations[1]->operation_id, "create");

        const auto& removal = groups[0].operations[2];
        EXPECT_EQ(removal->name, "delete");
        EXPECT_EQ(removal->identifier, "delete_");
        EXPECT_EQ(removal->path, "/users/{id}");
    }

    TEST(EndpointAnalyzerTest, UntaggedOperationGroupedByPath) {
        const auto spec = json::parse(R"({"paths": {"/api/v1/orders/{id}": {"get": {}}}})");

        const auto groups = group_by_tags(spec);
        ASSERT_EQ(groups.size(), 1u);
        EXPECT_EQ(groups[0].name, "orders");
        EXPECT_FALSE(groups[0].operations[0]->operation_id.has_value());
    }

    TEST(EndpointAnalyzerTest, MultiTaggedOperationIsShared) {
        const auto spec = json::parse(R"({"paths": {"/reports": {"get": {"tags": ["reports", "admin"]}}}})");

        const auto groups = group_by_tags(spec);
        ASSERT_EQ(groups.size(), 2u);
        EXPECT_EQ(groups[0].name, "reports");
        EXPECT_EQ(groups[1].name, "admin");
        EXPECT_EQ(groups[0].operations[0], groups[1].operations[0]);
    }

    TEST(EndpointAnalyzerTest, OperationKeepsExtensionFields) {
        const auto spec = json::parse(R"({"paths": {"/stages": {"post": {"tags": ["stages"], "x-nested-resource": "instruct"}}}})");

        const auto groups = group_by_tags(spec);
        ASSERT_EQ(groups.size(), 1u);
        EXPECT_EQ(groups[0].operations[0]->definition["x-nested-resource"], "instruct");
    }

    TEST(EndpointAnalyzerTest, NonOperationKeysIgnored) {
        const auto spec = json::parse(R"({"paths": {"/users": {"parameters": [], "summary": "Users", "get": {"tags": ["users"]}}}})");

        const auto groups = group_by_tags(spec);
        ASSERT_EQ(groups.size(), 1u);
        EXPECT_EQ(groups[0].operations.size(), 1u);
    }

    TEST(EndpointAnalyzerTest, SpecWithoutPathsHasNoGroups) {
        EXPECT_TRUE(group_by_tags(json::object()).empty());
    }

    TEST(EndpointAnalyzerTest, OperationPathsAreDistinctAndOrdered) {
        const auto spec = json::parse(R"({
            "paths": {
                "/users": {"get": {"tags": ["u"]}, "post": {"tags": ["u"]}},
                "/users/{id}": {"get": {"tags": ["u"]}}
            }
        })");

        const auto groups = group_by_tags(spec);
        ASSERT_EQ(groups.size(), 1u);
        EXPECT_EQ(operation_paths(groups[0].operations), (std::vector<std::string>{"/users", "/users/{id}"}));
    }

}
