//
// Created by gregorian-rayne on 1/17/26.
//

#ifndef SDKIR_ENDPOINT_ANALYZER_HPP
#define SDKIR_ENDPOINT_ANALYZER_HPP

/**
 * @file endpoint_analyzer.hpp
 * @brief Grouping of operations into resources and method-name inference.
 *
 * Method names are inferred in three tiers, first match wins:
 *
 *   1. declared-id  the cleaned operationId is a simple verb
 *                   ("create", "list", "get", ...)
 *   2. rpc-action   the last non-parameter path segment is an action word
 *                   ("/files/{id}/download" gives "download")
 *   3. method-shape the HTTP method, and for GET the response shape
 *
 * Tier 3 never fails, so every operation receives a name.
 */

#include "sdkir/types.hpp"

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace sdkir::analyzers::endpoint {

    using WordSet = std::set<std::string, std::less<>>;

    struct InferredName {
        std::string name;
        NamingTier tier = NamingTier::MethodShape;
    };

    struct ResourceId {
        bool required = false;
        std::optional<std::string> param_name;
    };

    /// Verbs accepted from a cleaned operationId.
    [[nodiscard]] const WordSet& declared_verbs();

    /// Trailing path segments recognized as RPC-style actions.
    [[nodiscard]] const WordSet& action_words();

    /**
     * Groups every operation of spec["paths"] by tag, in document order.
     *
     * Untagged operations go to the group named by
     * extract_resource_from_path(). An operation listed under several
     * tags is one shared Operation object placed in each group. Names are
     * inferred while grouping.
     */
    [[nodiscard]] OperationGroups group_by_tags(const json& spec);

    /**
     * First path segment that is not a parameter, a bare version token
     * (v1, v2, ...) or one of "api", "beta", "alpha"; "default" when none
     * is left.
     */
    [[nodiscard]] std::string extract_resource_from_path(std::string_view path);

    /**
     * Common leading segment of a resource's paths.
     *
     * A single path yields its first two non-parameter segments; several
     * paths yield "/<first segment>" as long as no two paths disagree.
     */
    [[nodiscard]] std::optional<std::string> detect_path_prefix(const std::vector<std::string>& paths);

    /**
     * A resource needs an id at construction when exactly one distinct
     * path parameter whose name contains "id" (any case) occurs across
     * its paths.
     */
    [[nodiscard]] ResourceId requires_resource_id(const std::vector<std::string>& paths);

    /**
     * Checks responses "200" then "201"; the first one present with a
     * JSON schema decides whether the response is an array.
     */
    [[nodiscard]] bool response_is_array(const json& responses);

    /**
     * Strips a generated "_api_..." suffix from an operationId together
     * with a trailing "v1", "v2" or "beta" token before it.
     * "list_users_v1_api_v1_users_get" gives "list_users".
     */
    [[nodiscard]] std::string clean_operation_id(std::string_view operation_id);

    [[nodiscard]] InferredName infer_operation_name(
        HttpMethod method,
        std::string_view path,
        const std::optional<std::string>& operation_id,
        const json& responses
    );

    /**
     * Paths of a list of operations, duplicates removed, in order.
     */
    [[nodiscard]] std::vector<std::string> operation_paths(const OperationList& operations);

}  // namespace sdkir::analyzers::endpoint

#endif //SDKIR_ENDPOINT_ANALYZER_HPP
