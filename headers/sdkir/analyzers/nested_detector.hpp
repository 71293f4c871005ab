//
// Created by gregorian-rayne on 1/18/26.
//

#ifndef SDKIR_NESTED_DETECTOR_HPP
#define SDKIR_NESTED_DETECTOR_HPP

/**
 * @file nested_detector.hpp
 * @brief Detection of sub-resources inside a resource's operations.
 *
 * An operation joins a nested group either through an explicit extension
 * field ("x-nested-resource": "instruct") or through an operationId of
 * the form "<resource>_<nested>_<action>" ("stages_instruct_create").
 */

#include "sdkir/types.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace sdkir::analyzers::nested {

    inline constexpr auto DEFAULT_EXTENSION_KEY = "x-nested-resource";
    inline constexpr std::size_t DEFAULT_MIN_OPERATIONS = 2;

    struct NestedOptions {
        std::string extension_key = DEFAULT_EXTENSION_KEY;
        std::size_t min_operations = DEFAULT_MIN_OPERATIONS;
    };

    /// Leading operationId words that mark a flat, non-nested operation.
    [[nodiscard]] const std::set<std::string, std::less<>>& leading_verbs();

    /**
     * Nested name encoded in an operationId, if any.
     *
     * Ids with more than five parts that include an "api" part are treated
     * as generated and rejected, as are ids starting with a verb.
     * Otherwise an id of at least three parts yields its second part.
     */
    [[nodiscard]] std::optional<std::string> extract_nested_from_operation_id(std::string_view operation_id);

    /**
     * Groups operations by nested name in encounter order. The extension
     * field wins over the operationId. Groups are returned regardless of
     * size; see should_create_nested_resource().
     */
    [[nodiscard]] std::vector<NestedGroup> detect_nested_resources(
        const OperationList& operations,
        const NestedOptions& options = {}
    );

    /**
     * Single-operation groups stay on the parent resource.
     */
    [[nodiscard]] bool should_create_nested_resource(
        std::size_t operation_count,
        std::size_t min_operations = DEFAULT_MIN_OPERATIONS
    ) noexcept;

    [[nodiscard]] std::string nested_property_name(std::string_view nested_name);

}  // namespace sdkir::analyzers::nested

#endif //SDKIR_NESTED_DETECTOR_HPP
