//
// Created by gregorian-rayne on 1/18/26.
//

#include "sdkir/analyzers/nested_detector.hpp"
#include "sdkir/utils/json_utils.hpp"
#include "sdkir/utils/string_utils.hpp"

#include <algorithm>

namespace sdkir::analyzers::nested {

    namespace {
        constexpr std::size_t GENERATED_ID_MIN_PARTS = 6;

        NestedGroup& nested_group_for(std::vector<NestedGroup>& groups, const std::string& name) {
            for (auto& group : groups) {
                if (group.name == name) {
                    return group;
                }
            }
            groups.push_back(NestedGroup{name, nested_property_name(name), {}});
            return groups.back();
        }
    }

    const std::set<std::string, std::less<>>& leading_verbs() {
        static const std::set<std::string, std::less<>> verbs = {
            "get", "list", "create", "update", "delete", "patch", "post", "put",
            "upload", "download", "fetch", "search", "find"
        };
        return verbs;
    }

    std::optional<std::string> extract_nested_from_operation_id(const std::string_view operation_id) {
        const auto parts = string_utils::split(operation_id, '_');

        if (parts.size() >= GENERATED_ID_MIN_PARTS && std::ranges::find(parts, std::string_view("api")) != parts.end()) {
            return std::nullopt;
        }
        if (leading_verbs().contains(string_utils::to_lower(parts.front()))) {
            return std::nullopt;
        }
        if (parts.size() >= 3) {
            return std::string(parts[1]);
        }
        return std::nullopt;
    }

    std::vector<NestedGroup> detect_nested_resources(
        const OperationList& operations,
        const NestedOptions& options
    ) {
        std::vector<NestedGroup> groups;

        for (const auto& operation : operations) {
            if (const auto ext = operation->definition.find(options.extension_key);
                ext != operation->definition.end()) {
                const std::string name = ext->is_string() ? ext->get<std::string>() : json_utils::to_string(*ext);
                nested_group_for(groups, name).operations.push_back(operation);
                continue;
            }

            if (!operation->operation_id || operation->operation_id->empty()) {
                continue;
            }
            if (const auto name = extract_nested_from_operation_id(*operation->operation_id)) {
                nested_group_for(groups, *name).operations.push_back(operation);
            }
        }

        return groups;
    }

    bool should_create_nested_resource(const std::size_t operation_count, const std::size_t min_operations) noexcept {
        return operation_count >= min_operations;
    }

    std::string nested_property_name(const std::string_view nested_name) {
        return string_utils::to_lower(nested_name);
    }

}  // namespace sdkir::analyzers::nested
