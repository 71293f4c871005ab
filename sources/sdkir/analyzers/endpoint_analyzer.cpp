//
// Created by gregorian-rayne on 1/17/26.
//

#include "sdkir/analyzers/endpoint_analyzer.hpp"
#include "sdkir/utils/case_utils.hpp"
#include "sdkir/utils/json_utils.hpp"
#include "sdkir/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <memory>
#include <utility>

namespace sdkir::analyzers::endpoint {

    namespace {

        bool is_version_token(const std::string_view segment) noexcept {
            return segment.size() > 1 && segment.front() == 'v' && string_utils::is_digits(segment.substr(1));
        }

        /**
         * Non-empty path segments that are not parameters.
         */
        std::vector<std::string_view> static_segments(const std::string_view path) {
            std::vector<std::string_view> result;
            for (const auto segment : string_utils::path_segments(path)) {
                if (!segment.empty() && !string_utils::is_path_parameter(segment)) {
                    result.push_back(segment);
                }
            }
            return result;
        }

        bool is_truthy(const json& value) {
            switch (value.type()) {
                case json::value_t::null:
                case json::value_t::discarded:
                    return false;
                case json::value_t::object:
                case json::value_t::array:
                    return !value.empty();
                case json::value_t::string:
                    return !value.get_ref<const std::string&>().empty();
                case json::value_t::boolean:
                    return value.get<bool>();
                default:
                    return value != json(0);
            }
        }

        // ====================================================================
        // Naming tiers
        // ====================================================================

        struct NamingInput {
            HttpMethod method;
            std::string_view path;
            const std::optional<std::string>& operation_id;
            const json& responses;
            std::vector<std::string_view> segments;
            bool has_path_param;
        };

        using TierFn = std::optional<std::string> (*)(const NamingInput&);

        std::optional<std::string> declared_id_tier(const NamingInput& input) {
            if (!input.operation_id || input.operation_id->empty()) {
                return std::nullopt;
            }
            std::string cleaned = clean_operation_id(*input.operation_id);
            if (declared_verbs().contains(cleaned)) {
                return cleaned;
            }
            return std::nullopt;
        }

        std::optional<std::string> rpc_action_tier(const NamingInput& input) {
            if (input.segments.size() <= 1) {
                return std::nullopt;
            }
            if (const auto last = input.segments.back(); action_words().contains(last)) {
                return string_utils::to_lower(last);
            }
            return std::nullopt;
        }

        std::optional<std::string> method_shape_tier(const NamingInput& input) {
            switch (input.method) {
                case HttpMethod::Get:
                    if (input.has_path_param) {
                        return "get";
                    }
                    if (response_is_array(input.responses)) {
                        return "list";
                    }
                    if (!input.segments.empty()) {
                        return string_utils::to_lower(input.segments.back());
                    }
                    return "get";
                case HttpMethod::Post:
                    return "create";
                case HttpMethod::Put:
                case HttpMethod::Patch:
                    return "update";
                case HttpMethod::Delete:
                    return "delete";
                default:
                    return string_utils::to_lower(to_string(input.method));
            }
        }

        constexpr std::array<std::pair<NamingTier, TierFn>, 3> NAMING_TIERS = {{
            {NamingTier::DeclaredId, &declared_id_tier},
            {NamingTier::RpcAction, &rpc_action_tier},
            {NamingTier::MethodShape, &method_shape_tier},
        }};

        std::vector<std::string> read_tags(const json& operation) {
            std::vector<std::string> tags;
            if (const json* declared = json_utils::get_array(operation, "tags")) {
                for (const auto& tag : *declared) {
                    if (tag.is_string()) {
                        tags.push_back(tag.get<std::string>());
                    }
                }
            }
            return tags;
        }

        OperationPtr make_operation(const std::string& path, const HttpMethod method, const json& definition) {
            auto operation = std::make_shared<Operation>();
            operation->path = path;
            operation->method = method;
            operation->tags = read_tags(definition);
            operation->definition = definition;

            if (const std::string id = json_utils::get_string(definition, "operationId"); !id.empty()) {
                operation->operation_id = id;
            }
            if (const json* responses = json_utils::get_object(definition, "responses")) {
                operation->responses = *responses;
            }

            auto inferred = infer_operation_name(method, path, operation->operation_id, operation->responses);
            operation->name = std::move(inferred.name);
            operation->naming_tier = inferred.tier;
            operation->identifier = case_utils::sanitize_identifier(case_utils::to_snake_case(operation->name), "_");

            return operation;
        }

    }  // namespace

    const WordSet& declared_verbs() {
        static const WordSet verbs = {
            "create", "list", "get", "update", "delete",
            "download", "upload", "export", "import"
        };
        return verbs;
    }

    const WordSet& action_words() {
        static const WordSet words = {
            // file operations
            "download", "upload", "export", "import",
            // state transitions
            "activate", "deactivate", "enable", "disable", "publish", "unpublish",
            "archive", "unarchive",
            // workflow
            "approve", "reject", "cancel", "complete", "submit", "confirm", "verify", "validate",
            // execution control
            "execute", "trigger", "run", "start", "stop", "pause", "resume", "retry", "restart",
            // data sync
            "refresh", "sync", "clone", "duplicate", "copy", "resend", "reprocess",
            // utility
            "summary", "status", "health", "me", "current"
        };
        return words;
    }

    OperationGroups group_by_tags(const json& spec) {
        OperationGroups groups;

        const json* paths = json_utils::get_object(spec, "paths");
        if (paths == nullptr) {
            return groups;
        }

        for (auto path_it = paths->begin(); path_it != paths->end(); ++path_it) {
            const std::string& path = path_it.key();
            const json& path_item = path_it.value();
            if (!path_item.is_object()) {
                continue;
            }

            for (const auto method : ALL_HTTP_METHODS) {
                const json* definition = json_utils::get_object(path_item, path_item_key(method));
                if (definition == nullptr) {
                    continue;
                }

                const OperationPtr operation = make_operation(path, method, *definition);

                if (operation->tags.empty()) {
                    group_for(groups, extract_resource_from_path(path)).operations.push_back(operation);
                    continue;
                }
                for (const auto& tag : operation->tags) {
                    group_for(groups, tag).operations.push_back(operation);
                }
            }
        }

        return groups;
    }

    std::string extract_resource_from_path(const std::string_view path) {
        for (const auto segment : static_segments(path)) {
            if (is_version_token(segment)) {
                continue;
            }
            if (segment == "api" || segment == "beta" || segment == "alpha") {
                continue;
            }
            return std::string(segment);
        }
        return "default";
    }

    std::optional<std::string> detect_path_prefix(const std::vector<std::string>& paths) {
        if (paths.empty()) {
            return std::nullopt;
        }

        if (paths.size() == 1) {
            const auto segments = static_segments(paths.front());
            if (segments.empty()) {
                return std::nullopt;
            }
            const auto count = static_cast<std::ptrdiff_t>(std::min<std::size_t>(2, segments.size()));
            const std::vector<std::string_view> leading(segments.begin(), segments.begin() + count);
            return "/" + string_utils::join(leading, "/");
        }

        std::optional<std::string> common;
        for (const auto& path : paths) {
            const auto segments = static_segments(path);
            if (segments.empty()) {
                continue;
            }

            std::string prefix = "/" + std::string(segments.front());
            if (!common) {
                common = std::move(prefix);
            } else if (!string_utils::starts_with(*common, prefix) && !string_utils::starts_with(prefix, *common)) {
                return std::nullopt;
            }
        }
        return common;
    }

    ResourceId requires_resource_id(const std::vector<std::string>& paths) {
        std::set<std::string> id_params;
        for (const auto& path : paths) {
            for (const auto segment : string_utils::path_segments(path)) {
                if (segment.size() < 2 || segment.front() != '{' || segment.back() != '}') {
                    continue;
                }
                const auto name = segment.substr(1, segment.size() - 2);
                if (string_utils::contains(string_utils::to_lower(name), "id")) {
                    id_params.emplace(name);
                }
            }
        }

        if (id_params.size() == 1) {
            return ResourceId{true, *id_params.begin()};
        }
        return ResourceId{};
    }

    bool response_is_array(const json& responses) {
        for (const char* status : {"200", "201"}) {
            const json* response = json_utils::get_object(responses, status);
            if (response == nullptr || !is_truthy(*response)) {
                continue;
            }

            const json* content = json_utils::get_object(*response, "content");
            const json* media = content ? json_utils::get_object(*content, "application/json") : nullptr;
            if (media == nullptr) {
                continue;
            }

            if (const auto schema = media->find("schema"); schema != media->end() && is_truthy(*schema)) {
                return json_utils::get_string(*schema, "type") == "array";
            }
        }
        return false;
    }

    std::string clean_operation_id(const std::string_view operation_id) {
        constexpr std::string_view marker = "_api_";
        const auto pos = operation_id.find(marker);
        if (pos == std::string_view::npos) {
            return std::string(operation_id);
        }

        auto parts = string_utils::split(operation_id.substr(0, pos), '_');
        if (const auto last = parts.back(); last == "v1" || last == "v2" || last == "beta") {
            parts.pop_back();
        }
        return string_utils::join(parts, "_");
    }

    InferredName infer_operation_name(
        const HttpMethod method,
        const std::string_view path,
        const std::optional<std::string>& operation_id,
        const json& responses
    ) {
        const NamingInput input{
            method,
            path,
            operation_id,
            responses,
            static_segments(path),
            string_utils::contains(path, "{")
        };

        for (const auto& [tier, infer] : NAMING_TIERS) {
            if (auto name = infer(input)) {
                return InferredName{std::move(*name), tier};
            }
        }

        // The method-shape tier always produces a name.
        return InferredName{string_utils::to_lower(to_string(method)), NamingTier::MethodShape};
    }

    std::vector<std::string> operation_paths(const OperationList& operations) {
        std::vector<std::string> paths;
        for (const auto& operation : operations) {
            if (std::ranges::find(paths, operation->path) == paths.end()) {
                paths.push_back(operation->path);
            }
        }
        return paths;
    }

}  // namespace sdkir::analyzers::endpoint
