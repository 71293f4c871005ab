//
// Created by gregorian-rayne on 1/18/26.
//

#include "sdkir/analyzers/namespace_analyzer.hpp"
#include "sdkir/utils/json_utils.hpp"
#include "sdkir/utils/string_utils.hpp"

#include <algorithm>
#include <iterator>

namespace sdkir::analyzers::namespaces {

    namespace {

        bool is_version_token(const std::string_view segment) noexcept {
            return segment.size() > 1 && segment.front() == 'v' && string_utils::is_digits(segment.substr(1));
        }

        bool is_stage_token(const std::string_view segment) noexcept {
            return segment == "beta" || segment == "alpha" || segment == "canary" || segment == "preview";
        }

        void add_namespace(std::vector<Namespace>& namespaces, const std::string& token) {
            const bool known = std::ranges::any_of(namespaces, [&](const Namespace& ns) {
                return ns.name == token;
            });
            if (!known) {
                namespaces.push_back(Namespace{token, "/" + token, {}});
            }
        }

    }  // namespace

    std::optional<std::string> extract_namespace_from_path(const std::string_view path) {
        const auto segments = string_utils::path_segments(path);
        for (std::size_t i = 0; i < segments.size(); ++i) {
            const auto segment = segments[i];
            if (is_version_token(segment) || is_stage_token(segment)) {
                return std::string(segment);
            }
            if (segment == "api" && i + 1 < segments.size() && is_version_token(segments[i + 1])) {
                return std::string(segments[i + 1]);
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> extract_namespace_from_url(std::string_view url) {
        if (const auto scheme = url.find("://"); scheme != std::string_view::npos) {
            url.remove_prefix(scheme + 3);
        }

        const auto slash = url.find('/');
        if (slash == std::string_view::npos) {
            return std::nullopt;
        }
        return extract_namespace_from_path(url.substr(slash));
    }

    std::vector<Namespace> detect_namespaces(const json& spec) {
        std::vector<Namespace> namespaces;

        if (const json* paths = json_utils::get_object(spec, "paths")) {
            for (auto it = paths->begin(); it != paths->end(); ++it) {
                if (const auto token = extract_namespace_from_path(it.key())) {
                    add_namespace(namespaces, *token);
                }
            }
        }

        if (!namespaces.empty()) {
            return namespaces;
        }

        const json* servers = json_utils::get_array(spec, "servers");
        if (servers != nullptr && !servers->empty()) {
            const std::string url = json_utils::get_string(servers->front(), "url");
            if (const auto token = extract_namespace_from_url(url)) {
                add_namespace(namespaces, *token);
            }
        }

        return namespaces;
    }

    std::vector<PathGroup> group_paths_by_namespace(const std::vector<std::string>& paths) {
        std::vector<PathGroup> groups;
        for (const auto& path : paths) {
            const std::string token = extract_namespace_from_path(path).value_or(DEFAULT_GROUP);

            auto group = std::ranges::find_if(groups, [&](const PathGroup& g) {
                return g.name == token;
            });
            if (group == groups.end()) {
                groups.push_back(PathGroup{token, {}});
                group = std::prev(groups.end());
            }
            group->paths.push_back(path);
        }
        return groups;
    }

}  // namespace sdkir::analyzers::namespaces
