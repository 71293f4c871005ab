//
// Created by gregorian-rayne on 1/18/26.
//

#ifndef SDKIR_NAMESPACE_ANALYZER_HPP
#define SDKIR_NAMESPACE_ANALYZER_HPP

/**
 * @file namespace_analyzer.hpp
 * @brief Detection of version and release-stage namespaces (v1, beta, ...).
 */

#include "sdkir/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sdkir::analyzers::namespaces {

    /// Key under which group_paths_by_namespace() collects paths with no token.
    inline constexpr auto DEFAULT_GROUP = "default";

    /**
     * First segment of a path that is a namespace token: "v<digits>", one
     * of "beta", "alpha", "canary", "preview", or "v<digits>" following an
     * "api" segment.
     */
    [[nodiscard]] std::optional<std::string> extract_namespace_from_path(std::string_view path);

    /**
     * Applies extract_namespace_from_path() to the path part of a URL
     * ("https://api.example.com/v2" gives "v2").
     */
    [[nodiscard]] std::optional<std::string> extract_namespace_from_url(std::string_view url);

    /**
     * Distinct namespace tokens of spec["paths"] in first-seen order, each
     * with path prefix "/<token>". When no path has a token, the first
     * server URL is tried instead; the result may be empty.
     */
    [[nodiscard]] std::vector<Namespace> detect_namespaces(const json& spec);

    /**
     * Groups paths by their namespace token, in first-seen order. Paths
     * without a token go to DEFAULT_GROUP.
     */
    [[nodiscard]] std::vector<PathGroup> group_paths_by_namespace(const std::vector<std::string>& paths);

}  // namespace sdkir::analyzers::namespaces

#endif //SDKIR_NAMESPACE_ANALYZER_HPP
