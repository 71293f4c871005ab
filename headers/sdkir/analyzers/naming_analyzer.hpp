//
// Created by gregorian-rayne on 1/18/26.
//

#ifndef SDKIR_NAMING_ANALYZER_HPP
#define SDKIR_NAMING_ANALYZER_HPP

/**
 * @file naming_analyzer.hpp
 * @brief Detection of the field and parameter naming style of an API.
 *
 * Results are one of "snake_case", "camelCase" or "original" (no clear
 * style). Only the first ten names of a sample are inspected.
 */

#include "sdkir/types.hpp"

#include <cstddef>
#include <string>

namespace sdkir::analyzers::naming {

    inline constexpr std::size_t SAMPLE_SIZE = 10;

    [[nodiscard]] std::string detect_field_naming(const json& schema);

    /**
     * @param parameters Array of parameter objects carrying a "name".
     */
    [[nodiscard]] std::string detect_parameter_naming(const json& parameters);

    /**
     * Request names are always snake_case. Response names follow the first
     * entry of components.schemas, parameter names follow the parameters
     * declared on operations; both default to camelCase when there is
     * nothing to sample.
     */
    [[nodiscard]] NamingConventions analyze_conventions(const json& spec);

}  // namespace sdkir::analyzers::naming

#endif //SDKIR_NAMING_ANALYZER_HPP
