//
// Created by gregorian-rayne on 1/13/26.
//

#ifndef SDKIR_YAML_UTILS_HPP
#define SDKIR_YAML_UTILS_HPP

/**
 * @file yaml_utils.hpp
 * @brief YAML decoding into the document tree.
 *
 * YAML input is parsed with yaml-cpp and converted to sdkir::json so that
 * every later stage works on a single tree type. Plain scalars are typed
 * by the YAML 1.2 core schema (null, bool, int, float, string); quoted
 * scalars and mapping keys always stay strings.
 */

#include "sdkir/result.hpp"
#include "sdkir/error.hpp"
#include "sdkir/types.hpp"

#include <string>
#include <string_view>

namespace sdkir::yaml_utils {

    /**
     * Parses YAML text. Only the first document of a stream is read.
     *
     * @param content The YAML text.
     * @return The converted document or a ParseError naming the position.
     */
    [[nodiscard]] Result<json, Error> parse(std::string_view content);

    /**
     * Types a plain (unquoted) scalar by the YAML 1.2 core schema.
     */
    [[nodiscard]] json resolve_plain_scalar(const std::string& text);

}  // namespace sdkir::yaml_utils

#endif //SDKIR_YAML_UTILS_HPP
