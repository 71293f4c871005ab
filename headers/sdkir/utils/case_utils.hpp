//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef SDKIR_CASE_UTILS_HPP
#define SDKIR_CASE_UTILS_HPP

/**
 * @file case_utils.hpp
 * @brief Case conversion and identifier sanitization.
 *
 * Pure string functions used when naming resources and operations:
 *
 * @code
 *     to_snake_case("HTTPResponseCode")   // "http_response_code"
 *     to_pascal_case("user_profile")      // "UserProfile"
 *     sanitize_identifier("2fa-token")    // "n2fa_token"
 *     sanitize_identifier("delete")       // "deletevalue"
 * @endcode
 */

#include <set>
#include <string>
#include <string_view>

namespace sdkir::case_utils {

    using KeywordSet = std::set<std::string, std::less<>>;

    /**
     * Reserved words of C++, the default target of identifier escaping.
     */
    const KeywordSet& cpp_keywords();

    /**
     * Converts camelCase, PascalCase, kebab-case or spaced text to
     * snake_case. Acronyms are split before a following word
     * ("HTTPResponse" gives "http_response").
     */
    [[nodiscard]] std::string to_snake_case(std::string_view text);

    /**
     * Converts snake_case to camelCase; the first part is kept as is.
     */
    [[nodiscard]] std::string to_camel_case(std::string_view text);

    /**
     * Converts snake_case to PascalCase. Each part is title-cased, so
     * "user_id" gives "UserId".
     */
    [[nodiscard]] std::string to_pascal_case(std::string_view text);

    /**
     * Title-cases a word: the first letter of every alphabetic run is
     * upper-cased and the rest lower-cased ("v2beta" gives "V2Beta").
     */
    [[nodiscard]] std::string title_case(std::string_view word);

    /**
     * Classifies an identifier as "snake_case", "SCREAMING_SNAKE_CASE",
     * "PascalCase", "camelCase" or "unknown".
     */
    [[nodiscard]] std::string detect_naming_convention(std::string_view text);

    /**
     * Makes an arbitrary string a legal identifier.
     *
     * Characters outside [A-Za-z0-9_] become underscores, a leading digit
     * gets an "n" prefix, runs of underscores collapse and edge underscores
     * are stripped. An empty result becomes the suffix; a reserved word
     * gets the suffix appended.
     *
     * @param name Raw name from the API description.
     * @param suffix Replacement for empty names and keyword escape.
     * @param keywords Reserved words of the target language.
     */
    [[nodiscard]] std::string sanitize_identifier(
        std::string_view name,
        std::string_view suffix = "value",
        const KeywordSet& keywords = cpp_keywords()
    );

    /**
     * Sanitized PascalCase class name ("user-profile" gives "UserProfile").
     */
    [[nodiscard]] std::string sanitize_class_name(std::string_view name);

}  // namespace sdkir::case_utils

#endif //SDKIR_CASE_UTILS_HPP
