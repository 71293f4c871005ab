//
// Created by gregorian-rayne on 1/16/26.
//

#ifndef SDKIR_REFERENCE_HPP
#define SDKIR_REFERENCE_HPP

/**
 * @file reference.hpp
 * @brief Parsed "$ref" locators and JSON Pointer navigation.
 */

#include "sdkir/result.hpp"
#include "sdkir/error.hpp"
#include "sdkir/types.hpp"

#include <compare>
#include <string>
#include <string_view>

namespace sdkir::resolver {

    /// Key that marks a reference node.
    inline constexpr auto REF_KEY = "$ref";
    /// Key of the marker node that replaces a circular reference.
    inline constexpr auto CIRCULAR_REF_KEY = "$circular_ref";

    /**
     * A reference split on its first '#' into a document part and a
     * pointer part. "#/a/b" has an empty document part (this document);
     * "common.yaml" has an empty pointer part (the whole document).
     */
    struct Reference {
        std::string raw;
        std::string document;
        std::string pointer;

        static Reference parse(std::string_view text);

        [[nodiscard]] bool is_local() const noexcept { return document.empty(); }
        [[nodiscard]] bool is_url() const noexcept;

        auto operator<=>(const Reference&) const = default;
        bool operator==(const Reference&) const = default;
    };

    /**
     * Decodes one pointer segment: "~1" becomes "/", then "~0" becomes "~".
     */
    [[nodiscard]] std::string unescape_segment(std::string_view segment);

    /**
     * Walks an RFC 6901 pointer through a document. An empty pointer or "/"
     * selects the whole document. Objects are indexed by key, arrays by a
     * decimal index.
     *
     * @param reference Reference text used in error context.
     * @return The addressed node (owned by document), or ReferenceError
     *         for a missing key, a bad index, or a step through a scalar.
     */
    [[nodiscard]] Result<const json*, Error> navigate(
        const json& document,
        std::string_view pointer,
        const std::string& reference
    );

    /**
     * Builds the circular marker for a reference as it was written.
     */
    [[nodiscard]] json circular_marker(const std::string& reference);

    [[nodiscard]] bool is_circular_marker(const json& node);

}  // namespace sdkir::resolver

#endif //SDKIR_REFERENCE_HPP
