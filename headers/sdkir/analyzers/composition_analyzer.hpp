//
// Created by gregorian-rayne on 1/17/26.
//

#ifndef SDKIR_COMPOSITION_ANALYZER_HPP
#define SDKIR_COMPOSITION_ANALYZER_HPP

/**
 * @file composition_analyzer.hpp
 * @brief Classification of allOf / oneOf / anyOf schemas.
 *
 * oneOf and anyOf stay unions in the IR. allOf is an intersection and can
 * be flattened into a single object schema with merge_all_of().
 *
 * Kinds are checked in the order allOf, oneOf, anyOf; the first one
 * present decides. A composition keyword whose value is not an array is
 * ignored.
 */

#include "sdkir/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sdkir::analyzers::composition {

    /**
     * Keyword under which a composition kind appears in a schema.
     */
    [[nodiscard]] const char* keyword(CompositionKind kind) noexcept;

    /**
     * First of allOf, oneOf, anyOf present as a non-empty array.
     */
    [[nodiscard]] std::optional<CompositionKind> composition_kind(const json& schema);

    [[nodiscard]] bool is_composition(const json& schema);

    /**
     * Bare schema name of a reference: its last '/'-separated segment
     * ("#/components/schemas/Pet" gives "Pet").
     */
    [[nodiscard]] std::string schema_name_from_ref(std::string_view ref);

    /**
     * Reads a discriminator object. "propertyName" defaults to "type" and
     * "mapping" to empty; non-string mapping targets are kept as JSON text.
     */
    [[nodiscard]] Discriminator extract_discriminator(const json& discriminator);

    /**
     * Builds the composition of a schema, or nothing when the schema has
     * no composition keyword. Reference members (including circular
     * markers) become schema names; everything else is kept inline.
     */
    [[nodiscard]] std::optional<Composition> analyze(const json& schema);

    /**
     * Flattens allOf members into one object schema.
     *
     * Properties of later members replace same-named properties of earlier
     * ones, while "description" and "title" keep the first value seen.
     * Required names are concatenated and then deduplicated.
     */
    [[nodiscard]] json merge_all_of(const std::vector<json>& members);

}  // namespace sdkir::analyzers::composition

#endif //SDKIR_COMPOSITION_ANALYZER_HPP
