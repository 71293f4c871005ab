//
// Created by gregorian-rayne on 1/19/26.
//

#ifndef SDKIR_IR_BUILDER_HPP
#define SDKIR_IR_BUILDER_HPP

/**
 * @file ir_builder.hpp
 * @brief Assembles the SDK intermediate representation from a document.
 *
 * The builder runs the analyzers over the resolved document: endpoint
 * grouping and naming, nested-resource detection per resource, namespace
 * detection, naming conventions. Schema compositions are read from the
 * raw document, where member schemas still carry their names; allOf
 * compositions are flattened from the resolved members.
 */

#include "sdkir/result.hpp"
#include "sdkir/error.hpp"
#include "sdkir/types.hpp"
#include "sdkir/config/config.hpp"

namespace sdkir::ir {

    /**
     * @param raw The document as loaded, references intact.
     * @param resolved The same document after reference resolution.
     * @return The IR, or StructuralError when the resolved document is
     *         not an object.
     */
    [[nodiscard]] Result<ApiIR, Error> build(
        const json& raw,
        const json& resolved,
        const config::Config& config = config::Config::defaults()
    );

    [[nodiscard]] json to_json(const Operation& operation);

    /**
     * Renders the IR as JSON. Operations shared between resources are
     * written out in full under each resource.
     */
    [[nodiscard]] json to_json(const ApiIR& ir);

}  // namespace sdkir::ir

#endif //SDKIR_IR_BUILDER_HPP
