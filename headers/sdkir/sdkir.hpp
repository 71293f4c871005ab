//
// Created by gregorian-rayne on 1/12/26.
//

#ifndef SDKIR_SDKIR_HPP
#define SDKIR_SDKIR_HPP

/**
 * @file sdkir.hpp
 * @brief Main header for the sdkir library.
 *
 * Pulls in the core types and the pipeline entry point. Include the
 * individual analyzer or resolver headers for narrower dependencies.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"
#include "pipeline.hpp"
#include "ir/ir_builder.hpp"

#endif //SDKIR_SDKIR_HPP
