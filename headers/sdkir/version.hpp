//
// Created by gregorian-rayne on 1/12/26.
//

#ifndef SDKIR_VERSION_HPP
#define SDKIR_VERSION_HPP

/**
 * @file version.hpp
 * @brief sdkir version information.
 */

namespace sdkir {

    constexpr int VERSION_MAJOR = 0;
    constexpr int VERSION_MINOR = 3;
    constexpr int VERSION_PATCH = 0;

    constexpr auto VERSION_STRING = "0.3.0";

    /**
     * Project name.
     */
    constexpr auto PROJECT_NAME = "SDK IR Builder";

    /**
     * Short project name for CLI usage.
     */
    constexpr auto PROJECT_SHORT_NAME = "sdkir";

}  // namespace sdkir

#endif //SDKIR_VERSION_HPP
