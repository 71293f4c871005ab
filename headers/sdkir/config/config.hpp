//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef SDKIR_CONFIG_HPP
#define SDKIR_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Tool configuration loaded from a TOML file.
 *
 * Every field has a default, so an absent file or an absent section is
 * valid. Example:
 *
 * @code
 *     [resolver]
 *     cache_dir = "~/.sdkir/cache"
 *     fetch_timeout_ms = 30000
 *     prefetch = true
 *     prefetch_threads = 0
 *
 *     [naming]
 *     report_ambiguity = true
 *
 *     [nested]
 *     extension_key = "x-nested-resource"
 *     min_operations = 2
 *
 *     [namespaces]
 *     default_name = ""
 * @endcode
 */

#include "sdkir/result.hpp"
#include "sdkir/error.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace sdkir::config {

    namespace fs = std::filesystem;

    inline constexpr auto DEFAULT_CONFIG_FILE = ".sdkir.toml";

    struct ResolverConfig {
        std::string cache_dir = "~/.sdkir/cache";
        std::int64_t fetch_timeout_ms = 30000;
        bool prefetch = true;
        unsigned int prefetch_threads = 0;  // 0 = hardware concurrency
    };

    struct NamingConfig {
        bool report_ambiguity = true;
    };

    struct NestedConfig {
        std::string extension_key = "x-nested-resource";
        std::size_t min_operations = 2;
    };

    struct NamespaceConfig {
        std::string default_name;  // empty = no fallback namespace
    };

    class Config {
    public:
        ResolverConfig resolver;
        NamingConfig naming;
        NestedConfig nested;
        NamespaceConfig namespaces;

        /**
         * Loads and validates a configuration file.
         *
         * @return The configuration, NotFound for a missing file, or
         *         ConfigError for bad TOML or invalid values.
         */
        static Result<Config, Error> load_from_file(const fs::path& path);

        static Result<Config, Error> load_from_string(std::string_view content);

        /**
         * Loads DEFAULT_CONFIG_FILE from the given directory when present,
         * defaults otherwise.
         */
        static Result<Config, Error> load_default(const fs::path& directory);

        static Config defaults();

        [[nodiscard]] Result<void, Error> validate() const;

        /**
         * The URL cache directory with "~" expanded.
         */
        [[nodiscard]] fs::path cache_directory() const;
    };

}  // namespace sdkir::config

#endif //SDKIR_CONFIG_HPP
