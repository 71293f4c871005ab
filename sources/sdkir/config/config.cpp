//
// Created by gregorian-rayne on 1/14/26.
//

#include "sdkir/config/config.hpp"
#include "sdkir/utils/file_utils.hpp"
#include "sdkir/utils/string_utils.hpp"

#include <toml++/toml.h>

#include <optional>
#include <sstream>
#include <vector>

namespace sdkir::config {

    namespace {

        /**
         * Reads an optional typed value. A present value of the wrong type
         * is recorded as an error instead of silently falling back.
         */
        template<typename T>
        void read_value(
            const toml::table& section,
            const std::string_view section_name,
            const std::string_view key,
            T& out,
            std::vector<std::string>& errors
        ) {
            const auto node = section[key];
            if (!node) {
                return;
            }
            if (const std::optional<T> value = node.template value<T>()) {
                out = *value;
            } else {
                errors.push_back(std::string(section_name) + "." + std::string(key) + " has an invalid type");
            }
        }

        const toml::table* section_of(
            const toml::table& root,
            const std::string_view name,
            std::vector<std::string>& errors
        ) {
            const auto node = root[name];
            if (!node) {
                return nullptr;
            }
            if (!node.is_table()) {
                errors.push_back("[" + std::string(name) + "] must be a table");
                return nullptr;
            }
            return node.as_table();
        }

    }  // namespace

    Result<Config, Error> Config::load_from_file(const fs::path& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<Config, Error>::failure(content.error());
        }

        return load_from_string(content.value()).map_error([&](Error error) {
            return error.with_context(path.string());
        });
    }

    Result<Config, Error> Config::load_from_string(const std::string_view content) {
        toml::table tbl;
        try {
            tbl = toml::parse(content);
        } catch (const toml::parse_error& err) {
            std::ostringstream where;
            where << "line " << err.source().begin.line << ", column " << err.source().begin.column;
            return Result<Config, Error>::failure(
                Error::config_error("Failed to parse TOML configuration: " + std::string(err.description()),
                                    where.str())
            );
        }

        Config config;
        std::vector<std::string> errors;

        if (const auto* resolver = section_of(tbl, "resolver", errors)) {
            read_value(*resolver, "resolver", "cache_dir", config.resolver.cache_dir, errors);
            read_value(*resolver, "resolver", "fetch_timeout_ms", config.resolver.fetch_timeout_ms, errors);
            read_value(*resolver, "resolver", "prefetch", config.resolver.prefetch, errors);

            std::int64_t threads = config.resolver.prefetch_threads;
            read_value(*resolver, "resolver", "prefetch_threads", threads, errors);
            if (threads < 0) {
                errors.emplace_back("resolver.prefetch_threads must be non-negative");
            } else {
                config.resolver.prefetch_threads = static_cast<unsigned int>(threads);
            }
        }

        if (const auto* naming = section_of(tbl, "naming", errors)) {
            read_value(*naming, "naming", "report_ambiguity", config.naming.report_ambiguity, errors);
        }

        if (const auto* nested = section_of(tbl, "nested", errors)) {
            read_value(*nested, "nested", "extension_key", config.nested.extension_key, errors);

            auto min_operations = static_cast<std::int64_t>(config.nested.min_operations);
            read_value(*nested, "nested", "min_operations", min_operations, errors);
            if (min_operations < 1) {
                errors.emplace_back("nested.min_operations must be at least 1");
            } else {
                config.nested.min_operations = static_cast<std::size_t>(min_operations);
            }
        }

        if (const auto* namespaces = section_of(tbl, "namespaces", errors)) {
            read_value(*namespaces, "namespaces", "default_name", config.namespaces.default_name, errors);
        }

        if (!errors.empty()) {
            return Result<Config, Error>::failure(
                Error::config_error("Configuration validation failed:\n  " + string_utils::join(errors, "\n  "))
            );
        }

        if (auto validation = config.validate(); validation.is_err()) {
            return Result<Config, Error>::failure(validation.error());
        }

        return Result<Config, Error>::success(std::move(config));
    }

    Result<Config, Error> Config::load_default(const fs::path& directory) {
        const fs::path candidate = directory / DEFAULT_CONFIG_FILE;
        if (std::error_code ec; !fs::exists(candidate, ec)) {
            return Result<Config, Error>::success(defaults());
        }
        return load_from_file(candidate);
    }

    Config Config::defaults() {
        return Config{};
    }

    Result<void, Error> Config::validate() const {
        std::vector<std::string> errors;

        if (resolver.fetch_timeout_ms <= 0) {
            errors.emplace_back("resolver.fetch_timeout_ms must be positive");
        }

        if (resolver.cache_dir.empty()) {
            errors.emplace_back("resolver.cache_dir must not be empty");
        }

        if (nested.extension_key.empty()) {
            errors.emplace_back("nested.extension_key must not be empty");
        }

        if (nested.min_operations == 0) {
            errors.emplace_back("nested.min_operations must be at least 1");
        }

        if (!errors.empty()) {
            return Result<void, Error>::failure(
                Error::config_error("Configuration validation failed:\n  " + string_utils::join(errors, "\n  "))
            );
        }

        return Result<void, Error>::success();
    }

    fs::path Config::cache_directory() const {
        return file_utils::expand_home(resolver.cache_dir);
    }

}  // namespace sdkir::config
