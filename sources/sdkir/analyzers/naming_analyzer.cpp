//
// Created by gregorian-rayne on 1/18/26.
//

#include "sdkir/analyzers/naming_analyzer.hpp"
#include "sdkir/utils/case_utils.hpp"
#include "sdkir/utils/json_utils.hpp"
#include "sdkir/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace sdkir::analyzers::naming {

    namespace {
        std::string dominant(const std::size_t snake, const std::size_t camel) {
            if (snake > camel) {
                return "snake_case";
            }
            if (camel > 0) {
                return "camelCase";
            }
            return "original";
        }
    }

    std::string detect_field_naming(const json& schema) {
        const json* properties = json_utils::get_object(schema, "properties");
        if (properties == nullptr || properties->empty()) {
            return "original";
        }

        std::size_t snake = 0;
        std::size_t camel = 0;
        std::size_t sampled = 0;
        for (auto it = properties->begin(); it != properties->end() && sampled < SAMPLE_SIZE; ++it, ++sampled) {
            const std::string convention = case_utils::detect_naming_convention(it.key());
            if (convention == "snake_case") {
                ++snake;
            } else if (convention == "camelCase") {
                ++camel;
            }
        }

        return dominant(snake, camel);
    }

    std::string detect_parameter_naming(const json& parameters) {
        if (!parameters.is_array() || parameters.empty()) {
            return "original";
        }

        std::size_t snake = 0;
        std::size_t camel = 0;
        std::size_t sampled = 0;
        for (const auto& parameter : parameters) {
            if (sampled++ == SAMPLE_SIZE) {
                break;
            }
            const std::string name = json_utils::get_string(parameter, "name");
            const bool has_underscore = string_utils::contains(name, "_");
            const bool has_upper = std::ranges::any_of(name, [](const unsigned char c) {
                return std::isupper(c) != 0;
            });

            if (has_underscore) {
                ++snake;
            } else if (has_upper) {
                ++camel;
            }
        }

        return dominant(snake, camel);
    }

    NamingConventions analyze_conventions(const json& spec) {
        NamingConventions conventions;

        if (const json* components = json_utils::get_object(spec, "components")) {
            if (const json* schemas = json_utils::get_object(*components, "schemas"); schemas && !schemas->empty()) {
                conventions.response = detect_field_naming(schemas->front());
            }
        }

        json parameters = json::array();
        if (const json* paths = json_utils::get_object(spec, "paths")) {
            for (const auto& path_item : *paths) {
                if (!path_item.is_object()) {
                    continue;
                }
                for (const auto& operation : path_item) {
                    if (const json* declared = json_utils::get_array(operation, "parameters")) {
                        parameters.insert(parameters.end(), declared->begin(), declared->end());
                    }
                }
            }
        }

        if (!parameters.empty()) {
            conventions.parameter = detect_parameter_naming(parameters);
        }

        return conventions;
    }

}  // namespace sdkir::analyzers::naming
