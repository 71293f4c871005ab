//
// Created by gregorian-rayne on 1/13/26.
//

#include "sdkir/utils/yaml_utils.hpp"

#include <yaml-cpp/yaml.h>

#include <limits>
#include <regex>
#include <stdexcept>

namespace sdkir::yaml_utils {

    namespace {

        const std::regex& int_pattern() {
            static const std::regex pattern(R"([-+]?[0-9]+)");
            return pattern;
        }

        const std::regex& float_pattern() {
            static const std::regex pattern(R"([-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?)");
            return pattern;
        }

        bool is_quoted_or_string_tagged(const YAML::Node& node) {
            // yaml-cpp tags quoted scalars with the non-specific tag "!"
            const std::string& tag = node.Tag();
            return tag == "!" || tag == "tag:yaml.org,2002:str";
        }

        json convert(const YAML::Node& node) {
            switch (node.Type()) {
                case YAML::NodeType::Undefined:
                case YAML::NodeType::Null:
                    return nullptr;

                case YAML::NodeType::Scalar:
                    if (is_quoted_or_string_tagged(node)) {
                        return node.Scalar();
                    }
                    return resolve_plain_scalar(node.Scalar());

                case YAML::NodeType::Sequence: {
                    json array = json::array();
                    for (const auto& item : node) {
                        array.push_back(convert(item));
                    }
                    return array;
                }

                case YAML::NodeType::Map: {
                    json object = json::object();
                    for (const auto& entry : node) {
                        // Keys are kept as written: an unquoted 200 stays "200"
                        std::string key = entry.first.IsScalar()
                            ? entry.first.Scalar()
                            : YAML::Dump(entry.first);
                        object[key] = convert(entry.second);
                    }
                    return object;
                }
            }
            return nullptr;
        }

    }  // namespace

    json resolve_plain_scalar(const std::string& text) {
        if (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL") {
            return nullptr;
        }
        if (text == "true" || text == "True" || text == "TRUE") {
            return true;
        }
        if (text == "false" || text == "False" || text == "FALSE") {
            return false;
        }

        if (std::regex_match(text, int_pattern())) {
            try {
                return std::stoll(text);
            } catch (const std::out_of_range&) {
                return std::stod(text);
            }
        }

        if (text.size() > 2 && (text.starts_with("0x") || text.starts_with("0o"))) {
            const int base = text[1] == 'x' ? 16 : 8;
            try {
                std::size_t consumed = 0;
                const long long value = std::stoll(text.substr(2), &consumed, base);
                if (consumed == text.size() - 2) {
                    return value;
                }
            } catch (const std::logic_error&) {
                return text;
            }
            return text;
        }

        if (std::regex_match(text, float_pattern())) {
            try {
                return std::stod(text);
            } catch (const std::out_of_range&) {
                return text;
            }
        }

        if (text == ".inf" || text == ".Inf" || text == ".INF" || text == "+.inf") {
            return std::numeric_limits<double>::infinity();
        }
        if (text == "-.inf" || text == "-.Inf" || text == "-.INF") {
            return -std::numeric_limits<double>::infinity();
        }
        if (text == ".nan" || text == ".NaN" || text == ".NAN") {
            return std::numeric_limits<double>::quiet_NaN();
        }

        return text;
    }

    Result<json, Error> parse(std::string_view content) {
        try {
            const YAML::Node root = YAML::Load(std::string(content));
            return Result<json, Error>::success(convert(root));
        } catch (const YAML::ParserException& e) {
            return Result<json, Error>::failure(
                Error::parse_error("YAML parse error", e.what())
            );
        } catch (const YAML::Exception& e) {
            return Result<json, Error>::failure(
                Error::parse_error("YAML conversion error", e.what())
            );
        }
    }

}  // namespace sdkir::yaml_utils
