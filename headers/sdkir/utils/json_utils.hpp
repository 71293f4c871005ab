//
// Created by gregorian-rayne on 1/12/26.
//

#ifndef SDKIR_JSON_UTILS_HPP
#define SDKIR_JSON_UTILS_HPP

/**
 * @file json_utils.hpp
 * @brief JSON serialization utilities.
 *
 * Helpers for parsing and serializing documents with nlohmann/json.
 * Documents are insertion-ordered (sdkir::json). All operations use
 * Result<T, Error> for error handling.
 */

#include "sdkir/result.hpp"
#include "sdkir/error.hpp"
#include "sdkir/types.hpp"
#include "sdkir/utils/file_utils.hpp"

#include <string>
#include <string_view>
#include <filesystem>

namespace sdkir::json_utils {

    namespace fs = std::filesystem;

    /**
     * Parses a JSON string.
     *
     * @param content The JSON text.
     * @return The parsed document or a ParseError.
     */
    inline Result<json, Error> parse(std::string_view content) {
        try {
            return Result<json, Error>::success(json::parse(content));
        } catch (const json::parse_error& e) {
            return Result<json, Error>::failure(
                Error::parse_error("JSON parse error", e.what())
            );
        }
    }

    /**
     * Reads and parses a JSON file.
     */
    inline Result<json, Error> read_file(const fs::path& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<json, Error>::failure(content.error());
        }

        auto parsed = parse(content.value());
        if (parsed.is_err()) {
            return Result<json, Error>::failure(
                Error::parse_error(parsed.error().message(),
                                   path.string() + ": " + parsed.error().context().value_or(""))
            );
        }
        return parsed;
    }

    /**
     * Writes a document to a file.
     *
     * @param path Path to write to.
     * @param data The document.
     * @param indent Indentation level (-1 for compact output).
     */
    inline Result<void, Error> write_file(
        const fs::path& path,
        const json& data,
        const int indent = 2
    ) {
        std::string text;
        try {
            text = data.dump(indent);
        } catch (const json::type_error& e) {
            return Result<void, Error>::failure(
                Error::internal_error("JSON serialization error", e.what())
            );
        }
        text += "\n";
        return file_utils::write_file(path, text);
    }

    /**
     * Serializes a document to a string. Invalid UTF-8 is replaced
     * rather than rejected.
     */
    inline std::string to_string(const json& data, const int indent = -1) {
        return data.dump(indent, ' ', false, json::error_handler_t::replace);
    }

    /**
     * Returns the string member of an object, or the default when the
     * member is missing or not a string.
     */
    inline std::string get_string(const json& obj, const std::string& key, const std::string& default_value = "") {
        if (obj.is_object()) {
            if (const auto it = obj.find(key); it != obj.end() && it->is_string()) {
                return it->get<std::string>();
            }
        }
        return default_value;
    }

    /**
     * Returns the object member of an object, or nullptr when the member
     * is missing or not an object.
     */
    inline const json* get_object(const json& obj, const std::string& key) {
        if (obj.is_object()) {
            if (const auto it = obj.find(key); it != obj.end() && it->is_object()) {
                return &*it;
            }
        }
        return nullptr;
    }

    /**
     * Returns the array member of an object, or nullptr when the member
     * is missing or not an array.
     */
    inline const json* get_array(const json& obj, const std::string& key) {
        if (obj.is_object()) {
            if (const auto it = obj.find(key); it != obj.end() && it->is_array()) {
                return &*it;
            }
        }
        return nullptr;
    }

}  // namespace sdkir::json_utils

#endif //SDKIR_JSON_UTILS_HPP
