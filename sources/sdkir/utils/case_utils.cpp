//
// Created by gregorian-rayne on 1/14/26.
//

#include "sdkir/utils/case_utils.hpp"
#include "sdkir/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace sdkir::case_utils {

    const KeywordSet& cpp_keywords() {
        static const KeywordSet keywords = {
            "alignas", "alignof", "and", "and_eq", "asm", "auto", "bitand", "bitor",
            "bool", "break", "case", "catch", "char", "char8_t", "char16_t", "char32_t",
            "class", "compl", "concept", "const", "consteval", "constexpr", "constinit",
            "const_cast", "continue", "co_await", "co_return", "co_yield", "decltype",
            "default", "delete", "do", "double", "dynamic_cast", "else", "enum",
            "explicit", "export", "extern", "false", "float", "for", "friend", "goto",
            "if", "inline", "int", "long", "mutable", "namespace", "new", "noexcept",
            "not", "not_eq", "nullptr", "operator", "or", "or_eq", "private",
            "protected", "public", "register", "reinterpret_cast", "requires", "return",
            "short", "signed", "sizeof", "static", "static_assert", "static_cast",
            "struct", "switch", "template", "this", "thread_local", "throw", "true",
            "try", "typedef", "typeid", "typename", "union", "unsigned", "using",
            "virtual", "void", "volatile", "wchar_t", "while", "xor", "xor_eq"
        };
        return keywords;
    }

    std::string to_snake_case(const std::string_view text) {
        static const std::regex lower_upper(R"(([a-z\d])([A-Z]))");
        static const std::regex acronym_word(R"(([A-Z]+)([A-Z][a-z]))");

        std::string normalized = string_utils::replace_all(text, " ", "_");
        normalized = string_utils::replace_all(normalized, "-", "_");

        normalized = std::regex_replace(normalized, lower_upper, "$1_$2");
        normalized = std::regex_replace(normalized, acronym_word, "$1_$2");
        return string_utils::to_lower(normalized);
    }

    std::string title_case(const std::string_view word) {
        std::string result;
        result.reserve(word.size());

        bool previous_alpha = false;
        for (const char ch : word) {
            const auto c = static_cast<unsigned char>(ch);
            if (std::isalpha(c)) {
                result += static_cast<char>(previous_alpha ? std::tolower(c) : std::toupper(c));
                previous_alpha = true;
            } else {
                result += ch;
                previous_alpha = false;
            }
        }
        return result;
    }

    std::string to_camel_case(const std::string_view text) {
        const auto parts = string_utils::split(text, '_');

        std::string result(parts.front());
        for (std::size_t i = 1; i < parts.size(); ++i) {
            result += title_case(parts[i]);
        }
        return result;
    }

    std::string to_pascal_case(const std::string_view text) {
        std::string result;
        for (const auto part : string_utils::split(text, '_')) {
            result += title_case(part);
        }
        return result;
    }

    std::string detect_naming_convention(const std::string_view text) {
        if (text.empty()) {
            return "unknown";
        }

        const bool has_upper = std::ranges::any_of(text, [](const unsigned char c) {
            return std::isupper(c) != 0;
        });
        const bool has_lower = std::ranges::any_of(text, [](const unsigned char c) {
            return std::islower(c) != 0;
        });

        if (string_utils::contains(text, "_")) {
            if (has_upper && !has_lower) {
                return "SCREAMING_SNAKE_CASE";
            }
            return "snake_case";
        }
        if (std::isupper(static_cast<unsigned char>(text.front()))) {
            return "PascalCase";
        }
        if (has_upper) {
            return "camelCase";
        }
        return "unknown";
    }

    std::string sanitize_identifier(
        const std::string_view name,
        const std::string_view suffix,
        const KeywordSet& keywords
    ) {
        std::string sanitized;
        sanitized.reserve(name.size() + 1);

        for (const char ch : name) {
            const auto c = static_cast<unsigned char>(ch);
            const bool valid = (c < 0x80 && std::isalnum(c)) || ch == '_';
            const char out = valid ? ch : '_';
            // Collapse runs of underscores as they are produced
            if (out == '_' && !sanitized.empty() && sanitized.back() == '_') {
                continue;
            }
            sanitized += out;
        }

        sanitized = std::string(string_utils::strip(sanitized, '_'));

        if (!sanitized.empty() && std::isdigit(static_cast<unsigned char>(sanitized.front()))) {
            sanitized.insert(sanitized.begin(), 'n');
        }

        if (sanitized.empty()) {
            sanitized = suffix;
        }

        if (keywords.contains(sanitized)) {
            sanitized += suffix;
        }

        return sanitized;
    }

    std::string sanitize_class_name(const std::string_view name) {
        return to_pascal_case(sanitize_identifier(name, "Class"));
    }

}  // namespace sdkir::case_utils
