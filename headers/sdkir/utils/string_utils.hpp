//
// Created by gregorian-rayne on 1/12/26.
//

#ifndef SDKIR_STRING_UTILS_HPP
#define SDKIR_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String manipulation utilities.
 *
 * Trimming, splitting, joining and case helpers shared by the analyzers.
 * Functions returning string_view point into their argument.
 */

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace sdkir::string_utils {

    /**
     * Trims whitespace from both ends of a string.
     */
    inline std::string_view trim(std::string_view s) noexcept {
        const auto first = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        s.remove_prefix(static_cast<std::size_t>(first - s.begin()));

        const auto last = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - last));
    }

    /**
     * Strips every leading and trailing occurrence of a character.
     *
     * @param s The string view to strip.
     * @param ch The character to remove, e.g. '/' for paths.
     */
    inline std::string_view strip(std::string_view s, const char ch) noexcept {
        while (!s.empty() && s.front() == ch) {
            s.remove_prefix(1);
        }
        while (!s.empty() && s.back() == ch) {
            s.remove_suffix(1);
        }
        return s;
    }

    /**
     * Splits a string by a delimiter. Empty parts are kept, so splitting
     * an empty string yields one empty part.
     */
    inline std::vector<std::string_view> split(std::string_view s, const char delimiter) {
        std::vector<std::string_view> result;
        std::size_t start = 0;
        std::size_t end = s.find(delimiter);

        while (end != std::string_view::npos) {
            result.push_back(s.substr(start, end - start));
            start = end + 1;
            end = s.find(delimiter, start);
        }

        result.push_back(s.substr(start));
        return result;
    }

    /**
     * Splits a string on the first occurrence of a delimiter.
     *
     * @return The part before the delimiter and the part after it; the
     *         second part is empty when the delimiter is absent.
     */
    inline std::pair<std::string_view, std::string_view> split_once(
        std::string_view s,
        const std::string_view delimiter
    ) noexcept {
        const auto pos = s.find(delimiter);
        if (pos == std::string_view::npos) {
            return {s, std::string_view{}};
        }
        return {s.substr(0, pos), s.substr(pos + delimiter.size())};
    }

    /**
     * Joins strings with a delimiter.
     */
    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        std::ostringstream oss;
        bool first = true;

        for (const auto& part : parts) {
            if (!first) {
                oss << delimiter;
            }
            oss << part;
            first = false;
        }

        return oss.str();
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    inline bool ends_with(const std::string_view s, const std::string_view suffix) noexcept {
        return s.size() >= suffix.size() &&
               s.substr(s.size() - suffix.size()) == suffix;
    }

    inline bool contains(const std::string_view s, const std::string_view needle) noexcept {
        return s.find(needle) != std::string_view::npos;
    }

    /**
     * True when the string is non-empty and made only of ASCII digits.
     */
    inline bool is_digits(const std::string_view s) noexcept {
        return !s.empty() && std::ranges::all_of(s, [](const unsigned char c) {
            return std::isdigit(c) != 0;
        });
    }

    inline std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    inline std::string to_upper(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return result;
    }

    /**
     * Replaces all occurrences of a substring, scanning left to right.
     */
    inline std::string replace_all(std::string_view s, const std::string_view from, const std::string_view to) {
        if (from.empty()) {
            return std::string(s);
        }

        std::string result;
        result.reserve(s.size());

        std::size_t pos = 0;
        std::size_t found;

        while ((found = s.find(from, pos)) != std::string_view::npos) {
            result.append(s, pos, found - pos);
            result.append(to);
            pos = found + from.size();
        }

        result.append(s, pos, s.size() - pos);
        return result;
    }

    /**
     * Splits an API path into its segments after stripping leading and
     * trailing slashes. "/users/{id}/" gives {"users", "{id}"}; "/" gives
     * a single empty segment.
     */
    inline std::vector<std::string_view> path_segments(const std::string_view path) {
        return split(strip(path, '/'), '/');
    }

    /**
     * True for a templated path segment such as "{user_id}".
     */
    inline bool is_path_parameter(const std::string_view segment) noexcept {
        return starts_with(segment, "{");
    }

}  // namespace sdkir::string_utils

#endif //SDKIR_STRING_UTILS_HPP
