//
// Created by gregorian-rayne on 1/12/26.
//

#ifndef SDKIR_ERROR_HPP
#define SDKIR_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error types and error handling utilities.
 *
 * Provides a structured error type that carries error codes, messages,
 * and optional context information. Designed to work with Result<T, Error>
 * for explicit error handling throughout the analysis pipeline.
 *
 * Error categories:
 * - None: No error (success state)
 * - InvalidArgument: Invalid function arguments or parameters
 * - NotFound: External document or file not found
 * - ParseError: Failed to decode JSON/YAML/TOML input
 * - IoError: File system operation failed
 * - ConfigError: Configuration validation failed
 * - StructuralError: Malformed specification (missing fields, bad version)
 * - ReferenceError: A reference points at a missing key or index
 * - FetchError: External document unreachable (I/O, network, timeout)
 * - InternalError: Unexpected internal error
 *
 * Usage:
 * @code
 *     auto resolved = resolver.resolve(spec);
 *     if (resolved.is_err()) {
 *         std::cerr << resolved.error() << std::endl;
 *         // Output: [ReferenceError] Key not found: Pet (context: #/components/schemas/Pet)
 *     }
 * @endcode
 */

#include <string>
#include <optional>
#include <ostream>
#include <utility>

namespace sdkir {

    /**
     * Error category enumeration.
     */
    enum class ErrorCode {
        None,             ///< No error
        InvalidArgument,  ///< Invalid argument or parameter
        NotFound,         ///< Document or file not found
        ParseError,       ///< Parsing failed
        IoError,          ///< I/O operation failed
        ConfigError,      ///< Configuration error
        StructuralError,  ///< Malformed or unsupported specification
        ReferenceError,   ///< Unresolvable reference
        FetchError,       ///< External document fetch failed
        InternalError     ///< Internal/unexpected error
    };

    /**
     * Converts an ErrorCode to its string representation.
     *
     * @param code The error code to convert.
     * @return A string representation of the error code.
     */
    inline const char* error_code_to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:            return "None";
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::NotFound:        return "NotFound";
            case ErrorCode::ParseError:      return "ParseError";
            case ErrorCode::IoError:         return "IoError";
            case ErrorCode::ConfigError:     return "ConfigError";
            case ErrorCode::StructuralError: return "StructuralError";
            case ErrorCode::ReferenceError:  return "ReferenceError";
            case ErrorCode::FetchError:      return "FetchError";
            case ErrorCode::InternalError:   return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Structured error type with code, message, and optional context.
     *
     * Error objects are immutable after construction. The context usually
     * names the offending reference string, JSON pointer, file path or URL
     * so that callers can point at the source location.
     */
    class Error {
    public:
        Error(ErrorCode code, std::string message)
            : code_(code)
            , message_(std::move(message))
            , context_(std::nullopt) {}

        Error(ErrorCode code, std::string message, std::string context)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        // Factory methods for common error types

        static Error invalid_argument(std::string message) {
            return {ErrorCode::InvalidArgument, std::move(message)};
        }

        static Error invalid_argument(std::string message, std::string context) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        static Error not_found(std::string message) {
            return {ErrorCode::NotFound, std::move(message)};
        }

        static Error not_found(std::string message, std::string context) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error parse_error(std::string message) {
            return {ErrorCode::ParseError, std::move(message)};
        }

        static Error parse_error(std::string message, std::string context) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message) {
            return {ErrorCode::IoError, std::move(message)};
        }

        static Error io_error(std::string message, std::string context) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        static Error config_error(std::string message) {
            return {ErrorCode::ConfigError, std::move(message)};
        }

        static Error config_error(std::string message, std::string context) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        /**
         * Creates a structural error (malformed specification). Fatal.
         */
        static Error structural_error(std::string message) {
            return {ErrorCode::StructuralError, std::move(message)};
        }

        static Error structural_error(std::string message, std::string context) {
            return {ErrorCode::StructuralError, std::move(message), std::move(context)};
        }

        /**
         * Creates a reference resolution error. The context should be the
         * reference string as written in the document.
         */
        static Error reference_error(std::string message) {
            return {ErrorCode::ReferenceError, std::move(message)};
        }

        static Error reference_error(std::string message, std::string context) {
            return {ErrorCode::ReferenceError, std::move(message), std::move(context)};
        }

        /**
         * Creates a fetch error (unreachable external document).
         */
        static Error fetch_error(std::string message) {
            return {ErrorCode::FetchError, std::move(message)};
        }

        static Error fetch_error(std::string message, std::string context) {
            return {ErrorCode::FetchError, std::move(message), std::move(context)};
        }

        static Error internal_error(std::string message) {
            return {ErrorCode::InternalError, std::move(message)};
        }

        static Error internal_error(std::string message, std::string context) {
            return {ErrorCode::InternalError, std::move(message), std::move(context)};
        }

        [[nodiscard]] ErrorCode code() const noexcept {
            return code_;
        }

        [[nodiscard]] const std::string& message() const noexcept {
            return message_;
        }

        [[nodiscard]] const std::optional<std::string>& context() const noexcept {
            return context_;
        }

        [[nodiscard]] bool has_context() const noexcept {
            return context_.has_value();
        }

        /**
         * Creates a new error with additional context appended.
         *
         * @param additional_context Context to append.
         * @return A new Error with combined context.
         */
        [[nodiscard]] Error with_context(std::string additional_context) const {
            if (context_.has_value()) {
                return {code_, message_, *context_ + "; " + std::move(additional_context)};
            }
            return {code_, message_, std::move(additional_context)};
        }

        /**
         * Formats the error as a string.
         *
         * Format: "[ErrorCode] message" or "[ErrorCode] message (context: ...)"
         */
        [[nodiscard]] std::string to_string() const {
            std::string result = "[";
            result += error_code_to_string(code_);
            result += "] ";
            result += message_;
            if (context_.has_value()) {
                result += " (context: ";
                result += *context_;
                result += ")";
            }
            return result;
        }

        bool operator==(const Error& other) const {
            return code_ == other.code_ &&
                   message_ == other.message_ &&
                   context_ == other.context_;
        }

        bool operator!=(const Error& other) const {
            return !(*this == other);
        }

    private:
        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace sdkir

#endif //SDKIR_ERROR_HPP
