//
// Created by gregorian-rayne on 1/12/26.
//

#ifndef SDKIR_RESULT_HPP
#define SDKIR_RESULT_HPP

/**
 * @file result.hpp
 * @brief Result type used by every fallible operation in sdkir.
 *
 * Result<T, E> holds either a success value of type T or an error of
 * type E. Analyzers that can never fail (naming, grouping) return plain
 * values; loading, validation and reference resolution return a Result.
 *
 * Usage:
 * @code
 *     Result<json, Error> doc = json_utils::read_file("openapi.json");
 *     auto resolved = doc.and_then([&](const json& d) { return resolver.resolve(d); });
 *     if (resolved.is_err()) {
 *         std::cerr << resolved.error() << std::endl;
 *     }
 * @endcode
 */

#include <variant>
#include <optional>
#include <utility>
#include <type_traits>
#include <stdexcept>

namespace sdkir {

    struct SuccessTag {};
    struct FailureTag {};

    inline constexpr SuccessTag success_tag{};
    inline constexpr FailureTag failure_tag{};

    /**
     * Either a successful value or an error. Never empty.
     *
     * @tparam T The type of the success value.
     * @tparam E The type of the error value.
     */
    template<typename T, typename E>
    class Result {
    public:
        using value_type = T;
        using error_type = E;

        static Result success(T value) {
            return Result(success_tag, std::move(value));
        }

        static Result failure(E error) {
            return Result(failure_tag, std::move(error));
        }

        Result(SuccessTag, T value) : data_(std::in_place_index<0>, std::move(value)) {}
        Result(FailureTag, E error) : data_(std::in_place_index<1>, std::move(error)) {}

        Result(const Result&) = default;
        Result(Result&&) noexcept = default;
        Result& operator=(const Result&) = default;
        Result& operator=(Result&&) noexcept = default;
        ~Result() = default;

        [[nodiscard]] bool is_ok() const noexcept {
            return data_.index() == 0;
        }

        [[nodiscard]] bool is_err() const noexcept {
            return data_.index() == 1;
        }

        explicit operator bool() const noexcept {
            return is_ok();
        }

        /**
         * Returns the success value.
         * @throws std::logic_error if the Result contains an error.
         */
        T& value() & {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
            return std::get<0>(data_);
        }

        const T& value() const& {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
            return std::get<0>(data_);
        }

        T&& value() && {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
            return std::get<0>(std::move(data_));
        }

        /**
         * Returns the error.
         * @throws std::logic_error if the Result contains a success value.
         */
        E& error() & {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return std::get<1>(data_);
        }

        const E& error() const& {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return std::get<1>(data_);
        }

        T value_or(T default_value) const& {
            if (is_ok()) {
                return std::get<0>(data_);
            }
            return default_value;
        }

        T value_or(T default_value) && {
            if (is_ok()) {
                return std::get<0>(std::move(data_));
            }
            return default_value;
        }

        /**
         * Applies f to the success value, keeping an error untouched.
         */
        template<typename F>
        auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
            using U = std::invoke_result_t<F, const T&>;
            if (is_ok()) {
                return Result<U, E>::success(std::forward<F>(f)(std::get<0>(data_)));
            }
            return Result<U, E>::failure(std::get<1>(data_));
        }

        template<typename F>
        auto map(F&& f) && -> Result<std::invoke_result_t<F, T&&>, E> {
            using U = std::invoke_result_t<F, T&&>;
            if (is_ok()) {
                return Result<U, E>::success(std::forward<F>(f)(std::get<0>(std::move(data_))));
            }
            return Result<U, E>::failure(std::get<1>(std::move(data_)));
        }

        /**
         * Chains an operation that may itself fail.
         */
        template<typename F>
        auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
            if (is_ok()) {
                return std::forward<F>(f)(std::get<0>(data_));
            }
            using ResultType = std::invoke_result_t<F, const T&>;
            return ResultType::failure(std::get<1>(data_));
        }

        template<typename F>
        auto and_then(F&& f) && -> std::invoke_result_t<F, T&&> {
            if (is_ok()) {
                return std::forward<F>(f)(std::get<0>(std::move(data_)));
            }
            using ResultType = std::invoke_result_t<F, T&&>;
            return ResultType::failure(std::get<1>(std::move(data_)));
        }

        /**
         * Transforms the error, keeping a success value untouched.
         * Used to attach reference context while unwinding resolution.
         */
        template<typename F>
        Result map_error(F&& f) && {
            if (is_ok()) {
                return std::move(*this);
            }
            return Result::failure(std::forward<F>(f)(std::get<1>(std::move(data_))));
        }

    private:
        std::variant<T, E> data_;
    };

    /**
     * Specialization for operations without a success value.
     */
    template<typename E>
    class Result<void, E> {
    public:
        using value_type = void;
        using error_type = E;

        static Result success() {
            return Result(success_tag);
        }

        static Result failure(E error) {
            return Result(failure_tag, std::move(error));
        }

        explicit Result(SuccessTag) : error_(std::nullopt) {}
        Result(FailureTag, E error) : error_(std::move(error)) {}

        Result(const Result&) = default;
        Result(Result&&) noexcept = default;
        Result& operator=(const Result&) = default;
        Result& operator=(Result&&) noexcept = default;
        ~Result() = default;

        [[nodiscard]] bool is_ok() const noexcept {
            return !error_.has_value();
        }

        [[nodiscard]] bool is_err() const noexcept {
            return error_.has_value();
        }

        explicit operator bool() const noexcept {
            return is_ok();
        }

        E& error() & {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return *error_;
        }

        const E& error() const& {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return *error_;
        }

        template<typename F>
        auto and_then(F&& f) const& -> std::invoke_result_t<F> {
            if (is_ok()) {
                return std::forward<F>(f)();
            }
            using ResultType = std::invoke_result_t<F>;
            return ResultType::failure(*error_);
        }

    private:
        std::optional<E> error_;
    };

}  // namespace sdkir

#endif //SDKIR_RESULT_HPP
