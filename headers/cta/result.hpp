//
// Created by gregorian-rayne on 10/2/26.
//

#ifndef CRASHTESTAUDIT_RESULT_HPP
#define CRASHTESTAUDIT_RESULT_HPP

/**
 * @file result.hpp
 * @brief Result type used for every fallible operation.
 *
 * Result<T, E> holds either a value of type T or an error of type E.
 * Failures are values: library code never throws for expected error
 * conditions, and callers must inspect is_ok()/is_err() before reading.
 *
 * Usage:
 * @code
 *     Result<CalendarDate, Error> parse(std::string_view text);
 *
 *     auto date = parse("2024-01-01");
 *     if (date.is_err()) {
 *         return Result<ScanResult, Error>::failure(date.error());
 *     }
 *     use(date.value());
 * @endcode
 */

#include "cta/error.hpp"

#include <variant>
#include <optional>
#include <utility>
#include <type_traits>
#include <stdexcept>

namespace cta {

    struct SuccessTag {};
    struct FailureTag {};

    inline constexpr SuccessTag success_tag{};
    inline constexpr FailureTag failure_tag{};

    /**
     * Either a success value or an error. Never empty.
     *
     * @tparam T The success type.
     * @tparam E The error type.
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
         * Access the success value.
         * @throws std::logic_error when the Result holds an error.
         */
        T& value() & {
            ensure_ok();
            return std::get<0>(data_);
        }

        const T& value() const& {
            ensure_ok();
            return std::get<0>(data_);
        }

        T&& value() && {
            ensure_ok();
            return std::get<0>(std::move(data_));
        }

        /**
         * Access the error.
         * @throws std::logic_error when the Result holds a value.
         */
        E& error() & {
            ensure_err();
            return std::get<1>(data_);
        }

        const E& error() const& {
            ensure_err();
            return std::get<1>(data_);
        }

        T value_or(T fallback) const& {
            return is_ok() ? std::get<0>(data_) : std::move(fallback);
        }

        T value_or(T fallback) && {
            return is_ok() ? std::get<0>(std::move(data_)) : std::move(fallback);
        }

        /**
         * Transforms the success value, propagating an error unchanged.
         */
        template<typename F>
        auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
            using U = std::invoke_result_t<F, const T&>;
            if (is_ok()) {
                return Result<U, E>::success(std::forward<F>(f)(std::get<0>(data_)));
            }
            return Result<U, E>::failure(std::get<1>(data_));
        }

        /**
         * Chains an operation that itself returns a Result.
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
         * Transforms the error, keeping a success value unchanged.
         */
        template<typename F>
        Result map_error(F&& f) const& {
            if (is_ok()) {
                return *this;
            }
            return Result::failure(std::forward<F>(f)(std::get<1>(data_)));
        }

    private:
        void ensure_ok() const {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
        }

        void ensure_err() const {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
        }

        std::variant<T, E> data_;
    };

    /**
     * Result for operations that produce no value.
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

        [[nodiscard]] bool is_ok() const noexcept {
            return !error_.has_value();
        }

        [[nodiscard]] bool is_err() const noexcept {
            return error_.has_value();
        }

        explicit operator bool() const noexcept {
            return is_ok();
        }

        const E& error() const& {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return *error_;
        }

    private:
        std::optional<E> error_;
    };

}  // namespace cta

#endif //CRASHTESTAUDIT_RESULT_HPP
