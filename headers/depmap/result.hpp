//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef DEPMAP_RESULT_HPP
#define DEPMAP_RESULT_HPP

/**
 * @file result.hpp
 * @brief Success-or-error return type.
 *
 * Result<T, E> holds exactly one of a T (success) or an E (failure).
 * Library entry points return Result<T, Error> instead of throwing.
 *
 * @code
 *     Result<SortKey, Error> key = sort_key_from_string(name);
 *     if (key.is_err()) {
 *         return Result<std::vector<CouplingMetric>, Error>::failure(key.error());
 *     }
 *     auto metrics = compute_metrics(graph, key.value());
 * @endcode
 */

#include <variant>
#include <optional>
#include <utility>
#include <type_traits>
#include <stdexcept>

namespace depmap {

    struct SuccessTag {};
    struct FailureTag {};

    inline constexpr SuccessTag success_tag{};
    inline constexpr FailureTag failure_tag{};

    /**
     * Either a success value of type T or an error of type E, never empty.
     *
     * Accessing the wrong alternative throws std::logic_error; callers are
     * expected to test is_ok()/is_err() first.
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

        [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
        [[nodiscard]] bool is_err() const noexcept { return data_.index() == 1; }

        explicit operator bool() const noexcept { return is_ok(); }

        T& value() & {
            require_ok();
            return std::get<0>(data_);
        }

        const T& value() const& {
            require_ok();
            return std::get<0>(data_);
        }

        T&& value() && {
            require_ok();
            return std::get<0>(std::move(data_));
        }

        E& error() & {
            require_err();
            return std::get<1>(data_);
        }

        const E& error() const& {
            require_err();
            return std::get<1>(data_);
        }

        T value_or(T fallback) const& {
            return is_ok() ? std::get<0>(data_) : std::move(fallback);
        }

        T value_or(T fallback) && {
            return is_ok() ? std::get<0>(std::move(data_)) : std::move(fallback);
        }

        /**
         * Transforms the success value, passing an error through unchanged.
         */
        template<typename F>
        auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
            using U = std::invoke_result_t<F, const T&>;
            if (is_err()) {
                return Result<U, E>::failure(std::get<1>(data_));
            }
            return Result<U, E>::success(std::forward<F>(f)(std::get<0>(data_)));
        }

        /**
         * Transforms the error, passing a success value through unchanged.
         *
         * @code
         *     return read_file(path).map_error([&](const Error& e) {
         *         return e.with_context(path.string());
         *     });
         * @endcode
         */
        template<typename F>
        auto map_error(F&& f) && -> Result<T, std::invoke_result_t<F, const E&>> {
            using G = std::invoke_result_t<F, const E&>;
            if (is_ok()) {
                return Result<T, G>::success(std::get<0>(std::move(data_)));
            }
            return Result<T, G>::failure(std::forward<F>(f)(std::get<1>(data_)));
        }

        /**
         * Chains a fallible step onto the success value.
         */
        template<typename F>
        auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
            using Next = std::invoke_result_t<F, const T&>;
            if (is_err()) {
                return Next::failure(std::get<1>(data_));
            }
            return std::forward<F>(f)(std::get<0>(data_));
        }

        template<typename F>
        auto and_then(F&& f) && -> std::invoke_result_t<F, T&&> {
            using Next = std::invoke_result_t<F, T&&>;
            if (is_err()) {
                return Next::failure(std::get<1>(std::move(data_)));
            }
            return std::forward<F>(f)(std::get<0>(std::move(data_)));
        }

        /**
         * Recovers from an error; a success value is passed through.
         */
        template<typename F>
        auto or_else(F&& f) const& -> std::invoke_result_t<F, const E&> {
            using Next = std::invoke_result_t<F, const E&>;
            if (is_ok()) {
                return Next::success(std::get<0>(data_));
            }
            return std::forward<F>(f)(std::get<1>(data_));
        }

    private:
        void require_ok() const {
            if (is_err()) {
                throw std::logic_error("Result holds an error, not a value");
            }
        }

        void require_err() const {
            if (is_ok()) {
                throw std::logic_error("Result holds a value, not an error");
            }
        }

        std::variant<T, E> data_;
    };

    /**
     * Result for operations that produce nothing on success.
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

        explicit Result(SuccessTag) {}
        Result(FailureTag, E error) : error_(std::move(error)) {}

        [[nodiscard]] bool is_ok() const noexcept { return !error_.has_value(); }
        [[nodiscard]] bool is_err() const noexcept { return error_.has_value(); }

        explicit operator bool() const noexcept { return is_ok(); }

        const E& error() const& {
            if (is_ok()) {
                throw std::logic_error("Result holds a value, not an error");
            }
            return *error_;
        }

        template<typename F>
        auto map_error(F&& f) && -> Result<void, std::invoke_result_t<F, const E&>> {
            using G = std::invoke_result_t<F, const E&>;
            if (is_ok()) {
                return Result<void, G>::success();
            }
            return Result<void, G>::failure(std::forward<F>(f)(*error_));
        }

    private:
        std::optional<E> error_;
    };

}  // namespace depmap

#endif //DEPMAP_RESULT_HPP
