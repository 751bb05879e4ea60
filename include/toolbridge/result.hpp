#pragma once

#include <cassert>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "error.hpp"

namespace toolbridge {

    /// @brief Result<T> holds either a value of type T or an Error.
    /// @tparam T The type of the successful value.
    /// @note Similar to std::expected<T, Error> in C++23. Used for every
    /// outcome a caller is expected to branch on; fatal conditions are
    /// exceptions.
    template <typename T>
    class [[nodiscard]] Result {
       public:
        /// @brief Create a successful Result, constructing T in place.
        template <typename... Args, typename = std::enable_if_t<
                                        std::is_constructible_v<T, Args&&...>>>
        static Result ok(Args&&... args) {
            return Result(std::in_place_type<T>, std::forward<Args>(args)...);
        }

        /// @brief Create an error Result with the given Error.
        static Result err(const Error& error) {
            return Result(std::in_place_type<Error>, error);
        }

        /// @brief Create an error Result with the given Error.
        static Result err(Error&& error) {
            return Result(std::in_place_type<Error>, std::move(error));
        }

        /// @brief Shorthand for err(Error{code, message}).
        static Result err(Error::Code code, std::string message) {
            return err(Error{code, std::move(message)});
        }

        /// @brief `if (result)` means "if success".
        explicit operator bool() const noexcept { return has_value(); }

        bool has_value() const noexcept {
            return std::holds_alternative<T>(m_state);
        }

        bool has_error() const noexcept {
            return std::holds_alternative<Error>(m_state);
        }

        const T& value() const& {
            const T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return *p;
        }

        T& value() & {
            T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return *p;
        }

        T&& value() && {
            T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return std::move(*p);
        }

        [[nodiscard]] const T* value_ptr() const noexcept {
            return std::get_if<T>(&m_state);
        }

        [[nodiscard]] T* value_ptr() noexcept {
            return std::get_if<T>(&m_state);
        }

        const Error& error() const& {
            const Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return *p;
        }

        Error& error() & {
            Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return *p;
        }

        Error&& error() && {
            Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return std::move(*p);
        }

        [[nodiscard]] const Error* error_ptr() const noexcept {
            return std::get_if<Error>(&m_state);
        }

        [[nodiscard]] Error* error_ptr() noexcept {
            return std::get_if<Error>(&m_state);
        }

        /// @brief Return the stored value, or the result of make_fallback()
        /// when this holds an Error. make_fallback is only invoked on error.
        template <typename F,
                  typename = std::enable_if_t<std::is_invocable_r_v<T, F&&>>>
        T value_or_else(F&& make_fallback) const& {
            return has_value() ? value() : std::forward<F>(make_fallback)();
        }

        template <typename F,
                  typename = std::enable_if_t<std::is_invocable_r_v<T, F&&>>>
        T value_or_else(F&& make_fallback) && {
            return has_value() ? std::move(*this).value()
                               : std::forward<F>(make_fallback)();
        }

        T value_or(T fallback) const& {
            return value_or_else([&] { return std::move(fallback); });
        }

        T value_or(T fallback) && {
            return std::move(*this).value_or_else(
                [&] { return std::move(fallback); });
        }

        /// @brief Stored error if present, otherwise the given fallback.
        const Error& error_or(const Error& fallback) const noexcept {
            return has_error() ? *error_ptr() : fallback;
        }

       private:
        template <typename... Args>
        explicit Result(std::in_place_type_t<T>, Args&&... args)
            : m_state(std::in_place_type<T>, std::forward<Args>(args)...) {}

        explicit Result(std::in_place_type_t<Error>, const Error& error)
            : m_state(std::in_place_type<Error>, error) {}

        explicit Result(std::in_place_type_t<Error>, Error&& error)
            : m_state(std::in_place_type<Error>, std::move(error)) {}

        /// @brief Exactly one of {T, Error} is active at any time.
        std::variant<T, Error> m_state;
    };

    /// @brief Result of an operation that produces no value.
    template <>
    class [[nodiscard]] Result<void> {
       public:
        static Result ok() { return Result(std::nullopt); }

        static Result err(Error error) { return Result(std::move(error)); }

        static Result err(Error::Code code, std::string message) {
            return Result(Error{code, std::move(message)});
        }

        explicit operator bool() const noexcept { return has_value(); }

        bool has_value() const noexcept { return !m_error.has_value(); }

        bool has_error() const noexcept { return m_error.has_value(); }

        const Error& error() const& {
            assert(m_error && "Result::error() called on a successful Result");
            return *m_error;
        }

        Error&& error() && {
            assert(m_error && "Result::error() called on a successful Result");
            return std::move(*m_error);
        }

        [[nodiscard]] const Error* error_ptr() const noexcept {
            return m_error ? &*m_error : nullptr;
        }

        const Error& error_or(const Error& fallback) const noexcept {
            return m_error ? *m_error : fallback;
        }

       private:
        explicit Result(std::optional<Error> error)
            : m_error(std::move(error)) {}

        std::optional<Error> m_error;
    };

}  // namespace toolbridge
