#pragma once

#include <libassert/assert.hpp>

#include <concepts>
#include <functional>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace patchgrader {

template <typename T = void, typename E = std::error_code>
/**
 * @brief std::variant based stand-in for C++23's std::expected
 *
 * @tparam T The expected value type (may be void)
 * @tparam E The error type
 *
 * Note: types T and E must not be convertible between one another, otherwise
 * the converting constructors are ambiguous.
 */
class [[nodiscard]] Expected
{
    using StorageT = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

public:
    using ExpectedT = T;
    using ErrT = E;

    constexpr Expected()
        requires(std::is_void_v<T> || std::default_initializable<T>)
        : data_{std::in_place_index<0>} {}

    template <typename Tu>
    constexpr Expected(Tu&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && std::is_convertible_v<Tu, StorageT> && !std::is_convertible_v<Tu, E>)
        : data_{std::in_place_index<0>, std::forward<Tu>(value)} {}

    template <typename Eu>
    constexpr Expected(Eu&& error) // NOLINT(*-explicit-*)
        requires(std::is_convertible_v<Eu, E> && !std::is_convertible_v<Eu, StorageT>)
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    constexpr bool has_value() const { return data_.index() == 0; }

    constexpr bool has_error() const { return !has_value(); }

    constexpr explicit operator bool() const { return has_value(); }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr U& value() & {
        ASSERT(has_value(), "value() called on an Expected holding an error");
        return std::get<0>(data_);
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr const U& value() const& {
        ASSERT(has_value(), "value() called on an Expected holding an error");
        return std::get<0>(data_);
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr U&& value() && {
        ASSERT(has_value(), "value() called on an Expected holding an error");
        return std::get<0>(std::move(data_));
    }

    template <typename U = T>
        requires(std::is_void_v<U>)
    constexpr void value() const {
        ASSERT(has_value(), "value() called on an Expected holding an error");
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr U& operator*() & {
        return value();
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr const U& operator*() const& {
        return value();
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr U* operator->() {
        return &value();
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr const U* operator->() const {
        return &value();
    }

    template <typename Tu>
        requires(!std::is_void_v<T> && std::convertible_to<Tu, StorageT>)
    constexpr StorageT value_or(Tu&& default_value) const {
        if (!has_value()) {
            return static_cast<StorageT>(std::forward<Tu>(default_value));
        }
        return std::get<0>(data_);
    }

    constexpr const E& error() const {
        ASSERT(has_error(), "error() called on an Expected holding a value");
        return std::get<1>(data_);
    }

    template <typename Eu>
        requires(std::convertible_to<Eu, E>)
    constexpr E error_or(Eu&& default_error) const {
        if (has_value()) {
            return static_cast<E>(std::forward<Eu>(default_error));
        }
        return std::get<1>(data_);
    }

    template <typename Func>
    constexpr auto transform(Func&& func) const -> Expected<std::invoke_result_t<Func, const StorageT&>, E> {
        if (has_error()) {
            return error();
        }
        return std::invoke(std::forward<Func>(func), std::get<0>(data_));
    }

private:
    std::variant<StorageT, E> data_;
};

} // namespace patchgrader
