#pragma once

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <concepts>
#include <functional>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace gradebox {

template <typename T = void, typename E = std::error_code>
/**
 * @brief std::variant wrapper for the subset of C++23's std::expected that we need
 *
 * @tparam T The expected value type
 * @tparam E The error type
 *
 * Note: types T and E must not be convertible between one another.
 */
class [[nodiscard]] Expected
{
    static constexpr bool IS_VOID = std::is_void_v<T>;
    using StorageT = std::conditional_t<IS_VOID, std::monostate, T>;

public:
    using ExpectedT = T;
    using ErrT = E;

    constexpr Expected()
        requires(IS_VOID || std::default_initializable<T>)
        : data_{std::in_place_index<0>} {}

    template <typename Tu>
    constexpr Expected(Tu&& value) // NOLINT(*-explicit-*)
        requires(!IS_VOID && std::convertible_to<Tu, StorageT> && !std::convertible_to<Tu, E>)
        : data_{std::in_place_index<0>, std::forward<Tu>(value)} {}

    template <typename Eu>
    constexpr Expected(Eu&& error) // NOLINT(*-explicit-*)
        requires(std::convertible_to<Eu, E> && (IS_VOID || !std::convertible_to<Eu, StorageT>))
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    constexpr bool has_value() const noexcept { return data_.index() == 0; }

    constexpr bool has_error() const noexcept { return !has_value(); }

    constexpr explicit operator bool() const noexcept { return has_value(); }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr U& value() & {
        DEBUG_ASSERT(has_value(), "value() called on an Expected holding an error");
        return std::get<0>(data_);
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr const U& value() const& {
        DEBUG_ASSERT(has_value(), "value() called on an Expected holding an error");
        return std::get<0>(data_);
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr U&& value() && {
        DEBUG_ASSERT(has_value(), "value() called on an Expected holding an error");
        return std::get<0>(std::move(data_));
    }

    template <typename U = T>
        requires(std::is_void_v<U>)
    constexpr void value() const& {
        DEBUG_ASSERT(has_value(), "value() called on an Expected holding an error");
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
        requires(!IS_VOID && std::convertible_to<Tu, StorageT>)
    constexpr StorageT value_or(Tu&& default_value) const {
        if (!has_value()) {
            return static_cast<StorageT>(std::forward<Tu>(default_value));
        }
        return std::get<0>(data_);
    }

    constexpr const E& error() const {
        DEBUG_ASSERT(has_error(), "error() called on an Expected holding a value");
        return std::get<1>(data_);
    }

    template <typename Func>
        requires(!IS_VOID)
    constexpr auto transform(Func&& func) const -> Expected<std::invoke_result_t<Func, const StorageT&>, E> {
        if (!has_value()) {
            return error();
        }

        return std::invoke(std::forward<Func>(func), std::get<0>(data_));
    }

    constexpr bool operator==(const Expected& rhs) const = default;

private:
    std::variant<StorageT, E> data_;
};

} // namespace gradebox

template <typename T, typename E>
struct fmt::formatter<::gradebox::Expected<T, E>> : fmt::formatter<std::string_view>
{
    auto format(const ::gradebox::Expected<T, E>& from, fmt::format_context& ctx) const {
        if (!from) {
            if constexpr (fmt::is_formattable<E>::value) {
                return fmt::format_to(ctx.out(), "Error({})", from.error());
            } else {
                return fmt::format_to(ctx.out(), "Error(<unformattable>)");
            }
        }

        if constexpr (std::is_void_v<T>) {
            return fmt::format_to(ctx.out(), "Expected(void)");
        } else if constexpr (fmt::is_formattable<T>::value) {
            return fmt::format_to(ctx.out(), "Expected({})", from.value());
        } else {
            return fmt::format_to(ctx.out(), "Expected(<unformattable>)");
        }
    }
};
