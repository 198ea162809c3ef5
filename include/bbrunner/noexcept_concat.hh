#pragma once

#include <bbrunner/to_string.hh>
#include <cstddef>
#include <type_traits>

namespace detail {

template <class>
struct NoexceptStringMaxLength {};

template <size_t N>
struct NoexceptStringMaxLength<StaticCStringBuff<N>> : std::integral_constant<size_t, N> {};

template <size_t N>
struct NoexceptStringMaxLength<char[N]> : std::integral_constant<size_t, N - 1> {};

template <class T>
constexpr decltype(auto) noexcept_stringify(T&& x) noexcept {
    using U = std::remove_cvref_t<T>;
    if constexpr (std::is_same_v<U, char>) {
        StaticCStringBuff<1> res;
        res[0] = x;
        res[1] = '\0';
        res.len_ = 1;
        return res;
    } else if constexpr (std::is_integral_v<U>) {
        return ::to_string(x);
    } else {
        return std::forward<T>(x);
    }
}

} // namespace detail

// Concatenates integers, string literals and StaticCStringBuffs without allocating
template <class... Args>
[[nodiscard]] constexpr auto noexcept_concat(Args&&... args) noexcept {
    return [](auto&&... str) {
        StaticCStringBuff<(
            detail::NoexceptStringMaxLength<std::remove_cvref_t<decltype(str)>>::value + ... + 0
        )>
            res;
        size_t pos = 0;
        auto append = [&](const auto& s) {
            for (size_t i = 0; s[i] != '\0'; ++i) {
                res[pos++] = s[i];
            }
        };
        (append(str), ...);
        res[pos] = '\0';
        res.len_ = pos;
        return res;
    }(detail::noexcept_stringify(std::forward<Args>(args))...);
}
