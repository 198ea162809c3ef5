#pragma once

#include <bbrunner/to_string.hh>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

template <class T>
constexpr inline bool is_string_argument = [] {
    using U = std::remove_cvref_t<T>;
    return std::is_integral_v<U> || std::is_constructible_v<std::string_view, const U&>;
}();

// Converts argument to a string-like object: std::string_view or StaticCStringBuff. Returned
// std::string_view may refer to the argument itself, so it is valid only as long as the argument.
template <class T, std::enable_if_t<is_string_argument<T>, int> = 0>
constexpr auto stringify(T&& x) noexcept {
    using U = std::remove_cvref_t<T>;
    if constexpr (std::is_same_v<U, char>) {
        return std::string_view{&x, 1};
    } else if constexpr (std::is_same_v<U, bool>) {
        return std::string_view{x ? "true" : "false"};
    } else if constexpr (std::is_integral_v<U>) {
        return to_string(x);
    } else {
        return std::string_view{x};
    }
}

template <class T>
constexpr size_t string_length(const T& str) noexcept {
    return std::string_view{str}.size();
}

template <class T>
constexpr const char* string_data(const T& str) noexcept {
    return std::string_view{str}.data();
}

template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
std::string& back_insert(std::string& str, Args&&... args) {
    [&str](auto&&... s) {
        str.reserve(str.size() + (size_t{0} + ... + string_length(s)));
        (str.append(std::string_view{s}), ...);
    }(stringify(std::forward<Args>(args))...);
    return str;
}

template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
std::string concat_tostr(Args&&... args) {
    std::string res;
    back_insert(res, std::forward<Args>(args)...);
    return res;
}
