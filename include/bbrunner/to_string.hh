#pragma once

#include <bbrunner/static_cstring_buff.hh>
#include <limits>
#include <type_traits>

// Converts integer to its decimal representation without allocating
template <
    class T,
    std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char>,
                     int> = 0>
constexpr auto to_string(T x) noexcept {
    constexpr size_t max_len = std::numeric_limits<T>::digits10 + 1 + std::is_signed_v<T>;
    StaticCStringBuff<max_len> res;
    using U = std::make_unsigned_t<T>;
    U val = static_cast<U>(x);
    bool negative = false;
    if constexpr (std::is_signed_v<T>) {
        if (x < 0) {
            negative = true;
            val = static_cast<U>(U{0} - val);
        }
    }
    char digits[max_len];
    size_t n = 0;
    do {
        digits[n++] = static_cast<char>('0' + val % 10);
        val /= 10;
    } while (val > 0);
    size_t pos = 0;
    if (negative) {
        res[pos++] = '-';
    }
    while (n > 0) {
        res[pos++] = digits[--n];
    }
    res[pos] = '\0';
    res.len_ = pos;
    return res;
}
