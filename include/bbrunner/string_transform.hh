#pragma once

#include <charconv>
#include <optional>
#include <string_view>
#include <type_traits>

// Parses the whole @p str as a decimal number. Returns std::nullopt on any error (including
// trailing characters and overflow).
template <class T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
constexpr std::optional<T> str2num(std::string_view str) noexcept {
    if (str.empty() || str.front() == '+') {
        return std::nullopt;
    }
    T res{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), res);
    if (ec != std::errc{} || ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return res;
}

constexpr bool has_prefix(std::string_view str, std::string_view prefix) noexcept {
    return str.substr(0, prefix.size()) == prefix;
}

constexpr bool has_suffix(std::string_view str, std::string_view suffix) noexcept {
    return str.size() >= suffix.size() && str.substr(str.size() - suffix.size()) == suffix;
}
