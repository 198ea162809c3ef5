#pragma once

#include <array>
#include <cstddef>
#include <string_view>
#include <type_traits>

// Fixed-capacity null-terminated string, usable where allocation is not allowed
template <size_t N>
class StaticCStringBuff {
    std::array<char, N + 1> str_{'\0'};

public:
    size_t len_ = 0;

    constexpr StaticCStringBuff() noexcept = default;

    template <size_t M, std::enable_if_t<M <= N + 1, int> = 0>
    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr StaticCStringBuff(const char (&str)[M]) noexcept {
        while (len_ < M - 1 && str[len_] != '\0') {
            str_[len_] = str[len_];
            ++len_;
        }
        str_[len_] = '\0';
    }

    constexpr StaticCStringBuff(const StaticCStringBuff&) noexcept = default;
    constexpr StaticCStringBuff(StaticCStringBuff&&) noexcept = default;
    constexpr StaticCStringBuff& operator=(const StaticCStringBuff&) noexcept = default;
    constexpr StaticCStringBuff& operator=(StaticCStringBuff&&) noexcept = default;
    ~StaticCStringBuff() = default;

    [[nodiscard]] constexpr bool is_empty() const noexcept { return len_ == 0; }

    [[nodiscard]] constexpr size_t size() const noexcept { return len_; }

    [[nodiscard]] static constexpr size_t max_size() noexcept { return N; }

    constexpr char* data() noexcept { return str_.data(); }

    [[nodiscard]] constexpr const char* data() const noexcept { return str_.data(); }

    [[nodiscard]] constexpr const char* c_str() const noexcept { return str_.data(); }

    constexpr auto begin() noexcept { return str_.begin(); }

    [[nodiscard]] constexpr auto begin() const noexcept { return str_.begin(); }

    constexpr auto end() noexcept { return str_.begin() + len_; }

    [[nodiscard]] constexpr auto end() const noexcept { return str_.begin() + len_; }

    constexpr char& operator[](size_t n) noexcept { return str_[n]; }

    constexpr const char& operator[](size_t n) const noexcept { return str_[n]; }

    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr operator std::string_view() const noexcept { return {str_.data(), len_}; }
};

template <size_t M>
StaticCStringBuff(const char (&)[M]) -> StaticCStringBuff<M - 1>;
