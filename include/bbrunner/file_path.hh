#pragma once

#include <bbrunner/static_cstring_buff.hh>
#include <string>
#include <string_view>

// Non-owning reference to a null-terminated path. This type should NOT be returned from a
// function call.
class FilePath {
    const char* str_;
    size_t size_;

public:
    constexpr FilePath(const FilePath&) noexcept = default;
    constexpr FilePath(FilePath&&) noexcept = default;
    FilePath& operator=(const FilePath&) = delete;
    FilePath& operator=(FilePath&&) = delete;
    ~FilePath() = default;

    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr FilePath(const char* str) noexcept
    : str_(str)
    , size_(std::char_traits<char>::length(str)) {}

    // NOLINTNEXTLINE(google-explicit-constructor)
    FilePath(const std::string& str) noexcept : str_(str.c_str()), size_(str.size()) {}

    template <size_t N>
    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr FilePath(const StaticCStringBuff<N>& str) noexcept
    : str_(str.c_str())
    , size_(str.size()) {}

    [[nodiscard]] constexpr const char* data() const noexcept { return str_; }

    [[nodiscard]] constexpr const char* c_str() const noexcept { return str_; }

    [[nodiscard]] constexpr size_t size() const noexcept { return size_; }

    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr operator const char*() const noexcept { return str_; }

    [[nodiscard]] std::string to_str() const { return {str_, size_}; }
};
