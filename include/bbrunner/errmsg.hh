#pragma once

#include <bbrunner/static_cstring_buff.hh>
#include <bbrunner/to_string.hh>
#include <cerrno>
#include <cstring>

// Returns " - <error description> (os error <errnum>)"; does not allocate
inline auto errmsg(int errnum) noexcept {
    constexpr auto prefix = StaticCStringBuff{" - "};
    constexpr size_t bytes_for_error_description = 64;
    constexpr auto infix = StaticCStringBuff{" (os error "};
    auto errnum_str = to_string(errnum);
    constexpr auto suffix = StaticCStringBuff{")"};
    StaticCStringBuff<
        prefix.size() + bytes_for_error_description + infix.size() +
        decltype(errnum_str)::max_size() + suffix.size()>
        res;
    size_t pos = 0;
    auto append = [&res, &pos](const auto& s) noexcept {
        for (auto c : s) {
            res[pos++] = c;
        }
    };
    append(prefix);
    // GNU strerror_r() may or may not use the supplied buffer
    const char* errstr =
        strerror_r(errnum, res.data() + pos, prefix.size() + bytes_for_error_description - pos);
    if (errstr == res.data() + pos) {
        while (res[pos] != '\0') {
            ++pos;
        }
    } else {
        if (errstr == nullptr) {
            errstr = "Unknown error";
        }
        while (pos < prefix.size() + bytes_for_error_description && *errstr != '\0') {
            res[pos++] = *(errstr++);
        }
    }
    append(infix);
    append(errnum_str);
    append(suffix);
    res[pos] = '\0';
    res.len_ = pos;
    return res;
}

inline auto errmsg() noexcept { return errmsg(errno); }
