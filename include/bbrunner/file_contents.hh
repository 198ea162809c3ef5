#pragma once

#include <bbrunner/file_path.hh>
#include <string>
#include <string_view>
#include <sys/types.h>

// Writes all @p data to @p fd retrying on EINTR. Returns the number of bytes written; if it is
// less than the data size, errno describes the error. Async-signal-safe.
size_t write_all(int fd, const void* data, size_t len) noexcept;

inline size_t write_all(int fd, std::string_view data) noexcept {
    return write_all(fd, data.data(), data.size());
}

// Reads the whole contents of the file @p fd from its current offset. Throws on error.
std::string get_file_contents(int fd);

// Reads the whole contents of the file @p path. Throws on error.
std::string get_file_contents(FilePath path);

// Reads the whole contents of the file @p path relative to @p dirfd. Throws on error.
std::string get_file_contents_at(int dirfd, FilePath path);

// Creates or truncates the file @p path and writes @p data to it. Throws on error.
void put_file_contents(FilePath path, std::string_view data, mode_t mode = 0644);
