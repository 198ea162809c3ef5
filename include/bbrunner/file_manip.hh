#pragma once

#include <bbrunner/file_path.hh>
#include <bbrunner/file_perms.hh>
#include <fcntl.h>
#include <string>

// Removes @p path relative to @p dirfd recursively (like rm -r). Returns 0 on success, -1 on
// error and sets errno.
int remove_r_at(int dirfd, FilePath path) noexcept;

// Removes @p path recursively (like rm -r). Returns 0 on success, -1 on error and sets errno.
inline int remove_r(FilePath path) noexcept { return remove_r_at(AT_FDCWD, path); }

// Creates @p path with all the missing parent directories (like mkdir -p). Returns 0 on
// success, -1 on error and sets errno.
int mkdir_r(std::string path, mode_t mode = S_0755) noexcept;

// Returns true iff @p path exists (does not follow the final symlink)
bool path_exists(FilePath path) noexcept;

// Returns true iff @p path is a directory (follows symlinks)
bool is_directory(FilePath path) noexcept;
