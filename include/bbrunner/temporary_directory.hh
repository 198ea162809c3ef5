#pragma once

#include <bbrunner/file_path.hh>
#include <string>
#include <utility>

// Directory created with mkdtemp(3) and removed recursively on destruction
class TemporaryDirectory {
    std::string path_; // absolute, without a trailing slash

public:
    TemporaryDirectory() = default; // Does NOT create a temporary directory

    // @p templ has to be an absolute path ending with "XXXXXX". Throws on error.
    explicit TemporaryDirectory(FilePath templ);

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory(TemporaryDirectory&& other) noexcept : path_{std::move(other.path_)} {
        other.path_.clear();
    }
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
    // NOLINTNEXTLINE(performance-noexcept-move-constructor)
    TemporaryDirectory& operator=(TemporaryDirectory&& other);

    ~TemporaryDirectory();

    [[nodiscard]] bool exists() const noexcept { return !path_.empty(); }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
};
