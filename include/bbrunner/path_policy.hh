#pragma once

#include <string>
#include <string_view>

namespace bbrunner {

// Confines caller-supplied paths to a directory tree
class PathPolicy {
    std::string root_; // canonical if the root exists

public:
    // @p root has to be an absolute path
    explicit PathPolicy(std::string_view root);

    [[nodiscard]] const std::string& root() const noexcept { return root_; }

    // Returns the absolute path of @p relative (interpreted relative to the root) with symlinks
    // of its existing part resolved. Throws RunError INVALID_ARGUMENT if @p relative is absolute,
    // steps above the root with "..", or its existing part resolves outside the root (dangling
    // symlinks included). Does not modify the filesystem.
    [[nodiscard]] std::string resolve(std::string_view relative) const;

    // Like resolve() but also accepts an absolute @p path that lies inside the root
    [[nodiscard]] std::string resolve_absolute_or_relative(std::string_view path) const;

    // Returns true iff @p path (canonical) is the root or lies inside it
    [[nodiscard]] bool contains(std::string_view path) const noexcept;
};

} // namespace bbrunner
