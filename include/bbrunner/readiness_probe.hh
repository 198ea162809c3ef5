#pragma once

#include <bbrunner/path_policy.hh>
#include <string_view>

namespace bbrunner {

class ReadinessProbe {
    PathPolicy build_dir_policy_;

public:
    explicit ReadinessProbe(std::string_view build_directory_path)
    : build_dir_policy_{build_directory_path} {}

    // Returns true if @p path is empty or names an existing file inside the build directory.
    // A path escaping the build directory is not ready. Never modifies the filesystem.
    [[nodiscard]] bool check_readiness(std::string_view path) const;
};

} // namespace bbrunner
