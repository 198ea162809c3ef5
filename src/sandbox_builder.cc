#include <bbrunner/file_manip.hh>
#include <bbrunner/run_error.hh>
#include <bbrunner/sandbox_builder.hh>
#include <utility>

using std::string;
using std::string_view;
using std::vector;

namespace bbrunner {

SandboxHandle::SandboxHandle(vector<BindMount> bind_mounts)
: bind_mounts_{std::move(bind_mounts)} {
    mount_operations_.reserve(bind_mounts_.size());
    for (const auto& bind_mount : bind_mounts_) {
        mount_operations_.push_back({
            .source = bind_mount.path,
            .dest = bind_mount.path,
            .recursive = true,
            .read_only = bind_mount.read_only,
            .skip_if_missing = bind_mount.skip_if_missing,
        });
    }
}

SandboxHandle LinuxSandboxBuilder::build(
    string_view root_path,
    std::span<const string> writable_allow_list,
    std::span<const string> task_areas
) const {
    vector<SandboxHandle::BindMount> bind_mounts;
    auto root = string{root_path};
    if (!is_directory(root)) {
        throw RunError(
            RunError::Code::SANDBOX_SETUP_ERROR, "build root is not a directory: ", root
        );
    }
    bind_mounts.push_back({.path = std::move(root), .read_only = true, .skip_if_missing = false});

    for (const auto& path : writable_allow_list) {
        if (!path_exists(path)) {
            continue;
        }
        bind_mounts.push_back({.path = path, .read_only = false, .skip_if_missing = true});
    }

    for (const auto& path : task_areas) {
        if (!is_directory(path)) {
            throw RunError(
                RunError::Code::SANDBOX_SETUP_ERROR, "task area is not a directory: ", path
            );
        }
        bind_mounts.push_back({.path = path, .read_only = false, .skip_if_missing = false});
    }
    return SandboxHandle{std::move(bind_mounts)};
}

} // namespace bbrunner
