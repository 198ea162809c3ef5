#pragma once

#include <bbrunner/sandbox/cancellation_token.hh>
#include <bbrunner/sandbox/cgroups.hh>
#include <bbrunner/sandbox/si.hh>
#include <chrono>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace sandbox {

struct RequestOptions {
    // If unset, the file descriptor is closed in the sandboxed process
    std::optional<int> stdin_fd = std::nullopt;
    std::optional<int> stdout_fd = std::nullopt;
    std::optional<int> stderr_fd = std::nullopt;
    std::span<const std::string> env = {}; // entries in the form "NAME=VALUE"
    // Absolute path, the sandboxed process starts in it
    std::string_view working_directory = "/";

    struct LinuxNamespaces {
        struct Mount {
            // Bind mount of @p source at @p dest; both paths are absolute. Operations are
            // performed in the order of appearance, so a later bind may be placed over (or
            // beneath) an earlier one.
            struct BindMount {
                std::string_view source;
                std::string_view dest;
                bool recursive = true;
                // If false, the read-only flag of the top mount of the bind is cleared,
                // otherwise it is set recursively
                bool read_only = true;
                // If true, missing @p source is not an error and the bind is skipped
                bool skip_if_missing = false;
            };

            std::span<const BindMount> bind_mounts = {};
        } mount = {};

        struct Uts {
            std::string_view hostname = "localhost";
        } uts = {};
    } linux_namespaces = {};

    // Wall time after which the process tree is terminated
    std::optional<std::chrono::nanoseconds> time_limit = std::nullopt;
    // Time between SIGTERM and the forced kill of the process tree upon the time limit or the
    // cancellation
    std::chrono::nanoseconds termination_grace_period = std::chrono::seconds{2};
    const CancellationToken* cancellation_token = nullptr;
};

namespace result {

struct Ok {
    Si si; // of the root process of the process tree
    std::chrono::nanoseconds runtime;

    enum class Termination {
        NONE,
        TIME_LIMIT,
        CANCELLED,
    } termination;

    // True iff the process tree survived SIGTERM for the whole grace period
    bool escalated_to_kill;
};

struct Error {
    enum class Stage {
        SETUP, // namespaces, mounts and the process environment
        SPAWN, // changing the working directory and execve()
        INTERNAL,
    } stage;

    int errnum; // 0 if the error is not an OS error
    std::string description;
};

} // namespace result

using Result = std::variant<result::Ok, result::Error>;

// Runs @p executable (absolute path) with arguments @p argv inside new user, mount, pid, uts and
// ipc namespaces. The process tree is placed in @p cgroup that has to be configured beforehand.
// Returns after every process of the tree has died. Throws if supervising the process tree fails.
Result run(
    std::string_view executable,
    std::span<const std::string> argv,
    const RequestOptions& options,
    cgroups::RequestCgroup& cgroup
);

} // namespace sandbox
