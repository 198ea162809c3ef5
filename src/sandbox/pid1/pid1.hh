#pragma once

#include "../communication/supervisor_pid1_tracee.hh"

#include <bbrunner/sandbox/sandbox.hh>
#include <linux/filter.h>
#include <optional>
#include <sys/capability.h>
#include <sys/types.h>
#include <vector>

namespace sandbox::pid1 {

struct Args {
    volatile communication::supervisor_pid1_tracee::SharedMemState* shared_mem_state;
    const char* executable;
    std::optional<int> stdin_fd;
    std::optional<int> stdout_fd;
    std::optional<int> stderr_fd;
    std::vector<char*> argv; // with a trailing nullptr element
    std::vector<char*> env; // with a trailing nullptr element
    const char* working_directory;
    int supervisor_pidfd;
    int tracee_cgroup_fd;
    cap_t empty_caps; // prepared beforehand as cap_init() allocates

    struct LinuxNamespaces {
        struct User {
            uid_t outside_uid;
            gid_t outside_gid;
        } user;

        struct Mount {
            struct BindMount {
                const char* source;
                const char* dest;
                bool recursive;
                bool read_only;
                bool skip_if_missing;
            };

            std::vector<BindMount> bind_mounts;
        } mount;

        struct Uts {
            const char* hostname;
        } uts;
    } linux_namespaces;

    sock_fprog seccomp_filter;
};

[[noreturn]] void main(Args args) noexcept;

} // namespace sandbox::pid1
