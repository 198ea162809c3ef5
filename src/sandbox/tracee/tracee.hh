#pragma once

#include "../communication/supervisor_pid1_tracee.hh"

#include <optional>
#include <sys/capability.h>
#include <sys/types.h>
#include <vector>

namespace sandbox::tracee {

struct Args {
    volatile communication::supervisor_pid1_tracee::SharedMemState* shared_mem_state;
    const char* executable;
    std::optional<int> stdin_fd;
    std::optional<int> stdout_fd;
    std::optional<int> stderr_fd;
    std::vector<char*> argv; // with a trailing nullptr element
    std::vector<char*> env; // with a trailing nullptr element
    const char* working_directory;
    int proc_dirfd;
    cap_t empty_caps; // prepared beforehand as cap_init() allocates

    struct LinuxNamespaces {
        struct User {
            uid_t outside_uid;
            uid_t inside_uid;
            gid_t outside_gid;
            gid_t inside_gid;
        } user;
    } linux_namespaces;
};

[[noreturn]] void main(Args args) noexcept;

} // namespace sandbox::tracee
