#pragma once

#include <csignal>
#include <linux/sched.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

extern "C" struct rusage;

namespace syscalls {

inline int
waitid(int id_type, pid_t id, siginfo_t* info, int options, struct rusage* usage) noexcept {
    return static_cast<int>(syscall(SYS_waitid, id_type, id, info, options, usage));
}

inline int pidfd_open(pid_t pid, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_pidfd_open, pid, flags));
}

inline int pidfd_send_signal(int pidfd, int sig, siginfo_t* info, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_pidfd_send_signal, pidfd, sig, info, flags));
}

// NOLINTNEXTLINE(google-runtime-int)
inline long clone3(struct clone_args* cl_args) noexcept {
    return syscall(SYS_clone3, cl_args, sizeof(*cl_args));
}

} // namespace syscalls
