#include "communication/supervisor_pid1_tracee.hh"
#include "pid1/pid1.hh"

#include <algorithm>
#include <array>
#include <bbrunner/errmsg.hh>
#include <bbrunner/file_contents.hh>
#include <bbrunner/file_descriptor.hh>
#include <bbrunner/macros/throw.hh>
#include <bbrunner/sandbox/sandbox.hh>
#include <bbrunner/sandbox/seccomp/bpf_builder.hh>
#include <bbrunner/syscalls.hh>
#include <cerrno>
#include <chrono>
#include <climits>
#include <csignal>
#include <cstdint>
#include <exception>
#include <linux/filter.h>
#include <memory>
#include <optional>
#include <poll.h>
#include <sched.h>
#include <seccomp.h>
#include <span>
#include <string>
#include <sys/capability.h>
#include <sys/mman.h>
#include <sys/wait.h>
#include <type_traits>
#include <unistd.h>
#include <utility>
#include <variant>
#include <vector>

using std::optional;
using std::string;
using std::string_view;
using std::vector;

namespace sms = sandbox::communication::supervisor_pid1_tracee;

namespace {

// After spawning the tracee, pid1 only reaps processes and forwards SIGTERM
const vector<sock_filter>& pid1_seccomp_filter() {
    static const auto filter = [] {
        auto bpf = sandbox::seccomp::BpfBuilder{SCMP_ACT_KILL_PROCESS};
        bpf.allow_syscall(SCMP_SYS(waitid));
        bpf.allow_syscall(SCMP_SYS(kill));
        bpf.allow_syscall(SCMP_SYS(rt_sigreturn));
        bpf.allow_syscall(SCMP_SYS(restart_syscall));
        bpf.allow_syscall(SCMP_SYS(exit));
        bpf.allow_syscall(SCMP_SYS(exit_group));
        auto fd = bpf.export_to_fd();
        if (lseek(fd, 0, SEEK_SET) < 0) {
            THROW("lseek()", errmsg());
        }
        auto bytes = get_file_contents(fd);
        if (bytes.size() % sizeof(sock_filter) != 0) {
            THROW("invalid size of the exported seccomp filter: ", bytes.size());
        }
        vector<sock_filter> res(bytes.size() / sizeof(sock_filter));
        std::copy(bytes.begin(), bytes.end(), reinterpret_cast<char*>(res.data()));
        return res;
    }();
    return filter;
}

class SharedMemory {
    void* mem_;

public:
    SharedMemory() {
        mem_ = mmap(
            nullptr,
            sizeof(sms::SharedMemState),
            PROT_READ | PROT_WRITE,
            MAP_SHARED | MAP_ANONYMOUS,
            -1,
            0
        );
        // NOLINTNEXTLINE(performance-no-int-to-ptr)
        if (mem_ == MAP_FAILED) {
            THROW("mmap()", errmsg());
        }
    }

    SharedMemory(const SharedMemory&) = delete;
    SharedMemory(SharedMemory&&) = delete;
    SharedMemory& operator=(const SharedMemory&) = delete;
    SharedMemory& operator=(SharedMemory&&) = delete;

    ~SharedMemory() { (void)munmap(mem_, sizeof(sms::SharedMemState)); }

    [[nodiscard]] void* get() const noexcept { return mem_; }
};

struct CapFree {
    void operator()(cap_t caps) const noexcept { (void)cap_free(caps); }
};

using CapsPtr = std::unique_ptr<std::remove_pointer_t<cap_t>, CapFree>;

vector<char*> to_null_terminated_array(std::span<const string> strs) {
    vector<char*> res;
    res.reserve(strs.size() + 1);
    for (const auto& str : strs) {
        res.emplace_back(const_cast<char*>(str.c_str()));
    }
    res.emplace_back(nullptr);
    return res;
}

// Returns true iff the pid1 process became waitable before the @p deadline (if any)
bool wait_for_pid1_death(
    int pid1_pidfd,
    optional<std::chrono::steady_clock::time_point> deadline,
    const sandbox::CancellationToken* cancellation_token,
    bool& cancelled
) {
    std::array<pollfd, 2> pfds = {{
        {.fd = pid1_pidfd, .events = POLLIN, .revents = 0},
        {
            .fd = cancellation_token ? cancellation_token->pollable_fd() : -1,
            .events = POLLIN,
            .revents = 0,
        },
    }};
    for (;;) {
        int timeout_ms = -1;
        if (deadline) {
            auto remaining = *deadline - std::chrono::steady_clock::now();
            // Round up so that the deadline has passed when poll() times out
            auto remaining_ms = std::chrono::ceil<std::chrono::milliseconds>(remaining).count();
            timeout_ms = static_cast<int>(std::clamp<int64_t>(remaining_ms, 0, INT_MAX));
        }
        pfds[0].revents = 0;
        pfds[1].revents = 0;
        int rc = poll(pfds.data(), pfds.size(), timeout_ms);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            THROW("poll()", errmsg());
        }
        if (pfds[0].revents & POLLIN) {
            return true;
        }
        if (pfds[1].revents & POLLIN) {
            cancelled = true;
            return false;
        }
        if (rc == 0 && deadline && std::chrono::steady_clock::now() >= *deadline) {
            return false;
        }
    }
}

} // namespace

namespace sandbox {

Result run(
    string_view executable,
    std::span<const string> argv,
    const RequestOptions& options,
    cgroups::RequestCgroup& cgroup
) {
    if (argv.empty()) {
        THROW("argv cannot be empty");
    }
    auto executable_str = string{executable};
    auto working_directory = string{options.working_directory};
    auto hostname = string{options.linux_namespaces.uts.hostname};

    vector<string> bind_mount_paths;
    bind_mount_paths.reserve(options.linux_namespaces.mount.bind_mounts.size() * 2);
    vector<pid1::Args::LinuxNamespaces::Mount::BindMount> bind_mounts;
    for (const auto& bind_mount : options.linux_namespaces.mount.bind_mounts) {
        const auto& source = bind_mount_paths.emplace_back(bind_mount.source);
        const auto& dest = bind_mount_paths.emplace_back(bind_mount.dest);
        bind_mounts.push_back({
            .source = source.c_str(),
            .dest = dest.c_str(),
            .recursive = bind_mount.recursive,
            .read_only = bind_mount.read_only,
            .skip_if_missing = bind_mount.skip_if_missing,
        });
    }

    // Nothing may be allocated in the child process as other threads may hold the allocator locks
    auto argv_arr = to_null_terminated_array(argv);
    auto env_arr = to_null_terminated_array(options.env);
    auto outside_uid = geteuid();
    auto outside_gid = getegid();
    const auto& seccomp_filter = pid1_seccomp_filter();
    auto empty_caps = CapsPtr{cap_init()}; // all capabilities are cleared
    if (!empty_caps) {
        THROW("cap_init()", errmsg());
    }

    SharedMemory shared_mem;
    auto shared_mem_state = sms::initialize(shared_mem.get());
    auto supervisor_pidfd = FileDescriptor{syscalls::pidfd_open(getpid(), 0)};
    if (!supervisor_pidfd.is_open()) {
        THROW("pidfd_open()", errmsg());
    }

    int pid1_pidfd_raw = -1;
    clone_args cl_args = {};
    cl_args.flags = CLONE_PIDFD | CLONE_INTO_CGROUP | CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWPID |
        CLONE_NEWUTS | CLONE_NEWIPC;
    cl_args.pidfd = reinterpret_cast<uint64_t>(&pid1_pidfd_raw);
    cl_args.exit_signal = 0; // we don't need SIGCHLD
    cl_args.cgroup = static_cast<uint64_t>(cgroup.pid1_cgroup_fd());

    auto start_time = std::chrono::steady_clock::now();
    auto pid = syscalls::clone3(&cl_args);
    if (pid == -1) {
        return result::Error{
            .stage = result::Error::Stage::SETUP,
            .errnum = errno,
            .description = concat_tostr("clone3()", errmsg()),
        };
    }
    if (pid == 0) {
        pid1::main({
            .shared_mem_state = shared_mem_state,
            .executable = executable_str.c_str(),
            .stdin_fd = options.stdin_fd,
            .stdout_fd = options.stdout_fd,
            .stderr_fd = options.stderr_fd,
            .argv = std::move(argv_arr),
            .env = std::move(env_arr),
            .working_directory = working_directory.c_str(),
            .supervisor_pidfd = supervisor_pidfd,
            .tracee_cgroup_fd = cgroup.tracee_cgroup_fd(),
            .empty_caps = empty_caps.get(),
            .linux_namespaces =
                {
                    .user =
                        {
                            .outside_uid = outside_uid,
                            .outside_gid = outside_gid,
                        },
                    .mount = {.bind_mounts = std::move(bind_mounts)},
                    .uts = {.hostname = hostname.c_str()},
                },
            .seccomp_filter =
                {
                    .len = static_cast<decltype(sock_fprog::len)>(seccomp_filter.size()),
                    .filter = const_cast<sock_filter*>(seccomp_filter.data()),
                },
        });
    }
    auto pid1_pidfd = FileDescriptor{pid1_pidfd_raw};

    auto reap_pid1 = [&pid1_pidfd] {
        siginfo_t si;
        while (syscalls::waitid(P_PIDFD, pid1_pidfd, &si, __WALL | WEXITED, nullptr)) {
            if (errno != EINTR) {
                THROW("waitid()", errmsg());
            }
        }
        return si;
    };

    auto termination = result::Ok::Termination::NONE;
    bool escalated_to_kill = false;
    auto deadline = options.time_limit
        ? optional{start_time + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                    *options.time_limit
                                )}
        : std::nullopt;
    try {
        bool cancelled = false;
        if (!wait_for_pid1_death(pid1_pidfd, deadline, options.cancellation_token, cancelled)) {
            termination = cancelled ? result::Ok::Termination::CANCELLED
                                    : result::Ok::Termination::TIME_LIMIT;
            // pid1 forwards SIGTERM to the whole process tree
            if (syscalls::pidfd_send_signal(pid1_pidfd, SIGTERM, nullptr, 0) && errno != ESRCH) {
                THROW("pidfd_send_signal()", errmsg());
            }
            auto grace_deadline = std::chrono::steady_clock::now() +
                std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                      options.termination_grace_period
                );
            bool ignored_cancellation = false;
            if (!wait_for_pid1_death(pid1_pidfd, grace_deadline, nullptr, ignored_cancellation)) {
                cgroup.kill();
                escalated_to_kill = true;
            }
        }
    } catch (const std::exception&) {
        // Death of pid1 kills the whole PID namespace; pid1 is not reaped by anyone else
        (void)syscalls::pidfd_send_signal(pid1_pidfd, SIGKILL, nullptr, 0);
        (void)reap_pid1();
        throw;
    }

    auto si = reap_pid1();
    auto runtime = std::chrono::steady_clock::now() - start_time;
    // Orphans left by the dying pid1 are killed with it, but they may still be exiting
    cgroup.wait_until_empty(std::chrono::seconds{10});

    auto res = sms::read_result(shared_mem_state);
    if (auto* err = std::get_if<result::Error>(&res)) {
        return std::move(*err);
    }
    if (auto* ok = std::get_if<result::Ok>(&res)) {
        ok->runtime = runtime;
        ok->termination = termination;
        ok->escalated_to_kill = escalated_to_kill;
        if (termination != result::Ok::Termination::NONE && ok->si.code == CLD_EXITED) {
            // The tree was terminated even if its root handled the signal and exited by itself
            ok->si = {.code = CLD_KILLED, .status = escalated_to_kill ? SIGKILL : SIGTERM};
        }
        return *ok;
    }
    // pid1 died before the tracee
    if (termination != result::Ok::Termination::NONE) {
        return result::Ok{
            .si = {.code = CLD_KILLED, .status = SIGKILL},
            .runtime = runtime,
            .termination = termination,
            .escalated_to_kill = escalated_to_kill,
        };
    }
    return result::Error{
        .stage = result::Error::Stage::INTERNAL,
        .errnum = 0,
        .description = concat_tostr(
            "pid1 died unexpectedly: ", Si{.code = si.si_code, .status = si.si_status}.description()
        ),
    };
}

} // namespace sandbox
