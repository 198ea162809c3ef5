#include "../communication/supervisor_pid1_tracee.hh"
#include "../tracee/tracee.hh"
#include "pid1.hh"

#include <bbrunner/errmsg.hh>
#include <bbrunner/file_contents.hh>
#include <bbrunner/file_path.hh>
#include <bbrunner/noexcept_concat.hh>
#include <bbrunner/syscalls.hh>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <poll.h>
#include <sched.h>
#include <string_view>
#include <sys/capability.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <unistd.h>
#include <utility>

namespace sms = sandbox::communication::supervisor_pid1_tracee;
using Stage = sandbox::result::Error::Stage;

namespace {

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sms::SharedMemState* shared_mem_state;

template <class... Args>
[[noreturn]] void die_with_msg(Args&&... msg) noexcept {
    sms::write_result_error(
        shared_mem_state, Stage::SETUP, 0, "pid1: ", std::forward<decltype(msg)>(msg)...
    );
    _exit(1);
}

template <class... Args>
[[noreturn]] void die_with_error(Args&&... msg) noexcept {
    int errnum = errno;
    sms::write_result_error(
        shared_mem_state,
        Stage::SETUP,
        errnum,
        "pid1: ",
        std::forward<decltype(msg)>(msg)...,
        errmsg(errnum)
    );
    _exit(1);
}

void set_process_name() noexcept {
    if (prctl(PR_SET_NAME, "pid1", 0, 0, 0)) {
        die_with_error("prctl(SET_NAME)");
    }
}

void setup_kill_on_supervisor_death(int supervisor_pidfd) noexcept {
    // Make kernel send us SIGKILL when the parent process (= supervisor process) dies
    if (prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0)) {
        die_with_error("prctl(PR_SET_PDEATHSIG)");
    }
    // Check if the supervisor is not already dead - it might happened just before prctl(). We
    // cannot use getppid() because it returns 0 as we are in a new PID namespace, so we use
    // poll() on supervisor's pidfd
    pollfd pfd = {
        .fd = supervisor_pidfd,
        .events = POLLIN,
        .revents = 0,
    };
    if (poll(&pfd, 1, 0) == 1) {
        die_with_msg("supervisor died");
    }
}

// The supervisor's thread may have signals blocked or ignored and both are inherited across
// execve()
void reset_signals() noexcept {
    struct sigaction sa = {};
    sa.sa_handler = SIG_DFL;
    if (sigemptyset(&sa.sa_mask)) {
        die_with_error("sigemptyset()");
    }
    for (int sig = 1; sig < NSIG; ++sig) {
        if (sig == SIGKILL || sig == SIGSTOP) {
            continue;
        }
        // Fails only for signals reserved by the C library
        (void)sigaction(sig, &sa, nullptr);
    }
    sigset_t empty_set;
    if (sigemptyset(&empty_set)) {
        die_with_error("sigemptyset()");
    }
    if (sigprocmask(SIG_SETMASK, &empty_set, nullptr)) {
        die_with_error("sigprocmask()");
    }
}

void write_file(FilePath file_path, std::string_view data) noexcept {
    auto fd = open(file_path, O_WRONLY | O_TRUNC | O_CLOEXEC);
    if (fd == -1) {
        die_with_error("open(", file_path, ")");
    }
    if (write_all(fd, data) != data.size()) {
        die_with_error("write(", file_path, ")");
    }
    if (close(fd)) {
        die_with_error("close()");
    }
}

void setup_user_namespace(const sandbox::pid1::Args::LinuxNamespaces::User& user_ns) noexcept {
    // Identity mapping of the supervisor's effective ids
    write_file(
        "/proc/self/uid_map", noexcept_concat(user_ns.outside_uid, ' ', user_ns.outside_uid, " 1")
    );
    write_file("/proc/self/setgroups", "deny");
    write_file(
        "/proc/self/gid_map", noexcept_concat(user_ns.outside_gid, ' ', user_ns.outside_gid, " 1")
    );
    // Set real, effective and saved user ids all to the same value to prevent privilege escalation
    if (setresuid(user_ns.outside_uid, user_ns.outside_uid, user_ns.outside_uid) != 0) {
        die_with_error("setresuid()");
    }
    // Set real, effective and saved group ids all to the same value to prevent privilege escalation
    if (setresgid(user_ns.outside_gid, user_ns.outside_gid, user_ns.outside_gid) != 0) {
        die_with_error("setresgid()");
    }
}

void setup_uts_namespace(const sandbox::pid1::Args::LinuxNamespaces::Uts& uts_ns) noexcept {
    if (sethostname(uts_ns.hostname, std::strlen(uts_ns.hostname))) {
        die_with_error("sethostname()");
    }
}

void setup_mount_namespace(const sandbox::pid1::Args::LinuxNamespaces::Mount& mount_ns) noexcept {
    // Nothing mounted below may propagate outside the sandbox
    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr)) {
        die_with_error("mount(\"/\", MS_REC | MS_PRIVATE)");
    }
    for (const auto& bind_mount : mount_ns.bind_mounts) {
        int mount_fd = open_tree(
            AT_FDCWD,
            bind_mount.source,
            OPEN_TREE_CLOEXEC | OPEN_TREE_CLONE | (bind_mount.recursive ? AT_RECURSIVE : 0)
        );
        if (mount_fd < 0) {
            if (errno == ENOENT && bind_mount.skip_if_missing) {
                continue;
            }
            die_with_error("open_tree(\"", bind_mount.source, "\")");
        }

        mount_attr mattr = {};
        unsigned int setattr_flags = AT_EMPTY_PATH;
        if (bind_mount.read_only) {
            mattr.attr_set = MOUNT_ATTR_RDONLY | MOUNT_ATTR_NOSUID;
            if (bind_mount.recursive) {
                setattr_flags |= AT_RECURSIVE;
            }
        } else {
            // Submounts keep their flags, so a read-only mount below stays read-only
            mattr.attr_clr = MOUNT_ATTR_RDONLY;
        }
        if (mount_setattr(mount_fd, "", setattr_flags, &mattr, sizeof(mattr))) {
            die_with_error("mount_setattr(\"", bind_mount.source, "\")");
        }
        if (move_mount(mount_fd, "", AT_FDCWD, bind_mount.dest, MOVE_MOUNT_F_EMPTY_PATH)) {
            die_with_error("move_mount(dest: \"", bind_mount.dest, "\")");
        }
        if (close(mount_fd)) {
            die_with_error("close()");
        }
    }
}

void forward_sigterm_to_all_processes(int /*sig*/) noexcept {
    int saved_errno = errno;
    // Sends to every process in our pid namespace except us
    (void)kill(-1, SIGTERM);
    errno = saved_errno;
}

void install_sigterm_forwarder() noexcept {
    // As the init process of the pid namespace, we would otherwise ignore SIGTERM
    struct sigaction sa = {};
    sa.sa_handler = &forward_sigterm_to_all_processes;
    sa.sa_flags = SA_RESTART;
    if (sigemptyset(&sa.sa_mask)) {
        die_with_error("sigemptyset()");
    }
    if (sigaction(SIGTERM, &sa, nullptr)) {
        die_with_error("sigaction()");
    }
}

void drop_all_capabilities_and_prevent_gaining_any_of_them(cap_t empty_caps) noexcept {
    if (cap_set_proc(empty_caps)) {
        die_with_error("cap_set_proc()");
    }
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0)) {
        die_with_error("prctl(PR_SET_NO_NEW_PRIVS)");
    }
}

void harden_against_potential_compromise(cap_t empty_caps, sock_fprog seccomp_filter) noexcept {
    // pid1 only reaps processes from now on
    if (close_range(0, ~0U, 0)) {
        die_with_error("close_range()");
    }
    drop_all_capabilities_and_prevent_gaining_any_of_them(empty_caps);
    if (syscall(SYS_seccomp, SECCOMP_SET_MODE_FILTER, 0, &seccomp_filter)) {
        die_with_error("seccomp()");
    }
}

} // namespace

namespace sandbox::pid1 {

[[noreturn]] void main(Args args) noexcept {
    shared_mem_state = args.shared_mem_state;

    set_process_name();
    setup_kill_on_supervisor_death(args.supervisor_pidfd);
    reset_signals();
    setup_user_namespace(args.linux_namespaces.user);
    int proc_dirfd = open("/proc", O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (proc_dirfd < 0) {
        die_with_error("open(/proc)");
    }
    setup_uts_namespace(args.linux_namespaces.uts);
    setup_mount_namespace(args.linux_namespaces.mount);
    install_sigterm_forwarder();

    clone_args cl_args = {};
    // CLONE_NEWUSER | CLONE_NEWNS are needed to lock the mount tree
    cl_args.flags = CLONE_INTO_CGROUP | CLONE_NEWUSER | CLONE_NEWNS;
    cl_args.exit_signal = SIGCHLD;
    cl_args.cgroup = static_cast<uint64_t>(args.tracee_cgroup_fd);

    auto tracee_pid = syscalls::clone3(&cl_args);
    if (tracee_pid == -1) {
        die_with_error("clone3()");
    }
    if (tracee_pid == 0) {
        tracee::main({
            .shared_mem_state = args.shared_mem_state,
            .executable = args.executable,
            .stdin_fd = args.stdin_fd,
            .stdout_fd = args.stdout_fd,
            .stderr_fd = args.stderr_fd,
            .argv = std::move(args.argv),
            .env = std::move(args.env),
            .working_directory = args.working_directory,
            .proc_dirfd = proc_dirfd,
            .empty_caps = args.empty_caps,
            .linux_namespaces =
                {
                    .user =
                        {
                            .outside_uid = args.linux_namespaces.user.outside_uid,
                            .inside_uid = args.linux_namespaces.user.outside_uid,
                            .outside_gid = args.linux_namespaces.user.outside_gid,
                            .inside_gid = args.linux_namespaces.user.outside_gid,
                        },
                },
        });
    }

    harden_against_potential_compromise(args.empty_caps, args.seccomp_filter);

    siginfo_t si;
    for (;;) {
        if (syscalls::waitid(P_ALL, 0, &si, __WALL | WEXITED, nullptr)) {
            if (errno == EINTR) {
                continue;
            }
            die_with_error("waitid()");
        }
        if (si.si_pid == tracee_pid) {
            // Remaining processes will be killed on pid1's death
            break;
        }
    }

    // Check if tracee died prematurely with an error
    if (sms::is_error(args.shared_mem_state)) {
        _exit(1); // error is already written by tracee
    }

    sms::write_result_ok(
        args.shared_mem_state,
        {
            .code = si.si_code,
            .status = si.si_status,
        }
    );

    _exit(0);
}

} // namespace sandbox::pid1
