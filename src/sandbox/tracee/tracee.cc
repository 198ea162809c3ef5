#include "../communication/supervisor_pid1_tracee.hh"
#include "tracee.hh"

#include <bbrunner/errmsg.hh>
#include <bbrunner/file_contents.hh>
#include <bbrunner/file_path.hh>
#include <bbrunner/noexcept_concat.hh>
#include <cerrno>
#include <fcntl.h>
#include <linux/close_range.h>
#include <linux/securebits.h>
#include <string_view>
#include <sys/capability.h>
#include <sys/prctl.h>
#include <unistd.h>
#include <utility>

namespace sandbox::tracee {

[[noreturn]] void main(Args args) noexcept {
    namespace sms = communication::supervisor_pid1_tracee;
    using Stage = result::Error::Stage;
    auto die_with_msg = [&] [[noreturn]] (Stage stage, int errnum, auto&&... msg) noexcept {
        sms::write_result_error(
            args.shared_mem_state, stage, errnum, "tracee: ", std::forward<decltype(msg)>(msg)...
        );
        _exit(1);
    };
    auto die_with_error = [&] [[noreturn]] (auto&&... msg) noexcept {
        int errnum = errno;
        die_with_msg(Stage::SETUP, errnum, std::forward<decltype(msg)>(msg)..., errmsg(errnum));
    };
    auto exclude_pid1_from_tracee_session_and_process_group = [&]() noexcept {
        if (setsid() < 0) {
            die_with_error("setsid()");
        }
    };
    auto write_file_at = [&](int dirfd, FilePath file_path, std::string_view data) noexcept {
        auto fd = openat(dirfd, file_path, O_WRONLY | O_TRUNC | O_CLOEXEC);
        if (fd == -1) {
            die_with_error("openat(", file_path, ")");
        }
        if (write_all(fd, data) != data.size()) {
            die_with_error("write(", file_path, ")");
        }
        if (close(fd)) {
            die_with_error("close()");
        }
    };
    auto setup_user_namespace = [&](const Args::LinuxNamespaces::User& user_ns,
                                    int proc_dirfd) noexcept {
        write_file_at(
            proc_dirfd,
            "self/uid_map",
            noexcept_concat(user_ns.inside_uid, ' ', user_ns.outside_uid, " 1")
        );
        write_file_at(proc_dirfd, "self/setgroups", "deny");
        write_file_at(
            proc_dirfd,
            "self/gid_map",
            noexcept_concat(user_ns.inside_gid, ' ', user_ns.outside_gid, " 1")
        );
        if (close(proc_dirfd)) {
            die_with_error("close()");
        }
    };
    auto setup_std_fds = [&]() noexcept {
        auto setup_fd = [&](std::optional<int> fd, int std_fd) noexcept {
            if (!fd) {
                if (close(std_fd) && errno != EBADF) {
                    die_with_error("close()");
                }
            } else if (*fd != std_fd && dup3(*fd, std_fd, 0) < 0) {
                die_with_error("dup3()");
            }
        };
        setup_fd(args.stdin_fd, STDIN_FILENO);
        setup_fd(args.stdout_fd, STDOUT_FILENO);
        setup_fd(args.stderr_fd, STDERR_FILENO);
    };
    auto change_working_directory = [&]() noexcept {
        if (chdir(args.working_directory)) {
            int errnum = errno;
            die_with_msg(
                Stage::SPAWN, errnum, "chdir(", args.working_directory, ")", errmsg(errnum)
            );
        }
    };
    auto drop_all_capabilities_and_prevent_gaining_any_of_them = [&]() noexcept {
        // Executing a set-user-ID-root program or having uid 0 will not grant capabilities
        if (prctl(PR_SET_SECUREBITS, SECBIT_NOROOT | SECBIT_NOROOT_LOCKED, 0, 0, 0)) {
            die_with_error("prctl(PR_SET_SECUREBITS)");
        }
        if (cap_set_proc(args.empty_caps)) {
            die_with_error("cap_set_proc()");
        }
        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0)) {
            die_with_error("prctl(PR_SET_NO_NEW_PRIVS)");
        }
    };

    exclude_pid1_from_tracee_session_and_process_group();
    setup_user_namespace(args.linux_namespaces.user, args.proc_dirfd);
    setup_std_fds();
    change_working_directory();
    drop_all_capabilities_and_prevent_gaining_any_of_them();
    // Only the standard streams are inherited by the executed program
    if (close_range(3, ~0U, CLOSE_RANGE_CLOEXEC)) {
        die_with_error("close_range()");
    }

    if (args.argv.empty() || args.argv.back() != nullptr) {
        die_with_msg(
            Stage::INTERNAL, 0, "BUG: argv array does not contain nullptr as the last element"
        );
    }
    if (args.env.empty() || args.env.back() != nullptr) {
        die_with_msg(
            Stage::INTERNAL, 0, "BUG: env array does not contain nullptr as the last element"
        );
    }

    execve(args.executable, args.argv.data(), args.env.data());
    int errnum = errno;
    die_with_msg(Stage::SPAWN, errnum, "execve(", args.executable, ")", errmsg(errnum));
}

} // namespace sandbox::tracee
