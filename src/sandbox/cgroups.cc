#include <algorithm>
#include <bbrunner/concat_tostr.hh>
#include <bbrunner/errmsg.hh>
#include <bbrunner/file_contents.hh>
#include <bbrunner/file_perms.hh>
#include <bbrunner/logger.hh>
#include <bbrunner/macros/throw.hh>
#include <bbrunner/sandbox/cgroups.hh>
#include <bbrunner/string_transform.hh>
#include <cerrno>
#include <exception>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

using std::optional;
using std::string;
using std::string_view;

namespace {

constexpr const char* pid1_cgroup_name = "pid1";
constexpr const char* tracee_cgroup_name = "tracee";
constexpr const char* controllers = "+pids +memory +cpu";

void write_file_at(int dirfd, FilePath path, string_view data) {
    FileDescriptor fd{openat(dirfd, path, O_WRONLY | O_CLOEXEC)};
    if (!fd.is_open()) {
        THROW("openat(", path, ")", errmsg());
    }
    if (write_all(fd, data) != data.size()) {
        THROW("write(", path, ")", errmsg());
    }
    if (fd.close()) {
        THROW("close(", path, ")", errmsg());
    }
}

FileDescriptor open_dir_at(int dirfd, FilePath path) {
    FileDescriptor fd{openat(dirfd, path, O_RDONLY | O_DIRECTORY | O_CLOEXEC)};
    if (!fd.is_open()) {
        THROW("openat(", path, ")", errmsg());
    }
    return fd;
}

void mkdir_at(int dirfd, FilePath path) {
    if (mkdirat(dirfd, path, S_0755)) {
        THROW("mkdirat(", path, ")", errmsg());
    }
}

// Cgroup directory may stay busy for a moment after its last process died
void rmdir_at(int dirfd, FilePath path) {
    for (int attempt = 0;; ++attempt) {
        if (unlinkat(dirfd, path, AT_REMOVEDIR) == 0 || errno == ENOENT) {
            return;
        }
        if (errno != EBUSY || attempt == 100) {
            THROW("rmdir(", path, ")", errmsg());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{1});
    }
}

// Returns the value of the "@p key <value>" line
optional<string_view> find_keyed_value(string_view contents, string_view key) {
    while (!contents.empty()) {
        auto line = contents.substr(0, contents.find('\n'));
        contents.remove_prefix(std::min(contents.size(), line.size() + 1));
        if (has_prefix(line, key) && line.size() > key.size() && line[key.size()] == ' ') {
            return line.substr(key.size() + 1);
        }
    }
    return std::nullopt;
}

uint64_t read_keyed_number_at(int dirfd, FilePath path, string_view key) {
    auto contents = get_file_contents_at(dirfd, path);
    auto value = find_keyed_value(contents, key);
    if (!value) {
        THROW("missing '", key, "' in ", path);
    }
    auto num = str2num<uint64_t>(*value);
    if (!num) {
        THROW("invalid value of '", key, "' in ", path, ": ", *value);
    }
    return *num;
}

string current_process_cgroup_path() {
    // In cgroup v2 the only line is "0::<path>"
    auto contents = get_file_contents("/proc/self/cgroup");
    for (string_view data = contents; !data.empty();) {
        auto line = data.substr(0, data.find('\n'));
        data.remove_prefix(std::min(data.size(), line.size() + 1));
        if (has_prefix(line, "0::")) {
            line.remove_prefix(3);
            return concat_tostr("/sys/fs/cgroup", line == "/" ? "" : line);
        }
    }
    THROW("cgroup v2 entry not found in /proc/self/cgroup");
}

// Moves every process of the cgroup @p dirfd to its child cgroup @p leaf_name
void move_all_processes_to_leaf(int dirfd, FilePath leaf_name) {
    auto leaf_procs_path = concat_tostr(leaf_name, "/cgroup.procs");
    // New processes may be forked in the meantime
    for (int iter = 0; iter < 16; ++iter) {
        auto procs = get_file_contents_at(dirfd, "cgroup.procs");
        if (procs.empty()) {
            return;
        }
        for (string_view data = procs; !data.empty();) {
            auto pid = data.substr(0, data.find('\n'));
            data.remove_prefix(std::min(data.size(), pid.size() + 1));
            FileDescriptor fd{openat(dirfd, leaf_procs_path.c_str(), O_WRONLY | O_CLOEXEC)};
            if (!fd.is_open()) {
                THROW("openat(", leaf_procs_path, ")", errmsg());
            }
            // ESRCH: the process has already exited
            if (write_all(fd, pid) != pid.size() && errno != ESRCH) {
                THROW("write(", leaf_procs_path, ")", errmsg());
            }
        }
    }
    THROW("cannot move all processes out of the cgroup: processes keep appearing");
}

void kill_and_wait_until_empty(int cgroup_dirfd, std::chrono::milliseconds timeout) {
    write_file_at(cgroup_dirfd, "cgroup.kill", "1");
    FileDescriptor events_fd{openat(cgroup_dirfd, "cgroup.events", O_RDONLY | O_CLOEXEC)};
    if (!events_fd.is_open()) {
        THROW("openat(cgroup.events)", errmsg());
    }
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        if (lseek(events_fd, 0, SEEK_SET) < 0) {
            THROW("lseek(cgroup.events)", errmsg());
        }
        auto contents = get_file_contents(events_fd);
        if (find_keyed_value(contents, "populated") == "0") {
            return;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()
        );
        if (remaining.count() <= 0) {
            THROW("processes survived cgroup.kill");
        }
        // cgroup.events signals modification with POLLPRI
        pollfd pfd = {
            .fd = events_fd,
            .events = POLLPRI,
            .revents = 0,
        };
        int rc = poll(&pfd, 1, static_cast<int>(std::min(remaining.count(), int64_t{100})));
        if (rc < 0 && errno != EINTR) {
            THROW("poll()", errmsg());
        }
    }
}

} // namespace

namespace sandbox::cgroups {

CgroupRoot::CgroupRoot(string path) : path_{path.empty() ? current_process_cgroup_path() : path} {
    dirfd_ = open_dir_at(AT_FDCWD, path_);

    if (current_process_cgroup_path() == path_) {
        // Processes are not allowed in a cgroup that distributes controllers to its children
        if (mkdirat(dirfd_, service_cgroup_name, S_0755) && errno != EEXIST) {
            THROW("mkdirat(", service_cgroup_name, ")", errmsg());
        }
        move_all_processes_to_leaf(dirfd_, service_cgroup_name);
    }
    write_file_at(dirfd_, "cgroup.subtree_control", controllers);
}

RequestCgroup CgroupRoot::create_request_cgroup(string_view name) {
    RequestCgroup cg{dirfd_, string{name}};
    if (mkdirat(dirfd_, cg.name_.c_str(), S_0755)) {
        if (errno != EEXIST) {
            THROW("mkdirat(", name, ")", errmsg());
        }
        stdlog("removing stale cgroup ", path_, '/', name);
        {
            auto stale_fd = open_dir_at(dirfd_, cg.name_);
            kill_and_wait_until_empty(stale_fd, std::chrono::seconds{10});
            rmdir_at(stale_fd, pid1_cgroup_name);
            rmdir_at(stale_fd, tracee_cgroup_name);
        }
        rmdir_at(dirfd_, cg.name_);
        mkdir_at(dirfd_, cg.name_);
    }

    cg.dirfd_ = open_dir_at(dirfd_, cg.name_);
    write_file_at(cg.dirfd_, "cgroup.subtree_control", controllers);
    mkdir_at(cg.dirfd_, pid1_cgroup_name);
    mkdir_at(cg.dirfd_, tracee_cgroup_name);
    cg.pid1_dirfd_ = open_dir_at(cg.dirfd_, pid1_cgroup_name);
    cg.tracee_dirfd_ = open_dir_at(cg.dirfd_, tracee_cgroup_name);
    return cg;
}

RequestCgroup::~RequestCgroup() { destroy(); }

void RequestCgroup::destroy() noexcept {
    if (!dirfd_.is_open()) {
        return;
    }
    try {
        pid1_dirfd_.reset(-1);
        tracee_dirfd_.reset(-1);
        rmdir_at(dirfd_, pid1_cgroup_name);
        rmdir_at(dirfd_, tracee_cgroup_name);
        dirfd_.reset(-1);
        rmdir_at(root_dirfd_, name_);
    } catch (const std::exception& e) {
        // Removed as stale on the next use of the name
        errlog("cannot remove cgroup ", name_, ": ", e.what());
    }
}

void RequestCgroup::set_memory_max(optional<uint64_t> memory_max_in_bytes) {
    write_file_at(
        tracee_dirfd_,
        "memory.max",
        memory_max_in_bytes ? string_view{to_string(*memory_max_in_bytes)} : "max"
    );
}

void RequestCgroup::set_swap_max(uint64_t swap_max_in_bytes) {
    // memory.swap.max is absent if the kernel does not account swap
    if (faccessat(tracee_dirfd_, "memory.swap.max", F_OK, 0) && errno == ENOENT) {
        return;
    }
    write_file_at(tracee_dirfd_, "memory.swap.max", to_string(swap_max_in_bytes));
}

void RequestCgroup::set_oom_group(bool kill_all_on_oom) {
    write_file_at(tracee_dirfd_, "memory.oom.group", kill_all_on_oom ? "1" : "0");
}

void RequestCgroup::set_cpu_max(uint64_t max_usec, uint64_t period_usec) {
    write_file_at(tracee_dirfd_, "cpu.max", concat_tostr(max_usec, ' ', period_usec));
}

void RequestCgroup::set_pids_max(optional<uint32_t> pids_max) {
    write_file_at(tracee_dirfd_, "pids.max", pids_max ? string_view{to_string(*pids_max)} : "max");
}

void RequestCgroup::kill() { write_file_at(dirfd_, "cgroup.kill", "1"); }

void RequestCgroup::wait_until_empty(std::chrono::milliseconds timeout) {
    kill_and_wait_until_empty(dirfd_, timeout);
}

CpuTimes RequestCgroup::read_cpu_times() const {
    auto contents = get_file_contents_at(tracee_dirfd_, "cpu.stat");
    auto parse = [&](string_view key) {
        auto value = find_keyed_value(contents, key);
        if (!value) {
            THROW("missing '", key, "' in cpu.stat");
        }
        auto num = str2num<uint64_t>(*value);
        if (!num) {
            THROW("invalid value of '", key, "' in cpu.stat: ", *value);
        }
        return *num;
    };
    return {
        .user_usec = parse("user_usec"),
        .system_usec = parse("system_usec"),
    };
}

uint64_t RequestCgroup::read_peak_memory_in_bytes() const {
    FileDescriptor fd{openat(tracee_dirfd_, "memory.peak", O_RDONLY | O_CLOEXEC)};
    if (!fd.is_open()) {
        if (errno == ENOENT) {
            return 0;
        }
        THROW("openat(memory.peak)", errmsg());
    }
    auto contents = get_file_contents(fd);
    while (!contents.empty() && contents.back() == '\n') {
        contents.pop_back();
    }
    auto num = str2num<uint64_t>(contents);
    if (!num) {
        THROW("invalid contents of memory.peak: ", contents);
    }
    return *num;
}

uint64_t RequestCgroup::read_oom_kill_count() const {
    return read_keyed_number_at(tracee_dirfd_, "memory.events", "oom_kill");
}

} // namespace sandbox::cgroups
