#pragma once

#include <bbrunner/file_descriptor.hh>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace sandbox::cgroups {

struct CpuTimes {
    uint64_t user_usec;
    uint64_t system_usec;
};

class RequestCgroup;

// Delegated cgroup v2 subtree in which the per-request cgroups are created
class CgroupRoot {
    std::string path_;
    FileDescriptor dirfd_;

public:
    static constexpr const char* service_cgroup_name = "service";

    // Uses cgroup @p path or, if it is empty, the cgroup of the current process. If the current
    // process resides in the chosen cgroup, it is moved to its "service" leaf so that controllers
    // can be enabled for the subtree. Throws on error.
    explicit CgroupRoot(std::string path = {});

    CgroupRoot(const CgroupRoot&) = delete;
    CgroupRoot(CgroupRoot&&) = delete;
    CgroupRoot& operator=(const CgroupRoot&) = delete;
    CgroupRoot& operator=(CgroupRoot&&) = delete;
    ~CgroupRoot() = default;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    // Creates cgroup @p name with leaves "pid1" and "tracee". A stale cgroup of the same name is
    // killed and removed first. Throws on error.
    [[nodiscard]] RequestCgroup create_request_cgroup(std::string_view name);
};

// Cgroup of a single request: pid1 lives in the "pid1" leaf and the process tree in the "tracee"
// leaf. All limits and accounting apply to the "tracee" leaf. Removed on destruction.
class RequestCgroup {
    int root_dirfd_;
    std::string name_;
    FileDescriptor dirfd_;
    FileDescriptor pid1_dirfd_;
    FileDescriptor tracee_dirfd_;

    RequestCgroup(int root_dirfd, std::string name) noexcept
    : root_dirfd_{root_dirfd}
    , name_{std::move(name)} {}

    void destroy() noexcept;

public:
    RequestCgroup(const RequestCgroup&) = delete;
    RequestCgroup(RequestCgroup&&) noexcept = default;
    RequestCgroup& operator=(const RequestCgroup&) = delete;
    RequestCgroup& operator=(RequestCgroup&&) = delete;
    ~RequestCgroup();

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] int pid1_cgroup_fd() const noexcept { return pid1_dirfd_; }

    [[nodiscard]] int tracee_cgroup_fd() const noexcept { return tracee_dirfd_; }

    // Throws on error
    void set_memory_max(std::optional<uint64_t> memory_max_in_bytes);
    void set_swap_max(uint64_t swap_max_in_bytes);
    void set_oom_group(bool kill_all_on_oom);
    void set_cpu_max(uint64_t max_usec, uint64_t period_usec);
    void set_pids_max(std::optional<uint32_t> pids_max);

    // Kills every process in the request cgroup. Throws on error.
    void kill();

    // Waits until no process resides in the request cgroup. Throws on error or if @p timeout
    // passes.
    void wait_until_empty(std::chrono::milliseconds timeout);

    [[nodiscard]] CpuTimes read_cpu_times() const;

    // Returns 0 if the kernel does not provide memory.peak
    [[nodiscard]] uint64_t read_peak_memory_in_bytes() const;

    [[nodiscard]] uint64_t read_oom_kill_count() const;

    friend class CgroupRoot;
};

} // namespace sandbox::cgroups
