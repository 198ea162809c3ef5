#include <algorithm>
#include <bbrunner/resource_limiter.hh>
#include <bbrunner/run_error.hh>
#include <exception>
#include <thread>

namespace bbrunner {

void ResourceLimiter::apply(sandbox::cgroups::RequestCgroup& cgroup, const Limits& limits) {
    uint64_t cpu_count = limits.cpu_count;
    if (cpu_count == 0) {
        cpu_count = std::max(std::thread::hardware_concurrency(), 1U);
    }
    try {
        cgroup.set_memory_max(limits.memory_max_in_bytes);
        // Otherwise the memory ceiling only slows the tree down
        cgroup.set_swap_max(0);
        cgroup.set_oom_group(true);
        cgroup.set_cpu_max(cpu_count * cpu_period_usec, cpu_period_usec);
        cgroup.set_pids_max(limits.max_processes);
    } catch (const std::exception& e) {
        throw RunError(
            RunError::Code::RESOURCE_LIMIT_ERROR,
            "cannot set limits of cgroup ",
            cgroup.name(),
            ": ",
            e.what()
        );
    }
}

} // namespace bbrunner
