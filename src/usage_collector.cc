#include <bbrunner/run_error.hh>
#include <bbrunner/usage_collector.hh>
#include <exception>

namespace bbrunner {

UsageCollector::Collected UsageCollector::collect(
    const sandbox::cgroups::RequestCgroup& cgroup, std::chrono::nanoseconds wall_time
) {
    try {
        auto cpu_times = cgroup.read_cpu_times();
        return {
            .usage =
                {
                    .user_cpu_time = std::chrono::microseconds{cpu_times.user_usec},
                    .system_cpu_time = std::chrono::microseconds{cpu_times.system_usec},
                    .peak_memory_in_bytes = cgroup.read_peak_memory_in_bytes(),
                    .wall_time = wall_time,
                },
            .oom_kill_count = cgroup.read_oom_kill_count(),
        };
    } catch (const std::exception& e) {
        throw RunError(
            RunError::Code::INTERNAL,
            "cannot collect resource usage of cgroup ",
            cgroup.name(),
            ": ",
            e.what()
        );
    }
}

} // namespace bbrunner
