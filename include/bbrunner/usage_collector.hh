#pragma once

#include <bbrunner/run_request.hh>
#include <bbrunner/sandbox/cgroups.hh>
#include <chrono>
#include <cstdint>

namespace bbrunner {

class UsageCollector {
public:
    struct Collected {
        ResourceUsage usage;
        uint64_t oom_kill_count; // processes killed for exceeding the memory ceiling
    };

    // Reads the accounting of the whole process tree; call it only after every process of the
    // tree has exited. Throws RunError INTERNAL on error.
    static Collected
    collect(const sandbox::cgroups::RequestCgroup& cgroup, std::chrono::nanoseconds wall_time);
};

} // namespace bbrunner
