#pragma once

#include <bbrunner/sandbox/cgroups.hh>
#include <cstdint>
#include <optional>

namespace bbrunner {

class ResourceLimiter {
public:
    static constexpr uint64_t cpu_period_usec = 100'000;

    struct Limits {
        uint64_t memory_max_in_bytes;
        uint32_t cpu_count; // 0 means the number of the host's cores
        std::optional<uint32_t> max_processes;
    };

    // Sets the limits of the process tree cgroup: exceeding the memory ceiling kills the whole
    // tree and the CPU bandwidth is capped at cpu_count cores. Has to be called before spawning.
    // Throws RunError RESOURCE_LIMIT_ERROR on error.
    static void apply(sandbox::cgroups::RequestCgroup& cgroup, const Limits& limits);
};

} // namespace bbrunner
