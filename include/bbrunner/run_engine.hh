#pragma once

#include <bbrunner/config.hh>
#include <bbrunner/cpu_slot_pool.hh>
#include <bbrunner/path_policy.hh>
#include <bbrunner/run_error.hh>
#include <bbrunner/run_request.hh>
#include <bbrunner/sandbox/cancellation_token.hh>
#include <bbrunner/sandbox/cgroups.hh>
#include <bbrunner/sandbox_builder.hh>

namespace bbrunner {

struct RunOptions {
    // Cancels the run once the command has been started
    const sandbox::CancellationToken* cancellation_token = nullptr;
};

// Runs requests in sandboxes; safe to use from many threads at once
class RunEngine {
    const SandboxConfig& config_;
    const SandboxBuilder& sandbox_builder_;
    PathPolicy build_dir_policy_;
    sandbox::cgroups::CgroupRoot cgroup_root_;
    CpuSlotPool cpu_slots_;

public:
    // @p config and @p sandbox_builder have to outlive the engine. Throws if @p config has no
    // cpus or no memory or if the cgroup subtree cannot be delegated.
    RunEngine(const SandboxConfig& config, const SandboxBuilder& sandbox_builder);

    RunEngine(const RunEngine&) = delete;
    RunEngine(RunEngine&&) = delete;
    RunEngine& operator=(const RunEngine&) = delete;
    RunEngine& operator=(RunEngine&&) = delete;
    ~RunEngine() = default;

    // Runs the command of @p request and waits until its whole process tree dies. A timeout or
    // a cancellation is reported in RunResponse::outcome. Throws RunError on failure.
    RunResponse run(const RunRequest& request, const RunOptions& options = {});
};

} // namespace bbrunner
