#pragma once

#include <bbrunner/file_path.hh>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bbrunner {

// Process-wide configuration, immutable once loaded
struct SandboxConfig {
    std::string build_directory_path; // absolute, without a trailing slash
    std::string listen_path;
    uint32_t num_cpus = 0; // never 0 once loaded
    uint64_t memory_max_in_bytes = 0;
    std::vector<std::string> rw_paths; // absolute paths
    std::optional<uint32_t> max_processes;
    std::string cgroup_path; // empty means the cgroup of the current process
    std::chrono::milliseconds termination_grace_period{2000};
    std::string log_file; // empty means stderr
    std::string error_log_file; // empty means stderr

    // Throws on I/O error, on parse error and on invalid or missing values
    static SandboxConfig load(FilePath config_file_path);

    // Throws on parse error and on invalid or missing values
    static SandboxConfig load_from_string(std::string config);
};

} // namespace bbrunner
