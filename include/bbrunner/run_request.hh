#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bbrunner {

struct RunRequest {
    // The first element names the executable
    std::vector<std::string> arguments;
    std::map<std::string, std::string> environment_variables;
    std::string working_directory; // relative to input_root_directory
    std::string stdout_path; // relative to working_directory
    std::string stderr_path; // relative to working_directory
    // The three below are relative to the build directory or absolute paths inside it
    std::string input_root_directory;
    std::string temporary_directory;
    std::string server_logs_directory;
    std::optional<std::chrono::nanoseconds> timeout;
};

struct ResourceUsage {
    std::chrono::microseconds user_cpu_time{0};
    std::chrono::microseconds system_cpu_time{0};
    uint64_t peak_memory_in_bytes = 0;
    std::chrono::nanoseconds wall_time{0};
};

struct RunResponse {
    // Exactly one of these is set
    std::optional<int> exit_code;
    std::optional<int> termination_signal;

    ResourceUsage usage;

    enum class Outcome {
        COMPLETED,
        TIMED_OUT,
        CANCELLED,
        MEMORY_LIMIT_EXCEEDED,
    } outcome;
};

constexpr const char* to_str(RunResponse::Outcome outcome) noexcept {
    switch (outcome) {
    case RunResponse::Outcome::COMPLETED: return "COMPLETED";
    case RunResponse::Outcome::TIMED_OUT: return "TIMED_OUT";
    case RunResponse::Outcome::CANCELLED: return "CANCELLED";
    case RunResponse::Outcome::MEMORY_LIMIT_EXCEEDED: return "MEMORY_LIMIT_EXCEEDED";
    }
    return "UNKNOWN";
}

} // namespace bbrunner
