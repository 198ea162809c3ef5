#pragma once

#include <bbrunner/concat_tostr.hh>
#include <bbrunner/run_request.hh>
#include <cerrno>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace bbrunner {

// Failure of a single request
class RunError : public std::runtime_error {
public:
    enum class Code {
        INVALID_ARGUMENT,
        NOT_FOUND,
        SANDBOX_SETUP_ERROR,
        RESOURCE_LIMIT_ERROR,
        DEADLINE_EXCEEDED,
        CANCELLED,
        INTERNAL,
    };

private:
    Code code_;
    std::optional<ResourceUsage> usage_;

public:
    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    explicit RunError(Code code, Args&&... msg)
    : runtime_error(concat_tostr(std::forward<Args>(msg)...))
    , code_(code) {}

    RunError(const RunError&) = default;
    RunError(RunError&&) noexcept = default;
    RunError& operator=(const RunError&) = default;
    RunError& operator=(RunError&&) noexcept = default;
    ~RunError() override = default;

    [[nodiscard]] Code code() const noexcept { return code_; }

    // Set iff the failure happened after the command had been started
    [[nodiscard]] const std::optional<ResourceUsage>& usage() const noexcept { return usage_; }

    RunError&& with_usage(ResourceUsage usage) && noexcept {
        usage_ = usage;
        return std::move(*this);
    }
};

// Classifies a failure of opening or executing a caller-supplied path
constexpr RunError::Code error_code_of_errno(int errnum) noexcept {
    switch (errnum) {
    case ENOENT:
    case ENOTDIR: return RunError::Code::NOT_FOUND;
    case EACCES:
    case EPERM:
    case EISDIR:
    case ENOEXEC:
    case ELOOP:
    case ENAMETOOLONG: return RunError::Code::INVALID_ARGUMENT;
    default: return RunError::Code::INTERNAL;
    }
}

constexpr const char* to_str(RunError::Code code) noexcept {
    switch (code) {
    case RunError::Code::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
    case RunError::Code::NOT_FOUND: return "NOT_FOUND";
    case RunError::Code::SANDBOX_SETUP_ERROR: return "SANDBOX_SETUP_ERROR";
    case RunError::Code::RESOURCE_LIMIT_ERROR: return "RESOURCE_LIMIT_ERROR";
    case RunError::Code::DEADLINE_EXCEEDED: return "DEADLINE_EXCEEDED";
    case RunError::Code::CANCELLED: return "CANCELLED";
    case RunError::Code::INTERNAL: return "INTERNAL";
    }
    return "UNKNOWN";
}

} // namespace bbrunner
