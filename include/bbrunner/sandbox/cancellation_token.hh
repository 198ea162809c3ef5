#pragma once

#include <bbrunner/file_descriptor.hh>

namespace sandbox {

// Cancellation flag that can be waited on with poll(2) alongside other file descriptors
class CancellationToken {
    FileDescriptor event_fd_;

public:
    // Throws on error
    CancellationToken();

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken(CancellationToken&&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;
    CancellationToken& operator=(CancellationToken&&) = delete;
    ~CancellationToken() = default;

    // Idempotent and async-signal-safe
    void cancel() noexcept;

    // Becomes readable (POLLIN) once cancel() is called
    [[nodiscard]] int pollable_fd() const noexcept { return event_fd_; }
};

} // namespace sandbox
