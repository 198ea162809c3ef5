#pragma once

#include <optional>
#include <string>

namespace sandbox {

// Exit status of the root process of the sandboxed process tree
struct Si {
    int code; // siginfo_t::si_code from waitid()
    int status; // siginfo_t::si_status from waitid()

    // Exit code iff the process exited normally
    [[nodiscard]] std::optional<int> exit_code() const noexcept;

    // Signal number iff the process was terminated by a signal
    [[nodiscard]] std::optional<int> termination_signal() const noexcept;

    [[nodiscard]] std::string description() const;

    [[nodiscard]] bool operator==(const Si& other) const noexcept = default;
};

} // namespace sandbox
