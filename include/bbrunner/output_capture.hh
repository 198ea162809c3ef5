#pragma once

#include <bbrunner/file_descriptor.hh>
#include <string>

namespace bbrunner {

// Files receiving the standard output and the standard error of the process tree
class OutputCapture {
    FileDescriptor stdout_fd_;
    FileDescriptor stderr_fd_;

public:
    // Creates or truncates @p stdout_path and @p stderr_path (absolute and already validated).
    // The final path component may not be a symlink. If both paths are equal, the file is opened
    // once and shared. Throws RunError on error.
    OutputCapture(const std::string& stdout_path, const std::string& stderr_path);

    [[nodiscard]] int stdout_fd() const noexcept { return stdout_fd_; }

    [[nodiscard]] int stderr_fd() const noexcept { return stderr_fd_; }
};

} // namespace bbrunner
