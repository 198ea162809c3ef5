#include <bbrunner/errmsg.hh>
#include <bbrunner/file_perms.hh>
#include <bbrunner/output_capture.hh>
#include <bbrunner/run_error.hh>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace {

FileDescriptor create_output_file(const std::string& path) {
    FileDescriptor fd{path, O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, S_0644};
    if (!fd.is_open()) {
        int errnum = errno;
        throw bbrunner::RunError(
            bbrunner::error_code_of_errno(errnum),
            "cannot create output file ",
            path,
            errmsg(errnum)
        );
    }
    return fd;
}

} // namespace

namespace bbrunner {

OutputCapture::OutputCapture(const std::string& stdout_path, const std::string& stderr_path)
: stdout_fd_{create_output_file(stdout_path)} {
    if (stderr_path != stdout_path) {
        stderr_fd_ = create_output_file(stderr_path);
        return;
    }
    // Shared file offset keeps both streams from overwriting each other
    stderr_fd_.reset(fcntl(stdout_fd_, F_DUPFD_CLOEXEC, 0));
    if (!stderr_fd_.is_open()) {
        throw RunError(RunError::Code::INTERNAL, "fcntl(F_DUPFD_CLOEXEC)", errmsg());
    }
}

} // namespace bbrunner
