#include <bbrunner/errmsg.hh>
#include <bbrunner/macros/throw.hh>
#include <bbrunner/sandbox/cancellation_token.hh>
#include <cerrno>
#include <cstdint>
#include <sys/eventfd.h>
#include <unistd.h>

namespace sandbox {

CancellationToken::CancellationToken() : event_fd_{eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK)} {
    if (!event_fd_.is_open()) {
        THROW("eventfd()", errmsg());
    }
}

void CancellationToken::cancel() noexcept {
    int saved_errno = errno;
    uint64_t val = 1;
    // EAGAIN means the counter is saturated, so the token is already cancelled
    (void)write(event_fd_, &val, sizeof(val));
    errno = saved_errno;
}

} // namespace sandbox
