#include <bbrunner/concat_tostr.hh>
#include <bbrunner/sandbox/si.hh>
#include <cstring>
#include <sys/wait.h>

namespace sandbox {

std::optional<int> Si::exit_code() const noexcept {
    if (code == CLD_EXITED) {
        return status;
    }
    return std::nullopt;
}

std::optional<int> Si::termination_signal() const noexcept {
    if (code == CLD_KILLED || code == CLD_DUMPED) {
        return status;
    }
    return std::nullopt;
}

std::string Si::description() const {
    auto signal_description = [](const char* prefix, int signum) {
        const char* abbrev = sigabbrev_np(signum);
        const char* desc = sigdescr_np(signum);
        if (abbrev && desc) {
            return concat_tostr(prefix, " SIG", abbrev, " - ", desc);
        }
        return concat_tostr(prefix, " with number ", signum);
    };
    switch (code) {
    case CLD_EXITED: return concat_tostr("exited with ", status);
    case CLD_KILLED: return signal_description("killed by signal", status);
    case CLD_DUMPED: return signal_description("killed and dumped by signal", status);
    default: break;
    }
    return concat_tostr("unable to describe (code ", code, ", status ", status, ')');
}

} // namespace sandbox
