#include <bbrunner/file_manip.hh>
#include <bbrunner/logger.hh>
#include <bbrunner/readiness_probe.hh>
#include <bbrunner/run_error.hh>

namespace bbrunner {

bool ReadinessProbe::check_readiness(std::string_view path) const {
    if (path.empty()) {
        return true;
    }
    try {
        return path_exists(build_dir_policy_.resolve_absolute_or_relative(path));
    } catch (const RunError& e) {
        stdlog("readiness: ", path, ": ", e.what());
        return false;
    }
}

} // namespace bbrunner
