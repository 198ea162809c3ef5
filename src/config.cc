#include <algorithm>
#include <bbrunner/config.hh>
#include <bbrunner/config_file.hh>
#include <bbrunner/file_contents.hh>
#include <bbrunner/macros/throw.hh>
#include <iterator>
#include <thread>
#include <utility>

using std::string;
using std::string_view;

namespace {

constexpr const char* default_rw_paths[] = {"/dev", "/proc", "/tmp"};

const ConfigFile::Variable& get_single_value(const ConfigFile& cf, string_view name) {
    const auto& var = cf[name];
    if (var.is_array()) {
        THROW("config: variable `", name, "` cannot be specified as an array");
    }
    return var;
}

template <class T>
std::optional<T> get_number(const ConfigFile& cf, string_view name) {
    const auto& var = get_single_value(cf, name);
    if (!var.is_set()) {
        return std::nullopt;
    }
    auto num = var.as<T>();
    if (!num) {
        THROW("config: variable `", name, "` has invalid value: ", var.as_string());
    }
    return num;
}

string normalize_absolute_path(string_view name, string path) {
    if (path.empty() || path.front() != '/') {
        THROW("config: variable `", name, "` has to be an absolute path, got: ", path);
    }
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

bbrunner::SandboxConfig load_from(const ConfigFile& cf) {
    bbrunner::SandboxConfig config;

    const auto& build_dir = get_single_value(cf, "build_directory_path");
    if (!build_dir.is_set()) {
        THROW("config: variable `build_directory_path` is not set");
    }
    config.build_directory_path =
        normalize_absolute_path("build_directory_path", build_dir.as_string());

    config.listen_path = get_single_value(cf, "listen_path").as_string();

    config.num_cpus = get_number<uint32_t>(cf, "num_cpus").value_or(0);
    if (config.num_cpus == 0) {
        config.num_cpus = std::max(std::thread::hardware_concurrency(), 1U);
    }

    auto memory_max = get_number<uint64_t>(cf, "memory_max");
    if (!memory_max) {
        THROW("config: variable `memory_max` is not set");
    }
    if (*memory_max == 0) {
        THROW("config: variable `memory_max` has to be positive");
    }
    config.memory_max_in_bytes = *memory_max;

    const auto& rw_paths = cf["rw_paths"];
    if (!rw_paths.is_set()) {
        config.rw_paths.assign(std::begin(default_rw_paths), std::end(default_rw_paths));
    } else if (!rw_paths.is_array()) {
        THROW("config: variable `rw_paths` has to be an array");
    } else {
        for (const auto& path : rw_paths.as_array()) {
            config.rw_paths.emplace_back(normalize_absolute_path("rw_paths", path));
        }
    }

    auto max_processes = get_number<uint32_t>(cf, "max_processes").value_or(0);
    if (max_processes > 0) {
        config.max_processes = max_processes;
    }

    const auto& cgroup_path = get_single_value(cf, "cgroup_path");
    if (!cgroup_path.as_string().empty()) {
        config.cgroup_path = normalize_absolute_path("cgroup_path", cgroup_path.as_string());
    }

    config.termination_grace_period = std::chrono::milliseconds{
        get_number<uint32_t>(cf, "termination_grace_period").value_or(2000)
    };

    config.log_file = get_single_value(cf, "log_file").as_string();
    config.error_log_file = get_single_value(cf, "error_log_file").as_string();
    return config;
}

ConfigFile make_config_file() {
    ConfigFile cf;
    cf.add_vars(
        "build_directory_path",
        "listen_path",
        "num_cpus",
        "memory_max",
        "rw_paths",
        "max_processes",
        "cgroup_path",
        "termination_grace_period",
        "log_file",
        "error_log_file"
    );
    return cf;
}

} // namespace

namespace bbrunner {

SandboxConfig SandboxConfig::load(FilePath config_file_path) {
    return load_from_string(get_file_contents(config_file_path));
}

SandboxConfig SandboxConfig::load_from_string(string config) {
    auto cf = make_config_file();
    cf.load_config_from_string(std::move(config));
    return load_from(cf);
}

} // namespace bbrunner
