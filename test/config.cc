#include <algorithm>
#include <bbrunner/config.hh>
#include <bbrunner/config_file.hh>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using bbrunner::SandboxConfig;
using std::string;
using std::string_view;
using std::vector;

namespace {

string error_of(string config) {
    try {
        (void)SandboxConfig::load_from_string(std::move(config));
    } catch (const std::runtime_error& e) {
        string_view msg = e.what();
        return string{msg.substr(0, msg.find(" (thrown at "))};
    }
    return "no error";
}

} // namespace

// NOLINTNEXTLINE
TEST(config, defaults) {
    auto config = SandboxConfig::load_from_string(R"(
build_directory_path: /worker/build/
memory_max: 1073741824
)");
    EXPECT_EQ(config.build_directory_path, "/worker/build");
    EXPECT_EQ(config.listen_path, "");
    EXPECT_EQ(config.num_cpus, std::max(std::thread::hardware_concurrency(), 1U));
    EXPECT_EQ(config.memory_max_in_bytes, 1073741824);
    EXPECT_EQ(config.rw_paths, (vector<string>{"/dev", "/proc", "/tmp"}));
    EXPECT_EQ(config.max_processes, std::nullopt);
    EXPECT_EQ(config.cgroup_path, "");
    EXPECT_EQ(config.termination_grace_period, std::chrono::milliseconds{2000});
    EXPECT_EQ(config.log_file, "");
    EXPECT_EQ(config.error_log_file, "");
}

// NOLINTNEXTLINE
TEST(config, all_variables) {
    auto config = SandboxConfig::load_from_string(R"(
build_directory_path: /worker/build
listen_path: /run/runner.sock
num_cpus: 3
memory_max: 2048
rw_paths: [/dev/, /scratch]
max_processes: 64
cgroup_path: /sys/fs/cgroup/runner.scope/
termination_grace_period: 500
log_file: /var/log/runner.log
error_log_file: '/var/log/runner error.log'
unknown_variable: ignored
)");
    EXPECT_EQ(config.build_directory_path, "/worker/build");
    EXPECT_EQ(config.listen_path, "/run/runner.sock");
    EXPECT_EQ(config.num_cpus, 3);
    EXPECT_EQ(config.memory_max_in_bytes, 2048);
    EXPECT_EQ(config.rw_paths, (vector<string>{"/dev", "/scratch"}));
    EXPECT_EQ(config.max_processes, 64);
    EXPECT_EQ(config.cgroup_path, "/sys/fs/cgroup/runner.scope");
    EXPECT_EQ(config.termination_grace_period, std::chrono::milliseconds{500});
    EXPECT_EQ(config.log_file, "/var/log/runner.log");
    EXPECT_EQ(config.error_log_file, "/var/log/runner error.log");
}

// NOLINTNEXTLINE
TEST(config, zero_means_default) {
    auto config = SandboxConfig::load_from_string(
        "build_directory_path: /b\nmemory_max: 1\nnum_cpus: 0\nmax_processes: 0\nrw_paths: []\n"
    );
    EXPECT_GT(config.num_cpus, 0);
    EXPECT_EQ(config.max_processes, std::nullopt);
    EXPECT_EQ(config.rw_paths, vector<string>{});
}

// NOLINTNEXTLINE
TEST(config, invalid_values) {
    EXPECT_EQ(error_of("memory_max: 1\n"), "config: variable `build_directory_path` is not set");
    EXPECT_EQ(
        error_of("build_directory_path: build\nmemory_max: 1\n"),
        "config: variable `build_directory_path` has to be an absolute path, got: build"
    );
    EXPECT_EQ(error_of("build_directory_path: /b\n"), "config: variable `memory_max` is not set");
    EXPECT_EQ(
        error_of("build_directory_path: /b\nmemory_max: 0\n"),
        "config: variable `memory_max` has to be positive"
    );
    EXPECT_EQ(
        error_of("build_directory_path: /b\nmemory_max: 1G\n"),
        "config: variable `memory_max` has invalid value: 1G"
    );
    EXPECT_EQ(
        error_of("build_directory_path: /b\nmemory_max: 1\nnum_cpus: -1\n"),
        "config: variable `num_cpus` has invalid value: -1"
    );
    EXPECT_EQ(
        error_of("build_directory_path: /b\nmemory_max: 1\nrw_paths: /tmp\n"),
        "config: variable `rw_paths` has to be an array"
    );
    EXPECT_EQ(
        error_of("build_directory_path: /b\nmemory_max: 1\nrw_paths: [tmp]\n"),
        "config: variable `rw_paths` has to be an absolute path, got: tmp"
    );
    EXPECT_EQ(
        error_of("build_directory_path: [/b]\nmemory_max: 1\n"),
        "config: variable `build_directory_path` cannot be specified as an array"
    );
}

// NOLINTNEXTLINE
TEST(config, parse_error_propagates) {
    EXPECT_THROW(
        (void)SandboxConfig::load_from_string("build_directory_path /b\n"), ConfigFile::ParseError
    );
}
