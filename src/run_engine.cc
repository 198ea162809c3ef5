#include <bbrunner/concat_tostr.hh>
#include <bbrunner/errmsg.hh>
#include <bbrunner/file_descriptor.hh>
#include <bbrunner/file_manip.hh>
#include <bbrunner/logger.hh>
#include <bbrunner/macros/throw.hh>
#include <bbrunner/output_capture.hh>
#include <bbrunner/resource_limiter.hh>
#include <bbrunner/run_engine.hh>
#include <bbrunner/sandbox/sandbox.hh>
#include <bbrunner/usage_collector.hh>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <exception>
#include <fcntl.h>
#include <optional>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <variant>
#include <vector>

using std::optional;
using std::string;
using std::string_view;
using std::vector;

namespace {

string join_relative(string_view dir, string_view path) {
    if (dir.empty()) {
        return string{path};
    }
    return concat_tostr(dir, '/', path);
}

bool is_executable_file(const string& path) noexcept {
    struct stat64 st;
    return stat64(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

// Looks up the executable the way a shell does, but relative PATH entries and, as the last
// resort, the bare name are anchored at the working directory
string find_executable(
    const bbrunner::PathPolicy& input_root_policy,
    const bbrunner::RunRequest& request,
    const string& working_dir
) {
    const auto& arg0 = request.arguments.front();
    if (arg0.front() == '/') {
        return arg0;
    }
    if (arg0.find('/') != string::npos) {
        return input_root_policy.resolve(join_relative(request.working_directory, arg0));
    }

    if (auto it = request.environment_variables.find("PATH");
        it != request.environment_variables.end())
    {
        for (string_view entries = it->second; !entries.empty();) {
            auto entry = entries.substr(0, entries.find(':'));
            entries.remove_prefix(std::min(entries.size(), entry.size() + 1));
            string dir;
            if (!entry.empty() && entry.front() == '/') {
                dir = entry;
            } else {
                try {
                    dir = input_root_policy.resolve(join_relative(request.working_directory, entry)
                    );
                } catch (const bbrunner::RunError&) {
                    continue; // entries escaping the input root are not searched
                }
            }
            auto candidate = concat_tostr(dir, dir == "/" ? "" : "/", arg0);
            if (is_executable_file(candidate)) {
                return candidate;
            }
        }
    }

    auto candidate = concat_tostr(working_dir, '/', arg0);
    if (path_exists(candidate)) {
        return candidate;
    }
    throw bbrunner::RunError(
        bbrunner::RunError::Code::NOT_FOUND, "executable not found: ", arg0
    );
}

void recreate_temporary_directory(const string& dir) {
    using bbrunner::RunError;
    if (remove_r(dir) && errno != ENOENT) {
        throw RunError(
            RunError::Code::SANDBOX_SETUP_ERROR, "cannot remove ", dir, errmsg()
        );
    }
    for (const auto* subdir : {"/tmp", "/home"}) {
        if (mkdir_r(concat_tostr(dir, subdir), S_0755)) {
            throw RunError(
                RunError::Code::SANDBOX_SETUP_ERROR, "cannot create ", dir, subdir, errmsg()
            );
        }
    }
}

vector<string> make_environment(
    const bbrunner::RunRequest& request, const string& tmp_dir, const string& home_dir
) {
    vector<string> env;
    for (const auto& [name, value] : request.environment_variables) {
        if (name.empty() || name.find('=') != string::npos) {
            throw bbrunner::RunError(
                bbrunner::RunError::Code::INVALID_ARGUMENT,
                "invalid environment variable name: ",
                name
            );
        }
        if (name == "TMP" || name == "TMPDIR" || name == "HOME") {
            continue;
        }
        env.emplace_back(concat_tostr(name, '=', value));
    }
    env.emplace_back(concat_tostr("TMP=", tmp_dir));
    env.emplace_back(concat_tostr("TMPDIR=", tmp_dir));
    env.emplace_back(concat_tostr("HOME=", home_dir));
    return env;
}

bbrunner::RunError::Code error_code_of(const sandbox::result::Error& err) noexcept {
    using Stage = sandbox::result::Error::Stage;
    using Code = bbrunner::RunError::Code;
    switch (err.stage) {
    case Stage::SETUP: return Code::SANDBOX_SETUP_ERROR;
    case Stage::SPAWN: return bbrunner::error_code_of_errno(err.errnum);
    case Stage::INTERNAL: return Code::INTERNAL;
    }
    return Code::INTERNAL;
}

bool overlap(const string& a, const string& b) {
    return bbrunner::PathPolicy{a}.contains(b) || bbrunner::PathPolicy{b}.contains(a);
}

// The temporary directory is removed recursively, so it must not hold anything else of the task
// nor of the other tasks
void check_temporary_directory(
    const string& temporary_dir,
    const string& build_dir,
    const string& input_root,
    const optional<string>& server_logs_dir
) {
    using bbrunner::RunError;
    if (temporary_dir == build_dir) {
        throw RunError(
            RunError::Code::INVALID_ARGUMENT, "temporary directory is the build directory"
        );
    }
    if (overlap(temporary_dir, input_root)) {
        throw RunError(
            RunError::Code::INVALID_ARGUMENT,
            "temporary directory ",
            temporary_dir,
            " overlaps the input root ",
            input_root
        );
    }
    if (server_logs_dir && overlap(temporary_dir, *server_logs_dir)) {
        throw RunError(
            RunError::Code::INVALID_ARGUMENT,
            "temporary directory ",
            temporary_dir,
            " overlaps the logs directory ",
            *server_logs_dir
        );
    }
}

const bbrunner::SandboxConfig& validated(const bbrunner::SandboxConfig& config) {
    if (config.num_cpus == 0) {
        THROW("num_cpus has to be positive");
    }
    if (config.memory_max_in_bytes == 0) {
        THROW("memory_max has to be positive");
    }
    return config;
}

template <class... Args>
void log_usage(Logger& logger, const bbrunner::ResourceUsage& usage, Args&&... prefix) {
    logger(
        std::forward<Args>(prefix)...,
        "usage: user ",
        usage.user_cpu_time.count(),
        " us, system ",
        usage.system_cpu_time.count(),
        " us, peak memory ",
        usage.peak_memory_in_bytes,
        " B, wall ",
        std::chrono::duration_cast<std::chrono::microseconds>(usage.wall_time).count(),
        " us"
    );
}

} // namespace

namespace bbrunner {

RunEngine::RunEngine(const SandboxConfig& config, const SandboxBuilder& sandbox_builder)
: config_{validated(config)}
, sandbox_builder_{sandbox_builder}
, build_dir_policy_{config.build_directory_path}
, cgroup_root_{config.cgroup_path}
, cpu_slots_{config.num_cpus} {
    stdlog(
        "engine: build directory ",
        build_dir_policy_.root(),
        ", cgroup ",
        cgroup_root_.path(),
        ", ",
        config.num_cpus,
        " cpu slots"
    );
}

RunResponse RunEngine::run(const RunRequest& request, const RunOptions& options) {
    if (request.arguments.empty() || request.arguments.front().empty()) {
        throw RunError(RunError::Code::INVALID_ARGUMENT, "missing executable in arguments");
    }

    auto input_root = build_dir_policy_.resolve_absolute_or_relative(request.input_root_directory);
    auto temporary_dir =
        build_dir_policy_.resolve_absolute_or_relative(request.temporary_directory);
    optional<string> server_logs_dir;
    if (!request.server_logs_directory.empty()) {
        server_logs_dir =
            build_dir_policy_.resolve_absolute_or_relative(request.server_logs_directory);
    }
    check_temporary_directory(
        temporary_dir, build_dir_policy_.root(), input_root, server_logs_dir
    );
    PathPolicy input_root_policy{input_root};
    auto working_dir = input_root_policy.resolve(request.working_directory);
    auto stdout_path =
        input_root_policy.resolve(join_relative(request.working_directory, request.stdout_path));
    auto stderr_path =
        input_root_policy.resolve(join_relative(request.working_directory, request.stderr_path));
    auto tmp_dir = concat_tostr(temporary_dir, "/tmp");
    auto home_dir = concat_tostr(temporary_dir, "/home");
    auto env = make_environment(request, tmp_dir, home_dir);

    if (!is_directory(input_root)) {
        throw RunError(
            RunError::Code::NOT_FOUND, "input root directory does not exist: ", input_root
        );
    }
    auto executable = find_executable(input_root_policy, request, working_dir);

    recreate_temporary_directory(temporary_dir);

    Logger task_log{static_cast<FILE*>(nullptr)};
    if (server_logs_dir) {
        auto log_path = concat_tostr(*server_logs_dir, "/runner.log");
        try {
            if (mkdir_r(*server_logs_dir, S_0755)) {
                THROW("mkdir_r(", *server_logs_dir, ")", errmsg());
            }
            task_log.open(log_path);
        } catch (const std::exception& e) {
            throw RunError(RunError::Code::INTERNAL, "cannot open task log: ", e.what());
        }
    }
    {
        auto entry = task_log("run: ", executable);
        for (size_t i = 1; i < request.arguments.size(); ++i) {
            entry(' ', request.arguments[i]);
        }
        entry("\n  working directory: ", working_dir);
        entry("\n  stdout: ", stdout_path, "\n  stderr: ", stderr_path);
        if (request.timeout) {
            entry(
                "\n  timeout: ",
                std::chrono::duration_cast<std::chrono::milliseconds>(*request.timeout).count(),
                " ms"
            );
        }
    }

    vector<string> task_areas = {input_root, tmp_dir, home_dir};
    auto sandbox_handle =
        sandbox_builder_.build(build_dir_policy_.root(), config_.rw_paths, task_areas);
    for (const auto& bind_mount : sandbox_handle.bind_mounts()) {
        task_log("mount: ", bind_mount.path, bind_mount.read_only ? " (read-only)" : " (writable)");
    }

    OutputCapture output{stdout_path, stderr_path};
    FileDescriptor dev_null{"/dev/null", O_RDONLY | O_CLOEXEC};
    if (!dev_null.is_open()) {
        throw RunError(RunError::Code::INTERNAL, "open(/dev/null)", errmsg());
    }

    auto cpu_slot = cpu_slots_.acquire();
    auto cgroup_name = concat_tostr("slot-", cpu_slot.slot());
    optional<sandbox::cgroups::RequestCgroup> cgroup;
    try {
        cgroup.emplace(cgroup_root_.create_request_cgroup(cgroup_name));
    } catch (const std::exception& e) {
        throw RunError(
            RunError::Code::RESOURCE_LIMIT_ERROR,
            "cannot create cgroup ",
            cgroup_name,
            ": ",
            e.what()
        );
    }
    ResourceLimiter::apply(
        *cgroup,
        {
            .memory_max_in_bytes = config_.memory_max_in_bytes,
            .cpu_count = config_.num_cpus,
            .max_processes = config_.max_processes,
        }
    );
    task_log(
        "limits: memory ",
        config_.memory_max_in_bytes,
        " B, ",
        config_.num_cpus,
        " cpus, cgroup ",
        cgroup_name
    );

    auto result = [&]() -> sandbox::Result {
        try {
            return sandbox::run(
                executable,
                request.arguments,
                {
                    .stdin_fd = dev_null,
                    .stdout_fd = output.stdout_fd(),
                    .stderr_fd = output.stderr_fd(),
                    .env = env,
                    .working_directory = working_dir,
                    .linux_namespaces =
                        {
                            .mount = {.bind_mounts = sandbox_handle.mount_operations()},
                            .uts = {.hostname = "localhost"},
                        },
                    .time_limit = request.timeout,
                    .termination_grace_period = config_.termination_grace_period,
                    .cancellation_token = options.cancellation_token,
                },
                *cgroup
            );
        } catch (const std::exception& e) {
            task_log("supervision failed: ", e.what());
            errlog(cgroup_name, ": supervision failed: ", e.what());
            try {
                cgroup->kill();
                cgroup->wait_until_empty(std::chrono::seconds{10});
            } catch (const std::exception& kill_error) {
                errlog(cgroup_name, ": cannot kill the process tree: ", kill_error.what());
            }
            auto run_error = RunError(RunError::Code::INTERNAL, "supervision failed: ", e.what());
            optional<ResourceUsage> usage;
            try {
                usage = UsageCollector::collect(*cgroup, std::chrono::nanoseconds{0}).usage;
            } catch (const std::exception& collect_error) {
                errlog(cgroup_name, ": cannot collect usage: ", collect_error.what());
            }
            if (usage) {
                throw std::move(run_error).with_usage(*usage);
            }
            throw run_error;
        }
    }();

    if (auto* err = std::get_if<sandbox::result::Error>(&result)) {
        task_log("error: ", err->description);
        auto run_error = RunError(error_code_of(*err), err->description);
        if (err->stage == sandbox::result::Error::Stage::INTERNAL) {
            // The command might have run for a while
            throw std::move(run_error).with_usage(
                UsageCollector::collect(*cgroup, std::chrono::nanoseconds{0}).usage
            );
        }
        throw run_error;
    }

    const auto& ok = std::get<sandbox::result::Ok>(result);
    auto collected = UsageCollector::collect(*cgroup, ok.runtime);
    RunResponse response = {
        .exit_code = ok.si.exit_code(),
        .termination_signal = ok.si.termination_signal(),
        .usage = collected.usage,
        .outcome = RunResponse::Outcome::COMPLETED,
    };
    using Termination = sandbox::result::Ok::Termination;
    switch (ok.termination) {
    case Termination::TIME_LIMIT: response.outcome = RunResponse::Outcome::TIMED_OUT; break;
    case Termination::CANCELLED: response.outcome = RunResponse::Outcome::CANCELLED; break;
    case Termination::NONE:
        if (collected.oom_kill_count > 0) {
            response.outcome = RunResponse::Outcome::MEMORY_LIMIT_EXCEEDED;
        }
        break;
    }

    task_log(
        "finished: ",
        ok.si.description(),
        ", outcome ",
        to_str(response.outcome),
        ok.escalated_to_kill ? ", killed after the grace period" : ""
    );
    log_usage(task_log, response.usage);
    stdlog(
        cgroup_name, ": ", executable, ": ", ok.si.description(), ", ", to_str(response.outcome)
    );
    return response;
}

} // namespace bbrunner
