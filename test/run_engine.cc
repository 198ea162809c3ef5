#include "gtest_with_tester.hh"

#include <atomic>
#include <bbrunner/concat_tostr.hh>
#include <bbrunner/config.hh>
#include <bbrunner/file_contents.hh>
#include <bbrunner/file_manip.hh>
#include <bbrunner/run_engine.hh>
#include <bbrunner/sandbox/cancellation_token.hh>
#include <bbrunner/sandbox_builder.hh>
#include <bbrunner/temporary_directory.hh>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <dirent.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

using bbrunner::RunError;
using bbrunner::RunRequest;
using bbrunner::RunResponse;
using std::string;
using std::string_view;
using std::vector;
using Outcome = RunResponse::Outcome;

namespace {

constexpr uint64_t memory_max_in_bytes = 128 << 20;
constexpr uint32_t num_cpus = 4;
constexpr uint32_t max_processes = 256;

// Returns pids of the processes whose command line contains @p marker
vector<string> processes_with_marker(const string& marker) {
    vector<string> pids;
    std::unique_ptr<DIR, decltype(&closedir)> proc{opendir("/proc"), &closedir};
    if (!proc) {
        ADD_FAILURE() << "opendir(/proc) failed";
        return pids;
    }
    while (dirent* entry = readdir(proc.get())) {
        string name = entry->d_name;
        if (name.empty() || name.find_first_not_of("0123456789") != string::npos) {
            continue;
        }
        string cmdline;
        try {
            cmdline = get_file_contents(concat_tostr("/proc/", name, "/cmdline"));
        } catch (const std::exception&) {
            continue; // the process has already exited
        }
        if (cmdline.find(marker) != string::npos) {
            pids.emplace_back(std::move(name));
        }
    }
    return pids;
}

// The engine's cgroup root is the parent of the "service" leaf the test process was moved to
string engine_cgroup_root() {
    auto contents = get_file_contents("/proc/self/cgroup");
    auto pos = contents.find("0::");
    EXPECT_NE(pos, string::npos) << contents;
    auto path = contents.substr(pos + 3, contents.find('\n', pos) - pos - 3);
    EXPECT_TRUE(path.ends_with("/service")) << path;
    path.resize(path.size() - std::string_view{"/service"}.size());
    return concat_tostr("/sys/fs/cgroup", path);
}

class RunEngineTest : public testing::Test {
protected:
    // The engine moves the test process to a leaf of its cgroup, so it is created only once
    static inline std::unique_ptr<TemporaryDirectory> build_dir;
    static inline std::unique_ptr<bbrunner::SandboxConfig> config;
    static inline bbrunner::LinuxSandboxBuilder sandbox_builder;
    static inline std::unique_ptr<bbrunner::RunEngine> engine;
    static inline string engine_error;

    static void SetUpTestSuite() {
        build_dir = std::make_unique<TemporaryDirectory>("/tmp/bbrunner-run-engine.XXXXXX");
        config = std::make_unique<bbrunner::SandboxConfig>(
            bbrunner::SandboxConfig::load_from_string(concat_tostr(
                "build_directory_path: ",
                build_dir->path(),
                "\nmemory_max: ",
                memory_max_in_bytes,
                "\nnum_cpus: ",
                num_cpus,
                "\nmax_processes: ",
                max_processes,
                "\nrw_paths: [/dev]\ntermination_grace_period: 1000\n"
            ))
        );
        try {
            engine = std::make_unique<bbrunner::RunEngine>(*config, sandbox_builder);
        } catch (const std::exception& e) {
            engine_error = e.what();
        }
    }

    static void TearDownTestSuite() {
        engine.reset();
        config.reset();
        build_dir.reset();
    }

    void SetUp() override {
        if (!engine) {
            GTEST_SKIP() << "needs a delegated cgroup v2 subtree (e.g. run under `systemd-run "
                            "--user --scope -p Delegate=yes`): "
                         << engine_error;
        }
    }

    // Each test uses its own input root and temporary directory
    static RunRequest make_request(const string& name, vector<string> arguments) {
        auto input_root = concat_tostr(name, "/input");
        EXPECT_EQ(mkdir_r(concat_tostr(build_dir->path(), '/', input_root)), 0);
        return {
            .arguments = std::move(arguments),
            .environment_variables = {{"PATH", "/usr/local/bin:/usr/bin:/bin"}},
            .working_directory = "",
            .stdout_path = "stdout",
            .stderr_path = "stderr",
            .input_root_directory = input_root,
            .temporary_directory = concat_tostr(name, "/tmp"),
            .server_logs_directory = concat_tostr(name, "/logs"),
            .timeout = std::nullopt,
        };
    }

    static string input_file(const RunRequest& req, const string& path) {
        return concat_tostr(build_dir->path(), '/', req.input_root_directory, '/', path);
    }

    static RunError::Code run_error_code(const RunRequest& req) {
        try {
            (void)engine->run(req);
        } catch (const RunError& e) {
            return e.code();
        }
        ADD_FAILURE() << "run() did not throw";
        return RunError::Code::INTERNAL;
    }
};

} // namespace

// NOLINTNEXTLINE
TEST_F(RunEngineTest, captures_stdout_and_stderr) {
    auto req = make_request("capture", {"sh", "-c", "echo hello; echo oops >&2"});
    auto res = engine->run(req);
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_EQ(res.termination_signal, std::nullopt);
    EXPECT_EQ(res.outcome, Outcome::COMPLETED);
    EXPECT_EQ(get_file_contents(input_file(req, "stdout")), "hello\n");
    EXPECT_EQ(get_file_contents(input_file(req, "stderr")), "oops\n");
    EXPECT_GT(res.usage.wall_time.count(), 0);
    auto task_log = get_file_contents(concat_tostr(build_dir->path(), "/capture/logs/runner.log"));
    EXPECT_NE(task_log.find("outcome COMPLETED"), string::npos) << task_log;
}

// NOLINTNEXTLINE
TEST_F(RunEngineTest, exit_code_and_signal) {
    auto req = make_request("exit_code", {"sh", "-c", "exit 7"});
    auto res = engine->run(req);
    EXPECT_EQ(res.exit_code, 7);
    EXPECT_EQ(res.outcome, Outcome::COMPLETED);

    req.arguments = {"sh", "-c", "kill -SEGV $$"};
    res = engine->run(req);
    EXPECT_EQ(res.exit_code, std::nullopt);
    EXPECT_EQ(res.termination_signal, SIGSEGV);
    EXPECT_EQ(res.outcome, Outcome::COMPLETED);
}

// NOLINTNEXTLINE
TEST_F(RunEngineTest, working_directory_and_environment) {
    auto req = make_request(
        "environment", {"sh", "-c", "pwd; echo \"$FOO|$TMPDIR|$TMP|$HOME\"; test -d \"$HOME\""}
    );
    req.working_directory = "sub/dir";
    req.stdout_path = "../out";
    req.environment_variables["FOO"] = "bar baz";
    req.environment_variables["HOME"] = "/overridden";
    ASSERT_EQ(mkdir_r(input_file(req, "sub/dir")), 0);
    auto res = engine->run(req);
    EXPECT_EQ(res.exit_code, 0);
    auto tmp = concat_tostr(build_dir->path(), "/environment/tmp");
    EXPECT_EQ(
        get_file_contents(input_file(req, "sub/out")),
        concat_tostr(
            input_file(req, "sub/dir"),
            "\nbar baz|",
            tmp,
            "/tmp|",
            tmp,
            "/tmp|",
            tmp,
            "/home\n"
        )
    );
}

// NOLINTNEXTLINE
TEST_F(RunEngineTest, build_root_outside_task_areas_is_read_only) {
    auto forbidden = concat_tostr(build_dir->path(), "/forbidden");
    auto req = make_request(
        "read_only", {"sh", "-c", concat_tostr("touch ", forbidden, " && echo written > file")}
    );
    auto res = engine->run(req);
    EXPECT_NE(res.exit_code, 0);
    EXPECT_FALSE(path_exists(forbidden));

    req.arguments = {"sh", "-c", "echo written > file && touch \"$TMPDIR/x\" \"$HOME/y\""};
    res = engine->run(req);
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_EQ(get_file_contents(input_file(req, "file")), "written\n");
}

// NOLINTNEXTLINE
TEST_F(RunEngineTest, temporary_directory_is_recreated) {
    auto req = make_request(
        "idempotence",
        {"sh",
         "-c",
         "test -z \"$(ls -A \"$TMPDIR\")\" && test -z \"$(ls -A \"$HOME\")\" && "
         "touch \"$TMPDIR/left\" \"$HOME/over\""}
    );
    for (int i = 0; i < 3; ++i) {
        auto res = engine->run(req);
        EXPECT_EQ(res.exit_code, 0) << "run " << i;
    }
    // Stale contents of the temporary directory itself are removed as well
    put_file_contents(concat_tostr(build_dir->path(), "/idempotence/tmp/stale"), "");
    EXPECT_EQ(engine->run(req).exit_code, 0);
    EXPECT_FALSE(path_exists(concat_tostr(build_dir->path(), "/idempotence/tmp/stale")));
}

// NOLINTNEXTLINE
TEST_F(RunEngineTest, no_processes_outlive_the_run) {
    auto marker = concat_tostr("bbrunner-linger-marker-", getpid());
    auto req = make_request("linger", {string{tester_executable_path}, "linger", marker});
    auto res = engine->run(req);
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_EQ(get_file_contents(input_file(req, "stdout")), "spawned\n");
    EXPECT_EQ(processes_with_marker(marker), vector<string>{});
}

// NOLINTNEXTLINE
TEST_F(RunEngineTest, concurrent_runs_do_not_interleave) {
    constexpr int runs_num = 6;
    constexpr int lines_num = 200;
    vector<RunRequest> requests;
    for (int i = 0; i < runs_num; ++i) {
        requests.emplace_back(make_request(
            concat_tostr("concurrent", i),
            {"sh",
             "-c",
             concat_tostr(
                 "i=0; while [ $i -lt ", lines_num, " ]; do echo run", i, "; i=$((i+1)); done"
             )}
        ));
    }
    vector<std::optional<RunResponse>> responses(runs_num);
    vector<std::thread> threads;
    for (int i = 0; i < runs_num; ++i) {
        threads.emplace_back([&, i] {
            try {
                responses[i] = engine->run(requests[i]);
            } catch (const std::exception& e) {
                ADD_FAILURE() << "run " << i << ": " << e.what();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (int i = 0; i < runs_num; ++i) {
        ASSERT_TRUE(responses[i].has_value());
        EXPECT_EQ(responses[i]->exit_code, 0);
        string expected;
        for (int line = 0; line < lines_num; ++line) {
            back_insert(expected, "run", i, '\n');
        }
        EXPECT_EQ(get_file_contents(input_file(requests[i], "stdout")), expected);
    }
}

// NOLINTNEXTLINE
TEST_F(RunEngineTest, timeout_terminates_the_process_tree) {
    auto req = make_request("timeout", {"sleep", "10"});
    req.timeout = std::chrono::seconds{2};
    auto start = std::chrono::steady_clock::now();
    auto res = engine->run(req);
    auto took = std::chrono::steady_clock::now() - start;
    EXPECT_EQ(res.outcome, Outcome::TIMED_OUT);
    EXPECT_EQ(res.exit_code, std::nullopt);
    EXPECT_TRUE(res.termination_signal.has_value());
    EXPECT_GE(took, std::chrono::seconds{2});
    EXPECT_LT(
        took, std::chrono::seconds{2} + config->termination_grace_period + std::chrono::seconds{2}
    );
    EXPECT_LT(res.usage.user_cpu_time + res.usage.system_cpu_time, std::chrono::seconds{1});
    EXPECT_GE(res.usage.wall_time, std::chrono::seconds{2});
}

// NOLINTNEXTLINE
TEST_F(RunEngineTest, timeout_escalates_to_kill) {
    auto req = make_request("escalation", {string{tester_executable_path}, "ignore_sigterm"});
    req.timeout = std::chrono::milliseconds{500};
    auto start = std::chrono::steady_clock::now();
    auto res = engine->run(req);
    auto took = std::chrono::steady_clock::now() - start;
    EXPECT_EQ(res.outcome, Outcome::TIMED_OUT);
    EXPECT_EQ(res.termination_signal, SIGKILL);
    EXPECT_GE(took, std::chrono::milliseconds{500} + config->termination_grace_period);
    EXPECT_EQ(get_file_contents(input_file(req, "stdout")), "ready\n");
}

// NOLINTNEXTLINE
TEST_F(RunEngineTest, memory_hog_is_killed) {
    auto req = make_request("memory_hog", {string{tester_executable_path}, "hog_memory"});
    auto res = engine->run(req);
    EXPECT_EQ(res.outcome, Outcome::MEMORY_LIMIT_EXCEEDED);
    EXPECT_EQ(res.termination_signal, SIGKILL);
    EXPECT_LE(res.usage.peak_memory_in_bytes, memory_max_in_bytes + (4 << 20));
}

// NOLINTNEXTLINE
TEST_F(RunEngineTest, cancellation) {
    auto req = make_request("cancellation", {"sleep", "10"});
    sandbox::CancellationToken token;
    std::thread canceller{[&] {
        std::this_thread::sleep_for(std::chrono::milliseconds{300});
        token.cancel();
    }};
    auto start = std::chrono::steady_clock::now();
    auto res = engine->run(req, {.cancellation_token = &token});
    auto took = std::chrono::steady_clock::now() - start;
    canceller.join();
    EXPECT_EQ(res.outcome, Outcome::CANCELLED);
    EXPECT_TRUE(res.termination_signal.has_value());
    EXPECT_LT(took, std::chrono::seconds{5});
}

// NOLINTNEXTLINE
TEST_F(RunEngineTest, not_found) {
    auto req = make_request("not_found", {"bbrunner-nonexistent-command"});
    EXPECT_EQ(run_error_code(req), RunError::Code::NOT_FOUND);

    req.arguments = {"./missing"};
    EXPECT_EQ(run_error_code(req), RunError::Code::NOT_FOUND);

    req.arguments = {"true"};
    req.working_directory = "missing_dir";
    EXPECT_EQ(run_error_code(req), RunError::Code::NOT_FOUND);

    req = make_request("not_found", {"true"});
    req.input_root_directory = "not_found/missing_input_root";
    EXPECT_EQ(run_error_code(req), RunError::Code::NOT_FOUND);
}

// NOLINTNEXTLINE
TEST_F(RunEngineTest, invalid_arguments) {
    auto req = make_request("invalid", {});
    EXPECT_EQ(run_error_code(req), RunError::Code::INVALID_ARGUMENT);

    req.arguments = {""};
    EXPECT_EQ(run_error_code(req), RunError::Code::INVALID_ARGUMENT);

    req = make_request("invalid", {"true"});
    req.working_directory = "../..";
    EXPECT_EQ(run_error_code(req), RunError::Code::INVALID_ARGUMENT);

    req = make_request("invalid", {"true"});
    req.stdout_path = "../../../escaped";
    EXPECT_EQ(run_error_code(req), RunError::Code::INVALID_ARGUMENT);

    req = make_request("invalid", {"true"});
    req.input_root_directory = "/etc";
    EXPECT_EQ(run_error_code(req), RunError::Code::INVALID_ARGUMENT);

    req = make_request("invalid", {"true"});
    req.environment_variables["A=B"] = "c";
    EXPECT_EQ(run_error_code(req), RunError::Code::INVALID_ARGUMENT);

    // Not executable
    req = make_request("invalid", {"./data"});
    put_file_contents(input_file(req, "data"), "not a program", 0644);
    EXPECT_EQ(run_error_code(req), RunError::Code::INVALID_ARGUMENT);
}

// NOLINTNEXTLINE
TEST_F(RunEngineTest, timeout_of_a_command_exiting_on_sigterm_is_a_signal_termination) {
    auto req = make_request(
        "sigterm_handler", {"sh", "-c", "trap 'exit 0' TERM; echo ready; sleep 10 & wait"}
    );
    req.timeout = std::chrono::seconds{1};
    auto res = engine->run(req);
    EXPECT_EQ(res.outcome, Outcome::TIMED_OUT);
    EXPECT_EQ(res.exit_code, std::nullopt);
    EXPECT_EQ(res.termination_signal, SIGTERM);
    EXPECT_EQ(get_file_contents(input_file(req, "stdout")), "ready\n");

    sandbox::CancellationToken token;
    std::thread canceller{[&] {
        std::this_thread::sleep_for(std::chrono::milliseconds{300});
        token.cancel();
    }};
    req.timeout = std::nullopt;
    res = engine->run(req, {.cancellation_token = &token});
    canceller.join();
    EXPECT_EQ(res.outcome, Outcome::CANCELLED);
    EXPECT_EQ(res.exit_code, std::nullopt);
    EXPECT_EQ(res.termination_signal, SIGTERM);
}

// NOLINTNEXTLINE
TEST_F(RunEngineTest, limits_are_set_on_the_cgroup_of_the_command) {
    auto req = make_request(
        "limits",
        {"sh",
         "-c",
         "cg=\"/sys/fs/cgroup$(sed -n 's/^0:://p' /proc/self/cgroup)\" && "
         "cat \"$cg/cpu.max\" \"$cg/pids.max\" \"$cg/memory.max\" \"$cg/memory.oom.group\""}
    );
    auto res = engine->run(req);
    EXPECT_EQ(res.exit_code, 0) << get_file_contents(input_file(req, "stderr"));
    EXPECT_EQ(
        get_file_contents(input_file(req, "stdout")),
        concat_tostr(
            num_cpus * 100000, " 100000\n", max_processes, '\n', memory_max_in_bytes, "\n1\n"
        )
    );
}

// NOLINTNEXTLINE
TEST_F(RunEngineTest, process_limit_is_enforced) {
    auto req = make_request(
        "pids_limit",
        {"sh",
         "-c",
         concat_tostr(
             "i=0; while [ $i -lt ", max_processes + 16, " ]; do sleep 5 & i=$((i+1)); done"
         )}
    );
    req.timeout = std::chrono::seconds{3};
    auto res = engine->run(req);
    EXPECT_EQ(res.outcome, Outcome::COMPLETED);
    // fork() fails once the limit is reached
    EXPECT_NE(get_file_contents(input_file(req, "stderr")), "");
}

// NOLINTNEXTLINE
TEST_F(RunEngineTest, stale_slot_cgroups_are_killed_and_reused) {
    auto cgroup_root = engine_cgroup_root();
    // A crashed service leaves slot cgroups with live processes behind
    vector<pid_t> orphans;
    for (uint32_t slot = 0; slot < num_cpus; ++slot) {
        auto slot_path = concat_tostr(cgroup_root, "/slot-", slot);
        ASSERT_EQ(mkdir(slot_path.c_str(), 0755), 0) << slot_path;
        ASSERT_EQ(mkdir(concat_tostr(slot_path, "/pid1").c_str(), 0755), 0);
        ASSERT_EQ(mkdir(concat_tostr(slot_path, "/tracee").c_str(), 0755), 0);
        pid_t pid = fork();
        ASSERT_NE(pid, -1);
        if (pid == 0) {
            execlp("sleep", "sleep", "30", nullptr);
            _exit(1);
        }
        orphans.emplace_back(pid);
        put_file_contents(concat_tostr(slot_path, "/tracee/cgroup.procs"), concat_tostr(pid));
    }

    // Consecutive runs go through every slot
    auto req = make_request("stale_slots", {"true"});
    for (uint32_t i = 0; i < num_cpus; ++i) {
        EXPECT_EQ(engine->run(req).exit_code, 0) << "run " << i;
    }
    for (auto pid : orphans) {
        int status = 0;
        ASSERT_EQ(waitpid(pid, &status, 0), pid);
        EXPECT_TRUE(WIFSIGNALED(status) && WTERMSIG(status) == SIGKILL) << status;
    }
}

// NOLINTNEXTLINE
TEST_F(RunEngineTest, temporary_directory_must_not_overlap_task_directories) {
    auto other = make_request("overlap_other", {"true"});
    put_file_contents(input_file(other, "keep"), "other task");
    auto req = make_request("overlap", {"true"});
    put_file_contents(input_file(req, "keep"), "own input");

    req.temporary_directory = "";
    EXPECT_EQ(run_error_code(req), RunError::Code::INVALID_ARGUMENT);
    req.temporary_directory = ".";
    EXPECT_EQ(run_error_code(req), RunError::Code::INVALID_ARGUMENT);
    req.temporary_directory = build_dir->path();
    EXPECT_EQ(run_error_code(req), RunError::Code::INVALID_ARGUMENT);
    // An ancestor of the input root
    req.temporary_directory = "overlap";
    EXPECT_EQ(run_error_code(req), RunError::Code::INVALID_ARGUMENT);
    req.temporary_directory = "overlap/input";
    EXPECT_EQ(run_error_code(req), RunError::Code::INVALID_ARGUMENT);
    req.temporary_directory = "overlap/input/tmp";
    EXPECT_EQ(run_error_code(req), RunError::Code::INVALID_ARGUMENT);
    req.temporary_directory = "overlap/logs";
    EXPECT_EQ(run_error_code(req), RunError::Code::INVALID_ARGUMENT);
    req.temporary_directory = "overlap/logs/tmp";
    EXPECT_EQ(run_error_code(req), RunError::Code::INVALID_ARGUMENT);

    EXPECT_EQ(get_file_contents(input_file(other, "keep")), "other task");
    EXPECT_EQ(get_file_contents(input_file(req, "keep")), "own input");

    // A sibling of the input root is fine, even one with a common name prefix
    req.temporary_directory = "overlap/input-tmp";
    EXPECT_EQ(engine->run(req).exit_code, 0);
    EXPECT_EQ(get_file_contents(input_file(req, "keep")), "own input");
}

// NOLINTNEXTLINE
TEST(RunEngine, rejects_config_without_cpus_or_memory) {
    bbrunner::LinuxSandboxBuilder sandbox_builder;
    bbrunner::SandboxConfig config;
    config.build_directory_path = "/tmp";
    config.memory_max_in_bytes = memory_max_in_bytes;
    EXPECT_THROW((bbrunner::RunEngine{config, sandbox_builder}), std::runtime_error);

    config.num_cpus = 1;
    config.memory_max_in_bytes = 0;
    EXPECT_THROW((bbrunner::RunEngine{config, sandbox_builder}), std::runtime_error);
}

// NOLINTNEXTLINE
TEST_F(RunEngineTest, failed_kill_escalation_leaves_no_zombie) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "root can write to cgroup.kill regardless of its permissions";
    }
    auto cgroup_root = engine_cgroup_root();
    auto req = make_request("failed_kill", {string{tester_executable_path}, "ignore_sigterm"});
    req.timeout = std::chrono::seconds{1};
    std::optional<RunError::Code> code;
    std::thread runner{[&] { code = run_error_code(req); }};

    // Make cgroup.kill of the running request unwritable before the grace period ends
    string kill_file;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{2};
    while (kill_file.empty() && std::chrono::steady_clock::now() < deadline) {
        std::unique_ptr<DIR, decltype(&closedir)> dir{opendir(cgroup_root.c_str()), &closedir};
        while (dir && kill_file.empty()) {
            dirent* entry = readdir(dir.get());
            if (!entry) {
                break;
            }
            if (string_view{entry->d_name}.starts_with("slot-")) {
                auto path = concat_tostr(cgroup_root, '/', entry->d_name, "/cgroup.kill");
                if (chmod(path.c_str(), 0444) == 0) {
                    kill_file = std::move(path);
                }
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    runner.join();
    if (!kill_file.empty()) {
        // Lets the next run recover the slot if its cgroup could not be removed
        (void)chmod(kill_file.c_str(), 0644);
    }
    ASSERT_FALSE(kill_file.empty());
    EXPECT_EQ(code, RunError::Code::INTERNAL);

    // The sandbox's init process must have been reaped
    siginfo_t si = {};
    int rc = waitid(P_ALL, 0, &si, WEXITED | WNOHANG | __WALL);
    if (rc == 0) {
        EXPECT_EQ(si.si_pid, 0) << "unreaped child " << si.si_pid;
    } else {
        EXPECT_EQ(errno, ECHILD);
    }
}
