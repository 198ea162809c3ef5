#include <atomic>
#include <bbrunner/config.hh>
#include <bbrunner/errmsg.hh>
#include <bbrunner/logger.hh>
#include <bbrunner/macros/throw.hh>
#include <bbrunner/readiness_probe.hh>
#include <bbrunner/run_engine.hh>
#include <bbrunner/sandbox/cancellation_token.hh>
#include <bbrunner/sandbox_builder.hh>
#include <bbrunner/string_transform.hh>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <exception>
#include <optional>
#include <string_view>

using std::string_view;

namespace {

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
std::atomic<sandbox::CancellationToken*> running_request_token = nullptr;

void help(const char* program_name) {
    if (program_name == nullptr) {
        program_name = "bbrunner";
    }
    (void)fprintf(
        stderr,
        "Usage: %s <config-file> <command> [args...]\n"
        "Runs commands of a build worker inside sandboxes.\n"
        "\n"
        "Commands:\n"
        "  check-readiness [path]  Prints \"ready\" if path (relative to the build directory)\n"
        "                            exists or is empty, \"not ready\" otherwise\n"
        "  run [options] -- <argv...>\n"
        "                          Runs argv in a sandbox and prints its exit status, outcome\n"
        "                            and resource usage. SIGINT and SIGTERM cancel the run.\n"
        "  help                    Prints this help\n"
        "\n"
        "Options of run:\n"
        "  -t <seconds>            Time limit (default: none)\n"
        "  -w <dir>                Working directory relative to the input root (default: .)\n"
        "  -i <dir>                Input root relative to the build directory (default: input)\n"
        "  -T <dir>                Temporary directory relative to the build directory, removed\n"
        "                            before the run; must not overlap the input root or the\n"
        "                            log directory (default: tmp)\n"
        "  -l <dir>                Directory for the log of the run (default: none)\n"
        "  -o <path>               Stdout file relative to the working directory\n"
        "                            (default: stdout)\n"
        "  -e <path>               Stderr file relative to the working directory\n"
        "                            (default: stderr)\n"
        "  -E NAME=VALUE           Environment variable, may be repeated\n",
        program_name
    );
}

void cancel_running_request(int /*signum*/) noexcept {
    auto* token = running_request_token.load();
    if (token) {
        token->cancel();
    }
}

void install_cancelling_signal_handlers() {
    struct sigaction sa = {};
    sa.sa_handler = cancel_running_request;
    if (sigemptyset(&sa.sa_mask)) {
        THROW("sigemptyset()", errmsg());
    }
    for (int signum : {SIGINT, SIGTERM}) {
        if (sigaction(signum, &sa, nullptr)) {
            THROW("sigaction()", errmsg());
        }
    }
}

// Parses the options of the run command; returns std::nullopt on invalid usage
std::optional<bbrunner::RunRequest> parse_run_request(int argc, char** argv) {
    bbrunner::RunRequest req = {
        .working_directory = ".",
        .stdout_path = "stdout",
        .stderr_path = "stderr",
        .input_root_directory = "input",
        .temporary_directory = "tmp",
    };
    int i = 0;
    for (; i < argc; ++i) {
        string_view arg = argv[i];
        if (arg == "--") {
            ++i;
            break;
        }
        if (i + 1 >= argc) {
            (void)fprintf(stderr, "Invalid option: '%s'\n", argv[i]);
            return std::nullopt;
        }
        string_view value = argv[++i];
        if (arg == "-t") {
            auto seconds = str2num<uint32_t>(value);
            if (!seconds) {
                (void)fprintf(stderr, "Invalid time limit: '%s'\n", argv[i]);
                return std::nullopt;
            }
            req.timeout = std::chrono::seconds{*seconds};
        } else if (arg == "-w") {
            req.working_directory = value;
        } else if (arg == "-i") {
            req.input_root_directory = value;
        } else if (arg == "-T") {
            req.temporary_directory = value;
        } else if (arg == "-l") {
            req.server_logs_directory = value;
        } else if (arg == "-o") {
            req.stdout_path = value;
        } else if (arg == "-e") {
            req.stderr_path = value;
        } else if (arg == "-E") {
            auto pos = value.find('=');
            if (pos == string_view::npos) {
                (void)fprintf(stderr, "Invalid environment variable: '%s'\n", argv[i]);
                return std::nullopt;
            }
            req.environment_variables.insert_or_assign(
                std::string{value.substr(0, pos)}, std::string{value.substr(pos + 1)}
            );
        } else {
            (void)fprintf(stderr, "Unknown option: '%s'\n", argv[i - 1]);
            return std::nullopt;
        }
    }
    req.arguments.assign(argv + i, argv + argc);
    if (req.arguments.empty()) {
        (void)fprintf(stderr, "Missing command to run\n");
        return std::nullopt;
    }
    return req;
}

int run_command(const bbrunner::SandboxConfig& config, int argc, char** argv) {
    auto request = parse_run_request(argc, argv);
    if (!request) {
        return 1;
    }

    bbrunner::LinuxSandboxBuilder sandbox_builder;
    bbrunner::RunEngine engine{config, sandbox_builder};
    sandbox::CancellationToken cancellation_token;
    running_request_token = &cancellation_token;
    install_cancelling_signal_handlers();

    Logger out{stdout};
    out.label(false);
    try {
        auto response = engine.run(*request, {.cancellation_token = &cancellation_token});
        running_request_token = nullptr;
        if (response.exit_code) {
            out("exit code: ", *response.exit_code);
        } else {
            out("killed by signal: ", response.termination_signal.value_or(0));
        }
        out("outcome: ", to_str(response.outcome));
        const auto& usage = response.usage;
        out("user cpu time: ", usage.user_cpu_time.count(), " us");
        out("system cpu time: ", usage.system_cpu_time.count(), " us");
        out("peak memory: ", usage.peak_memory_in_bytes, " B");
        out(
            "wall time: ",
            std::chrono::duration_cast<std::chrono::microseconds>(usage.wall_time).count(),
            " us"
        );
        return response.outcome == bbrunner::RunResponse::Outcome::COMPLETED &&
                response.exit_code == 0
            ? 0
            : 1;
    } catch (const bbrunner::RunError& e) {
        running_request_token = nullptr;
        errlog("Error: ", to_str(e.code()), ": ", e.what());
        return 1;
    }
}

int real_main(int argc, char** argv) {
    stdlog.label(false);
    errlog.label(false);

    if (argc == 2 && string_view{argv[1]} == "help") {
        help(argv[0]);
        return 0;
    }
    if (argc < 3) {
        help(argv[0]);
        return 1;
    }
    string_view command = argv[2];
    if (command == "help") {
        help(argv[0]);
        return 0;
    }

    auto config = bbrunner::SandboxConfig::load(argv[1]);
    if (!config.log_file.empty()) {
        stdlog.open(config.log_file);
        stdlog.label(true);
    }
    if (!config.error_log_file.empty()) {
        errlog.open(config.error_log_file);
        errlog.label(true);
    }

    if (command == "check-readiness") {
        if (argc > 4) {
            help(argv[0]);
            return 1;
        }
        bbrunner::ReadinessProbe probe{config.build_directory_path};
        bool ready = probe.check_readiness(argc == 4 ? argv[3] : "");
        (void)printf("%s\n", ready ? "ready" : "not ready");
        return ready ? 0 : 1;
    }
    if (command == "run") {
        return run_command(config, argc - 3, argv + 3);
    }

    (void)fprintf(stderr, "Unknown command: '%s'\n", argv[2]);
    help(argv[0]);
    return 1;
}

} // namespace

int main(int argc, char** argv) {
    try {
        return real_main(argc, argv);
    } catch (const std::exception& e) {
        errlog("Error: ", e.what());
        return 1;
    }
}
