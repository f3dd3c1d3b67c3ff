#include "runner/process_runner.hpp"

#include <boost/process/v1.hpp>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>
#include <utility>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "diagnosis/input_starvation.hpp"
#include "utils/logging.hpp"

namespace coderun::runner {
namespace bp = boost::process::v1;

namespace {

struct ScratchFiles {
    std::filesystem::path input;
    std::filesystem::path output;
    std::filesystem::path error;

    ~ScratchFiles() {
        std::error_code ec;
        std::filesystem::remove(input, ec);
        std::filesystem::remove(output, ec);
        std::filesystem::remove(error, ec);
    }
};

std::string NextScratchStamp() {
    static std::atomic<unsigned long> counter{0};
    return std::to_string(::getpid()) + "_" + std::to_string(counter.fetch_add(1)) + "_" +
        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
}

std::string ResolveInterpreter(const std::string& interpreter) {
    if (interpreter.find('/') != std::string::npos) {
        return interpreter;
    }
    const auto found = bp::search_path(interpreter);
    if (found.empty()) {
        return std::string();
    }
    return found.string();
}

template <typename InputRedirect>
bp::child Spawn(const std::string& executable,
                const std::string& code,
                const std::filesystem::path& working_dir,
                InputRedirect&& input,
                const ScratchFiles& files) {
    return bp::child(
        executable,
        "-c",
        code,
        bp::start_dir = working_dir.string(),
        std::forward<InputRedirect>(input),
        bp::std_out > files.output.string(),
        bp::std_err > files.error.string());
}

enum class WaitResult {
    kReaped,
    kDeadline,
    kFailed
};

// Polls the one child this request owns until it exits or the deadline passes.
WaitResult WaitUntil(pid_t pid,
                     std::chrono::steady_clock::time_point deadline,
                     std::chrono::milliseconds poll_interval,
                     int& status) {
    while (true) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return WaitResult::kReaped;
        }
        if (waited < 0 && errno != EINTR) {
            utils::Log(
                utils::LogLevel::kWarn,
                "runner",
                "waitpid failed pid=" + std::to_string(pid) + ": " + std::strerror(errno));
            return WaitResult::kFailed;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return WaitResult::kDeadline;
        }
        std::this_thread::sleep_for(poll_interval);
    }
}

void Terminate(pid_t pid, std::chrono::milliseconds grace, std::chrono::milliseconds poll_interval) {
    int status = 0;
    if (::kill(pid, SIGTERM) != 0 && errno == ESRCH) {
        ::waitpid(pid, &status, WNOHANG);
        return;
    }
    const auto grace_deadline = std::chrono::steady_clock::now() + grace;
    if (WaitUntil(pid, grace_deadline, poll_interval, status) != WaitResult::kDeadline) {
        return;
    }
    ::kill(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::string();
    }
    std::ostringstream target;
    target << input.rdbuf();
    return target.str();
}

}  // namespace

const char* ToString(RunStatus status) {
    switch (status) {
        case RunStatus::kExited: return "exited";
        case RunStatus::kTimedOut: return "timed_out";
        case RunStatus::kDispatchFailed: return "dispatch_failed";
    }
    return "unknown";
}

ProcessRunner::ProcessRunner(RunnerOptions options)
    : options_(std::move(options)) {
    if (options_.working_dir.empty()) {
        std::error_code ec;
        options_.working_dir = std::filesystem::temp_directory_path(ec);
        if (ec) {
            options_.working_dir = ".";
        }
    }
}

ExecutionOutcome ProcessRunner::Run(const std::string& code,
                                    const std::string& input,
                                    std::chrono::seconds timeout) const {
    ExecutionOutcome outcome{};

    const auto stamp = NextScratchStamp();
    std::error_code ec;
    auto scratch_dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        scratch_dir = options_.working_dir;
    }
    ScratchFiles files;
    files.input = scratch_dir / ("coderun_stdin_" + stamp + ".txt");
    files.output = scratch_dir / ("coderun_stdout_" + stamp + ".log");
    files.error = scratch_dir / ("coderun_stderr_" + stamp + ".log");

    const auto started = std::chrono::steady_clock::now();
    auto elapsed = [&started]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    };

    const auto executable = ResolveInterpreter(options_.interpreter);
    if (executable.empty()) {
        outcome.status = RunStatus::kDispatchFailed;
        outcome.failure = "interpreter not found: " + options_.interpreter;
        outcome.duration_seconds = elapsed();
        utils::Log(utils::LogLevel::kError, "runner", outcome.failure);
        return outcome;
    }

    WaitResult waited = WaitResult::kFailed;
    int status = 0;
    try {
        // Holds the write end of the child's stdin for programs that prompt
        // without supplied input, so input() blocks instead of hitting EOF.
        bp::pipe silent_input;
        bp::child child_process;
        if (input.empty() && diagnosis::RequestsInteractiveInput(code)) {
            child_process = Spawn(executable, code, options_.working_dir, bp::std_in < silent_input, files);
        } else if (input.empty()) {
            child_process = Spawn(executable, code, options_.working_dir, bp::std_in < bp::null, files);
        } else {
            {
                std::ofstream input_file(files.input, std::ios::binary | std::ios::trunc);
                if (!input_file.is_open()) {
                    outcome.status = RunStatus::kDispatchFailed;
                    outcome.failure = "cannot stage stdin at " + files.input.string();
                    outcome.duration_seconds = elapsed();
                    return outcome;
                }
                input_file << input;
            }
            child_process = Spawn(
                executable, code, options_.working_dir, bp::std_in < files.input.string(), files);
        }

        const pid_t pid = child_process.id();
        utils::Log(
            utils::LogLevel::kDebug,
            "runner",
            "spawned pid=" + std::to_string(pid) + " timeout=" + std::to_string(timeout.count()) + "s");

        waited = WaitUntil(pid, started + timeout, options_.poll_interval, status);
        if (waited == WaitResult::kDeadline) {
            outcome.status = RunStatus::kTimedOut;
            Terminate(pid, options_.kill_grace, options_.poll_interval);
            utils::Log(utils::LogLevel::kInfo, "runner", "pid=" + std::to_string(pid) + " timed out");
        }
        child_process.detach();
    } catch (const bp::process_error& ex) {
        outcome.status = RunStatus::kDispatchFailed;
        outcome.failure = std::string("exec failed: ") + ex.what();
        outcome.duration_seconds = elapsed();
        utils::Log(utils::LogLevel::kError, "runner", outcome.failure);
        return outcome;
    }
    outcome.duration_seconds = elapsed();

    if (waited == WaitResult::kReaped) {
        if (WIFEXITED(status)) {
            outcome.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            outcome.exit_code = 128 + WTERMSIG(status);
        }
    } else if (waited == WaitResult::kFailed) {
        outcome.status = RunStatus::kDispatchFailed;
        outcome.failure = "lost track of child process";
    }

    outcome.output = ReadFile(files.output);
    outcome.error = ReadFile(files.error);
    return outcome;
}

}  // namespace coderun::runner
