#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace coderun::runner {

enum class RunStatus {
    kExited,
    kTimedOut,
    kDispatchFailed
};

const char* ToString(RunStatus status);

struct ExecutionOutcome {
    RunStatus status = RunStatus::kExited;
    int exit_code = -1;
    std::string output;
    std::string error;
    // Set only for kDispatchFailed.
    std::string failure;
    double duration_seconds = 0.0;

    bool Succeeded() const { return status == RunStatus::kExited && exit_code == 0; }
};

struct RunnerOptions {
    std::string interpreter = "python3";
    std::filesystem::path working_dir;
    std::chrono::milliseconds poll_interval{20};
    std::chrono::milliseconds kill_grace{500};
};

// Runs "<interpreter> -c <code>" in a fresh child process. Time-bounded and
// output-capturing only: the child is not confined in any other way.
class ProcessRunner {
public:
    explicit ProcessRunner(RunnerOptions options);

    // With empty input, code that calls input() gets a stdin that stays open
    // and silent until the child exits, so the read blocks until the deadline.
    // Any other code reads end-of-file at once.
    ExecutionOutcome Run(const std::string& code,
                         const std::string& input,
                         std::chrono::seconds timeout) const;

private:
    RunnerOptions options_;
};

}  // namespace coderun::runner
