#include "service/run_service.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

#include "diagnosis/input_starvation.hpp"
#include "providers/offline_provider.hpp"

using coderun::diagnosis::Explanation;
using coderun::runner::ExecutionOutcome;
using coderun::runner::ProcessRunner;
using coderun::runner::RunnerOptions;
using coderun::runner::RunStatus;
using coderun::service::AssembleResponse;
using coderun::service::ExecutionRequest;
using coderun::service::RequestLimits;
using coderun::service::ResponseStatus;
using coderun::service::RunService;

namespace {

class RecordingProvider : public coderun::providers::ExplanationProvider {
public:
    Explanation Explain(const std::string& code, const std::string& error_text) const override {
        ++calls;
        last_code = code;
        last_error = error_text;
        return Explanation{"recorded", "because", {"fix it"}, std::nullopt, 0.42};
    }
    std::string Name() const override { return "recording"; }

    mutable int calls = 0;
    mutable std::string last_code;
    mutable std::string last_error;
};

ExecutionRequest MakeRequest(std::string code, std::string input = "", int timeout_s = 10) {
    ExecutionRequest request{};
    request.code = std::move(code);
    request.stdin_text = std::move(input);
    request.timeout_s = timeout_s;
    return request;
}

ExecutionOutcome Exited(int exit_code, std::string output, std::string error) {
    ExecutionOutcome outcome{};
    outcome.status = RunStatus::kExited;
    outcome.exit_code = exit_code;
    outcome.output = std::move(output);
    outcome.error = std::move(error);
    outcome.duration_seconds = 0.25;
    return outcome;
}

ExecutionOutcome TimedOut() {
    ExecutionOutcome outcome{};
    outcome.status = RunStatus::kTimedOut;
    outcome.duration_seconds = 1.0;
    return outcome;
}

RunnerOptions ShellOptions() {
    RunnerOptions options{};
    options.interpreter = "sh";
    options.poll_interval = std::chrono::milliseconds(10);
    options.kill_grace = std::chrono::milliseconds(200);
    return options;
}

bool HasPython() {
    return std::system("command -v python3 >/dev/null 2>&1") == 0;
}

}  // namespace

TEST(AssembleResponseTest, SuccessCarriesOutputOnly) {
    RecordingProvider provider;
    const auto record = AssembleResponse(MakeRequest("print('hi')"), Exited(0, "hi\n", ""), provider);
    EXPECT_EQ(record.status, ResponseStatus::kSuccess);
    ASSERT_TRUE(record.output.has_value());
    EXPECT_EQ(*record.output, "hi\n");
    EXPECT_FALSE(record.error.has_value());
    EXPECT_FALSE(record.explanation.has_value());
    ASSERT_TRUE(record.execution_time.has_value());
    EXPECT_DOUBLE_EQ(*record.execution_time, 0.25);
    EXPECT_EQ(provider.calls, 0);
}

TEST(AssembleResponseTest, EmptyOutputBecomesPlaceholder) {
    RecordingProvider provider;
    const auto record = AssembleResponse(MakeRequest("x = 1"), Exited(0, "", ""), provider);
    EXPECT_EQ(record.status, ResponseStatus::kSuccess);
    EXPECT_EQ(*record.output, "(no output)");
}

TEST(AssembleResponseTest, SuccessIgnoresStderr) {
    RecordingProvider provider;
    const auto record = AssembleResponse(MakeRequest("code"), Exited(0, "", "DeprecationWarning"), provider);
    EXPECT_EQ(record.status, ResponseStatus::kSuccess);
    EXPECT_FALSE(record.error.has_value());
}

TEST(AssembleResponseTest, FailureAsksProviderWithStderr) {
    RecordingProvider provider;
    const auto record = AssembleResponse(
        MakeRequest("print(1/0)"), Exited(1, "", "ZeroDivisionError: division by zero\n"), provider);
    EXPECT_EQ(record.status, ResponseStatus::kError);
    EXPECT_EQ(*record.error, "ZeroDivisionError: division by zero\n");
    ASSERT_TRUE(record.explanation.has_value());
    EXPECT_EQ(record.explanation->summary, "recorded");
    EXPECT_FALSE(record.output.has_value());
    EXPECT_TRUE(record.execution_time.has_value());
    EXPECT_EQ(provider.calls, 1);
    EXPECT_EQ(provider.last_code, "print(1/0)");
    EXPECT_EQ(provider.last_error, "ZeroDivisionError: division by zero\n");
}

TEST(AssembleResponseTest, StarvationBypassesProvider) {
    RecordingProvider provider;
    const auto record = AssembleResponse(MakeRequest("name = input()", "  ", 1), TimedOut(), provider);
    EXPECT_EQ(record.status, ResponseStatus::kError);
    EXPECT_EQ(*record.error, coderun::diagnosis::kStarvationError);
    ASSERT_TRUE(record.explanation.has_value());
    EXPECT_DOUBLE_EQ(record.explanation->confidence, 0.95);
    EXPECT_EQ(*record.explanation, coderun::diagnosis::StarvationExplanation());
    EXPECT_TRUE(record.execution_time.has_value());
    EXPECT_EQ(provider.calls, 0);
}

TEST(AssembleResponseTest, GenuineTimeoutHasNoExplanation) {
    RecordingProvider provider;
    const auto record = AssembleResponse(MakeRequest("while True:\n    pass", "", 7), TimedOut(), provider);
    EXPECT_EQ(record.status, ResponseStatus::kError);
    EXPECT_EQ(*record.error, "Execution timed out after 7 seconds");
    EXPECT_FALSE(record.explanation.has_value());
    EXPECT_EQ(provider.calls, 0);
}

TEST(AssembleResponseTest, TimeoutWithSuppliedInputIsNotStarvation) {
    RecordingProvider provider;
    const auto record = AssembleResponse(MakeRequest("x = input()\nwhile True: pass", "5\n", 2), TimedOut(), provider);
    EXPECT_EQ(*record.error, "Execution timed out after 2 seconds");
    EXPECT_FALSE(record.explanation.has_value());
}

TEST(AssembleResponseTest, DispatchFailureSurfacesMessage) {
    RecordingProvider provider;
    ExecutionOutcome outcome{};
    outcome.status = RunStatus::kDispatchFailed;
    outcome.failure = "exec failed: No such file or directory";
    const auto record = AssembleResponse(MakeRequest("print(1)"), outcome, provider);
    EXPECT_EQ(record.status, ResponseStatus::kError);
    EXPECT_EQ(*record.error, "exec failed: No such file or directory");
    EXPECT_FALSE(record.explanation.has_value());
    EXPECT_TRUE(record.execution_time.has_value());
    EXPECT_EQ(provider.calls, 0);
}

TEST(ValidateRequestTest, Bounds) {
    const RequestLimits limits{};
    EXPECT_FALSE(coderun::service::ValidateRequest(MakeRequest("print(1)", "", 1), limits).has_value());
    EXPECT_FALSE(coderun::service::ValidateRequest(MakeRequest("print(1)", "", 60), limits).has_value());
    EXPECT_TRUE(coderun::service::ValidateRequest(MakeRequest("print(1)", "", 0), limits).has_value());
    EXPECT_TRUE(coderun::service::ValidateRequest(MakeRequest("print(1)", "", 61), limits).has_value());
    EXPECT_TRUE(coderun::service::ValidateRequest(MakeRequest("", "", 10), limits).has_value());
}

class RunServiceShellTest : public ::testing::Test {
protected:
    ProcessRunner runner_{ShellOptions()};
    coderun::providers::OfflineProvider provider_;
    RunService service_{runner_, provider_, RequestLimits{}};
};

TEST_F(RunServiceShellTest, InvalidRequestIsNotExecuted) {
    const auto record = service_.Run(MakeRequest("echo never", "", 0));
    EXPECT_EQ(record.status, ResponseStatus::kError);
    EXPECT_FALSE(record.execution_time.has_value());
    EXPECT_FALSE(record.output.has_value());
}

TEST_F(RunServiceShellTest, ClassifiesStderrOfFailedProgram) {
    const auto record = service_.Run(MakeRequest("echo 'ZeroDivisionError: division by zero' >&2; exit 1"));
    EXPECT_EQ(record.status, ResponseStatus::kError);
    ASSERT_TRUE(record.explanation.has_value());
    EXPECT_DOUBLE_EQ(record.explanation->confidence, 0.95);
    EXPECT_EQ(record.explanation->summary, "You divided a number by zero.");
}

TEST_F(RunServiceShellTest, StarvedReaderIsDiagnosed) {
    // "input(" only has to appear in the source text.
    const auto record = service_.Run(MakeRequest("read line  # input(", "", 1));
    EXPECT_EQ(record.status, ResponseStatus::kError);
    EXPECT_EQ(*record.error, coderun::diagnosis::kStarvationError);
    ASSERT_TRUE(record.explanation.has_value());
    EXPECT_DOUBLE_EQ(record.explanation->confidence, 0.95);
}

TEST_F(RunServiceShellTest, RunsAreRepeatable) {
    const auto request = MakeRequest("echo same; echo 'NameError: x' >&2; exit 2");
    const auto first = service_.Run(request);
    const auto second = service_.Run(request);
    EXPECT_EQ(first.status, second.status);
    EXPECT_EQ(first.output, second.output);
    EXPECT_EQ(first.error, second.error);
    EXPECT_EQ(first.explanation, second.explanation);
}

class RunServicePythonTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!HasPython()) {
            GTEST_SKIP() << "python3 not on PATH";
        }
    }

    RunnerOptions PythonOptions() {
        auto options = ShellOptions();
        options.interpreter = "python3";
        return options;
    }

    ProcessRunner runner_{PythonOptions()};
    coderun::providers::OfflineProvider provider_;
    RunService service_{runner_, provider_, RequestLimits{}};
};

TEST_F(RunServicePythonTest, PrintsOutput) {
    const auto record = service_.Run(MakeRequest("print('hello')"));
    EXPECT_EQ(record.status, ResponseStatus::kSuccess);
    EXPECT_EQ(*record.output, "hello\n");
    EXPECT_FALSE(record.explanation.has_value());
}

TEST_F(RunServicePythonTest, SilentProgramGetsPlaceholder) {
    const auto record = service_.Run(MakeRequest("x = 1"));
    EXPECT_EQ(record.status, ResponseStatus::kSuccess);
    EXPECT_EQ(*record.output, "(no output)");
}

TEST_F(RunServicePythonTest, DivisionByZero) {
    const auto record = service_.Run(MakeRequest("print(1/0)"));
    EXPECT_EQ(record.status, ResponseStatus::kError);
    EXPECT_NE(record.error->find("ZeroDivisionError"), std::string::npos);
    ASSERT_TRUE(record.explanation.has_value());
    EXPECT_DOUBLE_EQ(record.explanation->confidence, 0.95);
    EXPECT_NE(record.explanation->summary.find("divided a number by zero"), std::string::npos);
}

TEST_F(RunServicePythonTest, UndefinedName) {
    const auto record = service_.Run(MakeRequest("print(total)"));
    ASSERT_TRUE(record.explanation.has_value());
    EXPECT_DOUBLE_EQ(record.explanation->confidence, 0.95);
    EXPECT_NE(record.explanation->summary.find("variable before defining it"), std::string::npos);
}

TEST_F(RunServicePythonTest, SyntaxError) {
    const auto record = service_.Run(MakeRequest("def broken(:\n    pass"));
    ASSERT_TRUE(record.explanation.has_value());
    EXPECT_DOUBLE_EQ(record.explanation->confidence, 0.85);
    EXPECT_FALSE(record.explanation->corrected_example.has_value());
}

TEST_F(RunServicePythonTest, WaitingForInput) {
    const auto record = service_.Run(MakeRequest("name = input()\nprint(name)", "", 1));
    EXPECT_EQ(record.status, ResponseStatus::kError);
    EXPECT_NE(record.error->find("waiting for input"), std::string::npos);
    ASSERT_TRUE(record.explanation.has_value());
    EXPECT_DOUBLE_EQ(record.explanation->confidence, 0.95);
}

TEST_F(RunServicePythonTest, SuppliedInputIsRead) {
    const auto record = service_.Run(MakeRequest("n = int(input())\nprint(n * 2)", "21\n"));
    EXPECT_EQ(record.status, ResponseStatus::kSuccess);
    EXPECT_EQ(*record.output, "42\n");
}

TEST_F(RunServicePythonTest, StdinReaderWithoutInputSeesEof) {
    const auto record = service_.Run(MakeRequest("import sys\nprint(len(sys.stdin.read()))"));
    EXPECT_EQ(record.status, ResponseStatus::kSuccess);
    EXPECT_EQ(*record.output, "0\n");
}

TEST_F(RunServicePythonTest, InfiniteLoopTimesOut) {
    const auto record = service_.Run(MakeRequest("while True:\n    pass", "", 1));
    EXPECT_EQ(record.status, ResponseStatus::kError);
    EXPECT_EQ(*record.error, "Execution timed out after 1 seconds");
    EXPECT_FALSE(record.explanation.has_value());
}
