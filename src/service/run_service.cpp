#include "service/run_service.hpp"

#include <chrono>

#include "diagnosis/input_starvation.hpp"
#include "utils/logging.hpp"

namespace coderun::service {

const char* const kNoOutputPlaceholder = "(no output)";

std::optional<std::string> ValidateRequest(const ExecutionRequest& request, const RequestLimits& limits) {
    if (request.code.empty()) {
        return std::string("code must not be empty");
    }
    if (request.timeout_s < limits.min_timeout_s || request.timeout_s > limits.max_timeout_s) {
        return "timeout must be between " + std::to_string(limits.min_timeout_s) + " and " +
            std::to_string(limits.max_timeout_s) + " seconds";
    }
    return std::nullopt;
}

ResponseRecord AssembleResponse(const ExecutionRequest& request,
                                const runner::ExecutionOutcome& outcome,
                                const providers::ExplanationProvider& provider) {
    ResponseRecord record{};
    record.execution_time = outcome.duration_seconds;

    switch (outcome.status) {
        case runner::RunStatus::kExited:
            if (outcome.exit_code == 0) {
                record.status = ResponseStatus::kSuccess;
                record.output = outcome.output.empty() ? std::string(kNoOutputPlaceholder) : outcome.output;
                return record;
            }
            record.status = ResponseStatus::kError;
            record.error = outcome.error;
            record.explanation = provider.Explain(request.code, outcome.error);
            return record;

        case runner::RunStatus::kTimedOut:
            record.status = ResponseStatus::kError;
            if (diagnosis::IsInputStarved(request.code, request.stdin_text)) {
                record.error = std::string(diagnosis::kStarvationError);
                record.explanation = diagnosis::StarvationExplanation();
            } else {
                record.error = "Execution timed out after " + std::to_string(request.timeout_s) + " seconds";
            }
            return record;

        case runner::RunStatus::kDispatchFailed:
            record.status = ResponseStatus::kError;
            record.error = outcome.failure;
            return record;
    }

    record.status = ResponseStatus::kError;
    record.error = outcome.failure.empty() ? std::string("unknown execution state") : outcome.failure;
    return record;
}

RunService::RunService(const runner::ProcessRunner& runner,
                       const providers::ExplanationProvider& provider,
                       RequestLimits limits)
    : runner_(runner)
    , provider_(provider)
    , limits_(limits) {}

ResponseRecord RunService::Run(const ExecutionRequest& request) const {
    if (const auto invalid = ValidateRequest(request, limits_)) {
        ResponseRecord record{};
        record.status = ResponseStatus::kError;
        record.error = *invalid;
        return record;
    }

    const auto outcome = runner_.Run(request.code, request.stdin_text, std::chrono::seconds(request.timeout_s));
    utils::Log(
        utils::LogLevel::kInfo,
        "run",
        std::string("status=") + runner::ToString(outcome.status) +
            " exit=" + std::to_string(outcome.exit_code) +
            " duration=" + std::to_string(outcome.duration_seconds) + "s");
    if (!outcome.output.empty()) {
        utils::Log(utils::LogLevel::kDebug, "run", "stdout\n" + outcome.output);
    }
    if (!outcome.error.empty()) {
        utils::Log(utils::LogLevel::kDebug, "run", "stderr\n" + outcome.error);
    }
    return AssembleResponse(request, outcome, provider_);
}

}  // namespace coderun::service
