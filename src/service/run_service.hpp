#pragma once

#include <optional>
#include <string>

#include "providers/explanation_provider.hpp"
#include "runner/process_runner.hpp"
#include "service/run_types.hpp"

namespace coderun::service {

extern const char* const kNoOutputPlaceholder;

// Empty optional when the request may be executed, otherwise the reason.
std::optional<std::string> ValidateRequest(const ExecutionRequest& request, const RequestLimits& limits);

// Turns one execution outcome into the record sent back to the caller.
ResponseRecord AssembleResponse(const ExecutionRequest& request,
                                const runner::ExecutionOutcome& outcome,
                                const providers::ExplanationProvider& provider);

// Runs requests through the runner and assembles the response. Holds no
// per-request state, so one instance serves concurrent callers.
class RunService {
public:
    RunService(const runner::ProcessRunner& runner,
               const providers::ExplanationProvider& provider,
               RequestLimits limits);

    // Callers validate first; an invalid request yields an error record
    // without execution_time.
    ResponseRecord Run(const ExecutionRequest& request) const;

    const RequestLimits& Limits() const { return limits_; }

private:
    const runner::ProcessRunner& runner_;
    const providers::ExplanationProvider& provider_;
    RequestLimits limits_;
};

}  // namespace coderun::service
