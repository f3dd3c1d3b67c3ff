#pragma once

#include <memory>
#include <string>

#include "config/config_schema.hpp"
#include "diagnosis/explanation.hpp"

namespace coderun::providers {

// Resolved once at startup and never changed; the readiness gate reads only
// this value.
struct ReasoningSettings {
    std::string endpoint;
    std::string api_key;
    std::string deployment;
    std::string api_version;
    int timeout_s = 30;

    bool Ready() const { return !endpoint.empty() && !api_key.empty() && !deployment.empty(); }
};

class ExplanationProvider {
public:
    virtual ~ExplanationProvider() = default;
    virtual diagnosis::Explanation Explain(const std::string& code, const std::string& error_text) const = 0;
    virtual std::string Name() const = 0;
};

ReasoningSettings ResolveReasoningSettings(const coderun::config::Config& config);

// Remote provider when the settings are ready, offline classifier otherwise.
std::unique_ptr<ExplanationProvider> CreateProvider(const ReasoningSettings& settings);

// Returned by the remote provider when it cannot produce an answer.
diagnosis::Explanation DegradedNotice();

}  // namespace coderun::providers
