#pragma once

#include <optional>
#include <string>

#include "nlohmann/json.hpp"
#include "providers/explanation_provider.hpp"

namespace coderun::providers {

struct EndpointUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string base_path;
};

// Asks an Azure OpenAI chat deployment to explain the failure. Only the
// shape of the reply is checked; any failure yields DegradedNotice().
class AzureOpenAIProvider : public ExplanationProvider {
public:
    explicit AzureOpenAIProvider(ReasoningSettings settings);

    diagnosis::Explanation Explain(const std::string& code, const std::string& error_text) const override;
    std::string Name() const override { return "azure-openai"; }

    static nlohmann::json BuildPayload(const std::string& code, const std::string& error_text);
    static std::optional<diagnosis::Explanation> ParseReply(const std::string& body);
    static std::optional<diagnosis::Explanation> ParseExplanation(const nlohmann::json& json);

    // Splits "https://host[:port][/base]". Empty optional for a missing host
    // or a port that is not a plain number.
    static std::optional<EndpointUrl> ParseEndpoint(const std::string& url);

private:
    ReasoningSettings settings_;
};

}  // namespace coderun::providers
