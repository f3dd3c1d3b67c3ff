#include "providers/explanation_provider.hpp"

#include "providers/azure_openai_provider.hpp"
#include "providers/offline_provider.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace coderun::providers {

ReasoningSettings ResolveReasoningSettings(const coderun::config::Config& config) {
    ReasoningSettings settings{};
    settings.endpoint = utils::Trim(config.reasoning.endpoint);
    settings.api_key = utils::Trim(config.reasoning.api_key);
    settings.deployment = utils::Trim(config.reasoning.deployment);
    settings.api_version = config.reasoning.api_version.empty()
        ? "2024-02-15-preview"
        : config.reasoning.api_version;
    settings.timeout_s = config.reasoning.timeout_s > 0 ? config.reasoning.timeout_s : 30;
    return settings;
}

std::unique_ptr<ExplanationProvider> CreateProvider(const ReasoningSettings& settings) {
    if (settings.Ready()) {
        utils::Log(
            utils::LogLevel::kInfo,
            "explain",
            "remote reasoning enabled endpoint=" + settings.endpoint +
                " deployment=" + settings.deployment +
                " api_key=" + utils::MaskKey(settings.api_key));
        return std::make_unique<AzureOpenAIProvider>(settings);
    }
    utils::Log(utils::LogLevel::kInfo, "explain", "remote reasoning not configured; using offline rules");
    return std::make_unique<OfflineProvider>();
}

diagnosis::Explanation DegradedNotice() {
    return diagnosis::Explanation{
        "A full explanation is not available right now.",
        "The explanation service is enabled but did not return a usable answer.",
        {"Read the error message above", "Try running the code again later for a detailed explanation"},
        std::nullopt,
        0.5};
}

}  // namespace coderun::providers
