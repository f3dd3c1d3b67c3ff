#include "providers/offline_provider.hpp"

#include <utility>

#include "utils/logging.hpp"

namespace coderun::providers {

OfflineProvider::OfflineProvider(diagnosis::ErrorClassifier classifier)
    : classifier_(std::move(classifier)) {}

diagnosis::Explanation OfflineProvider::Explain(const std::string& /*code*/,
                                                const std::string& error_text) const {
    utils::Log(utils::LogLevel::kDebug, "explain", "offline rule=" + classifier_.MatchingRule(error_text));
    return classifier_.Classify(error_text);
}

}  // namespace coderun::providers
