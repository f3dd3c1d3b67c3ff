#pragma once

#include <string>

#include "diagnosis/error_classifier.hpp"
#include "providers/explanation_provider.hpp"

namespace coderun::providers {

class OfflineProvider : public ExplanationProvider {
public:
    OfflineProvider() = default;
    explicit OfflineProvider(diagnosis::ErrorClassifier classifier);

    diagnosis::Explanation Explain(const std::string& code, const std::string& error_text) const override;
    std::string Name() const override { return "offline"; }

private:
    diagnosis::ErrorClassifier classifier_;
};

}  // namespace coderun::providers
