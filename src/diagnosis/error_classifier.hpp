#pragma once

#include <functional>
#include <string>
#include <vector>

#include "diagnosis/explanation.hpp"

namespace coderun::diagnosis {

struct ClassifierRule {
    std::string name;
    // Receives the lower-cased error text.
    std::function<bool(const std::string&)> matches;
    Explanation explanation;
};

// Offline diagnosis: the first rule whose predicate accepts the error text
// wins, otherwise the catch-all explanation is returned.
class ErrorClassifier {
public:
    ErrorClassifier();
    ErrorClassifier(std::vector<ClassifierRule> rules, Explanation fallback);

    Explanation Classify(const std::string& error_text) const;

    // Name of the rule that would fire, or "default".
    std::string MatchingRule(const std::string& error_text) const;

    const std::vector<ClassifierRule>& Rules() const { return rules_; }
    const Explanation& Fallback() const { return fallback_; }

private:
    const ClassifierRule* FindRule(const std::string& lowered) const;

    std::vector<ClassifierRule> rules_;
    Explanation fallback_;
};

std::vector<ClassifierRule> DefaultRules();
Explanation DefaultFallback();

}  // namespace coderun::diagnosis
