#include "diagnosis/error_classifier.hpp"

#include <utility>

#include "utils/common.hpp"

namespace coderun::diagnosis {
namespace {

std::function<bool(const std::string&)> Contains(std::string needle) {
    return [needle = std::move(needle)](const std::string& lowered) {
        return lowered.find(needle) != std::string::npos;
    };
}

}  // namespace

std::vector<ClassifierRule> DefaultRules() {
    std::vector<ClassifierRule> rules;

    rules.push_back(ClassifierRule{
        "undefined_name",
        Contains("nameerror"),
        Explanation{
            "You used a variable before defining it.",
            "Python could not find the variable name.",
            {"Define the variable before using it", "Check spelling"},
            std::string("x = 10\nprint(x)"),
            0.95}});

    rules.push_back(ClassifierRule{
        "division_by_zero",
        Contains("zerodivisionerror"),
        Explanation{
            "You divided a number by zero.",
            "Division by zero is undefined.",
            {"Ensure the denominator is not zero"},
            std::string("if y != 0:\n    print(x / y)"),
            0.95}});

    rules.push_back(ClassifierRule{
        "syntax",
        Contains("syntaxerror"),
        Explanation{
            "There is a syntax mistake in your code.",
            "Python could not parse the code.",
            {"Check brackets, colons, indentation"},
            std::nullopt,
            0.85}});

    return rules;
}

Explanation DefaultFallback() {
    return Explanation{
        "Your code caused an error.",
        "Python encountered a runtime problem.",
        {"Read the error message", "Fix the issue and retry"},
        std::nullopt,
        0.70};
}

ErrorClassifier::ErrorClassifier()
    : ErrorClassifier(DefaultRules(), DefaultFallback()) {}

ErrorClassifier::ErrorClassifier(std::vector<ClassifierRule> rules, Explanation fallback)
    : rules_(std::move(rules))
    , fallback_(std::move(fallback)) {}

const ClassifierRule* ErrorClassifier::FindRule(const std::string& lowered) const {
    for (const auto& rule : rules_) {
        if (rule.matches && rule.matches(lowered)) {
            return &rule;
        }
    }
    return nullptr;
}

Explanation ErrorClassifier::Classify(const std::string& error_text) const {
    const auto* rule = FindRule(utils::ToLower(error_text));
    return rule ? rule->explanation : fallback_;
}

std::string ErrorClassifier::MatchingRule(const std::string& error_text) const {
    const auto* rule = FindRule(utils::ToLower(error_text));
    return rule ? rule->name : std::string("default");
}

}  // namespace coderun::diagnosis
