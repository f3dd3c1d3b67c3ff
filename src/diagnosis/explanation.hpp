#pragma once

#include <optional>
#include <string>
#include <vector>

namespace coderun::diagnosis {

struct Explanation {
    std::string summary;
    std::string why_it_happened;
    std::vector<std::string> how_to_fix;
    std::optional<std::string> corrected_example;
    double confidence = 0.0;

    bool IsWellFormed() const {
        return !summary.empty() && !why_it_happened.empty() && !how_to_fix.empty() &&
            confidence >= 0.0 && confidence <= 1.0;
    }
};

inline bool operator==(const Explanation& lhs, const Explanation& rhs) {
    return lhs.summary == rhs.summary && lhs.why_it_happened == rhs.why_it_happened &&
        lhs.how_to_fix == rhs.how_to_fix && lhs.corrected_example == rhs.corrected_example &&
        lhs.confidence == rhs.confidence;
}

inline bool operator!=(const Explanation& lhs, const Explanation& rhs) {
    return !(lhs == rhs);
}

}  // namespace coderun::diagnosis
