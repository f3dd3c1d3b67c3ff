#include "diagnosis/input_starvation.hpp"

#include "utils/common.hpp"

namespace coderun::diagnosis {

const char* const kStarvationError = "Your code is waiting for input, but no input was provided.";

bool RequestsInteractiveInput(const std::string& code) {
    return code.find("input(") != std::string::npos ||
        code.find("raw_input(") != std::string::npos;
}

bool IsInputStarved(const std::string& code, const std::string& supplied_input) {
    return RequestsInteractiveInput(code) && utils::Trim(supplied_input).empty();
}

Explanation StarvationExplanation() {
    return Explanation{
        "Your code is waiting for user input.",
        "The script calls input() but the API call did not supply stdin data.",
        {"Add the expected input in the 'Program input' field before running",
         "Or remove input() calls if they are not required"},
        std::nullopt,
        0.95};
}

}  // namespace coderun::diagnosis
