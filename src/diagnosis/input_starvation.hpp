#pragma once

#include <string>

#include "diagnosis/explanation.hpp"

namespace coderun::diagnosis {

// Lexical check only: "input(" or "raw_input(" anywhere in the source,
// reachable or not. Indirect calls (aliases, getattr) are not seen.
bool RequestsInteractiveInput(const std::string& code);

// True when a timed-out run was most likely blocked on input it never got.
bool IsInputStarved(const std::string& code, const std::string& supplied_input);

extern const char* const kStarvationError;

Explanation StarvationExplanation();

}  // namespace coderun::diagnosis
