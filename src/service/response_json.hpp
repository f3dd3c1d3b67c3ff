#pragma once

#include <string>

#include "nlohmann/json.hpp"
#include "service/run_types.hpp"

namespace coderun::service {

nlohmann::json ToJson(const diagnosis::Explanation& explanation);
nlohmann::json ToJson(const ResponseRecord& record);

// Program output is arbitrary bytes; invalid UTF-8 becomes U+FFFD instead of
// failing the response.
std::string Serialize(const nlohmann::json& json, int indent = -1);
std::string Serialize(const ResponseRecord& record, int indent = -1);

// Decodes a /run body and checks it against the limits. On failure returns
// false and leaves the reason in error.
bool ParseRunRequest(const std::string& body,
                     const RequestLimits& limits,
                     ExecutionRequest& request,
                     std::string& error);

nlohmann::json StatusPayload();

}  // namespace coderun::service
