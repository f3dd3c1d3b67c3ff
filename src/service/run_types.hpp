#pragma once

#include <optional>
#include <string>

#include "diagnosis/explanation.hpp"

namespace coderun::service {

struct ExecutionRequest {
    std::string code;
    std::string stdin_text;
    int timeout_s = 10;
};

enum class ResponseStatus {
    kSuccess,
    kError
};

inline const char* ToString(ResponseStatus status) {
    switch (status) {
        case ResponseStatus::kSuccess: return "success";
        case ResponseStatus::kError: return "error";
    }
    return "error";
}

struct ResponseRecord {
    ResponseStatus status = ResponseStatus::kError;
    std::optional<std::string> output;
    std::optional<std::string> error;
    std::optional<diagnosis::Explanation> explanation;
    std::optional<double> execution_time;
};

struct RequestLimits {
    int default_timeout_s = 10;
    int min_timeout_s = 1;
    int max_timeout_s = 60;
};

}  // namespace coderun::service
