#include "service/response_json.hpp"

#include <cmath>

#include "service/run_service.hpp"

namespace coderun::service {

nlohmann::json ToJson(const diagnosis::Explanation& explanation) {
    return {
        {"summary", explanation.summary},
        {"why_it_happened", explanation.why_it_happened},
        {"how_to_fix", explanation.how_to_fix},
        {"corrected_example", explanation.corrected_example.has_value()
            ? nlohmann::json(*explanation.corrected_example)
            : nlohmann::json(nullptr)},
        {"confidence", explanation.confidence}
    };
}

nlohmann::json ToJson(const ResponseRecord& record) {
    nlohmann::json json = nlohmann::json::object();
    json["status"] = ToString(record.status);
    if (record.output) {
        json["output"] = *record.output;
    }
    if (record.error) {
        json["error"] = *record.error;
    }
    if (record.explanation) {
        json["explanation"] = ToJson(*record.explanation);
    }
    if (record.execution_time) {
        json["execution_time"] = *record.execution_time;
    }
    return json;
}

std::string Serialize(const nlohmann::json& json, int indent) {
    return json.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Serialize(const ResponseRecord& record, int indent) {
    return Serialize(ToJson(record), indent);
}

bool ParseRunRequest(const std::string& body,
                     const RequestLimits& limits,
                     ExecutionRequest& request,
                     std::string& error) {
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        error = "request body must be a JSON object";
        return false;
    }

    if (!json.contains("code") || !json["code"].is_string()) {
        error = "code is required and must be a string";
        return false;
    }
    request.code = json["code"].get<std::string>();

    request.stdin_text.clear();
    if (json.contains("stdin") && !json["stdin"].is_null()) {
        if (!json["stdin"].is_string()) {
            error = "stdin must be a string";
            return false;
        }
        request.stdin_text = json["stdin"].get<std::string>();
    }

    request.timeout_s = limits.default_timeout_s;
    if (json.contains("timeout") && !json["timeout"].is_null()) {
        const auto& value = json["timeout"];
        double timeout = 0.0;
        if (value.is_number_integer()) {
            timeout = static_cast<double>(value.get<long long>());
        } else if (value.is_number_float() && std::isfinite(value.get<double>()) &&
                   std::floor(value.get<double>()) == value.get<double>()) {
            // Whole-valued floats such as 10.0 count as integers.
            timeout = value.get<double>();
        } else {
            error = "timeout must be an integer";
            return false;
        }
        if (timeout < limits.min_timeout_s || timeout > limits.max_timeout_s) {
            error = "timeout must be between " + std::to_string(limits.min_timeout_s) + " and " +
                std::to_string(limits.max_timeout_s) + " seconds";
            return false;
        }
        request.timeout_s = static_cast<int>(timeout);
    }

    if (const auto invalid = ValidateRequest(request, limits)) {
        error = *invalid;
        return false;
    }
    return true;
}

nlohmann::json StatusPayload() {
    return {
        {"service", "Code Execution Service"},
        {"status", "running"},
        {"endpoint", "/run"}
    };
}

}  // namespace coderun::service
