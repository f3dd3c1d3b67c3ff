#include "providers/azure_openai_provider.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "httplib.h"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace coderun::providers {
namespace {

constexpr const char* kSystemPrompt =
    "You explain Python errors to beginners. Reply with one JSON object and nothing else, "
    "with exactly these keys: \"summary\" (one sentence), \"why_it_happened\" (one sentence), "
    "\"how_to_fix\" (array of short actionable strings, at least one), "
    "\"corrected_example\" (a short corrected snippet, or null), "
    "\"confidence\" (number between 0 and 1).";

// Models sometimes wrap JSON in a ```json fence.
std::string StripCodeFence(const std::string& text) {
    auto trimmed = utils::Trim(text);
    if (trimmed.rfind("```", 0) != 0) {
        return trimmed;
    }
    const auto first_newline = trimmed.find('\n');
    const auto closing = trimmed.rfind("```");
    if (first_newline == std::string::npos || closing <= first_newline) {
        return trimmed;
    }
    return trimmed.substr(first_newline + 1, closing - first_newline - 1);
}

}  // namespace

AzureOpenAIProvider::AzureOpenAIProvider(ReasoningSettings settings)
    : settings_(std::move(settings)) {}

std::optional<EndpointUrl> AzureOpenAIProvider::ParseEndpoint(const std::string& url) {
    EndpointUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        const auto port_text = host_port.substr(colon_pos + 1);
        const bool digits_only = !port_text.empty() &&
            std::all_of(port_text.begin(), port_text.end(), [](unsigned char c) { return std::isdigit(c); });
        if (!digits_only) {
            return std::nullopt;
        }
        try {
            parsed.port = std::stoi(port_text);
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
        if (parsed.port <= 0 || parsed.port > 65535) {
            return std::nullopt;
        }
    } else {
        parsed.host = host_port;
    }

    while (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }
    if (parsed.host.empty()) {
        return std::nullopt;
    }
    return parsed;
}

nlohmann::json AzureOpenAIProvider::BuildPayload(const std::string& code, const std::string& error_text) {
    std::string user_content = "Code:\n```python\n" + code + "\n```\n\nError:\n" + error_text;
    return {
        {"messages", nlohmann::json::array({
            {{"role", "system"}, {"content", kSystemPrompt}},
            {{"role", "user"}, {"content", user_content}}
        })},
        {"temperature", 0.2},
        {"max_tokens", 800},
        {"response_format", {{"type", "json_object"}}}
    };
}

std::optional<diagnosis::Explanation> AzureOpenAIProvider::ParseExplanation(const nlohmann::json& json) {
    if (!json.is_object()) {
        return std::nullopt;
    }
    if (!json.contains("summary") || !json["summary"].is_string() ||
        !json.contains("why_it_happened") || !json["why_it_happened"].is_string() ||
        !json.contains("how_to_fix") || !json["how_to_fix"].is_array() ||
        !json.contains("confidence") || !json["confidence"].is_number()) {
        return std::nullopt;
    }

    diagnosis::Explanation explanation{};
    explanation.summary = json["summary"].get<std::string>();
    explanation.why_it_happened = json["why_it_happened"].get<std::string>();
    for (const auto& step : json["how_to_fix"]) {
        if (!step.is_string()) {
            return std::nullopt;
        }
        explanation.how_to_fix.push_back(step.get<std::string>());
    }
    if (json.contains("corrected_example")) {
        const auto& example = json["corrected_example"];
        if (example.is_string()) {
            explanation.corrected_example = example.get<std::string>();
        } else if (!example.is_null()) {
            return std::nullopt;
        }
    }
    explanation.confidence = json["confidence"].get<double>();

    if (!explanation.IsWellFormed()) {
        return std::nullopt;
    }
    return explanation;
}

std::optional<diagnosis::Explanation> AzureOpenAIProvider::ParseReply(const std::string& body) {
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }
    if (!json.contains("choices") || !json["choices"].is_array() || json["choices"].empty()) {
        return std::nullopt;
    }
    const auto& choice = json["choices"][0];
    if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object()) {
        return std::nullopt;
    }
    const auto& message = choice["message"];
    if (!message.contains("content") || !message["content"].is_string()) {
        return std::nullopt;
    }
    const auto content = nlohmann::json::parse(
        StripCodeFence(message["content"].get<std::string>()), nullptr, false);
    if (content.is_discarded()) {
        return std::nullopt;
    }
    return ParseExplanation(content);
}

diagnosis::Explanation AzureOpenAIProvider::Explain(const std::string& code,
                                                    const std::string& error_text) const {
    const auto parsed = ParseEndpoint(settings_.endpoint);
    if (!parsed) {
        utils::Log(utils::LogLevel::kError, "explain", "invalid endpoint: " + settings_.endpoint);
        return DegradedNotice();
    }

    const std::string endpoint = parsed->base_path + "/openai/deployments/" + settings_.deployment +
        "/chat/completions?api-version=" + settings_.api_version;
    std::string scheme_host_port = parsed->https ? "https://" : "http://";
    scheme_host_port += parsed->host + ":" + std::to_string(parsed->port);

    try {
        auto client = std::make_unique<httplib::Client>(scheme_host_port);
        if (!client->is_valid()) {
            utils::Log(utils::LogLevel::kError, "explain", "cannot create client for " + scheme_host_port);
            return DegradedNotice();
        }
        client->set_connection_timeout(settings_.timeout_s);
        client->set_read_timeout(settings_.timeout_s);

        utils::Log(
            utils::LogLevel::kDebug,
            "explain",
            "POST " + scheme_host_port + endpoint + " api_key=" + utils::MaskKey(settings_.api_key));

        httplib::Headers headers{{"api-key", settings_.api_key}};
        const auto payload = BuildPayload(code, error_text);
        auto response = client->Post(
            endpoint,
            headers,
            payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
            "application/json");
        if (!response) {
            utils::Log(
                utils::LogLevel::kWarn,
                "explain",
                "request failed: " + httplib::to_string(response.error()));
            return DegradedNotice();
        }
        if (response->status >= 400) {
            utils::Log(
                utils::LogLevel::kWarn,
                "explain",
                "HTTP " + std::to_string(response->status) + " body=" + response->body);
            return DegradedNotice();
        }

        auto explanation = ParseReply(response->body);
        if (!explanation) {
            utils::Log(utils::LogLevel::kWarn, "explain", "reply does not have the expected shape");
            return DegradedNotice();
        }
        return *explanation;
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "explain", std::string("remote explain failed: ") + ex.what());
        return DegradedNotice();
    }
}

}  // namespace coderun::providers
