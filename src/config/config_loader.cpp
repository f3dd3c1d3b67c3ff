#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace coderun::config {
namespace {

using utils::GetEnv;

// Upper bound on any request deadline, whatever the configuration says.
constexpr int kTimeoutCeilingS = 60;

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void ApplyString(std::string& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplyInt(int& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        ApplyString(config.server.host, server, "host");
        ApplyInt(config.server.port, server, "port");
        ApplyString(config.server.frontend_index, server, "frontendIndex");
        ApplyInt(config.server.threads, server, "threads");
    }

    if (data.contains("runner") && data["runner"].is_object()) {
        const auto& runner = data["runner"];
        ApplyString(config.runner.interpreter, runner, "interpreter");
        ApplyString(config.runner.working_dir, runner, "workingDir");
        ApplyInt(config.runner.default_timeout_s, runner, "defaultTimeoutS");
        ApplyInt(config.runner.min_timeout_s, runner, "minTimeoutS");
        ApplyInt(config.runner.max_timeout_s, runner, "maxTimeoutS");
        ApplyInt(config.runner.poll_interval_ms, runner, "pollIntervalMs");
        ApplyInt(config.runner.kill_grace_ms, runner, "killGraceMs");
    }

    if (data.contains("reasoning") && data["reasoning"].is_object()) {
        const auto& reasoning = data["reasoning"];
        ApplyString(config.reasoning.endpoint, reasoning, "endpoint");
        ApplyString(config.reasoning.api_key, reasoning, "apiKey");
        ApplyString(config.reasoning.deployment, reasoning, "deployment");
        ApplyString(config.reasoning.api_version, reasoning, "apiVersion");
        ApplyInt(config.reasoning.timeout_s, reasoning, "timeoutS");
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ApplyString(config.logging.level, data["logging"], "level");
    }
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

void ApplyEnvString(std::string& target, const char* primary, const char* secondary) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = value;
    }
}

void ApplyEnvInt(int& target, const char* primary, const char* secondary) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseInt(value, target);
    }
}

void ApplyConfigFromEnv(Config& config) {
    ApplyEnvString(config.server.host, "HOST", "CODERUN_SERVER__HOST");
    ApplyEnvInt(config.server.port, "PORT", "CODERUN_SERVER__PORT");
    ApplyEnvString(
        config.server.frontend_index,
        "CODERUN_SERVER__FRONTEND_INDEX",
        "CODERUN_SERVER_FRONTEND_INDEX");
    ApplyEnvInt(config.server.threads, "CODERUN_SERVER__THREADS", "CODERUN_SERVER_THREADS");

    ApplyEnvString(
        config.runner.interpreter,
        "CODERUN_RUNNER__INTERPRETER",
        "CODERUN_RUNNER_INTERPRETER");
    ApplyEnvString(
        config.runner.working_dir,
        "CODERUN_RUNNER__WORKING_DIR",
        "CODERUN_RUNNER_WORKING_DIR");
    ApplyEnvInt(
        config.runner.default_timeout_s,
        "CODERUN_RUNNER__DEFAULT_TIMEOUT_S",
        "CODERUN_RUNNER_DEFAULT_TIMEOUT_S");
    ApplyEnvInt(
        config.runner.min_timeout_s,
        "CODERUN_RUNNER__MIN_TIMEOUT_S",
        "CODERUN_RUNNER_MIN_TIMEOUT_S");
    ApplyEnvInt(
        config.runner.max_timeout_s,
        "CODERUN_RUNNER__MAX_TIMEOUT_S",
        "CODERUN_RUNNER_MAX_TIMEOUT_S");
    ApplyEnvInt(
        config.runner.poll_interval_ms,
        "CODERUN_RUNNER__POLL_INTERVAL_MS",
        "CODERUN_RUNNER_POLL_INTERVAL_MS");
    ApplyEnvInt(
        config.runner.kill_grace_ms,
        "CODERUN_RUNNER__KILL_GRACE_MS",
        "CODERUN_RUNNER_KILL_GRACE_MS");

    ApplyEnvString(config.reasoning.endpoint, "AZURE_OPENAI_ENDPOINT", "CODERUN_REASONING__ENDPOINT");
    ApplyEnvString(config.reasoning.api_key, "AZURE_OPENAI_API_KEY", "CODERUN_REASONING__API_KEY");
    ApplyEnvString(
        config.reasoning.deployment,
        "AZURE_OPENAI_DEPLOYMENT",
        "CODERUN_REASONING__DEPLOYMENT");
    ApplyEnvString(
        config.reasoning.api_version,
        "AZURE_OPENAI_API_VERSION",
        "CODERUN_REASONING__API_VERSION");
    ApplyEnvInt(
        config.reasoning.timeout_s,
        "CODERUN_REASONING__TIMEOUT_S",
        "CODERUN_REASONING_TIMEOUT_S");

    ApplyEnvString(config.logging.level, "CODERUN_LOGGING__LEVEL", "CODERUN_LOG_LEVEL");
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("CODERUN_CONFIG");
    if (!explicit_path.empty()) {
        return std::filesystem::path(explicit_path);
    }
    return GetHomePath() / ".coderun" / "config.json";
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(config_path, ec)) {
        std::ifstream input(config_path);
        if (!input.is_open()) {
            utils::Log(utils::LogLevel::kWarn, "config", "cannot open " + config_path.string());
        } else {
            try {
                nlohmann::json data;
                input >> data;
                ApplyConfigFromJson(config, data);
            } catch (const nlohmann::json::exception& ex) {
                utils::Log(
                    utils::LogLevel::kWarn,
                    "config",
                    "ignoring " + config_path.string() + ": " + ex.what());
            }
        }
    }

    ApplyConfigFromEnv(config);

    if (config.runner.min_timeout_s < 1) {
        config.runner.min_timeout_s = 1;
    }
    config.runner.min_timeout_s = std::min(config.runner.min_timeout_s, kTimeoutCeilingS);
    config.runner.max_timeout_s = std::clamp(
        config.runner.max_timeout_s,
        config.runner.min_timeout_s,
        kTimeoutCeilingS);
    config.runner.default_timeout_s = std::clamp(
        config.runner.default_timeout_s,
        config.runner.min_timeout_s,
        config.runner.max_timeout_s);
    if (config.runner.poll_interval_ms < 1) {
        config.runner.poll_interval_ms = 1;
    }
    if (config.runner.kill_grace_ms < 0) {
        config.runner.kill_grace_ms = 0;
    }
    if (config.server.threads < 1) {
        config.server.threads = 1;
    }
    return config;
}

}  // namespace coderun::config
