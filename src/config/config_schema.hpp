#pragma once

#include <string>

namespace coderun::config {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    std::string frontend_index = "Frontend/index.html";
    int threads = 8;
};

struct RunnerConfig {
    std::string interpreter = "python3";
    std::string working_dir;
    int default_timeout_s = 10;
    int min_timeout_s = 1;
    int max_timeout_s = 60;
    int poll_interval_ms = 20;
    int kill_grace_ms = 500;
};

struct ReasoningConfig {
    std::string endpoint;
    std::string api_key;
    std::string deployment;
    std::string api_version = "2024-02-15-preview";
    int timeout_s = 30;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    ServerConfig server;
    RunnerConfig runner;
    ReasoningConfig reasoning;
    LoggingConfig logging;
};

}  // namespace coderun::config
