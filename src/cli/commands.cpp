#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config/config_loader.hpp"
#include "providers/explanation_provider.hpp"
#include "runner/process_runner.hpp"
#include "server/http_server.hpp"
#include "service/response_json.hpp"
#include "service/run_service.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void PrintUsage() {
    std::cout << "Usage: coderun_cli serve\n"
              << "       coderun_cli run <file|-> [--stdin <file>] [--timeout <seconds>]\n"
              << "       coderun_cli health" << std::endl;
}

coderun::runner::RunnerOptions MakeRunnerOptions(const coderun::config::RunnerConfig& config) {
    coderun::runner::RunnerOptions options{};
    options.interpreter = config.interpreter;
    options.working_dir = config.working_dir;
    options.poll_interval = std::chrono::milliseconds(config.poll_interval_ms);
    options.kill_grace = std::chrono::milliseconds(config.kill_grace_ms);
    return options;
}

coderun::service::RequestLimits MakeLimits(const coderun::config::RunnerConfig& config) {
    coderun::service::RequestLimits limits{};
    limits.default_timeout_s = config.default_timeout_s;
    limits.min_timeout_s = config.min_timeout_s;
    limits.max_timeout_s = config.max_timeout_s;
    return limits;
}

bool ReadSource(const std::string& path, std::string& content) {
    if (path == "-") {
        content.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    content = buffer.str();
    return true;
}

int Serve(const coderun::config::Config& config, const coderun::service::RunService& service) {
    coderun::server::HttpServer http_server(service, config.server);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::atomic<bool> listen_failed{false};
    const std::string host = config.server.host;
    const int port = config.server.port;
    std::thread http_thread([&http_server, &listen_failed, host, port]() {
        if (!http_server.Listen(host, port)) {
            coderun::utils::Log(
                coderun::utils::LogLevel::kError,
                "http",
                "failed to listen on " + host + ":" + std::to_string(port));
            listen_failed.store(true);
        }
    });

    std::cout << "coderun listening on " << host << ":" << port << ". Press Ctrl+C to stop." << std::endl;
    while (g_signal == 0 && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    http_server.Stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    return listen_failed.load() ? 1 : 0;
}

int RunOnce(const std::vector<std::string>& args,
            const coderun::service::RunService& service) {
    if (args.empty()) {
        PrintUsage();
        return 2;
    }

    coderun::service::ExecutionRequest request{};
    request.timeout_s = service.Limits().default_timeout_s;
    if (!ReadSource(args[0], request.code)) {
        std::cerr << "cannot read " << args[0] << std::endl;
        return 2;
    }

    for (std::size_t i = 1; i < args.size(); ++i) {
        if (args[i] == "--stdin" && i + 1 < args.size()) {
            if (!ReadSource(args[++i], request.stdin_text)) {
                std::cerr << "cannot read " << args[i] << std::endl;
                return 2;
            }
        } else if (args[i] == "--timeout" && i + 1 < args.size()) {
            try {
                request.timeout_s = std::stoi(args[++i]);
            } catch (const std::logic_error&) {
                std::cerr << "invalid timeout: " << args[i] << std::endl;
                return 2;
            }
        } else {
            PrintUsage();
            return 2;
        }
    }

    if (const auto invalid = coderun::service::ValidateRequest(request, service.Limits())) {
        std::cerr << *invalid << std::endl;
        return 2;
    }

    const auto record = service.Run(request);
    std::cout << coderun::service::Serialize(record, 2) << std::endl;
    return record.status == coderun::service::ResponseStatus::kSuccess ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 2;
    }
    const std::string command = argv[1];
    if (command == "health") {
        std::cout << coderun::service::StatusPayload().dump(2) << std::endl;
        return 0;
    }
    if (command != "serve" && command != "run") {
        PrintUsage();
        return 2;
    }

    const auto config = coderun::config::LoadConfig();
    coderun::utils::SetMinLogLevel(
        coderun::utils::ParseLogLevel(config.logging.level, coderun::utils::LogLevel::kInfo));

    // The readiness decision is taken here, once, and the chosen provider is
    // shared read-only by every request.
    const auto settings = coderun::providers::ResolveReasoningSettings(config);
    const auto provider = coderun::providers::CreateProvider(settings);
    const coderun::runner::ProcessRunner runner(MakeRunnerOptions(config.runner));
    const coderun::service::RunService service(runner, *provider, MakeLimits(config.runner));

    if (command == "serve") {
        return Serve(config, service);
    }
    return RunOnce(std::vector<std::string>(argv + 2, argv + argc), service);
}
