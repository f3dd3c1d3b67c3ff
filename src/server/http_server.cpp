#include "server/http_server.hpp"

#include <fstream>
#include <sstream>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "service/response_json.hpp"
#include "utils/logging.hpp"

namespace coderun::server {
namespace {

constexpr const char* kJson = "application/json";

bool ReadFile(const std::filesystem::path& path, std::string& content) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    content = buffer.str();
    return true;
}

}  // namespace

HttpServer::HttpServer(const service::RunService& service, const coderun::config::ServerConfig& config)
    : service_(service)
    , frontend_index_(config.frontend_index)
    , http_(std::make_unique<httplib::Server>()) {
    const auto threads = static_cast<std::size_t>(config.threads > 0 ? config.threads : 1);
    http_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    http_->set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Credentials", "true"}
    });
    RegisterRoutes();
}

HttpServer::~HttpServer() {
    Stop();
}

void HttpServer::RegisterRoutes() {
    http_->Options(R"(/.*)", [](const httplib::Request& req, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        const auto requested = req.get_header_value("Access-Control-Request-Headers");
        res.set_header("Access-Control-Allow-Headers", requested.empty() ? "*" : requested);
        res.status = 204;
    });

    http_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(service::StatusPayload().dump(), kJson);
    });

    http_->Get("/", [this](const httplib::Request&, httplib::Response& res) {
        std::string page;
        std::error_code ec;
        if (std::filesystem::is_regular_file(frontend_index_, ec) && ReadFile(frontend_index_, page)) {
            res.set_content(page, "text/html; charset=utf-8");
            return;
        }
        res.set_content(service::StatusPayload().dump(), kJson);
    });

    http_->Post("/run", [this](const httplib::Request& req, httplib::Response& res) {
        service::ExecutionRequest request{};
        std::string error;
        if (!service::ParseRunRequest(req.body, service_.Limits(), request, error)) {
            utils::Log(utils::LogLevel::kInfo, "http", "rejected /run: " + error);
            res.status = 422;
            res.set_content(service::Serialize(nlohmann::json{{"detail", error}}), kJson);
            return;
        }
        const auto record = service_.Run(request);
        res.set_content(service::Serialize(record), kJson);
    });

    http_->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& ex) {
            what = ex.what();
        } catch (...) {
            // Not derived from std::exception; reported as "unknown error".
        }
        utils::Log(utils::LogLevel::kError, "http", req.method + " " + req.path + " failed: " + what);
        res.status = 500;
        res.set_content(service::Serialize(nlohmann::json{{"status", "error"}, {"error", what}}), kJson);
    });

    http_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        utils::Log(
            utils::LogLevel::kDebug,
            "http",
            req.method + " " + req.path + " -> " + std::to_string(res.status));
    });
}

bool HttpServer::Listen(const std::string& host, int port) {
    utils::Log(utils::LogLevel::kInfo, "http", "listening on " + host + ":" + std::to_string(port));
    return http_->listen(host, port);
}

int HttpServer::BindToAnyPort(const std::string& host) {
    return http_->bind_to_any_port(host);
}

bool HttpServer::ListenAfterBind() {
    return http_->listen_after_bind();
}

void HttpServer::Stop() {
    if (http_ && http_->is_running()) {
        http_->stop();
    }
}

bool HttpServer::IsRunning() const {
    return http_ && http_->is_running();
}

}  // namespace coderun::server
