#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "config/config_schema.hpp"
#include "service/run_service.hpp"

namespace httplib {
class Server;
}

namespace coderun::server {

// POST /run, GET /health and GET / over cpp-httplib. Every request runs on
// a worker thread of its own, so one long-running program does not hold up
// the others.
class HttpServer {
public:
    HttpServer(const service::RunService& service, const coderun::config::ServerConfig& config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Blocks until Stop() is called. False when the address cannot be bound.
    bool Listen(const std::string& host, int port);

    // Binds an ephemeral port and returns it (-1 on failure); serve with
    // ListenAfterBind().
    int BindToAnyPort(const std::string& host);
    bool ListenAfterBind();

    void Stop();
    bool IsRunning() const;

private:
    void RegisterRoutes();

    const service::RunService& service_;
    std::filesystem::path frontend_index_;
    std::unique_ptr<httplib::Server> http_;
};

}  // namespace coderun::server
