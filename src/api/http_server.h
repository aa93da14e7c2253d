#pragma once

/// @file http_server.h
/// @brief cpp-httplib server exposing the drift detection API

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "api/drift_api.h"
#include "common/config.h"

namespace httplib {
class Server;
}  // namespace httplib

namespace sentinel::api {

/// @brief HTTP listener settings
struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;

    /// Read and write timeouts in seconds
    int read_timeout_seconds = 30;
    int write_timeout_seconds = 30;

    /// @brief Read the "server" section of a configuration
    static absl::StatusOr<ServerConfig> FromConfig(const Config& config);
};

/// @brief Binds DriftApi handlers to HTTP routes
///
/// Routes: GET /, GET /health, GET /metrics, POST /api/v1/drift/detect.
/// The server listens on a background thread between Start() and Stop().
class HttpServer {
public:
    HttpServer(ServerConfig config, std::shared_ptr<const DriftApi> api);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// @brief Bind the port and start serving
    /// @return UnavailableError if the address cannot be bound
    absl::Status Start();

    /// @brief Stop serving and join the listener thread
    void Stop();

    bool IsRunning() const { return running_.load(); }

    /// @brief Port actually bound (differs from the configured one when 0)
    int BoundPort() const { return bound_port_; }

private:
    void RegisterRoutes();

    ServerConfig config_;
    std::shared_ptr<const DriftApi> api_;
    std::unique_ptr<httplib::Server> server_;
    std::thread listen_thread_;
    std::atomic<bool> running_{false};
    int bound_port_ = 0;
};

}  // namespace sentinel::api
