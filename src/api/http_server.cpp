/// @file http_server.cpp
/// @brief HTTP server implementation

#include "api/http_server.h"

#include <httplib.h>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace sentinel::api {

namespace {

void WriteResponse(const ApiResponse& api_response, httplib::Response& res) {
    res.status = api_response.status_code;
    res.set_content(api_response.body, api_response.content_type.c_str());
}

}  // namespace

absl::StatusOr<ServerConfig> ServerConfig::FromConfig(const Config& config) {
    ServerConfig result;
    result.host = config.GetString("server.host", result.host);

    int64_t port = 0;
    SENTINEL_ASSIGN_OR_RETURN(port, config.ReadInt("server.port", result.port));
    if (port < 0 || port > 65535) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("server.port out of range: ", port));
    }
    result.port = static_cast<int>(port);

    int64_t read_timeout = 0;
    SENTINEL_ASSIGN_OR_RETURN(read_timeout, config.ReadInt("server.read_timeout_seconds",
                                                           result.read_timeout_seconds));
    int64_t write_timeout = 0;
    SENTINEL_ASSIGN_OR_RETURN(write_timeout, config.ReadInt("server.write_timeout_seconds",
                                                            result.write_timeout_seconds));
    if (read_timeout <= 0 || write_timeout <= 0) {
        return MakeError(ErrorCode::kConfigurationError, "server timeouts must be positive");
    }
    result.read_timeout_seconds = static_cast<int>(read_timeout);
    result.write_timeout_seconds = static_cast<int>(write_timeout);
    return result;
}

HttpServer::HttpServer(ServerConfig config, std::shared_ptr<const DriftApi> api)
    : config_(std::move(config)), api_(std::move(api)) {}

HttpServer::~HttpServer() {
    Stop();
}

void HttpServer::RegisterRoutes() {
    server_->Get("/", [this](const httplib::Request&, httplib::Response& res) {
        WriteResponse(api_->HandleRoot(), res);
    });

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        WriteResponse(api_->HandleHealth(), res);
    });

    server_->Get("/metrics", [this](const httplib::Request&, httplib::Response& res) {
        WriteResponse(api_->HandleMetrics(), res);
    });

    server_->Post("/api/v1/drift/detect", [this](const httplib::Request& req,
                                                 httplib::Response& res) {
        SENTINEL_LOG_DEBUG("POST /api/v1/drift/detect from {} ({} bytes)",
                           req.remote_addr, req.body.size());
        WriteResponse(api_->HandleDetect(req.body), res);
    });
}

absl::Status HttpServer::Start() {
    if (running_.load()) {
        return absl::FailedPreconditionError("HTTP server already running");
    }

    server_ = std::make_unique<httplib::Server>();
    server_->set_read_timeout(config_.read_timeout_seconds, 0);
    server_->set_write_timeout(config_.write_timeout_seconds, 0);
    // Oversized bodies are refused by httplib with 413 before reaching a handler
    server_->set_payload_max_length(api_->GetConfig().max_request_body_bytes);
    RegisterRoutes();

    if (config_.port == 0) {
        bound_port_ = server_->bind_to_any_port(config_.host);
        if (bound_port_ <= 0) {
            return absl::UnavailableError(
                absl::StrCat("Failed to bind any port on ", config_.host));
        }
    } else {
        if (!server_->bind_to_port(config_.host, config_.port)) {
            return absl::UnavailableError(
                absl::StrCat("Failed to bind ", config_.host, ":", config_.port));
        }
        bound_port_ = config_.port;
    }

    running_ = true;
    listen_thread_ = std::thread([this]() {
        SENTINEL_LOG_INFO("HTTP server listening on {}:{}", config_.host, bound_port_);
        if (!server_->listen_after_bind()) {
            SENTINEL_LOG_ERROR("HTTP server on {}:{} stopped with an error",
                               config_.host, bound_port_);
        }
        running_ = false;
    });

    return absl::OkStatus();
}

void HttpServer::Stop() {
    if (server_) {
        server_->stop();
    }
    if (listen_thread_.joinable()) {
        listen_thread_.join();
    }
    running_ = false;
}

}  // namespace sentinel::api
