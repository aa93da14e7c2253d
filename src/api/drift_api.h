#pragma once

/// @file drift_api.h
/// @brief Request handling for the drift detection HTTP API
///
/// Handlers take the raw request body and return a fully formed response, so
/// they can be exercised without a socket. HttpServer binds them to routes.

#include <cstddef>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "common/config.h"
#include "drift/drift_detector.h"

namespace sentinel::api {

inline constexpr std::string_view kServiceName = "Sentinel ML Monitoring";
inline constexpr std::string_view kServiceVersion = "0.1.0";

/// @brief HTTP response produced by a handler
///
/// Bodies are serialized with invalid UTF-8 replaced by U+FFFD, since column
/// names and category labels arrive as raw bytes.
struct ApiResponse {
    int status_code = 200;
    std::string body;
    std::string content_type = "application/json";

    static ApiResponse Ok(const nlohmann::ordered_json& body) {
        ApiResponse resp;
        resp.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        return resp;
    }

    static ApiResponse Error(int status_code, std::string_view message) {
        ApiResponse resp;
        resp.status_code = status_code;
        resp.body = nlohmann::json{{"error", std::string(message)}}.dump(
            -1, ' ', false, nlohmann::json::error_handler_t::replace);
        return resp;
    }

    static ApiResponse BadRequest(std::string_view message) { return Error(400, message); }

    static ApiResponse PayloadTooLarge(std::string_view message = "Request body too large") {
        return Error(413, message);
    }

    /// @brief Error response for a failed status; adds "code" when the status
    ///        carries a domain ErrorCode
    static ApiResponse FromStatus(const absl::Status& status);
};

/// @brief Map a failed status onto an HTTP status code
int HttpStatusFromStatus(const absl::Status& status);

/// @brief API configuration
struct ApiConfig {
    /// Defaults for requests that do not override detector parameters
    drift::DetectorConfig detector;

    /// Largest accepted request body
    size_t max_request_body_bytes = 64 * 1024 * 1024;  // 64 MB

    /// @brief Detector defaults plus server.max_request_body_bytes
    static absl::StatusOr<ApiConfig> FromConfig(const Config& config);
};

/// @brief Stateless handlers behind the HTTP routes
class DriftApi {
public:
    explicit DriftApi(ApiConfig config = {});

    /// @brief GET /
    ApiResponse HandleRoot() const;

    /// @brief GET /health
    ApiResponse HandleHealth() const;

    /// @brief GET /metrics, Prometheus text format
    ApiResponse HandleMetrics() const;

    /// @brief POST /api/v1/drift/detect
    ///
    /// Body: {"reference": dataset, "production": dataset} plus optional
    /// "categorical_features", "significance_level", "psi_threshold" and
    /// "psi_bins". Datasets are column-oriented objects or arrays of rows.
    ApiResponse HandleDetect(std::string_view body) const;

    const ApiConfig& GetConfig() const { return config_; }

private:
    /// @brief Server defaults overlaid with the request's detector parameters
    absl::StatusOr<drift::DetectorConfig> RequestDetectorConfig(
        const nlohmann::ordered_json& request) const;

    ApiConfig config_;
};

}  // namespace sentinel::api
