/// @file drift_api.cpp
/// @brief Drift detection API handlers

#include "api/drift_api.h"

#include <vector>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"
#include "data/dataset.h"
#include "drift/drift_report.h"

namespace sentinel::api {

namespace {

absl::StatusOr<data::Dataset> DatasetField(const nlohmann::ordered_json& request,
                                           std::string_view field) {
    auto it = request.find(std::string(field));
    if (it == request.end() || it->is_null()) {
        return absl::InvalidArgumentError(absl::StrCat("Missing required field '", absl::string_view(field.data(), field.size()), "'"));
    }
    auto dataset = data::Dataset::FromJson(*it);
    if (!dataset.ok()) {
        return absl::InvalidArgumentError(
            absl::StrCat("Invalid '", absl::string_view(field.data(), field.size()), "' dataset: ", dataset.status().message()));
    }
    return dataset;
}

}  // namespace

int HttpStatusFromStatus(const absl::Status& status) {
    switch (status.code()) {
        case absl::StatusCode::kOk:
            return 200;
        case absl::StatusCode::kInvalidArgument:
        case absl::StatusCode::kFailedPrecondition:
        case absl::StatusCode::kOutOfRange:
            return 400;
        case absl::StatusCode::kNotFound:
            return 404;
        case absl::StatusCode::kResourceExhausted:
            return 413;
        case absl::StatusCode::kUnimplemented:
            return 501;
        case absl::StatusCode::kUnavailable:
            return 503;
        default:
            return 500;
    }
}

ApiResponse ApiResponse::FromStatus(const absl::Status& status) {
    ApiResponse resp;
    resp.status_code = HttpStatusFromStatus(status);

    nlohmann::ordered_json body;
    body["error"] = std::string(status.message());
    if (auto code = GetErrorCode(status)) {
        body["code"] = std::string(ErrorCodeName(*code));
    }
    resp.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return resp;
}

absl::StatusOr<ApiConfig> ApiConfig::FromConfig(const Config& config) {
    ApiConfig result;
    SENTINEL_ASSIGN_OR_RETURN(result.detector, drift::DetectorConfig::FromConfig(config));

    int64_t max_body = 0;
    SENTINEL_ASSIGN_OR_RETURN(max_body,
                              config.ReadInt("server.max_request_body_bytes",
                                             static_cast<int64_t>(result.max_request_body_bytes)));
    if (max_body <= 0) {
        return MakeError(ErrorCode::kConfigurationError,
            absl::StrCat("server.max_request_body_bytes must be positive, got ", max_body));
    }
    result.max_request_body_bytes = static_cast<size_t>(max_body);
    return result;
}

DriftApi::DriftApi(ApiConfig config) : config_(std::move(config)) {}

ApiResponse DriftApi::HandleRoot() const {
    nlohmann::ordered_json body;
    body["status"] = "healthy";
    body["service"] = std::string(kServiceName);
    body["version"] = std::string(kServiceVersion);
    return ApiResponse::Ok(body);
}

ApiResponse DriftApi::HandleHealth() const {
    nlohmann::ordered_json body;
    body["api"] = "up";
    body["detector"] = "ready";
    return ApiResponse::Ok(body);
}

ApiResponse DriftApi::HandleMetrics() const {
    ApiResponse resp;
    resp.body = MetricsRegistry::Instance().ExportText();
    resp.content_type = "text/plain; version=0.0.4";
    return resp;
}

absl::StatusOr<drift::DetectorConfig> DriftApi::RequestDetectorConfig(
    const nlohmann::ordered_json& request) const {
    drift::DetectorConfig config = config_.detector;

    if (auto it = request.find("categorical_features"); it != request.end() && !it->is_null()) {
        if (!it->is_array()) {
            return absl::InvalidArgumentError("'categorical_features' must be an array of strings");
        }
        std::vector<std::string> names;
        for (const auto& name : *it) {
            if (!name.is_string()) {
                return absl::InvalidArgumentError(
                    "'categorical_features' must be an array of strings");
            }
            names.push_back(name.get<std::string>());
        }
        config.categorical_features = std::move(names);
    }

    if (auto it = request.find("significance_level"); it != request.end() && !it->is_null()) {
        if (!it->is_number()) {
            return absl::InvalidArgumentError("'significance_level' must be a number");
        }
        config.significance_level = it->get<double>();
    }

    if (auto it = request.find("psi_threshold"); it != request.end() && !it->is_null()) {
        if (!it->is_number()) {
            return absl::InvalidArgumentError("'psi_threshold' must be a number");
        }
        config.psi_threshold = it->get<double>();
    }

    if (auto it = request.find("psi_bins"); it != request.end() && !it->is_null()) {
        if (!it->is_number_integer() || it->get<int64_t>() < 2) {
            return absl::InvalidArgumentError("'psi_bins' must be an integer of at least 2");
        }
        config.psi_bins = it->get<size_t>();
    }

    SENTINEL_RETURN_IF_ERROR(config.Validate());
    return config;
}

ApiResponse DriftApi::HandleDetect(std::string_view body) const {
    SENTINEL_COUNTER("sentinel_api_requests_total").Increment();

    if (body.size() > config_.max_request_body_bytes) {
        SENTINEL_LOG_WARN("Rejecting detect request of {} bytes (limit {})",
                          body.size(), config_.max_request_body_bytes);
        return ApiResponse::PayloadTooLarge();
    }

    nlohmann::ordered_json request;
    try {
        request = nlohmann::ordered_json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        // parse_error, or out_of_range for numbers that overflow a double
        return ApiResponse::BadRequest(absl::StrCat("Invalid JSON: ", e.what()));
    }
    if (!request.is_object()) {
        return ApiResponse::BadRequest("Request body must be a JSON object");
    }

    auto reference = DatasetField(request, "reference");
    if (!reference.ok()) {
        return ApiResponse::BadRequest(std::string_view(reference.status().message().data(), reference.status().message().size()));
    }
    auto production = DatasetField(request, "production");
    if (!production.ok()) {
        return ApiResponse::BadRequest(std::string_view(production.status().message().data(), production.status().message().size()));
    }

    auto detector_config = RequestDetectorConfig(request);
    if (!detector_config.ok()) {
        return ApiResponse::FromStatus(detector_config.status());
    }

    auto detector = drift::DriftDetector::Create(std::move(*detector_config));
    if (!detector.ok()) {
        return ApiResponse::FromStatus(detector.status());
    }

    auto report = (*detector)->Detect(*reference, *production);
    if (!report.ok()) {
        SENTINEL_LOG_WARN("Detect request failed: {}", report.status().ToString());
        return ApiResponse::FromStatus(report.status());
    }

    return ApiResponse::Ok(drift::ReportToJson(*report));
}

}  // namespace sentinel::api
