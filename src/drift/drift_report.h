#pragma once

/// @file drift_report.h
/// @brief Aggregated drift verdict across all features

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "drift/comparison_result.h"
#include "drift/feature_classifier.h"

namespace sentinel::drift {

/// @brief Result of one detection run
///
/// Feature details are stored in traversal order: continuous features first,
/// then categorical ones, each in reference column order.
struct DriftReport {
    /// True iff at least one feature drifted
    bool drift_detected = false;

    /// Drifted feature names in traversal order
    std::vector<std::string> features_with_drift;

    /// Features whose comparison failed, in traversal order
    std::vector<std::string> features_with_errors;

    /// Partition the report was computed over
    FeaturePartition partition;

    /// One entry per feature, in traversal order
    std::vector<ComparisonResult> feature_details;

    /// @brief Look up a feature's result
    /// @return Pointer to the result or nullptr if the feature is unknown
    const ComparisonResult* Find(std::string_view feature) const;

    /// @brief True if every feature was compared successfully
    bool Complete() const { return features_with_errors.empty(); }
};

/// @brief Serialize one feature result
nlohmann::ordered_json ComparisonResultToJson(const ComparisonResult& result);

/// @brief Serialize a report to a nested JSON object
///
/// Layout: drift_detected, features_with_drift, features_with_errors,
/// continuous_features, categorical_features, feature_details (an object keyed
/// by feature name, in traversal order).
nlohmann::ordered_json ReportToJson(const DriftReport& report);

/// @brief Serialized ReportToJson(); invalid UTF-8 in names and labels is
///        replaced with U+FFFD instead of failing
/// @param indent Pretty-print indent, or -1 for compact output
std::string ReportToJsonText(const DriftReport& report, int indent = -1);

/// @brief Human-readable summary: partition, verdict and a per-feature table
std::string FormatReport(const DriftReport& report);

}  // namespace sentinel::drift
