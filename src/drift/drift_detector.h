#pragma once

/// @file drift_detector.h
/// @brief Drift detection entry point: classify, compare every feature, aggregate

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/config.h"
#include "common/thread_pool.h"
#include "data/dataset.h"
#include "drift/categorical_comparator.h"
#include "drift/continuous_comparator.h"
#include "drift/drift_report.h"
#include "drift/feature_classifier.h"

namespace sentinel::drift {

/// @brief Distinct feature labels kept on sentinel_feature_drift_total; later
///        features are counted under kOtherFeatureLabel
inline constexpr size_t kMaxFeatureDriftSeries = 256;
inline constexpr const char* kOtherFeatureLabel = "other";

/// @brief Configuration for a drift detector
struct DetectorConfig {
    /// p-value threshold for the KS and Chi-square tests, in (0, 1)
    double significance_level = 0.05;

    /// PSI value at or above which a continuous feature drifts, > 0
    double psi_threshold = 0.25;

    /// Requested PSI bin count, >= 2
    size_t psi_bins = 10;

    /// Worker threads for per-feature comparisons (1 = run inline)
    size_t num_workers = 1;

    /// Explicit categorical features; replaces auto-detection when set
    std::optional<std::vector<std::string>> categorical_features;

    /// @brief Check parameter ranges
    /// @return InvalidArgumentError naming the offending parameter
    absl::Status Validate() const;

    /// @brief Read the "detector" section of a configuration, falling back to
    ///        defaults for absent keys
    static absl::StatusOr<DetectorConfig> FromConfig(const Config& config);
};

/// @brief Detects drift between a reference and a production dataset
///
/// Every reference column is classified once (continuous or categorical) from
/// the reference data alone. Continuous features get a KS test and PSI,
/// categorical features a Chi-square test. All features are always evaluated;
/// the report lists drifted features in traversal order (continuous first).
///
/// A feature whose comparison cannot be computed is recorded with its error
/// and listed in features_with_errors; the rest of the report is unaffected.
///
/// Example usage:
/// @code
///   auto detector = DriftDetector::Create(DetectorConfig{});
///   if (!detector.ok()) { ... }
///   auto report = (*detector)->Detect(reference, production);
///   if (report.ok() && report->drift_detected) {
///       for (const auto& name : report->features_with_drift) { ... }
///   }
/// @endcode
class DriftDetector {
public:
    /// @brief Create a detector after validating its configuration
    static absl::StatusOr<std::unique_ptr<DriftDetector>> Create(DetectorConfig config);

    ~DriftDetector();

    DriftDetector(const DriftDetector&) = delete;
    DriftDetector& operator=(const DriftDetector&) = delete;

    /// @brief Compare production against reference for every feature
    /// @return InvalidArgumentError for empty datasets, mismatched column sets
    ///         or unknown categorical override names
    absl::StatusOr<DriftReport> Detect(const data::Dataset& reference,
                                       const data::Dataset& production) const;

    /// @brief Partition the reference dataset the way Detect would
    absl::StatusOr<FeaturePartition> Classify(const data::Dataset& reference) const;

    const DetectorConfig& GetConfig() const { return config_; }

private:
    explicit DriftDetector(DetectorConfig config);

    /// @brief Input validity checks shared by Detect
    absl::Status ValidateInputs(const data::Dataset& reference,
                                const data::Dataset& production) const;

    /// @brief Compare a single feature; never fails, errors go into the result
    ComparisonResult CompareFeature(const Feature& feature,
                                    const data::Dataset& reference,
                                    const data::Dataset& production) const;

    DetectorConfig config_;
    FeatureClassifier classifier_;
    ContinuousComparator continuous_;
    CategoricalComparator categorical_;
    std::unique_ptr<ThreadPool> pool_;
};

}  // namespace sentinel::drift
