/// @file drift_detector.cpp
/// @brief Drift aggregation implementation

#include "drift/drift_detector.h"

#include <algorithm>
#include <iterator>
#include <set>
#include <utility>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"

namespace sentinel::drift {

namespace {

void DescribeMetrics() {
    auto& registry = MetricsRegistry::Instance();
    registry.Describe("sentinel_detections_total", "Drift detection runs");
    registry.Describe("sentinel_detection_seconds", "Wall time of one detection run");
    registry.Describe("sentinel_features_evaluated_total", "Features compared across all runs");
    registry.Describe("sentinel_feature_errors_total", "Feature comparisons that failed");
    registry.Describe("sentinel_drift_detected_total", "Runs with at least one drifted feature");
    registry.Describe("sentinel_feature_drift_total",
                      "Runs in which the feature drifted; features past the series cap share one");
    registry.Describe("sentinel_last_drifted_features", "Drifted features in the latest run");
}

}  // namespace

// =============================================================================
// DetectorConfig
// =============================================================================

absl::Status DetectorConfig::Validate() const {
    if (!(significance_level > 0.0 && significance_level < 1.0)) {
        return MakeError(ErrorCode::kConfigurationError, absl::StrCat(
            "significance_level must be in (0, 1), got ", significance_level));
    }
    if (!(psi_threshold > 0.0)) {
        return MakeError(ErrorCode::kConfigurationError, absl::StrCat(
            "psi_threshold must be positive, got ", psi_threshold));
    }
    if (psi_bins < 2) {
        return MakeError(ErrorCode::kConfigurationError, absl::StrCat(
            "psi_bins must be at least 2, got ", psi_bins));
    }
    if (num_workers == 0) {
        return MakeError(ErrorCode::kConfigurationError, "num_workers must be at least 1");
    }
    return absl::OkStatus();
}

absl::StatusOr<DetectorConfig> DetectorConfig::FromConfig(const Config& config) {
    DetectorConfig result;
    SENTINEL_ASSIGN_OR_RETURN(result.significance_level,
                              config.ReadDouble("detector.significance_level",
                                                result.significance_level));
    SENTINEL_ASSIGN_OR_RETURN(result.psi_threshold,
                              config.ReadDouble("detector.psi_threshold", result.psi_threshold));

    int64_t bins = 0;
    SENTINEL_ASSIGN_OR_RETURN(bins, config.ReadInt("detector.psi_bins",
                                                   static_cast<int64_t>(result.psi_bins)));
    if (bins < 2) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("detector.psi_bins must be at least 2, got ", bins));
    }
    result.psi_bins = static_cast<size_t>(bins);

    int64_t workers = 0;
    SENTINEL_ASSIGN_OR_RETURN(workers, config.ReadInt("detector.num_workers",
                                                      static_cast<int64_t>(result.num_workers)));
    if (workers < 1) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("detector.num_workers must be at least 1, got ", workers));
    }
    result.num_workers = static_cast<size_t>(workers);

    if (config.HasKey("detector.categorical_features")) {
        std::vector<std::string> names;
        SENTINEL_ASSIGN_OR_RETURN(names, config.ReadStringList("detector.categorical_features"));
        result.categorical_features = std::move(names);
    }

    SENTINEL_RETURN_IF_ERROR(result.Validate());
    return result;
}

// =============================================================================
// DriftDetector
// =============================================================================

DriftDetector::DriftDetector(DetectorConfig config)
    : config_(std::move(config)),
      continuous_(ContinuousComparatorConfig{
          config_.significance_level,
          config_.psi_threshold,
          config_.psi_bins}),
      categorical_(config_.significance_level) {
    if (config_.num_workers > 1) {
        pool_ = std::make_unique<ThreadPool>(config_.num_workers);
    }
}

DriftDetector::~DriftDetector() = default;

absl::StatusOr<std::unique_ptr<DriftDetector>> DriftDetector::Create(DetectorConfig config) {
    SENTINEL_RETURN_IF_ERROR(config.Validate());
    return std::unique_ptr<DriftDetector>(new DriftDetector(std::move(config)));
}

absl::Status DriftDetector::ValidateInputs(const data::Dataset& reference,
                                           const data::Dataset& production) const {
    if (reference.Empty()) {
        return MakeError(ErrorCode::kEmptyDataset, "Reference dataset is empty");
    }
    if (production.Empty()) {
        return MakeError(ErrorCode::kEmptyDataset, "Production dataset is empty");
    }

    const auto ref_names = reference.ColumnNames();
    const auto prod_names = production.ColumnNames();
    const std::set<std::string> ref_set(ref_names.begin(), ref_names.end());
    const std::set<std::string> prod_set(prod_names.begin(), prod_names.end());

    if (ref_set != prod_set) {
        std::vector<std::string> only_reference;
        std::vector<std::string> only_production;
        std::set_difference(ref_set.begin(), ref_set.end(), prod_set.begin(), prod_set.end(),
                            std::back_inserter(only_reference));
        std::set_difference(prod_set.begin(), prod_set.end(), ref_set.begin(), ref_set.end(),
                            std::back_inserter(only_production));
        return MakeError(ErrorCode::kSchemaMismatch, absl::StrCat(
            "Reference and production column sets differ; only in reference: [",
            absl::StrJoin(only_reference, ", "), "], only in production: [",
            absl::StrJoin(only_production, ", "), "]"));
    }
    return absl::OkStatus();
}

absl::StatusOr<FeaturePartition> DriftDetector::Classify(const data::Dataset& reference) const {
    if (config_.categorical_features.has_value()) {
        return classifier_.PartitionWithOverride(reference, *config_.categorical_features);
    }
    return classifier_.Partition(reference);
}

ComparisonResult DriftDetector::CompareFeature(const Feature& feature,
                                               const data::Dataset& reference,
                                               const data::Dataset& production) const {
    const data::Column* ref_column = reference.FindColumn(feature.name);
    const data::Column* prod_column = production.FindColumn(feature.name);

    const FeatureComparator& comparator =
        feature.kind == FeatureKind::kContinuous
            ? static_cast<const FeatureComparator&>(continuous_)
            : static_cast<const FeatureComparator&>(categorical_);

    ComparisonResult result = comparator.Compare(*ref_column, *prod_column);
    if (!result.ok()) {
        SENTINEL_LOG_WARN("{} could not compare feature '{}': {}",
                          comparator.Name(), feature.name, std::string_view(result.status.message().data(), result.status.message().size()));
    } else {
        SENTINEL_LOG_DEBUG("{} compared '{}': drift={}", comparator.Name(), feature.name,
                           result.drift_detected);
    }
    return result;
}

absl::StatusOr<DriftReport> DriftDetector::Detect(const data::Dataset& reference,
                                                  const data::Dataset& production) const {
    DescribeMetrics();
    SENTINEL_TIMER(SENTINEL_HISTOGRAM("sentinel_detection_seconds"));
    SENTINEL_COUNTER("sentinel_detections_total").Increment();

    SENTINEL_RETURN_IF_ERROR(ValidateInputs(reference, production));

    FeaturePartition partition;
    SENTINEL_ASSIGN_OR_RETURN(partition, Classify(reference));
    SENTINEL_LOG_DEBUG("Continuous features: [{}]; categorical features: [{}]",
                       absl::StrJoin(partition.continuous, ", "),
                       absl::StrJoin(partition.categorical, ", "));

    const std::vector<Feature> features = partition.Features();
    std::vector<ComparisonResult> results;

    if (pool_ && features.size() > 1) {
        results = pool_->Map(features, [&](const Feature& feature) {
            return CompareFeature(feature, reference, production);
        });
    } else {
        results.reserve(features.size());
        for (const auto& feature : features) {
            results.push_back(CompareFeature(feature, reference, production));
        }
    }

    DriftReport report;
    report.partition = std::move(partition);
    for (auto& result : results) {
        if (!result.ok()) {
            report.features_with_errors.push_back(result.feature);
        } else if (result.drift_detected) {
            report.features_with_drift.push_back(result.feature);
            report.drift_detected = true;
            MetricsRegistry::Instance()
                .GetBoundedCounter("sentinel_feature_drift_total", {{"feature", result.feature}},
                                   kMaxFeatureDriftSeries, {{"feature", kOtherFeatureLabel}})
                .Increment();
        }
        report.feature_details.push_back(std::move(result));
    }

    SENTINEL_COUNTER("sentinel_features_evaluated_total").Add(
        static_cast<int64_t>(report.feature_details.size()));
    SENTINEL_COUNTER("sentinel_feature_errors_total").Add(
        static_cast<int64_t>(report.features_with_errors.size()));
    SENTINEL_GAUGE("sentinel_last_drifted_features").Set(
        static_cast<double>(report.features_with_drift.size()));
    if (report.drift_detected) {
        SENTINEL_COUNTER("sentinel_drift_detected_total").Increment();
    }

    SENTINEL_LOG_INFO("Drift detection over {} features ({} continuous, {} categorical): "
                      "drift={}, drifted=[{}], errors={}",
                      report.feature_details.size(), report.partition.continuous.size(),
                      report.partition.categorical.size(), report.drift_detected,
                      absl::StrJoin(report.features_with_drift, ", "),
                      report.features_with_errors.size());
    return report;
}

}  // namespace sentinel::drift
