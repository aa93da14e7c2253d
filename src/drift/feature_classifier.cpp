#include "drift/feature_classifier.h"

#include <unordered_set>

#include <absl/strings/str_cat.h>

#include "common/logging.h"

namespace sentinel::drift {

std::string_view FeatureKindToString(FeatureKind kind) {
    switch (kind) {
        case FeatureKind::kContinuous:
            return "continuous";
        case FeatureKind::kCategorical:
            return "categorical";
        default:
            return "unknown";
    }
}

std::vector<Feature> FeaturePartition::Features() const {
    std::vector<Feature> features;
    features.reserve(Size());
    for (const auto& name : continuous) {
        features.push_back(Feature{name, FeatureKind::kContinuous});
    }
    for (const auto& name : categorical) {
        features.push_back(Feature{name, FeatureKind::kCategorical});
    }
    return features;
}

FeatureKind FeatureClassifier::Classify(const data::Column& column) const {
    if (!column.IsNumeric()) {
        return FeatureKind::kCategorical;
    }
    if (column.DistinctCount() < kCategoricalCardinalityThreshold) {
        return FeatureKind::kCategorical;
    }
    return FeatureKind::kContinuous;
}

FeaturePartition FeatureClassifier::Partition(const data::Dataset& reference) const {
    FeaturePartition partition;
    for (const auto& column : reference.Columns()) {
        if (Classify(column) == FeatureKind::kCategorical) {
            partition.categorical.push_back(column.Name());
        } else {
            partition.continuous.push_back(column.Name());
        }
    }

    SENTINEL_LOG_DEBUG("Auto-classified {} continuous and {} categorical features",
                       partition.continuous.size(), partition.categorical.size());
    return partition;
}

absl::StatusOr<FeaturePartition> FeatureClassifier::PartitionWithOverride(
    const data::Dataset& reference,
    const std::vector<std::string>& categorical_features) const {

    std::unordered_set<std::string> categorical;
    for (const auto& name : categorical_features) {
        if (!reference.HasColumn(name)) {
            return absl::InvalidArgumentError(absl::StrCat(
                "Categorical feature '", name, "' is not a column of the reference dataset"));
        }
        categorical.insert(name);
    }

    FeaturePartition partition;
    for (const auto& column : reference.Columns()) {
        if (categorical.count(column.Name()) > 0) {
            partition.categorical.push_back(column.Name());
        } else {
            partition.continuous.push_back(column.Name());
        }
    }

    SENTINEL_LOG_DEBUG("Caller-supplied split: {} continuous and {} categorical features",
                       partition.continuous.size(), partition.categorical.size());
    return partition;
}

}  // namespace sentinel::drift
