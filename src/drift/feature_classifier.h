#pragma once

/// @file feature_classifier.h
/// @brief Splits reference columns into continuous and categorical features

#include <cstddef>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "data/dataset.h"
#include "drift/feature.h"

namespace sentinel::drift {

/// @brief Numeric columns with fewer distinct values than this are categorical
inline constexpr size_t kCategoricalCardinalityThreshold = 10;

/// @brief Continuous/categorical split of a dataset's columns
///
/// Both lists keep the reference dataset's column order. Drift reports walk
/// the continuous list first, then the categorical list.
struct FeaturePartition {
    std::vector<std::string> continuous;
    std::vector<std::string> categorical;

    /// @brief All features in traversal order (continuous, then categorical)
    std::vector<Feature> Features() const;

    size_t Size() const { return continuous.size() + categorical.size(); }
};

/// @brief Assigns every reference column exactly one FeatureKind
///
/// A column is categorical when it holds any text value or when it has fewer
/// than kCategoricalCardinalityThreshold distinct non-missing values; binary
/// flags and small ordinal codes therefore go to the Chi-square test even
/// though they are numeric. Only the reference dataset is ever inspected.
class FeatureClassifier {
public:
    FeatureClassifier() = default;

    /// @brief Kind of a single column under auto-detection
    FeatureKind Classify(const data::Column& column) const;

    /// @brief Auto-detect the partition of the reference dataset
    FeaturePartition Partition(const data::Dataset& reference) const;

    /// @brief Partition with a caller-supplied categorical list
    ///
    /// The list replaces auto-detection entirely: listed columns are
    /// categorical, every other column is continuous.
    /// @return InvalidArgumentError if a listed name is not a reference column
    absl::StatusOr<FeaturePartition> PartitionWithOverride(
        const data::Dataset& reference,
        const std::vector<std::string>& categorical_features) const;
};

}  // namespace sentinel::drift
