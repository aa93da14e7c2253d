#pragma once

/// @file categorical_comparator.h
/// @brief Chi-square drift comparison for categorical features

#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "drift/comparator.h"

namespace sentinel::drift {

/// @brief 2 x K table of raw category counts
///
/// Columns are the union of categories seen on either side, in ascending
/// category order; a category seen on one side only has count 0 on the other.
struct ContingencyTable {
    std::vector<data::Cell> categories;
    std::vector<size_t> reference_counts;
    std::vector<size_t> production_counts;

    size_t NumCategories() const { return categories.size(); }

    /// @brief Build the table from the non-missing values of each side
    static ContingencyTable Build(const std::vector<data::Cell>& reference,
                                  const std::vector<data::Cell>& production);
};

/// @brief Compares a categorical feature with Pearson's Chi-square test of
///        independence between dataset origin and category
///
/// Expected counts are row_total * column_total / grand_total with K - 1
/// degrees of freedom. Yates' continuity correction applies when there is a
/// single degree of freedom, and a one-category table has statistic 0 and
/// p-value 1. Drift is flagged when the p-value is strictly below the
/// significance level.
class CategoricalComparator : public FeatureComparator {
public:
    explicit CategoricalComparator(double significance_level = 0.05);
    ~CategoricalComparator() override = default;

    ComparisonResult Compare(const data::Column& reference,
                             const data::Column& production) const override;

    FeatureKind Kind() const override { return FeatureKind::kCategorical; }
    std::string Name() const override { return "CategoricalComparator"; }

    /// @brief Run the Chi-square test on non-missing category values
    /// @return FailedPreconditionError if a row or column of the contingency
    ///         table sums to zero, which leaves the statistic undefined
    absl::StatusOr<ChiSquareResult> ChiSquare(const std::vector<data::Cell>& reference,
                                              const std::vector<data::Cell>& production) const;

    /// @brief Run the Chi-square test on a prepared table
    absl::StatusOr<ChiSquareResult> ChiSquare(const ContingencyTable& table) const;

    double GetSignificanceLevel() const { return significance_level_; }

private:
    double significance_level_;
};

}  // namespace sentinel::drift
