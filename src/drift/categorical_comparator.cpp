/// @file categorical_comparator.cpp
/// @brief Chi-square comparator implementation

#include "drift/categorical_comparator.h"

#include <algorithm>
#include <cmath>
#include <map>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "drift/statistics.h"

namespace sentinel::drift {

ContingencyTable ContingencyTable::Build(const std::vector<data::Cell>& reference,
                                         const std::vector<data::Cell>& production) {
    // std::map keeps the category order stable across runs
    std::map<data::Cell, std::array<size_t, 2>> counts;
    for (const auto& value : reference) {
        if (!data::IsMissing(value)) {
            counts[value][0]++;
        }
    }
    for (const auto& value : production) {
        if (!data::IsMissing(value)) {
            counts[value][1]++;
        }
    }

    ContingencyTable table;
    table.categories.reserve(counts.size());
    table.reference_counts.reserve(counts.size());
    table.production_counts.reserve(counts.size());
    for (const auto& [category, pair] : counts) {
        table.categories.push_back(category);
        table.reference_counts.push_back(pair[0]);
        table.production_counts.push_back(pair[1]);
    }
    return table;
}

CategoricalComparator::CategoricalComparator(double significance_level)
    : significance_level_(significance_level) {}

ComparisonResult CategoricalComparator::Compare(const data::Column& reference,
                                                const data::Column& production) const {
    ComparisonResult result;
    result.feature = reference.Name();
    result.kind = FeatureKind::kCategorical;

    const std::vector<data::Cell> ref_values = reference.PresentValues();
    const std::vector<data::Cell> prod_values = production.PresentValues();
    result.reference_count = ref_values.size();
    result.production_count = prod_values.size();

    auto chi = ChiSquare(ref_values, prod_values);
    if (!chi.ok()) {
        result.status = chi.status();
        return result;
    }

    CategoricalComparison comparison{*chi};
    result.drift_detected = comparison.DriftDetected();
    result.detail = comparison;

    SENTINEL_LOG_DEBUG("Feature '{}': chi2={:.4f} dof={} p={:.4g}, drift={}",
                       result.feature, chi->statistic, chi->degrees_of_freedom,
                       chi->p_value, result.drift_detected);
    return result;
}

absl::StatusOr<ChiSquareResult> CategoricalComparator::ChiSquare(
    const std::vector<data::Cell>& reference,
    const std::vector<data::Cell>& production) const {
    return ChiSquare(ContingencyTable::Build(reference, production));
}

absl::StatusOr<ChiSquareResult> CategoricalComparator::ChiSquare(
    const ContingencyTable& table) const {

    const size_t k = table.NumCategories();
    if (k == 0) {
        return MakeError(ErrorCode::kDegenerateStatistic,
                         "Chi-square: contingency table has no categories");
    }

    double ref_total = 0.0;
    double prod_total = 0.0;
    std::vector<double> column_totals(k);
    for (size_t j = 0; j < k; ++j) {
        ref_total += static_cast<double>(table.reference_counts[j]);
        prod_total += static_cast<double>(table.production_counts[j]);
        column_totals[j] = static_cast<double>(table.reference_counts[j] +
                                               table.production_counts[j]);
    }

    // Any zero margin makes an expected frequency zero and chi2 undefined
    if (ref_total == 0.0) {
        return MakeError(ErrorCode::kDegenerateStatistic,
                         "Chi-square: reference row of the contingency table sums to zero");
    }
    if (prod_total == 0.0) {
        return MakeError(ErrorCode::kDegenerateStatistic,
                         "Chi-square: production row of the contingency table sums to zero");
    }
    for (size_t j = 0; j < k; ++j) {
        if (column_totals[j] == 0.0) {
            return MakeError(ErrorCode::kDegenerateStatistic, absl::StrCat(
                "Chi-square: category '", data::CellToString(table.categories[j]),
                "' column of the contingency table sums to zero"));
        }
    }

    ChiSquareResult result;
    result.num_categories = k;
    result.degrees_of_freedom = static_cast<int>(k) - 1;

    if (result.degrees_of_freedom == 0) {
        result.statistic = 0.0;
        result.p_value = 1.0;
        result.drift_detected = false;
        return result;
    }

    const double grand_total = ref_total + prod_total;
    const bool yates = result.degrees_of_freedom == 1;

    double statistic = 0.0;
    auto accumulate = [&](double observed, double row_total, double column_total) {
        const double expected = row_total * column_total / grand_total;
        double diff = observed - expected;
        if (yates) {
            // Move each observation up to 0.5 towards its expectation
            const double magnitude = std::min(0.5, std::abs(diff));
            diff = diff > 0.0 ? diff - magnitude : diff + magnitude;
        }
        statistic += diff * diff / expected;
    };

    for (size_t j = 0; j < k; ++j) {
        accumulate(static_cast<double>(table.reference_counts[j]), ref_total, column_totals[j]);
        accumulate(static_cast<double>(table.production_counts[j]), prod_total, column_totals[j]);
    }

    result.statistic = statistic;
    result.p_value = stats::ChiSquaredSurvival(statistic, result.degrees_of_freedom);
    result.drift_detected = result.p_value < significance_level_;
    return result;
}

}  // namespace sentinel::drift
