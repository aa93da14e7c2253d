#pragma once

/// @file comparison_result.h
/// @brief Per-feature statistical comparison records

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

#include <absl/status/status.h>

#include "drift/feature.h"

namespace sentinel::drift {

/// @brief Two-sample Kolmogorov-Smirnov outcome
struct KsTestResult {
    double statistic = 0.0;     ///< sup |F_ref - F_prod|
    double p_value = 1.0;
    bool drift_detected = false;  ///< p_value < significance level
};

/// @brief Population Stability Index outcome
struct PsiResult {
    double psi_value = 0.0;
    bool drift_detected = false;  ///< psi_value >= PSI threshold

    /// Deduplicated reference percentile edges actually used
    std::vector<double> bin_edges;

    /// Effective bin count (edges - 1, or 1 for a degenerate single edge)
    size_t NumBins() const {
        return bin_edges.size() < 2 ? bin_edges.size() : bin_edges.size() - 1;
    }
};

/// @brief Chi-square test of independence outcome
struct ChiSquareResult {
    double statistic = 0.0;
    double p_value = 1.0;
    int degrees_of_freedom = 0;
    size_t num_categories = 0;
    bool drift_detected = false;  ///< p_value < significance level
};

/// @brief Detail for a continuous feature: drift if either test flags
struct ContinuousComparison {
    KsTestResult ks_test;
    PsiResult psi;

    bool DriftDetected() const { return ks_test.drift_detected || psi.drift_detected; }
};

/// @brief Detail for a categorical feature
struct CategoricalComparison {
    ChiSquareResult chi_square;

    bool DriftDetected() const { return chi_square.drift_detected; }
};

/// @brief Result of comparing one feature between reference and production
///
/// Exactly one of three states: a continuous detail, a categorical detail, or
/// a failed comparison (non-OK status, no detail, never drifted).
struct ComparisonResult {
    std::string feature;
    FeatureKind kind = FeatureKind::kContinuous;

    /// OK unless the comparison could not be computed
    absl::Status status;

    std::variant<std::monostate, ContinuousComparison, CategoricalComparison> detail;

    /// Non-missing values that took part on each side
    size_t reference_count = 0;
    size_t production_count = 0;

    bool drift_detected = false;

    bool ok() const { return status.ok(); }

    const ContinuousComparison* continuous() const {
        return std::get_if<ContinuousComparison>(&detail);
    }

    const CategoricalComparison* categorical() const {
        return std::get_if<CategoricalComparison>(&detail);
    }
};

}  // namespace sentinel::drift
