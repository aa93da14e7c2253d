#pragma once

/// @file continuous_comparator.h
/// @brief KS test and Population Stability Index for continuous features

#include <cstddef>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "drift/comparator.h"

namespace sentinel::drift {

/// @brief Share assigned to empty PSI bins so the log-ratio stays finite
inline constexpr double kPsiEmptyBinShare = 0.0001;

/// @brief Configuration for the continuous comparator
struct ContinuousComparatorConfig {
    /// KS p-values strictly below this flag drift
    double significance_level = 0.05;

    /// PSI at or above this flags drift (0.1 = moderate, 0.25 = significant)
    double psi_threshold = 0.25;

    /// Requested number of reference-percentile bins
    size_t psi_bins = 10;
};

/// @brief Compares a continuous feature with two independent statistics
///
/// - KS test: two-sample Kolmogorov-Smirnov on non-missing values.
/// - PSI: reference percentile bins (0th, 100/B-th, ..., 100th), deduplicated;
///   PSI = sum((prod% - ref%) * ln(prod% / ref%)) with empty bins clamped to
///   kPsiEmptyBinShare.
///
/// The feature drifts if either statistic flags it.
///
/// Example usage:
/// @code
///   ContinuousComparator comparator({.significance_level = 0.05,
///                                    .psi_threshold = 0.25,
///                                    .psi_bins = 10});
///   auto psi = comparator.Psi(reference_values, production_values);
///   if (psi.ok() && psi->drift_detected) {
///       // investigate
///   }
/// @endcode
class ContinuousComparator : public FeatureComparator {
public:
    explicit ContinuousComparator(ContinuousComparatorConfig config = {});
    ~ContinuousComparator() override = default;

    ComparisonResult Compare(const data::Column& reference,
                             const data::Column& production) const override;

    FeatureKind Kind() const override { return FeatureKind::kContinuous; }
    std::string Name() const override { return "ContinuousComparator"; }

    /// @brief Two-sample KS test
    /// @return FailedPreconditionError if either side is empty
    absl::StatusOr<KsTestResult> KsTest(const std::vector<double>& reference,
                                        const std::vector<double>& production) const;

    /// @brief Population Stability Index over reference percentile bins
    /// @return FailedPreconditionError if either side is empty or holds a
    ///         non-finite value
    absl::StatusOr<PsiResult> Psi(const std::vector<double>& reference,
                                  const std::vector<double>& production) const;

    /// @brief Deduplicated percentile bin edges of the reference values
    std::vector<double> BinEdges(const std::vector<double>& reference) const;

    /// @brief Count values into bins defined by edges
    ///
    /// Bins are [e_i, e_i+1) except the last, which also includes its upper
    /// edge. Values outside [e_0, e_last] land in no bin. A single edge forms
    /// one degenerate bin holding values equal to it.
    static std::vector<size_t> Histogram(const std::vector<double>& values,
                                         const std::vector<double>& edges);

    const ContinuousComparatorConfig& GetConfig() const { return config_; }

private:
    ContinuousComparatorConfig config_;
};

}  // namespace sentinel::drift
