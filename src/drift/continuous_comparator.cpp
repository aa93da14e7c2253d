/// @file continuous_comparator.cpp
/// @brief KS and PSI comparator implementation

#include "drift/continuous_comparator.h"

#include <algorithm>
#include <cmath>
#include <string_view>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "drift/statistics.h"

namespace sentinel::drift {

namespace {

absl::Status CheckNotEmpty(const std::vector<double>& reference,
                           const std::vector<double>& production,
                           std::string_view test) {
    if (reference.empty()) {
        return MakeError(ErrorCode::kDegenerateStatistic,
                         absl::StrCat(absl::string_view(test.data(), test.size()), ": reference has no non-missing values"));
    }
    if (production.empty()) {
        return MakeError(ErrorCode::kDegenerateStatistic,
                         absl::StrCat(absl::string_view(test.data(), test.size()), ": production has no non-missing values"));
    }
    return absl::OkStatus();
}

// Text cells would otherwise vanish from NumericValues() without a trace
absl::Status CheckAllNumeric(const data::Column& column, std::string_view side) {
    if (column.TextCount() > 0) {
        return MakeError(ErrorCode::kDegenerateStatistic,
                         absl::StrCat(absl::string_view(side.data(), side.size()), " has ", column.TextCount(),
                                      " non-numeric values in a continuous feature"));
    }
    return absl::OkStatus();
}

absl::Status CheckFinite(const std::vector<double>& values, std::string_view side) {
    const auto count = std::count_if(values.begin(), values.end(),
                                     [](double value) { return !std::isfinite(value); });
    if (count > 0) {
        return MakeError(ErrorCode::kDegenerateStatistic,
                         absl::StrCat(absl::string_view(side.data(), side.size()), " has ", count, " non-finite values"));
    }
    return absl::OkStatus();
}

std::vector<double> ToShares(const std::vector<size_t>& counts, size_t total) {
    std::vector<double> shares(counts.size());
    const double n = static_cast<double>(total);
    for (size_t i = 0; i < counts.size(); ++i) {
        const double share = static_cast<double>(counts[i]) / n;
        shares[i] = share == 0.0 ? kPsiEmptyBinShare : share;
    }
    return shares;
}

}  // namespace

ContinuousComparator::ContinuousComparator(ContinuousComparatorConfig config)
    : config_(std::move(config)) {}

ComparisonResult ContinuousComparator::Compare(const data::Column& reference,
                                               const data::Column& production) const {
    ComparisonResult result;
    result.feature = reference.Name();
    result.kind = FeatureKind::kContinuous;

    // Missing values are dropped independently on each side
    const std::vector<double> ref_values = reference.NumericValues();
    const std::vector<double> prod_values = production.NumericValues();
    result.reference_count = ref_values.size();
    result.production_count = prod_values.size();

    for (absl::Status status : {CheckAllNumeric(reference, "reference"),
                                CheckAllNumeric(production, "production"),
                                CheckFinite(ref_values, "reference"),
                                CheckFinite(prod_values, "production")}) {
        if (!status.ok()) {
            result.status = std::move(status);
            return result;
        }
    }

    auto ks = KsTest(ref_values, prod_values);
    if (!ks.ok()) {
        result.status = ks.status();
        return result;
    }

    auto psi = Psi(ref_values, prod_values);
    if (!psi.ok()) {
        result.status = psi.status();
        return result;
    }

    ContinuousComparison comparison{*ks, std::move(*psi)};
    result.drift_detected = comparison.DriftDetected();
    result.detail = std::move(comparison);

    SENTINEL_LOG_DEBUG("Feature '{}': KS D={:.4f} p={:.4g}, PSI={:.4f}, drift={}",
                       result.feature, ks->statistic, ks->p_value,
                       result.continuous()->psi.psi_value, result.drift_detected);
    return result;
}

absl::StatusOr<KsTestResult> ContinuousComparator::KsTest(
    const std::vector<double>& reference,
    const std::vector<double>& production) const {

    if (auto status = CheckNotEmpty(reference, production, "KS test"); !status.ok()) {
        return status;
    }

    KsTestResult result;
    result.statistic = stats::KolmogorovSmirnovStatistic(reference, production);
    result.p_value = stats::KolmogorovSmirnovPValue(
        result.statistic, reference.size(), production.size());
    result.drift_detected = result.p_value < config_.significance_level;
    return result;
}

absl::StatusOr<PsiResult> ContinuousComparator::Psi(
    const std::vector<double>& reference,
    const std::vector<double>& production) const {

    if (auto status = CheckNotEmpty(reference, production, "PSI"); !status.ok()) {
        return status;
    }
    // A non-finite percentile would leave NaN among the bin edges
    SENTINEL_RETURN_IF_ERROR(CheckFinite(reference, "PSI: reference"));
    SENTINEL_RETURN_IF_ERROR(CheckFinite(production, "PSI: production"));

    PsiResult result;
    result.bin_edges = BinEdges(reference);

    const std::vector<double> ref_shares =
        ToShares(Histogram(reference, result.bin_edges), reference.size());
    const std::vector<double> prod_shares =
        ToShares(Histogram(production, result.bin_edges), production.size());

    double psi = 0.0;
    for (size_t i = 0; i < ref_shares.size(); ++i) {
        psi += (prod_shares[i] - ref_shares[i]) * std::log(prod_shares[i] / ref_shares[i]);
    }

    result.psi_value = psi;
    result.drift_detected = psi >= config_.psi_threshold;
    return result;
}

std::vector<double> ContinuousComparator::BinEdges(const std::vector<double>& reference) const {
    if (reference.empty()) {
        return {};
    }

    std::vector<double> sorted = reference;
    std::sort(sorted.begin(), sorted.end());

    std::vector<double> edges;
    edges.reserve(config_.psi_bins + 1);
    for (size_t i = 0; i <= config_.psi_bins; ++i) {
        const double fraction = static_cast<double>(i) / static_cast<double>(config_.psi_bins);
        edges.push_back(stats::SortedPercentile(sorted, fraction));
    }

    // Percentiles are non-decreasing; ties at bin boundaries collapse here
    edges.erase(std::unique(edges.begin(), edges.end()), edges.end());
    return edges;
}

std::vector<size_t> ContinuousComparator::Histogram(const std::vector<double>& values,
                                                    const std::vector<double>& edges) {
    if (edges.empty()) {
        return {};
    }

    if (edges.size() == 1) {
        const size_t matches = static_cast<size_t>(
            std::count(values.begin(), values.end(), edges.front()));
        return {matches};
    }

    std::vector<size_t> counts(edges.size() - 1, 0);
    const double lo = edges.front();
    const double hi = edges.back();

    for (double value : values) {
        if (value < lo || value > hi) {
            continue;
        }
        if (value == hi) {
            ++counts.back();
            continue;
        }
        auto it = std::upper_bound(edges.begin(), edges.end(), value);
        const size_t bin = static_cast<size_t>(std::distance(edges.begin(), it)) - 1;
        if (bin >= counts.size()) {
            continue;
        }
        ++counts[bin];
    }
    return counts;
}

}  // namespace sentinel::drift
