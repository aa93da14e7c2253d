/// @file drift_report.cpp
/// @brief Report lookup, JSON serialization and text formatting

#include "drift/drift_report.h"

#include <algorithm>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>

namespace sentinel::drift {

const ComparisonResult* DriftReport::Find(std::string_view feature) const {
    for (const auto& result : feature_details) {
        if (result.feature == feature) {
            return &result;
        }
    }
    return nullptr;
}

nlohmann::ordered_json ComparisonResultToJson(const ComparisonResult& result) {
    nlohmann::ordered_json j;
    j["type"] = std::string(FeatureKindToString(result.kind));
    j["drift_detected"] = result.drift_detected;
    j["reference_count"] = result.reference_count;
    j["production_count"] = result.production_count;

    if (!result.ok()) {
        j["error"] = result.status.ToString();
        return j;
    }

    if (const auto* continuous = result.continuous()) {
        j["ks_test"] = {
            {"test", "KS"},
            {"statistic", continuous->ks_test.statistic},
            {"p_value", continuous->ks_test.p_value},
            {"drift_detected", continuous->ks_test.drift_detected},
        };
        j["psi"] = {
            {"test", "PSI"},
            {"psi_value", continuous->psi.psi_value},
            {"bins", continuous->psi.NumBins()},
            {"drift_detected", continuous->psi.drift_detected},
        };
    } else if (const auto* categorical = result.categorical()) {
        j["chi_square"] = {
            {"test", "Chi-Square"},
            {"statistic", categorical->chi_square.statistic},
            {"p_value", categorical->chi_square.p_value},
            {"degrees_of_freedom", categorical->chi_square.degrees_of_freedom},
            {"categories", categorical->chi_square.num_categories},
            {"drift_detected", categorical->chi_square.drift_detected},
        };
    }
    return j;
}

nlohmann::ordered_json ReportToJson(const DriftReport& report) {
    nlohmann::ordered_json j;
    j["drift_detected"] = report.drift_detected;
    j["features_with_drift"] = report.features_with_drift;
    j["features_with_errors"] = report.features_with_errors;
    j["continuous_features"] = report.partition.continuous;
    j["categorical_features"] = report.partition.categorical;

    nlohmann::ordered_json details = nlohmann::ordered_json::object();
    for (const auto& result : report.feature_details) {
        details[result.feature] = ComparisonResultToJson(result);
    }
    j["feature_details"] = std::move(details);
    return j;
}

std::string ReportToJsonText(const DriftReport& report, int indent) {
    return ReportToJson(report).dump(indent, ' ', false,
                                     nlohmann::ordered_json::error_handler_t::replace);
}

std::string FormatReport(const DriftReport& report) {
    auto list = [](const std::vector<std::string>& names) {
        return names.empty() ? std::string("(none)") : absl::StrJoin(names, ", ");
    };

    std::string out;
    absl::StrAppend(&out, "Continuous features:  ", list(report.partition.continuous), "\n");
    absl::StrAppend(&out, "Categorical features: ", list(report.partition.categorical), "\n");
    absl::StrAppend(&out, "Overall drift detected: ", report.drift_detected ? "YES" : "no", "\n");
    absl::StrAppend(&out, "Features with drift:  ", list(report.features_with_drift), "\n");
    if (!report.features_with_errors.empty()) {
        absl::StrAppend(&out, "Features with errors: ", list(report.features_with_errors), "\n");
    }
    absl::StrAppend(&out, "\n");

    size_t width = 7;  // "Feature"
    for (const auto& result : report.feature_details) {
        width = std::max(width, result.feature.size());
    }
    const int w = static_cast<int>(width);

    absl::StrAppend(&out, absl::StrFormat("%-*s  %-11s  %10s  %10s  %10s  %s\n", w, "Feature",
                                          "Type", "PSI", "KS p", "Chi2 p", "Drift"));
    for (const auto& result : report.feature_details) {
        const std::string type(FeatureKindToString(result.kind));
        if (!result.ok()) {
            absl::StrAppend(&out, absl::StrFormat("%-*s  %-11s  %10s  %10s  %10s  ERROR: %s\n", w,
                                                  result.feature, type, "-", "-", "-",
                                                  result.status.message()));
        } else if (const auto* continuous = result.continuous()) {
            absl::StrAppend(&out, absl::StrFormat("%-*s  %-11s  %10.4f  %10.4f  %10s  %s\n", w,
                                                  result.feature, type,
                                                  continuous->psi.psi_value,
                                                  continuous->ks_test.p_value, "-",
                                                  result.drift_detected ? "YES" : "no"));
        } else if (const auto* categorical = result.categorical()) {
            absl::StrAppend(&out, absl::StrFormat("%-*s  %-11s  %10s  %10s  %10.4f  %s\n", w,
                                                  result.feature, type, "-", "-",
                                                  categorical->chi_square.p_value,
                                                  result.drift_detected ? "YES" : "no"));
        }
    }
    return out;
}

}  // namespace sentinel::drift
