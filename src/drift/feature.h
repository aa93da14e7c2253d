#pragma once

/// @file feature.h
/// @brief Feature kinds assigned once per column by the classifier

#include <string>
#include <string_view>

namespace sentinel::drift {

/// @brief How a feature is compared between datasets
enum class FeatureKind {
    kContinuous,   ///< KS test and PSI
    kCategorical   ///< Chi-square test of independence
};

/// @brief Convert feature kind to string ("continuous" / "categorical")
std::string_view FeatureKindToString(FeatureKind kind);

/// @brief A named column together with its comparison kind
struct Feature {
    std::string name;
    FeatureKind kind = FeatureKind::kContinuous;
};

}  // namespace sentinel::drift
