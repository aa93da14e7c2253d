#pragma once

/// @file comparator.h
/// @brief Interface for per-feature reference/production comparisons

#include <string>

#include "data/dataset.h"
#include "drift/comparison_result.h"

namespace sentinel::drift {

/// @brief Abstract base class for feature comparators
///
/// Implementations never throw for bad data: a comparison that cannot be
/// computed comes back with a non-OK status so the caller can report it for
/// that feature alone.
class FeatureComparator {
public:
    virtual ~FeatureComparator() = default;

    /// @brief Compare one column of the reference dataset with the same column
    ///        of the production dataset
    virtual ComparisonResult Compare(const data::Column& reference,
                                     const data::Column& production) const = 0;

    /// @brief Kind of feature this comparator handles
    virtual FeatureKind Kind() const = 0;

    /// @brief Comparator name for logs
    virtual std::string Name() const = 0;
};

}  // namespace sentinel::drift
