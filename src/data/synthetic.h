#pragma once

/// @file synthetic.h
/// @brief Synthetic credit-default dataset for demos and end-to-end runs

#include <cstddef>
#include <cstdint>

#include <absl/status/statusor.h>

#include "data/dataset.h"

namespace sentinel::data {

/// @brief Generation parameters
struct SyntheticCreditOptions {
    size_t samples = 30000;
    uint64_t seed = 42;

    /// Share of rows drawn (without replacement) into the reference split
    double reference_fraction = 0.7;
};

/// @brief Full dataset and its reference/production split
struct SyntheticCreditSplit {
    Dataset full;
    Dataset reference;
    Dataset production;
};

/// @brief Generate the credit-default table
///
/// Columns (integer ranges half-open): LIMIT_BAL [10000, 500000),
/// AGE [21, 70), PAY_0, PAY_2, PAY_3 [-2, 9), BILL_AMT1, BILL_AMT2
/// [-10000, 400000), PAY_AMT1, PAY_AMT2 [0, 100000), default ~ Bernoulli(0.22).
/// The same seed always yields the same table.
absl::StatusOr<Dataset> GenerateCreditDataset(size_t samples, uint64_t seed);

/// @brief Generate the table and split it
///
/// The reference split holds round(samples * reference_fraction) randomly
/// sampled rows in sampled order; production holds the remaining rows in
/// their original order.
absl::StatusOr<SyntheticCreditSplit> GenerateCreditSplit(const SyntheticCreditOptions& options);

}  // namespace sentinel::data
