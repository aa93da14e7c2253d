#include "data/synthetic.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <absl/strings/str_cat.h>

namespace sentinel::data {

namespace {

constexpr double kDefaultRate = 0.22;

struct IntColumnSpec {
    const char* name;
    int64_t low;   // inclusive
    int64_t high;  // exclusive
};

constexpr IntColumnSpec kIntColumns[] = {
    {"LIMIT_BAL", 10000, 500000},
    {"AGE", 21, 70},
    {"PAY_0", -2, 9},
    {"PAY_2", -2, 9},
    {"PAY_3", -2, 9},
    {"BILL_AMT1", -10000, 400000},
    {"BILL_AMT2", -10000, 400000},
    {"PAY_AMT1", 0, 100000},
    {"PAY_AMT2", 0, 100000},
};

absl::StatusOr<Dataset> SelectRows(const Dataset& dataset, const std::vector<size_t>& rows) {
    std::vector<Column> columns;
    columns.reserve(dataset.NumColumns());
    for (const auto& column : dataset.Columns()) {
        std::vector<Cell> cells;
        cells.reserve(rows.size());
        for (size_t row : rows) {
            cells.push_back(column.Cells()[row]);
        }
        columns.emplace_back(column.Name(), std::move(cells));
    }
    return Dataset::FromColumns(std::move(columns));
}

}  // namespace

absl::StatusOr<Dataset> GenerateCreditDataset(size_t samples, uint64_t seed) {
    if (samples == 0) {
        return absl::InvalidArgumentError("samples must be positive");
    }

    std::mt19937_64 rng(seed);
    std::vector<Column> columns;

    // Column by column, so each column's stream depends only on the seed and
    // the columns before it
    for (const auto& range : kIntColumns) {
        std::uniform_int_distribution<int64_t> dist(range.low, range.high - 1);
        std::vector<Cell> cells;
        cells.reserve(samples);
        for (size_t i = 0; i < samples; ++i) {
            cells.emplace_back(static_cast<double>(dist(rng)));
        }
        columns.emplace_back(range.name, std::move(cells));
    }

    std::bernoulli_distribution default_dist(kDefaultRate);
    std::vector<Cell> defaults;
    defaults.reserve(samples);
    for (size_t i = 0; i < samples; ++i) {
        defaults.emplace_back(default_dist(rng) ? 1.0 : 0.0);
    }
    columns.emplace_back("default", std::move(defaults));

    return Dataset::FromColumns(std::move(columns));
}

absl::StatusOr<SyntheticCreditSplit> GenerateCreditSplit(const SyntheticCreditOptions& options) {
    if (!(options.reference_fraction > 0.0 && options.reference_fraction < 1.0)) {
        return absl::InvalidArgumentError(absl::StrCat(
            "reference_fraction must be in (0, 1), got ", options.reference_fraction));
    }

    auto full = GenerateCreditDataset(options.samples, options.seed);
    if (!full.ok()) {
        return full.status();
    }

    const size_t n = full->NumRows();
    const auto reference_size = static_cast<size_t>(
        std::llround(static_cast<double>(n) * options.reference_fraction));
    if (reference_size == 0 || reference_size >= n) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Cannot split ", n, " rows with reference_fraction ",
            options.reference_fraction, " into two non-empty sets"));
    }

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), size_t{0});
    std::mt19937_64 rng(options.seed);
    std::shuffle(order.begin(), order.end(), rng);

    std::vector<size_t> reference_rows(order.begin(), order.begin() + reference_size);
    std::vector<size_t> production_rows(order.begin() + reference_size, order.end());
    std::sort(production_rows.begin(), production_rows.end());

    auto reference = SelectRows(*full, reference_rows);
    if (!reference.ok()) {
        return reference.status();
    }
    auto production = SelectRows(*full, production_rows);
    if (!production.ok()) {
        return production.status();
    }

    SyntheticCreditSplit split;
    split.full = std::move(*full);
    split.reference = std::move(*reference);
    split.production = std::move(*production);
    return split;
}

}  // namespace sentinel::data
