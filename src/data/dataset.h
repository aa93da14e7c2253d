#pragma once

/// @file dataset.h
/// @brief In-memory tabular datasets compared by the drift engine

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

namespace sentinel::data {

/// @brief A single table cell: missing, numeric or text
///
/// Alternatives are ordered so that std::less<Cell> gives a stable category
/// order: numbers before text, each by value.
using Cell = std::variant<std::monostate, double, std::string>;

/// @brief True if the cell holds no value
inline bool IsMissing(const Cell& cell) {
    return std::holds_alternative<std::monostate>(cell);
}

/// @brief Render a cell as a label ("" for missing)
std::string CellToString(const Cell& cell);

/// @brief Convert a cell to JSON (null, number or string)
nlohmann::json CellToJson(const Cell& cell);

/// @brief A named column of cells
///
/// NaN numbers are stored as missing so they never take part in statistics.
class Column {
public:
    Column(std::string name, std::vector<Cell> cells);

    const std::string& Name() const { return name_; }
    const std::vector<Cell>& Cells() const { return cells_; }
    size_t Size() const { return cells_.size(); }

    /// @brief True if no non-missing cell holds text
    bool IsNumeric() const { return text_count_ == 0; }

    /// @brief Number of non-missing cells holding text
    size_t TextCount() const { return text_count_; }

    /// @brief Number of missing cells
    size_t MissingCount() const { return missing_count_; }

    /// @brief Non-missing numeric values in row order (text cells skipped)
    std::vector<double> NumericValues() const;

    /// @brief Non-missing cells in row order
    std::vector<Cell> PresentValues() const;

    /// @brief Number of distinct non-missing values
    size_t DistinctCount() const;

private:
    std::string name_;
    std::vector<Cell> cells_;
    size_t missing_count_ = 0;
    size_t text_count_ = 0;
};

/// @brief An ordered collection of equal-length named columns
class Dataset {
public:
    Dataset() = default;

    /// @brief Build a dataset, validating equal column lengths and unique names
    static absl::StatusOr<Dataset> FromColumns(std::vector<Column> columns);

    /// @brief Build a dataset from JSON
    ///
    /// Accepts a column-oriented object (`{"a": [1, 2], "b": ["x", null]}`) or a
    /// row-oriented array of objects (`[{"a": 1, "b": "x"}, ...]`). Column order
    /// follows the order keys first appear.
    static absl::StatusOr<Dataset> FromJson(const nlohmann::ordered_json& json);

    size_t NumRows() const { return num_rows_; }
    size_t NumColumns() const { return columns_.size(); }

    /// @brief True if the dataset has no columns or no rows
    bool Empty() const { return columns_.empty() || num_rows_ == 0; }

    const std::vector<Column>& Columns() const { return columns_; }

    /// @brief Column names in dataset order
    std::vector<std::string> ColumnNames() const;

    /// @brief Find a column by name
    /// @return Pointer to the column or nullptr if absent
    const Column* FindColumn(std::string_view name) const;

    bool HasColumn(std::string_view name) const { return FindColumn(name) != nullptr; }

private:
    std::vector<Column> columns_;
    std::unordered_map<std::string, size_t> index_;
    size_t num_rows_ = 0;
};

}  // namespace sentinel::data
