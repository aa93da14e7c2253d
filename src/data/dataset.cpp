#include "data/dataset.h"

#include <cmath>
#include <cstdint>
#include <set>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

namespace sentinel::data {

namespace {

absl::StatusOr<Cell> JsonToCell(const nlohmann::ordered_json& value, std::string_view column) {
    if (value.is_null()) {
        return Cell{};
    }
    if (value.is_boolean()) {
        return Cell{value.get<bool>() ? 1.0 : 0.0};
    }
    if (value.is_number()) {
        return Cell{value.get<double>()};
    }
    if (value.is_string()) {
        return Cell{value.get<std::string>()};
    }
    return absl::InvalidArgumentError(absl::StrCat(
        "Column '", absl::string_view(column.data(), column.size()), "' holds a non-scalar JSON value: ", value.dump()));
}

}  // namespace

std::string CellToString(const Cell& cell) {
    if (const auto* number = std::get_if<double>(&cell)) {
        // Integral values print without a fraction so labels read "1", not "1.0"
        if (std::trunc(*number) == *number && std::fabs(*number) < 9.0e15) {
            return absl::StrCat(static_cast<int64_t>(*number));
        }
        return absl::StrFormat("%.15g", *number);
    }
    if (const auto* text = std::get_if<std::string>(&cell)) {
        return *text;
    }
    return "";
}

nlohmann::json CellToJson(const Cell& cell) {
    if (const auto* number = std::get_if<double>(&cell)) {
        return *number;
    }
    if (const auto* text = std::get_if<std::string>(&cell)) {
        return *text;
    }
    return nullptr;
}

// =============================================================================
// Column
// =============================================================================

Column::Column(std::string name, std::vector<Cell> cells)
    : name_(std::move(name)), cells_(std::move(cells)) {
    for (auto& cell : cells_) {
        if (const auto* number = std::get_if<double>(&cell); number && std::isnan(*number)) {
            cell = std::monostate{};
        }
        if (IsMissing(cell)) {
            ++missing_count_;
        } else if (std::holds_alternative<std::string>(cell)) {
            ++text_count_;
        }
    }
}

std::vector<double> Column::NumericValues() const {
    std::vector<double> values;
    values.reserve(cells_.size() - missing_count_);
    for (const auto& cell : cells_) {
        if (const auto* number = std::get_if<double>(&cell)) {
            values.push_back(*number);
        }
    }
    return values;
}

std::vector<Cell> Column::PresentValues() const {
    std::vector<Cell> values;
    values.reserve(cells_.size() - missing_count_);
    for (const auto& cell : cells_) {
        if (!IsMissing(cell)) {
            values.push_back(cell);
        }
    }
    return values;
}

size_t Column::DistinctCount() const {
    std::set<Cell> distinct;
    for (const auto& cell : cells_) {
        if (!IsMissing(cell)) {
            distinct.insert(cell);
        }
    }
    return distinct.size();
}

// =============================================================================
// Dataset
// =============================================================================

absl::StatusOr<Dataset> Dataset::FromColumns(std::vector<Column> columns) {
    Dataset dataset;
    if (columns.empty()) {
        return dataset;
    }

    dataset.num_rows_ = columns.front().Size();
    for (size_t i = 0; i < columns.size(); ++i) {
        const auto& column = columns[i];
        if (column.Size() != dataset.num_rows_) {
            return absl::InvalidArgumentError(absl::StrCat(
                "Column '", column.Name(), "' has ", column.Size(),
                " values, expected ", dataset.num_rows_));
        }
        auto [it, inserted] = dataset.index_.emplace(column.Name(), i);
        if (!inserted) {
            return absl::InvalidArgumentError(
                absl::StrCat("Duplicate column name: '", column.Name(), "'"));
        }
    }

    dataset.columns_ = std::move(columns);
    return dataset;
}

absl::StatusOr<Dataset> Dataset::FromJson(const nlohmann::ordered_json& json) {
    std::vector<Column> columns;

    if (json.is_object()) {
        columns.reserve(json.size());
        for (const auto& [name, values] : json.items()) {
            if (!values.is_array()) {
                return absl::InvalidArgumentError(
                    absl::StrCat("Column '", name, "' must be a JSON array"));
            }
            std::vector<Cell> cells;
            cells.reserve(values.size());
            for (const auto& value : values) {
                auto cell = JsonToCell(value, name);
                if (!cell.ok()) {
                    return cell.status();
                }
                cells.push_back(std::move(*cell));
            }
            columns.emplace_back(name, std::move(cells));
        }
        return FromColumns(std::move(columns));
    }

    if (json.is_array()) {
        std::vector<std::string> names;
        std::unordered_map<std::string, std::vector<Cell>> cells_by_name;
        size_t row = 0;

        for (const auto& record : json) {
            if (!record.is_object()) {
                return absl::InvalidArgumentError(
                    absl::StrCat("Row ", row, " must be a JSON object"));
            }
            for (const auto& [name, value] : record.items()) {
                auto it = cells_by_name.find(name);
                if (it == cells_by_name.end()) {
                    // Column first seen on this row: earlier rows are missing
                    names.push_back(name);
                    it = cells_by_name.emplace(name, std::vector<Cell>(row)).first;
                }
                auto cell = JsonToCell(value, name);
                if (!cell.ok()) {
                    return cell.status();
                }
                it->second.push_back(std::move(*cell));
            }
            ++row;
            for (auto& [name, cells] : cells_by_name) {
                cells.resize(row);  // pads keys absent from this record
            }
        }

        columns.reserve(names.size());
        for (const auto& name : names) {
            columns.emplace_back(name, std::move(cells_by_name[name]));
        }
        return FromColumns(std::move(columns));
    }

    return absl::InvalidArgumentError(
        "Dataset JSON must be an object of columns or an array of rows");
}

std::vector<std::string> Dataset::ColumnNames() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& column : columns_) {
        names.push_back(column.Name());
    }
    return names;
}

const Column* Dataset::FindColumn(std::string_view name) const {
    auto it = index_.find(std::string(name));
    if (it == index_.end()) {
        return nullptr;
    }
    return &columns_[it->second];
}

}  // namespace sentinel::data
