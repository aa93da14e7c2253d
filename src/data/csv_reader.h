#pragma once

/// @file csv_reader.h
/// @brief CSV ingestion into typed datasets

#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "data/dataset.h"

namespace sentinel::data {

/// @brief Options controlling CSV parsing and cell typing
struct CsvOptions {
    char delimiter = ',';

    /// Unquoted fields are trimmed of spaces and tabs
    bool trim_whitespace = true;

    /// Tokens read as missing values (the empty field is always missing)
    std::vector<std::string> na_values = {
        "NA", "N/A", "NaN", "nan", "null", "NULL", "None", "#N/A"};

    /// Upper bound on a single field to stop runaway quoted fields
    size_t max_field_bytes = 8 * 1024 * 1024;
};

/// @brief Reads CSV files with a header row into a Dataset
///
/// Each cell is typed on its own: NA tokens become missing, fields that parse
/// completely as floating point become numbers, everything else is text. A
/// column is numeric when none of its cells is text. Rows shorter than the
/// header are padded with missing cells; longer rows are rejected.
class CsvReader {
public:
    explicit CsvReader(CsvOptions options = {});

    /// @brief Read a CSV file
    absl::StatusOr<Dataset> ReadFile(const std::filesystem::path& path) const;

    /// @brief Read CSV content from a stream
    /// @param source Name used in error messages
    absl::StatusOr<Dataset> ReadStream(std::istream& in,
                                       std::string_view source = "<stream>") const;

    /// @brief Read CSV content held in memory
    absl::StatusOr<Dataset> ReadString(std::string_view content) const;

    /// @brief Type a single raw field
    Cell ParseCell(std::string_view field) const;

    const CsvOptions& GetOptions() const { return options_; }

private:
    struct Record {
        std::vector<std::string> fields;
        size_t line = 0;  ///< 1-based line the record starts on
    };

    /// @brief Split the whole input into records, honoring quoted newlines
    absl::StatusOr<std::vector<Record>> Tokenize(std::istream& in,
                                                 std::string_view source) const;

    CsvOptions options_;
};

}  // namespace sentinel::data
