#pragma once

/// @file csv_writer.h
/// @brief Writes datasets back out as CSV

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>

#include <absl/status/status.h>

#include "data/dataset.h"

namespace sentinel::data {

/// @brief Serializes a Dataset with a header row
///
/// Missing cells are written as empty fields. Fields containing the
/// delimiter, a quote or a line break are quoted with doubled quotes.
class CsvWriter {
public:
    explicit CsvWriter(char delimiter = ',') : delimiter_(delimiter) {}

    /// @brief Write to a file, replacing it if present
    absl::Status WriteFile(const Dataset& dataset, const std::filesystem::path& path) const;

    /// @brief Write to a stream
    absl::Status WriteStream(const Dataset& dataset, std::ostream& out) const;

    /// @brief Render to a string
    std::string WriteString(const Dataset& dataset) const;

private:
    void Write(const Dataset& dataset, std::ostream& out) const;
    std::string Escape(std::string_view field) const;

    char delimiter_;
};

}  // namespace sentinel::data
