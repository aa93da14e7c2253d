#include "data/csv_writer.h"

#include <fstream>
#include <sstream>

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace sentinel::data {

std::string CsvWriter::Escape(std::string_view field) const {
    const bool needs_quotes =
        field.find_first_of(std::string{delimiter_, '"', '\n', '\r'}) != std::string_view::npos;
    if (!needs_quotes) {
        return std::string(field);
    }
    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"') {
            escaped += '"';
        }
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

void CsvWriter::Write(const Dataset& dataset, std::ostream& out) const {
    const auto& columns = dataset.Columns();

    for (size_t c = 0; c < columns.size(); ++c) {
        if (c > 0) {
            out << delimiter_;
        }
        out << Escape(columns[c].Name());
    }
    out << '\n';

    for (size_t row = 0; row < dataset.NumRows(); ++row) {
        for (size_t c = 0; c < columns.size(); ++c) {
            if (c > 0) {
                out << delimiter_;
            }
            out << Escape(CellToString(columns[c].Cells()[row]));
        }
        out << '\n';
    }
}

absl::Status CsvWriter::WriteStream(const Dataset& dataset, std::ostream& out) const {
    Write(dataset, out);
    if (!out) {
        return MakeError(ErrorCode::kSerializationError, "Failed writing CSV output");
    }
    return absl::OkStatus();
}

absl::Status CsvWriter::WriteFile(const Dataset& dataset,
                                  const std::filesystem::path& path) const {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        return absl::UnavailableError(absl::StrCat("Cannot open ", path.string(), " for writing"));
    }
    if (auto status = WriteStream(dataset, out); !status.ok()) {
        return MakeError(ErrorCode::kSerializationError, absl::StrCat("Failed writing ", path.string()));
    }
    out.close();
    if (out.fail()) {
        return MakeError(ErrorCode::kSerializationError, absl::StrCat("Failed closing ", path.string()));
    }
    return absl::OkStatus();
}

std::string CsvWriter::WriteString(const Dataset& dataset) const {
    std::ostringstream out;
    Write(dataset, out);
    return out.str();
}

}  // namespace sentinel::data
