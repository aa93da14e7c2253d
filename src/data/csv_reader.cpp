#include "data/csv_reader.h"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace sentinel::data {

namespace {

void SkipBom(std::istream& in) {
    static constexpr unsigned char kBom[] = {0xEF, 0xBB, 0xBF};
    for (unsigned char expected : kBom) {
        const int next = in.peek();
        if (next == std::char_traits<char>::eof() ||
            static_cast<unsigned char>(next) != expected) {
            // A partial BOM is not valid UTF-8 text anyway; leave the stream as is
            return;
        }
        in.get();
    }
}

std::string_view TrimBlanks(std::string_view value) {
    const size_t start = value.find_first_not_of(" \t");
    if (start == std::string_view::npos) {
        return {};
    }
    const size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

}  // namespace

CsvReader::CsvReader(CsvOptions options) : options_(std::move(options)) {}

Cell CsvReader::ParseCell(std::string_view field) const {
    const std::string_view trimmed = TrimBlanks(field);
    if (trimmed.empty()) {
        return Cell{};
    }
    if (std::find(options_.na_values.begin(), options_.na_values.end(), trimmed) !=
        options_.na_values.end()) {
        return Cell{};
    }

    double number = 0.0;
    if (absl::SimpleAtod(absl::string_view(trimmed.data(), trimmed.size()), &number)) {
        return Cell{number};
    }
    return Cell{std::string(field)};
}

absl::StatusOr<std::vector<CsvReader::Record>> CsvReader::Tokenize(
    std::istream& in, std::string_view source) const {

    std::vector<Record> records;
    Record current;
    std::string field;
    bool in_quotes = false;
    bool field_quoted = false;
    bool record_has_data = false;
    size_t line = 1;
    current.line = line;

    auto push_field = [&]() {
        if (field_quoted || !options_.trim_whitespace) {
            current.fields.push_back(field);
        } else {
            current.fields.emplace_back(TrimBlanks(field));
        }
        field.clear();
        field_quoted = false;
    };

    auto push_record = [&]() {
        if (record_has_data) {
            push_field();
            records.push_back(std::move(current));
        }
        current = Record{};
        field.clear();
        field_quoted = false;
        record_has_data = false;
        current.line = line;
    };

    char c;
    while (in.get(c)) {
        if (in_quotes) {
            if (c == '"') {
                if (in.peek() == '"') {
                    in.get();
                    field += '"';
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') {
                    ++line;
                }
                field += c;
            }
        } else if (c == '"' && TrimBlanks(field).empty() && !field_quoted) {
            in_quotes = true;
            field_quoted = true;
            field.clear();
            record_has_data = true;
        } else if (c == options_.delimiter) {
            push_field();
            record_has_data = true;
        } else if (c == '\r') {
            if (in.peek() == '\n') {
                continue;
            }
            ++line;
            push_record();
        } else if (c == '\n') {
            ++line;
            push_record();
        } else {
            field += c;
            if (c != ' ' && c != '\t') {
                record_has_data = true;
            }
        }

        if (field.size() > options_.max_field_bytes) {
            return MakeError(ErrorCode::kParseError, absl::StrCat(
                absl::string_view(source.data(), source.size()), ":", current.line, ": field exceeds ",
                options_.max_field_bytes, " bytes"));
        }
    }

    if (in_quotes) {
        return MakeError(ErrorCode::kParseError, absl::StrCat(
            absl::string_view(source.data(), source.size()), ":", current.line, ": unterminated quoted field"));
    }
    push_record();

    return records;
}

absl::StatusOr<Dataset> CsvReader::ReadStream(std::istream& in,
                                              std::string_view source) const {
    SkipBom(in);

    auto records = Tokenize(in, source);
    if (!records.ok()) {
        return records.status();
    }
    if (records->empty()) {
        return absl::InvalidArgumentError(absl::StrCat(absl::string_view(source.data(), source.size()), ": no header row"));
    }

    const std::vector<std::string>& header = records->front().fields;
    const size_t num_columns = header.size();
    std::vector<std::vector<Cell>> cells(num_columns);
    for (auto& column_cells : cells) {
        column_cells.reserve(records->size() - 1);
    }

    for (size_t r = 1; r < records->size(); ++r) {
        const Record& record = (*records)[r];
        if (record.fields.size() > num_columns) {
            return MakeError(ErrorCode::kParseError, absl::StrCat(
                absl::string_view(source.data(), source.size()), ":", record.line, ": expected ", num_columns,
                " fields, saw ", record.fields.size()));
        }
        for (size_t c = 0; c < num_columns; ++c) {
            if (c < record.fields.size()) {
                cells[c].push_back(ParseCell(record.fields[c]));
            } else {
                cells[c].emplace_back();
            }
        }
    }

    std::vector<Column> columns;
    columns.reserve(num_columns);
    for (size_t c = 0; c < num_columns; ++c) {
        std::string name = header[c];
        if (name.empty()) {
            name = absl::StrCat("Unnamed: ", c);
        }
        columns.emplace_back(std::move(name), std::move(cells[c]));
    }

    auto dataset = Dataset::FromColumns(std::move(columns));
    if (!dataset.ok()) {
        return absl::InvalidArgumentError(
            absl::StrCat(absl::string_view(source.data(), source.size()), ": ", dataset.status().message()));
    }

    SENTINEL_LOG_DEBUG("Read {} rows x {} columns from {}",
                       dataset->NumRows(), dataset->NumColumns(), source);
    return dataset;
}

absl::StatusOr<Dataset> CsvReader::ReadFile(const std::filesystem::path& path) const {
    if (!std::filesystem::exists(path)) {
        return absl::NotFoundError(absl::StrCat("CSV file not found: ", path.string()));
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return absl::UnavailableError(absl::StrCat("Cannot open CSV file: ", path.string()));
    }
    return ReadStream(in, path.string());
}

absl::StatusOr<Dataset> CsvReader::ReadString(std::string_view content) const {
    std::istringstream in{std::string(content)};
    return ReadStream(in, "<string>");
}

}  // namespace sentinel::data
