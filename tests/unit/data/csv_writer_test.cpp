/// @file csv_writer_test.cpp
/// @brief Tests for CSV output

#include <gtest/gtest.h>

#include <filesystem>

#include "data/csv_reader.h"
#include "data/csv_writer.h"

namespace sentinel::data {
namespace {

Dataset MakeDataset() {
    std::vector<Column> columns;
    columns.emplace_back("id", std::vector<Cell>{Cell{1.0}, Cell{2.0}});
    columns.emplace_back("note", std::vector<Cell>{Cell{std::string("a, b")}, Cell{}});
    columns.emplace_back("ratio", std::vector<Cell>{Cell{0.5}, Cell{std::string("say \"x\"")}});
    auto dataset = Dataset::FromColumns(std::move(columns));
    EXPECT_TRUE(dataset.ok());
    return std::move(*dataset);
}

TEST(CsvWriterTest, WritesHeaderAndEscapesFields) {
    CsvWriter writer;
    EXPECT_EQ(writer.WriteString(MakeDataset()),
              "id,note,ratio\n"
              "1,\"a, b\",0.5\n"
              "2,,\"say \"\"x\"\"\"\n");
}

TEST(CsvWriterTest, OutputReadsBack) {
    CsvWriter writer;
    CsvReader reader;

    auto dataset = reader.ReadString(writer.WriteString(MakeDataset()));
    ASSERT_TRUE(dataset.ok()) << dataset.status();

    EXPECT_EQ(dataset->NumRows(), 2u);
    EXPECT_EQ(std::get<std::string>(dataset->FindColumn("note")->Cells()[0]), "a, b");
    EXPECT_TRUE(IsMissing(dataset->FindColumn("note")->Cells()[1]));
    EXPECT_EQ(std::get<std::string>(dataset->FindColumn("ratio")->Cells()[1]), "say \"x\"");
}

TEST(CsvWriterTest, WriteFile) {
    const auto path = std::filesystem::temp_directory_path() / "sentinel_csv_writer_test.csv";
    CsvWriter writer;

    ASSERT_TRUE(writer.WriteFile(MakeDataset(), path).ok());
    EXPECT_TRUE(std::filesystem::exists(path));

    auto dataset = CsvReader().ReadFile(path);
    ASSERT_TRUE(dataset.ok()) << dataset.status();
    EXPECT_EQ(dataset->NumColumns(), 3u);

    std::filesystem::remove(path);
}

TEST(CsvWriterTest, UnwritablePath) {
    CsvWriter writer;
    auto status = writer.WriteFile(MakeDataset(), "/nonexistent/dir/out.csv");
    EXPECT_FALSE(status.ok());
}

}  // namespace
}  // namespace sentinel::data
