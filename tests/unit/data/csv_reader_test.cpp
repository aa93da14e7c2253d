/// @file csv_reader_test.cpp
/// @brief Tests for CSV ingestion

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "data/csv_reader.h"

namespace sentinel::data {
namespace {

class CsvReaderTest : public ::testing::Test {
protected:
    CsvReader reader_;
};

TEST_F(CsvReaderTest, ReadsTypedColumns) {
    auto dataset = reader_.ReadString(
        "LIMIT_BAL,SEX,score\n"
        "20000,M,0.5\n"
        "120000,F,1.25\n");
    ASSERT_TRUE(dataset.ok()) << dataset.status();

    EXPECT_EQ(dataset->NumRows(), 2u);
    EXPECT_EQ(dataset->ColumnNames(),
              (std::vector<std::string>{"LIMIT_BAL", "SEX", "score"}));
    EXPECT_TRUE(dataset->FindColumn("LIMIT_BAL")->IsNumeric());
    EXPECT_FALSE(dataset->FindColumn("SEX")->IsNumeric());
    EXPECT_EQ(dataset->FindColumn("score")->NumericValues(), (std::vector<double>{0.5, 1.25}));
}

TEST_F(CsvReaderTest, NaTokensAndEmptyFieldsAreMissing) {
    auto dataset = reader_.ReadString(
        "a,b\n"
        "1,NA\n"
        ",x\n"
        "nan,null\n");
    ASSERT_TRUE(dataset.ok()) << dataset.status();

    EXPECT_EQ(dataset->FindColumn("a")->MissingCount(), 2u);
    EXPECT_EQ(dataset->FindColumn("b")->MissingCount(), 2u);
    EXPECT_TRUE(dataset->FindColumn("a")->IsNumeric());
}

TEST_F(CsvReaderTest, QuotedFields) {
    auto dataset = reader_.ReadString(
        "name,note\n"
        "\"Smith, J\",\"said \"\"hi\"\"\"\n"
        "\"multi\nline\",plain\n");
    ASSERT_TRUE(dataset.ok()) << dataset.status();

    const auto& names = dataset->FindColumn("name")->Cells();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(std::get<std::string>(names[0]), "Smith, J");
    EXPECT_EQ(std::get<std::string>(names[1]), "multi\nline");
    EXPECT_EQ(std::get<std::string>(dataset->FindColumn("note")->Cells()[0]), "said \"hi\"");
}

TEST_F(CsvReaderTest, HandlesCrlfBomAndBlankLines) {
    auto dataset = reader_.ReadString(
        "\xEF\xBB\xBFx,y\r\n"
        "1,2\r\n"
        "\r\n"
        "3,4\r\n");
    ASSERT_TRUE(dataset.ok()) << dataset.status();

    EXPECT_EQ(dataset->ColumnNames(), (std::vector<std::string>{"x", "y"}));
    EXPECT_EQ(dataset->NumRows(), 2u);
    EXPECT_EQ(dataset->FindColumn("y")->NumericValues(), (std::vector<double>{2.0, 4.0}));
}

TEST_F(CsvReaderTest, TrimsUnquotedWhitespace) {
    auto dataset = reader_.ReadString("a , b\n 1 ,  x \n");
    ASSERT_TRUE(dataset.ok()) << dataset.status();

    EXPECT_EQ(dataset->ColumnNames(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(dataset->FindColumn("a")->NumericValues(), std::vector<double>{1.0});
    EXPECT_EQ(std::get<std::string>(dataset->FindColumn("b")->Cells()[0]), "x");
}

TEST_F(CsvReaderTest, ShortRowsArePadded) {
    auto dataset = reader_.ReadString("a,b,c\n1,2\n4,5,6\n");
    ASSERT_TRUE(dataset.ok()) << dataset.status();

    EXPECT_EQ(dataset->NumRows(), 2u);
    EXPECT_EQ(dataset->FindColumn("c")->MissingCount(), 1u);
}

TEST_F(CsvReaderTest, LongRowsAreRejectedWithLocation) {
    auto dataset = reader_.ReadString("a,b\n1,2\n3,4,5\n");
    ASSERT_FALSE(dataset.ok());
    EXPECT_EQ(dataset.status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_NE(dataset.status().message().find("<string>:3"), std::string::npos)
        << dataset.status().message();
}

TEST_F(CsvReaderTest, UnterminatedQuoteIsAnError) {
    EXPECT_FALSE(reader_.ReadString("a\n\"open\n").ok());
}

TEST_F(CsvReaderTest, EmptyInputHasNoHeader) {
    EXPECT_FALSE(reader_.ReadString("").ok());
}

TEST_F(CsvReaderTest, HeaderOnlyGivesEmptyDataset) {
    auto dataset = reader_.ReadString("a,b\n");
    ASSERT_TRUE(dataset.ok());
    EXPECT_EQ(dataset->NumColumns(), 2u);
    EXPECT_TRUE(dataset->Empty());
}

TEST_F(CsvReaderTest, UnnamedHeaderColumns) {
    auto dataset = reader_.ReadString(",value\n0,1\n");
    ASSERT_TRUE(dataset.ok()) << dataset.status();
    EXPECT_TRUE(dataset->HasColumn("Unnamed: 0"));
}

TEST_F(CsvReaderTest, DuplicateHeaderIsAnError) {
    EXPECT_FALSE(reader_.ReadString("a,a\n1,2\n").ok());
}

TEST_F(CsvReaderTest, CustomDelimiter) {
    CsvOptions options;
    options.delimiter = ';';
    CsvReader reader(options);

    auto dataset = reader.ReadString("a;b\n1,5;x\n");
    ASSERT_TRUE(dataset.ok()) << dataset.status();
    EXPECT_FALSE(dataset->FindColumn("a")->IsNumeric());  // "1,5" is text
}

TEST_F(CsvReaderTest, ParseCell) {
    EXPECT_TRUE(IsMissing(reader_.ParseCell("")));
    EXPECT_TRUE(IsMissing(reader_.ParseCell("  ")));
    EXPECT_TRUE(IsMissing(reader_.ParseCell("N/A")));
    EXPECT_EQ(std::get<double>(reader_.ParseCell("-2")), -2.0);
    EXPECT_EQ(std::get<double>(reader_.ParseCell("1e3")), 1000.0);
    EXPECT_EQ(std::get<std::string>(reader_.ParseCell("abc")), "abc");
}

TEST_F(CsvReaderTest, ReadFile) {
    const auto path = std::filesystem::temp_directory_path() / "sentinel_csv_reader_test.csv";
    {
        std::ofstream out(path);
        out << "AGE,default\n25,0\n40,1\n";
    }

    auto dataset = reader_.ReadFile(path);
    ASSERT_TRUE(dataset.ok()) << dataset.status();
    EXPECT_EQ(dataset->NumRows(), 2u);

    std::filesystem::remove(path);
}

TEST_F(CsvReaderTest, MissingFileIsNotFound) {
    auto dataset = reader_.ReadFile("/nonexistent/data.csv");
    ASSERT_FALSE(dataset.ok());
    EXPECT_EQ(dataset.status().code(), absl::StatusCode::kNotFound);
}

}  // namespace
}  // namespace sentinel::data
