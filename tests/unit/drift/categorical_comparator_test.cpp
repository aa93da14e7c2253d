/// @file categorical_comparator_test.cpp
/// @brief Tests for the Chi-square comparator and contingency tables

#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

#include "drift/categorical_comparator.h"
#include "test_data.h"

namespace sentinel::drift {
namespace {

using testing::Labels;
using testing::NumericColumn;
using testing::SampleGenerator;
using testing::TextColumn;

std::vector<std::string> Repeat(const std::string& value, size_t n) {
    return std::vector<std::string>(n, value);
}

std::vector<std::string> Concat(std::initializer_list<std::vector<std::string>> parts) {
    std::vector<std::string> out;
    for (const auto& part : parts) {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

std::vector<data::Cell> Cells(const std::vector<std::string>& values) {
    return std::vector<data::Cell>(values.begin(), values.end());
}

ContingencyTable Table(std::vector<size_t> reference, std::vector<size_t> production) {
    ContingencyTable table;
    for (size_t i = 0; i < reference.size(); ++i) {
        table.categories.push_back(data::Cell{std::string(1, static_cast<char>('a' + i))});
    }
    table.reference_counts = std::move(reference);
    table.production_counts = std::move(production);
    return table;
}

class CategoricalComparatorTest : public ::testing::Test {
protected:
    CategoricalComparator comparator_;
};

TEST_F(CategoricalComparatorTest, MatchingCountsHaveZeroStatistic) {
    auto result = comparator_.ChiSquare(Table({40, 30, 30}, {40, 30, 30}));
    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(result->statistic, 0.0);
    EXPECT_DOUBLE_EQ(result->p_value, 1.0);
    EXPECT_EQ(result->degrees_of_freedom, 2);
    EXPECT_EQ(result->num_categories, 3u);
    EXPECT_FALSE(result->drift_detected);
}

TEST_F(CategoricalComparatorTest, ThreeCategoryStatistic) {
    // Expected counts 15/10/5 per row; deviations of 5 in columns a and c
    auto result = comparator_.ChiSquare(Table({10, 10, 10}, {20, 10, 0}));
    ASSERT_TRUE(result.ok());
    EXPECT_NEAR(result->statistic, 40.0 / 3.0, 1e-12);
    EXPECT_EQ(result->degrees_of_freedom, 2);
    // With two degrees of freedom the survival function is exp(-x / 2)
    EXPECT_NEAR(result->p_value, std::exp(-20.0 / 3.0), 1e-12);
    EXPECT_TRUE(result->drift_detected);
}

TEST_F(CategoricalComparatorTest, TwoCategoriesUseYatesCorrection) {
    auto result = comparator_.ChiSquare(Table({10, 20}, {20, 10}));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->degrees_of_freedom, 1);
    EXPECT_NEAR(result->statistic, 5.4, 1e-12);
    EXPECT_NEAR(result->p_value, 0.020137, 1e-5);
    EXPECT_TRUE(result->drift_detected);
}

TEST_F(CategoricalComparatorTest, YatesCorrectionNeverOvershoots) {
    // Observed within 0.5 of expected collapses to zero rather than flipping sign
    auto result = comparator_.ChiSquare(Table({50, 51}, {51, 50}));
    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(result->statistic, 0.0);
    EXPECT_DOUBLE_EQ(result->p_value, 1.0);
}

TEST_F(CategoricalComparatorTest, SingleCategoryNeverDrifts) {
    auto result = comparator_.ChiSquare(Cells(Repeat("x", 100)), Cells(Repeat("x", 10)));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->degrees_of_freedom, 0);
    EXPECT_DOUBLE_EQ(result->statistic, 0.0);
    EXPECT_DOUBLE_EQ(result->p_value, 1.0);
    EXPECT_FALSE(result->drift_detected);
}

TEST_F(CategoricalComparatorTest, NewProductionCategoryDrifts) {
    const auto reference = Concat({Repeat("a", 100), Repeat("b", 100)});
    const auto production = Concat({Repeat("a", 100), Repeat("b", 100), Repeat("c", 50)});

    auto result = comparator_.Compare(TextColumn("f", reference), TextColumn("f", production));
    ASSERT_TRUE(result.ok()) << result.status;
    ASSERT_NE(result.categorical(), nullptr);
    EXPECT_EQ(result.categorical()->chi_square.num_categories, 3u);
    EXPECT_LT(result.categorical()->chi_square.p_value, 1e-6);
    EXPECT_TRUE(result.drift_detected);
    EXPECT_EQ(result.kind, FeatureKind::kCategorical);
}

TEST_F(CategoricalComparatorTest, SameDistributionDoesNotDrift) {
    SampleGenerator gen(21);
    const std::vector<std::string> categories = {"low", "mid", "high"};
    const std::vector<double> weights = {0.5, 0.3, 0.2};
    const auto reference = Labels(gen, 2000, categories, weights);
    const auto production = Labels(gen, 2000, categories, weights);

    auto result = comparator_.Compare(TextColumn("f", reference), TextColumn("f", production));
    ASSERT_TRUE(result.ok());
    EXPECT_GT(result.categorical()->chi_square.p_value, 0.001);
}

TEST_F(CategoricalComparatorTest, ShiftedProportionsDrift) {
    SampleGenerator gen(22);
    const std::vector<std::string> categories = {"low", "mid", "high"};
    const auto reference = Labels(gen, 2000, categories, {0.6, 0.3, 0.1});
    const auto production = Labels(gen, 2000, categories, {0.2, 0.3, 0.5});

    auto result = comparator_.Compare(TextColumn("f", reference), TextColumn("f", production));
    ASSERT_TRUE(result.ok());
    EXPECT_LT(result.categorical()->chi_square.p_value, 1e-10);
    EXPECT_TRUE(result.drift_detected);
}

TEST_F(CategoricalComparatorTest, EmptySideFails) {
    auto result = comparator_.Compare(TextColumn("f", Repeat("a", 10)),
                                      data::Column("f", {data::Cell{}, data::Cell{}}));
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.status.code(), absl::StatusCode::kFailedPrecondition);
    EXPECT_FALSE(result.drift_detected);
    EXPECT_EQ(result.categorical(), nullptr);
    EXPECT_EQ(result.reference_count, 10u);
    EXPECT_EQ(result.production_count, 0u);
}

TEST_F(CategoricalComparatorTest, ZeroMarginsFail) {
    EXPECT_EQ(comparator_.ChiSquare(Table({0, 0}, {3, 4})).status().code(),
              absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(comparator_.ChiSquare(Table({5, 0}, {3, 0})).status().code(),
              absl::StatusCode::kFailedPrecondition);
    EXPECT_FALSE(comparator_.ChiSquare(ContingencyTable{}).ok());
}

TEST_F(CategoricalComparatorTest, ContingencyTableIsSortedUnion) {
    const std::vector<data::Cell> reference = {
        data::Cell{std::string("b")}, data::Cell{1.0}, data::Cell{}, data::Cell{std::string("b")}};
    const std::vector<data::Cell> production = {
        data::Cell{std::string("a")}, data::Cell{1.0}, data::Cell{1.0}};

    const auto table = ContingencyTable::Build(reference, production);

    ASSERT_EQ(table.NumCategories(), 3u);
    // Numbers order before text
    EXPECT_TRUE(table.categories[0] == data::Cell{1.0});
    EXPECT_TRUE(table.categories[1] == data::Cell{std::string("a")});
    EXPECT_TRUE(table.categories[2] == data::Cell{std::string("b")});
    EXPECT_EQ(table.reference_counts, (std::vector<size_t>{1, 0, 2}));
    EXPECT_EQ(table.production_counts, (std::vector<size_t>{2, 1, 0}));
}

TEST_F(CategoricalComparatorTest, NumericCategoriesAreCounted) {
    auto result = comparator_.Compare(NumericColumn("sex", {1, 2, 1, 2, 1, 2}),
                                      NumericColumn("sex", {1, 2, 2, 1}));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.categorical()->chi_square.num_categories, 2u);
    EXPECT_FALSE(result.drift_detected);
}

TEST_F(CategoricalComparatorTest, SignificanceLevelIsConfigurable) {
    CategoricalComparator strict(1e-12);
    auto result = strict.ChiSquare(Table({10, 20}, {20, 10}));
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result->drift_detected);
    EXPECT_DOUBLE_EQ(strict.GetSignificanceLevel(), 1e-12);
}

TEST_F(CategoricalComparatorTest, Identity) {
    EXPECT_EQ(comparator_.Kind(), FeatureKind::kCategorical);
    EXPECT_EQ(comparator_.Name(), "CategoricalComparator");
}

}  // namespace
}  // namespace sentinel::drift
