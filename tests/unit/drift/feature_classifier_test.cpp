/// @file feature_classifier_test.cpp
/// @brief Tests for continuous/categorical feature classification

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "drift/feature_classifier.h"
#include "test_data.h"

namespace sentinel::drift {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

using testing::Grid;
using testing::MakeDataset;
using testing::NumericColumn;
using testing::TextColumn;

class FeatureClassifierTest : public ::testing::Test {
protected:
    FeatureClassifier classifier_;
};

TEST_F(FeatureClassifierTest, HighCardinalityNumericIsContinuous) {
    EXPECT_EQ(classifier_.Classify(NumericColumn("x", Grid(100))), FeatureKind::kContinuous);
}

TEST_F(FeatureClassifierTest, TextIsCategorical) {
    EXPECT_EQ(classifier_.Classify(TextColumn("sex", {"M", "F", "F"})),
              FeatureKind::kCategorical);
}

TEST_F(FeatureClassifierTest, BinaryNumericIsCategorical) {
    EXPECT_EQ(classifier_.Classify(NumericColumn("default", {0, 1, 0, 0, 1, 1, 0})),
              FeatureKind::kCategorical);
}

TEST_F(FeatureClassifierTest, CardinalityThresholdIsExclusive) {
    std::vector<double> nine;
    std::vector<double> ten;
    for (int i = 0; i < 100; ++i) {
        nine.push_back(i % 9);
        ten.push_back(i % 10);
    }
    EXPECT_EQ(classifier_.Classify(NumericColumn("nine", nine)), FeatureKind::kCategorical);
    EXPECT_EQ(classifier_.Classify(NumericColumn("ten", ten)), FeatureKind::kContinuous);
}

TEST_F(FeatureClassifierTest, MissingValuesDoNotCount) {
    data::Column column("x", {data::Cell{1.0}, data::Cell{}, data::Cell{2.0}, data::Cell{}});
    EXPECT_EQ(column.DistinctCount(), 2u);
    EXPECT_EQ(classifier_.Classify(column), FeatureKind::kCategorical);
}

TEST_F(FeatureClassifierTest, PartitionKeepsColumnOrder) {
    auto dataset = MakeDataset({
        NumericColumn("AGE", Grid(20, 0.0, 50.0)),
        NumericColumn("default", std::vector<double>(20, 1.0)),
        NumericColumn("LIMIT_BAL", Grid(20, 0.5, 1e5)),
        TextColumn("SEX", std::vector<std::string>(20, "F")),
    });

    auto partition = classifier_.Partition(dataset);

    EXPECT_THAT(partition.continuous, ElementsAre("AGE", "LIMIT_BAL"));
    EXPECT_THAT(partition.categorical, ElementsAre("default", "SEX"));
    EXPECT_EQ(partition.Size(), 4u);

    auto features = partition.Features();
    ASSERT_EQ(features.size(), 4u);
    EXPECT_EQ(features[0].name, "AGE");
    EXPECT_EQ(features[1].name, "LIMIT_BAL");
    EXPECT_EQ(features[2].name, "default");
    EXPECT_EQ(features[2].kind, FeatureKind::kCategorical);
    EXPECT_EQ(features[3].name, "SEX");
}

TEST_F(FeatureClassifierTest, OverrideReplacesAutoDetection) {
    auto dataset = MakeDataset({
        NumericColumn("AGE", Grid(20, 0.0, 50.0)),
        NumericColumn("default", std::vector<double>(20, 1.0)),
        NumericColumn("EDUCATION", Grid(20, 0.0, 100.0)),
    });

    auto partition = classifier_.PartitionWithOverride(dataset, {"EDUCATION"});
    ASSERT_TRUE(partition.ok()) << partition.status();

    // "default" would be auto-detected as categorical but the override wins
    EXPECT_THAT(partition->continuous, ElementsAre("AGE", "default"));
    EXPECT_THAT(partition->categorical, ElementsAre("EDUCATION"));
}

TEST_F(FeatureClassifierTest, EmptyOverrideMakesEverythingContinuous) {
    auto dataset = MakeDataset({
        NumericColumn("default", std::vector<double>(20, 1.0)),
    });

    auto partition = classifier_.PartitionWithOverride(dataset, {});
    ASSERT_TRUE(partition.ok());
    EXPECT_THAT(partition->continuous, ElementsAre("default"));
    EXPECT_TRUE(partition->categorical.empty());
}

TEST_F(FeatureClassifierTest, UnknownOverrideNameIsRejected) {
    auto dataset = MakeDataset({NumericColumn("AGE", Grid(20))});

    auto partition = classifier_.PartitionWithOverride(dataset, {"AGE", "SEX"});
    ASSERT_FALSE(partition.ok());
    EXPECT_EQ(partition.status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_THAT(std::string(partition.status().message()), HasSubstr("SEX"));
}

TEST(FeatureKindTest, ToString) {
    EXPECT_EQ(FeatureKindToString(FeatureKind::kContinuous), "continuous");
    EXPECT_EQ(FeatureKindToString(FeatureKind::kCategorical), "categorical");
}

}  // namespace
}  // namespace sentinel::drift
