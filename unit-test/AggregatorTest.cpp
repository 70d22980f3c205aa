#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "scoring/aggregator.hpp"

using namespace std;
using namespace grader;

class AggregatorTest : public ::testing::Test {
protected:
    static rubric_criterion make_criterion(const string &id, double weight, double max_score = 100) {
        rubric_criterion criterion;
        criterion.id = id;
        criterion.name = id;
        criterion.weight = weight;
        criterion.max_score = max_score;
        criterion.detail = static_check_spec();
        return criterion;
    }

    static score_entry make_entry(const string &id, double raw, double max_score = 100) {
        score_entry entry;
        entry.criterion_id = id;
        entry.raw_score = raw;
        entry.max_score = max_score;
        return entry;
    }

    vector<rubric_criterion> rubric = {
        make_criterion("functional", 40),
        make_criterion("retrieval", 30),
        make_criterion("static", 30)};
};

TEST_F(AggregatorTest, WeightedTotalTest) {
    auto result = aggregate({make_entry("functional", 90), make_entry("retrieval", 80), make_entry("static", 100)},
                            rubric, default_grade_thresholds());
    EXPECT_DOUBLE_EQ(result.total_score, 90.0);
    EXPECT_EQ(result.grade, "A");
}

TEST_F(AggregatorTest, AllZeroTest) {
    auto result = aggregate({make_entry("functional", 0), make_entry("retrieval", 0), make_entry("static", 0)},
                            rubric, default_grade_thresholds());
    EXPECT_DOUBLE_EQ(result.total_score, 0.0);
    EXPECT_EQ(result.grade, "F");
}

TEST_F(AggregatorTest, MissingEntryCountsAsZeroTest) {
    auto result = aggregate({make_entry("functional", 100)}, rubric, default_grade_thresholds());
    EXPECT_DOUBLE_EQ(result.total_score, 40.0);
    EXPECT_EQ(result.grade, "F");
}

TEST_F(AggregatorTest, DifferentMaxScoreTest) {
    vector<rubric_criterion> criteria = {make_criterion("setup", 15, 15), make_criterion("query", 25, 25)};
    auto result = aggregate({make_entry("setup", 15, 15), make_entry("query", 12.5, 25)}, criteria, default_grade_thresholds());
    // 100 * (1 * 15 + 0.5 * 25) / 40 = 68.75
    EXPECT_DOUBLE_EQ(result.total_score, 68.8);
    EXPECT_EQ(result.grade, "D");
}

TEST_F(AggregatorTest, TotalIsClampedTest) {
    auto result = aggregate({make_entry("functional", 1000), make_entry("retrieval", -50), make_entry("static", 100)},
                            rubric, default_grade_thresholds());
    EXPECT_GE(result.total_score, 0);
    EXPECT_LE(result.total_score, 100);
    EXPECT_DOUBLE_EQ(result.total_score, 70.0);
}

TEST_F(AggregatorTest, BoundaryGradeTest) {
    auto thresholds = default_grade_thresholds();
    EXPECT_EQ(letter_grade(100, thresholds), "A");
    EXPECT_EQ(letter_grade(89.9, thresholds), "B");
    EXPECT_EQ(letter_grade(80, thresholds), "B");
    EXPECT_EQ(letter_grade(60, thresholds), "D");
    EXPECT_EQ(letter_grade(59.9, thresholds), "F");
}

TEST_F(AggregatorTest, DeterministicTest) {
    vector<score_entry> entries = {make_entry("functional", 33.3), make_entry("retrieval", 66.6), make_entry("static", 12.1)};
    auto first = aggregate(entries, rubric, default_grade_thresholds());
    for (int i = 0; i < 10; ++i) {
        auto again = aggregate(entries, rubric, default_grade_thresholds());
        EXPECT_EQ(first.total_score, again.total_score);
        EXPECT_EQ(first.grade, again.grade);
    }
}

TEST_F(AggregatorTest, InvalidRubricTest) {
    EXPECT_THROW(validate_rubric({}), aggregation_error);
    EXPECT_THROW(validate_rubric({make_criterion("a", 0), make_criterion("b", 0)}), aggregation_error);
    EXPECT_THROW(validate_rubric({make_criterion("a", -1), make_criterion("b", 2)}), aggregation_error);
    EXPECT_THROW(validate_rubric({make_criterion("a", 1), make_criterion("a", 1)}), aggregation_error);
    EXPECT_THROW(validate_rubric({make_criterion("a", 1, 0)}), aggregation_error);
    EXPECT_NO_THROW(validate_rubric(rubric));
}

TEST_F(AggregatorTest, ZeroWeightAggregationTest) {
    EXPECT_THROW(aggregate({}, {make_criterion("a", 0)}, default_grade_thresholds()), aggregation_error);
}

TEST_F(AggregatorTest, InvalidThresholdsTest) {
    EXPECT_THROW(validate_thresholds({}), configuration_error);
    EXPECT_THROW(validate_thresholds({{80, "B"}, {90, "A"}, {0, "F"}}), configuration_error);
    EXPECT_THROW(validate_thresholds({{90, "A"}, {90, "B"}, {0, "F"}}), configuration_error);
    EXPECT_THROW(validate_thresholds({{120, "A"}, {0, "F"}}), configuration_error);
    EXPECT_THROW(validate_thresholds({{90, "A"}, {50, "F"}}), configuration_error);
    EXPECT_NO_THROW(validate_thresholds(default_grade_thresholds()));
}
