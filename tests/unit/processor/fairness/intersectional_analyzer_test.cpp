/// @file intersectional_analyzer_test.cpp
/// @brief Tests for intersectional fairness analysis

#include <gtest/gtest.h>

#include "common/error.h"
#include "processor/fairness/bias_analyzer.h"
#include "processor/fairness/intersectional_analyzer.h"
#include "fairness_test_util.h"

namespace driftguard::fairness {
namespace {

using test_util::MakeTable;
using test_util::Table;

/// Single-attribute checks look acceptable; Female x 50+ does not
Table HiringTable() {
    return MakeTable({"Sex", "Age_Group"}, {{{"Male", "<50"}, 100, 79},
                                            {{"Male", "50+"}, 100, 70},
                                            {{"Female", "<50"}, 100, 72},
                                            {{"Female", "50+"}, 100, 38}});
}

class IntersectionalAnalyzerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(analyzer_.Configure({"Sex", "Age_Group"}).ok());
    }

    IntersectionalAnalyzer analyzer_;
};

TEST_F(IntersectionalAnalyzerTest, FindsCompoundDisadvantage) {
    auto table = HiringTable();
    auto report = analyzer_.Evaluate(table.y_pred, table.sensitive);
    ASSERT_TRUE(report.ok()) << report.status().message();

    ASSERT_EQ(report->combinations.size(), 1);
    const CombinationResult& combination = report->combinations[0];
    EXPECT_EQ(combination.Name(), "Sex_Age_Group");
    ASSERT_EQ(combination.groups.size(), 4);

    const IntersectionalGroup& worst = combination.groups.at({"Female", "50+"});
    EXPECT_DOUBLE_EQ(worst.selection_rate, 0.38);
    EXPECT_NEAR(worst.disparity_ratio, 0.38 / 0.79, 1e-12);
    EXPECT_NEAR(worst.disparity_ratio, 0.48, 0.01);
    EXPECT_TRUE(worst.violation);

    const IntersectionalGroup& best = combination.groups.at({"Male", "<50"});
    EXPECT_DOUBLE_EQ(best.disparity_ratio, 1.0);
    EXPECT_FALSE(best.violation);

    ASSERT_FALSE(report->leaderboard.empty());
    const LeaderboardEntry& top = report->leaderboard.front();
    EXPECT_EQ(top.rank, 1);
    EXPECT_EQ(top.group, "Female_50+");
    EXPECT_EQ(top.combination, "Sex_Age_Group");
    EXPECT_EQ(top.status, LeaderboardStatus::kFail);
    EXPECT_EQ(top.count, 100);

    EXPECT_EQ(report->fairness_score, 80);
}

TEST_F(IntersectionalAnalyzerTest, LeaderboardSortedWorstFirst) {
    auto table = HiringTable();
    auto report = analyzer_.Evaluate(table.y_pred, table.sensitive);
    ASSERT_TRUE(report.ok());

    ASSERT_EQ(report->leaderboard.size(), 4);
    for (size_t i = 1; i < report->leaderboard.size(); ++i) {
        EXPECT_LE(report->leaderboard[i - 1].disparity_ratio,
                  report->leaderboard[i].disparity_ratio);
        EXPECT_EQ(report->leaderboard[i].rank, i + 1);
    }

    auto worst = report->WorstGroups(2);
    ASSERT_EQ(worst.size(), 2);
    EXPECT_EQ(worst[0].group, "Female_50+");
    EXPECT_EQ(report->WorstGroups(10).size(), 4);
}

TEST_F(IntersectionalAnalyzerTest, StatusLabels) {
    auto table = HiringTable();
    auto report = analyzer_.Evaluate(table.y_pred, table.sensitive);
    ASSERT_TRUE(report.ok());

    for (const auto& entry : report->leaderboard) {
        if (entry.group == "Male_50+") {
            // 0.70 / 0.79 = 0.886
            EXPECT_EQ(entry.status, LeaderboardStatus::kWarn);
        } else if (entry.group == "Female_<50") {
            // 0.72 / 0.79 = 0.911
            EXPECT_EQ(entry.status, LeaderboardStatus::kPass);
        }
    }
    EXPECT_EQ(LeaderboardStatusToString(LeaderboardStatus::kWarn), "WARN");
}

TEST_F(IntersectionalAnalyzerTest, UndersizedGroupsNeverRanked) {
    auto table = MakeTable({"Sex", "Age_Group"}, {{{"Male", "<50"}, 40, 30},
                                                  {{"Female", "<50"}, 40, 28},
                                                  {{"Female", "50+"}, 4, 0}});
    auto report = analyzer_.Evaluate(table.y_pred, table.sensitive, 10);
    ASSERT_TRUE(report.ok());

    for (const auto& entry : report->leaderboard) {
        EXPECT_GE(entry.count, 10) << entry.group;
    }
    const CombinationResult& combination = report->combinations[0];
    EXPECT_EQ(combination.groups.count({"Female", "50+"}), 0);
    ASSERT_EQ(combination.excluded_groups.size(), 1);
    EXPECT_EQ(combination.excluded_groups.at({"Female", "50+"}), 4);
    EXPECT_EQ(report->min_group_size, 10);
}

TEST_F(IntersectionalAnalyzerTest, RowsMissingAnAttributeNotGrouped) {
    auto table = HiringTable();
    table.sensitive["Age_Group"][0] = std::nullopt;

    auto report = analyzer_.Evaluate(table.y_pred, table.sensitive);
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report->combinations[0].groups.at({"Male", "<50"}).count, 99);
}

TEST_F(IntersectionalAnalyzerTest, NoFavorableOutcomesGiveUnitRatios) {
    auto table = MakeTable({"Sex", "Age_Group"}, {{{"Male", "<50"}, 20, 0},
                                                  {{"Female", "50+"}, 20, 0}});
    auto report = analyzer_.Evaluate(table.y_pred, table.sensitive);
    ASSERT_TRUE(report.ok());

    for (const auto& entry : report->leaderboard) {
        EXPECT_DOUBLE_EQ(entry.disparity_ratio, 1.0);
        EXPECT_FALSE(entry.violation);
    }
    EXPECT_EQ(report->fairness_score, 100);
}

TEST_F(IntersectionalAnalyzerTest, SummaryNamesWorstGroups) {
    auto table = HiringTable();
    auto report = analyzer_.Evaluate(table.y_pred, table.sensitive);
    ASSERT_TRUE(report.ok());

    EXPECT_NE(report->summary.find("INTERSECTIONAL BIAS DETECTED"), std::string::npos);
    EXPECT_NE(report->summary.find("Female_50+ (Sex_Age_Group)"), std::string::npos);
    EXPECT_NE(report->summary.find("38.0%"), std::string::npos);
    EXPECT_NE(report->summary.find("Monitor closely"), std::string::npos);
}

TEST_F(IntersectionalAnalyzerTest, SummaryWithoutViolations) {
    auto table = MakeTable({"Sex", "Age_Group"}, {{{"Male", "<50"}, 20, 10},
                                                  {{"Female", "50+"}, 20, 10}});
    auto report = analyzer_.Evaluate(table.y_pred, table.sensitive);
    ASSERT_TRUE(report.ok());
    EXPECT_NE(report->summary.find("No significant intersectional bias"), std::string::npos);
}

TEST_F(IntersectionalAnalyzerTest, InputErrors) {
    auto table = HiringTable();
    EXPECT_EQ(GetErrorCode(analyzer_.Evaluate({}, table.sensitive).status()),
              ErrorCode::kInputValidation);
    EXPECT_EQ(GetErrorCode(analyzer_.Evaluate(table.y_pred, table.sensitive, 0).status()),
              ErrorCode::kInputValidation);

    SensitiveFeatures misaligned = table.sensitive;
    misaligned["Sex"].pop_back();
    EXPECT_EQ(GetErrorCode(analyzer_.Evaluate(table.y_pred, misaligned).status()),
              ErrorCode::kInputValidation);
}

TEST_F(IntersectionalAnalyzerTest, ReportToJson) {
    auto table = HiringTable();
    auto report = analyzer_.Evaluate(table.y_pred, table.sensitive);
    ASSERT_TRUE(report.ok());

    nlohmann::json j = ToJson(*report);
    EXPECT_EQ(j["intersectional_fairness_score"], 80);
    ASSERT_TRUE(j["combinations"].contains("Sex_Age_Group"));
    EXPECT_TRUE(j["combinations"]["Sex_Age_Group"]["has_violation"].get<bool>());
    EXPECT_EQ(j["leaderboard"][0]["group"], "Female_50+");
    EXPECT_EQ(j["leaderboard"][0]["status"], "FAIL");
}

TEST(IntersectionalConfigureTest, EnumeratesCombinationsInOrder) {
    IntersectionalAnalyzer analyzer;
    ASSERT_TRUE(analyzer.Configure({"A", "B", "C"}, 3).ok());

    const std::vector<std::vector<std::string>> expected = {
        {"A", "B"}, {"A", "C"}, {"B", "C"}, {"A", "B", "C"}};
    EXPECT_EQ(analyzer.Combinations(), expected);
}

TEST(IntersectionalConfigureTest, CapLimitsCombinationSize) {
    IntersectionalAnalyzer analyzer;
    ASSERT_TRUE(analyzer.Configure({"A", "B", "C", "D"}, 2).ok());
    EXPECT_EQ(analyzer.Combinations().size(), 6);
    for (const auto& combination : analyzer.Combinations()) {
        EXPECT_EQ(combination.size(), 2);
    }
}

TEST(IntersectionalConfigureTest, RejectsInvalidSettings) {
    IntersectionalAnalyzer analyzer;
    EXPECT_EQ(GetErrorCode(analyzer.Configure({})), ErrorCode::kConfigurationError);
    EXPECT_EQ(GetErrorCode(analyzer.Configure({"A", "A"})), ErrorCode::kConfigurationError);
    EXPECT_EQ(GetErrorCode(analyzer.Configure({"A", "B"}, 1, 2)),
              ErrorCode::kConfigurationError);
    EXPECT_EQ(GetErrorCode(analyzer.Configure({"A", "B"}, 2, 0)),
              ErrorCode::kConfigurationError);
}

TEST(IntersectionalConfigureTest, EvaluateBeforeConfigureFails) {
    IntersectionalAnalyzer analyzer;
    auto table = HiringTable();
    EXPECT_EQ(GetErrorCode(analyzer.Evaluate(table.y_pred, table.sensitive).status()),
              ErrorCode::kFailedPrecondition);
}

TEST(IntersectionalConfigureTest, CombinationsWithAbsentAttributeSkipped) {
    IntersectionalAnalyzer analyzer;
    ASSERT_TRUE(analyzer.Configure({"Sex", "Age_Group", "Religion"}, 2).ok());

    auto table = HiringTable();
    auto report = analyzer.Evaluate(table.y_pred, table.sensitive);
    ASSERT_TRUE(report.ok());

    ASSERT_EQ(report->combinations.size(), 1);
    EXPECT_NE(report->FindCombination({"Sex", "Age_Group"}), nullptr);
    EXPECT_EQ(report->FindCombination({"Sex", "Religion"}), nullptr);
    const std::vector<std::vector<std::string>> skipped = {
        {"Sex", "Religion"}, {"Age_Group", "Religion"}};
    EXPECT_EQ(report->skipped_combinations, skipped);
}

TEST(IntersectionalConsistencyTest, SizeOneMatchesBiasAnalyzer) {
    auto table = MakeTable({"Sex", "Race"}, {{{"Male", "A"}, 30, 20},
                                             {{"Male", "B"}, 25, 9},
                                             {{"Female", "A"}, 15, 12},
                                             {{"Female", "B"}, 40, 13},
                                             {{"Female", "C"}, 6, 1}});

    BiasAnalyzer bias;
    ASSERT_TRUE(bias.Configure({"Sex", "Race"}).ok());

    IntersectionalAnalyzer intersectional;
    ASSERT_TRUE(intersectional.Configure({"Sex", "Race"}, 1, 1).ok());

    auto report = intersectional.Evaluate(table.y_pred, table.sensitive, 10);
    ASSERT_TRUE(report.ok());
    ASSERT_EQ(report->combinations.size(), 2);

    for (const auto& combination : report->combinations) {
        const std::string& attribute = combination.attributes.front();
        auto fairness = bias.Evaluate(attribute, table.y_pred, {}, table.sensitive);
        ASSERT_TRUE(fairness.ok());

        ASSERT_EQ(combination.groups.size(), fairness->groups.size()) << attribute;
        for (const auto& [key, group] : combination.groups) {
            ASSERT_EQ(key.size(), 1);
            EXPECT_DOUBLE_EQ(group.selection_rate,
                             fairness->groups.at(key.front()).selection_rate)
                << attribute << "=" << key.front();
        }
        EXPECT_EQ(combination.excluded_groups.size(), fairness->excluded_groups.size());
    }
}

}  // namespace
}  // namespace driftguard::fairness
