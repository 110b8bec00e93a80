/// @file root_cause_analyzer_test.cpp
/// @brief Tests for attribution drift analysis

#include <gtest/gtest.h>

#include <cmath>
#include <memory>

#include "common/error.h"
#include "processor/rca/linear_attribution.h"
#include "processor/rca/root_cause_analyzer.h"

namespace driftguard::rca {
namespace {

class TreeModel : public Model {
public:
    std::string Type() const override { return "random_forest"; }
    absl::StatusOr<std::vector<double>> Predict(const Dataset& rows) const override {
        return std::vector<double>(rows.size(), 1.0);
    }
};

/// Counts calls and hands back a fixed-shape matrix
class RecordingEngine : public AttributionEngine {
public:
    absl::StatusOr<AttributionMatrix> Explain(const Model&,
                                              const Dataset& background,
                                              const Dataset& sample) const override {
        background_sizes.push_back(background.size());
        sample_sizes.push_back(sample.size());
        AttributionMatrix matrix;
        matrix.features = {"x"};
        matrix.values.assign(sample.size(), std::vector<double>{1.0});
        return matrix;
    }

    mutable std::vector<size_t> background_sizes;
    mutable std::vector<size_t> sample_sizes;
};

class RaggedEngine : public AttributionEngine {
public:
    absl::StatusOr<AttributionMatrix> Explain(const Model&, const Dataset&,
                                              const Dataset&) const override {
        AttributionMatrix matrix;
        matrix.features = {"x", "y"};
        matrix.values = {{1.0}};
        return matrix;
    }
};

class RootCauseAnalyzerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto model = LinearModel::Create({"age", "income", "tenure"}, {1.0, 0.0, 0.5});
        ASSERT_TRUE(model.ok());
        model_ = std::make_unique<LinearModel>(std::move(*model));

        // Age is pinned near 40 in the baseline and spread over 20..60 now
        for (int i = 0; i < 200; ++i) {
            baseline_.push_back(FeatureRow{{"age", 39.0 + i % 3},
                                           {"income", 1000.0 + i},
                                           {"tenure", static_cast<double>(i % 11)}});
            current_.push_back(FeatureRow{{"age", 20.0 + i % 41},
                                          {"income", 1000.0 + i},
                                          {"tenure", static_cast<double>(i % 11)}});
        }
    }

    RootCauseAnalyzer LinearAnalyzer() const {
        return RootCauseAnalyzer(AnalysisConfig{}, std::make_shared<LinearAttributionEngine>());
    }

    std::unique_ptr<LinearModel> model_;
    Dataset baseline_;
    Dataset current_;
};

TEST_F(RootCauseAnalyzerTest, RanksShiftedFeatureFirst) {
    auto report = LinearAnalyzer().ExplainDrift(*model_, baseline_, current_, 50, 2);
    ASSERT_TRUE(report.ok()) << report.status().message();
    ASSERT_TRUE(report->available);

    EXPECT_EQ(report->baseline_sample_size, 50);
    EXPECT_EQ(report->current_sample_size, 50);
    ASSERT_EQ(report->features.size(), 3);
    ASSERT_EQ(report->top_features.size(), 2);
    EXPECT_EQ(report->top_features[0], "age");

    const auto* age = report->Find("age");
    ASSERT_NE(age, nullptr);
    EXPECT_LT(age->baseline_mean_abs_attribution, 1.5);
    EXPECT_GT(age->current_mean_abs_attribution, 5.0);
    EXPECT_GT(age->delta, 0.0);

    const auto* income = report->Find("income");
    ASSERT_NE(income, nullptr);
    EXPECT_DOUBLE_EQ(income->delta, 0.0);
}

TEST_F(RootCauseAnalyzerTest, FeaturesOrderedByAbsoluteDelta) {
    auto report = LinearAnalyzer().ExplainDrift(*model_, baseline_, current_, 60, 3);
    ASSERT_TRUE(report.ok());
    for (size_t i = 1; i < report->features.size(); ++i) {
        EXPECT_GE(std::abs(report->features[i - 1].delta),
                  std::abs(report->features[i].delta));
    }
}

TEST_F(RootCauseAnalyzerTest, SeededSamplingIsDeterministic) {
    auto analyzer = LinearAnalyzer();
    auto first = analyzer.ExplainDrift(*model_, baseline_, current_, 30);
    auto second = analyzer.ExplainDrift(*model_, baseline_, current_, 30);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    ASSERT_EQ(first->features.size(), second->features.size());
    for (size_t i = 0; i < first->features.size(); ++i) {
        EXPECT_EQ(first->features[i].feature, second->features[i].feature);
        EXPECT_DOUBLE_EQ(first->features[i].delta, second->features[i].delta);
    }
}

TEST_F(RootCauseAnalyzerTest, SmallSamplesUsedWhole) {
    auto engine = std::make_shared<RecordingEngine>();
    RootCauseAnalyzer analyzer(AnalysisConfig{}, engine);

    Dataset few(baseline_.begin(), baseline_.begin() + 7);
    auto report = analyzer.ExplainDrift(*model_, few, current_, 20);
    ASSERT_TRUE(report.ok());
    EXPECT_TRUE(report->available);
    EXPECT_EQ(report->baseline_sample_size, 7);
    EXPECT_EQ(report->current_sample_size, 20);

    // Background for both calls, then baseline and current samples
    EXPECT_EQ(engine->background_sizes, (std::vector<size_t>{7, 7}));
    EXPECT_EQ(engine->sample_sizes, (std::vector<size_t>{7, 20}));
    EXPECT_DOUBLE_EQ(report->features[0].delta, 0.0);
}

TEST_F(RootCauseAnalyzerTest, UnsupportedModelIsUnavailable) {
    TreeModel tree;
    auto report = LinearAnalyzer().ExplainDrift(tree, baseline_, current_);
    ASSERT_TRUE(report.ok());
    EXPECT_FALSE(report->available);
    EXPECT_NE(report->reason.find("random_forest"), std::string::npos);
    EXPECT_TRUE(report->features.empty());
}

TEST_F(RootCauseAnalyzerTest, MalformedEngineOutputIsUnavailable) {
    RootCauseAnalyzer analyzer(AnalysisConfig{}, std::make_shared<RaggedEngine>());
    auto report = analyzer.ExplainDrift(*model_, baseline_, current_, 10);
    ASSERT_TRUE(report.ok());
    EXPECT_FALSE(report->available);
}

TEST_F(RootCauseAnalyzerTest, Errors) {
    RootCauseAnalyzer no_engine;
    EXPECT_FALSE(no_engine.HasEngine());
    EXPECT_EQ(GetErrorCode(no_engine.ExplainDrift(*model_, baseline_, current_).status()),
              ErrorCode::kFailedPrecondition);

    auto analyzer = LinearAnalyzer();
    EXPECT_TRUE(analyzer.HasEngine());
    EXPECT_EQ(GetErrorCode(analyzer.ExplainDrift(*model_, {}, current_).status()),
              ErrorCode::kInputValidation);
    EXPECT_EQ(GetErrorCode(analyzer.ExplainDrift(*model_, baseline_, {}).status()),
              ErrorCode::kInputValidation);
    EXPECT_EQ(GetErrorCode(analyzer.ExplainDrift(*model_, baseline_, current_, 0).status()),
              ErrorCode::kInputValidation);
}

TEST_F(RootCauseAnalyzerTest, RenderAndJson) {
    auto report = LinearAnalyzer().ExplainDrift(*model_, baseline_, current_, 50, 1);
    ASSERT_TRUE(report.ok());

    std::string text = RenderReport(*report);
    EXPECT_NE(text.find("- age: importance increased by"), std::string::npos);
    EXPECT_EQ(text.find("tenure"), std::string::npos);

    auto json = ToJson(*report);
    EXPECT_TRUE(json["available"].get<bool>());
    EXPECT_EQ(json["top_drifted_features"][0], "age");
    EXPECT_EQ(json["feature_importance_drift"].size(), 3);
    EXPECT_EQ(json["baseline_sample_size"], 50);
}

TEST(RenderReportTest, UnavailableAndEmpty) {
    auto unavailable = AttributionDriftReport::Unavailable("no model");
    EXPECT_EQ(RenderReport(unavailable), "Root cause analysis unavailable: no model");
    EXPECT_EQ(ToJson(unavailable)["reason"], "no model");

    AttributionDriftReport empty;
    empty.available = true;
    EXPECT_EQ(RenderReport(empty), "No significant feature importance drift detected.");
}

}  // namespace
}  // namespace driftguard::rca
