/// @file model_monitor_test.cpp
/// @brief End-to-end tests for the model monitor

#include <gtest/gtest.h>

#include "common/error.h"
#include "monitor/model_monitor.h"

namespace driftguard::monitor {
namespace {

class TreeModel : public rca::Model {
public:
    std::string Type() const override { return "random_forest"; }
    absl::StatusOr<std::vector<double>> Predict(const Dataset& rows) const override {
        return std::vector<double>(rows.size(), 0.5);
    }
};

class ModelMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        schema_.numerical_features = {"age", "income"};
        schema_.categorical_features = {"region"};
        for (int i = 0; i < 300; ++i) {
            baseline_.push_back(Row(30.0 + i % 20, 50.0 + i % 10, i));
        }
        config_.analysis_interval = 100;
        config_.sample_size = 50;
    }

    static FeatureRow Row(double age, double income, int i) {
        return FeatureRow{{"age", age},
                          {"income", income},
                          {"region", std::string(i % 2 == 0 ? "north" : "south")}};
    }

    /// Male selection rate 0.5, female 0.2; age shifted by age_offset
    static Observation MakeObservation(int i, double age_offset) {
        Observation observation;
        observation.features = Row(30.0 + i % 20 + age_offset, 50.0 + i % 10, i);
        const bool male = i % 2 == 0;
        observation.prediction = male ? (i % 4 == 0 ? 1 : 0) : (i % 10 == 1 ? 1 : 0);
        observation.sensitive_features = {
            {"Sex", male ? "Male" : "Female"},
            {"Race", (i / 2) % 2 == 0 ? "A" : "B"},
        };
        return observation;
    }

    void LogMany(ModelMonitor& monitor, int count, double age_offset) {
        for (int i = 0; i < count; ++i) {
            ASSERT_TRUE(monitor.LogObservation(MakeObservation(i, age_offset)).ok());
        }
    }

    std::shared_ptr<const rca::Model> LinearModel() const {
        auto model = rca::LinearModel::Create({"age", "income"}, {0.1, 0.02});
        EXPECT_TRUE(model.ok());
        return std::make_shared<rca::LinearModel>(std::move(*model));
    }

    FeatureSchema schema_;
    Dataset baseline_;
    AnalysisConfig config_;
};

TEST_F(ModelMonitorTest, RegisterOnce) {
    ModelMonitor monitor("credit", config_);
    EXPECT_FALSE(monitor.IsRegistered());
    ASSERT_TRUE(monitor.Register(schema_, baseline_, {"Sex", "Race"}).ok());
    EXPECT_TRUE(monitor.IsRegistered());
    EXPECT_EQ(monitor.SensitiveAttributes(), (std::vector<std::string>{"Sex", "Race"}));

    auto again = monitor.Register(schema_, baseline_, {});
    EXPECT_EQ(GetErrorCode(again), ErrorCode::kFailedPrecondition);
}

TEST_F(ModelMonitorTest, RegisterRejectsBadInput) {
    AnalysisConfig bad = config_;
    bad.min_group_size = 0;
    ModelMonitor invalid_config("m", bad);
    EXPECT_EQ(GetErrorCode(invalid_config.Register(schema_, baseline_, {})),
              ErrorCode::kConfigurationError);

    ModelMonitor duplicate_attributes("m", config_);
    EXPECT_EQ(GetErrorCode(duplicate_attributes.Register(schema_, baseline_, {"Sex", "Sex"})),
              ErrorCode::kConfigurationError);
    EXPECT_FALSE(duplicate_attributes.IsRegistered());

    ModelMonitor empty_baseline("m", config_);
    EXPECT_EQ(GetErrorCode(empty_baseline.Register(schema_, {}, {})),
              ErrorCode::kInputValidation);
    EXPECT_FALSE(empty_baseline.IsRegistered());
}

TEST_F(ModelMonitorTest, RequiresRegistration) {
    ModelMonitor monitor("m", config_);
    EXPECT_EQ(GetErrorCode(monitor.LogObservation(MakeObservation(0, 0.0)).status()),
              ErrorCode::kFailedPrecondition);
    EXPECT_EQ(GetErrorCode(monitor.RunAnalysis().status()), ErrorCode::kFailedPrecondition);
}

TEST_F(ModelMonitorTest, AnalysisDueEveryInterval) {
    ModelMonitor monitor("m", config_);
    ASSERT_TRUE(monitor.Register(schema_, baseline_, {}).ok());

    for (int i = 1; i <= 200; ++i) {
        auto due = monitor.LogObservation(MakeObservation(i, 0.0));
        ASSERT_TRUE(due.ok());
        EXPECT_EQ(*due, i % 100 == 0) << "observation " << i;
    }
    EXPECT_EQ(monitor.Log().Size(), 200);
}

TEST_F(ModelMonitorTest, IntervalZeroNeverDue) {
    AnalysisConfig config = config_;
    config.analysis_interval = 0;
    ModelMonitor monitor("m", config);
    ASSERT_TRUE(monitor.Register(schema_, baseline_, {}).ok());
    for (int i = 0; i < 150; ++i) {
        auto due = monitor.LogObservation(MakeObservation(i, 0.0));
        ASSERT_TRUE(due.ok());
        EXPECT_FALSE(*due);
    }
}

TEST_F(ModelMonitorTest, EmptyLogIsInsufficientData) {
    ModelMonitor monitor("m", config_);
    ASSERT_TRUE(monitor.Register(schema_, baseline_, {}).ok());
    EXPECT_EQ(GetErrorCode(monitor.RunAnalysis().status()), ErrorCode::kInsufficientData);
    EXPECT_EQ(monitor.LastReport(), nullptr);
}

TEST_F(ModelMonitorTest, StableDataSkipsRootCause) {
    ModelMonitor monitor("m", config_);
    ASSERT_TRUE(monitor.Register(schema_, baseline_, {}).ok());
    LogMany(monitor, 100, 0.0);

    auto report = monitor.RunAnalysis();
    ASSERT_TRUE(report.ok()) << report.status().message();
    EXPECT_FALSE(report->drift.HasAlerts());
    EXPECT_FALSE(report->root_cause.has_value());
    EXPECT_FALSE(report->fairness.has_value());
    EXPECT_EQ(report->fairness_note, "No sensitive attributes registered");
}

TEST_F(ModelMonitorTest, DriftWithoutModelArtifact) {
    ModelMonitor monitor("credit", config_);
    ASSERT_TRUE(monitor.Register(schema_, baseline_, {"Sex", "Race"}).ok());
    LogMany(monitor, 100, 30.0);

    auto report = monitor.RunAnalysis();
    ASSERT_TRUE(report.ok()) << report.status().message();

    EXPECT_EQ(report->model_id, "credit");
    EXPECT_EQ(report->total_observations, 100);
    EXPECT_EQ(report->analyzed_observations, 100);
    EXPECT_EQ(report->drift.AlertedFeatures(), std::vector<std::string>{"age"});

    ASSERT_TRUE(report->root_cause.has_value());
    EXPECT_FALSE(report->root_cause->available);
    EXPECT_EQ(report->root_cause_report,
              "Model artifact not available for attribution analysis");

    ASSERT_TRUE(report->fairness.has_value());
    const auto* sex = report->fairness->Find("Sex");
    ASSERT_NE(sex, nullptr);
    ASSERT_TRUE(sex->disparate_impact.value.has_value());
    EXPECT_NEAR(*sex->disparate_impact.value, 0.4, 1e-9);
    EXPECT_TRUE(sex->disparate_impact.Failed());
    EXPECT_LT(report->fairness->fairness_score, 100);

    ASSERT_TRUE(report->intersectional.has_value());
    ASSERT_FALSE(report->intersectional->leaderboard.empty());
    EXPECT_DOUBLE_EQ(report->intersectional->leaderboard.front().disparity_ratio, 0.0);
    EXPECT_LT(report->intersectional->fairness_score, 100);
}

TEST_F(ModelMonitorTest, DriftExplainedWithModel) {
    ModelMonitor monitor("credit", config_);
    ASSERT_TRUE(monitor.Register(schema_, baseline_, {"Sex", "Race"}).ok());
    monitor.SetModel(LinearModel());
    EXPECT_TRUE(monitor.HasModel());
    LogMany(monitor, 100, 30.0);

    auto report = monitor.RunAnalysis();
    ASSERT_TRUE(report.ok()) << report.status().message();
    ASSERT_TRUE(report->root_cause.has_value());
    ASSERT_TRUE(report->root_cause->available);
    ASSERT_FALSE(report->root_cause->top_features.empty());
    EXPECT_EQ(report->root_cause->top_features.front(), "age");
    EXPECT_EQ(report->root_cause->baseline_sample_size, 50);
    EXPECT_NE(report->root_cause_report.find("age: importance increased"), std::string::npos);
}

TEST_F(ModelMonitorTest, UnsupportedModelKeepsDriftReport) {
    ModelMonitor monitor("credit", config_);
    ASSERT_TRUE(monitor.Register(schema_, baseline_, {"Sex", "Race"}).ok());
    monitor.SetModel(std::make_shared<TreeModel>());
    LogMany(monitor, 100, 30.0);

    auto report = monitor.RunAnalysis();
    ASSERT_TRUE(report.ok()) << report.status().message();
    ASSERT_TRUE(report->root_cause.has_value());
    EXPECT_FALSE(report->root_cause->available);
    EXPECT_NE(report->root_cause->reason.find("random_forest"), std::string::npos);
    EXPECT_NE(report->root_cause_report.find("random_forest"), std::string::npos);

    for (const auto& feature : schema_.AllFeatures()) {
        EXPECT_NE(report->drift.Find(feature), nullptr) << feature;
    }
    EXPECT_EQ(report->drift.entries.size(), schema_.Size());
    EXPECT_TRUE(report->drift.HasAlerts());
    EXPECT_TRUE(report->fairness.has_value());
    EXPECT_NE(monitor.LastReport(), nullptr);
}

TEST_F(ModelMonitorTest, MissingEngineKeepsDriftReport) {
    ModelMonitor monitor("credit", config_, nullptr);
    ASSERT_TRUE(monitor.Register(schema_, baseline_, {}).ok());
    monitor.SetModel(LinearModel());
    LogMany(monitor, 100, 30.0);

    auto report = monitor.RunAnalysis();
    ASSERT_TRUE(report.ok()) << report.status().message();
    EXPECT_EQ(report->drift.AlertedFeatures(), std::vector<std::string>{"age"});
    ASSERT_TRUE(report->root_cause.has_value());
    EXPECT_FALSE(report->root_cause->available);
    EXPECT_NE(report->root_cause->reason.find("No attribution engine"), std::string::npos);

    const MonitoringReport* last = monitor.LastReport();
    ASSERT_NE(last, nullptr);
    EXPECT_EQ(last->total_observations, 100);
}

TEST_F(ModelMonitorTest, WindowLimitsAnalyzedObservations) {
    AnalysisConfig config = config_;
    config.window_size = 40;
    ModelMonitor monitor("m", config);
    ASSERT_TRUE(monitor.Register(schema_, baseline_, {}).ok());
    LogMany(monitor, 120, 0.0);

    auto report = monitor.RunAnalysis();
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report->total_observations, 120);
    EXPECT_EQ(report->analyzed_observations, 40);
    EXPECT_EQ(report->drift.current_size, 40);
}

TEST_F(ModelMonitorTest, LastReportAndJson) {
    ModelMonitor monitor("credit", config_);
    ASSERT_TRUE(monitor.Register(schema_, baseline_, {"Sex", "Race"}).ok());
    EXPECT_EQ(monitor.LastReport(), nullptr);
    LogMany(monitor, 100, 30.0);

    auto report = monitor.RunAnalysis();
    ASSERT_TRUE(report.ok());
    const MonitoringReport* last = monitor.LastReport();
    ASSERT_NE(last, nullptr);
    EXPECT_EQ(last->generated_at, report->generated_at);

    auto json = ToJson(*report);
    EXPECT_EQ(json["model_id"], "credit");
    EXPECT_EQ(json["total_predictions"], 100);
    EXPECT_TRUE(json.contains("drift_analysis"));
    EXPECT_TRUE(json["bias_analysis"].is_object());
    EXPECT_TRUE(json["intersectional_analysis"].is_object());
    EXPECT_FALSE(json["root_cause"]["available"].get<bool>());
    EXPECT_TRUE(json["timestamp"].is_number());
}

}  // namespace
}  // namespace driftguard::monitor
