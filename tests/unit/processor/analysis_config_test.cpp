/// @file analysis_config_test.cpp
/// @brief Tests for typed analysis configuration

#include <gtest/gtest.h>

#include "common/config.h"
#include "common/error.h"
#include "processor/analysis_config.h"

namespace driftguard {
namespace {

TEST(AnalysisConfigTest, DefaultsAreValid) {
    EXPECT_TRUE(ValidateAnalysisConfig(AnalysisConfig{}).ok());
}

TEST(AnalysisConfigTest, RejectsOutOfRangeValues) {
    AnalysisConfig config;
    config.psi_bins = 1;
    EXPECT_EQ(GetErrorCode(ValidateAnalysisConfig(config)), ErrorCode::kConfigurationError);

    config = AnalysisConfig{};
    config.min_group_size = 0;
    EXPECT_EQ(GetErrorCode(ValidateAnalysisConfig(config)), ErrorCode::kConfigurationError);

    config = AnalysisConfig{};
    config.thresholds.psi_major = 0.05;  // below psi_minor
    EXPECT_EQ(GetErrorCode(ValidateAnalysisConfig(config)), ErrorCode::kConfigurationError);

    config = AnalysisConfig{};
    config.thresholds.p_value = 1.5;
    EXPECT_EQ(GetErrorCode(ValidateAnalysisConfig(config)), ErrorCode::kConfigurationError);

    config = AnalysisConfig{};
    config.score_penalty = 120;
    EXPECT_EQ(GetErrorCode(ValidateAnalysisConfig(config)), ErrorCode::kConfigurationError);
}

TEST(AnalysisConfigTest, LoadFromYaml) {
    auto yaml = Config::LoadFromString(R"(
analysis:
  min_group_size: 30
  max_combination_size: 2
  psi_bins: 5
  sample_size: 50
  top_k: 5
  random_seed: 7
  analysis_interval: 500
  window_size: 1000
  thresholds:
    psi_minor: 0.05
    psi_major: 0.2
    disparate_impact: 0.9
)");
    ASSERT_TRUE(yaml.ok());

    auto config = LoadAnalysisConfig(*yaml);
    ASSERT_TRUE(config.ok()) << config.status().message();

    EXPECT_EQ(config->min_group_size, 30);
    EXPECT_EQ(config->max_combination_size, 2);
    EXPECT_EQ(config->psi_bins, 5);
    EXPECT_EQ(config->sample_size, 50);
    EXPECT_EQ(config->top_k, 5);
    EXPECT_EQ(config->random_seed, 7);
    EXPECT_EQ(config->analysis_interval, 500);
    EXPECT_EQ(config->window_size, 1000);
    EXPECT_DOUBLE_EQ(config->thresholds.psi_minor, 0.05);
    EXPECT_DOUBLE_EQ(config->thresholds.psi_major, 0.2);
    EXPECT_DOUBLE_EQ(config->thresholds.disparate_impact, 0.9);
    // Untouched keys keep their defaults
    EXPECT_DOUBLE_EQ(config->thresholds.p_value, 0.05);
    EXPECT_EQ(config->positive_label, 1);
}

TEST(AnalysisConfigTest, LoadRejectsNegativeSizes) {
    auto yaml = Config::LoadFromString("analysis:\n  min_group_size: -3\n");
    ASSERT_TRUE(yaml.ok());

    auto config = LoadAnalysisConfig(*yaml);
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(GetErrorCode(config.status()), ErrorCode::kConfigurationError);
}

TEST(AnalysisConfigTest, LoadValidatesResult) {
    auto yaml = Config::LoadFromString("analysis:\n  psi_bins: 1\n");
    ASSERT_TRUE(yaml.ok());
    EXPECT_FALSE(LoadAnalysisConfig(*yaml).ok());
}

TEST(AnalysisConfigTest, ToJson) {
    AnalysisConfig config;
    config.min_group_size = 15;
    nlohmann::json j = AnalysisConfigToJson(config);
    EXPECT_EQ(j["min_group_size"], 15);
    EXPECT_EQ(j["top_k"], 3);
}

}  // namespace
}  // namespace driftguard
