#pragma once

/// @file analysis_config.h
/// @brief Typed configuration shared by the drift, fairness and RCA analyzers

#include <cstddef>
#include <cstdint>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "common/config.h"

namespace driftguard {

/// @brief Decision thresholds
///
/// Industry rules of thumb, configurable per model.
struct Thresholds {
    /// PSI at or below this is "no drift"; above raises an alert
    double psi_minor = 0.1;

    /// PSI above this is "major" drift
    double psi_major = 0.25;

    /// Significance level for the KS and chi-square tests
    double p_value = 0.05;

    /// Four-Fifths Rule: min/max selection rate must reach this
    double disparate_impact = 0.8;

    /// Max allowed selection rate gap
    double parity_diff = 0.1;

    /// Max allowed TPR/FPR gap
    double eq_odds_diff = 0.1;
};

/// @brief Recognized analysis options with their defaults
struct AnalysisConfig {
    /// Groups smaller than this are excluded from fairness reporting
    size_t min_group_size = 10;

    /// Largest attribute combination evaluated intersectionally
    size_t max_combination_size = 3;

    /// Equal-frequency bins for PSI
    size_t psi_bins = 10;

    /// Floor applied to empty PSI bins to avoid log(0)
    double psi_epsilon = 1e-4;

    /// Chi-square cells must expect more than this many rows
    double min_expected_frequency = 5.0;

    /// Prediction value counted as the favorable outcome
    int positive_label = 1;

    /// Points removed from a 100 fairness score per failed check
    int score_penalty = 20;

    /// Rows drawn per side for attribution
    size_t sample_size = 100;

    /// Most-changed contributors reported by root cause analysis
    size_t top_k = 3;

    /// Seed for attribution subsampling
    uint64_t random_seed = 42;

    /// Observations between automatic analyses (0 disables)
    size_t analysis_interval = 100;

    /// Most recent observations analyzed (0 = whole log)
    size_t window_size = 0;

    Thresholds thresholds;
};

/// @brief Reject out-of-range options
/// @return kConfigurationError describing the first invalid option
absl::Status ValidateAnalysisConfig(const AnalysisConfig& config);

/// @brief Build the typed configuration from the "analysis" section
///
/// Keys missing from the document keep their defaults; the result is validated.
absl::StatusOr<AnalysisConfig> LoadAnalysisConfig(const Config& config);

/// @brief JSON rendering of the effective configuration
nlohmann::json AnalysisConfigToJson(const AnalysisConfig& config);

}  // namespace driftguard
