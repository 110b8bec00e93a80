/// @file analysis_config.cpp
/// @brief Analysis configuration loading and validation

#include "processor/analysis_config.h"

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace driftguard {

absl::Status ValidateAnalysisConfig(const AnalysisConfig& config) {
    const Thresholds& t = config.thresholds;

    if (config.min_group_size == 0) {
        return ConfigurationError("min_group_size must be at least 1");
    }
    if (config.max_combination_size == 0) {
        return ConfigurationError("max_combination_size must be at least 1");
    }
    if (config.psi_bins < 2) {
        return ConfigurationError(
            absl::StrCat("psi_bins must be at least 2, got ", config.psi_bins));
    }
    if (config.psi_epsilon <= 0.0 || config.psi_epsilon >= 1.0) {
        return ConfigurationError("psi_epsilon must be in (0, 1)");
    }
    if (config.min_expected_frequency < 0.0) {
        return ConfigurationError("min_expected_frequency must be non-negative");
    }
    if (config.score_penalty < 0 || config.score_penalty > 100) {
        return ConfigurationError("score_penalty must be in [0, 100]");
    }
    if (config.sample_size == 0) {
        return ConfigurationError("sample_size must be at least 1");
    }
    if (config.top_k == 0) {
        return ConfigurationError("top_k must be at least 1");
    }
    if (t.psi_minor < 0.0 || t.psi_major < t.psi_minor) {
        return ConfigurationError(absl::StrCat(
            "PSI thresholds must satisfy 0 <= psi_minor <= psi_major, got ",
            t.psi_minor, " and ", t.psi_major));
    }
    if (t.p_value <= 0.0 || t.p_value >= 1.0) {
        return ConfigurationError("p_value threshold must be in (0, 1)");
    }
    if (t.disparate_impact <= 0.0 || t.disparate_impact > 1.0) {
        return ConfigurationError("disparate_impact threshold must be in (0, 1]");
    }
    if (t.parity_diff < 0.0 || t.parity_diff > 1.0) {
        return ConfigurationError("parity_diff threshold must be in [0, 1]");
    }
    if (t.eq_odds_diff < 0.0 || t.eq_odds_diff > 1.0) {
        return ConfigurationError("eq_odds_diff threshold must be in [0, 1]");
    }
    return absl::OkStatus();
}

absl::StatusOr<AnalysisConfig> LoadAnalysisConfig(const Config& config) {
    AnalysisConfig result;

    auto get_size = [&config](std::string_view key, size_t fallback) -> absl::StatusOr<size_t> {
        int64_t value = config.GetInt(key, static_cast<int64_t>(fallback));
        if (value < 0) {
            return ConfigurationError(absl::StrCat(absl::string_view(key.data(), key.size()), " must be non-negative"));
        }
        return static_cast<size_t>(value);
    };

    DRIFTGUARD_ASSIGN_OR_RETURN(result.min_group_size,
        get_size("analysis.min_group_size", result.min_group_size));
    DRIFTGUARD_ASSIGN_OR_RETURN(result.max_combination_size,
        get_size("analysis.max_combination_size", result.max_combination_size));
    DRIFTGUARD_ASSIGN_OR_RETURN(result.psi_bins,
        get_size("analysis.psi_bins", result.psi_bins));
    DRIFTGUARD_ASSIGN_OR_RETURN(result.sample_size,
        get_size("analysis.sample_size", result.sample_size));
    DRIFTGUARD_ASSIGN_OR_RETURN(result.top_k,
        get_size("analysis.top_k", result.top_k));
    DRIFTGUARD_ASSIGN_OR_RETURN(result.analysis_interval,
        get_size("analysis.analysis_interval", result.analysis_interval));
    DRIFTGUARD_ASSIGN_OR_RETURN(result.window_size,
        get_size("analysis.window_size", result.window_size));

    result.psi_epsilon = config.GetDouble("analysis.psi_epsilon", result.psi_epsilon);
    result.min_expected_frequency = config.GetDouble(
        "analysis.min_expected_frequency", result.min_expected_frequency);
    result.positive_label = static_cast<int>(
        config.GetInt("analysis.positive_label", result.positive_label));
    result.score_penalty = static_cast<int>(
        config.GetInt("analysis.score_penalty", result.score_penalty));
    result.random_seed = static_cast<uint64_t>(
        config.GetInt("analysis.random_seed", static_cast<int64_t>(result.random_seed)));

    Thresholds& t = result.thresholds;
    t.psi_minor = config.GetDouble("analysis.thresholds.psi_minor", t.psi_minor);
    t.psi_major = config.GetDouble("analysis.thresholds.psi_major", t.psi_major);
    t.p_value = config.GetDouble("analysis.thresholds.p_value", t.p_value);
    t.disparate_impact = config.GetDouble(
        "analysis.thresholds.disparate_impact", t.disparate_impact);
    t.parity_diff = config.GetDouble("analysis.thresholds.parity_diff", t.parity_diff);
    t.eq_odds_diff = config.GetDouble("analysis.thresholds.eq_odds_diff", t.eq_odds_diff);

    DRIFTGUARD_RETURN_IF_ERROR(ValidateAnalysisConfig(result));
    return result;
}

nlohmann::json AnalysisConfigToJson(const AnalysisConfig& config) {
    nlohmann::json j;
    j["min_group_size"] = config.min_group_size;
    j["max_combination_size"] = config.max_combination_size;
    j["psi_bins"] = config.psi_bins;
    j["psi_epsilon"] = config.psi_epsilon;
    j["min_expected_frequency"] = config.min_expected_frequency;
    j["positive_label"] = config.positive_label;
    j["score_penalty"] = config.score_penalty;
    j["sample_size"] = config.sample_size;
    j["top_k"] = config.top_k;
    j["random_seed"] = config.random_seed;
    j["analysis_interval"] = config.analysis_interval;
    j["window_size"] = config.window_size;
    j["thresholds"] = {
        {"psi_minor", config.thresholds.psi_minor},
        {"psi_major", config.thresholds.psi_major},
        {"p_value", config.thresholds.p_value},
        {"disparate_impact", config.thresholds.disparate_impact},
        {"parity_diff", config.thresholds.parity_diff},
        {"eq_odds_diff", config.thresholds.eq_odds_diff},
    };
    return j;
}

}  // namespace driftguard
