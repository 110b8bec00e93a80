#pragma once

/// @file bias_analyzer.h
/// @brief Single-attribute group fairness metrics

#include <map>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "processor/analysis_config.h"
#include "processor/dataset.h"
#include "processor/fairness/group_metrics.h"

namespace driftguard::fairness {

/// @brief Fairness of the model's decisions across the groups of one attribute
struct FairnessReport {
    std::string attribute;

    /// Groups with at least min_group_size rows
    std::map<std::string, GroupStats> groups;

    /// Groups below min_group_size -> row count
    std::map<std::string, size_t> excluded_groups;

    MetricResult disparate_impact;
    MetricResult demographic_parity_diff;
    MetricResult equalized_odds_diff;

    int composite_score = 100;

    size_t FailedMetrics() const;
    std::map<std::string, double> SelectionRates() const;
};

/// @brief Reports for every configured attribute plus an overall score
struct FairnessSummary {
    std::vector<FairnessReport> reports;

    /// Configured attributes that could not be evaluated -> reason
    std::map<std::string, std::string> skipped_attributes;

    /// 100 minus the penalty per failed metric across all attributes
    int fairness_score = 100;

    const FairnessReport* Find(const std::string& attribute) const;
};

nlohmann::json ToJson(const FairnessReport& report);
nlohmann::json ToJson(const FairnessSummary& summary);

/// @brief Computes group fairness metrics for one sensitive attribute at a time
///
/// Metrics:
/// - Disparate impact: min/max selection rate, pass at >= 0.8 (Four-Fifths Rule)
/// - Demographic parity difference: max - min selection rate, pass at <= 0.1
/// - Equalized odds difference: larger of the TPR and FPR spreads, pass at
///   <= 0.1; requires ground truth
///
/// Example usage:
/// @code
///   BiasAnalyzer analyzer;
///   analyzer.Configure({"Sex", "Race"});
///   auto report = analyzer.Evaluate("Sex", predictions, labels, sensitive);
///   if (report.ok() && report->disparate_impact.Failed()) {
///       // investigate
///   }
/// @endcode
class BiasAnalyzer {
public:
    explicit BiasAnalyzer(AnalysisConfig config = {});

    /// @brief Set the sensitive attributes to evaluate
    /// @return kConfigurationError if the list is empty or has duplicates
    absl::Status Configure(std::vector<std::string> sensitive_attributes);

    /// @brief Evaluate one configured attribute
    /// @param attribute Sensitive attribute to group by
    /// @param y_pred Predictions
    /// @param y_true Labels aligned with y_pred, or empty when not available
    /// @param sensitive_features Attribute columns aligned with y_pred
    /// @return kInputValidation for zero rows, a missing or misaligned column,
    ///         or zero distinct groups
    absl::StatusOr<FairnessReport> Evaluate(
        const std::string& attribute,
        const std::vector<int>& y_pred,
        const LabelColumn& y_true,
        const SensitiveFeatures& sensitive_features) const;

    /// @brief Evaluate every configured attribute
    ///
    /// Attributes that cannot be evaluated are listed as skipped. Fails only
    /// when no attribute could be evaluated.
    absl::StatusOr<FairnessSummary> EvaluateAll(
        const std::vector<int>& y_pred,
        const LabelColumn& y_true,
        const SensitiveFeatures& sensitive_features) const;

    const std::vector<std::string>& SensitiveAttributes() const { return attributes_; }
    const AnalysisConfig& GetConfig() const { return config_; }

private:
    void ComputeMetrics(FairnessReport& report, bool has_labels) const;

    AnalysisConfig config_;
    std::vector<std::string> attributes_;
};

}  // namespace driftguard::fairness
