/// @file bias_analyzer.cpp
/// @brief Bias analyzer implementation

#include "processor/fairness/bias_analyzer.h"

#include <algorithm>
#include <unordered_set>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace driftguard::fairness {

namespace {

/// Spread (max - min) of a per-group rate over groups where it is defined
std::optional<double> RateSpread(const std::map<std::string, GroupStats>& groups,
                                 std::optional<double> GroupStats::*rate) {
    std::optional<double> lo;
    std::optional<double> hi;
    size_t defined = 0;
    for (const auto& [name, stats] : groups) {
        const auto& value = stats.*rate;
        if (!value) {
            continue;
        }
        ++defined;
        lo = lo ? std::min(*lo, *value) : *value;
        hi = hi ? std::max(*hi, *value) : *value;
    }
    if (defined < 2) {
        return std::nullopt;
    }
    return *hi - *lo;
}

}  // namespace

size_t FairnessReport::FailedMetrics() const {
    return static_cast<size_t>(disparate_impact.Failed()) +
           static_cast<size_t>(demographic_parity_diff.Failed()) +
           static_cast<size_t>(equalized_odds_diff.Failed());
}

std::map<std::string, double> FairnessReport::SelectionRates() const {
    std::map<std::string, double> rates;
    for (const auto& [name, stats] : groups) {
        rates[name] = stats.selection_rate;
    }
    return rates;
}

const FairnessReport* FairnessSummary::Find(const std::string& attribute) const {
    for (const auto& report : reports) {
        if (report.attribute == attribute) {
            return &report;
        }
    }
    return nullptr;
}

nlohmann::json ToJson(const FairnessReport& report) {
    nlohmann::json j;
    j["attribute"] = report.attribute;
    j["by_group"] = nlohmann::json::object();
    for (const auto& [name, stats] : report.groups) {
        j["by_group"][name] = ToJson(stats);
    }
    j["excluded_groups"] = report.excluded_groups;
    j["disparate_impact"] = ToJson(report.disparate_impact);
    j["demographic_parity_difference"] = ToJson(report.demographic_parity_diff);
    j["equalized_odds_difference"] = ToJson(report.equalized_odds_diff);
    j["composite_score"] = report.composite_score;
    return j;
}

nlohmann::json ToJson(const FairnessSummary& summary) {
    nlohmann::json j;
    j["attributes"] = nlohmann::json::array();
    for (const auto& report : summary.reports) {
        j["attributes"].push_back(ToJson(report));
    }
    j["skipped_attributes"] = summary.skipped_attributes;
    j["fairness_score"] = summary.fairness_score;
    return j;
}

// =============================================================================
// BiasAnalyzer Implementation
// =============================================================================

BiasAnalyzer::BiasAnalyzer(AnalysisConfig config)
    : config_(std::move(config)) {}

absl::Status BiasAnalyzer::Configure(std::vector<std::string> sensitive_attributes) {
    if (sensitive_attributes.empty()) {
        return ConfigurationError("At least one sensitive attribute is required");
    }
    std::unordered_set<std::string> seen;
    for (const auto& attribute : sensitive_attributes) {
        if (attribute.empty()) {
            return ConfigurationError("Sensitive attribute names must be non-empty");
        }
        if (!seen.insert(attribute).second) {
            return ConfigurationError(
                absl::StrCat("Sensitive attribute '", attribute, "' listed twice"));
        }
    }
    DRIFTGUARD_RETURN_IF_ERROR(ValidateAnalysisConfig(config_));

    attributes_ = std::move(sensitive_attributes);
    DRIFTGUARD_LOG_INFO("BiasAnalyzer configured with {} sensitive attributes",
                        attributes_.size());
    return absl::OkStatus();
}

absl::StatusOr<FairnessReport> BiasAnalyzer::Evaluate(
    const std::string& attribute,
    const std::vector<int>& y_pred,
    const LabelColumn& y_true,
    const SensitiveFeatures& sensitive_features) const {

    if (attributes_.empty()) {
        return FailedPreconditionError("BiasAnalyzer has no sensitive attributes configured");
    }
    if (std::find(attributes_.begin(), attributes_.end(), attribute) == attributes_.end()) {
        return ConfigurationError(
            absl::StrCat("Attribute '", attribute, "' is not a configured sensitive attribute"));
    }
    if (y_pred.empty()) {
        return InputValidationError("No predictions to evaluate");
    }

    auto column = sensitive_features.find(attribute);
    if (column == sensitive_features.end()) {
        return InputValidationError(
            absl::StrCat("Sensitive feature '", attribute, "' not supplied"));
    }
    if (column->second.empty()) {
        return InputValidationError(
            absl::StrCat("Sensitive feature '", attribute, "' has zero rows"));
    }

    DRIFTGUARD_ASSIGN_OR_RETURN(
        auto grouped,
        GroupBy(y_pred, y_true, {&column->second}, config_.positive_label));
    if (grouped.empty()) {
        return InputValidationError(
            absl::StrCat("Sensitive feature '", attribute, "' has zero distinct groups"));
    }

    FairnessReport report;
    report.attribute = attribute;
    for (auto& [key, stats] : grouped) {
        const std::string& name = key.front();
        if (stats.count < config_.min_group_size) {
            report.excluded_groups[name] = stats.count;
        } else {
            report.groups.emplace(name, std::move(stats));
        }
    }
    if (!report.excluded_groups.empty()) {
        DRIFTGUARD_LOG_WARN("Attribute '{}': {} groups below minimum size {} excluded",
                            attribute, report.excluded_groups.size(),
                            config_.min_group_size);
    }

    const bool has_labels = std::any_of(y_true.begin(), y_true.end(),
                                        [](const auto& label) { return label.has_value(); });
    ComputeMetrics(report, has_labels);

    DRIFTGUARD_LOG_DEBUG("Attribute '{}': {} groups, score {}",
                         attribute, report.groups.size(), report.composite_score);
    return report;
}

void BiasAnalyzer::ComputeMetrics(FairnessReport& report, bool has_labels) const {
    const Thresholds& t = config_.thresholds;

    if (report.groups.size() < 2) {
        const std::string note = absl::StrCat(
            "Fewer than two groups with at least ", config_.min_group_size, " rows");
        report.disparate_impact = MetricResult::NotApplicable(t.disparate_impact, note);
        report.demographic_parity_diff = MetricResult::NotApplicable(t.parity_diff, note);
        report.equalized_odds_diff = MetricResult::NotApplicable(t.eq_odds_diff, note);
        report.composite_score = CompositeScore(0, config_.score_penalty);
        return;
    }

    double min_rate = 1.0;
    double max_rate = 0.0;
    for (const auto& [name, stats] : report.groups) {
        min_rate = std::min(min_rate, stats.selection_rate);
        max_rate = std::max(max_rate, stats.selection_rate);
    }

    // Demographic parity
    MetricResult& parity = report.demographic_parity_diff;
    parity.threshold = t.parity_diff;
    parity.value = max_rate - min_rate;
    parity.status = *parity.value <= t.parity_diff ? MetricStatus::kPass : MetricStatus::kFail;

    // Disparate impact, relative to the best-treated group
    if (max_rate > 0.0) {
        MetricResult& impact = report.disparate_impact;
        impact.threshold = t.disparate_impact;
        impact.value = min_rate / max_rate;
        impact.status = *impact.value >= t.disparate_impact ? MetricStatus::kPass
                                                            : MetricStatus::kFail;
    } else {
        report.disparate_impact = MetricResult::NotApplicable(
            t.disparate_impact, "No favorable predictions in any group");
    }

    // Equalized odds
    if (!has_labels) {
        report.equalized_odds_diff = MetricResult::NotApplicable(
            t.eq_odds_diff, "Ground truth not supplied");
    } else {
        auto tpr_gap = RateSpread(report.groups, &GroupStats::true_positive_rate);
        auto fpr_gap = RateSpread(report.groups, &GroupStats::false_positive_rate);
        if (!tpr_gap && !fpr_gap) {
            report.equalized_odds_diff = MetricResult::NotApplicable(
                t.eq_odds_diff, "Fewer than two groups with defined TPR or FPR");
        } else {
            MetricResult& odds = report.equalized_odds_diff;
            odds.threshold = t.eq_odds_diff;
            odds.value = std::max(tpr_gap.value_or(0.0), fpr_gap.value_or(0.0));
            odds.status = *odds.value <= t.eq_odds_diff ? MetricStatus::kPass
                                                        : MetricStatus::kFail;
        }
    }

    report.composite_score = CompositeScore(report.FailedMetrics(), config_.score_penalty);
}

absl::StatusOr<FairnessSummary> BiasAnalyzer::EvaluateAll(
    const std::vector<int>& y_pred,
    const LabelColumn& y_true,
    const SensitiveFeatures& sensitive_features) const {

    if (attributes_.empty()) {
        return FailedPreconditionError("BiasAnalyzer has no sensitive attributes configured");
    }
    if (y_pred.empty()) {
        return InputValidationError("No predictions to evaluate");
    }

    FairnessSummary summary;
    size_t failures = 0;

    for (const auto& attribute : attributes_) {
        auto report = Evaluate(attribute, y_pred, y_true, sensitive_features);
        if (!report.ok()) {
            if (GetErrorCode(report.status()) != ErrorCode::kInputValidation) {
                return report.status();
            }
            summary.skipped_attributes[attribute] = std::string(report.status().message());
            DRIFTGUARD_LOG_WARN("Skipping fairness evaluation for '{}': {}",
                                attribute, std::string(report.status().message()));
            continue;
        }
        failures += report->FailedMetrics();
        summary.reports.push_back(std::move(*report));
    }

    if (summary.reports.empty()) {
        return InputValidationError("None of the configured sensitive attributes could be evaluated");
    }

    summary.fairness_score = CompositeScore(failures, config_.score_penalty);
    DRIFTGUARD_LOG_INFO("Fairness evaluated for {} attributes, overall score {}",
                        summary.reports.size(), summary.fairness_score);
    return summary;
}

}  // namespace driftguard::fairness
