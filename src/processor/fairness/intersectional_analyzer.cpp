/// @file intersectional_analyzer.cpp
/// @brief Intersectional fairness analyzer implementation

#include "processor/fairness/intersectional_analyzer.h"

#include <algorithm>
#include <unordered_set>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "common/logging.h"

namespace driftguard::fairness {

namespace {

/// Ratio below which a passing group is still flagged on the leaderboard
constexpr double kWarnRatio = 0.9;

/// Violating groups listed in the summary
constexpr size_t kSummaryGroups = 3;

/// All k-element combinations of items, in lexicographic index order
void AppendCombinations(const std::vector<std::string>& items, size_t k,
                        std::vector<std::vector<std::string>>& out) {
    if (k == 0 || k > items.size()) {
        return;
    }
    std::vector<size_t> idx(k);
    for (size_t i = 0; i < k; ++i) idx[i] = i;

    while (true) {
        std::vector<std::string> combo;
        combo.reserve(k);
        for (size_t i : idx) combo.push_back(items[i]);
        out.push_back(std::move(combo));

        // Advance the rightmost index that still has room
        size_t pos = k;
        while (pos > 0 && idx[pos - 1] == items.size() - k + pos - 1) {
            --pos;
        }
        if (pos == 0) {
            return;
        }
        ++idx[pos - 1];
        for (size_t i = pos; i < k; ++i) {
            idx[i] = idx[i - 1] + 1;
        }
    }
}

}  // namespace

bool CombinationResult::HasViolation() const {
    return std::any_of(groups.begin(), groups.end(),
                       [](const auto& kv) { return kv.second.violation; });
}

std::string CombinationResult::Name() const {
    return absl::StrJoin(attributes, "_");
}

std::string_view LeaderboardStatusToString(LeaderboardStatus status) {
    switch (status) {
        case LeaderboardStatus::kPass:
            return "PASS";
        case LeaderboardStatus::kWarn:
            return "WARN";
        case LeaderboardStatus::kFail:
            return "FAIL";
        default:
            return "UNKNOWN";
    }
}

std::vector<LeaderboardEntry> IntersectionalReport::WorstGroups(size_t n) const {
    const size_t count = std::min(n, leaderboard.size());
    return {leaderboard.begin(), leaderboard.begin() + static_cast<std::ptrdiff_t>(count)};
}

const CombinationResult* IntersectionalReport::FindCombination(
    const std::vector<std::string>& attributes) const {
    for (const auto& combination : combinations) {
        if (combination.attributes == attributes) {
            return &combination;
        }
    }
    return nullptr;
}

nlohmann::json ToJson(const LeaderboardEntry& entry) {
    nlohmann::json j;
    j["rank"] = entry.rank;
    j["combination"] = entry.combination;
    j["group"] = entry.group;
    j["selection_rate"] = entry.selection_rate;
    j["count"] = entry.count;
    j["disparity_ratio"] = entry.disparity_ratio;
    j["violation"] = entry.violation;
    j["status"] = std::string(LeaderboardStatusToString(entry.status));
    return j;
}

nlohmann::json ToJson(const IntersectionalReport& report) {
    nlohmann::json j;
    j["combinations"] = nlohmann::json::object();
    for (const auto& combination : report.combinations) {
        nlohmann::json groups = nlohmann::json::object();
        for (const auto& [key, group] : combination.groups) {
            groups[JoinGroupKey(key)] = {
                {"selection_rate", group.selection_rate},
                {"count", group.count},
                {"disparity_ratio", group.disparity_ratio},
                {"violation", group.violation},
            };
        }
        nlohmann::json excluded = nlohmann::json::object();
        for (const auto& [key, count] : combination.excluded_groups) {
            excluded[JoinGroupKey(key)] = count;
        }
        j["combinations"][combination.Name()] = {
            {"groups", groups},
            {"excluded_groups", excluded},
            {"has_violation", combination.HasViolation()},
        };
    }
    j["skipped_combinations"] = report.skipped_combinations;
    j["leaderboard"] = nlohmann::json::array();
    for (const auto& entry : report.leaderboard) {
        j["leaderboard"].push_back(ToJson(entry));
    }
    j["intersectional_fairness_score"] = report.fairness_score;
    j["min_group_size"] = report.min_group_size;
    j["summary"] = report.summary;
    return j;
}

// =============================================================================
// IntersectionalAnalyzer Implementation
// =============================================================================

IntersectionalAnalyzer::IntersectionalAnalyzer(AnalysisConfig config)
    : config_(std::move(config)) {}

absl::Status IntersectionalAnalyzer::Configure(
    std::vector<std::string> sensitive_attributes,
    size_t max_combination_size,
    size_t min_combination_size) {

    if (sensitive_attributes.empty()) {
        return ConfigurationError("At least one sensitive attribute is required");
    }
    std::unordered_set<std::string> seen;
    for (const auto& attribute : sensitive_attributes) {
        if (!seen.insert(attribute).second) {
            return ConfigurationError(
                absl::StrCat("Sensitive attribute '", attribute, "' listed twice"));
        }
    }
    if (min_combination_size == 0) {
        return ConfigurationError("min_combination_size must be at least 1");
    }
    if (max_combination_size < min_combination_size) {
        return ConfigurationError(absl::StrCat(
            "max_combination_size ", max_combination_size,
            " is below min_combination_size ", min_combination_size));
    }
    DRIFTGUARD_RETURN_IF_ERROR(ValidateAnalysisConfig(config_));

    std::vector<std::vector<std::string>> combinations;
    const size_t largest = std::min(max_combination_size, sensitive_attributes.size());
    for (size_t k = min_combination_size; k <= largest; ++k) {
        AppendCombinations(sensitive_attributes, k, combinations);
    }
    if (combinations.empty()) {
        DRIFTGUARD_LOG_WARN("{} sensitive attributes yield no combinations of size {}..{}",
                            sensitive_attributes.size(), min_combination_size,
                            max_combination_size);
    }

    attributes_ = std::move(sensitive_attributes);
    combinations_ = std::move(combinations);
    DRIFTGUARD_LOG_INFO("IntersectionalAnalyzer configured: {} attributes, {} combinations",
                        attributes_.size(), combinations_.size());
    return absl::OkStatus();
}

absl::StatusOr<IntersectionalReport> IntersectionalAnalyzer::Evaluate(
    const std::vector<int>& y_pred,
    const SensitiveFeatures& sensitive_features,
    size_t min_group_size) const {

    if (attributes_.empty()) {
        return FailedPreconditionError(
            "IntersectionalAnalyzer has no sensitive attributes configured");
    }
    if (y_pred.empty()) {
        return InputValidationError("No predictions to evaluate");
    }
    if (min_group_size == 0) {
        return InputValidationError("min_group_size must be at least 1");
    }

    IntersectionalReport report;
    report.min_group_size = min_group_size;
    size_t violating_combinations = 0;

    for (const auto& attributes : combinations_) {
        const bool available = std::all_of(
            attributes.begin(), attributes.end(),
            [&](const std::string& a) { return sensitive_features.count(a) > 0; });
        if (!available) {
            DRIFTGUARD_LOG_WARN("Skipping combination {}: attribute not supplied",
                                absl::StrJoin(attributes, "_"));
            report.skipped_combinations.push_back(attributes);
            continue;
        }

        DRIFTGUARD_ASSIGN_OR_RETURN(
            CombinationResult combination,
            EvaluateCombination(attributes, y_pred, sensitive_features, min_group_size));

        if (combination.HasViolation()) {
            ++violating_combinations;
        }

        const std::string name = combination.Name();
        for (const auto& [key, group] : combination.groups) {
            LeaderboardEntry entry;
            entry.combination = name;
            entry.group = JoinGroupKey(key);
            entry.key = key;
            entry.selection_rate = group.selection_rate;
            entry.count = group.count;
            entry.disparity_ratio = group.disparity_ratio;
            entry.violation = group.violation;
            if (group.violation) {
                entry.status = LeaderboardStatus::kFail;
            } else if (group.disparity_ratio < kWarnRatio) {
                entry.status = LeaderboardStatus::kWarn;
            }
            report.leaderboard.push_back(std::move(entry));
        }
        report.combinations.push_back(std::move(combination));
    }

    // Worst first; ties keep combination and key order
    std::stable_sort(report.leaderboard.begin(), report.leaderboard.end(),
                     [](const LeaderboardEntry& a, const LeaderboardEntry& b) {
                         return a.disparity_ratio < b.disparity_ratio;
                     });
    for (size_t i = 0; i < report.leaderboard.size(); ++i) {
        report.leaderboard[i].rank = i + 1;
    }

    report.fairness_score = CompositeScore(violating_combinations, config_.score_penalty);
    report.summary = BuildSummary(report);

    DRIFTGUARD_LOG_INFO("Intersectional analysis: {} combinations, {} groups ranked, score {}",
                        report.combinations.size(), report.leaderboard.size(),
                        report.fairness_score);
    return report;
}

absl::StatusOr<CombinationResult> IntersectionalAnalyzer::EvaluateCombination(
    const std::vector<std::string>& attributes,
    const std::vector<int>& y_pred,
    const SensitiveFeatures& sensitive_features,
    size_t min_group_size) const {

    std::vector<const AttributeColumn*> columns;
    columns.reserve(attributes.size());
    for (const auto& attribute : attributes) {
        columns.push_back(&sensitive_features.at(attribute));
    }

    DRIFTGUARD_ASSIGN_OR_RETURN(
        auto grouped,
        GroupBy(y_pred, LabelColumn{}, columns, config_.positive_label));

    CombinationResult result;
    result.attributes = attributes;

    double max_rate = 0.0;
    for (const auto& [key, stats] : grouped) {
        if (stats.count < min_group_size) {
            result.excluded_groups[key] = stats.count;
            continue;
        }
        IntersectionalGroup group;
        group.key = key;
        group.selection_rate = stats.selection_rate;
        group.count = stats.count;
        max_rate = std::max(max_rate, group.selection_rate);
        result.groups.emplace(key, std::move(group));
    }

    for (auto& [key, group] : result.groups) {
        // No favorable outcomes anywhere means no group is disadvantaged
        group.disparity_ratio = max_rate > 0.0 ? group.selection_rate / max_rate : 1.0;
        group.violation = group.disparity_ratio < config_.thresholds.disparate_impact;
    }

    DRIFTGUARD_LOG_DEBUG("Combination {}: {} groups kept, {} excluded below {}",
                         result.Name(), result.groups.size(),
                         result.excluded_groups.size(), min_group_size);
    return result;
}

std::string IntersectionalAnalyzer::BuildSummary(const IntersectionalReport& report) {
    std::vector<const LeaderboardEntry*> violations;
    for (const auto& entry : report.leaderboard) {
        if (entry.violation) {
            violations.push_back(&entry);
        }
    }

    if (violations.empty()) {
        return absl::StrFormat(
            "No significant intersectional bias detected across %d ranked groups.",
            report.leaderboard.size());
    }

    std::string summary = "INTERSECTIONAL BIAS DETECTED\n\n"
                          "The following groups show significantly lower selection rates:\n\n";
    const size_t shown = std::min(kSummaryGroups, violations.size());
    for (size_t i = 0; i < shown; ++i) {
        const LeaderboardEntry& entry = *violations[i];
        absl::StrAppend(&summary, absl::StrFormat(
            "%d. %s (%s)\n"
            "   - Selection rate: %.1f%%\n"
            "   - Disparity ratio: %.2f (%s Four-Fifths Rule)\n"
            "   - Sample size: %d\n\n",
            i + 1, entry.group, entry.combination, entry.selection_rate * 100.0,
            entry.disparity_ratio, LeaderboardStatusToString(entry.status),
            entry.count));
    }

    if (report.fairness_score < 60) {
        absl::StrAppend(&summary,
            "RECOMMENDATION: Immediate investigation required. This pattern suggests "
            "potential intersectional discrimination.\n");
    } else if (report.fairness_score <= 80) {
        absl::StrAppend(&summary,
            "RECOMMENDATION: Monitor closely and consider mitigation strategies.\n");
    } else {
        absl::StrAppend(&summary, "STATUS: Acceptable intersectional fairness levels.\n");
    }
    return summary;
}

}  // namespace driftguard::fairness
