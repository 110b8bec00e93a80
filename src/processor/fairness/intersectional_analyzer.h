#pragma once

/// @file intersectional_analyzer.h
/// @brief Fairness across combinations of sensitive attributes

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "processor/analysis_config.h"
#include "processor/dataset.h"
#include "processor/fairness/group_metrics.h"

namespace driftguard::fairness {

/// @brief One composite group within an attribute combination
struct IntersectionalGroup {
    GroupKey key;
    double selection_rate = 0.0;
    size_t count = 0;

    /// selection_rate / best selection_rate of the same combination
    double disparity_ratio = 1.0;
    bool violation = false;
};

/// @brief Groups of one attribute combination
struct CombinationResult {
    std::vector<std::string> attributes;

    /// Surviving groups, keyed by attribute values in attribute order
    std::map<GroupKey, IntersectionalGroup> groups;

    /// Groups below min_group_size -> row count
    std::map<GroupKey, size_t> excluded_groups;

    bool HasViolation() const;

    /// @brief Attribute names joined, e.g. "Sex_Race"
    std::string Name() const;
};

/// @brief Four-Fifths Rule verdict shown on the leaderboard
enum class LeaderboardStatus {
    kPass,  ///< ratio >= 0.9
    kWarn,  ///< threshold <= ratio < 0.9
    kFail   ///< ratio below the disparate impact threshold
};

std::string_view LeaderboardStatusToString(LeaderboardStatus status);

/// @brief Ranked row of the leaderboard
struct LeaderboardEntry {
    size_t rank = 0;
    std::string combination;
    std::string group;
    GroupKey key;
    double selection_rate = 0.0;
    size_t count = 0;
    double disparity_ratio = 1.0;
    bool violation = false;
    LeaderboardStatus status = LeaderboardStatus::kPass;
};

/// @brief Result of an intersectional evaluation
struct IntersectionalReport {
    std::vector<CombinationResult> combinations;

    /// Combinations naming an attribute absent from the input
    std::vector<std::vector<std::string>> skipped_combinations;

    /// All surviving groups, worst disparity ratio first
    std::vector<LeaderboardEntry> leaderboard;

    /// 100 minus the penalty per combination with a violation
    int fairness_score = 100;

    size_t min_group_size = 0;

    /// Human readable findings
    std::string summary;

    /// @brief First n leaderboard entries
    std::vector<LeaderboardEntry> WorstGroups(size_t n = 5) const;

    /// @brief Combination over exactly these attributes, or nullptr
    const CombinationResult* FindCombination(const std::vector<std::string>& attributes) const;
};

nlohmann::json ToJson(const LeaderboardEntry& entry);
nlohmann::json ToJson(const IntersectionalReport& report);

/// @brief Detects bias visible only across attribute combinations
///
/// Single-attribute checks can pass while a subgroup such as
/// Female x Age 50+ is selected at half the rate of the best subgroup.
/// Every combination of 2..max_combination_size configured attributes is
/// grouped, undersized groups are excluded, and each group's selection rate
/// is compared to the best group of the same combination.
///
/// Example usage:
/// @code
///   IntersectionalAnalyzer analyzer;
///   analyzer.Configure({"Sex", "Race", "Age_Group"}, 3);
///   auto report = analyzer.Evaluate(predictions, sensitive, 10);
///   for (const auto& entry : report->WorstGroups(3)) {
///       std::cout << entry.group << ": " << entry.disparity_ratio << "\n";
///   }
/// @endcode
class IntersectionalAnalyzer {
public:
    explicit IntersectionalAnalyzer(AnalysisConfig config = {});

    /// @brief Set attributes and the combination size range
    /// @param sensitive_attributes Attributes to combine, in key order
    /// @param max_combination_size Largest combination evaluated (mandatory cap)
    /// @param min_combination_size Smallest combination evaluated; 1 reproduces
    ///        single-attribute grouping
    absl::Status Configure(std::vector<std::string> sensitive_attributes,
                           size_t max_combination_size = 3,
                           size_t min_combination_size = 2);

    /// @brief Evaluate all configured combinations
    /// @param y_pred Predictions
    /// @param sensitive_features Attribute columns aligned with y_pred
    /// @param min_group_size Groups with fewer rows are excluded
    absl::StatusOr<IntersectionalReport> Evaluate(
        const std::vector<int>& y_pred,
        const SensitiveFeatures& sensitive_features,
        size_t min_group_size = 10) const;

    /// @brief Attribute combinations in evaluation order
    const std::vector<std::vector<std::string>>& Combinations() const { return combinations_; }

    /// @brief Render findings for reviewers
    static std::string BuildSummary(const IntersectionalReport& report);

private:
    absl::StatusOr<CombinationResult> EvaluateCombination(
        const std::vector<std::string>& attributes,
        const std::vector<int>& y_pred,
        const SensitiveFeatures& sensitive_features,
        size_t min_group_size) const;

    AnalysisConfig config_;
    std::vector<std::string> attributes_;
    std::vector<std::vector<std::string>> combinations_;
};

}  // namespace driftguard::fairness
