#pragma once

/// @file group_metrics.h
/// @brief Group-by aggregation and metric verdicts shared by the fairness analyzers

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "processor/dataset.h"

namespace driftguard::fairness {

/// @brief Composite group key: one value per attribute, in attribute order
using GroupKey = std::vector<std::string>;

/// @brief Outcome counts and rates for one group
struct GroupStats {
    size_t count = 0;
    size_t positives = 0;
    double selection_rate = 0.0;

    // Populated from rows with a known label
    size_t labeled = 0;
    size_t true_positives = 0;
    size_t false_positives = 0;
    size_t true_negatives = 0;
    size_t false_negatives = 0;

    std::optional<double> accuracy;
    std::optional<double> true_positive_rate;   ///< Undefined without actual positives
    std::optional<double> false_positive_rate;  ///< Undefined without actual negatives
};

/// @brief Aggregate predictions (and labels, when given) by composite key
///
/// Rows missing a value for any of the columns are not grouped. Iteration
/// order of the result is the lexicographic order of the keys.
///
/// @param y_pred Predictions
/// @param y_true Labels aligned with y_pred, or empty when not supplied
/// @param columns Attribute columns aligned with y_pred
/// @param positive_label Favorable outcome value
absl::StatusOr<std::map<GroupKey, GroupStats>> GroupBy(
    const std::vector<int>& y_pred,
    const LabelColumn& y_true,
    const std::vector<const AttributeColumn*>& columns,
    int positive_label);

/// @brief Join key parts for display, e.g. {"Female", "50+"} -> "Female_50+"
std::string JoinGroupKey(const GroupKey& key, std::string_view separator = "_");

/// @brief Verdict of a single fairness check
enum class MetricStatus {
    kPass,
    kFail,
    kNotApplicable
};

std::string_view MetricStatusToString(MetricStatus status);

/// @brief Value and verdict of a fairness metric
struct MetricResult {
    std::optional<double> value;
    double threshold = 0.0;
    MetricStatus status = MetricStatus::kNotApplicable;
    std::string note;

    bool Failed() const { return status == MetricStatus::kFail; }

    static MetricResult NotApplicable(double threshold, std::string note);
};

/// @brief 100 minus the penalty per failure, floored at 0
int CompositeScore(size_t failures, int penalty);

nlohmann::json ToJson(const GroupStats& stats);
nlohmann::json ToJson(const MetricResult& metric);

}  // namespace driftguard::fairness
