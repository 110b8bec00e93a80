/// @file group_metrics.cpp
/// @brief Shared group-by implementation

#include "processor/fairness/group_metrics.h"

#include <algorithm>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"

namespace driftguard::fairness {

absl::StatusOr<std::map<GroupKey, GroupStats>> GroupBy(
    const std::vector<int>& y_pred,
    const LabelColumn& y_true,
    const std::vector<const AttributeColumn*>& columns,
    int positive_label) {

    if (columns.empty()) {
        return InputValidationError("Group-by requires at least one attribute column");
    }
    if (!y_true.empty() && y_true.size() != y_pred.size()) {
        return InputValidationError(absl::StrCat(
            "Label count ", y_true.size(), " does not match prediction count ",
            y_pred.size()));
    }
    for (const AttributeColumn* column : columns) {
        if (column == nullptr || column->size() != y_pred.size()) {
            return InputValidationError(absl::StrCat(
                "Attribute column length does not match prediction count ",
                y_pred.size()));
        }
    }

    std::map<GroupKey, GroupStats> groups;
    GroupKey key;
    key.reserve(columns.size());

    for (size_t row = 0; row < y_pred.size(); ++row) {
        key.clear();
        bool complete = true;
        for (const AttributeColumn* column : columns) {
            const auto& value = (*column)[row];
            if (!value.has_value()) {
                complete = false;
                break;
            }
            key.push_back(*value);
        }
        if (!complete) {
            continue;
        }

        GroupStats& stats = groups[key];
        const bool predicted_positive = y_pred[row] == positive_label;
        stats.count++;
        if (predicted_positive) {
            stats.positives++;
        }

        if (!y_true.empty() && y_true[row].has_value()) {
            const bool actual_positive = *y_true[row] == positive_label;
            stats.labeled++;
            if (actual_positive && predicted_positive) stats.true_positives++;
            if (actual_positive && !predicted_positive) stats.false_negatives++;
            if (!actual_positive && predicted_positive) stats.false_positives++;
            if (!actual_positive && !predicted_positive) stats.true_negatives++;
        }
    }

    for (auto& [group_key, stats] : groups) {
        stats.selection_rate =
            static_cast<double>(stats.positives) / static_cast<double>(stats.count);

        if (stats.labeled > 0) {
            stats.accuracy = static_cast<double>(stats.true_positives + stats.true_negatives) /
                             static_cast<double>(stats.labeled);
        }
        const size_t actual_positives = stats.true_positives + stats.false_negatives;
        if (actual_positives > 0) {
            stats.true_positive_rate = static_cast<double>(stats.true_positives) /
                                       static_cast<double>(actual_positives);
        }
        const size_t actual_negatives = stats.false_positives + stats.true_negatives;
        if (actual_negatives > 0) {
            stats.false_positive_rate = static_cast<double>(stats.false_positives) /
                                        static_cast<double>(actual_negatives);
        }
    }

    return groups;
}

std::string JoinGroupKey(const GroupKey& key, std::string_view separator) {
    return absl::StrJoin(key, absl::string_view(separator.data(), separator.size()));
}

std::string_view MetricStatusToString(MetricStatus status) {
    switch (status) {
        case MetricStatus::kPass:
            return "pass";
        case MetricStatus::kFail:
            return "fail";
        case MetricStatus::kNotApplicable:
            return "not_applicable";
        default:
            return "unknown";
    }
}

MetricResult MetricResult::NotApplicable(double threshold, std::string note) {
    MetricResult result;
    result.threshold = threshold;
    result.status = MetricStatus::kNotApplicable;
    result.note = std::move(note);
    return result;
}

int CompositeScore(size_t failures, int penalty) {
    const long long score = 100LL - static_cast<long long>(failures) * penalty;
    return static_cast<int>(std::max(0LL, score));
}

nlohmann::json ToJson(const GroupStats& stats) {
    nlohmann::json j;
    j["count"] = stats.count;
    j["selection_rate"] = stats.selection_rate;
    if (stats.labeled > 0) {
        j["labeled"] = stats.labeled;
    }
    if (stats.accuracy) j["accuracy"] = *stats.accuracy;
    if (stats.true_positive_rate) j["true_positive_rate"] = *stats.true_positive_rate;
    if (stats.false_positive_rate) j["false_positive_rate"] = *stats.false_positive_rate;
    return j;
}

nlohmann::json ToJson(const MetricResult& metric) {
    nlohmann::json j;
    j["value"] = metric.value ? nlohmann::json(*metric.value) : nlohmann::json(nullptr);
    j["threshold"] = metric.threshold;
    j["status"] = std::string(MetricStatusToString(metric.status));
    if (!metric.note.empty()) {
        j["note"] = metric.note;
    }
    return j;
}

}  // namespace driftguard::fairness
