/// @file drift_detector.cpp
/// @brief Drift detector implementation

#include "processor/drift/drift_detector.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_set>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace driftguard::drift {

std::string_view FeatureKindToString(FeatureKind kind) {
    switch (kind) {
        case FeatureKind::kNumerical:
            return "numerical";
        case FeatureKind::kCategorical:
            return "categorical";
        default:
            return "unknown";
    }
}

std::string_view DriftSeverityToString(DriftSeverity severity) {
    switch (severity) {
        case DriftSeverity::kNone:
            return "none";
        case DriftSeverity::kMinor:
            return "minor";
        case DriftSeverity::kMajor:
            return "major";
        default:
            return "unknown";
    }
}

std::string_view EntryStatusToString(EntryStatus status) {
    switch (status) {
        case EntryStatus::kOk:
            return "ok";
        case EntryStatus::kSkipped:
            return "skipped";
        case EntryStatus::kMissing:
            return "missing";
        default:
            return "unknown";
    }
}

bool DriftReport::HasAlerts() const {
    return std::any_of(entries.begin(), entries.end(),
                       [](const DriftEntry& e) { return e.alert; });
}

std::vector<std::string> DriftReport::AlertedFeatures() const {
    std::vector<std::string> features;
    for (const auto& entry : entries) {
        if (entry.alert) {
            features.push_back(entry.feature);
        }
    }
    return features;
}

const DriftEntry* DriftReport::Find(std::string_view feature) const {
    for (const auto& entry : entries) {
        if (entry.feature == feature) {
            return &entry;
        }
    }
    return nullptr;
}

nlohmann::json ToJson(const DriftEntry& entry) {
    nlohmann::json j;
    j["feature"] = entry.feature;
    j["type"] = std::string(FeatureKindToString(entry.kind));
    j["metric"] = entry.metric;
    j["score"] = entry.score;
    j["p_value"] = entry.p_value ? nlohmann::json(*entry.p_value) : nlohmann::json(nullptr);
    j["psi"] = entry.psi ? nlohmann::json(*entry.psi) : nlohmann::json(nullptr);
    j["alert"] = entry.alert;
    j["severity"] = std::string(DriftSeverityToString(entry.severity));
    j["status"] = std::string(EntryStatusToString(entry.status));
    if (!entry.note.empty()) {
        j["note"] = entry.note;
    }
    j["baseline_count"] = entry.baseline_count;
    j["current_count"] = entry.current_count;
    return j;
}

nlohmann::json ToJson(const DriftReport& report) {
    nlohmann::json j;
    j["baseline_size"] = report.baseline_size;
    j["current_size"] = report.current_size;
    j["generated_at"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        report.generated_at.time_since_epoch()).count();
    j["has_alerts"] = report.HasAlerts();
    j["features"] = nlohmann::json::array();
    for (const auto& entry : report.entries) {
        j["features"].push_back(ToJson(entry));
    }
    return j;
}

// =============================================================================
// DriftDetector Implementation
// =============================================================================

DriftDetector::DriftDetector(AnalysisConfig config,
                             std::shared_ptr<const stats::StatisticalTests> tests)
    : config_(std::move(config)),
      tests_(std::move(tests)),
      psi_(PSIConfig{.num_bins = config_.psi_bins, .epsilon = config_.psi_epsilon}) {}

absl::Status DriftDetector::Register(FeatureSchema schema, Dataset baseline_rows) {
    if (baseline_) {
        return FailedPreconditionError(
            "Baseline already registered; the baseline is immutable");
    }
    DRIFTGUARD_RETURN_IF_ERROR(ValidateAnalysisConfig(config_));
    if (!tests_) {
        return FailedPreconditionError("No statistical test provider configured");
    }
    if (schema.Empty()) {
        return InputValidationError("Feature schema references no columns");
    }
    if (baseline_rows.empty()) {
        return InputValidationError("Baseline dataset is empty");
    }

    std::unordered_set<std::string> seen;
    for (const auto& feature : schema.AllFeatures()) {
        if (!seen.insert(feature).second) {
            return InputValidationError(
                absl::StrCat("Feature '", feature, "' appears more than once in the schema"));
        }
        if (!HasFeature(baseline_rows, feature)) {
            return InputValidationError(
                absl::StrCat("Feature '", feature, "' has no values in the baseline"));
        }
    }

    auto state = std::make_shared<BaselineState>();

    for (const auto& feature : schema.numerical_features) {
        NumericReference reference;
        reference.column = ExtractNumericColumn(baseline_rows, feature);
        if (reference.column.IsNumeric()) {
            auto psi_reference = psi_.BuildReference(reference.column.values);
            if (psi_reference.ok()) {
                reference.psi = std::move(*psi_reference);
            }
        } else {
            DRIFTGUARD_LOG_WARN(
                "Baseline feature '{}' is declared numerical but holds {} non-numeric values",
                feature, reference.column.non_numeric);
        }
        state->numeric.emplace(feature, std::move(reference));
    }

    for (const auto& feature : schema.categorical_features) {
        CategoricalReference reference;
        for (auto& label : ExtractCategoryColumn(baseline_rows, feature)) {
            reference.counts[std::move(label)]++;
            reference.total++;
        }
        state->categorical.emplace(feature, std::move(reference));
    }

    state->schema = std::move(schema);
    state->rows = std::move(baseline_rows);
    baseline_ = std::move(state);

    DRIFTGUARD_LOG_INFO("Registered baseline with {} rows, {} numerical and {} categorical features",
                        baseline_->rows.size(), baseline_->schema.numerical_features.size(),
                        baseline_->schema.categorical_features.size());
    return absl::OkStatus();
}

const FeatureSchema& DriftDetector::Schema() const {
    static const FeatureSchema kEmpty;
    return baseline_ ? baseline_->schema : kEmpty;
}

std::shared_ptr<const Dataset> DriftDetector::BaselineRows() const {
    if (!baseline_) {
        return nullptr;
    }
    return std::shared_ptr<const Dataset>(baseline_, &baseline_->rows);
}

absl::StatusOr<DriftReport> DriftDetector::Detect(const Dataset& current_rows) const {
    // Hold the baseline for the duration of the call
    std::shared_ptr<const BaselineState> baseline = baseline_;
    if (!baseline) {
        return FailedPreconditionError("Baseline not registered");
    }
    if (current_rows.empty()) {
        return InputValidationError("Current batch is empty");
    }

    DriftReport report;
    report.baseline_size = baseline->rows.size();
    report.current_size = current_rows.size();
    report.generated_at = std::chrono::system_clock::now();
    report.entries.reserve(baseline->schema.Size());

    for (const auto& feature : baseline->schema.numerical_features) {
        report.entries.push_back(DetectNumerical(*baseline, feature, current_rows));
    }
    for (const auto& feature : baseline->schema.categorical_features) {
        report.entries.push_back(DetectCategorical(*baseline, feature, current_rows));
    }

    DRIFTGUARD_LOG_INFO("Drift detection over {} rows: {} of {} features alerted",
                        current_rows.size(), report.AlertedFeatures().size(),
                        report.entries.size());
    return report;
}

DriftEntry DriftDetector::MissingEntry(const std::string& feature, FeatureKind kind,
                                       size_t baseline_count) {
    DriftEntry entry;
    entry.feature = feature;
    entry.kind = kind;
    entry.metric = "missing";
    entry.status = EntryStatus::kMissing;
    entry.note = "Feature not present in the current batch";
    entry.baseline_count = baseline_count;
    return entry;
}

DriftEntry DriftDetector::DetectNumerical(const BaselineState& baseline,
                                          const std::string& feature,
                                          const Dataset& current_rows) const {
    const NumericReference& reference = baseline.numeric.at(feature);
    const size_t baseline_count =
        reference.column.values.size() + reference.column.non_numeric;

    if (!HasFeature(current_rows, feature)) {
        DRIFTGUARD_LOG_WARN("Feature '{}' missing from current batch", feature);
        return MissingEntry(feature, FeatureKind::kNumerical, baseline_count);
    }

    DriftEntry entry;
    entry.feature = feature;
    entry.kind = FeatureKind::kNumerical;
    entry.metric = "KS+PSI";
    entry.baseline_count = baseline_count;

    NumericColumn current = ExtractNumericColumn(current_rows, feature);
    entry.current_count = current.values.size() + current.non_numeric;

    if (!reference.column.IsNumeric() || !current.IsNumeric()) {
        const bool baseline_side = !reference.column.IsNumeric();
        const NumericColumn& offending = baseline_side ? reference.column : current;
        entry.status = EntryStatus::kSkipped;
        entry.note = absl::StrCat(
            "Non-numeric value '", offending.first_non_numeric, "' in ",
            baseline_side ? "baseline" : "current", " data for a numerical feature");
        DRIFTGUARD_LOG_WARN("Skipping drift scoring for '{}': {}", feature, entry.note);
        return entry;
    }

    auto ks = tests_->KolmogorovSmirnov(reference.column.values, current.values);
    if (!ks.ok()) {
        entry.status = EntryStatus::kSkipped;
        entry.note = std::string(ks.status().message());
        DRIFTGUARD_LOG_WARN("Skipping drift scoring for '{}': {}", feature, entry.note);
        return entry;
    }

    const double psi = reference.psi ? psi_.Compute(*reference.psi, current.values) : 0.0;
    const PSIBand band = ClassifyPSI(psi, config_.thresholds.psi_minor,
                                     config_.thresholds.psi_major);
    const bool ks_significant = ks->p_value < config_.thresholds.p_value;

    entry.score = ks->statistic;
    entry.p_value = ks->p_value;
    entry.psi = psi;
    entry.alert = psi > config_.thresholds.psi_minor || ks_significant;

    switch (band) {
        case PSIBand::kMajor:
            entry.severity = DriftSeverity::kMajor;
            break;
        case PSIBand::kMinor:
            entry.severity = DriftSeverity::kMinor;
            break;
        case PSIBand::kNone:
            entry.severity = entry.alert ? DriftSeverity::kMinor : DriftSeverity::kNone;
            break;
    }
    if (reference.psi && reference.psi->IsDegenerate()) {
        entry.note = "Baseline is constant; PSI not computed";
    }

    DRIFTGUARD_LOG_DEBUG("Feature '{}': KS={:.4f} p={:.4g} PSI={:.4f} alert={}",
                         feature, entry.score, ks->p_value, psi, entry.alert);
    return entry;
}

DriftEntry DriftDetector::DetectCategorical(const BaselineState& baseline,
                                            const std::string& feature,
                                            const Dataset& current_rows) const {
    const CategoricalReference& reference = baseline.categorical.at(feature);

    if (!HasFeature(current_rows, feature)) {
        DRIFTGUARD_LOG_WARN("Feature '{}' missing from current batch", feature);
        return MissingEntry(feature, FeatureKind::kCategorical, reference.total);
    }

    DriftEntry entry;
    entry.feature = feature;
    entry.kind = FeatureKind::kCategorical;
    entry.metric = "Chi-square";
    entry.baseline_count = reference.total;

    // Align category sets; categories absent on one side count zero
    std::map<std::string, size_t> current_counts;
    size_t current_total = 0;
    for (auto& label : ExtractCategoryColumn(current_rows, feature)) {
        current_counts[std::move(label)]++;
        current_total++;
    }
    entry.current_count = current_total;

    std::map<std::string, std::pair<double, double>> aligned;  // observed, expected
    size_t unseen_categories = 0;
    for (const auto& [category, count] : reference.counts) {
        aligned[category].second = static_cast<double>(count) /
            static_cast<double>(reference.total) * static_cast<double>(current_total);
    }
    for (const auto& [category, count] : current_counts) {
        if (reference.counts.find(category) == reference.counts.end()) {
            ++unseen_categories;
        }
        aligned[category].first = static_cast<double>(count);
    }

    std::vector<double> observed;
    std::vector<double> expected;
    for (const auto& [category, cell] : aligned) {
        if (!std::isfinite(cell.second)) {
            entry.status = EntryStatus::kSkipped;
            entry.note = absl::StrCat("Non-numeric expected count for category '",
                                      category, "'");
            DRIFTGUARD_LOG_WARN("Skipping drift scoring for '{}': {}", feature, entry.note);
            return entry;
        }
        // Sparse cells make the chi-square approximation unreliable
        if (cell.second > config_.min_expected_frequency) {
            observed.push_back(cell.first);
            expected.push_back(cell.second);
        }
    }

    if (unseen_categories > 0) {
        entry.note = absl::StrCat(unseen_categories,
                                  " categories not present in the baseline");
    }

    if (observed.size() < 2) {
        entry.p_value = 1.0;
        entry.note = absl::StrCat(
            entry.note, entry.note.empty() ? "" : "; ",
            "fewer than two categories with expected count above ",
            config_.min_expected_frequency, ", test not run");
        return entry;
    }

    const double observed_sum = std::accumulate(observed.begin(), observed.end(), 0.0);
    const double expected_sum = std::accumulate(expected.begin(), expected.end(), 0.0);
    if (observed_sum > 0.0 && expected_sum > 0.0) {
        for (auto& e : expected) {
            e *= observed_sum / expected_sum;
        }
    }

    auto chi = tests_->ChiSquareGoodnessOfFit(observed, expected);
    if (!chi.ok()) {
        entry.status = EntryStatus::kSkipped;
        entry.note = std::string(chi.status().message());
        DRIFTGUARD_LOG_WARN("Skipping drift scoring for '{}': {}", feature, entry.note);
        return entry;
    }

    entry.score = chi->statistic;
    entry.p_value = chi->p_value;
    entry.alert = chi->p_value < config_.thresholds.p_value;
    entry.severity = entry.alert ? DriftSeverity::kMajor : DriftSeverity::kNone;

    DRIFTGUARD_LOG_DEBUG("Feature '{}': chi2={:.4f} df={} p={:.4g} alert={}",
                         feature, chi->statistic, chi->degrees_of_freedom,
                         chi->p_value, entry.alert);
    return entry;
}

}  // namespace driftguard::drift
