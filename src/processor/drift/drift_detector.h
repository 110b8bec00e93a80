#pragma once

/// @file drift_detector.h
/// @brief Per-feature drift detection against a registered baseline

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "processor/analysis_config.h"
#include "processor/dataset.h"
#include "processor/drift/psi_detector.h"
#include "processor/stats/statistical_tests.h"

namespace driftguard::drift {

/// @brief Statistical kind of a monitored feature
enum class FeatureKind {
    kNumerical,
    kCategorical
};

/// @brief How serious a detected drift is
enum class DriftSeverity {
    kNone,
    kMinor,
    kMajor
};

/// @brief Whether a feature could be scored
enum class EntryStatus {
    kOk,       ///< Tests ran
    kSkipped,  ///< Data could not be scored (e.g. non-numeric values)
    kMissing   ///< Feature absent from the current batch
};

std::string_view FeatureKindToString(FeatureKind kind);
std::string_view DriftSeverityToString(DriftSeverity severity);
std::string_view EntryStatusToString(EntryStatus status);

/// @brief Drift verdict for one feature
struct DriftEntry {
    std::string feature;
    FeatureKind kind = FeatureKind::kNumerical;

    /// "KS+PSI", "Chi-square", or "missing"
    std::string metric;

    /// KS statistic for numerical features, chi-square statistic for categorical
    double score = 0.0;
    std::optional<double> p_value;
    std::optional<double> psi;

    bool alert = false;
    DriftSeverity severity = DriftSeverity::kNone;
    EntryStatus status = EntryStatus::kOk;

    /// Explanation of skips, missing data or unseen categories
    std::string note;

    size_t baseline_count = 0;
    size_t current_count = 0;
};

/// @brief Result of one detection call, numerical features first
struct DriftReport {
    std::vector<DriftEntry> entries;
    size_t baseline_size = 0;
    size_t current_size = 0;
    std::chrono::system_clock::time_point generated_at;

    bool HasAlerts() const;
    std::vector<std::string> AlertedFeatures() const;

    /// @brief Entry for a feature, or nullptr
    const DriftEntry* Find(std::string_view feature) const;
};

nlohmann::json ToJson(const DriftEntry& entry);
nlohmann::json ToJson(const DriftReport& report);

/// @brief Compares current batches against an immutable baseline
///
/// Numerical features run a two-sample KS test and PSI; categorical features
/// run a chi-square goodness-of-fit test. Problems with a single feature are
/// recorded in its entry and never abort the whole call.
///
/// Example usage:
/// @code
///   DriftDetector detector;
///   auto status = detector.Register(
///       FeatureSchema{.numerical_features = {"age"},
///                     .categorical_features = {"country"}},
///       training_rows);
///   auto report = detector.Detect(production_rows);
///   if (report.ok() && report->HasAlerts()) {
///       // explain with RootCauseAnalyzer
///   }
/// @endcode
class DriftDetector {
public:
    explicit DriftDetector(
        AnalysisConfig config = {},
        std::shared_ptr<const stats::StatisticalTests> tests = stats::DefaultTests());

    /// @brief Store the reference schema and rows
    ///
    /// Fails with kInputValidation on an empty baseline, an empty or
    /// duplicated schema, or a schema feature absent from every baseline row.
    /// Fails with kFailedPrecondition if a baseline is already registered.
    absl::Status Register(FeatureSchema schema, Dataset baseline_rows);

    /// @brief Compare a batch against the baseline, feature by feature
    /// @return kInputValidation on an empty batch
    absl::StatusOr<DriftReport> Detect(const Dataset& current_rows) const;

    bool IsRegistered() const { return baseline_ != nullptr; }

    /// @brief Registered schema (empty before Register)
    const FeatureSchema& Schema() const;

    /// @brief Registered baseline rows (nullptr before Register)
    std::shared_ptr<const Dataset> BaselineRows() const;

    const AnalysisConfig& GetConfig() const { return config_; }

private:
    struct NumericReference {
        NumericColumn column;
        std::optional<PSIReference> psi;
    };

    struct CategoricalReference {
        std::map<std::string, size_t> counts;
        size_t total = 0;
    };

    struct BaselineState {
        FeatureSchema schema;
        Dataset rows;
        std::unordered_map<std::string, NumericReference> numeric;
        std::unordered_map<std::string, CategoricalReference> categorical;
    };

    DriftEntry DetectNumerical(const BaselineState& baseline,
                               const std::string& feature,
                               const Dataset& current_rows) const;

    DriftEntry DetectCategorical(const BaselineState& baseline,
                                 const std::string& feature,
                                 const Dataset& current_rows) const;

    static DriftEntry MissingEntry(const std::string& feature, FeatureKind kind,
                                   size_t baseline_count);

    AnalysisConfig config_;
    std::shared_ptr<const stats::StatisticalTests> tests_;
    PSIDetector psi_;
    std::shared_ptr<const BaselineState> baseline_;
};

}  // namespace driftguard::drift
