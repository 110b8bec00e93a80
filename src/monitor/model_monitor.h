#pragma once

/// @file model_monitor.h
/// @brief Per-model monitoring context running drift, fairness and root cause analysis

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "monitor/observation_log.h"
#include "processor/analysis_config.h"
#include "processor/dataset.h"
#include "processor/drift/drift_detector.h"
#include "processor/fairness/bias_analyzer.h"
#include "processor/fairness/intersectional_analyzer.h"
#include "processor/rca/attribution.h"
#include "processor/rca/linear_attribution.h"
#include "processor/rca/root_cause_analyzer.h"
#include "processor/stats/statistical_tests.h"

namespace driftguard::monitor {

/// @brief Outcome of one analysis run
struct MonitoringReport {
    std::string model_id;

    /// Observations in the log when the run started
    size_t total_observations = 0;

    /// Observations fed to the analyzers (the configured window)
    size_t analyzed_observations = 0;

    drift::DriftReport drift;

    /// Absent when no sensitive attributes are registered or none could be evaluated
    std::optional<fairness::FairnessSummary> fairness;
    std::optional<fairness::IntersectionalReport> intersectional;

    /// Why fairness results are absent
    std::string fairness_note;

    /// Present only when drift raised alerts
    std::optional<rca::AttributionDriftReport> root_cause;
    std::string root_cause_report;

    std::chrono::system_clock::time_point generated_at;
};

nlohmann::json ToJson(const MonitoringReport& report);

/// @brief Owns everything monitored for one model
///
/// Lifecycle: Register once with the schema, baseline rows and sensitive
/// attributes; optionally attach the model artifact; log observations; run
/// analysis on demand or whenever LogObservation reports one is due.
///
/// Not internally synchronized. Callers allow at most one mutation or
/// analysis at a time per monitor.
///
/// Example usage:
/// @code
///   ModelMonitor monitor("credit-v3", config);
///   monitor.Register(schema, training_rows, {"Sex", "Race"});
///   monitor.SetModel(model);
///   auto due = monitor.LogObservation(observation);
///   if (due.ok() && *due) {
///       auto report = monitor.RunAnalysis();
///   }
/// @endcode
class ModelMonitor {
public:
    ModelMonitor(std::string model_id,
                 AnalysisConfig config = {},
                 std::shared_ptr<const rca::AttributionEngine> engine =
                     std::make_shared<rca::LinearAttributionEngine>(),
                 std::shared_ptr<const stats::StatisticalTests> tests = stats::DefaultTests());

    /// @brief Register the baseline and configure the analyzers
    /// @return kConfigurationError for an invalid config or attribute list,
    ///         kInputValidation for a bad baseline, kFailedPrecondition if
    ///         already registered
    absl::Status Register(FeatureSchema schema,
                          Dataset baseline_rows,
                          std::vector<std::string> sensitive_attributes);

    /// @brief Attach (or replace) the model artifact used for root cause analysis
    void SetModel(std::shared_ptr<const rca::Model> model);

    /// @brief Append an observation
    /// @return true when this observation makes a periodic analysis due
    absl::StatusOr<bool> LogObservation(Observation observation);

    /// @brief Run the full pipeline over the configured window
    ///
    /// Drift, then fairness per attribute and the overall score, then the
    /// intersectional leaderboard, then root cause analysis when drift
    /// raised alerts. The report is retained as LastReport().
    absl::StatusOr<MonitoringReport> RunAnalysis();

    const std::string& ModelId() const { return model_id_; }
    bool IsRegistered() const { return drift_.IsRegistered(); }
    bool HasModel() const { return model_ != nullptr; }
    const ObservationLog& Log() const { return log_; }
    const std::vector<std::string>& SensitiveAttributes() const { return sensitive_attributes_; }

    /// @brief Most recent analysis (nullptr before the first run)
    const MonitoringReport* LastReport() const;

private:
    void RunFairness(const ObservationBatch& batch, MonitoringReport& report) const;

    /// @brief Attach attribution drift; failures become an unavailable report
    void RunRootCause(const ObservationBatch& batch, MonitoringReport& report) const;

    std::string model_id_;
    AnalysisConfig config_;
    drift::DriftDetector drift_;
    fairness::BiasAnalyzer bias_;
    fairness::IntersectionalAnalyzer intersectional_;
    rca::RootCauseAnalyzer root_cause_;
    std::shared_ptr<const rca::Model> model_;
    std::vector<std::string> sensitive_attributes_;
    ObservationLog log_;
    std::optional<MonitoringReport> last_report_;
};

}  // namespace driftguard::monitor
