/// @file model_monitor.cpp
/// @brief Model monitor implementation

#include "monitor/model_monitor.h"

#include <algorithm>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "common/logging.h"

namespace driftguard::monitor {

namespace {

constexpr char kNoModelArtifact[] = "Model artifact not available for attribution analysis";

}  // namespace

nlohmann::json ToJson(const MonitoringReport& report) {
    nlohmann::json j;
    j["model_id"] = report.model_id;
    j["total_predictions"] = report.total_observations;
    j["analyzed_predictions"] = report.analyzed_observations;
    j["drift_analysis"] = ToJson(report.drift);
    j["bias_analysis"] = report.fairness ? ToJson(*report.fairness) : nlohmann::json(nullptr);
    j["intersectional_analysis"] =
        report.intersectional ? ToJson(*report.intersectional) : nlohmann::json(nullptr);
    if (!report.fairness_note.empty()) {
        j["fairness_note"] = report.fairness_note;
    }
    if (report.root_cause) {
        j["root_cause"] = ToJson(*report.root_cause);
        j["root_cause_report"] = report.root_cause_report;
    } else {
        j["root_cause"] = nullptr;
        j["root_cause_report"] = nullptr;
    }
    j["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        report.generated_at.time_since_epoch()).count();
    return j;
}

// =============================================================================
// ModelMonitor Implementation
// =============================================================================

ModelMonitor::ModelMonitor(std::string model_id,
                           AnalysisConfig config,
                           std::shared_ptr<const rca::AttributionEngine> engine,
                           std::shared_ptr<const stats::StatisticalTests> tests)
    : model_id_(std::move(model_id)),
      config_(std::move(config)),
      drift_(config_, std::move(tests)),
      bias_(config_),
      intersectional_(config_),
      root_cause_(config_, std::move(engine)) {}

absl::Status ModelMonitor::Register(FeatureSchema schema,
                                    Dataset baseline_rows,
                                    std::vector<std::string> sensitive_attributes) {
    if (drift_.IsRegistered()) {
        return FailedPreconditionError(
            absl::StrCat("Model '", model_id_, "' is already registered"));
    }
    DRIFTGUARD_RETURN_IF_ERROR(ValidateAnalysisConfig(config_));

    // Configure into locals so a failure leaves the monitor untouched
    fairness::BiasAnalyzer bias(config_);
    fairness::IntersectionalAnalyzer intersectional(config_);
    if (!sensitive_attributes.empty()) {
        DRIFTGUARD_RETURN_IF_ERROR(bias.Configure(sensitive_attributes));
        DRIFTGUARD_RETURN_IF_ERROR(intersectional.Configure(
            sensitive_attributes, config_.max_combination_size,
            std::min<size_t>(2, config_.max_combination_size)));
    }

    DRIFTGUARD_RETURN_IF_ERROR(drift_.Register(std::move(schema), std::move(baseline_rows)));

    bias_ = std::move(bias);
    intersectional_ = std::move(intersectional);
    sensitive_attributes_ = std::move(sensitive_attributes);

    DRIFTGUARD_LOG_INFO("Registered model '{}': {} features, sensitive attributes [{}]",
                        model_id_, drift_.Schema().Size(),
                        absl::StrJoin(sensitive_attributes_, ", "));
    return absl::OkStatus();
}

void ModelMonitor::SetModel(std::shared_ptr<const rca::Model> model) {
    model_ = std::move(model);
    DRIFTGUARD_LOG_INFO("Model '{}': artifact {}", model_id_,
                        model_ ? model_->Type() : std::string("detached"));
}

absl::StatusOr<bool> ModelMonitor::LogObservation(Observation observation) {
    if (!drift_.IsRegistered()) {
        return FailedPreconditionError(
            absl::StrCat("Model '", model_id_, "' is not registered"));
    }
    const size_t size = log_.Append(std::move(observation));
    const bool due = config_.analysis_interval > 0 && size % config_.analysis_interval == 0;
    if (due) {
        DRIFTGUARD_LOG_DEBUG("Model '{}': analysis due after {} observations", model_id_, size);
    }
    return due;
}

const MonitoringReport* ModelMonitor::LastReport() const {
    return last_report_ ? &*last_report_ : nullptr;
}

absl::StatusOr<MonitoringReport> ModelMonitor::RunAnalysis() {
    if (!drift_.IsRegistered()) {
        return FailedPreconditionError(
            absl::StrCat("Model '", model_id_, "' is not registered"));
    }
    if (log_.Empty()) {
        return InsufficientDataError(
            absl::StrCat("Model '", model_id_, "' has no logged observations"));
    }

    const ObservationBatch batch =
        ToBatch(log_.Window(config_.window_size), sensitive_attributes_);

    MonitoringReport report;
    report.model_id = model_id_;
    report.total_observations = log_.Size();
    report.analyzed_observations = batch.Size();

    DRIFTGUARD_ASSIGN_OR_RETURN(report.drift, drift_.Detect(batch.features));
    RunFairness(batch, report);
    if (report.drift.HasAlerts()) {
        RunRootCause(batch, report);
    }
    report.generated_at = std::chrono::system_clock::now();

    DRIFTGUARD_LOG_INFO("Model '{}' analyzed over {} observations: {} drift alerts, "
                        "fairness score {}",
                        model_id_, report.analyzed_observations,
                        report.drift.AlertedFeatures().size(),
                        report.fairness ? std::to_string(report.fairness->fairness_score)
                                        : std::string("n/a"));

    last_report_ = report;
    return report;
}

void ModelMonitor::RunFairness(const ObservationBatch& batch,
                               MonitoringReport& report) const {
    if (sensitive_attributes_.empty()) {
        report.fairness_note = "No sensitive attributes registered";
        return;
    }

    auto summary = bias_.EvaluateAll(batch.predictions, batch.labels,
                                     batch.sensitive_features);
    if (!summary.ok()) {
        DRIFTGUARD_LOG_WARN("Model '{}': fairness not evaluated: {}", model_id_,
                            std::string(summary.status().message()));
        report.fairness_note = std::string(summary.status().message());
        return;
    }
    report.fairness = *std::move(summary);

    auto intersectional = intersectional_.Evaluate(
        batch.predictions, batch.sensitive_features, config_.min_group_size);
    if (!intersectional.ok()) {
        DRIFTGUARD_LOG_WARN("Model '{}': intersectional analysis not evaluated: {}",
                            model_id_, std::string(intersectional.status().message()));
        report.fairness_note = std::string(intersectional.status().message());
        return;
    }
    report.intersectional = *std::move(intersectional);
}

void ModelMonitor::RunRootCause(const ObservationBatch& batch,
                                MonitoringReport& report) const {
    if (model_ == nullptr) {
        report.root_cause = rca::AttributionDriftReport::Unavailable(kNoModelArtifact);
        report.root_cause_report = kNoModelArtifact;
        return;
    }

    std::shared_ptr<const Dataset> baseline = drift_.BaselineRows();
    auto attribution = root_cause_.ExplainDrift(*model_, *baseline, batch.features,
                                                config_.sample_size, config_.top_k);
    if (!attribution.ok()) {
        DRIFTGUARD_LOG_WARN("Model '{}': root cause analysis not run: {}", model_id_,
                            std::string(attribution.status().message()));
        attribution = rca::AttributionDriftReport::Unavailable(
            std::string(attribution.status().message()));
    }
    report.root_cause_report = rca::RenderReport(*attribution);
    report.root_cause = *std::move(attribution);
}

}  // namespace driftguard::monitor
