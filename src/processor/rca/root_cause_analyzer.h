#pragma once

/// @file root_cause_analyzer.h
/// @brief Explains drift through shifts in feature attribution

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "processor/analysis_config.h"
#include "processor/dataset.h"
#include "processor/drift/drift_detector.h"
#include "processor/rca/attribution.h"

namespace driftguard::rca {

/// @brief Change of one feature's mean absolute attribution
struct FeatureAttributionDrift {
    std::string feature;
    double baseline_mean_abs_attribution = 0.0;
    double current_mean_abs_attribution = 0.0;

    /// current - baseline
    double delta = 0.0;
};

/// @brief Result of ExplainDrift
struct AttributionDriftReport {
    /// False when the engine could not explain the model
    bool available = false;
    std::string reason;

    /// All features, largest |delta| first
    std::vector<FeatureAttributionDrift> features;
    std::vector<std::string> top_features;

    size_t baseline_sample_size = 0;
    size_t current_sample_size = 0;

    /// @brief Report for an explanation that could not be produced
    static AttributionDriftReport Unavailable(std::string reason);

    const FeatureAttributionDrift* Find(std::string_view feature) const;
};

nlohmann::json ToJson(const AttributionDriftReport& report);

/// @brief Human readable root cause summary
std::string RenderReport(const AttributionDriftReport& report);

/// @brief Compares aggregated attribution between baseline and current data
///
/// A feature whose attribution grew or shrank the most is the likeliest
/// driver of a change in model behavior. Engine failures, including models
/// the engine does not support, produce an unavailable report rather than
/// an error so the rest of an analysis run survives.
///
/// Example usage:
/// @code
///   RootCauseAnalyzer analyzer(config, std::make_shared<LinearAttributionEngine>());
///   auto report = analyzer.ExplainDrift(model, baseline_rows, current_rows);
///   if (report.ok() && report->available) {
///       std::cout << RenderReport(*report);
///   }
/// @endcode
class RootCauseAnalyzer {
public:
    explicit RootCauseAnalyzer(AnalysisConfig config = {},
                               std::shared_ptr<const AttributionEngine> engine = nullptr);

    /// @brief Rank features by change in mean absolute attribution
    /// @param model Model to explain
    /// @param baseline_sample Reference rows; also the engine background
    /// @param current_sample Recent rows
    /// @param sample_size Rows drawn from each side (all rows if fewer)
    /// @param top_k Features listed in top_features
    /// @return kInputValidation on an empty sample or zero sizes,
    ///         kFailedPrecondition without an engine
    absl::StatusOr<AttributionDriftReport> ExplainDrift(
        const Model& model,
        const Dataset& baseline_sample,
        const Dataset& current_sample,
        size_t sample_size = 100,
        size_t top_k = 3) const;

    bool HasEngine() const { return engine_ != nullptr; }

private:
    /// @brief Seeded subsample without replacement, original row order kept
    Dataset Subsample(const Dataset& rows, size_t sample_size,
                      std::string_view side, uint64_t seed) const;

    AnalysisConfig config_;
    std::shared_ptr<const AttributionEngine> engine_;
};

}  // namespace driftguard::rca
