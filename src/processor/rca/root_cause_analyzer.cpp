/// @file root_cause_analyzer.cpp
/// @brief Attribution drift analysis implementation

#include "processor/rca/root_cause_analyzer.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include "common/error.h"
#include "common/logging.h"

namespace driftguard::rca {

namespace {

std::vector<double> MeanAbsolute(const AttributionMatrix& matrix) {
    std::vector<double> means(matrix.NumFeatures(), 0.0);
    if (matrix.values.empty()) {
        return means;
    }
    for (const auto& row : matrix.values) {
        for (size_t j = 0; j < means.size() && j < row.size(); ++j) {
            means[j] += std::abs(row[j]);
        }
    }
    for (double& m : means) {
        m /= static_cast<double>(matrix.NumInstances());
    }
    return means;
}

absl::Status CheckMatrix(const AttributionMatrix& matrix, size_t rows) {
    if (matrix.NumInstances() != rows) {
        return InternalError(absl::StrCat("Engine returned ", matrix.NumInstances(),
                                          " rows for ", rows, " instances"));
    }
    for (const auto& row : matrix.values) {
        if (row.size() != matrix.NumFeatures()) {
            return InternalError("Engine returned a ragged attribution matrix");
        }
    }
    return absl::OkStatus();
}

}  // namespace

AttributionDriftReport AttributionDriftReport::Unavailable(std::string reason) {
    AttributionDriftReport report;
    report.available = false;
    report.reason = std::move(reason);
    return report;
}

const FeatureAttributionDrift* AttributionDriftReport::Find(std::string_view feature) const {
    for (const auto& entry : features) {
        if (entry.feature == feature) {
            return &entry;
        }
    }
    return nullptr;
}

nlohmann::json ToJson(const AttributionDriftReport& report) {
    nlohmann::json j;
    j["available"] = report.available;
    if (!report.available) {
        j["reason"] = report.reason;
        return j;
    }
    j["feature_importance_drift"] = nlohmann::json::array();
    for (const auto& entry : report.features) {
        j["feature_importance_drift"].push_back({
            {"feature", entry.feature},
            {"baseline_importance", entry.baseline_mean_abs_attribution},
            {"current_importance", entry.current_mean_abs_attribution},
            {"drift", entry.delta},
        });
    }
    j["top_drifted_features"] = report.top_features;
    j["baseline_sample_size"] = report.baseline_sample_size;
    j["current_sample_size"] = report.current_sample_size;
    return j;
}

std::string RenderReport(const AttributionDriftReport& report) {
    if (!report.available) {
        return absl::StrCat("Root cause analysis unavailable: ", report.reason);
    }
    if (report.top_features.empty()) {
        return "No significant feature importance drift detected.";
    }

    std::string text =
        "Root Cause Analysis:\n"
        "The model's reliance on features has shifted. Largest changes:\n";
    for (const auto& name : report.top_features) {
        const FeatureAttributionDrift* entry = report.Find(name);
        if (entry == nullptr) {
            continue;
        }
        absl::StrAppend(&text, absl::StrFormat(
            "- %s: importance %s by %.4f (baseline %.4f -> current %.4f)\n",
            entry->feature, entry->delta > 0 ? "increased" : "decreased",
            std::abs(entry->delta), entry->baseline_mean_abs_attribution,
            entry->current_mean_abs_attribution));
    }
    absl::StrAppend(&text,
        "\nRecommendation: check whether the distribution of these features "
        "changed or a new relationship appeared in the data.");
    return text;
}

// =============================================================================
// RootCauseAnalyzer Implementation
// =============================================================================

RootCauseAnalyzer::RootCauseAnalyzer(AnalysisConfig config,
                                     std::shared_ptr<const AttributionEngine> engine)
    : config_(std::move(config)), engine_(std::move(engine)) {}

Dataset RootCauseAnalyzer::Subsample(const Dataset& rows, size_t sample_size,
                                     std::string_view side, uint64_t seed) const {
    if (rows.size() <= sample_size) {
        if (rows.size() < sample_size) {
            DRIFTGUARD_LOG_WARN("{} sample has {} rows, fewer than the requested {}",
                                side, rows.size(), sample_size);
        }
        return rows;
    }

    std::vector<size_t> indices(rows.size());
    std::iota(indices.begin(), indices.end(), size_t{0});

    // Partial Fisher-Yates: the first sample_size slots become the sample
    std::mt19937_64 rng(seed);
    for (size_t i = 0; i < sample_size; ++i) {
        std::uniform_int_distribution<size_t> pick(i, indices.size() - 1);
        std::swap(indices[i], indices[pick(rng)]);
    }
    indices.resize(sample_size);
    std::sort(indices.begin(), indices.end());

    Dataset sample;
    sample.reserve(sample_size);
    for (size_t idx : indices) {
        sample.push_back(rows[idx]);
    }
    return sample;
}

absl::StatusOr<AttributionDriftReport> RootCauseAnalyzer::ExplainDrift(
    const Model& model,
    const Dataset& baseline_sample,
    const Dataset& current_sample,
    size_t sample_size,
    size_t top_k) const {

    if (engine_ == nullptr) {
        return FailedPreconditionError("No attribution engine configured");
    }
    if (baseline_sample.empty() || current_sample.empty()) {
        return InputValidationError(absl::StrCat(
            "Attribution needs non-empty samples (baseline ", baseline_sample.size(),
            " rows, current ", current_sample.size(), " rows)"));
    }
    if (sample_size == 0) {
        return InputValidationError("sample_size must be at least 1");
    }

    const Dataset background =
        Subsample(baseline_sample, sample_size, "Baseline", config_.random_seed);
    const Dataset current =
        Subsample(current_sample, sample_size, "Current", config_.random_seed + 1);

    auto baseline_attr = engine_->Explain(model, background, background);
    if (!baseline_attr.ok()) {
        DRIFTGUARD_LOG_WARN("Attribution unavailable for baseline: {}",
                            std::string(baseline_attr.status().message()));
        return AttributionDriftReport::Unavailable(
            std::string(baseline_attr.status().message()));
    }
    auto current_attr = engine_->Explain(model, background, current);
    if (!current_attr.ok()) {
        DRIFTGUARD_LOG_WARN("Attribution unavailable for current: {}",
                            std::string(current_attr.status().message()));
        return AttributionDriftReport::Unavailable(
            std::string(current_attr.status().message()));
    }

    absl::Status shape = CheckMatrix(*baseline_attr, background.size());
    if (shape.ok()) {
        shape = CheckMatrix(*current_attr, current.size());
    }
    if (shape.ok() && baseline_attr->features != current_attr->features) {
        shape = InternalError("Engine attributed different features per sample");
    }
    if (!shape.ok()) {
        DRIFTGUARD_LOG_WARN("Attribution unavailable: {}", std::string(shape.message()));
        return AttributionDriftReport::Unavailable(std::string(shape.message()));
    }

    const std::vector<double> base_means = MeanAbsolute(*baseline_attr);
    const std::vector<double> curr_means = MeanAbsolute(*current_attr);

    AttributionDriftReport report;
    report.available = true;
    report.baseline_sample_size = background.size();
    report.current_sample_size = current.size();
    report.features.reserve(baseline_attr->NumFeatures());
    for (size_t j = 0; j < baseline_attr->NumFeatures(); ++j) {
        FeatureAttributionDrift entry;
        entry.feature = baseline_attr->features[j];
        entry.baseline_mean_abs_attribution = base_means[j];
        entry.current_mean_abs_attribution = curr_means[j];
        entry.delta = curr_means[j] - base_means[j];
        report.features.push_back(std::move(entry));
    }

    std::stable_sort(report.features.begin(), report.features.end(),
                     [](const FeatureAttributionDrift& a, const FeatureAttributionDrift& b) {
                         return std::abs(a.delta) > std::abs(b.delta);
                     });

    const size_t k = std::min(top_k, report.features.size());
    for (size_t i = 0; i < k; ++i) {
        report.top_features.push_back(report.features[i].feature);
    }

    DRIFTGUARD_LOG_INFO("Attribution drift over {} features, top: {}",
                        report.features.size(),
                        report.top_features.empty() ? "-" : report.top_features.front());
    return report;
}

}  // namespace driftguard::rca
