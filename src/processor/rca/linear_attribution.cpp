/// @file linear_attribution.cpp
/// @brief Linear model and Shapley attribution implementation

#include "processor/rca/linear_attribution.h"

#include <cmath>
#include <optional>
#include <unordered_set>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace driftguard::rca {

namespace {

/// Read a numeric cell; nullopt when the cell is absent or not finite
absl::StatusOr<std::optional<double>> ReadNumber(const FeatureRow& row,
                                                 const std::string& feature,
                                                 size_t row_index) {
    auto it = row.find(feature);
    if (it == row.end() || std::holds_alternative<std::monostate>(it->second)) {
        return std::optional<double>{};
    }
    if (const auto* number = std::get_if<double>(&it->second)) {
        if (!std::isfinite(*number)) {
            return std::optional<double>{};
        }
        return std::optional<double>{*number};
    }
    return UnsupportedTypeError(absl::StrCat(
        "Feature '", feature, "' holds non-numeric value '",
        std::get<std::string>(it->second), "' in row ", row_index));
}

}  // namespace

// =============================================================================
// LinearModel
// =============================================================================

LinearModel::LinearModel(std::vector<std::string> features,
                         std::vector<double> weights, double intercept)
    : features_(std::move(features)),
      weights_(std::move(weights)),
      intercept_(intercept) {}

absl::StatusOr<LinearModel> LinearModel::Create(std::vector<std::string> features,
                                                std::vector<double> weights,
                                                double intercept) {
    if (features.empty()) {
        return InputValidationError("A linear model needs at least one feature");
    }
    if (features.size() != weights.size()) {
        return InputValidationError(absl::StrCat(
            "Got ", features.size(), " features but ", weights.size(), " weights"));
    }
    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < features.size(); ++i) {
        if (!seen.insert(features[i]).second) {
            return InputValidationError(
                absl::StrCat("Feature '", features[i], "' listed twice"));
        }
        if (!std::isfinite(weights[i])) {
            return InputValidationError(
                absl::StrCat("Weight of '", features[i], "' is not finite"));
        }
    }
    if (!std::isfinite(intercept)) {
        return InputValidationError("Intercept is not finite");
    }
    return LinearModel(std::move(features), std::move(weights), intercept);
}

absl::StatusOr<std::vector<double>> LinearModel::Predict(const Dataset& rows) const {
    std::vector<double> predictions;
    predictions.reserve(rows.size());

    for (size_t r = 0; r < rows.size(); ++r) {
        double value = intercept_;
        for (size_t i = 0; i < features_.size(); ++i) {
            DRIFTGUARD_ASSIGN_OR_RETURN(auto x, ReadNumber(rows[r], features_[i], r));
            if (!x) {
                return InputValidationError(absl::StrCat(
                    "Row ", r, " has no value for feature '", features_[i], "'"));
            }
            value += weights_[i] * *x;
        }
        predictions.push_back(value);
    }
    return predictions;
}

// =============================================================================
// LinearAttributionEngine
// =============================================================================

absl::StatusOr<AttributionMatrix> LinearAttributionEngine::Explain(
    const Model& model,
    const Dataset& background,
    const Dataset& sample) const {

    const auto* linear = dynamic_cast<const LinearModel*>(&model);
    if (linear == nullptr) {
        return UnsupportedModelError(absl::StrCat(
            "Linear attribution cannot explain a '", model.Type(), "' model"));
    }
    if (background.empty()) {
        return InputValidationError("Background sample is empty");
    }

    const auto& features = linear->Features();
    const auto& weights = linear->Weights();

    // Expected value of each feature over the background
    std::vector<double> means(features.size(), 0.0);
    for (size_t i = 0; i < features.size(); ++i) {
        double sum = 0.0;
        size_t count = 0;
        for (size_t r = 0; r < background.size(); ++r) {
            DRIFTGUARD_ASSIGN_OR_RETURN(auto x, ReadNumber(background[r], features[i], r));
            if (x) {
                sum += *x;
                ++count;
            }
        }
        if (count == 0) {
            return InsufficientDataError(absl::StrCat(
                "Background has no values for feature '", features[i], "'"));
        }
        means[i] = sum / static_cast<double>(count);
    }

    AttributionMatrix matrix;
    matrix.features = features;
    matrix.values.reserve(sample.size());
    for (size_t r = 0; r < sample.size(); ++r) {
        std::vector<double> phi(features.size(), 0.0);
        for (size_t i = 0; i < features.size(); ++i) {
            DRIFTGUARD_ASSIGN_OR_RETURN(auto x, ReadNumber(sample[r], features[i], r));
            if (x) {
                phi[i] = weights[i] * (*x - means[i]);
            }
        }
        matrix.values.push_back(std::move(phi));
    }

    DRIFTGUARD_LOG_DEBUG("Linear attribution: {} rows x {} features",
                         matrix.NumInstances(), matrix.NumFeatures());
    return matrix;
}

}  // namespace driftguard::rca
