#pragma once

/// @file linear_attribution.h
/// @brief Linear model artifact and its exact Shapley attribution

#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "processor/rca/attribution.h"

namespace driftguard::rca {

/// @brief f(x) = intercept + sum_i weights[i] * x[features[i]]
class LinearModel : public Model {
public:
    /// @brief Validate and build a model
    /// @return kInputValidation if features and weights differ in length,
    ///         a feature repeats, or a coefficient is not finite
    static absl::StatusOr<LinearModel> Create(std::vector<std::string> features,
                                              std::vector<double> weights,
                                              double intercept = 0.0);

    std::string Type() const override { return "linear"; }

    /// @brief Score each row; every feature must hold a number
    absl::StatusOr<std::vector<double>> Predict(const Dataset& rows) const override;

    const std::vector<std::string>& Features() const { return features_; }
    const std::vector<double>& Weights() const { return weights_; }
    double Intercept() const { return intercept_; }

private:
    LinearModel(std::vector<std::string> features, std::vector<double> weights,
                double intercept);

    std::vector<std::string> features_;
    std::vector<double> weights_;
    double intercept_ = 0.0;
};

/// @brief Exact Shapley values for LinearModel
///
/// With independent features the Shapley value of feature i for row x is
/// w_i * (x_i - E[x_i]), the expectation taken over the background rows.
/// A missing cell in the sample is imputed with the background mean and
/// therefore contributes 0. Any other model type yields kUnsupportedModel.
class LinearAttributionEngine : public AttributionEngine {
public:
    absl::StatusOr<AttributionMatrix> Explain(
        const Model& model,
        const Dataset& background,
        const Dataset& sample) const override;
};

}  // namespace driftguard::rca
