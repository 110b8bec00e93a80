#pragma once

/// @file attribution.h
/// @brief Model and feature attribution interfaces used by root cause analysis

#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "processor/dataset.h"

namespace driftguard::rca {

/// @brief A trained model artifact
class Model {
public:
    virtual ~Model() = default;

    /// @brief Short model family name, e.g. "linear"
    virtual std::string Type() const = 0;

    /// @brief Score each row
    virtual absl::StatusOr<std::vector<double>> Predict(const Dataset& rows) const = 0;
};

/// @brief Per-instance, per-feature attribution scores
struct AttributionMatrix {
    std::vector<std::string> features;

    /// values[i][j]: contribution of features[j] to the prediction for row i
    std::vector<std::vector<double>> values;

    size_t NumInstances() const { return values.size(); }
    size_t NumFeatures() const { return features.size(); }
};

/// @brief Explains model predictions feature by feature
///
/// Implementations return kUnsupportedModel for model types they cannot
/// introspect.
class AttributionEngine {
public:
    virtual ~AttributionEngine() = default;

    /// @brief Attribute predictions on sample relative to background
    /// @param model Model to explain
    /// @param background Reference rows defining the expected prediction
    /// @param sample Rows to explain
    virtual absl::StatusOr<AttributionMatrix> Explain(
        const Model& model,
        const Dataset& background,
        const Dataset& sample) const = 0;
};

}  // namespace driftguard::rca
