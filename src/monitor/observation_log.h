#pragma once

/// @file observation_log.h
/// @brief Append-only log of prediction events

#include <chrono>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "processor/dataset.h"

namespace driftguard::monitor {

/// @brief One logged prediction
struct Observation {
    FeatureRow features;
    int prediction = 0;
    std::optional<int> true_label;

    /// Sensitive attribute -> value; absent attributes are unknown
    std::unordered_map<std::string, std::string> sensitive_features;

    std::chrono::system_clock::time_point timestamp;
};

/// @brief Column-oriented view of observations, ready for the analyzers
struct ObservationBatch {
    Dataset features;
    std::vector<int> predictions;

    /// Empty when no observation carries a label
    LabelColumn labels;

    /// One column per attribute seen in at least one observation
    SensitiveFeatures sensitive_features;

    size_t Size() const { return predictions.size(); }
};

/// @brief Insertion-ordered, append-only observation store
///
/// Not synchronized; the owner serializes access.
class ObservationLog {
public:
    /// @brief Append an observation, stamping it if no timestamp is set
    /// @return Log size after the append
    size_t Append(Observation observation);

    size_t Size() const { return observations_.size(); }
    bool Empty() const { return observations_.empty(); }

    std::span<const Observation> All() const { return observations_; }

    /// @brief The most recent n observations (all when n is 0 or exceeds the size)
    std::span<const Observation> Window(size_t n) const;

private:
    std::vector<Observation> observations_;
};

/// @brief Pivot observations into analyzer inputs
/// @param observations Rows to pivot
/// @param sensitive_attributes Attributes to extract as columns
ObservationBatch ToBatch(std::span<const Observation> observations,
                         const std::vector<std::string>& sensitive_attributes);

}  // namespace driftguard::monitor
