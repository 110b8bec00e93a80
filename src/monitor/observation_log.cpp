/// @file observation_log.cpp
/// @brief Observation log implementation

#include "monitor/observation_log.h"

#include <algorithm>

namespace driftguard::monitor {

size_t ObservationLog::Append(Observation observation) {
    if (observation.timestamp == std::chrono::system_clock::time_point{}) {
        observation.timestamp = std::chrono::system_clock::now();
    }
    observations_.push_back(std::move(observation));
    return observations_.size();
}

std::span<const Observation> ObservationLog::Window(size_t n) const {
    std::span<const Observation> all = observations_;
    if (n == 0 || n >= all.size()) {
        return all;
    }
    return all.last(n);
}

ObservationBatch ToBatch(std::span<const Observation> observations,
                         const std::vector<std::string>& sensitive_attributes) {
    ObservationBatch batch;
    batch.features.reserve(observations.size());
    batch.predictions.reserve(observations.size());

    const bool any_label = std::any_of(
        observations.begin(), observations.end(),
        [](const Observation& o) { return o.true_label.has_value(); });
    if (any_label) {
        batch.labels.reserve(observations.size());
    }

    for (const auto& observation : observations) {
        batch.features.push_back(observation.features);
        batch.predictions.push_back(observation.prediction);
        if (any_label) {
            batch.labels.push_back(observation.true_label);
        }
    }

    for (const auto& attribute : sensitive_attributes) {
        AttributeColumn column;
        column.reserve(observations.size());
        bool seen = false;
        for (const auto& observation : observations) {
            auto it = observation.sensitive_features.find(attribute);
            if (it == observation.sensitive_features.end()) {
                column.emplace_back(std::nullopt);
            } else {
                column.emplace_back(it->second);
                seen = true;
            }
        }
        if (seen) {
            batch.sensitive_features.emplace(attribute, std::move(column));
        }
    }
    return batch;
}

}  // namespace driftguard::monitor
