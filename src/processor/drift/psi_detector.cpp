/// @file psi_detector.cpp
/// @brief PSI computation implementation

#include "processor/drift/psi_detector.h"

#include <algorithm>
#include <cmath>

#include "common/error.h"

namespace driftguard::drift {

std::string_view PSIBandToString(PSIBand band) {
    switch (band) {
        case PSIBand::kNone:
            return "none";
        case PSIBand::kMinor:
            return "minor";
        case PSIBand::kMajor:
            return "major";
        default:
            return "unknown";
    }
}

PSIBand ClassifyPSI(double psi, double minor_threshold, double major_threshold) {
    if (psi > major_threshold) {
        return PSIBand::kMajor;
    }
    if (psi > minor_threshold) {
        return PSIBand::kMinor;
    }
    return PSIBand::kNone;
}

PSIDetector::PSIDetector(PSIConfig config)
    : config_(std::move(config)) {}

absl::StatusOr<PSIReference> PSIDetector::BuildReference(
    const std::vector<double>& values) const {

    if (values.empty()) {
        return InputValidationError("PSI reference has no values");
    }

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    PSIReference reference;
    reference.sample_count = values.size();
    reference.bin_edges = BuildBinEdges(std::move(sorted));
    if (!reference.IsDegenerate()) {
        reference.bin_percentages = AssignToBins(values, reference.bin_edges);
    }
    return reference;
}

double PSIDetector::Compute(const PSIReference& reference,
                            const std::vector<double>& current_values) const {
    if (reference.IsDegenerate() || current_values.empty()) {
        return 0.0;
    }

    std::vector<double> cur_percentages = AssignToBins(current_values, reference.bin_edges);

    double psi = 0.0;
    for (size_t i = 0; i < reference.bin_percentages.size(); ++i) {
        double expected = reference.bin_percentages[i];
        double actual = cur_percentages[i];

        // Floor empty bins to avoid log(0)
        if (expected == 0.0) expected = config_.epsilon;
        if (actual == 0.0) actual = config_.epsilon;

        psi += (actual - expected) * std::log(actual / expected);
    }

    return psi;
}

double PSIDetector::ComputeFeaturePSI(
    const std::vector<double>& ref_values,
    const std::vector<double>& cur_values) const {

    if (ref_values.empty() || cur_values.empty()) {
        return 0.0;
    }

    auto reference = BuildReference(ref_values);
    if (!reference.ok()) {
        return 0.0;
    }
    return Compute(*reference, cur_values);
}

std::vector<double> PSIDetector::BuildBinEdges(std::vector<double> sorted) const {
    std::vector<double> edges;
    if (sorted.empty()) {
        return edges;
    }

    edges.reserve(config_.num_bins + 1);
    const double last_index = static_cast<double>(sorted.size() - 1);

    for (size_t i = 0; i <= config_.num_bins; ++i) {
        const double position =
            last_index * static_cast<double>(i) / static_cast<double>(config_.num_bins);
        const size_t lower = static_cast<size_t>(std::floor(position));
        const size_t upper = std::min(lower + 1, sorted.size() - 1);
        const double fraction = position - static_cast<double>(lower);
        edges.push_back(sorted[lower] + fraction * (sorted[upper] - sorted[lower]));
    }

    edges.erase(std::unique(edges.begin(), edges.end()), edges.end());
    return edges;
}

std::vector<double> PSIDetector::AssignToBins(
    const std::vector<double>& values,
    const std::vector<double>& bin_edges) const {

    if (bin_edges.size() < 2) {
        return {};
    }

    std::vector<size_t> bin_counts(bin_edges.size() - 1, 0);

    // Bin index = number of interior edges <= value; out-of-range values
    // land in the first or last bin.
    const auto interior_begin = bin_edges.begin() + 1;
    const auto interior_end = bin_edges.end() - 1;
    for (double val : values) {
        auto it = std::upper_bound(interior_begin, interior_end, val);
        size_t bin_idx = static_cast<size_t>(std::distance(interior_begin, it));
        bin_counts[bin_idx]++;
    }

    std::vector<double> percentages(bin_counts.size(), 0.0);
    if (values.empty()) {
        return percentages;
    }

    const double n = static_cast<double>(values.size());
    for (size_t i = 0; i < bin_counts.size(); ++i) {
        percentages[i] = static_cast<double>(bin_counts[i]) / n;
    }

    return percentages;
}

}  // namespace driftguard::drift
