#pragma once

/// @file psi_detector.h
/// @brief Population Stability Index (PSI) computation

#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

namespace driftguard::drift {

/// @brief Configuration for PSI computation
struct PSIConfig {
    /// Number of equal-frequency bins built from the reference
    size_t num_bins = 10;

    /// Floor for empty bins to avoid log(0) and division by zero
    double epsilon = 1e-4;
};

/// @brief PSI magnitude bands
enum class PSIBand {
    kNone,   ///< PSI <= minor threshold
    kMinor,  ///< minor < PSI <= major
    kMajor   ///< PSI > major threshold
};

std::string_view PSIBandToString(PSIBand band);

/// @brief Classify a PSI value against the minor/major thresholds
PSIBand ClassifyPSI(double psi, double minor_threshold, double major_threshold);

/// @brief Reference binning captured from the baseline
struct PSIReference {
    /// Bin edges e0 < e1 < ... < em; bin i is [e_i, e_{i+1}), the last bin closed
    std::vector<double> bin_edges;

    /// Fraction of reference values per bin
    std::vector<double> bin_percentages;

    size_t sample_count = 0;

    /// Fewer than two distinct edges: the feature is constant in the baseline
    bool IsDegenerate() const { return bin_edges.size() < 2; }
};

/// @brief Population Stability Index calculator
///
/// PSI measures how much a distribution has shifted between two samples.
///
/// Formula: PSI = sum((actual_% - expected_%) * ln(actual_% / expected_%))
///
/// Interpretation:
/// - PSI < 0.1: No significant shift
/// - 0.1 <= PSI < 0.25: Moderate shift, investigate
/// - PSI >= 0.25: Significant shift, action required
///
/// Example usage:
/// @code
///   PSIDetector psi(PSIConfig{.num_bins = 10});
///   auto reference = psi.BuildReference(training_ages);
///   double score = psi.Compute(*reference, production_ages);
/// @endcode
class PSIDetector {
public:
    explicit PSIDetector(PSIConfig config = {});

    /// @brief Build equal-frequency bins from reference values
    /// @return Error if there are no values
    absl::StatusOr<PSIReference> BuildReference(const std::vector<double>& values) const;

    /// @brief PSI of current values against a prebuilt reference
    ///
    /// Current values outside the reference range fall into the edge bins.
    double Compute(const PSIReference& reference,
                   const std::vector<double>& current_values) const;

    /// @brief Compute PSI for a single feature
    /// @param ref_values Reference values
    /// @param cur_values Current values
    /// @return PSI score for this feature (0 if either side is empty)
    double ComputeFeaturePSI(const std::vector<double>& ref_values,
                             const std::vector<double>& cur_values) const;

    /// @brief Fraction of values per bin, clipping to the edge bins
    std::vector<double> AssignToBins(const std::vector<double>& values,
                                     const std::vector<double>& bin_edges) const;

    const PSIConfig& GetConfig() const { return config_; }

private:
    /// @brief Percentile edges with linear interpolation, duplicates removed
    std::vector<double> BuildBinEdges(std::vector<double> sorted) const;

    PSIConfig config_;
};

}  // namespace driftguard::drift
