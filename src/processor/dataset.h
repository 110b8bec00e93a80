#pragma once

/// @file dataset.h
/// @brief Tabular data model shared by the analyzers

#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace driftguard {

/// @brief A single cell; monostate marks a missing value
using FeatureValue = std::variant<std::monostate, double, std::string>;

/// @brief One row keyed by feature name
using FeatureRow = std::unordered_map<std::string, FeatureValue>;

/// @brief Row-oriented table of observations
using Dataset = std::vector<FeatureRow>;

/// @brief Values of one sensitive attribute, aligned with the predictions
using AttributeColumn = std::vector<std::optional<std::string>>;

/// @brief Sensitive attribute name -> column
using SensitiveFeatures = std::unordered_map<std::string, AttributeColumn>;

/// @brief Ground truth labels aligned with the predictions; nullopt if unknown
using LabelColumn = std::vector<std::optional<int>>;

/// @brief Ordered feature names by statistical kind
struct FeatureSchema {
    std::vector<std::string> numerical_features;
    std::vector<std::string> categorical_features;

    size_t Size() const {
        return numerical_features.size() + categorical_features.size();
    }
    bool Empty() const { return Size() == 0; }

    /// @brief Numerical features followed by categorical features
    std::vector<std::string> AllFeatures() const;
};

/// @brief Numeric values of one feature with data quality counters
struct NumericColumn {
    std::vector<double> values;   ///< Finite numeric values in row order
    size_t missing = 0;           ///< Rows without the feature or with NaN
    size_t non_numeric = 0;       ///< Rows holding a string
    std::string first_non_numeric;

    bool IsNumeric() const { return non_numeric == 0; }
};

/// @brief Extract a feature as doubles, counting missing and non-numeric cells
NumericColumn ExtractNumericColumn(const Dataset& rows, const std::string& feature);

/// @brief Extract a feature as category labels, skipping missing cells
std::vector<std::string> ExtractCategoryColumn(const Dataset& rows,
                                               const std::string& feature);

/// @brief True if at least one row holds a non-missing value for the feature
bool HasFeature(const Dataset& rows, const std::string& feature);

/// @brief Render a cell as a category label ("" for missing)
std::string FeatureValueToString(const FeatureValue& value);

}  // namespace driftguard
