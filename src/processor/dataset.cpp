/// @file dataset.cpp
/// @brief Column extraction helpers

#include "processor/dataset.h"

#include <cmath>

#include <absl/strings/str_cat.h>

namespace driftguard {

namespace {

bool IsMissing(const FeatureValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return true;
    }
    if (const auto* number = std::get_if<double>(&value)) {
        return !std::isfinite(*number);
    }
    return false;
}

}  // namespace

std::vector<std::string> FeatureSchema::AllFeatures() const {
    std::vector<std::string> all = numerical_features;
    all.insert(all.end(), categorical_features.begin(), categorical_features.end());
    return all;
}

NumericColumn ExtractNumericColumn(const Dataset& rows, const std::string& feature) {
    NumericColumn column;
    column.values.reserve(rows.size());

    for (const auto& row : rows) {
        auto it = row.find(feature);
        if (it == row.end() || IsMissing(it->second)) {
            ++column.missing;
            continue;
        }
        if (const auto* number = std::get_if<double>(&it->second)) {
            column.values.push_back(*number);
        } else {
            if (column.non_numeric == 0) {
                column.first_non_numeric = std::get<std::string>(it->second);
            }
            ++column.non_numeric;
        }
    }
    return column;
}

std::vector<std::string> ExtractCategoryColumn(const Dataset& rows,
                                               const std::string& feature) {
    std::vector<std::string> labels;
    labels.reserve(rows.size());
    for (const auto& row : rows) {
        auto it = row.find(feature);
        if (it == row.end() || IsMissing(it->second)) {
            continue;
        }
        labels.push_back(FeatureValueToString(it->second));
    }
    return labels;
}

bool HasFeature(const Dataset& rows, const std::string& feature) {
    for (const auto& row : rows) {
        auto it = row.find(feature);
        if (it != row.end() && !IsMissing(it->second)) {
            return true;
        }
    }
    return false;
}

std::string FeatureValueToString(const FeatureValue& value) {
    if (const auto* number = std::get_if<double>(&value)) {
        return absl::StrCat(*number);
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    return "";
}

}  // namespace driftguard
