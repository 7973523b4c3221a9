#pragma once

/// @file drift_classifier.h
/// @brief Thresholds KS p-values into per-feature drift flags

#include <absl/status/status.h>

#include "drift/drift_types.h"
#include "drift/ks_test.h"

namespace driftscope::drift {

/// @brief Default p-value cutoff
inline constexpr double kDefaultThreshold = 0.05;

/// @brief Check a drift threshold
/// @return kValidationError unless 0 <= threshold <= 1. A threshold of 0
///         is accepted and flags nothing.
absl::Status ValidateThreshold(double threshold);

/// @brief p_value < threshold
inline bool IsDrifted(double p_value, double threshold) {
    return p_value < threshold;
}

/// @brief Applies one threshold uniformly to every feature of a check
class DriftClassifier {
public:
    explicit DriftClassifier(double threshold = kDefaultThreshold)
        : threshold_(threshold) {}

    /// @brief Build the result for a comparable feature
    FeatureDriftResult Classify(const std::string& feature_name,
                                FeatureKind kind,
                                const KsTestResult& test,
                                size_t reference_size,
                                size_t production_size) const;

    /// @brief Build the result for a feature with an empty sample
    ///
    /// statistic 0, p-value 1, never drifted, type "degenerate".
    FeatureDriftResult Degenerate(const std::string& feature_name,
                                  size_t reference_size,
                                  size_t production_size) const;

    double Threshold() const { return threshold_; }

private:
    double threshold_;
};

}  // namespace driftscope::drift
