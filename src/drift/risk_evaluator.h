#pragma once

/// @file risk_evaluator.h
/// @brief Aggregates per-feature drift flags into a risk band

#include <cstddef>

#include "drift/drift_types.h"

namespace driftscope::drift {

/// @brief Drift percentage below which risk is LOW
inline constexpr double kMediumRiskPercentage = 20.0;

/// @brief Drift percentage from which risk is HIGH
inline constexpr double kHighRiskPercentage = 50.0;

/// @brief Band for a drift percentage: < 20 LOW, < 50 MEDIUM, else HIGH
RiskLevel RiskLevelFor(double drift_percentage);

/// @brief drifted / total * 100 rounded to two decimals; 0 when total is 0
double DriftPercentage(size_t drifted_count, size_t total_features);

/// @brief Assessment from raw counts
///
/// drifted_count is clamped to total_features.
AggregateRiskAssessment EvaluateRisk(size_t total_features, size_t drifted_count);

/// @brief Assessment of a report; every listed feature counts, including
/// degenerate ones
AggregateRiskAssessment EvaluateRisk(const DriftReport& report);

}  // namespace driftscope::drift
