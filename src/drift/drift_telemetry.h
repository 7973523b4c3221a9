#pragma once

/// @file drift_telemetry.h
/// @brief Structured drift events for the alerting/telemetry sink

#include <vector>

#include <nlohmann/json.hpp>

#include "drift/drift_types.h"

namespace driftscope::drift {

/// @brief Events describing one check
///
/// The first event is "drift_detection" with the drift percentage and risk
/// level; one "feature_drift" event follows per drifted feature with its
/// name, p-value, statistic and type.
std::vector<nlohmann::json> BuildDriftEvents(const DriftReport& report,
                                             const AggregateRiskAssessment& assessment);

/// @brief Emit the events of BuildDriftEvents through the process logger
///
/// Every event is logged at warn level; the sink decides how to route it.
void LogDriftAssessment(const DriftReport& report,
                        const AggregateRiskAssessment& assessment);

}  // namespace driftscope::drift
