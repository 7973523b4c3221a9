#include "drift/drift_telemetry.h"

#include "common/logging.h"

namespace driftscope::drift {

using json = nlohmann::json;

std::vector<json> BuildDriftEvents(const DriftReport& report,
                                   const AggregateRiskAssessment& assessment) {
    std::vector<json> events;
    events.push_back({
        {"event_type", "drift_detection"},
        {"drift_percentage", assessment.drift_percentage},
        {"risk_level", std::string(RiskLevelToString(assessment.risk_level))},
        {"features_analyzed", assessment.total_features},
        {"features_drifted", assessment.drifted_count}
    });

    for (const auto& [name, result] : report.Results()) {
        if (!result.drift_detected) {
            continue;
        }
        events.push_back({
            {"event_type", "feature_drift"},
            {"feature_name", name},
            {"p_value", result.p_value},
            {"statistic", result.statistic},
            {"type", result.type}
        });
    }
    return events;
}

void LogDriftAssessment(const DriftReport& report,
                        const AggregateRiskAssessment& assessment) {
    for (const auto& event : BuildDriftEvents(report, assessment)) {
        DRIFTSCOPE_LOG_WARN("{} {}", event["event_type"].get<std::string>(), event.dump());
    }
}

}  // namespace driftscope::drift
