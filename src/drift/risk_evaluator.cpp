#include "drift/risk_evaluator.h"

#include <algorithm>
#include <cmath>

namespace driftscope::drift {

RiskLevel RiskLevelFor(double drift_percentage) {
    if (drift_percentage < kMediumRiskPercentage) {
        return RiskLevel::kLow;
    }
    if (drift_percentage < kHighRiskPercentage) {
        return RiskLevel::kMedium;
    }
    return RiskLevel::kHigh;
}

double DriftPercentage(size_t drifted_count, size_t total_features) {
    if (total_features == 0) {
        return 0.0;
    }
    const double ratio = static_cast<double>(drifted_count) /
                         static_cast<double>(total_features);
    return std::round(ratio * 100.0 * 100.0) / 100.0;
}

AggregateRiskAssessment EvaluateRisk(size_t total_features, size_t drifted_count) {
    AggregateRiskAssessment assessment;
    assessment.total_features = total_features;
    assessment.drifted_count = std::min(drifted_count, total_features);
    assessment.drift_percentage =
        DriftPercentage(assessment.drifted_count, assessment.total_features);
    assessment.risk_level = RiskLevelFor(assessment.drift_percentage);
    return assessment;
}

AggregateRiskAssessment EvaluateRisk(const DriftReport& report) {
    return EvaluateRisk(report.FeatureCount(), report.DriftedCount());
}

}  // namespace driftscope::drift
