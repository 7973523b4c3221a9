#include "drift/drift_types.h"

#include <algorithm>

namespace driftscope::drift {

std::string_view FeatureKindToString(FeatureKind kind) {
    switch (kind) {
        case FeatureKind::kNumerical:
            return "numerical";
        case FeatureKind::kBinary:
            return "binary";
        default:
            return "unknown";
    }
}

std::string_view RiskLevelToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::kLow:
            return "LOW";
        case RiskLevel::kMedium:
            return "MEDIUM";
        case RiskLevel::kHigh:
            return "HIGH";
        default:
            return "UNKNOWN";
    }
}

DriftReport::DriftReport(ResultMap results,
                         double threshold,
                         std::chrono::system_clock::time_point created_at)
    : results_(std::move(results)),
      threshold_(threshold),
      created_at_(created_at) {}

const FeatureDriftResult* DriftReport::Find(std::string_view feature_name) const {
    auto it = results_.find(std::string(feature_name));
    return it == results_.end() ? nullptr : &it->second;
}

size_t DriftReport::DriftedCount() const {
    return static_cast<size_t>(std::count_if(
        results_.begin(), results_.end(),
        [](const auto& entry) { return entry.second.drift_detected; }));
}

std::vector<std::string> DriftReport::DriftedFeatures() const {
    std::vector<std::string> names;
    for (const auto& [name, result] : results_) {
        if (result.drift_detected) {
            names.push_back(name);
        }
    }
    return names;
}

}  // namespace driftscope::drift
