#include "drift/drift_classifier.h"

#include <cmath>

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace driftscope::drift {

absl::Status ValidateThreshold(double threshold) {
    if (std::isnan(threshold) || threshold < 0.0 || threshold > 1.0) {
        return ValidationError(
            absl::StrCat("Drift threshold must be within [0, 1], got ", threshold));
    }
    return absl::OkStatus();
}

FeatureDriftResult DriftClassifier::Classify(const std::string& feature_name,
                                             FeatureKind kind,
                                             const KsTestResult& test,
                                             size_t reference_size,
                                             size_t production_size) const {
    FeatureDriftResult result;
    result.feature_name = feature_name;
    result.statistic = test.statistic;
    result.p_value = test.p_value;
    result.drift_detected = IsDrifted(test.p_value, threshold_);
    result.type = std::string(FeatureKindToString(kind));
    result.reference_size = reference_size;
    result.production_size = production_size;
    return result;
}

FeatureDriftResult DriftClassifier::Degenerate(const std::string& feature_name,
                                               size_t reference_size,
                                               size_t production_size) const {
    FeatureDriftResult result;
    result.feature_name = feature_name;
    result.statistic = 0.0;
    result.p_value = 1.0;
    result.drift_detected = false;
    result.type = std::string(kDegenerateType);
    result.reference_size = reference_size;
    result.production_size = production_size;
    result.degenerate = true;
    return result;
}

}  // namespace driftscope::drift
