#pragma once

/// @file drift_types.h
/// @brief Value types produced by a drift check

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace driftscope::drift {

/// @brief Semantic type of a monitored column, decided once at load time
enum class FeatureKind {
    kNumerical,  ///< Real-valued column
    kBinary      ///< Numeric column whose values are all 0 or 1
};

/// @brief Convert feature kind to its report "type" string
std::string_view FeatureKindToString(FeatureKind kind);

/// @brief Report "type" for a feature whose comparison was degenerate
inline constexpr std::string_view kDegenerateType = "degenerate";

/// @brief Per-feature outcome of a two-sample comparison
struct FeatureDriftResult {
    std::string feature_name;
    double p_value = 1.0;       ///< In [0, 1]
    double statistic = 0.0;     ///< KS statistic D, >= 0
    bool drift_detected = false;  ///< Bound to p_value < threshold at creation
    std::string type;           ///< "numerical", "binary" or "degenerate"

    size_t reference_size = 0;   ///< Sample size after dropping missing values
    size_t production_size = 0;
    bool degenerate = false;     ///< Either sample was empty
};

/// @brief Immutable per-feature drift report for one check invocation
class DriftReport {
public:
    using ResultMap = std::map<std::string, FeatureDriftResult>;

    DriftReport() = default;
    DriftReport(ResultMap results,
                double threshold,
                std::chrono::system_clock::time_point created_at);

    /// @brief Results keyed by feature name
    const ResultMap& Results() const { return results_; }

    /// @brief Result for one feature, nullptr if not present
    const FeatureDriftResult* Find(std::string_view feature_name) const;

    /// @brief Threshold the drift flags were computed against
    double Threshold() const { return threshold_; }

    /// @brief Creation time, used for artifact naming only
    std::chrono::system_clock::time_point CreatedAt() const { return created_at_; }

    size_t FeatureCount() const { return results_.size(); }
    size_t DriftedCount() const;
    bool Empty() const { return results_.empty(); }

    /// @brief Names of the features flagged as drifted, sorted
    std::vector<std::string> DriftedFeatures() const;

private:
    ResultMap results_;
    double threshold_ = 0.05;
    std::chrono::system_clock::time_point created_at_{};
};

/// @brief Coarse overall drift severity
enum class RiskLevel {
    kLow,
    kMedium,
    kHigh
};

/// @brief "LOW", "MEDIUM" or "HIGH"
std::string_view RiskLevelToString(RiskLevel level);

/// @brief Summary of all per-feature flags of one report
struct AggregateRiskAssessment {
    size_t total_features = 0;
    size_t drifted_count = 0;
    double drift_percentage = 0.0;  ///< Rounded to two decimals
    RiskLevel risk_level = RiskLevel::kLow;
};

}  // namespace driftscope::drift
