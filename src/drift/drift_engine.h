#pragma once

/// @file drift_engine.h
/// @brief Runs a complete drift check: load, compare, classify, persist, assess

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "common/config.h"
#include "common/thread_pool.h"
#include "drift/dataset_loader.h"
#include "drift/drift_classifier.h"
#include "drift/drift_types.h"

namespace driftscope::drift {

/// @brief Largest accepted worker_threads: four per hardware thread
size_t MaxWorkerThreads();

/// @brief Engine settings, immutable once built
struct EngineOptions {
    /// p-value cutoff, within [0, 1]
    double threshold = kDefaultThreshold;

    /// Directory receiving JSON reports and charts
    std::filesystem::path output_directory = "drift_reports";

    /// Columns never compared
    std::vector<std::string> excluded_columns = {std::string(kDefaultLabelColumn)};

    /// Persist the JSON report
    bool write_report = true;

    /// Render the SVG chart next to the report
    bool render_chart = false;

    /// Compare features concurrently
    bool parallel = true;

    /// Worker threads for parallel comparison (0 = hardware concurrency),
    /// at most MaxWorkerThreads()
    size_t worker_threads = 0;

    /// @brief Build options from the "drift.*" configuration keys
    /// @return kConfigurationError for mistyped keys, kValidationError for
    ///         out-of-range values
    static absl::StatusOr<EngineOptions> FromConfig(const Config& config);

    /// @brief Check ranges of all fields
    absl::Status Validate() const;
};

/// @brief Everything one check produced
struct DriftCheckOutcome {
    DriftReport report;
    AggregateRiskAssessment assessment;
    FeatureSchema schema;

    /// No comparable columns remained; the report is empty
    bool schema_mismatch = false;

    /// Set when the JSON report was published
    std::optional<std::filesystem::path> artifact_path;
    /// kWriteFailure if persisting failed; OK otherwise (also when disabled)
    absl::Status write_status;

    std::optional<std::filesystem::path> chart_path;
    absl::Status chart_status;

    /// @brief Response document of a check trigger
    ///
    /// {"status", "features_analyzed", "features_drifted", "drift_percentage",
    ///  "risk_level", "results", "artifact"?, "write_error"?}
    nlohmann::json ToResponseJson() const;
};

/// @brief Stateless drift check runner
///
/// Holds an immutable options handle and a worker pool. Concurrent RunCheck
/// calls are independent; ReloadOptions swaps the handle for subsequent
/// checks without touching checks in flight.
///
/// Example:
/// @code
///   auto options = std::make_shared<const EngineOptions>();
///   DriftEngine engine(options);
///   auto outcome = engine.RunCheck("data/reference.csv", "data/production.csv");
///   if (outcome.ok()) {
///       LogDriftAssessment(outcome->report, outcome->assessment);
///   }
/// @endcode
class DriftEngine {
public:
    explicit DriftEngine(std::shared_ptr<const EngineOptions> options);
    ~DriftEngine();

    DriftEngine(const DriftEngine&) = delete;
    DriftEngine& operator=(const DriftEngine&) = delete;

    /// @brief Run a check with the configured threshold
    absl::StatusOr<DriftCheckOutcome> RunCheck(
        const std::filesystem::path& reference_path,
        const std::filesystem::path& production_path) const;

    /// @brief Run a check with an explicit threshold
    /// @return kValidationError for a threshold outside [0, 1],
    ///         kInputNotFound when a dataset is missing
    absl::StatusOr<DriftCheckOutcome> RunCheck(
        const std::filesystem::path& reference_path,
        const std::filesystem::path& production_path,
        double threshold) const;

    /// @brief Snapshot of the options in force
    std::shared_ptr<const EngineOptions> Options() const;

    /// @brief Replace the options handle for subsequent checks
    ///
    /// The worker pool is sized at construction; a reload that turns on
    /// parallel comparison has no effect when the engine started without it.
    absl::Status ReloadOptions(std::shared_ptr<const EngineOptions> options);

private:
    mutable std::mutex options_mutex_;
    std::shared_ptr<const EngineOptions> options_;
    std::unique_ptr<ThreadPool> pool_;
};

}  // namespace driftscope::drift
