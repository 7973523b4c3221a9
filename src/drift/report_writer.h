#pragma once

/// @file report_writer.h
/// @brief Persists drift reports as timestamped JSON artifacts

#include <filesystem>
#include <string_view>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "drift/drift_types.h"

namespace driftscope::drift {

/// @brief Artifact file name prefix, e.g. drift_20240102_030405.json
inline constexpr std::string_view kReportPrefix = "drift_";

/// @brief Serialize a report to the artifact shape
///
/// @code
///   {"Age": {"p_value": 0.0012, "statistic": 0.21,
///            "drift_detected": true, "type": "numerical"}, ...}
/// @endcode
nlohmann::json ReportToJson(const DriftReport& report);

/// @brief Parse artifact JSON back into per-feature results
/// @return kDeserializationError on malformed content
absl::StatusOr<DriftReport::ResultMap> ParseReportJson(std::string_view content);

/// @brief Read and parse an artifact file
absl::StatusOr<DriftReport::ResultMap> ReadReport(const std::filesystem::path& path);

/// @brief Writes reports under a configured directory
class ReportWriter {
public:
    explicit ReportWriter(std::filesystem::path output_directory)
        : output_directory_(std::move(output_directory)) {}

    /// @brief Publish the report as JSON
    /// @return Artifact path, or kWriteFailure. The report itself is untouched.
    absl::StatusOr<std::filesystem::path> Write(const DriftReport& report) const;

    const std::filesystem::path& OutputDirectory() const { return output_directory_; }

private:
    std::filesystem::path output_directory_;
};

}  // namespace driftscope::drift
