#pragma once

/// @file report_visualizer.h
/// @brief SVG bar chart of per-feature p-values

#include <filesystem>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>

#include "drift/drift_types.h"

namespace driftscope::drift {

/// @brief Chart file name prefix, e.g. drift_report_20240102_030405.svg
inline constexpr std::string_view kChartPrefix = "drift_report_";

/// @brief Chart layout
struct ChartStyle {
    int width = 1200;
    int bar_height = 22;
    int bar_gap = 8;
    int label_width = 220;
    int margin = 40;
    std::string drifted_color = "#d62728";
    std::string stable_color = "#2ca02c";
};

/// @brief Render the chart as an SVG document
///
/// One horizontal bar per feature with length proportional to its p-value
/// on a [0, 1] axis, red when drifted and green otherwise, and a dashed
/// vertical line at the threshold.
std::string RenderDriftChartSvg(const DriftReport& report,
                                double threshold,
                                const ChartStyle& style = {});

/// @brief Writes drift charts next to the JSON reports
///
/// Presentational only: callers log failures and carry on.
class ReportVisualizer {
public:
    explicit ReportVisualizer(std::filesystem::path output_directory,
                              ChartStyle style = {})
        : output_directory_(std::move(output_directory)), style_(std::move(style)) {}

    /// @brief Render and publish the chart
    /// @return Chart path, or kWriteFailure
    absl::StatusOr<std::filesystem::path> Render(const DriftReport& report,
                                                 double threshold) const;

private:
    std::filesystem::path output_directory_;
    ChartStyle style_;
};

}  // namespace driftscope::drift
