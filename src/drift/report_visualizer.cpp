#include "drift/report_visualizer.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "common/logging.h"
#include "drift/artifact_file.h"

namespace driftscope::drift {

namespace {

std::string EscapeXml(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c; break;
        }
    }
    return out;
}

}  // namespace

std::string RenderDriftChartSvg(const DriftReport& report,
                                double threshold,
                                const ChartStyle& style) {
    const int rows = static_cast<int>(std::max<size_t>(report.FeatureCount(), 1));
    const int plot_left = style.margin + style.label_width;
    const int plot_width = std::max(style.width - plot_left - style.margin, 100);
    const int plot_top = style.margin + 30;
    const int plot_height = rows * (style.bar_height + style.bar_gap);
    const int height = plot_top + plot_height + style.margin + 40;

    auto x_for = [&](double value) {
        return plot_left + std::clamp(value, 0.0, 1.0) * plot_width;
    };

    std::ostringstream svg;
    svg << std::fixed << std::setprecision(2);
    svg << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << style.width
        << "\" height=\"" << height << "\" font-family=\"sans-serif\" font-size=\"12\">\n";
    svg << "  <rect width=\"100%\" height=\"100%\" fill=\"white\"/>\n";
    svg << "  <text x=\"" << style.width / 2 << "\" y=\"" << style.margin
        << "\" text-anchor=\"middle\" font-size=\"16\">"
        << "Drift Detection - P-Values per Feature</text>\n";

    int row = 0;
    for (const auto& [name, result] : report.Results()) {
        const int y = plot_top + row * (style.bar_height + style.bar_gap);
        const double bar_width = x_for(result.p_value) - plot_left;
        const std::string& color =
            result.drift_detected ? style.drifted_color : style.stable_color;

        svg << "  <text x=\"" << plot_left - 6 << "\" y=\"" << y + style.bar_height / 2 + 4
            << "\" text-anchor=\"end\">" << EscapeXml(name) << "</text>\n";
        svg << "  <rect x=\"" << plot_left << "\" y=\"" << y << "\" width=\"" << bar_width
            << "\" height=\"" << style.bar_height << "\" fill=\"" << color << "\">"
            << "<title>" << EscapeXml(name) << ": p=" << std::setprecision(4)
            << result.p_value << std::setprecision(2) << "</title></rect>\n";
        ++row;
    }

    // Axis with ticks every 0.1
    const int axis_y = plot_top + plot_height;
    svg << "  <line x1=\"" << plot_left << "\" y1=\"" << axis_y << "\" x2=\""
        << plot_left + plot_width << "\" y2=\"" << axis_y << "\" stroke=\"black\"/>\n";
    for (int tick = 0; tick <= 10; ++tick) {
        const double x = x_for(tick / 10.0);
        svg << "  <line x1=\"" << x << "\" y1=\"" << axis_y << "\" x2=\"" << x
            << "\" y2=\"" << axis_y + 5 << "\" stroke=\"black\"/>\n";
        svg << "  <text x=\"" << x << "\" y=\"" << axis_y + 18
            << "\" text-anchor=\"middle\">" << std::setprecision(1) << tick / 10.0
            << std::setprecision(2) << "</text>\n";
    }
    svg << "  <text x=\"" << plot_left + plot_width / 2 << "\" y=\"" << axis_y + 36
        << "\" text-anchor=\"middle\">P-Value</text>\n";

    const double threshold_x = x_for(threshold);
    svg << "  <line x1=\"" << threshold_x << "\" y1=\"" << plot_top - 6 << "\" x2=\""
        << threshold_x << "\" y2=\"" << axis_y << "\" stroke=\"black\""
        << " stroke-dasharray=\"6,4\"/>\n";
    svg << "  <text x=\"" << threshold_x + 4 << "\" y=\"" << plot_top - 10 << "\">"
        << "Threshold (" << std::setprecision(3) << threshold << ")</text>\n";

    svg << "</svg>\n";
    return svg.str();
}

absl::StatusOr<std::filesystem::path> ReportVisualizer::Render(const DriftReport& report,
                                                               double threshold) const {
    const std::string svg = RenderDriftChartSvg(report, threshold, style_);
    auto path = PublishArtifact(output_directory_, kChartPrefix, report.CreatedAt(),
                                ".svg", svg);
    if (path.ok()) {
        DRIFTSCOPE_LOG_INFO("Drift chart written to {}", path->string());
    }
    return path;
}

}  // namespace driftscope::drift
