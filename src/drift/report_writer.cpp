#include "drift/report_writer.h"

#include <fstream>
#include <sstream>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "drift/artifact_file.h"

namespace driftscope::drift {

using json = nlohmann::json;

json ReportToJson(const DriftReport& report) {
    json root = json::object();
    for (const auto& [name, result] : report.Results()) {
        root[name] = {
            {"p_value", result.p_value},
            {"statistic", result.statistic},
            {"drift_detected", result.drift_detected},
            {"type", result.type}
        };
    }
    return root;
}

absl::StatusOr<DriftReport::ResultMap> ParseReportJson(std::string_view content) {
    json root = json::parse(content.begin(), content.end(), nullptr, false);
    if (root.is_discarded()) {
        return MakeError(ErrorCode::kDeserializationError, "Drift report is not valid JSON");
    }
    if (!root.is_object()) {
        return MakeError(ErrorCode::kDeserializationError,
                         "Drift report must be a JSON object keyed by feature");
    }

    DriftReport::ResultMap results;
    for (const auto& [name, entry] : root.items()) {
        if (!entry.is_object() ||
            !entry.contains("p_value") || !entry["p_value"].is_number() ||
            !entry.contains("statistic") || !entry["statistic"].is_number() ||
            !entry.contains("drift_detected") || !entry["drift_detected"].is_boolean() ||
            !entry.contains("type") || !entry["type"].is_string()) {
            return MakeError(ErrorCode::kDeserializationError,
                             absl::StrCat("Malformed drift entry for feature '", name, "'"));
        }

        FeatureDriftResult result;
        result.feature_name = name;
        result.p_value = entry["p_value"].get<double>();
        result.statistic = entry["statistic"].get<double>();
        result.drift_detected = entry["drift_detected"].get<bool>();
        result.type = entry["type"].get<std::string>();
        result.degenerate = result.type == kDegenerateType;
        results.emplace(name, std::move(result));
    }
    return results;
}

absl::StatusOr<DriftReport::ResultMap> ReadReport(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return InputNotFoundError(absl::StrCat("Cannot open drift report ", path.string()));
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return ParseReportJson(buffer.str());
}

absl::StatusOr<std::filesystem::path> ReportWriter::Write(const DriftReport& report) const {
    const std::string content = ReportToJson(report).dump(2);

    auto path = PublishArtifact(output_directory_, kReportPrefix, report.CreatedAt(),
                                ".json", content);
    if (!path.ok()) {
        DRIFTSCOPE_LOG_ERROR("Failed to write drift report: {}", path.status().message());
        return path.status();
    }

    DRIFTSCOPE_LOG_INFO("Drift report written to {}", path->string());
    return path;
}

}  // namespace driftscope::drift
