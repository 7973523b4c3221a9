#include "cli/cli_options.h"

#include "common/error.h"

namespace driftscope::cli {

int ExitCodeFor(const absl::Status& status) {
    switch (GetErrorCode(status)) {
        case ErrorCode::kInputNotFound:
            return kExitInputNotFound;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kValidationError:
        case ErrorCode::kConfigurationError:
            return kExitInvalidArgument;
        case ErrorCode::kWriteFailure:
            return kExitWriteFailure;
        default:
            return kExitLoadFailure;
    }
}

void ApplyOverrides(const CliOverrides& overrides, Config& config) {
    if (!overrides.log_level.empty()) {
        config.Set("logging.level", overrides.log_level);
    }
    if (overrides.threshold) {
        config.Set("drift.threshold", *overrides.threshold);
    }
    if (overrides.output_dir) {
        config.Set("drift.output_directory", *overrides.output_dir);
    }
    if (!overrides.excluded_columns.empty()) {
        config.Set("drift.excluded_columns", overrides.excluded_columns);
    }
    if (overrides.chart) {
        config.Set("drift.render_chart", true);
    }
    if (overrides.no_write) {
        config.Set("drift.write_report", false);
    }
    if (overrides.sequential) {
        config.Set("drift.parallel", false);
    }
}

absl::StatusOr<LogConfig> LogConfigFromConfig(const Config& config) {
    LogConfig log_config;
    log_config.name = "driftscope";
    DRIFTSCOPE_ASSIGN_OR_RETURN(log_config.level,
                                ParseLogLevel(config.GetString("logging.level", "info")));
    if (config.HasKey("logging.file")) {
        log_config.enable_file = true;
        log_config.file_path = config.GetString("logging.file");
    }
    return log_config;
}

}  // namespace driftscope::cli
