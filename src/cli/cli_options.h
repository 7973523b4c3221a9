#pragma once

/// @file cli_options.h
/// @brief Command-line overrides and process exit codes for the drift check

#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/config.h"
#include "common/logging.h"

namespace driftscope::cli {

/// @brief Process exit codes
enum ExitCode {
    kExitOk = 0,
    kExitInvalidArgument = 2,
    kExitInputNotFound = 3,
    kExitLoadFailure = 4,
    kExitWriteFailure = 5,
};

/// @brief Exit code for a failed check or configuration status
///
/// Argument, validation and configuration errors map to 2, missing inputs to
/// 3, report write failures to 5 and everything else to 4.
int ExitCodeFor(const absl::Status& status);

/// @brief Settings given on the command line; unset members leave the
/// configuration untouched
struct CliOverrides {
    std::optional<double> threshold;
    std::optional<std::string> output_dir;
    std::vector<std::string> excluded_columns;
    std::string log_level;
    bool chart = false;
    bool no_write = false;
    bool sequential = false;
};

/// @brief Write the set overrides into config, replacing file and environment
/// values
void ApplyOverrides(const CliOverrides& overrides, Config& config);

/// @brief Logger settings from "logging.level" and "logging.file"
/// @return InvalidArgument for an unknown level name
absl::StatusOr<LogConfig> LogConfigFromConfig(const Config& config);

}  // namespace driftscope::cli
