/// @file main.cpp
/// @brief DriftScope command-line drift check

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "cli/cli_options.h"
#include "common/config.h"
#include "common/error.h"
#include "common/logging.h"
#include "drift/drift_engine.h"
#include "drift/drift_telemetry.h"

namespace {

constexpr const char* kVersion = "1.0.0";

void PrintError(const absl::Status& status) {
    nlohmann::json error = {
        {"status", "error"},
        {"error", std::string(driftscope::ErrorCodeName(driftscope::GetErrorCode(status)))},
        {"detail", std::string(status.message())}
    };
    std::cout << error.dump(2) << std::endl;
}

}  // namespace

using driftscope::cli::ExitCodeFor;
using driftscope::cli::kExitInvalidArgument;
using driftscope::cli::kExitOk;
using driftscope::cli::kExitWriteFailure;

int main(int argc, char* argv[]) {
    CLI::App app{"DriftScope - Kolmogorov-Smirnov data drift check"};

    std::string reference_path;
    std::string production_path;
    std::string config_path;
    driftscope::cli::CliOverrides overrides;
    bool version_flag = false;

    app.add_option("-r,--reference", reference_path, "Reference dataset (CSV)");
    app.add_option("-p,--production", production_path, "Production dataset (CSV)");
    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    app.add_option("-t,--threshold", overrides.threshold, "P-value threshold (0-1, default 0.05)");
    app.add_option("-o,--output-dir", overrides.output_dir, "Directory for drift reports");
    app.add_option("-x,--exclude", overrides.excluded_columns,
                   "Column never compared (repeatable, default: Exited)");
    app.add_option("--log-level", overrides.log_level,
                   "Log level (trace, debug, info, warn, error)");
    app.add_flag("--chart", overrides.chart, "Also render an SVG p-value chart");
    app.add_flag("--no-write", overrides.no_write, "Do not persist the JSON report");
    app.add_flag("--sequential", overrides.sequential, "Compare features on the calling thread");
    app.add_flag("-v,--version", version_flag, "Print version and exit");

    CLI11_PARSE(app, argc, argv);

    if (version_flag) {
        std::cout << "DriftScope v" << kVersion << std::endl;
        return kExitOk;
    }

    if (reference_path.empty() || production_path.empty()) {
        std::cerr << "--reference and --production are required" << std::endl;
        return kExitInvalidArgument;
    }

    // Configuration: file, then environment, then command line
    std::optional<std::filesystem::path> config_file;
    if (!config_path.empty()) {
        config_file = config_path;
    }
    auto config_or = driftscope::LoadConfig(config_file);
    if (!config_or.ok()) {
        std::cerr << "Failed to load config: " << config_or.status().message() << std::endl;
        return kExitInvalidArgument;
    }
    driftscope::Config config = *std::move(config_or);

    driftscope::cli::ApplyOverrides(overrides, config);

    auto log_config = driftscope::cli::LogConfigFromConfig(config);
    if (!log_config.ok()) {
        std::cerr << log_config.status().message() << std::endl;
        return kExitInvalidArgument;
    }
    if (absl::Status status = driftscope::InitLogging(*log_config); !status.ok()) {
        PrintError(status);
        return ExitCodeFor(status);
    }

    auto options = driftscope::drift::EngineOptions::FromConfig(config);
    if (!options.ok()) {
        DRIFTSCOPE_LOG_ERROR("Invalid configuration: {}", options.status().message());
        PrintError(options.status());
        return ExitCodeFor(options.status());
    }

    DRIFTSCOPE_LOG_INFO("DriftScope v{} starting", kVersion);
    DRIFTSCOPE_LOG_INFO("  threshold: {}", options->threshold);
    DRIFTSCOPE_LOG_INFO("  output directory: {}", options->output_directory.string());

    driftscope::drift::DriftEngine engine(
        std::make_shared<const driftscope::drift::EngineOptions>(*std::move(options)));

    auto outcome = engine.RunCheck(reference_path, production_path);
    if (!outcome.ok()) {
        DRIFTSCOPE_LOG_ERROR("Drift check failed: {}", outcome.status().message());
        PrintError(outcome.status());
        driftscope::ShutdownLogging();
        return ExitCodeFor(outcome.status());
    }

    driftscope::drift::LogDriftAssessment(outcome->report, outcome->assessment);
    std::cout << outcome->ToResponseJson().dump(2) << std::endl;

    const int exit_code = outcome->write_status.ok() ? kExitOk : kExitWriteFailure;
    driftscope::ShutdownLogging();
    return exit_code;
}
