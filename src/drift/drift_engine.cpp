#include "drift/drift_engine.h"

#include <algorithm>
#include <chrono>
#include <thread>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "drift/distribution_comparator.h"
#include "drift/report_visualizer.h"
#include "drift/report_writer.h"
#include "drift/risk_evaluator.h"

namespace driftscope::drift {

using json = nlohmann::json;

// =============================================================================
// EngineOptions
// =============================================================================

namespace {

constexpr size_t kMaxWorkersPerCore = 4;

}  // namespace

size_t MaxWorkerThreads() {
    return kMaxWorkersPerCore * std::max(1u, std::thread::hardware_concurrency());
}

absl::StatusOr<EngineOptions> EngineOptions::FromConfig(const Config& config) {
    EngineOptions options;

    DRIFTSCOPE_ASSIGN_OR_RETURN(auto threshold, config.LookupDouble("drift.threshold"));
    if (threshold) {
        options.threshold = *threshold;
    }

    DRIFTSCOPE_ASSIGN_OR_RETURN(auto output_directory,
                                config.LookupString("drift.output_directory"));
    if (output_directory) {
        options.output_directory = *output_directory;
    }

    DRIFTSCOPE_ASSIGN_OR_RETURN(auto excluded, config.LookupStringList("drift.excluded_columns"));
    if (excluded) {
        options.excluded_columns = *excluded;
    }

    DRIFTSCOPE_ASSIGN_OR_RETURN(auto write_report, config.LookupBool("drift.write_report"));
    if (write_report) {
        options.write_report = *write_report;
    }

    DRIFTSCOPE_ASSIGN_OR_RETURN(auto render_chart, config.LookupBool("drift.render_chart"));
    if (render_chart) {
        options.render_chart = *render_chart;
    }

    DRIFTSCOPE_ASSIGN_OR_RETURN(auto parallel, config.LookupBool("drift.parallel"));
    if (parallel) {
        options.parallel = *parallel;
    }

    DRIFTSCOPE_ASSIGN_OR_RETURN(auto worker_threads, config.LookupInt("drift.worker_threads"));
    if (worker_threads) {
        if (*worker_threads < 0) {
            return ValidationError(absl::StrCat(
                "drift.worker_threads must not be negative, got ", *worker_threads));
        }
        options.worker_threads = static_cast<size_t>(*worker_threads);
    }

    DRIFTSCOPE_RETURN_IF_ERROR(options.Validate());
    return options;
}

absl::Status EngineOptions::Validate() const {
    DRIFTSCOPE_RETURN_IF_ERROR(ValidateThreshold(threshold));
    DRIFTSCOPE_CHECK_OR_RETURN(!(write_report || render_chart) || !output_directory.empty(),
                               ValidationError("drift.output_directory must not be empty"));
    DRIFTSCOPE_CHECK_OR_RETURN(
        worker_threads <= MaxWorkerThreads(),
        ValidationError(absl::StrCat("drift.worker_threads must be at most ",
                                     MaxWorkerThreads(), ", got ", worker_threads)));
    return absl::OkStatus();
}

// =============================================================================
// DriftCheckOutcome
// =============================================================================

json DriftCheckOutcome::ToResponseJson() const {
    json response = {
        {"status", "success"},
        {"features_analyzed", assessment.total_features},
        {"features_drifted", assessment.drifted_count},
        {"drift_percentage", assessment.drift_percentage},
        {"risk_level", std::string(RiskLevelToString(assessment.risk_level))},
        {"results", ReportToJson(report)}
    };
    if (schema_mismatch) {
        response["schema_mismatch"] = true;
    }
    if (artifact_path) {
        response["artifact"] = artifact_path->string();
    }
    if (!write_status.ok()) {
        response["write_error"] = std::string(write_status.message());
    }
    if (chart_path) {
        response["chart"] = chart_path->string();
    }
    return response;
}

// =============================================================================
// DriftEngine
// =============================================================================

DriftEngine::DriftEngine(std::shared_ptr<const EngineOptions> options)
    : options_(options ? std::move(options) : std::make_shared<const EngineOptions>()) {
    if (options_->parallel) {
        // Options built without Validate() still get a bounded pool
        const size_t workers = std::min(options_->worker_threads, MaxWorkerThreads());
        pool_ = std::make_unique<ThreadPool>(workers);
        DRIFTSCOPE_LOG_DEBUG("Drift engine using {} comparison workers", pool_->Size());
    }
}

DriftEngine::~DriftEngine() = default;

std::shared_ptr<const EngineOptions> DriftEngine::Options() const {
    std::lock_guard<std::mutex> lock(options_mutex_);
    return options_;
}

absl::Status DriftEngine::ReloadOptions(std::shared_ptr<const EngineOptions> options) {
    if (!options) {
        return absl::InvalidArgumentError("Engine options must not be null");
    }
    DRIFTSCOPE_RETURN_IF_ERROR(options->Validate());

    std::lock_guard<std::mutex> lock(options_mutex_);
    options_ = std::move(options);
    return absl::OkStatus();
}

absl::StatusOr<DriftCheckOutcome> DriftEngine::RunCheck(
    const std::filesystem::path& reference_path,
    const std::filesystem::path& production_path) const {
    return RunCheck(reference_path, production_path, Options()->threshold);
}

absl::StatusOr<DriftCheckOutcome> DriftEngine::RunCheck(
    const std::filesystem::path& reference_path,
    const std::filesystem::path& production_path,
    double threshold) const {

    DRIFTSCOPE_RETURN_IF_ERROR(ValidateThreshold(threshold));

    // Pin the options for the whole check; a reload only affects later checks
    const std::shared_ptr<const EngineOptions> options = Options();

    DatasetLoader loader(options->excluded_columns);
    DRIFTSCOPE_ASSIGN_OR_RETURN(LoadedDatasets datasets,
                                loader.Load(reference_path, production_path));

    ThreadPool* pool = options->parallel ? pool_.get() : nullptr;
    DistributionComparator comparator(threshold, pool);
    std::vector<FeatureDriftResult> results = comparator.CompareAll(datasets);

    DriftReport::ResultMap result_map;
    for (auto& result : results) {
        std::string name = result.feature_name;
        result_map.emplace(std::move(name), std::move(result));
    }

    DriftCheckOutcome outcome;
    outcome.report = DriftReport(std::move(result_map), threshold,
                                 std::chrono::system_clock::now());
    outcome.schema = std::move(datasets.schema);
    outcome.schema_mismatch = outcome.schema.Empty();
    outcome.assessment = EvaluateRisk(outcome.report);

    if (options->write_report) {
        ReportWriter writer(options->output_directory);
        auto artifact = writer.Write(outcome.report);
        if (artifact.ok()) {
            outcome.artifact_path = *std::move(artifact);
        } else {
            outcome.write_status = artifact.status();
        }
    }

    if (options->render_chart) {
        ReportVisualizer visualizer(options->output_directory);
        auto chart = visualizer.Render(outcome.report, threshold);
        if (chart.ok()) {
            outcome.chart_path = *std::move(chart);
        } else {
            outcome.chart_status = chart.status();
            DRIFTSCOPE_LOG_WARN("Drift chart not rendered: {}", chart.status().message());
        }
    }

    DRIFTSCOPE_LOG_INFO("Drift check complete: {}/{} features drifted ({:.2f}%), risk {}",
                        outcome.assessment.drifted_count, outcome.assessment.total_features,
                        outcome.assessment.drift_percentage,
                        RiskLevelToString(outcome.assessment.risk_level));
    return outcome;
}

}  // namespace driftscope::drift
