#include "drift/dataset_loader.h"

#include <algorithm>
#include <cmath>

#include <absl/strings/match.h>
#include <absl/strings/numbers.h>

#include "common/error.h"
#include "common/logging.h"

namespace driftscope::drift {

namespace {

/// @brief Convert a column to numbers; false if any non-missing cell is text
bool ExtractNumericColumn(const std::vector<std::string>& cells,
                          std::vector<double>& values) {
    values.clear();
    values.reserve(cells.size());
    for (const auto& cell : cells) {
        if (DatasetLoader::IsMissingValue(cell)) {
            continue;
        }
        auto parsed = DatasetLoader::ParseNumeric(cell);
        if (!parsed.has_value()) {
            return false;
        }
        if (std::isnan(*parsed)) {
            continue;
        }
        values.push_back(*parsed);
    }
    return true;
}

bool IsBinarySample(const std::vector<double>& values) {
    return std::all_of(values.begin(), values.end(),
                       [](double v) { return v == 0.0 || v == 1.0; });
}

}  // namespace

DatasetLoader::DatasetLoader(std::vector<std::string> excluded_columns)
    : excluded_columns_(std::move(excluded_columns)) {}

bool DatasetLoader::IsMissingValue(std::string_view cell) {
    static constexpr std::string_view kMissingTokens[] = {
        "", "NA", "N/A", "n/a", "NaN", "nan", "NAN", "null", "NULL", "None", "-nan"
    };
    return std::find(std::begin(kMissingTokens), std::end(kMissingTokens), cell) !=
           std::end(kMissingTokens);
}

std::optional<double> DatasetLoader::ParseNumeric(std::string_view cell) {
    double value = 0.0;
    if (absl::SimpleAtod(cell, &value)) {
        return value;
    }
    if (absl::EqualsIgnoreCase(cell, "true")) {
        return 1.0;
    }
    if (absl::EqualsIgnoreCase(cell, "false")) {
        return 0.0;
    }
    return std::nullopt;
}

bool DatasetLoader::IsExcluded(std::string_view column) const {
    return std::find(excluded_columns_.begin(), excluded_columns_.end(), column) !=
           excluded_columns_.end();
}

absl::StatusOr<LoadedDatasets> DatasetLoader::Load(
    const std::filesystem::path& reference_path,
    const std::filesystem::path& production_path) const {

    DRIFTSCOPE_ASSIGN_OR_RETURN(CsvTable reference, reader_.ReadFile(reference_path));
    DRIFTSCOPE_ASSIGN_OR_RETURN(CsvTable production, reader_.ReadFile(production_path));

    DRIFTSCOPE_LOG_INFO("Loaded reference {} ({} rows) and production {} ({} rows)",
                        reference_path.string(), reference.row_count,
                        production_path.string(), production.row_count);

    return FromTables(reference, production);
}

LoadedDatasets DatasetLoader::FromTables(const CsvTable& reference,
                                         const CsvTable& production) const {
    LoadedDatasets loaded;
    loaded.reference_rows = reference.row_count;
    loaded.production_rows = production.row_count;

    for (size_t ref_index = 0; ref_index < reference.header.size(); ++ref_index) {
        const std::string& name = reference.header[ref_index];
        const int prod_index = production.ColumnIndex(name);
        if (prod_index < 0) {
            continue;
        }
        if (IsExcluded(name)) {
            loaded.schema.excluded.push_back(name);
            continue;
        }

        FeatureSamples samples;
        samples.spec.name = name;
        if (!ExtractNumericColumn(reference.columns[ref_index], samples.reference) ||
            !ExtractNumericColumn(production.columns[static_cast<size_t>(prod_index)],
                                  samples.production)) {
            DRIFTSCOPE_LOG_WARN("Column '{}' has non-numeric values, not monitored", name);
            loaded.schema.skipped.push_back(name);
            continue;
        }

        const bool has_values = !samples.reference.empty() || !samples.production.empty();
        samples.spec.kind = has_values && IsBinarySample(samples.reference) &&
                                    IsBinarySample(samples.production)
                                ? FeatureKind::kBinary
                                : FeatureKind::kNumerical;

        loaded.schema.features.push_back(samples.spec);
        loaded.samples.push_back(std::move(samples));
    }

    if (loaded.schema.Empty()) {
        DRIFTSCOPE_LOG_WARN("SchemaMismatch: reference and production share no comparable columns");
    } else {
        DRIFTSCOPE_LOG_DEBUG("Feature schema: {} monitored, {} excluded, {} skipped",
                             loaded.schema.features.size(), loaded.schema.excluded.size(),
                             loaded.schema.skipped.size());
    }

    return loaded;
}

}  // namespace driftscope::drift
