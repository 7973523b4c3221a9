#pragma once

/// @file dataset_loader.h
/// @brief Loads reference and production datasets into per-feature samples

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "drift/csv_reader.h"
#include "drift/drift_types.h"

namespace driftscope::drift {

/// @brief Label column excluded from monitoring unless configured otherwise
inline constexpr std::string_view kDefaultLabelColumn = "Exited";

/// @brief A monitored column and its semantic type
struct FeatureSpec {
    std::string name;
    FeatureKind kind = FeatureKind::kNumerical;
};

/// @brief Columns retained for comparison, decided once per load
struct FeatureSchema {
    std::vector<FeatureSpec> features;    ///< In reference header order
    std::vector<std::string> excluded;    ///< Shared columns removed by configuration
    std::vector<std::string> skipped;     ///< Shared columns with non-numeric values

    bool Empty() const { return features.empty(); }
};

/// @brief Reference and production observations of one feature
///
/// Missing values are dropped from each sample independently, so the two
/// sizes may differ.
struct FeatureSamples {
    FeatureSpec spec;
    std::vector<double> reference;
    std::vector<double> production;
};

/// @brief Result of loading a dataset pair
struct LoadedDatasets {
    FeatureSchema schema;
    std::vector<FeatureSamples> samples;  ///< Parallel to schema.features
    size_t reference_rows = 0;
    size_t production_rows = 0;
};

/// @brief Reads two CSV datasets and aligns their shared numeric columns
///
/// Example usage:
/// @code
///   DatasetLoader loader({"Exited"});
///   auto loaded = loader.Load("data/reference.csv", "data/production.csv");
///   if (!loaded.ok()) {
///       // kInputNotFound when either file is missing
///   }
/// @endcode
class DatasetLoader {
public:
    explicit DatasetLoader(std::vector<std::string> excluded_columns = {
                               std::string(kDefaultLabelColumn)});

    /// @brief Load both datasets from disk
    /// @return kInputNotFound if either path cannot be resolved. An empty
    ///         schema (no shared numeric columns) is a valid result.
    absl::StatusOr<LoadedDatasets> Load(const std::filesystem::path& reference_path,
                                        const std::filesystem::path& production_path) const;

    /// @brief Build samples from already parsed tables
    LoadedDatasets FromTables(const CsvTable& reference, const CsvTable& production) const;

    const std::vector<std::string>& ExcludedColumns() const { return excluded_columns_; }

    /// @brief True for empty cells and the usual NA spellings
    static bool IsMissingValue(std::string_view cell);

    /// @brief Parse a non-missing cell as a real number
    ///
    /// "true"/"false" (any case) parse as 1/0. Returns nullopt for text.
    static std::optional<double> ParseNumeric(std::string_view cell);

private:
    bool IsExcluded(std::string_view column) const;

    std::vector<std::string> excluded_columns_;
    CsvReader reader_;
};

}  // namespace driftscope::drift
