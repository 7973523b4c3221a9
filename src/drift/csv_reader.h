#pragma once

/// @file csv_reader.h
/// @brief Column-oriented CSV reader for reference and production datasets

#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

namespace driftscope::drift {

/// @brief A parsed CSV file stored column by column
struct CsvTable {
    std::vector<std::string> header;
    /// columns[i] holds every cell of header[i], one entry per data row
    std::vector<std::vector<std::string>> columns;
    size_t row_count = 0;

    /// @brief Index of a column by name, or -1 when absent
    int ColumnIndex(std::string_view name) const;
};

/// @brief RFC 4180 style CSV reader
///
/// Accepts an optional UTF-8 BOM, quoted fields with embedded delimiters,
/// doubled quotes and newlines, and LF or CRLF line endings. Unquoted fields
/// are trimmed. Rows shorter than the header are padded with empty cells;
/// longer rows are rejected.
class CsvReader {
public:
    explicit CsvReader(char delimiter = ',') : delimiter_(delimiter) {}

    /// @brief Read a CSV file from disk
    /// @return kInputNotFound if the file does not exist or cannot be opened
    absl::StatusOr<CsvTable> ReadFile(const std::filesystem::path& path) const;

    /// @brief Parse CSV content from a stream
    /// @param source_name Name used in error messages
    absl::StatusOr<CsvTable> Parse(std::istream& input, std::string_view source_name) const;

private:
    /// @brief Read one logical record; false at end of input
    ///
    /// A blank or whitespace-only line yields a record with no fields.
    absl::StatusOr<bool> ReadRecord(std::istream& input,
                                    std::vector<std::string>& fields) const;

    char delimiter_;
};

}  // namespace driftscope::drift
