#include "drift/csv_reader.h"

#include <fstream>
#include <unordered_set>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace driftscope::drift {

namespace {

// Bytes of a truncated BOM are consumed; they cannot start a valid header anyway
void SkipByteOrderMark(std::istream& input) {
    static constexpr unsigned char kBom[] = {0xEF, 0xBB, 0xBF};
    for (unsigned char expected : kBom) {
        const int next = input.peek();
        if (next == std::char_traits<char>::eof() ||
            static_cast<unsigned char>(next) != expected) {
            return;
        }
        input.get();
    }
}

}  // namespace

int CsvTable::ColumnIndex(std::string_view name) const {
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

absl::StatusOr<CsvTable> CsvReader::ReadFile(const std::filesystem::path& path) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return InputNotFoundError(absl::StrCat("Dataset not found: ", path.string()));
    }

    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return InputNotFoundError(absl::StrCat("Cannot open dataset: ", path.string()));
    }

    return Parse(input, path.string());
}

absl::StatusOr<CsvTable> CsvReader::Parse(std::istream& input,
                                          std::string_view source_name) const {
    SkipByteOrderMark(input);

    CsvTable table;
    std::vector<std::string> fields;

    DRIFTSCOPE_ASSIGN_OR_RETURN(bool has_header, ReadRecord(input, fields));
    if (!has_header || fields.empty() || (fields.size() == 1 && fields[0].empty())) {
        return MakeError(ErrorCode::kDeserializationError,
            absl::StrCat("Dataset has no header row: ", source_name));
    }

    std::unordered_set<std::string> seen;
    for (const auto& name : fields) {
        if (!seen.insert(name).second) {
            return MakeError(ErrorCode::kDeserializationError,
                absl::StrCat("Duplicate column '", name, "' in ", source_name));
        }
    }
    table.header = fields;
    table.columns.resize(table.header.size());

    size_t line = 1;
    while (true) {
        DRIFTSCOPE_ASSIGN_OR_RETURN(bool has_record, ReadRecord(input, fields));
        if (!has_record) {
            break;
        }
        ++line;

        // Blank lines are skipped whatever the column count; a quoted "" is a value
        if (fields.empty()) {
            continue;
        }
        if (fields.size() > table.header.size()) {
            return MakeError(ErrorCode::kDeserializationError, absl::StrCat(
                source_name, ": record ", line, " has ", fields.size(),
                " fields, header has ", table.header.size()));
        }

        fields.resize(table.header.size());
        for (size_t i = 0; i < fields.size(); ++i) {
            table.columns[i].push_back(std::move(fields[i]));
        }
        ++table.row_count;
    }

    if (input.bad()) {
        return absl::DataLossError(absl::StrCat("I/O error while reading ", source_name));
    }

    DRIFTSCOPE_LOG_DEBUG("Parsed {}: {} columns, {} rows",
                         source_name, table.header.size(), table.row_count);
    return table;
}

absl::StatusOr<bool> CsvReader::ReadRecord(std::istream& input,
                                           std::vector<std::string>& fields) const {
    fields.clear();
    if (input.peek() == std::char_traits<char>::eof()) {
        return false;
    }

    std::string value;
    bool in_quotes = false;
    bool field_quoted = false;

    auto line_is_blank = [&]() {
        return fields.empty() && !field_quoted && absl::StripAsciiWhitespace(value).empty();
    };

    auto push_field = [&]() {
        if (field_quoted) {
            fields.push_back(std::move(value));
        } else {
            fields.emplace_back(absl::StripAsciiWhitespace(value));
        }
        value.clear();
        field_quoted = false;
    };

    char c;
    while (input.get(c)) {
        if (in_quotes) {
            if (c == '"') {
                if (input.peek() == '"') {
                    input.get();
                    value += '"';
                } else {
                    in_quotes = false;
                }
            } else {
                value += c;
            }
            continue;
        }

        if (c == '"' && absl::StripAsciiWhitespace(value).empty()) {
            value.clear();
            in_quotes = true;
            field_quoted = true;
        } else if (c == delimiter_) {
            push_field();
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && input.peek() == '\n') {
                input.get();
            }
            if (!line_is_blank()) {
                push_field();
            }
            return true;
        } else if (!(field_quoted && (c == ' ' || c == '\t'))) {
            // Whitespace after a closing quote is ignored
            value += c;
        }
    }

    if (in_quotes) {
        return MakeError(ErrorCode::kDeserializationError,
                         "Unterminated quoted field at end of input");
    }
    if (!line_is_blank()) {
        push_field();
    }
    return true;
}

}  // namespace driftscope::drift
