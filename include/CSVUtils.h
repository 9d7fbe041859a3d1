#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// RFC 4180 style tokenization, header cleanup and field escaping.
// Cells come back as raw text; type inference lives in TableIO.
struct ParseLimits {
    size_t maxFieldBytes = 8 * 1024 * 1024;    // 8 MiB
    size_t maxRecordBytes = 64 * 1024 * 1024;  // 64 MiB
    size_t maxColumns = 20000;
    size_t maxPhysicalLinesPerRecord = 10000;
};

struct RecordStatus {
    bool malformed = false;      // input ended inside a quoted field
    bool limitExceeded = false;  // one of ParseLimits was hit; the record is truncated
    size_t physicalLines = 0;    // source lines consumed by this record
};

void skipBOM(std::istream& is);

/**
 * @brief Reads one logical record; quoted fields may contain delimiters, doubled quotes and line breaks.
 * @details Unquoted fields are trimmed of spaces and tabs; quoted fields are kept verbatim.
 * @return false at end of input. A blank line yields true with an empty field list.
 */
bool readRecord(std::istream& is,
                char delimiter,
                std::vector<std::string>& fields,
                RecordStatus* status = nullptr,
                const ParseLimits& limits = ParseLimits{});

/// Fills empty names with column_<n> and suffixes repeats with _2, _3, ...
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

/// Quotes a field when it holds the delimiter, a quote, a line break or edge whitespace.
std::string escapeField(const std::string& value, char delimiter);
} // namespace CSVUtils
