#pragma once
#include "CSVUtils.h"
#include "DataTable.h"
#include "DateUtils.h"
#include "ValueParser.h"

#include <iosfwd>
#include <string>
#include <vector>

namespace TableIO {

struct ReadOptions {
    char delimiter = ',';
    ValueParser::NumericSeparatorPolicy numericPolicy = ValueParser::NumericSeparatorPolicy::AUTO;
    DateUtils::DateLocaleHint dateHint = DateUtils::DateLocaleHint::AUTO;
    size_t maxRows = 0;  // 0 => unlimited
    CSVUtils::ParseLimits limits;
};

struct LoadedTable {
    DataTable table;
    size_t paddedRows = 0;   // short rows filled with missing cells
    size_t skippedRows = 0;  // malformed or over-wide rows dropped
    std::vector<std::string> warnings;
};

/**
 * @brief Reads a delimited file into a typed table.
 * @details Each column is typed as a whole: int64 when every non-missing value is a plain integer, double when every
 *          one is a plain number, bool for true/false columns, date when every value parses as a calendar date, and
 *          text otherwise. Formatted numbers such as "$1,200" stay text and are interpreted later by the classifier, unless
 *          an explicit numeric locale is given and every value parses under it.
 * @throws Tally::IOException when the file cannot be opened or has no header.
 * @throws Tally::InvalidInputException when the row count exceeds options.maxRows.
 */
LoadedTable readCsv(const std::string& path, const ReadOptions& options = ReadOptions{});
LoadedTable readCsv(std::istream& in, const ReadOptions& options, const std::string& sourceName);

/// Writes the table with a header row; floating cells are rounded and missing cells are left empty.
void writeCsv(const DataTable& table, std::ostream& out, char delimiter = ',', int decimals = 2);
void writeCsv(const DataTable& table, const std::string& path, char delimiter = ',', int decimals = 2);

/// True when this build links Arrow/Parquet.
bool parquetSupported() noexcept;

/**
 * @brief Writes the table as a parquet file.
 * @details Integer columns map to int64, real and mixed numeric columns to float64, booleans to bool, dates to
 *          date32 and everything else to utf8.
 * @throws Tally::IOException on write failure or when the build lacks parquet support.
 */
void writeParquet(const DataTable& table, const std::string& path, int decimals = 2);

} // namespace TableIO
