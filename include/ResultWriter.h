#pragma once
#include "ColumnClassifier.h"
#include "DataTable.h"
#include "GroupAggregator.h"
#include "OutlierEngine.h"
#include "PivotReshaper.h"
#include "TableSummary.h"

#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

class ResultWriter {
public:
    static std::string escapeJsonString(const std::string& input);

    /// JSON literal for a cell: null for missing, rounded numbers, quoted text and dates.
    static std::string cellJson(const CellValue& value, int decimals = 2);
    /// Rounded number, or null when not finite.
    static std::string numberJson(double value, int decimals = 2);

    /// Array of row objects keyed by column name; every column appears in every row.
    static void writeRowsJson(std::ostream& out, const DataTable& table, int decimals, const std::string& indent);

    static std::string classificationJson(const std::vector<std::pair<std::string, ColumnRole>>& roles);
    static std::string summaryJson(const TableProfile& profile, int decimals = 2);
    static std::string aggregateJson(const AggregateResult& result, int decimals = 2);
    static std::string pivotJson(const PivotResult& result, int decimals = 2);
    static std::string detectJson(const DetectResult& result, int decimals = 2);
    static std::string treatJson(const TreatResult& result, int decimals = 2);

    /// Flagged records as a flat table for csv/parquet export.
    static DataTable outlierTable(const DetectResult& result);

    /**
     * @brief Output format for a run: the explicit one, else inferred from the path extension, else json.
     */
    static std::string resolveFormat(const std::string& format, const std::string& path);

    /// Writes text verbatim. @throws Tally::IOException
    static void writeText(const std::string& path, const std::string& content);

    /**
     * @brief Writes a result table as csv or parquet.
     * @throws Tally::IOException on write failure or unsupported format.
     */
    static void writeTable(const DataTable& table,
                           const std::string& path,
                           const std::string& format,
                           char delimiter = ',',
                           int decimals = 2);
};
