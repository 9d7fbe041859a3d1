#pragma once
#include "AggregationSelector.h"
#include "DataTable.h"
#include "EngineConfig.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct AggregateRequest {
    std::string groupBy;
    std::vector<std::string> valueColumns;                   // empty => every non-key column
    std::unordered_map<std::string, std::string> functions;  // column -> function name override
    std::string orderBy;
    std::string orderDirection = "asc";
    std::string intent;
};

struct AggregateResult {
    DataTable data;
    size_t rowsBefore = 0;
    size_t rowsAfter = 0;
    std::vector<AggregationSpec> specs;  // included specs, in output column order
    std::vector<std::string> warnings;
};

/// Rows sharing one key, in first-appearance order.
struct RowGroup {
    std::vector<CellValue> key;  // first row's cells for the key columns
    std::vector<size_t> rows;
};

class GroupAggregator {
public:
    /**
     * @brief Groups rows by one key column and reduces every value column with its selected function.
     * @details Value columns are classified, resolved through AggregationSelector and evaluated per group.
     *          Groups keep first-appearance order unless orderBy names a result or source column
     *          (case-insensitive); the sort is stable and places missing values last in both directions.
     *          Rows whose key is missing are dropped and reported as a warning.
     * @throws Tally::InvalidInputException when the group column or a requested column is absent, when the
     *         order column or direction is unknown, or when no value column survives classification.
     */
    static AggregateResult aggregate(const DataTable& table,
                                     const AggregateRequest& request,
                                     const EngineTuning& tuning = EngineTuning{});

    /**
     * @brief Classifies candidate columns and resolves one AggregationSpec per column.
     * @param explicitColumns true when candidates came from the caller rather than auto-selection.
     * @return every spec, including excluded ones (included == false), in candidate order.
     */
    static std::vector<AggregationSpec> resolveSpecs(const DataTable& table,
                                                     const std::vector<std::string>& candidates,
                                                     const std::unordered_map<std::string, std::string>& functions,
                                                     const std::string& intent,
                                                     bool explicitColumns,
                                                     const EngineTuning& tuning);

    /// Partitions rows by the joined keys of the given columns; rows with any missing key cell are skipped.
    static std::vector<RowGroup> groupRows(const DataTable& table,
                                           const std::vector<size_t>& keyColumns,
                                           size_t* droppedRows = nullptr);

    /// "Detected column roles: identifier=1, text=2" style breakdown used in empty-selection errors.
    static std::string roleBreakdown(const std::vector<AggregationSpec>& specs);

    /// Resolves the override for a column: exact name first, then case-insensitive.
    static std::optional<std::string> findOverride(const std::unordered_map<std::string, std::string>& functions,
                                                   const std::string& column);

    /// Fails when an override names a column the table does not have.
    static void checkOverrideColumns(const DataTable& table,
                                     const std::unordered_map<std::string, std::string>& functions);
};
