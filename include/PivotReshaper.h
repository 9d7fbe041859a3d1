#pragma once
#include "AggregationSelector.h"
#include "DataTable.h"
#include "EngineConfig.h"

#include <string>
#include <unordered_map>
#include <vector>

struct PivotRequest {
    std::string indexColumn;
    std::vector<std::string> valueColumns;                   // empty => quantitative non-index columns
    std::unordered_map<std::string, std::string> functions;  // column -> function name override
};

struct PivotResult {
    DataTable data;
    size_t rowsBefore = 0;
    size_t rowsAfter = 0;
    std::vector<AggregationSpec> specs;
    std::vector<std::string> indexValues;  // distinct index keys in discovery order
    std::vector<std::string> warnings;
    bool indexReconstructed = false;
    std::string reconstructionNote;
};

class PivotReshaper {
public:
    /**
     * @brief Spreads the distinct values of indexColumn into columns and aggregates value columns into them.
     * @details Output columns are named `<prefix>_<index value>` with spaces replaced by underscores, where the
     *          prefix is the value column name, or the distinct-count label for identifier columns. Rows are
     *          grouped by every remaining (preserved) column; cells without matching rows are missing.
     *
     *          The index column itself is rebuilt per output row from the pivoted cell with the largest
     *          non-zero value. Ties resolve to the index value discovered first. When no such cell exists
     *          the first source row of the group supplies it, then the first index value. This is a
     *          best-effort reconstruction, not an exact inverse, and the result says so in reconstructionNote.
     *
     * @throws Tally::InvalidInputException when the index column or a requested column is absent, the index
     *         column has no values, or no value column survives classification.
     */
    static PivotResult pivot(const DataTable& table,
                             const PivotRequest& request,
                             const EngineTuning& tuning = EngineTuning{});

    /// "In Progress" -> "In_Progress".
    static std::string columnSuffix(const std::string& indexKey);
};
