#pragma once
#include "ColumnClassifier.h"
#include "DataTable.h"
#include "EngineConfig.h"
#include "Statistics.h"

#include <optional>
#include <string>
#include <vector>

struct ColumnProfile {
    std::string name;
    ColumnRole role = ColumnRole::TEXT;
    size_t nonMissing = 0;
    size_t missing = 0;
    size_t distinct = 0;
    std::optional<NumericSummary> numeric;  // set when at least one value converts to a number
    std::string topValue;                   // most frequent value for non-numeric columns
    size_t topCount = 0;
};

struct TableProfile {
    size_t rowCount = 0;
    std::vector<ColumnProfile> columns;
};

class TableSummary {
public:
    /// Profiles every column. Numeric summaries are rounded to tuning.outputDecimals.
    static TableProfile summarize(const DataTable& table, const EngineTuning& tuning = EngineTuning{});
};
