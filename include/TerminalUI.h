#pragma once
#include "AggregationSelector.h"
#include "ColumnClassifier.h"
#include "DataTable.h"
#include "OutlierEngine.h"
#include "TableSummary.h"

#include <string>
#include <utility>
#include <vector>

class TerminalUI {
public:
    // Result tables
    static void printTablePreview(const std::string& title, const DataTable& table, size_t maxRows, int decimals = 2);

    static void printRoles(const std::vector<std::pair<std::string, ColumnRole>>& roles);
    static void printSummary(const TableProfile& profile, int decimals = 2);
    static void printAggregationSpecs(const std::vector<AggregationSpec>& specs);
    static void printOutlierSummary(const DetectResult& result);

    static void printWarnings(const std::vector<std::string>& warnings);
};
