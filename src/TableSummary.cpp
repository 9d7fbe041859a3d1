#include "TableSummary.h"
#include "CommonUtils.h"

#include <unordered_map>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
NumericSummary roundedSummary(NumericSummary s, int decimals) {
    for (double* field : {&s.sum, &s.mean, &s.median, &s.variance, &s.stddev, &s.min, &s.max, &s.q1, &s.q3, &s.iqr, &s.mode}) {
        *field = CommonUtils::roundTo(*field, decimals);
    }
    return s;
}

ColumnProfile profileColumn(const TableColumn& column, ColumnRole role, int decimals) {
    ColumnProfile profile;
    profile.name = column.name;
    profile.role = role;

    std::unordered_map<std::string, size_t> frequency;
    std::vector<std::string> firstSeen;
    std::vector<double> numbers;
    for (const auto& cell : column.cells) {
        if (CellUtils::isMissing(cell)) {
            ++profile.missing;
            continue;
        }
        ++profile.nonMissing;
        const std::string key = CellUtils::toKey(cell);
        if (frequency[key]++ == 0) firstSeen.push_back(key);
        if (isQuantitativeRole(role)) {
            if (const auto number = CellUtils::toNumber(cell)) numbers.push_back(*number);
        }
    }
    profile.distinct = frequency.size();

    if (!numbers.empty()) {
        profile.numeric = roundedSummary(Statistics::summarize(numbers), decimals);
        return profile;
    }
    // Ties keep the value seen first.
    for (const auto& key : firstSeen) {
        if (frequency[key] > profile.topCount) {
            profile.topCount = frequency[key];
            profile.topValue = key;
        }
    }
    return profile;
}
} // namespace

TableProfile TableSummary::summarize(const DataTable& table, const EngineTuning& tuning) {
    TableProfile out;
    out.rowCount = table.rowCount();
    const auto roles = ColumnClassifier::classifyTable(table, tuning);
    out.columns.resize(table.colCount());

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t c = 0; c < table.colCount(); ++c) {
        out.columns[c] = profileColumn(table.columns()[c], roles[c].second, tuning.outputDecimals);
    }
    return out;
}
