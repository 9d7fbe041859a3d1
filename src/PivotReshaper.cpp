#include "PivotReshaper.h"
#include "AggregationKernel.h"
#include "CommonUtils.h"
#include "GroupAggregator.h"
#include "TallyExceptions.h"

#include <algorithm>
#include <numeric>
#include <unordered_map>
#include <unordered_set>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
struct IndexValue {
    std::string key;
    CellValue cell;
};

std::string uniqueName(const std::string& wanted,
                       std::unordered_set<std::string>& taken,
                       std::vector<std::string>& warnings) {
    std::string name = wanted;
    size_t suffix = 2;
    while (taken.find(name) != taken.end()) {
        name = wanted + "_" + std::to_string(suffix++);
    }
    if (name != wanted) {
        warnings.push_back("Output column \"" + wanted + "\" already exists; renamed to \"" + name + "\".");
    }
    taken.insert(name);
    return name;
}

// Picks the index value whose pivoted cell is largest for one output row.
// cells[v][i] is the value for value column v and index value i.
std::optional<size_t> strongestIndex(const std::vector<std::vector<const CellValue*>>& cells, size_t indexCount) {
    std::optional<size_t> best;
    double bestValue = 0.0;
    for (size_t i = 0; i < indexCount; ++i) {
        for (const auto& perValue : cells) {
            const CellValue& cell = *perValue[i];
            if (CellUtils::isMissing(cell)) continue;
            const auto number = CellUtils::toNumber(cell);
            if (!number.has_value() || *number == 0.0) continue;
            if (!best.has_value() || *number > bestValue) {
                best = i;
                bestValue = *number;
            }
        }
    }
    return best;
}
} // namespace

std::string PivotReshaper::columnSuffix(const std::string& indexKey) {
    std::string out = indexKey;
    std::replace(out.begin(), out.end(), ' ', '_');
    return out;
}

PivotResult PivotReshaper::pivot(const DataTable& table, const PivotRequest& request, const EngineTuning& tuning) {
    PivotResult result;
    result.rowsBefore = table.rowCount();

    const std::string indexName = CommonUtils::trim(request.indexColumn);
    if (indexName.empty()) throw Tally::InvalidInputException("An index column is required for pivot.");
    const TableColumn& indexColumn = table.requireColumn(indexName);
    GroupAggregator::checkOverrideColumns(table, request.functions);

    std::vector<IndexValue> indexValues;
    std::unordered_map<std::string, size_t> indexPosition;
    std::vector<int> rowIndex(table.rowCount(), -1);
    size_t missingIndexRows = 0;
    for (size_t row = 0; row < table.rowCount(); ++row) {
        const CellValue& cell = indexColumn.cells[row];
        if (CellUtils::isMissing(cell)) {
            ++missingIndexRows;
            continue;
        }
        const std::string key = CellUtils::toKey(cell);
        auto it = indexPosition.find(key);
        if (it == indexPosition.end()) {
            it = indexPosition.emplace(key, indexValues.size()).first;
            indexValues.push_back({key, cell});
        }
        rowIndex[row] = static_cast<int>(it->second);
    }
    if (indexValues.empty()) {
        throw Tally::InvalidInputException("Index column \"" + indexColumn.name + "\" has no non-missing values.");
    }
    if (missingIndexRows > 0) {
        result.warnings.push_back(std::to_string(missingIndexRows) + " row(s) with a missing \"" +
                                  indexColumn.name + "\" value do not contribute to pivoted cells.");
    }

    // Value columns and the preserved columns that define output rows.
    const bool explicitColumns = !request.valueColumns.empty();
    std::vector<std::string> candidates;
    if (explicitColumns) {
        for (const auto& name : request.valueColumns) {
            const TableColumn& column = table.requireColumn(CommonUtils::trim(name));
            if (column.name == indexColumn.name) {
                result.warnings.push_back("Column \"" + column.name + "\" is the pivot index and was not aggregated.");
                continue;
            }
            if (std::find(candidates.begin(), candidates.end(), column.name) == candidates.end()) {
                candidates.push_back(column.name);
            }
        }
    } else {
        for (const auto& column : table.columns()) {
            if (column.name != indexColumn.name) candidates.push_back(column.name);
        }
    }

    std::vector<AggregationSpec> all = GroupAggregator::resolveSpecs(
        table, candidates, request.functions, "", explicitColumns, tuning);
    std::vector<AggregationSpec> specs;
    std::unordered_set<std::string> consumed = {indexColumn.name};
    for (auto& spec : all) {
        result.warnings.insert(result.warnings.end(), spec.warnings.begin(), spec.warnings.end());
        if (!spec.included) continue;
        if (spec.role == ColumnRole::IDENTIFIER && spec.function != AggregationFunction::COUNT_DISTINCT) {
            spec.function = AggregationFunction::COUNT_DISTINCT;
            spec.label = AggregationSelector::labelFor(spec.column, spec.role, spec.function);
        }
        consumed.insert(spec.column);
        specs.push_back(spec);
    }
    if (specs.empty()) {
        throw Tally::InvalidInputException("No value columns survive classification for pivot on \"" +
                                           indexColumn.name + "\". " + GroupAggregator::roleBreakdown(all) +
                                           ". Request value columns explicitly.");
    }
    // Requested columns that were excluded are dropped; in auto mode they define output rows.
    if (explicitColumns) {
        for (const auto& spec : all) {
            if (!spec.included) consumed.insert(spec.column);
        }
    }

    std::vector<size_t> preserved;
    for (size_t c = 0; c < table.colCount(); ++c) {
        if (consumed.find(table.columns()[c].name) == consumed.end()) preserved.push_back(c);
    }

    const size_t estimatedColumns = preserved.size() + 1 + specs.size() * indexValues.size();
    if (estimatedColumns > tuning.pivotColumnWarningLimit) {
        result.warnings.push_back("Pivot on \"" + indexColumn.name + "\" produces about " +
                                  std::to_string(estimatedColumns) + " columns (" +
                                  std::to_string(indexValues.size()) + " distinct index values).");
    }

    size_t droppedRows = 0;
    std::vector<RowGroup> groups = GroupAggregator::groupRows(table, preserved, &droppedRows);
    if (droppedRows > 0) {
        result.warnings.push_back(std::to_string(droppedRows) +
                                  " row(s) with missing values in preserved columns were excluded.");
    }

    // Row buckets per (group, index value).
    std::vector<std::vector<std::vector<size_t>>> buckets(groups.size(),
                                                          std::vector<std::vector<size_t>>(indexValues.size()));
    for (size_t g = 0; g < groups.size(); ++g) {
        for (size_t row : groups[g].rows) {
            if (rowIndex[row] >= 0) buckets[g][static_cast<size_t>(rowIndex[row])].push_back(row);
        }
    }

    std::vector<const std::vector<CellValue>*> sources;
    for (const auto& spec : specs) sources.push_back(&table.requireColumn(spec.column).cells);

    // pivoted[v][i][g]
    std::vector<std::vector<std::vector<CellValue>>> pivoted(
        specs.size(), std::vector<std::vector<CellValue>>(indexValues.size(), std::vector<CellValue>(groups.size())));
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t v = 0; v < specs.size(); ++v) {
        for (size_t i = 0; i < indexValues.size(); ++i) {
            for (size_t g = 0; g < groups.size(); ++g) {
                const auto& rows = buckets[g][i];
                if (rows.empty()) continue;
                pivoted[v][i][g] = AggregationKernel::apply(specs[v].function,
                                                            AggregationKernel::gather(*sources[v], rows),
                                                            tuning.outputDecimals);
            }
        }
    }

    // Reconstruct the index value for every output row.
    std::vector<CellValue> reconstructed(groups.size());
    std::vector<std::vector<const CellValue*>> rowCells(specs.size(), std::vector<const CellValue*>(indexValues.size()));
    for (size_t g = 0; g < groups.size(); ++g) {
        for (size_t v = 0; v < specs.size(); ++v) {
            for (size_t i = 0; i < indexValues.size(); ++i) rowCells[v][i] = &pivoted[v][i][g];
        }
        if (const auto strongest = strongestIndex(rowCells, indexValues.size())) {
            reconstructed[g] = indexValues[*strongest].cell;
            continue;
        }
        const auto source = std::find_if(groups[g].rows.begin(), groups[g].rows.end(), [&](size_t row) {
            return rowIndex[row] >= 0;
        });
        reconstructed[g] = (source != groups[g].rows.end()) ? indexColumn.cells[*source] : indexValues.front().cell;
    }

    std::unordered_set<std::string> taken;
    for (size_t p = 0; p < preserved.size(); ++p) {
        std::vector<CellValue> cells;
        cells.reserve(groups.size());
        for (const auto& group : groups) cells.push_back(group.key[p]);
        result.data.addColumn(uniqueName(table.columns()[preserved[p]].name, taken, result.warnings), std::move(cells));
    }
    const std::string indexOutputName = uniqueName(indexColumn.name, taken, result.warnings);
    result.data.addColumn(indexOutputName, std::move(reconstructed));
    for (size_t v = 0; v < specs.size(); ++v) {
        const std::string prefix = specs[v].role == ColumnRole::IDENTIFIER
            ? AggregationSelector::identifierLabel(specs[v].column)
            : specs[v].column;
        for (size_t i = 0; i < indexValues.size(); ++i) {
            const std::string name = uniqueName(prefix + "_" + columnSuffix(indexValues[i].key), taken, result.warnings);
            result.data.addColumn(name, std::move(pivoted[v][i]));
        }
    }

    result.indexReconstructed = true;
    result.reconstructionNote = "Column \"" + indexColumn.name +
        "\" is reconstructed per row from the pivoted cell with the largest value (ties go to the first index "
        "value seen). It is a best-effort approximation, not an exact inverse of the pivot.";

    const std::vector<CellValue>& sortCells =
        result.data.columns()[static_cast<size_t>(result.data.findColumnIndex(indexOutputName))].cells;
    std::vector<size_t> order(result.data.rowCount());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        const bool ma = CellUtils::isMissing(sortCells[a]);
        const bool mb = CellUtils::isMissing(sortCells[b]);
        if (ma || mb) return !ma && mb;
        return CellUtils::compare(sortCells[a], sortCells[b]) < 0;
    });
    result.data.reorderRows(order);
    result.data.roundFloating(tuning.outputDecimals);

    result.rowsAfter = result.data.rowCount();
    for (const auto& value : indexValues) result.indexValues.push_back(value.key);
    result.specs = std::move(specs);
    return result;
}
