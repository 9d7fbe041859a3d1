#pragma once
#include "AggregationSelector.h"
#include "DataTable.h"

#include <vector>

namespace AggregationKernel {
/**
 * @brief Reduces one group's cells with the given function.
 * @details Missing cells are ignored by every function. Numeric functions also skip cells that do not
 *          convert to numbers. Results:
 *          - count: non-missing cells; count_distinct: distinct toKey values (int64).
 *          - sum: 0 for an empty group; integers stay int64 when every input is integral.
 *          - min/max: integers stay int64, date inputs yield dates.
 *          - mean/median/p90/p95/p99: missing for an empty group.
 *          - std/var: sample statistics, missing below two values.
 *          - any/all: booleans; all() of an empty group is true.
 *          Floating results are rounded to `decimals`.
 */
CellValue apply(AggregationFunction function, const std::vector<CellValue>& cells, int decimals = 2);

/// Collects the cells of `column` at the given row positions.
std::vector<CellValue> gather(const std::vector<CellValue>& column, const std::vector<size_t>& rows);
} // namespace AggregationKernel
