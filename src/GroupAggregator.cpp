#include "GroupAggregator.h"
#include "AggregationKernel.h"
#include "CommonUtils.h"
#include "TallyExceptions.h"

#include <algorithm>
#include <map>
#include <numeric>
#include <unordered_map>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr char kKeySeparator = '\x1f';

bool mostlyNumeric(const std::vector<CellValue>& cells) {
    size_t nonMissing = 0;
    size_t convertible = 0;
    for (const auto& cell : cells) {
        if (CellUtils::isMissing(cell)) continue;
        ++nonMissing;
        if (CellUtils::toNumber(cell).has_value()) ++convertible;
    }
    return nonMissing > 0 && convertible * 2 > nonMissing;
}

int resolveOrderColumn(const DataTable& result,
                       const std::string& orderBy,
                       const std::string& groupBy,
                       const std::vector<AggregationSpec>& specs) {
    const std::vector<std::string> names = result.columnNames();
    for (size_t i = 0; i < names.size(); ++i) {
        if (CommonUtils::equalsIgnoreCase(names[i], orderBy)) return static_cast<int>(i);
    }
    if (CommonUtils::equalsIgnoreCase(groupBy, orderBy)) return 0;
    for (const auto& spec : specs) {
        if (CommonUtils::equalsIgnoreCase(spec.column, orderBy)) return result.findColumnIndex(spec.label);
    }
    throw Tally::InvalidInputException("Cannot order by \"" + orderBy +
                                       "\". Result columns: " + CommonUtils::joinList(names));
}

bool parseDescending(const std::string& direction) {
    const std::string d = CommonUtils::toLower(CommonUtils::trim(direction));
    if (d.empty() || d == "asc" || d == "ascending") return false;
    if (d == "desc" || d == "descending") return true;
    throw Tally::InvalidInputException("Unknown order direction '" + direction + "'. Use asc or desc.");
}
} // namespace

std::optional<std::string> GroupAggregator::findOverride(const std::unordered_map<std::string, std::string>& functions,
                                                         const std::string& column) {
    auto exact = functions.find(column);
    if (exact != functions.end()) return exact->second;
    for (const auto& [name, fn] : functions) {
        if (CommonUtils::equalsIgnoreCase(name, column)) return fn;
    }
    return std::nullopt;
}

void GroupAggregator::checkOverrideColumns(const DataTable& table,
                                           const std::unordered_map<std::string, std::string>& functions) {
    const std::vector<std::string> names = table.columnNames();
    for (const auto& entry : functions) {
        const bool known = std::any_of(names.begin(), names.end(), [&](const std::string& n) {
            return CommonUtils::equalsIgnoreCase(n, entry.first);
        });
        if (!known) throw Tally::InvalidInputException(missingColumnMessage(entry.first, names));
    }
}

std::vector<AggregationSpec> GroupAggregator::resolveSpecs(const DataTable& table,
                                                           const std::vector<std::string>& candidates,
                                                           const std::unordered_map<std::string, std::string>& functions,
                                                           const std::string& intent,
                                                           bool explicitColumns,
                                                           const EngineTuning& tuning) {
    const std::vector<std::string> siblings = table.columnNames();
    std::vector<AggregationSpec> specs;
    specs.reserve(candidates.size());
    for (const auto& name : candidates) {
        const TableColumn& column = table.requireColumn(name);
        const ColumnRole role = ColumnClassifier::classify(column.name, column.cells, siblings, tuning);
        const bool convertible = role == ColumnRole::TEXT && explicitColumns && mostlyNumeric(column.cells);
        specs.push_back(AggregationSelector::select(column.name, role, findOverride(functions, column.name),
                                                    intent, explicitColumns, convertible));
    }
    return specs;
}

std::vector<RowGroup> GroupAggregator::groupRows(const DataTable& table,
                                                 const std::vector<size_t>& keyColumns,
                                                 size_t* droppedRows) {
    std::vector<RowGroup> groups;
    std::unordered_map<std::string, size_t> index;
    size_t dropped = 0;

    for (size_t row = 0; row < table.rowCount(); ++row) {
        std::string key;
        bool missing = false;
        for (size_t k = 0; k < keyColumns.size(); ++k) {
            const CellValue& cell = table.at(row, keyColumns[k]);
            if (CellUtils::isMissing(cell)) {
                missing = true;
                break;
            }
            if (k > 0) key.push_back(kKeySeparator);
            key += CellUtils::toKey(cell);
        }
        if (missing) {
            ++dropped;
            continue;
        }

        auto it = index.find(key);
        if (it == index.end()) {
            RowGroup group;
            group.key.reserve(keyColumns.size());
            for (size_t col : keyColumns) group.key.push_back(table.at(row, col));
            index.emplace(key, groups.size());
            groups.push_back(std::move(group));
            it = index.find(key);
        }
        groups[it->second].rows.push_back(row);
    }

    if (droppedRows) *droppedRows = dropped;
    return groups;
}

std::string GroupAggregator::roleBreakdown(const std::vector<AggregationSpec>& specs) {
    std::map<std::string, size_t> counts;
    for (const auto& spec : specs) ++counts[roleName(spec.role)];
    std::vector<std::string> parts;
    for (const auto& [role, count] : counts) parts.push_back(role + "=" + std::to_string(count));
    if (parts.empty()) return "Detected column roles: none";
    return "Detected column roles: " + CommonUtils::joinList(parts);
}

AggregateResult GroupAggregator::aggregate(const DataTable& table,
                                           const AggregateRequest& request,
                                           const EngineTuning& tuning) {
    AggregateResult result;
    result.rowsBefore = table.rowCount();

    const std::string groupBy = CommonUtils::trim(request.groupBy);
    if (groupBy.empty()) throw Tally::InvalidInputException("A group-by column is required.");
    const TableColumn& keyColumn = table.requireColumn(groupBy);
    const size_t keyIndex = static_cast<size_t>(table.findColumnIndex(keyColumn.name));
    checkOverrideColumns(table, request.functions);
    const bool descending = parseDescending(request.orderDirection);

    const bool explicitColumns = !request.valueColumns.empty();
    std::vector<std::string> candidates;
    if (explicitColumns) {
        for (const auto& name : request.valueColumns) {
            const TableColumn& column = table.requireColumn(CommonUtils::trim(name));
            if (column.name == keyColumn.name) {
                result.warnings.push_back("Column \"" + column.name + "\" is the group key and was not aggregated.");
                continue;
            }
            if (std::find(candidates.begin(), candidates.end(), column.name) == candidates.end()) {
                candidates.push_back(column.name);
            }
        }
    } else {
        for (const auto& column : table.columns()) {
            if (column.name != keyColumn.name) candidates.push_back(column.name);
        }
    }

    std::vector<AggregationSpec> all =
        resolveSpecs(table, candidates, request.functions, request.intent, explicitColumns, tuning);
    std::vector<AggregationSpec> specs;
    for (auto& spec : all) {
        result.warnings.insert(result.warnings.end(), spec.warnings.begin(), spec.warnings.end());
        if (spec.included) specs.push_back(spec);
    }
    if (specs.empty()) {
        throw Tally::InvalidInputException("No aggregatable value columns remain after filtering for group \"" +
                                           keyColumn.name + "\". " + roleBreakdown(all) +
                                           ". Request value columns explicitly or supply functions.");
    }
    const std::vector<std::string> renamed = AggregationSelector::deduplicateLabels(specs, {keyColumn.name});
    result.warnings.insert(result.warnings.end(), renamed.begin(), renamed.end());

    size_t dropped = 0;
    const std::vector<RowGroup> groups = groupRows(table, {keyIndex}, &dropped);
    if (groups.empty()) {
        throw Tally::InvalidInputException("Group column \"" + keyColumn.name + "\" has no non-missing values.");
    }
    if (dropped > 0) {
        result.warnings.push_back(std::to_string(dropped) + " row(s) with a missing \"" + keyColumn.name +
                                  "\" value were excluded from grouping.");
    }

    std::vector<const std::vector<CellValue>*> sources;
    for (const auto& spec : specs) sources.push_back(&table.requireColumn(spec.column).cells);

    std::vector<std::vector<CellValue>> outputs(specs.size(), std::vector<CellValue>(groups.size()));
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t s = 0; s < specs.size(); ++s) {
        const std::vector<CellValue>& source = *sources[s];
        for (size_t g = 0; g < groups.size(); ++g) {
            outputs[s][g] = AggregationKernel::apply(specs[s].function,
                                                     AggregationKernel::gather(source, groups[g].rows),
                                                     tuning.outputDecimals);
        }
    }

    std::vector<CellValue> keys;
    keys.reserve(groups.size());
    for (const auto& group : groups) keys.push_back(group.key.front());
    result.data.addColumn(keyColumn.name, std::move(keys));
    for (size_t s = 0; s < specs.size(); ++s) {
        result.data.addColumn(specs[s].label, std::move(outputs[s]));
    }

    const std::string orderBy = CommonUtils::trim(request.orderBy);
    if (!orderBy.empty()) {
        const int orderCol = resolveOrderColumn(result.data, orderBy, keyColumn.name, specs);
        const std::vector<CellValue>& sortCells = result.data.columns()[static_cast<size_t>(orderCol)].cells;
        std::vector<size_t> order(result.data.rowCount());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            const bool ma = CellUtils::isMissing(sortCells[a]);
            const bool mb = CellUtils::isMissing(sortCells[b]);
            if (ma || mb) return !ma && mb;
            const int cmp = CellUtils::compare(sortCells[a], sortCells[b]);
            return descending ? cmp > 0 : cmp < 0;
        });
        result.data.reorderRows(order);
    }

    result.data.roundFloating(tuning.outputDecimals);
    result.rowsAfter = result.data.rowCount();
    result.specs = std::move(specs);
    return result;
}
