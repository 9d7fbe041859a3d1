#include "DataTable.h"
#include "CommonUtils.h"
#include "TallyExceptions.h"
#include "ValueParser.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace {
constexpr double kIntegralKeyLimit = 1e15;

std::string formatReal(double v) {
    if (std::isnan(v)) return "NaN";
    if (std::isinf(v)) return v > 0 ? "Infinity" : "-Infinity";
    if (std::abs(v) < kIntegralKeyLimit && v == std::floor(v)) {
        return std::to_string(static_cast<long long>(v));
    }
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%.15g", v);
    return buf;
}

int kindRank(const CellValue& v) {
    switch (CellUtils::kindOf(v)) {
        case CellKind::BOOLEAN:
        case CellKind::INTEGER:
        case CellKind::REAL:
            return 0;
        case CellKind::DATE:
            return 1;
        case CellKind::TEXT:
            return 2;
        case CellKind::MISSING:
            break;
    }
    return 3;
}

int compareText(const std::string& a, const std::string& b) {
    const size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        const int ca = std::tolower(static_cast<unsigned char>(a[i]));
        const int cb = std::tolower(static_cast<unsigned char>(b[i]));
        if (ca != cb) return ca < cb ? -1 : 1;
    }
    if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
    return a.compare(b) < 0 ? -1 : (a == b ? 0 : 1);
}
} // namespace

namespace CellUtils {

CellKind kindOf(const CellValue& v) noexcept {
    switch (v.index()) {
        case 1: return CellKind::BOOLEAN;
        case 2: return CellKind::INTEGER;
        case 3: return CellKind::REAL;
        case 4: return CellKind::TEXT;
        case 5: return CellKind::DATE;
        default: return CellKind::MISSING;
    }
}

bool isMissing(const CellValue& v) noexcept {
    return std::holds_alternative<std::monostate>(v);
}

std::string toKey(const CellValue& v) {
    switch (kindOf(v)) {
        case CellKind::BOOLEAN: return std::get<bool>(v) ? "true" : "false";
        case CellKind::INTEGER: return std::to_string(std::get<int64_t>(v));
        case CellKind::REAL: return formatReal(std::get<double>(v));
        case CellKind::TEXT: return CommonUtils::trim(std::get<std::string>(v));
        case CellKind::DATE: return DateUtils::formatDate(std::get<CivilDate>(v));
        case CellKind::MISSING: break;
    }
    return "";
}

std::optional<double> toNumber(const CellValue& v) {
    switch (kindOf(v)) {
        case CellKind::BOOLEAN: return std::get<bool>(v) ? 1.0 : 0.0;
        case CellKind::INTEGER: return static_cast<double>(std::get<int64_t>(v));
        case CellKind::REAL: {
            const double d = std::get<double>(v);
            if (!std::isfinite(d)) return std::nullopt;
            return d;
        }
        case CellKind::TEXT: {
            double parsed = 0.0;
            if (ValueParser::parseNumber(std::get<std::string>(v), parsed)) return parsed;
            return std::nullopt;
        }
        case CellKind::DATE:
        case CellKind::MISSING:
            break;
    }
    return std::nullopt;
}

std::optional<bool> toBoolean(const CellValue& v) {
    switch (kindOf(v)) {
        case CellKind::BOOLEAN: return std::get<bool>(v);
        case CellKind::INTEGER: return std::get<int64_t>(v) != 0;
        case CellKind::REAL: return std::get<double>(v) != 0.0;
        case CellKind::TEXT: {
            bool parsed = false;
            if (ValueParser::parseBooleanToken(std::get<std::string>(v), parsed)) return parsed;
            double number = 0.0;
            if (ValueParser::parseNumber(std::get<std::string>(v), number)) return number != 0.0;
            return std::nullopt;
        }
        case CellKind::DATE:
        case CellKind::MISSING:
            break;
    }
    return std::nullopt;
}

std::string toDisplay(const CellValue& v, int decimals) {
    if (kindOf(v) == CellKind::REAL) return formatReal(CommonUtils::roundTo(std::get<double>(v), decimals));
    if (kindOf(v) == CellKind::TEXT) return std::get<std::string>(v);
    return toKey(v);
}

int compare(const CellValue& a, const CellValue& b) {
    const int ra = kindRank(a);
    const int rb = kindRank(b);
    if (ra != rb) return ra < rb ? -1 : 1;
    switch (ra) {
        case 0: {
            if (kindOf(a) == CellKind::INTEGER && kindOf(b) == CellKind::INTEGER) {
                const int64_t x = std::get<int64_t>(a);
                const int64_t y = std::get<int64_t>(b);
                return x < y ? -1 : (x > y ? 1 : 0);
            }
            const double x = toNumber(a).value_or(0.0);
            const double y = toNumber(b).value_or(0.0);
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        case 1: {
            const int64_t x = std::get<CivilDate>(a).days;
            const int64_t y = std::get<CivilDate>(b).days;
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        case 2:
            return compareText(std::get<std::string>(a), std::get<std::string>(b));
        default:
            return 0;
    }
}

CellValue rounded(const CellValue& v, int decimals) {
    if (kindOf(v) != CellKind::REAL) return v;
    return CommonUtils::roundTo(std::get<double>(v), decimals);
}

} // namespace CellUtils

std::string missingColumnMessage(const std::string& column, const std::vector<std::string>& available) {
    return "Column \"" + column + "\" was not found. Available columns: " + CommonUtils::joinList(available);
}

DataTable::DataTable(const std::vector<std::string>& columnNames) {
    for (const auto& name : columnNames) addColumn(name, {});
}

std::vector<std::string> DataTable::columnNames() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& col : columns_) names.push_back(col.name);
    return names;
}

int DataTable::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name == name) return static_cast<int>(i);
    }
    return -1;
}

const TableColumn& DataTable::requireColumn(const std::string& name) const {
    const int idx = findColumnIndex(name);
    if (idx < 0) throw Tally::InvalidInputException(missingColumnMessage(name, columnNames()));
    return columns_[static_cast<size_t>(idx)];
}

void DataTable::addColumn(std::string name, std::vector<CellValue> cells) {
    if (findColumnIndex(name) >= 0) {
        throw Tally::InvalidInputException("Duplicate column name: " + name);
    }
    if (columns_.empty()) {
        rowCount_ = cells.size();
    } else if (cells.size() != rowCount_) {
        throw Tally::InvalidInputException("Column '" + name + "' has " + std::to_string(cells.size()) +
                                           " values but the table has " + std::to_string(rowCount_) + " rows");
    }
    columns_.push_back({std::move(name), std::move(cells)});
}

void DataTable::appendRow(std::vector<CellValue> row) {
    if (row.size() != columns_.size()) {
        throw Tally::InvalidInputException("Row width " + std::to_string(row.size()) +
                                           " does not match column count " + std::to_string(columns_.size()));
    }
    for (size_t c = 0; c < columns_.size(); ++c) {
        columns_[c].cells.push_back(std::move(row[c]));
    }
    ++rowCount_;
}

void DataTable::removeRows(const RowMask& keepMask) {
    if (keepMask.size() != rowCount_) {
        throw Tally::InvalidInputException("removeRows mask size mismatch");
    }

    size_t kept = 0;
    for (auto& col : columns_) {
        size_t write = 0;
        for (size_t r = 0; r < keepMask.size(); ++r) {
            if (!keepMask[r]) continue;
            if (write != r) col.cells[write] = std::move(col.cells[r]);
            ++write;
        }
        col.cells.resize(write);
        kept = write;
    }
    rowCount_ = columns_.empty()
        ? static_cast<size_t>(std::count_if(keepMask.begin(), keepMask.end(), [](uint8_t k) { return k != 0; }))
        : kept;
}

void DataTable::reorderRows(const std::vector<size_t>& order) {
    if (order.size() != rowCount_) {
        throw Tally::InvalidInputException("reorderRows permutation size mismatch");
    }
    for (auto& col : columns_) {
        std::vector<CellValue> reordered;
        reordered.reserve(order.size());
        for (size_t r : order) reordered.push_back(col.cells.at(r));
        col.cells = std::move(reordered);
    }
}

void DataTable::roundFloating(int decimals) {
    for (auto& col : columns_) {
        for (auto& cell : col.cells) {
            if (CellUtils::kindOf(cell) == CellKind::REAL) cell = CellUtils::rounded(cell, decimals);
        }
    }
}
