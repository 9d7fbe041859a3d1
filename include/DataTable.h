#pragma once
#include "DateUtils.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using CivilDate = DateUtils::CivilDate;
using CellValue = std::variant<std::monostate, bool, int64_t, double, std::string, CivilDate>;
using RowMask = std::vector<uint8_t>;

enum class CellKind { MISSING, BOOLEAN, INTEGER, REAL, TEXT, DATE };

struct TableColumn {
    std::string name;
    std::vector<CellValue> cells;
};

namespace CellUtils {
CellKind kindOf(const CellValue& v) noexcept;
bool isMissing(const CellValue& v) noexcept;

/**
 * @brief Canonical text used to compare cells for grouping and to build pivot suffixes.
 * @details Integral doubles render without a fraction so 1 and 1.0 share a key; booleans render as
 *          "true"/"false", dates as YYYY-MM-DD, strings trimmed. Missing cells yield an empty string.
 */
std::string toKey(const CellValue& v);

/// Numeric view of a cell: booleans as 1/0, strings through ValueParser. std::nullopt when not convertible.
std::optional<double> toNumber(const CellValue& v);

/// Truthiness for any/all: booleans, non-zero numbers, boolean-like strings.
std::optional<bool> toBoolean(const CellValue& v);

/// Display text, with floating values rounded to the given decimals.
std::string toDisplay(const CellValue& v, int decimals = 2);

/**
 * @brief Three-way ordering used by every sort in the engine.
 * @details Numbers (booleans, integers, reals) order numerically, then dates, then strings case-insensitively.
 *          Missing cells always order last regardless of direction, which callers handle by checking isMissing first.
 */
int compare(const CellValue& a, const CellValue& b);

/// Rounds floating cells to the given decimals; every other kind is returned unchanged.
CellValue rounded(const CellValue& v, int decimals);
} // namespace CellUtils

class DataTable {
public:
    DataTable() = default;
    explicit DataTable(const std::vector<std::string>& columnNames);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }

    const std::vector<TableColumn>& columns() const noexcept { return columns_; }
    std::vector<std::string> columnNames() const;

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;

    /**
     * @brief Returns the named column.
     * @throws Tally::InvalidInputException naming the column and listing the available ones.
     */
    const TableColumn& requireColumn(const std::string& name) const;

    /**
     * @brief Appends a column at the end of the column order.
     * @pre cells.size() == rowCount(), unless the table has no columns yet.
     * @throws Tally::InvalidInputException on duplicate names or misaligned lengths.
     */
    void addColumn(std::string name, std::vector<CellValue> cells);

    /**
     * @brief Appends one row; values align with column order.
     * @throws Tally::InvalidInputException when row width differs from colCount().
     */
    void appendRow(std::vector<CellValue> row);

    const CellValue& at(size_t row, size_t col) const { return columns_[col].cells[row]; }
    void set(size_t row, size_t col, CellValue value) { columns_[col].cells[row] = std::move(value); }

    /**
     * @brief Removes rows where keepMask is 0 across all columns.
     * @post All columns keep row alignment after filtering.
     * @throws Tally::InvalidInputException when mask size mismatches row count.
     */
    void removeRows(const RowMask& keepMask);

    /// Reorders rows by a permutation of row indices.
    void reorderRows(const std::vector<size_t>& order);

    /// Rounds every floating cell in place.
    void roundFloating(int decimals);

private:
    size_t rowCount_ = 0;
    std::vector<TableColumn> columns_;
};

/// Error text for an unknown column, listing what exists.
std::string missingColumnMessage(const std::string& column, const std::vector<std::string>& available);
