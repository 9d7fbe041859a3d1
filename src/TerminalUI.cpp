#include "TerminalUI.h"
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace {
constexpr size_t kMaxCellWidth = 24;

std::string clip(const std::string& text) {
    if (text.size() <= kMaxCellWidth) return text;
    return text.substr(0, kMaxCellWidth - 3) + "...";
}

void printBanner(const std::string& title, size_t width) {
    const std::string label = " " + title + " ";
    const size_t side = width > label.size() ? (width - label.size()) / 2 : 2;
    std::cout << "\n" << std::string(side, '=') << label << std::string(side, '=') << "\n";
}
} // namespace

void TerminalUI::printTablePreview(const std::string& title, const DataTable& table, size_t maxRows, int decimals) {
    const auto& columns = table.columns();
    const size_t shown = std::min(maxRows, table.rowCount());

    std::vector<size_t> widths(columns.size(), 4);
    std::vector<std::vector<std::string>> cells(shown, std::vector<std::string>(columns.size()));
    for (size_t c = 0; c < columns.size(); ++c) {
        widths[c] = std::max(widths[c], clip(columns[c].name).size());
        for (size_t r = 0; r < shown; ++r) {
            const CellValue& v = table.at(r, c);
            cells[r][c] = CellUtils::isMissing(v) ? "null" : clip(CellUtils::toDisplay(v, decimals));
            widths[c] = std::max(widths[c], cells[r][c].size());
        }
    }

    size_t total = 0;
    for (size_t w : widths) total += w + 2;
    printBanner(title, std::max<size_t>(total, 60));

    for (size_t c = 0; c < columns.size(); ++c) {
        std::cout << std::left << std::setw(static_cast<int>(widths[c] + 2)) << clip(columns[c].name);
    }
    std::cout << "\n" << std::string(std::max<size_t>(total, 1), '-') << "\n";

    for (size_t r = 0; r < shown; ++r) {
        for (size_t c = 0; c < columns.size(); ++c) {
            const CellKind kind = CellUtils::kindOf(table.at(r, c));
            const bool numeric = kind == CellKind::INTEGER || kind == CellKind::REAL;
            std::cout << (numeric ? std::right : std::left) << std::setw(static_cast<int>(widths[c])) << cells[r][c] << "  ";
        }
        std::cout << "\n";
    }
    if (shown < table.rowCount()) {
        std::cout << "... " << (table.rowCount() - shown) << " more row(s)\n";
    }
    std::cout << std::left << "[" << table.rowCount() << " rows x " << table.colCount() << " columns]\n";
}

void TerminalUI::printRoles(const std::vector<std::pair<std::string, ColumnRole>>& roles) {
    size_t nameWidth = 15;
    for (const auto& entry : roles) nameWidth = std::max(nameWidth, entry.first.size());

    printBanner("COLUMN ROLES", nameWidth + 16);
    std::cout << std::left << std::setw(static_cast<int>(nameWidth + 2)) << "Column" << "Role\n";
    std::cout << std::string(nameWidth + 16, '-') << "\n";
    for (const auto& entry : roles) {
        std::cout << std::left << std::setw(static_cast<int>(nameWidth + 2)) << entry.first << roleName(entry.second) << "\n";
    }
}

void TerminalUI::printSummary(const TableProfile& profile, int decimals) {
    size_t nameWidth = 15;
    for (const auto& c : profile.columns) nameWidth = std::max(nameWidth, c.name.size());
    const int w = static_cast<int>(nameWidth) + 2;

    printBanner("TABLE SUMMARY (" + std::to_string(profile.rowCount) + " rows)", static_cast<size_t>(w) + 12 * 7);
    std::cout << std::left << std::setw(w) << "Column"
              << std::setw(12) << "Role"
              << std::setw(12) << "Missing"
              << std::setw(12) << "Distinct"
              << std::setw(12) << "Mean"
              << std::setw(12) << "Median"
              << std::setw(12) << "Min"
              << "Max / Top\n";
    std::cout << std::string(static_cast<size_t>(w) + 12 * 7, '-') << "\n";

    for (const auto& c : profile.columns) {
        std::cout << std::left << std::setw(w) << c.name
                  << std::setw(12) << roleName(c.role)
                  << std::setw(12) << c.missing
                  << std::setw(12) << c.distinct;
        if (c.numeric) {
            std::cout << std::fixed << std::setprecision(decimals)
                      << std::setw(12) << c.numeric->mean
                      << std::setw(12) << c.numeric->median
                      << std::setw(12) << c.numeric->min
                      << c.numeric->max << "\n";
        } else {
            std::cout << std::setw(36) << "-" << clip(c.topValue) << " (" << c.topCount << ")\n";
        }
    }
}

void TerminalUI::printAggregationSpecs(const std::vector<AggregationSpec>& specs) {
    std::cout << "[Tally] Aggregation plan:\n";
    for (const auto& spec : specs) {
        std::cout << "        -> " << std::left << std::setw(20) << spec.column
                  << " [" << roleName(spec.role) << "] " << functionName(spec.function)
                  << " as \"" << spec.label << "\"\n";
    }
}

void TerminalUI::printOutlierSummary(const DetectResult& result) {
    std::cout << "\n[Tally] Outlier scan (" << result.method << ", threshold " << std::fixed << std::setprecision(2)
              << result.threshold << "): " << result.totalOutliers << " flagged\n";
    for (const auto& s : result.statistics) {
        std::cout << "        -> " << std::left << std::setw(20) << s.column
                  << " bounds [" << s.lowerBound << ", " << s.upperBound << "]"
                  << " | flagged " << s.outlierCount << " of " << s.count << "\n";
    }
}

void TerminalUI::printWarnings(const std::vector<std::string>& warnings) {
    for (const auto& w : warnings) {
        std::cerr << "[Tally Warning] " << w << "\n";
    }
}
