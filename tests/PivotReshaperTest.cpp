#include <gtest/gtest.h>

#include "GroupAggregator.h"
#include "PivotReshaper.h"
#include "TallyExceptions.h"

#include <algorithm>
#include <string>
#include <vector>

namespace {
CellValue text(const char* v) { return CellValue{std::string(v)}; }
CellValue integer(int64_t v) { return CellValue{v}; }

const CellValue& cellAt(const DataTable& table, size_t row, const std::string& column) {
    const int index = table.findColumnIndex(column);
    EXPECT_NE(index, -1) << "missing column " << column;
    return table.at(row, static_cast<size_t>(index));
}

DataTable weeklySales() {
    DataTable table({"week", "status", "sales"});
    table.appendRow({text("W1"), text("Done"), integer(100)});
    table.appendRow({text("W1"), text("Open"), integer(50)});
    table.appendRow({text("W2"), text("Done"), integer(30)});
    table.appendRow({text("W2"), text("Done"), integer(20)});
    table.appendRow({text("W2"), text("In Review"), integer(80)});
    return table;
}
} // namespace

TEST(PivotReshaperTest, SpreadsIndexValuesIntoColumns) {
    DataTable table({"week", "status", "sales"});
    table.appendRow({text("W1"), text("Done"), integer(100)});
    table.appendRow({text("W1"), text("Open"), integer(50)});

    PivotRequest request;
    request.indexColumn = "status";
    const PivotResult result = PivotReshaper::pivot(table, request);

    ASSERT_EQ(result.rowsAfter, 1u);
    EXPECT_EQ(std::get<std::string>(cellAt(result.data, 0, "week")), "W1");
    EXPECT_EQ(std::get<int64_t>(cellAt(result.data, 0, "sales_Done")), 100);
    EXPECT_EQ(std::get<int64_t>(cellAt(result.data, 0, "sales_Open")), 50);
}

TEST(PivotReshaperTest, EmptyCellsStayMissingAndSuffixesUseUnderscores) {
    const PivotResult result = PivotReshaper::pivot(weeklySales(), PivotRequest{"status", {}, {}});

    const std::vector<std::string> expected = {"week", "status", "sales_Done", "sales_Open", "sales_In_Review"};
    EXPECT_EQ(result.data.columnNames(), expected);
    EXPECT_EQ(result.indexValues, (std::vector<std::string>{"Done", "Open", "In Review"}));

    // Rows sort by the reconstructed status: W1 -> Done, W2 -> In Review.
    EXPECT_EQ(std::get<std::string>(cellAt(result.data, 0, "week")), "W1");
    EXPECT_TRUE(CellUtils::isMissing(cellAt(result.data, 0, "sales_In_Review")));
    EXPECT_EQ(std::get<int64_t>(cellAt(result.data, 1, "sales_Done")), 50);
    EXPECT_TRUE(CellUtils::isMissing(cellAt(result.data, 1, "sales_Open")));
}

TEST(PivotReshaperTest, ReconstructsIndexFromLargestCell) {
    const PivotResult result = PivotReshaper::pivot(weeklySales(), PivotRequest{"status", {}, {}});
    EXPECT_TRUE(result.indexReconstructed);
    EXPECT_NE(result.reconstructionNote.find("best-effort"), std::string::npos);
    EXPECT_EQ(std::get<std::string>(cellAt(result.data, 0, "status")), "Done");
    EXPECT_EQ(std::get<std::string>(cellAt(result.data, 1, "status")), "In Review");
}

TEST(PivotReshaperTest, TiesGoToFirstDiscoveredIndexValue) {
    DataTable table({"week", "status", "sales"});
    table.appendRow({text("W1"), text("Open"), integer(40)});
    table.appendRow({text("W1"), text("Done"), integer(40)});

    const PivotResult result = PivotReshaper::pivot(table, PivotRequest{"status", {}, {}});
    EXPECT_EQ(std::get<std::string>(cellAt(result.data, 0, "status")), "Open");
}

TEST(PivotReshaperTest, SumsAcrossIndexMatchAggregate) {
    DataTable table({"store", "channel", "revenue"});
    table.appendRow({text("s1"), text("web"), CellValue{10.25}});
    table.appendRow({text("s1"), text("shop"), CellValue{4.5}});
    table.appendRow({text("s2"), text("web"), CellValue{7.0}});
    table.appendRow({text("s1"), text("web"), CellValue{1.25}});
    table.appendRow({text("s2"), text("phone"), CellValue{3.75}});

    const PivotResult pivoted = PivotReshaper::pivot(table, PivotRequest{"channel", {"revenue"}, {}});
    AggregateRequest request;
    request.groupBy = "store";
    request.valueColumns = {"revenue"};
    const AggregateResult aggregated = GroupAggregator::aggregate(table, request);

    ASSERT_EQ(pivoted.rowsAfter, aggregated.rowsAfter);
    for (size_t g = 0; g < aggregated.rowsAfter; ++g) {
        const std::string store = std::get<std::string>(aggregated.data.at(g, 0));
        const double expected = *CellUtils::toNumber(cellAt(aggregated.data, g, "revenue (Sum)"));

        double total = 0.0;
        bool found = false;
        for (size_t r = 0; r < pivoted.rowsAfter; ++r) {
            if (std::get<std::string>(cellAt(pivoted.data, r, "store")) != store) continue;
            found = true;
            for (const auto& key : pivoted.indexValues) {
                const CellValue& cell = cellAt(pivoted.data, r, "revenue_" + PivotReshaper::columnSuffix(key));
                if (!CellUtils::isMissing(cell)) total += *CellUtils::toNumber(cell);
            }
        }
        ASSERT_TRUE(found) << store;
        EXPECT_DOUBLE_EQ(total, expected) << store;
    }
}

TEST(PivotReshaperTest, IdentifierValuesAreCountedDistinct) {
    DataTable table({"region", "status", "customer_id"});
    table.appendRow({text("north"), text("Done"), integer(1)});
    table.appendRow({text("north"), text("Done"), integer(1)});
    table.appendRow({text("north"), text("Done"), integer(2)});
    table.appendRow({text("north"), text("Open"), integer(3)});

    const PivotResult result = PivotReshaper::pivot(table, PivotRequest{"status", {"customer_id"}, {{"customer_id", "sum"}}});
    EXPECT_EQ(std::get<int64_t>(cellAt(result.data, 0, "unique_customers_Done")), 2);
    EXPECT_EQ(std::get<int64_t>(cellAt(result.data, 0, "unique_customers_Open")), 1);
}

TEST(PivotReshaperTest, AutoModeAggregatesIdentifiersAndBooleans) {
    DataTable table({"region", "status", "customer_id", "sales", "is_paid"});
    table.appendRow({text("north"), text("Done"), integer(1), integer(10), CellValue{true}});
    table.appendRow({text("north"), text("Done"), integer(2), integer(20), CellValue{false}});
    table.appendRow({text("north"), text("Open"), integer(3), integer(5), CellValue{false}});

    const PivotResult result = PivotReshaper::pivot(table, PivotRequest{"status", {}, {}});
    const std::vector<std::string> expected = {"region", "status", "unique_customers_Done", "unique_customers_Open",
                                               "sales_Done", "sales_Open", "is_paid_Done", "is_paid_Open"};
    EXPECT_EQ(result.data.columnNames(), expected);
    ASSERT_EQ(result.rowsAfter, 1u);
    EXPECT_EQ(std::get<std::string>(cellAt(result.data, 0, "region")), "north");
    EXPECT_EQ(std::get<int64_t>(cellAt(result.data, 0, "unique_customers_Done")), 2);
    EXPECT_EQ(std::get<int64_t>(cellAt(result.data, 0, "unique_customers_Open")), 1);
    EXPECT_EQ(std::get<int64_t>(cellAt(result.data, 0, "sales_Done")), 30);
    EXPECT_TRUE(std::get<bool>(cellAt(result.data, 0, "is_paid_Done")));
    EXPECT_FALSE(std::get<bool>(cellAt(result.data, 0, "is_paid_Open")));
}

TEST(PivotReshaperTest, ExplicitModeDropsExcludedColumns) {
    DataTable table({"week", "status", "note", "sales"});
    table.appendRow({text("W1"), text("Done"), text("late"), integer(10)});
    table.appendRow({text("W1"), text("Open"), text("ok"), integer(5)});

    const PivotResult result = PivotReshaper::pivot(table, PivotRequest{"status", {"note", "sales"}, {}});
    EXPECT_EQ(result.data.columnNames(), (std::vector<std::string>{"week", "status", "sales_Done", "sales_Open"}));
    EXPECT_EQ(result.rowsAfter, 1u);
}

TEST(PivotReshaperTest, RenamedOutputColumnsAreReported) {
    DataTable table({"sales_Done", "status", "sales"});
    table.appendRow({text("x"), text("Done"), integer(10)});
    table.appendRow({text("x"), text("Open"), integer(5)});

    const PivotResult result = PivotReshaper::pivot(table, PivotRequest{"status", {"sales"}, {}});
    EXPECT_EQ(result.data.columnNames(),
              (std::vector<std::string>{"sales_Done", "status", "sales_Done_2", "sales_Open"}));
    const bool reported = std::any_of(result.warnings.begin(), result.warnings.end(), [](const std::string& w) {
        return w.find("renamed to \"sales_Done_2\"") != std::string::npos;
    });
    EXPECT_TRUE(reported);
}

TEST(PivotReshaperTest, FailsWithoutIndexOrValues) {
    EXPECT_THROW(PivotReshaper::pivot(weeklySales(), PivotRequest{"stage", {}, {}}), Tally::InvalidInputException);
    EXPECT_THROW(PivotReshaper::pivot(weeklySales(), PivotRequest{"", {}, {}}), Tally::InvalidInputException);

    DataTable table({"week", "status", "note"});
    table.appendRow({text("W1"), text("Done"), text("ok")});
    EXPECT_THROW(PivotReshaper::pivot(table, PivotRequest{"status", {}, {}}), Tally::InvalidInputException);
}

TEST(PivotReshaperTest, WarnsWhenOutputIsWide) {
    EngineTuning tuning;
    tuning.pivotColumnWarningLimit = 3;
    const PivotResult result = PivotReshaper::pivot(weeklySales(), PivotRequest{"status", {}, {}}, tuning);
    ASSERT_FALSE(result.warnings.empty());
    EXPECT_NE(result.warnings.front().find("columns"), std::string::npos);
}

TEST(PivotReshaperTest, ColumnSuffixReplacesSpaces) {
    EXPECT_EQ(PivotReshaper::columnSuffix("In Review"), "In_Review");
    EXPECT_EQ(PivotReshaper::columnSuffix("2024-01-05"), "2024-01-05");
}
