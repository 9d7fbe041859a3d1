#include <gtest/gtest.h>

#include "GroupAggregator.h"
#include "TallyExceptions.h"

#include <string>
#include <vector>

namespace {
CellValue text(const char* v) { return CellValue{std::string(v)}; }
CellValue integer(int64_t v) { return CellValue{v}; }

const CellValue& cellAt(const DataTable& table, size_t row, const std::string& column) {
    return table.at(row, static_cast<size_t>(table.findColumnIndex(column)));
}

DataTable ordersTable() {
    DataTable table({"region", "customer_id", "qty", "unit_price", "notes", "order_date"});
    table.appendRow({text("north"), integer(1), integer(10), CellValue{2.5}, text("rush"), CellValue{CivilDate{19000}}});
    table.appendRow({text("north"), integer(1), integer(5), CellValue{3.5}, text("none given"), CellValue{CivilDate{19005}}});
    table.appendRow({text("south"), integer(2), integer(7), CellValue{4.0}, text("gift"), CellValue{CivilDate{19002}}});
    table.appendRow({text("north"), integer(3), integer(1), CellValue{1.0}, text("rush"), CellValue{CivilDate{19001}}});
    table.appendRow({text("south"), integer(2), integer(3), CellValue{}, text("gift"), CellValue{CivilDate{19003}}});
    return table;
}
} // namespace

TEST(GroupAggregatorTest, SumsQuantityPerKeyInFirstAppearanceOrder) {
    DataTable table({"id", "qty"});
    table.appendRow({text("A"), integer(10)});
    table.appendRow({text("A"), integer(5)});
    table.appendRow({text("B"), integer(7)});

    AggregateRequest request;
    request.groupBy = "id";
    request.valueColumns = {"qty"};
    const AggregateResult result = GroupAggregator::aggregate(table, request);

    EXPECT_EQ(result.rowsBefore, 3u);
    EXPECT_EQ(result.rowsAfter, 2u);
    ASSERT_EQ(result.data.columnNames(), (std::vector<std::string>{"id", "qty (Sum)"}));
    EXPECT_EQ(std::get<std::string>(result.data.at(0, 0)), "A");
    EXPECT_EQ(std::get<int64_t>(result.data.at(0, 1)), 15);
    EXPECT_EQ(std::get<std::string>(result.data.at(1, 0)), "B");
    EXPECT_EQ(std::get<int64_t>(result.data.at(1, 1)), 7);
}

TEST(GroupAggregatorTest, IdentifierColumnsCountDistinctValues) {
    AggregateRequest request;
    request.groupBy = "region";
    request.valueColumns = {"customer_id"};
    const AggregateResult result = GroupAggregator::aggregate(ordersTable(), request);

    ASSERT_NE(result.data.findColumnIndex("unique_customers"), -1);
    // north holds customers 1, 1, 3; a sum would give 5.
    EXPECT_EQ(std::get<int64_t>(cellAt(result.data, 0, "unique_customers")), 2);
    EXPECT_EQ(std::get<int64_t>(cellAt(result.data, 1, "unique_customers")), 1);
}

TEST(GroupAggregatorTest, AutoModeDropsTextAndDates) {
    AggregateRequest request;
    request.groupBy = "region";
    const AggregateResult result = GroupAggregator::aggregate(ordersTable(), request);

    const std::vector<std::string> expected = {"region", "unique_customers", "qty (Sum)", "unit_price (Sum)"};
    EXPECT_EQ(result.data.columnNames(), expected);
    EXPECT_DOUBLE_EQ(std::get<double>(cellAt(result.data, 0, "unit_price (Sum)")), 7.0);
    EXPECT_DOUBLE_EQ(std::get<double>(cellAt(result.data, 1, "unit_price (Sum)")), 4.0);
}

TEST(GroupAggregatorTest, IntentAndOverridesShapeLabels) {
    AggregateRequest request;
    request.groupBy = "region";
    request.valueColumns = {"qty", "unit_price", "order_date"};
    request.functions = {{"qty", "max"}};
    request.intent = "average basket";
    const AggregateResult result = GroupAggregator::aggregate(ordersTable(), request);

    const std::vector<std::string> expected = {"region", "max_qty", "avg_unit_price", "max_order_date"};
    EXPECT_EQ(result.data.columnNames(), expected);
    EXPECT_EQ(std::get<int64_t>(cellAt(result.data, 0, "max_qty")), 10);
    EXPECT_DOUBLE_EQ(std::get<double>(cellAt(result.data, 0, "avg_unit_price")), 2.33);
    EXPECT_EQ(std::get<CivilDate>(cellAt(result.data, 0, "max_order_date")).days, 19005);
}

TEST(GroupAggregatorTest, OrdersByRelabeledColumnDescending) {
    AggregateRequest request;
    request.groupBy = "region";
    request.valueColumns = {"qty"};
    request.orderBy = "QTY";
    request.orderDirection = "desc";
    const AggregateResult result = GroupAggregator::aggregate(ordersTable(), request);

    EXPECT_EQ(std::get<std::string>(result.data.at(0, 0)), "north");
    EXPECT_EQ(std::get<int64_t>(result.data.at(0, 1)), 16);

    request.orderDirection = "asc";
    const AggregateResult ascending = GroupAggregator::aggregate(ordersTable(), request);
    EXPECT_EQ(std::get<std::string>(ascending.data.at(0, 0)), "south");
}

TEST(GroupAggregatorTest, UnknownOrderColumnListsResultColumns) {
    AggregateRequest request;
    request.groupBy = "region";
    request.valueColumns = {"qty"};
    request.orderBy = "nope";
    try {
        GroupAggregator::aggregate(ordersTable(), request);
        FAIL() << "expected InvalidInputException";
    } catch (const Tally::InvalidInputException& e) {
        EXPECT_NE(std::string(e.what()).find("qty (Sum)"), std::string::npos);
    }
}

TEST(GroupAggregatorTest, MissingGroupColumnIsInvalidInput) {
    AggregateRequest request;
    request.groupBy = "store";
    EXPECT_THROW(GroupAggregator::aggregate(ordersTable(), request), Tally::InvalidInputException);

    request.groupBy = "";
    EXPECT_THROW(GroupAggregator::aggregate(ordersTable(), request), Tally::InvalidInputException);
}

TEST(GroupAggregatorTest, NoSurvivingColumnsReportsRoleCounts) {
    DataTable table({"region", "notes", "comment"});
    table.appendRow({text("north"), text("rush"), text("call first")});
    table.appendRow({text("south"), text("gift"), text("leave at door")});

    AggregateRequest request;
    request.groupBy = "region";
    try {
        GroupAggregator::aggregate(table, request);
        FAIL() << "expected InvalidInputException";
    } catch (const Tally::InvalidInputException& e) {
        EXPECT_NE(std::string(e.what()).find("text=2"), std::string::npos);
    }
}

TEST(GroupAggregatorTest, OverrideForUnknownColumnIsRejected) {
    AggregateRequest request;
    request.groupBy = "region";
    request.functions = {{"discount", "sum"}};
    EXPECT_THROW(GroupAggregator::aggregate(ordersTable(), request), Tally::InvalidInputException);
}

TEST(GroupAggregatorTest, RowsWithMissingKeyAreExcludedWithWarning) {
    DataTable table({"team", "points"});
    table.appendRow({text("red"), integer(3)});
    table.appendRow({CellValue{}, integer(4)});
    table.appendRow({text("blue"), integer(5)});

    AggregateRequest request;
    request.groupBy = "team";
    const AggregateResult result = GroupAggregator::aggregate(table, request);
    EXPECT_EQ(result.rowsAfter, 2u);
    ASSERT_FALSE(result.warnings.empty());
    EXPECT_NE(result.warnings.back().find("1 row(s)"), std::string::npos);
}

TEST(GroupAggregatorTest, InputTableIsNotModified) {
    const DataTable table = ordersTable();
    AggregateRequest request;
    request.groupBy = "region";
    request.orderBy = "qty";
    GroupAggregator::aggregate(table, request);
    EXPECT_EQ(table.rowCount(), 5u);
    EXPECT_EQ(std::get<int64_t>(table.at(0, 2)), 10);
}

TEST(GroupAggregatorTest, GroupRowsNormalizesKeys) {
    DataTable table({"k"});
    table.appendRow({integer(1)});
    table.appendRow({CellValue{1.0}});
    table.appendRow({text(" 1 ")});
    table.appendRow({integer(2)});
    const auto groups = GroupAggregator::groupRows(table, {0});
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].rows.size(), 3u);
}
