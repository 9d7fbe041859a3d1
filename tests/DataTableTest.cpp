#include <gtest/gtest.h>

#include "CommonUtils.h"
#include "DataTable.h"
#include "TallyExceptions.h"

#include <string>
#include <vector>

namespace {
CellValue text(const char* v) { return CellValue{std::string(v)}; }
CellValue integer(int64_t v) { return CellValue{v}; }
} // namespace

TEST(DataTableTest, ColumnsAndRowsStayAligned) {
    DataTable table({"name", "qty"});
    table.appendRow({text("a"), integer(1)});
    table.appendRow({text("b"), integer(2)});
    EXPECT_EQ(table.rowCount(), 2u);
    EXPECT_EQ(table.colCount(), 2u);

    table.addColumn("flag", {CellValue{true}, CellValue{}});
    EXPECT_EQ(table.findColumnIndex("flag"), 2);
    EXPECT_EQ(table.findColumnIndex("nope"), -1);

    EXPECT_THROW(table.addColumn("qty", {integer(1), integer(2)}), Tally::InvalidInputException);
    EXPECT_THROW(table.addColumn("short", {integer(1)}), Tally::InvalidInputException);
    EXPECT_THROW(table.appendRow({text("c")}), Tally::InvalidInputException);
}

TEST(DataTableTest, RequireColumnListsAvailableNames) {
    DataTable table({"region", "qty"});
    try {
        table.requireColumn("store");
        FAIL() << "expected InvalidInputException";
    } catch (const Tally::InvalidInputException& e) {
        const std::string message = e.what();
        EXPECT_NE(message.find("store"), std::string::npos);
        EXPECT_NE(message.find("region"), std::string::npos);
    }
}

TEST(DataTableTest, RemoveAndReorderRows) {
    DataTable table({"k"});
    for (int64_t v : {1, 2, 3, 4}) table.appendRow({integer(v)});

    table.removeRows({1, 0, 1, 0});
    ASSERT_EQ(table.rowCount(), 2u);
    EXPECT_EQ(std::get<int64_t>(table.at(1, 0)), 3);

    table.reorderRows({1, 0});
    EXPECT_EQ(std::get<int64_t>(table.at(0, 0)), 3);

    EXPECT_THROW(table.removeRows({1}), Tally::InvalidInputException);
}

TEST(DataTableTest, RoundFloatingLeavesOtherKindsAlone) {
    DataTable table({"x", "y"});
    table.appendRow({CellValue{3.14159}, integer(7)});
    table.roundFloating(2);
    EXPECT_DOUBLE_EQ(std::get<double>(table.at(0, 0)), 3.14);
    EXPECT_EQ(std::get<int64_t>(table.at(0, 1)), 7);
}

TEST(DataTableTest, RoundingTwiceMatchesRoundingOnce) {
    const std::vector<double> sweep = {1.005, 2.675, -0.125, 0.125, 1e12 + 0.015, -2.5e-3, 0.1 + 0.2,
                                       123.455, -987.654321, 0.0049999};
    for (double x : sweep) {
        const double once = CommonUtils::roundTo(x, 2);
        EXPECT_EQ(CommonUtils::roundTo(once, 2), once) << x;
    }

    DataTable table({"ratio", "qty"});
    for (double x : sweep) table.appendRow({CellValue{x}, integer(3)});
    table.roundFloating(2);
    DataTable again = table;
    again.roundFloating(2);
    for (size_t row = 0; row < table.rowCount(); ++row) {
        EXPECT_EQ(std::get<double>(again.at(row, 0)), std::get<double>(table.at(row, 0))) << row;
        EXPECT_EQ(std::get<int64_t>(again.at(row, 1)), 3);
    }
}

TEST(CellUtilsTest, KeysNormalizeEquivalentValues) {
    EXPECT_EQ(CellUtils::toKey(integer(1)), "1");
    EXPECT_EQ(CellUtils::toKey(CellValue{1.0}), "1");
    EXPECT_EQ(CellUtils::toKey(text(" a ")), "a");
    EXPECT_EQ(CellUtils::toKey(CellValue{true}), "true");
    EXPECT_EQ(CellUtils::toKey(CellValue{CivilDate{0}}), "1970-01-01");
    EXPECT_EQ(CellUtils::toKey(CellValue{}), "");
}

TEST(CellUtilsTest, NumericAndBooleanViews) {
    EXPECT_DOUBLE_EQ(*CellUtils::toNumber(text("$1,200")), 1200.0);
    EXPECT_DOUBLE_EQ(*CellUtils::toNumber(CellValue{false}), 0.0);
    EXPECT_FALSE(CellUtils::toNumber(CellValue{CivilDate{5}}).has_value());
    EXPECT_FALSE(CellUtils::toNumber(text("north")).has_value());

    EXPECT_EQ(CellUtils::toBoolean(text("yes")), std::optional<bool>(true));
    EXPECT_EQ(CellUtils::toBoolean(text("2")), std::optional<bool>(true));
    EXPECT_EQ(CellUtils::toBoolean(integer(0)), std::optional<bool>(false));
    EXPECT_FALSE(CellUtils::toBoolean(text("north")).has_value());
}

TEST(CellUtilsTest, CompareOrdersNumbersDatesThenText) {
    EXPECT_LT(CellUtils::compare(integer(2), CellValue{2.5}), 0);
    EXPECT_LT(CellUtils::compare(CellValue{100.0}, CellValue{CivilDate{0}}), 0);
    EXPECT_LT(CellUtils::compare(CellValue{CivilDate{0}}, text("a")), 0);
    EXPECT_LT(CellUtils::compare(text("apple"), text("Banana")), 0);
    EXPECT_EQ(CellUtils::compare(integer(3), CellValue{3.0}), 0);
    EXPECT_GT(CellUtils::compare(CellValue{}, text("z")), 0);
}

TEST(CellUtilsTest, DisplayRoundsReals) {
    EXPECT_EQ(CellUtils::toDisplay(CellValue{3.14159}), "3.14");
    EXPECT_EQ(CellUtils::toDisplay(CellValue{2.0}), "2");
    EXPECT_EQ(CellUtils::toDisplay(text(" keep ")), " keep ");
}
