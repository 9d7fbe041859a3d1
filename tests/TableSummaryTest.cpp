#include <gtest/gtest.h>

#include "TableSummary.h"

#include <string>

namespace {
DataTable inventory() {
    DataTable table({"qty", "amount", "region"});
    table.appendRow({CellValue{int64_t{10}}, CellValue{1.0}, CellValue{std::string("n")}});
    table.appendRow({CellValue{int64_t{20}}, CellValue{2.0}, CellValue{std::string("s")}});
    table.appendRow({CellValue{}, CellValue{2.0}, CellValue{std::string("n")}});
    table.appendRow({CellValue{int64_t{30}}, CellValue{}, CellValue{std::string("n")}});
    return table;
}
} // namespace

TEST(TableSummaryTest, NumericColumnsGetRoundedStatistics) {
    const TableProfile profile = TableSummary::summarize(inventory());
    ASSERT_EQ(profile.rowCount, 4u);
    ASSERT_EQ(profile.columns.size(), 3u);

    const ColumnProfile& qty = profile.columns[0];
    EXPECT_EQ(qty.role, ColumnRole::NUMERIC);
    EXPECT_EQ(qty.nonMissing, 3u);
    EXPECT_EQ(qty.missing, 1u);
    EXPECT_EQ(qty.distinct, 3u);
    ASSERT_TRUE(qty.numeric.has_value());
    EXPECT_DOUBLE_EQ(qty.numeric->mean, 20.0);
    EXPECT_DOUBLE_EQ(qty.numeric->median, 20.0);
    EXPECT_DOUBLE_EQ(qty.numeric->min, 10.0);
    EXPECT_DOUBLE_EQ(qty.numeric->max, 30.0);

    const ColumnProfile& amount = profile.columns[1];
    EXPECT_EQ(amount.role, ColumnRole::MONETARY);
    ASSERT_TRUE(amount.numeric.has_value());
    EXPECT_DOUBLE_EQ(amount.numeric->mean, 1.67);
    EXPECT_DOUBLE_EQ(amount.numeric->mode, 2.0);
}

TEST(TableSummaryTest, TextColumnsReportMostFrequentValue) {
    const TableProfile profile = TableSummary::summarize(inventory());
    const ColumnProfile& region = profile.columns[2];
    EXPECT_EQ(region.role, ColumnRole::TEXT);
    EXPECT_FALSE(region.numeric.has_value());
    EXPECT_EQ(region.distinct, 2u);
    EXPECT_EQ(region.topValue, "n");
    EXPECT_EQ(region.topCount, 3u);
}

TEST(TableSummaryTest, DecimalsFollowTuning) {
    EngineTuning tuning;
    tuning.outputDecimals = 0;
    const TableProfile profile = TableSummary::summarize(inventory(), tuning);
    EXPECT_DOUBLE_EQ(profile.columns[1].numeric->mean, 2.0);
}
