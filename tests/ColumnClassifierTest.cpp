#include <gtest/gtest.h>

#include "ColumnClassifier.h"

#include <string>
#include <vector>

namespace {
std::vector<CellValue> texts(std::initializer_list<const char*> values) {
    std::vector<CellValue> out;
    for (const char* v : values) out.push_back(CellValue{std::string(v)});
    return out;
}

std::vector<CellValue> ints(std::initializer_list<int64_t> values) {
    std::vector<CellValue> out;
    for (int64_t v : values) out.push_back(CellValue{v});
    return out;
}
} // namespace

TEST(ColumnClassifierTest, IdentifierNamesWinRegardlessOfValues) {
    EXPECT_EQ(ColumnClassifier::classify("customer_id", ints({1, 1, 2, 3})), ColumnRole::IDENTIFIER);
    EXPECT_EQ(ColumnClassifier::classify("Order ID", ints({10, 11})), ColumnRole::IDENTIFIER);
    EXPECT_EQ(ColumnClassifier::classify("uuid", texts({"a-1", "b-2"})), ColumnRole::IDENTIFIER);
    EXPECT_FALSE(ColumnClassifier::isIdentifierName("idle_minutes"));
}

TEST(ColumnClassifierTest, DateByNameOrValues) {
    EXPECT_EQ(ColumnClassifier::classify("order_date", texts({"x", "y"})), ColumnRole::DATE);
    EXPECT_EQ(ColumnClassifier::classify("created_at", texts({"2024-01-02"})), ColumnRole::DATE);
    EXPECT_EQ(ColumnClassifier::classify("when", texts({"2024-01-02", "2024-02-03", "Apr-23"})), ColumnRole::DATE);

    const std::vector<CellValue> native = {CellValue{CivilDate{19000}}, CellValue{CivilDate{19001}}};
    EXPECT_EQ(ColumnClassifier::classify("shipped", native), ColumnRole::DATE);
}

TEST(ColumnClassifierTest, DurationNamesAreNotDates) {
    EXPECT_FALSE(ColumnClassifier::isDateName("time_spent"));
    EXPECT_FALSE(ColumnClassifier::isDateName("response_time_ms"));
    EXPECT_EQ(ColumnClassifier::classify("response_time_ms", ints({120, 340, 95})), ColumnRole::NUMERIC);
}

TEST(ColumnClassifierTest, BooleanByNameOrValues) {
    EXPECT_EQ(ColumnClassifier::classify("is_active", ints({0, 1, 1})), ColumnRole::BOOLEAN);
    EXPECT_EQ(ColumnClassifier::classify("churned", texts({"yes", "no", "Yes"})), ColumnRole::BOOLEAN);
    EXPECT_EQ(ColumnClassifier::classify("fraud_flag", texts({"a", "b", "c"})), ColumnRole::BOOLEAN);

    const std::vector<CellValue> native = {CellValue{true}, CellValue{false}, CellValue{}};
    EXPECT_EQ(ColumnClassifier::classify("subscribed", native), ColumnRole::BOOLEAN);
}

TEST(ColumnClassifierTest, MonetaryRateAndDerivedNeedNumbers) {
    EXPECT_EQ(ColumnClassifier::classify("unit_price", texts({"$1,200.50", "$99", "$4"})), ColumnRole::MONETARY);
    EXPECT_EQ(ColumnClassifier::classify("sales", ints({100, 50, 75})), ColumnRole::MONETARY);
    EXPECT_EQ(ColumnClassifier::classify("conversion_rate", texts({"12%", "8%", "15%"})), ColumnRole::RATE);
    EXPECT_EQ(ColumnClassifier::classify("avg_rating", ints({3, 4, 5})), ColumnRole::DERIVED);
    EXPECT_EQ(ColumnClassifier::classify("price", texts({"cheap", "dear", "free"})), ColumnRole::TEXT);
}

TEST(ColumnClassifierTest, SummaryWordAloneNeedsBaseQuantitySibling) {
    const std::vector<CellValue> values = ints({10, 20, 30});
    EXPECT_EQ(ColumnClassifier::classify("average", values, {"average", "qty"}), ColumnRole::DERIVED);
    EXPECT_EQ(ColumnClassifier::classify("average", values, {"average", "region"}), ColumnRole::NUMERIC);
}

TEST(ColumnClassifierTest, PlainNumbersAndText) {
    EXPECT_EQ(ColumnClassifier::classify("qty", ints({10, 5, 7})), ColumnRole::NUMERIC);
    EXPECT_EQ(ColumnClassifier::classify("region", texts({"north", "south", "east"})), ColumnRole::TEXT);
    EXPECT_EQ(ColumnClassifier::classify("empty", std::vector<CellValue>{CellValue{}, CellValue{}}), ColumnRole::TEXT);
}

TEST(ColumnClassifierTest, NumericShareThresholdIsTunable) {
    const std::vector<CellValue> mixed = texts({"1", "2", "3", "n/a value", "x"});
    EXPECT_EQ(ColumnClassifier::classify("reading", mixed), ColumnRole::TEXT);

    EngineTuning loose;
    loose.numericRatioThreshold = 0.6;
    EXPECT_EQ(ColumnClassifier::classify("reading", mixed, {}, loose), ColumnRole::NUMERIC);
}

TEST(ColumnClassifierTest, ClassifyTableKeepsColumnOrder) {
    DataTable table;
    table.addColumn("customer_id", ints({1, 2}));
    table.addColumn("region", texts({"n", "s"}));
    table.addColumn("amount", ints({5, 6}));

    const auto roles = ColumnClassifier::classifyTable(table);
    ASSERT_EQ(roles.size(), 3u);
    EXPECT_EQ(roles[0].first, "customer_id");
    EXPECT_EQ(roles[0].second, ColumnRole::IDENTIFIER);
    EXPECT_EQ(roles[1].second, ColumnRole::TEXT);
    EXPECT_EQ(roles[2].second, ColumnRole::MONETARY);
}

TEST(ColumnClassifierTest, RoleNames) {
    EXPECT_EQ(roleName(ColumnRole::IDENTIFIER), "identifier");
    EXPECT_EQ(roleName(ColumnRole::DERIVED), "derived");
    EXPECT_TRUE(isQuantitativeRole(ColumnRole::RATE));
    EXPECT_FALSE(isQuantitativeRole(ColumnRole::BOOLEAN));
}
