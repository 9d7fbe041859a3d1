#include <gtest/gtest.h>

#include "AggregationSelector.h"
#include "TallyExceptions.h"

TEST(AggregationSelectorTest, NumericDefaultsToSumWithSumLabel) {
    const AggregationSpec spec = AggregationSelector::select("qty", ColumnRole::NUMERIC, std::nullopt, "");
    EXPECT_TRUE(spec.included);
    EXPECT_EQ(spec.function, AggregationFunction::SUM);
    EXPECT_EQ(spec.label, "qty (Sum)");
}

TEST(AggregationSelectorTest, IntentPicksFunctionFamily) {
    EXPECT_EQ(AggregationSelector::functionFromIntent("average price per store"), AggregationFunction::MEAN);
    EXPECT_EQ(AggregationSelector::functionFromIntent("median order value"), AggregationFunction::MEDIAN);
    EXPECT_EQ(AggregationSelector::functionFromIntent("p99 latency"), AggregationFunction::P99);
    EXPECT_EQ(AggregationSelector::functionFromIntent("top 5% of requests"), AggregationFunction::P95);
    EXPECT_EQ(AggregationSelector::functionFromIntent("top 10 percent"), AggregationFunction::P90);
    EXPECT_EQ(AggregationSelector::functionFromIntent("highest revenue"), AggregationFunction::MAX);
    EXPECT_EQ(AggregationSelector::functionFromIntent("lowest cost"), AggregationFunction::MIN);
    EXPECT_EQ(AggregationSelector::functionFromIntent("variance of sales"), AggregationFunction::VAR);
    EXPECT_EQ(AggregationSelector::functionFromIntent("volatility"), AggregationFunction::STD);
    EXPECT_FALSE(AggregationSelector::functionFromIntent("show me everything").has_value());
    EXPECT_FALSE(AggregationSelector::functionFromIntent("").has_value());
}

TEST(AggregationSelectorTest, MeanFamilyWinsOverLaterFamilies) {
    EXPECT_EQ(AggregationSelector::functionFromIntent("average of the highest values"), AggregationFunction::MEAN);
}

TEST(AggregationSelectorTest, IntentAppliesToMonetaryColumns) {
    const AggregationSpec spec = AggregationSelector::select("price", ColumnRole::MONETARY, std::nullopt, "typical price");
    EXPECT_EQ(spec.function, AggregationFunction::MEAN);
    EXPECT_EQ(spec.label, "avg_price");
}

TEST(AggregationSelectorTest, PercentileLabel) {
    const AggregationSpec spec = AggregationSelector::select("latency", ColumnRole::NUMERIC, std::string("p95"), "");
    EXPECT_EQ(spec.label, "p95_latency");
}

TEST(AggregationSelectorTest, OverrideBeatsIntent) {
    const AggregationSpec spec = AggregationSelector::select("qty", ColumnRole::NUMERIC, std::string("max"), "average");
    EXPECT_EQ(spec.function, AggregationFunction::MAX);
    EXPECT_EQ(spec.label, "max_qty");
}

TEST(AggregationSelectorTest, IdentifierSumIsReplacedWithWarning) {
    const AggregationSpec spec =
        AggregationSelector::select("customer_id", ColumnRole::IDENTIFIER, std::string("sum"), "");
    EXPECT_EQ(spec.function, AggregationFunction::COUNT_DISTINCT);
    EXPECT_EQ(spec.label, "unique_customers");
    ASSERT_EQ(spec.warnings.size(), 1u);
    EXPECT_NE(spec.warnings[0].find("count_distinct"), std::string::npos);
}

TEST(AggregationSelectorTest, IdentifierLabels) {
    EXPECT_EQ(AggregationSelector::identifierLabel("customer_id"), "unique_customers");
    EXPECT_EQ(AggregationSelector::identifierLabel("userId"), "unique_users");
    EXPECT_EQ(AggregationSelector::identifierLabel("ticket_id"), "ticket_count");
    EXPECT_EQ(AggregationSelector::identifierLabel("id"), "id_count");
}

TEST(AggregationSelectorTest, DateExcludedUnlessRequested) {
    EXPECT_FALSE(AggregationSelector::select("created_at", ColumnRole::DATE, std::nullopt, "").included);

    const AggregationSpec requested = AggregationSelector::select("created_at", ColumnRole::DATE, std::nullopt, "", true);
    EXPECT_TRUE(requested.included);
    EXPECT_EQ(requested.function, AggregationFunction::MAX);

    EXPECT_THROW(AggregationSelector::select("created_at", ColumnRole::DATE, std::string("sum"), ""),
                 Tally::InvalidInputException);
}

TEST(AggregationSelectorTest, BooleanDefaultsToAny) {
    const AggregationSpec spec = AggregationSelector::select("is_active", ColumnRole::BOOLEAN, std::nullopt, "average");
    EXPECT_EQ(spec.function, AggregationFunction::ANY);
    EXPECT_EQ(spec.label, "any_is_active");
}

TEST(AggregationSelectorTest, TextNeedsExplicitRequestAndNumbers) {
    EXPECT_FALSE(AggregationSelector::select("notes", ColumnRole::TEXT, std::nullopt, "").included);

    const AggregationSpec skipped = AggregationSelector::select("notes", ColumnRole::TEXT, std::nullopt, "", true, false);
    EXPECT_FALSE(skipped.included);
    EXPECT_EQ(skipped.warnings.size(), 1u);

    const AggregationSpec numeric = AggregationSelector::select("code", ColumnRole::TEXT, std::nullopt, "", true, true);
    EXPECT_TRUE(numeric.included);
    EXPECT_EQ(numeric.function, AggregationFunction::SUM);

    const AggregationSpec counted = AggregationSelector::select("notes", ColumnRole::TEXT, std::string("count"), "");
    EXPECT_TRUE(counted.included);
    EXPECT_EQ(counted.label, "notes (Count)");
}

TEST(AggregationSelectorTest, DerivedFallsBackToMeanWithWarning) {
    const AggregationSpec spec = AggregationSelector::select("conversion_efficiency", ColumnRole::DERIVED, std::nullopt, "");
    EXPECT_EQ(spec.function, AggregationFunction::MEAN);
    EXPECT_EQ(spec.warnings.size(), 1u);
}

TEST(AggregationSelectorTest, UnknownFunctionNameIsRejected) {
    EXPECT_THROW(parseFunctionName("geomean"), Tally::InvalidInputException);
    EXPECT_EQ(parseFunctionName(" AVG "), AggregationFunction::MEAN);
    EXPECT_EQ(parseFunctionName("nunique"), AggregationFunction::COUNT_DISTINCT);
}

TEST(AggregationSelectorTest, DuplicateLabelsGetSuffixes) {
    std::vector<AggregationSpec> specs(2);
    specs[0].label = "qty (Sum)";
    specs[1].label = "qty (Sum)";
    specs[0].column = "qty";
    specs[1].column = "Qty";
    const std::vector<std::string> warnings = AggregationSelector::deduplicateLabels(specs, {"qty (Sum)"});
    EXPECT_EQ(specs[0].label, "qty (Sum)_2");
    EXPECT_EQ(specs[1].label, "qty (Sum)_3");
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_NE(warnings[0].find("\"qty (Sum)_2\""), std::string::npos);
    EXPECT_NE(warnings[1].find("\"Qty\""), std::string::npos);
}

TEST(AggregationSelectorTest, DistinctLabelsProduceNoWarnings) {
    std::vector<AggregationSpec> specs(2);
    specs[0].label = "qty (Sum)";
    specs[1].label = "avg_price";
    EXPECT_TRUE(AggregationSelector::deduplicateLabels(specs, {"region"}).empty());
    EXPECT_EQ(specs[0].label, "qty (Sum)");
}
