#include <gtest/gtest.h>

#include "AggregationKernel.h"

#include <string>
#include <vector>

namespace {
std::vector<CellValue> ints(std::initializer_list<int64_t> values) {
    std::vector<CellValue> out;
    for (int64_t v : values) out.push_back(CellValue{v});
    return out;
}

std::vector<CellValue> reals(std::initializer_list<double> values) {
    std::vector<CellValue> out;
    for (double v : values) out.push_back(CellValue{v});
    return out;
}
} // namespace

TEST(AggregationKernelTest, SumKeepsIntegersExact) {
    const CellValue out = AggregationKernel::apply(AggregationFunction::SUM, ints({10, 5, 7}));
    ASSERT_EQ(CellUtils::kindOf(out), CellKind::INTEGER);
    EXPECT_EQ(std::get<int64_t>(out), 22);
}

TEST(AggregationKernelTest, SumOfRealsIsRounded) {
    const CellValue out = AggregationKernel::apply(AggregationFunction::SUM, reals({0.25, 0.5, 1.125}));
    ASSERT_EQ(CellUtils::kindOf(out), CellKind::REAL);
    EXPECT_DOUBLE_EQ(std::get<double>(out), 1.88);
}

TEST(AggregationKernelTest, SumOfEmptyGroupIsZero) {
    const std::vector<CellValue> cells = {CellValue{}, CellValue{}};
    const CellValue out = AggregationKernel::apply(AggregationFunction::SUM, cells);
    ASSERT_EQ(CellUtils::kindOf(out), CellKind::INTEGER);
    EXPECT_EQ(std::get<int64_t>(out), 0);
}

TEST(AggregationKernelTest, MissingCellsAreIgnored) {
    std::vector<CellValue> cells = ints({4, 8});
    cells.push_back(CellValue{});
    EXPECT_EQ(std::get<int64_t>(AggregationKernel::apply(AggregationFunction::COUNT, cells)), 2);
    EXPECT_DOUBLE_EQ(std::get<double>(AggregationKernel::apply(AggregationFunction::MEAN, cells)), 6.0);
}

TEST(AggregationKernelTest, CountDistinctUsesNormalizedKeys) {
    const std::vector<CellValue> cells = {CellValue{int64_t{1}}, CellValue{1.0}, CellValue{int64_t{2}},
                                          CellValue{std::string("3")}, CellValue{}};
    const CellValue out = AggregationKernel::apply(AggregationFunction::COUNT_DISTINCT, cells);
    EXPECT_EQ(std::get<int64_t>(out), 3);
}

TEST(AggregationKernelTest, MeanAndMedianOfEmptyGroupAreMissing) {
    const std::vector<CellValue> cells = {CellValue{}};
    EXPECT_TRUE(CellUtils::isMissing(AggregationKernel::apply(AggregationFunction::MEAN, cells)));
    EXPECT_TRUE(CellUtils::isMissing(AggregationKernel::apply(AggregationFunction::MEDIAN, cells)));
    EXPECT_TRUE(CellUtils::isMissing(AggregationKernel::apply(AggregationFunction::P95, cells)));
}

TEST(AggregationKernelTest, StdNeedsTwoValues) {
    EXPECT_TRUE(CellUtils::isMissing(AggregationKernel::apply(AggregationFunction::STD, ints({5}))));
    const CellValue var = AggregationKernel::apply(AggregationFunction::VAR, ints({2, 4, 6}));
    EXPECT_DOUBLE_EQ(std::get<double>(var), 4.0);
}

TEST(AggregationKernelTest, PercentilesInterpolateLinearly) {
    const CellValue p90 = AggregationKernel::apply(AggregationFunction::P90, ints({1, 2, 3, 4, 5, 6, 7, 8, 9, 10}));
    EXPECT_DOUBLE_EQ(std::get<double>(p90), 9.1);
}

TEST(AggregationKernelTest, MinMaxPreserveKinds) {
    const CellValue maxInt = AggregationKernel::apply(AggregationFunction::MAX, ints({3, 9, 1}));
    ASSERT_EQ(CellUtils::kindOf(maxInt), CellKind::INTEGER);
    EXPECT_EQ(std::get<int64_t>(maxInt), 9);

    const std::vector<CellValue> dates = {CellValue{CivilDate{100}}, CellValue{CivilDate{50}}, CellValue{}};
    const CellValue minDate = AggregationKernel::apply(AggregationFunction::MIN, dates);
    ASSERT_EQ(CellUtils::kindOf(minDate), CellKind::DATE);
    EXPECT_EQ(std::get<CivilDate>(minDate).days, 50);
}

TEST(AggregationKernelTest, AnyAndAllFollowTruthiness) {
    const std::vector<CellValue> flags = {CellValue{false}, CellValue{true}, CellValue{}};
    EXPECT_TRUE(std::get<bool>(AggregationKernel::apply(AggregationFunction::ANY, flags)));
    EXPECT_FALSE(std::get<bool>(AggregationKernel::apply(AggregationFunction::ALL, flags)));
    EXPECT_TRUE(std::get<bool>(AggregationKernel::apply(AggregationFunction::ALL, std::vector<CellValue>{})));
}

TEST(AggregationKernelTest, GatherPicksRowsInOrder) {
    const std::vector<CellValue> column = ints({10, 20, 30, 40});
    const auto picked = AggregationKernel::gather(column, {3, 1});
    ASSERT_EQ(picked.size(), 2u);
    EXPECT_EQ(std::get<int64_t>(picked[0]), 40);
    EXPECT_EQ(std::get<int64_t>(picked[1]), 20);
}
