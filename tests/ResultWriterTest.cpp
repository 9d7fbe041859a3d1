#include <gtest/gtest.h>

#include "ResultWriter.h"
#include "TallyExceptions.h"

#include <cmath>
#include <fstream>
#include <sstream>
#include <string>

namespace {
bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

DataTable quantities() {
    DataTable table({"id", "qty"});
    table.appendRow({CellValue{std::string("A")}, CellValue{int64_t{10}}});
    table.appendRow({CellValue{std::string("A")}, CellValue{int64_t{5}}});
    table.appendRow({CellValue{std::string("B")}, CellValue{int64_t{7}}});
    return table;
}
} // namespace

TEST(ResultWriterTest, EscapesJsonStrings) {
    EXPECT_EQ(ResultWriter::escapeJsonString("a\"b\\c\n"), "a\\\"b\\\\c\\n");
    EXPECT_EQ(ResultWriter::escapeJsonString(std::string("\x01")), "\\u0001");
}

TEST(ResultWriterTest, CellLiterals) {
    EXPECT_EQ(ResultWriter::cellJson(CellValue{}), "null");
    EXPECT_EQ(ResultWriter::cellJson(CellValue{true}), "true");
    EXPECT_EQ(ResultWriter::cellJson(CellValue{int64_t{42}}), "42");
    EXPECT_EQ(ResultWriter::cellJson(CellValue{3.14159}), "3.14");
    EXPECT_EQ(ResultWriter::cellJson(CellValue{std::string("x\"y")}), "\"x\\\"y\"");
    EXPECT_EQ(ResultWriter::cellJson(CellValue{CivilDate{0}}), "\"1970-01-01\"");
    EXPECT_EQ(ResultWriter::numberJson(std::nan("")), "null");
    EXPECT_EQ(ResultWriter::numberJson(2.0), "2");
}

TEST(ResultWriterTest, AggregateDocumentCarriesCountsSpecsAndRows) {
    AggregateRequest request;
    request.groupBy = "id";
    const std::string json = ResultWriter::aggregateJson(GroupAggregator::aggregate(quantities(), request));
    EXPECT_TRUE(contains(json, "\"rows_before\": 3"));
    EXPECT_TRUE(contains(json, "\"rows_after\": 2"));
    EXPECT_TRUE(contains(json, "\"function\": \"sum\""));
    EXPECT_TRUE(contains(json, "{ \"id\": \"A\", \"qty (Sum)\": 15 }"));
    EXPECT_TRUE(contains(json, "\"warnings\": []"));
}

TEST(ResultWriterTest, DetectDocumentListsRecordsAndStatistics) {
    DataTable table;
    std::vector<CellValue> cells;
    for (int64_t v : {1, 2, 3, 4, 5, 100}) cells.push_back(CellValue{v});
    table.addColumn("value", std::move(cells));

    const DetectResult result = OutlierEngine::detect(table, DetectRequest{"value", "iqr", std::nullopt});
    const std::string json = ResultWriter::detectJson(result);
    EXPECT_TRUE(contains(json, "\"total_outliers\": 1"));
    EXPECT_TRUE(contains(json, "\"outliers_by_column\": {\"value\": 1}"));
    EXPECT_TRUE(contains(json, "\"row_index\": 5"));
    EXPECT_TRUE(contains(json, "\"upper_bound\": 8.5"));
    EXPECT_TRUE(contains(json, "\"score\": null"));

    const DataTable flat = ResultWriter::outlierTable(result);
    ASSERT_EQ(flat.rowCount(), 1u);
    EXPECT_EQ(flat.colCount(), 7u);
    EXPECT_EQ(std::get<int64_t>(flat.at(0, 0)), 5);
    EXPECT_TRUE(CellUtils::isMissing(flat.at(0, 6)));
}

TEST(ResultWriterTest, EmptyRowsRenderAsEmptyArray) {
    std::ostringstream out;
    ResultWriter::writeRowsJson(out, DataTable({"a"}), 2, "");
    EXPECT_EQ(out.str(), "[]");
}

TEST(ResultWriterTest, FormatResolution) {
    EXPECT_EQ(ResultWriter::resolveFormat("", "out/Result.CSV"), "csv");
    EXPECT_EQ(ResultWriter::resolveFormat("", "result.parquet"), "parquet");
    EXPECT_EQ(ResultWriter::resolveFormat("", "result.json"), "json");
    EXPECT_EQ(ResultWriter::resolveFormat("", ""), "json");
    EXPECT_EQ(ResultWriter::resolveFormat("CSV", "result.json"), "csv");
}

TEST(ResultWriterTest, WritesTablesAndRejectsUnknownFormats) {
    const std::string path = ::testing::TempDir() + "tally_result.csv";
    ResultWriter::writeTable(quantities(), path, "csv");
    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str(), "id,qty\nA,10\nA,5\nB,7\n");

    EXPECT_THROW(ResultWriter::writeTable(quantities(), path, "xlsx"), Tally::IOException);
    EXPECT_THROW(ResultWriter::writeText("/nonexistent/tally/out.json", "{}"), Tally::IOException);
}
