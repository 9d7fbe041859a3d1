#include "TableIO.h"
#include "CommonUtils.h"
#include "TallyExceptions.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>

#ifdef TALLY_USE_NATIVE_PARQUET
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace {
enum class InferredType { INTEGER, REAL, FORMATTED_REAL, BOOLEAN, DATE, TEXT };

bool parsePlainReal(const std::string& raw, double& out) {
    const std::string s = CommonUtils::trim(raw);
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || errno == ERANGE || !std::isfinite(value)) return false;
    out = value;
    return true;
}

bool parseTrueFalse(const std::string& raw, bool& out) {
    const std::string s = CommonUtils::toLower(CommonUtils::trim(raw));
    if (s == "true") {
        out = true;
        return true;
    }
    if (s == "false") {
        out = false;
        return true;
    }
    return false;
}

InferredType inferColumnType(const std::vector<std::string>& raw, const TableIO::ReadOptions& options) {
    const auto hint = options.dateHint;
    const bool explicitLocale = options.numericPolicy != ValueParser::NumericSeparatorPolicy::AUTO;
    bool allFormatted = explicitLocale;
    bool allInt = true;
    bool allReal = true;
    bool allBool = true;
    bool allDate = true;
    size_t present = 0;

    for (const auto& value : raw) {
        if (ValueParser::isMissingToken(value)) continue;
        ++present;
        long long i = 0;
        double d = 0.0;
        bool b = false;
        CivilDate date;
        if (allInt && !ValueParser::parseInteger(value, i)) allInt = false;
        if (allReal && !parsePlainReal(value, d)) allReal = false;
        if (allBool && !parseTrueFalse(value, b)) allBool = false;
        if (allDate && !DateUtils::parseDate(value, date, hint)) allDate = false;
        if (allFormatted && !ValueParser::parseNumber(value, d, options.numericPolicy)) allFormatted = false;
        if (!allInt && !allReal && !allBool && !allDate && !allFormatted) return InferredType::TEXT;
    }

    if (present == 0) return InferredType::TEXT;
    if (allInt) return InferredType::INTEGER;
    if (allReal) return InferredType::REAL;
    if (allBool) return InferredType::BOOLEAN;
    if (allDate) return InferredType::DATE;
    if (allFormatted) return InferredType::FORMATTED_REAL;
    return InferredType::TEXT;
}

CellValue convertCell(const std::string& value, InferredType type, const TableIO::ReadOptions& options) {
    if (ValueParser::isMissingToken(value)) return CellValue{};
    switch (type) {
        case InferredType::INTEGER: {
            long long i = 0;
            ValueParser::parseInteger(value, i);
            return CellValue{static_cast<int64_t>(i)};
        }
        case InferredType::REAL: {
            double d = 0.0;
            parsePlainReal(value, d);
            return CellValue{d};
        }
        case InferredType::FORMATTED_REAL: {
            double d = 0.0;
            ValueParser::parseNumber(value, d, options.numericPolicy);
            return CellValue{d};
        }
        case InferredType::BOOLEAN: {
            bool b = false;
            parseTrueFalse(value, b);
            return CellValue{b};
        }
        case InferredType::DATE: {
            CivilDate date;
            DateUtils::parseDate(value, date, options.dateHint);
            return CellValue{date};
        }
        case InferredType::TEXT:
            break;
    }
    return CellValue{value};
}

bool allExtraFieldsEmpty(const std::vector<std::string>& row, size_t width) {
    for (size_t i = width; i < row.size(); ++i) {
        if (!CommonUtils::trim(row[i]).empty()) return false;
    }
    return true;
}

#ifdef TALLY_USE_NATIVE_PARQUET
enum class ParquetKind { INT64, FLOAT64, BOOL, DATE32, UTF8 };

ParquetKind parquetKindOf(const TableColumn& column) {
    bool allInt = true;
    bool allNumeric = true;
    bool allBool = true;
    bool allDate = true;
    for (const auto& cell : column.cells) {
        const CellKind kind = CellUtils::kindOf(cell);
        if (kind == CellKind::MISSING) continue;
        allInt = allInt && kind == CellKind::INTEGER;
        allNumeric = allNumeric && (kind == CellKind::INTEGER || kind == CellKind::REAL);
        allBool = allBool && kind == CellKind::BOOLEAN;
        allDate = allDate && kind == CellKind::DATE;
    }
    if (allInt) return ParquetKind::INT64;
    if (allNumeric) return ParquetKind::FLOAT64;
    if (allBool) return ParquetKind::BOOL;
    if (allDate) return ParquetKind::DATE32;
    return ParquetKind::UTF8;
}

template <typename Builder, typename AppendFn>
std::shared_ptr<arrow::Array> buildArray(const TableColumn& column, AppendFn appendValue) {
    Builder builder;
    for (const auto& cell : column.cells) {
        arrow::Status status;
        if (CellUtils::isMissing(cell)) {
            status = builder.AppendNull();
        } else {
            status = appendValue(builder, cell);
        }
        if (!status.ok()) {
            throw Tally::IOException("Failed to append value for parquet column '" + column.name + "': " + status.ToString());
        }
    }
    std::shared_ptr<arrow::Array> arr;
    const auto status = builder.Finish(&arr);
    if (!status.ok()) {
        throw Tally::IOException("Failed to finalize Arrow array for column '" + column.name + "': " + status.ToString());
    }
    return arr;
}
#endif
} // namespace

namespace TableIO {

LoadedTable readCsv(std::istream& in, const ReadOptions& options, const std::string& sourceName) {
    CSVUtils::skipBOM(in);

    std::vector<std::string> header;
    CSVUtils::RecordStatus status;
    bool haveHeader = false;
    size_t lineNumber = 0;
    while (CSVUtils::readRecord(in, options.delimiter, header, &status, options.limits)) {
        lineNumber += std::max<size_t>(status.physicalLines, 1);
        if (!header.empty()) {
            haveHeader = true;
            break;
        }
    }
    if (!haveHeader || status.malformed) {
        throw Tally::IOException("Malformed or empty CSV header in " + sourceName);
    }
    header = CSVUtils::normalizeHeader(header);
    const size_t width = header.size();

    LoadedTable loaded;
    std::vector<std::vector<std::string>> raw(width);
    std::vector<std::string> row;
    size_t rowCount = 0;

    while (CSVUtils::readRecord(in, options.delimiter, row, &status, options.limits)) {
        const size_t recordLine = lineNumber + 1;
        lineNumber += std::max<size_t>(status.physicalLines, 1);
        if (row.empty()) continue;

        if (status.malformed || status.limitExceeded) {
            ++loaded.skippedRows;
            continue;
        }
        if (row.size() > width) {
            if (!allExtraFieldsEmpty(row, width)) {
                ++loaded.skippedRows;
                if (loaded.skippedRows <= 3) {
                    loaded.warnings.push_back("Skipped row at line " + std::to_string(recordLine) + ": expected " +
                                              std::to_string(width) + " fields, found " + std::to_string(row.size()));
                }
                continue;
            }
            row.resize(width);
        } else if (row.size() < width) {
            row.resize(width);
            ++loaded.paddedRows;
        }

        ++rowCount;
        if (options.maxRows > 0 && rowCount > options.maxRows) {
            throw Tally::InvalidInputException("Dataset " + sourceName + " exceeds the row limit of " +
                                               std::to_string(options.maxRows) + " rows");
        }
        for (size_t c = 0; c < width; ++c) raw[c].push_back(std::move(row[c]));
    }

    if (loaded.skippedRows > 0) {
        loaded.warnings.push_back("Skipped " + std::to_string(loaded.skippedRows) + " malformed row(s)");
    }
    if (loaded.paddedRows > 0) {
        loaded.warnings.push_back("Filled missing trailing fields in " + std::to_string(loaded.paddedRows) + " short row(s)");
    }

    for (size_t c = 0; c < width; ++c) {
        const InferredType type = inferColumnType(raw[c], options);
        std::vector<CellValue> cells;
        cells.reserve(raw[c].size());
        for (const auto& value : raw[c]) cells.push_back(convertCell(value, type, options));
        loaded.table.addColumn(header[c], std::move(cells));
        std::vector<std::string>().swap(raw[c]);
    }
    return loaded;
}

LoadedTable readCsv(const std::string& path, const ReadOptions& options) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Tally::IOException("Could not open dataset file: " + path);
    return readCsv(in, options, path);
}

void writeCsv(const DataTable& table, std::ostream& out, char delimiter, int decimals) {
    const auto& columns = table.columns();
    for (size_t c = 0; c < columns.size(); ++c) {
        if (c > 0) out << delimiter;
        out << CSVUtils::escapeField(columns[c].name, delimiter);
    }
    out << "\n";
    for (size_t r = 0; r < table.rowCount(); ++r) {
        for (size_t c = 0; c < columns.size(); ++c) {
            if (c > 0) out << delimiter;
            const CellValue& cell = table.at(r, c);
            if (!CellUtils::isMissing(cell)) out << CSVUtils::escapeField(CellUtils::toDisplay(cell, decimals), delimiter);
        }
        out << "\n";
    }
}

void writeCsv(const DataTable& table, const std::string& path, char delimiter, int decimals) {
    std::ofstream out(path);
    if (!out) throw Tally::IOException("Failed to open output file: " + path);
    writeCsv(table, out, delimiter, decimals);
    if (!out.good()) throw Tally::IOException("Failed while writing output file: " + path);
}

bool parquetSupported() noexcept {
#ifdef TALLY_USE_NATIVE_PARQUET
    return true;
#else
    return false;
#endif
}

void writeParquet(const DataTable& table, const std::string& path, int decimals) {
#ifdef TALLY_USE_NATIVE_PARQUET
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    fields.reserve(table.colCount());
    arrays.reserve(table.colCount());

    for (const auto& column : table.columns()) {
        switch (parquetKindOf(column)) {
            case ParquetKind::INT64:
                arrays.push_back(buildArray<arrow::Int64Builder>(column, [](arrow::Int64Builder& b, const CellValue& v) {
                    return b.Append(std::get<int64_t>(v));
                }));
                fields.push_back(arrow::field(column.name, arrow::int64(), true));
                break;
            case ParquetKind::FLOAT64:
                arrays.push_back(buildArray<arrow::DoubleBuilder>(column, [decimals](arrow::DoubleBuilder& b, const CellValue& v) {
                    const double d = CellUtils::toNumber(v).value_or(std::nan(""));
                    if (!std::isfinite(d)) return b.AppendNull();
                    return b.Append(CommonUtils::roundTo(d, decimals));
                }));
                fields.push_back(arrow::field(column.name, arrow::float64(), true));
                break;
            case ParquetKind::BOOL:
                arrays.push_back(buildArray<arrow::BooleanBuilder>(column, [](arrow::BooleanBuilder& b, const CellValue& v) {
                    return b.Append(std::get<bool>(v));
                }));
                fields.push_back(arrow::field(column.name, arrow::boolean(), true));
                break;
            case ParquetKind::DATE32:
                arrays.push_back(buildArray<arrow::Date32Builder>(column, [](arrow::Date32Builder& b, const CellValue& v) {
                    return b.Append(static_cast<int32_t>(std::get<CivilDate>(v).days));
                }));
                fields.push_back(arrow::field(column.name, arrow::date32(), true));
                break;
            case ParquetKind::UTF8:
                arrays.push_back(buildArray<arrow::StringBuilder>(column, [decimals](arrow::StringBuilder& b, const CellValue& v) {
                    return b.Append(CellUtils::toDisplay(v, decimals));
                }));
                fields.push_back(arrow::field(column.name, arrow::utf8(), true));
                break;
        }
    }

    auto schema = std::make_shared<arrow::Schema>(fields);
    auto arrowTable = arrow::Table::Make(schema, arrays, static_cast<int64_t>(table.rowCount()));

    auto outRes = arrow::io::FileOutputStream::Open(path);
    if (!outRes.ok()) {
        throw Tally::IOException("Failed to open parquet output path: " + outRes.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> sink = outRes.ValueOrDie();

    const int64_t chunkRows = std::max<int64_t>(1, std::min<int64_t>(65536, static_cast<int64_t>(table.rowCount())));
    auto writeStatus = parquet::arrow::WriteTable(*arrowTable, arrow::default_memory_pool(), sink, chunkRows);
    if (!writeStatus.ok()) {
        throw Tally::IOException("Parquet write failed: " + writeStatus.ToString());
    }
    auto closeStatus = sink->Close();
    if (!closeStatus.ok()) {
        throw Tally::IOException("Failed to close parquet output stream: " + closeStatus.ToString());
    }
#else
    (void)table;
    (void)decimals;
    throw Tally::IOException("Parquet output requested for " + path +
                             ", but this build was compiled without native parquet support. "
                             "Rebuild with Arrow/Parquet libraries enabled or choose csv/json output.");
#endif
}

} // namespace TableIO
