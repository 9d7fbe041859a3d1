#include "ResultWriter.h"
#include "CommonUtils.h"
#include "TableIO.h"
#include "TallyExceptions.h"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace {
std::string quoted(const std::string& text) {
    return "\"" + ResultWriter::escapeJsonString(text) + "\"";
}

std::string optionalJson(const std::optional<double>& value, int decimals) {
    return value ? ResultWriter::numberJson(*value, decimals) : "null";
}

std::string stringArrayJson(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += quoted(items[i]);
    }
    return out + "]";
}

std::string countsJson(const std::vector<std::pair<std::string, size_t>>& counts) {
    std::string out = "{";
    for (size_t i = 0; i < counts.size(); ++i) {
        if (i > 0) out += ", ";
        out += quoted(counts[i].first) + ": " + std::to_string(counts[i].second);
    }
    return out + "}";
}

void writeSpecsJson(std::ostream& out, const std::vector<AggregationSpec>& specs) {
    out << "  \"aggregations\": [\n";
    for (size_t i = 0; i < specs.size(); ++i) {
        const auto& s = specs[i];
        out << "    { \"column\": " << quoted(s.column)
            << ", \"role\": " << quoted(roleName(s.role))
            << ", \"function\": " << quoted(functionName(s.function))
            << ", \"label\": " << quoted(s.label) << " }"
            << (i + 1 == specs.size() ? "" : ",") << "\n";
    }
    out << "  ],\n";
}

void writeDetectBody(std::ostream& out, const DetectResult& result, int decimals, const std::string& indent) {
    out << indent << "\"method\": " << quoted(result.method) << ",\n";
    out << indent << "\"threshold\": " << ResultWriter::numberJson(result.threshold, decimals) << ",\n";
    out << indent << "\"summary\": { \"total_outliers\": " << result.totalOutliers
        << ", \"outliers_by_column\": " << countsJson(result.outliersByColumn) << " },\n";

    out << indent << "\"statistics\": [\n";
    for (size_t i = 0; i < result.statistics.size(); ++i) {
        const auto& s = result.statistics[i];
        out << indent << "  { \"column\": " << quoted(s.column)
            << ", \"count\": " << s.count
            << ", \"mean\": " << ResultWriter::numberJson(s.mean, decimals)
            << ", \"median\": " << ResultWriter::numberJson(s.median, decimals)
            << ", \"std\": " << ResultWriter::numberJson(s.stddev, decimals)
            << ", \"q1\": " << ResultWriter::numberJson(s.q1, decimals)
            << ", \"q3\": " << ResultWriter::numberJson(s.q3, decimals)
            << ", \"iqr\": " << ResultWriter::numberJson(s.iqr, decimals)
            << ", \"min\": " << ResultWriter::numberJson(s.min, decimals)
            << ", \"max\": " << ResultWriter::numberJson(s.max, decimals)
            << ", \"lower_bound\": " << ResultWriter::numberJson(s.lowerBound, decimals)
            << ", \"upper_bound\": " << ResultWriter::numberJson(s.upperBound, decimals)
            << ", \"outlier_count\": " << s.outlierCount << " }"
            << (i + 1 == result.statistics.size() ? "" : ",") << "\n";
    }
    out << indent << "],\n";

    out << indent << "\"outliers\": [\n";
    for (size_t i = 0; i < result.outliers.size(); ++i) {
        const auto& o = result.outliers[i];
        out << indent << "  { \"row_index\": " << o.rowIndex
            << ", \"column\": " << quoted(o.column)
            << ", \"value\": " << ResultWriter::numberJson(o.value, decimals)
            << ", \"method\": " << quoted(o.method)
            << ", \"lower_bound\": " << optionalJson(o.lowerBound, decimals)
            << ", \"upper_bound\": " << optionalJson(o.upperBound, decimals)
            << ", \"score\": " << optionalJson(o.score, decimals) << " }"
            << (i + 1 == result.outliers.size() ? "" : ",") << "\n";
    }
    out << indent << "],\n";
    out << indent << "\"warnings\": " << stringArrayJson(result.warnings) << "\n";
}
} // namespace

std::string ResultWriter::escapeJsonString(const std::string& input) {
    std::string escaped;
    escaped.reserve(input.size());
    for (char ch : input) {
        switch (ch) {
            case '"': escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\b': escaped += "\\b"; break;
            case '\f': escaped += "\\f"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
                    escaped += buf;
                } else {
                    escaped += ch;
                }
                break;
        }
    }
    return escaped;
}

std::string ResultWriter::numberJson(double value, int decimals) {
    if (!std::isfinite(value)) return "null";
    return CellUtils::toDisplay(CellValue{CommonUtils::roundTo(value, decimals)}, decimals);
}

std::string ResultWriter::cellJson(const CellValue& value, int decimals) {
    switch (CellUtils::kindOf(value)) {
        case CellKind::MISSING: return "null";
        case CellKind::BOOLEAN: return std::get<bool>(value) ? "true" : "false";
        case CellKind::INTEGER: return std::to_string(std::get<int64_t>(value));
        case CellKind::REAL: return numberJson(std::get<double>(value), decimals);
        case CellKind::TEXT: return quoted(std::get<std::string>(value));
        case CellKind::DATE: return quoted(CellUtils::toKey(value));
    }
    return "null";
}

void ResultWriter::writeRowsJson(std::ostream& out, const DataTable& table, int decimals, const std::string& indent) {
    const auto& columns = table.columns();
    out << "[";
    if (table.rowCount() == 0) {
        out << "]";
        return;
    }
    out << "\n";
    for (size_t r = 0; r < table.rowCount(); ++r) {
        out << indent << "  {";
        for (size_t c = 0; c < columns.size(); ++c) {
            out << (c == 0 ? " " : ", ") << quoted(columns[c].name) << ": " << cellJson(table.at(r, c), decimals);
        }
        out << " }" << (r + 1 == table.rowCount() ? "" : ",") << "\n";
    }
    out << indent << "]";
}

std::string ResultWriter::classificationJson(const std::vector<std::pair<std::string, ColumnRole>>& roles) {
    std::ostringstream out;
    out << "{\n  \"columns\": [\n";
    for (size_t i = 0; i < roles.size(); ++i) {
        out << "    { \"name\": " << quoted(roles[i].first) << ", \"role\": " << quoted(roleName(roles[i].second)) << " }"
            << (i + 1 == roles.size() ? "" : ",") << "\n";
    }
    out << "  ]\n}\n";
    return out.str();
}

std::string ResultWriter::summaryJson(const TableProfile& profile, int decimals) {
    std::ostringstream out;
    out << "{\n  \"row_count\": " << profile.rowCount << ",\n  \"columns\": [\n";
    for (size_t i = 0; i < profile.columns.size(); ++i) {
        const auto& c = profile.columns[i];
        out << "    { \"name\": " << quoted(c.name)
            << ", \"role\": " << quoted(roleName(c.role))
            << ", \"non_missing\": " << c.nonMissing
            << ", \"missing\": " << c.missing
            << ", \"distinct\": " << c.distinct;
        if (c.numeric) {
            const auto& s = *c.numeric;
            out << ", \"mean\": " << numberJson(s.mean, decimals)
                << ", \"median\": " << numberJson(s.median, decimals)
                << ", \"std\": " << numberJson(s.stddev, decimals)
                << ", \"min\": " << numberJson(s.min, decimals)
                << ", \"max\": " << numberJson(s.max, decimals)
                << ", \"q1\": " << numberJson(s.q1, decimals)
                << ", \"q3\": " << numberJson(s.q3, decimals)
                << ", \"mode\": " << numberJson(s.mode, decimals);
        } else {
            out << ", \"top_value\": " << (c.topCount > 0 ? quoted(c.topValue) : "null")
                << ", \"top_count\": " << c.topCount;
        }
        out << " }" << (i + 1 == profile.columns.size() ? "" : ",") << "\n";
    }
    out << "  ]\n}\n";
    return out.str();
}

std::string ResultWriter::aggregateJson(const AggregateResult& result, int decimals) {
    std::ostringstream out;
    out << "{\n  \"rows_before\": " << result.rowsBefore << ",\n  \"rows_after\": " << result.rowsAfter << ",\n";
    writeSpecsJson(out, result.specs);
    out << "  \"warnings\": " << stringArrayJson(result.warnings) << ",\n";
    out << "  \"data\": ";
    writeRowsJson(out, result.data, decimals, "  ");
    out << "\n}\n";
    return out.str();
}

std::string ResultWriter::pivotJson(const PivotResult& result, int decimals) {
    std::ostringstream out;
    out << "{\n  \"rows_before\": " << result.rowsBefore << ",\n  \"rows_after\": " << result.rowsAfter << ",\n";
    out << "  \"index_values\": " << stringArrayJson(result.indexValues) << ",\n";
    writeSpecsJson(out, result.specs);
    out << "  \"index_reconstructed\": " << (result.indexReconstructed ? "true" : "false") << ",\n";
    out << "  \"reconstruction_note\": " << (result.reconstructionNote.empty() ? "null" : quoted(result.reconstructionNote)) << ",\n";
    out << "  \"warnings\": " << stringArrayJson(result.warnings) << ",\n";
    out << "  \"data\": ";
    writeRowsJson(out, result.data, decimals, "  ");
    out << "\n}\n";
    return out.str();
}

std::string ResultWriter::detectJson(const DetectResult& result, int decimals) {
    std::ostringstream out;
    out << "{\n";
    writeDetectBody(out, result, decimals, "  ");
    out << "}\n";
    return out.str();
}

std::string ResultWriter::treatJson(const TreatResult& result, int decimals) {
    std::ostringstream out;
    out << "{\n  \"rows_before\": " << result.rowsBefore << ",\n  \"rows_after\": " << result.rowsAfter << ",\n";
    out << "  \"strategy\": " << quoted(result.strategy) << ",\n";
    out << "  \"treated_count\": " << result.treatedCount << ",\n";
    out << "  \"summary\": { \"treated_by_column\": " << countsJson(result.treatedByColumn) << " },\n";
    out << "  \"detection\": {\n";
    writeDetectBody(out, result.detection, decimals, "    ");
    out << "  },\n";
    out << "  \"warnings\": " << stringArrayJson(result.warnings) << ",\n";
    out << "  \"data\": ";
    writeRowsJson(out, result.data, decimals, "  ");
    out << "\n}\n";
    return out.str();
}

DataTable ResultWriter::outlierTable(const DetectResult& result) {
    auto optionalCell = [](const std::optional<double>& v) { return v ? CellValue{*v} : CellValue{}; };
    DataTable table({"row_index", "column", "value", "method", "lower_bound", "upper_bound", "score"});
    for (const auto& o : result.outliers) {
        table.appendRow({CellValue{static_cast<int64_t>(o.rowIndex)},
                         CellValue{o.column},
                         CellValue{o.value},
                         CellValue{o.method},
                         optionalCell(o.lowerBound),
                         optionalCell(o.upperBound),
                         optionalCell(o.score)});
    }
    return table;
}

std::string ResultWriter::resolveFormat(const std::string& format, const std::string& path) {
    if (!format.empty()) return CommonUtils::toLower(format);
    const std::string lower = CommonUtils::toLower(path);
    if (CommonUtils::endsWith(lower, ".csv")) return "csv";
    if (CommonUtils::endsWith(lower, ".parquet")) return "parquet";
    return "json";
}

void ResultWriter::writeText(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    if (!out) throw Tally::IOException("Failed to open output file: " + path);
    out << content;
    if (!out.good()) throw Tally::IOException("Failed while writing output file: " + path);
}

void ResultWriter::writeTable(const DataTable& table,
                              const std::string& path,
                              const std::string& format,
                              char delimiter,
                              int decimals) {
    if (format == "csv") {
        TableIO::writeCsv(table, path, delimiter, decimals);
    } else if (format == "parquet") {
        TableIO::writeParquet(table, path, decimals);
    } else {
        throw Tally::IOException("Unsupported table output format '" + format + "' for " + path);
    }
}
