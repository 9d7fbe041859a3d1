#include "ColumnClassifier.h"
#include "EngineConfig.h"
#include "GroupAggregator.h"
#include "OutlierEngine.h"
#include "PivotReshaper.h"
#include "ResultWriter.h"
#include "TableIO.h"
#include "TableSummary.h"
#include "TallyExceptions.h"
#include "TerminalUI.h"

#include <iostream>
#include <optional>
#include <string>

namespace {
TableIO::ReadOptions readOptionsFor(const TallyConfig& config) {
    TableIO::ReadOptions options;
    options.delimiter = config.delimiter;
    options.maxRows = config.maxRows;
    if (config.numericLocaleHint == "us") options.numericPolicy = ValueParser::NumericSeparatorPolicy::US_THOUSANDS;
    else if (config.numericLocaleHint == "eu") options.numericPolicy = ValueParser::NumericSeparatorPolicy::EUROPEAN;
    if (config.datetimeLocaleHint == "dmy") options.dateHint = DateUtils::DateLocaleHint::DMY;
    else if (config.datetimeLocaleHint == "mdy") options.dateHint = DateUtils::DateLocaleHint::MDY;
    return options;
}

std::optional<double> thresholdFor(const TallyConfig& config) {
    if (config.outlierThreshold < 0.0) return std::nullopt;
    return config.outlierThreshold;
}

// Writes a report as JSON, or the accompanying result table as csv/parquet.
void exportResult(const TallyConfig& config, const std::string& json, const DataTable* table) {
    if (config.outputPath.empty()) return;
    const std::string format = ResultWriter::resolveFormat(config.outputFormat, config.outputPath);
    const int decimals = config.tuning.outputDecimals;
    if (format == "json") {
        ResultWriter::writeText(config.outputPath, json);
    } else if (table != nullptr) {
        ResultWriter::writeTable(*table, config.outputPath, format, config.delimiter, decimals);
    } else {
        throw Tally::IOException("Command '" + config.command + "' only supports json output");
    }
    std::cout << "[Tally] Results exported to: " << config.outputPath << " (" << format << ")\n";
}

int runClassify(const TallyConfig& config, const DataTable& table) {
    const auto roles = ColumnClassifier::classifyTable(table, config.tuning);
    TerminalUI::printRoles(roles);
    exportResult(config, ResultWriter::classificationJson(roles), nullptr);
    return 0;
}

int runSummary(const TallyConfig& config, const DataTable& table) {
    const TableProfile profile = TableSummary::summarize(table, config.tuning);
    TerminalUI::printSummary(profile, config.tuning.outputDecimals);
    exportResult(config, ResultWriter::summaryJson(profile, config.tuning.outputDecimals), nullptr);
    return 0;
}

int runAggregate(const TallyConfig& config, const DataTable& table) {
    AggregateRequest request;
    request.groupBy = config.groupBy;
    request.valueColumns = config.valueColumns;
    request.functions = config.functions;
    request.orderBy = config.orderBy;
    request.orderDirection = config.orderDirection;
    request.intent = config.intent;

    const AggregateResult result = GroupAggregator::aggregate(table, request, config.tuning);
    if (config.verbose) TerminalUI::printAggregationSpecs(result.specs);
    TerminalUI::printWarnings(result.warnings);
    std::cout << "[Tally] Aggregated " << result.rowsBefore << " rows into " << result.rowsAfter
              << " groups by '" << config.groupBy << "'\n";
    TerminalUI::printTablePreview("AGGREGATE", result.data, config.previewRows, config.tuning.outputDecimals);
    exportResult(config, ResultWriter::aggregateJson(result, config.tuning.outputDecimals), &result.data);
    return 0;
}

int runPivot(const TallyConfig& config, const DataTable& table) {
    PivotRequest request;
    request.indexColumn = config.indexColumn;
    request.valueColumns = config.valueColumns;
    request.functions = config.functions;

    const PivotResult result = PivotReshaper::pivot(table, request, config.tuning);
    if (config.verbose) TerminalUI::printAggregationSpecs(result.specs);
    TerminalUI::printWarnings(result.warnings);
    std::cout << "[Tally] Pivoted " << result.rowsBefore << " rows on '" << config.indexColumn << "' ("
              << result.indexValues.size() << " distinct values) into " << result.rowsAfter << " rows\n";
    if (result.indexReconstructed) std::cout << "[Tally] Note: " << result.reconstructionNote << "\n";
    TerminalUI::printTablePreview("PIVOT", result.data, config.previewRows, config.tuning.outputDecimals);
    exportResult(config, ResultWriter::pivotJson(result, config.tuning.outputDecimals), &result.data);
    return 0;
}

int runDetect(const TallyConfig& config, const DataTable& table) {
    DetectRequest request;
    request.column = config.outlierColumn;
    request.method = config.outlierMethod;
    request.threshold = thresholdFor(config);

    const DetectResult result = OutlierEngine::detect(table, request, config.tuning);
    TerminalUI::printWarnings(result.warnings);
    TerminalUI::printOutlierSummary(result);
    const DataTable records = ResultWriter::outlierTable(result);
    if (config.verbose) TerminalUI::printTablePreview("FLAGGED VALUES", records, config.previewRows, config.tuning.outputDecimals);
    exportResult(config, ResultWriter::detectJson(result, config.tuning.outputDecimals), &records);
    return 0;
}

int runTreat(const TallyConfig& config, const DataTable& table) {
    TreatRequest request;
    request.column = config.outlierColumn;
    request.method = config.outlierMethod;
    request.threshold = thresholdFor(config);
    request.strategy = config.outlierStrategy;
    request.strategyValue = config.strategyValue;

    const TreatResult result = OutlierEngine::treat(table, request, config.tuning);
    TerminalUI::printWarnings(result.warnings);
    if (config.verbose) TerminalUI::printOutlierSummary(result.detection);
    std::cout << "[Tally] Strategy '" << result.strategy << "' treated " << result.treatedCount << " value(s); rows "
              << result.rowsBefore << " -> " << result.rowsAfter << "\n";
    TerminalUI::printTablePreview("TREATED", result.data, config.previewRows, config.tuning.outputDecimals);
    exportResult(config, ResultWriter::treatJson(result, config.tuning.outputDecimals), &result.data);
    return 0;
}

int run(const TallyConfig& config) {
    TableIO::LoadedTable loaded = TableIO::readCsv(config.datasetPath, readOptionsFor(config));
    TerminalUI::printWarnings(loaded.warnings);
    const DataTable& table = loaded.table;
    std::cout << "[Tally] Loaded " << table.rowCount() << " rows x " << table.colCount() << " columns from "
              << config.datasetPath << "\n";

    if (config.verbose && config.command != "classify") {
        for (const auto& entry : ColumnClassifier::classifyTable(table, config.tuning)) {
            std::cout << "[Tally] Column '" << entry.first << "' -> " << roleName(entry.second) << "\n";
        }
    }

    if (config.command == "classify") return runClassify(config, table);
    if (config.command == "summary") return runSummary(config, table);
    if (config.command == "aggregate") return runAggregate(config, table);
    if (config.command == "pivot") return runPivot(config, table);
    if (config.command == "detect-outliers") return runDetect(config, table);
    if (config.command == "treat-outliers") return runTreat(config, table);
    throw Tally::ConfigurationException("Unknown command: " + config.command);
}
} // namespace

int main(int argc, char* argv[]) {
    TallyConfig config;
    try {
        config = TallyConfig::fromArgs(argc, argv);
    } catch (const Tally::TallyException& e) {
        std::cerr << "[Tally Error] " << e.what() << "\n";
        return 1;
    }

    if (config.showHelp) {
        std::cout << TallyConfig::usage() << "\n";
        return 0;
    }

    try {
        return run(config);
    } catch (const Tally::TallyException& e) {
        std::cerr << "[Tally Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Tally Exception] " << e.what() << "\n";
        return 1;
    }
}
