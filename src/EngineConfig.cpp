#include "EngineConfig.h"
#include "CommonUtils.h"
#include "TallyExceptions.h"

#include <algorithm>
#include <fstream>

namespace {
const char* kUsage =
    "Usage: tally <dataset.csv> <classify|summary|aggregate|pivot|detect-outliers|treat-outliers> "
    "[--config path] [--delimiter ,] [--group-by col] [--values a,b] [--function col=fn] "
    "[--order-by col] [--order-dir asc|desc] [--intent text] [--index col] [--column col] "
    "[--method iqr|zscore|isolation_forest|local_outlier_factor] [--threshold N] "
    "[--strategy remove|cap|winsorize|transform|impute|mean|median|mode] [--strategy-value V] "
    "[--output path] [--format json|csv|parquet] [--numeric-locale-hint auto|us|eu] "
    "[--datetime-locale-hint auto|dmy|mdy] [--max-rows N] [--preview-rows N] [--verbose] [--help]";

template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Tally::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Tally::TallyException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Tally::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) continue;
        out.push_back(c);
    }

    const size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) return i;
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// "function.<column>" keeps the column's case; every other key is lowercased with '-' mapped to '_'.
std::string normalizeConfigKey(std::string key) {
    key = CommonUtils::trim(key);
    const std::string lowered = CommonUtils::toLower(key);
    if (lowered.rfind("function.", 0) == 0) {
        return "function." + key.substr(9);
    }
    std::string out = lowered;
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    const int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Tally::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

size_t parseSizeStrict(const std::string& value, const std::string& key, size_t minValue) {
    const unsigned long long parsed = parseNumericStrict<unsigned long long>(
        value,
        key,
        "Invalid count for ",
        [](const std::string& v, size_t* pos) {
            if (!v.empty() && v.front() == '-') throw std::invalid_argument("negative");
            return std::stoull(v, pos);
        });
    if (parsed < minValue) {
        throw Tally::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return static_cast<size_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    const double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (parsed < minValue) {
        throw Tally::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Tally::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

char parseDelimiter(const std::string& value) {
    if (value == "\\t" || CommonUtils::toLower(value) == "tab") return '\t';
    if (value.size() != 1) throw Tally::ConfigurationException("delimiter expects a single character");
    return value[0];
}

// "qty=sum" or "qty=sum,price=mean".
void applyFunctionList(TallyConfig& config, const std::string& value, const std::string& key) {
    for (const auto& entry : CommonUtils::splitList(value)) {
        const size_t eq = entry.find('=');
        if (eq == std::string::npos) {
            throw Tally::ConfigurationException(key + " expects column=function, got '" + entry + "'");
        }
        const std::string column = CommonUtils::trim(entry.substr(0, eq));
        const std::string fn = CommonUtils::toLower(CommonUtils::trim(entry.substr(eq + 1)));
        if (column.empty() || fn.empty()) {
            throw Tally::ConfigurationException(key + " expects column=function, got '" + entry + "'");
        }
        config.functions[column] = fn;
    }
}

void assignKeyValue(TallyConfig& config, const std::string& key, const std::string& value) {
    if (key == "delimiter") {
        config.delimiter = parseDelimiter(value);
        return;
    }
    if (key == "values" || key == "value_columns") {
        std::string list = value;
        if (list.size() >= 2 && list.front() == '[' && list.back() == ']') list = list.substr(1, list.size() - 2);
        config.valueColumns.clear();
        for (const auto& item : CommonUtils::splitList(list)) config.valueColumns.push_back(maybeUnquote(item));
        return;
    }
    if (key == "functions") {
        applyFunctionList(config, value, key);
        return;
    }
    if (key.rfind("function.", 0) == 0) {
        const std::string column = CommonUtils::trim(key.substr(9));
        if (column.empty()) throw Tally::ConfigurationException("function.<column> requires a non-empty column name");
        config.functions[column] = CommonUtils::toLower(value);
        return;
    }
    if (key == "threshold") {
        config.outlierThreshold = parseDoubleStrict(value, key, 0.0);
        if (config.outlierThreshold <= 0.0) throw Tally::ConfigurationException("threshold must be > 0");
        return;
    }

    struct SizeRule {
        size_t TallyConfig::*member;
        size_t minValue;
    };
    struct TuningDoubleRule {
        double EngineTuning::*member;
        double minValue;
    };
    struct TuningSizeRule {
        size_t EngineTuning::*member;
        size_t minValue;
    };

    static const std::unordered_map<std::string, std::string TallyConfig::*> rawStringFields = {
        {"dataset", &TallyConfig::datasetPath},
        {"group_by", &TallyConfig::groupBy},
        {"order_by", &TallyConfig::orderBy},
        {"intent", &TallyConfig::intent},
        {"index", &TallyConfig::indexColumn},
        {"index_column", &TallyConfig::indexColumn},
        {"column", &TallyConfig::outlierColumn},
        {"strategy_value", &TallyConfig::strategyValue},
        {"output", &TallyConfig::outputPath}
    };
    static const std::unordered_map<std::string, std::string TallyConfig::*> lowerStringFields = {
        {"command", &TallyConfig::command},
        {"order_dir", &TallyConfig::orderDirection},
        {"order_direction", &TallyConfig::orderDirection},
        {"method", &TallyConfig::outlierMethod},
        {"strategy", &TallyConfig::outlierStrategy},
        {"format", &TallyConfig::outputFormat},
        {"numeric_locale_hint", &TallyConfig::numericLocaleHint},
        {"datetime_locale_hint", &TallyConfig::datetimeLocaleHint}
    };
    static const std::unordered_map<std::string, bool TallyConfig::*> boolFields = {
        {"verbose", &TallyConfig::verbose}
    };
    static const std::unordered_map<std::string, SizeRule> sizeFields = {
        {"max_rows", {&TallyConfig::maxRows, 1}},
        {"preview_rows", {&TallyConfig::previewRows, 0}}
    };
    static const std::unordered_map<std::string, TuningDoubleRule> tuningDoubleFields = {
        {"iqr_multiplier", {&EngineTuning::iqrMultiplier, 0.0}},
        {"zscore_threshold", {&EngineTuning::zScoreThreshold, 0.0}},
        {"lof_threshold", {&EngineTuning::lofThreshold, 0.0}},
        {"date_ratio_threshold", {&EngineTuning::dateRatioThreshold, 0.0}},
        {"numeric_ratio_threshold", {&EngineTuning::numericRatioThreshold, 0.0}},
        {"winsorize_percentile", {&EngineTuning::winsorizePercentile, 0.0}},
        {"numeric_epsilon", {&EngineTuning::numericEpsilon, 0.0}}
    };
    static const std::unordered_map<std::string, TuningSizeRule> tuningSizeFields = {
        {"lof_neighbors", {&EngineTuning::lofNeighbors, 1}},
        {"classifier_sample_size", {&EngineTuning::classifierSampleSize, 1}},
        {"boolean_max_distinct", {&EngineTuning::booleanMaxDistinct, 1}},
        {"pivot_column_warning_limit", {&EngineTuning::pivotColumnWarningLimit, 1}}
    };

    if (key == "output_decimals") {
        config.tuning.outputDecimals = parseIntStrict(value, key, 0);
        return;
    }
    if (const auto it = rawStringFields.find(key); it != rawStringFields.end()) {
        config.*(it->second) = value;
        return;
    }
    if (const auto it = lowerStringFields.find(key); it != lowerStringFields.end()) {
        config.*(it->second) = CommonUtils::toLower(value);
        return;
    }
    if (const auto it = boolFields.find(key); it != boolFields.end()) {
        config.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (const auto it = sizeFields.find(key); it != sizeFields.end()) {
        config.*(it->second.member) = parseSizeStrict(value, key, it->second.minValue);
        return;
    }
    if (const auto it = tuningDoubleFields.find(key); it != tuningDoubleFields.end()) {
        config.tuning.*(it->second.member) = parseDoubleStrict(value, key, it->second.minValue);
        return;
    }
    if (const auto it = tuningSizeFields.find(key); it != tuningSizeFields.end()) {
        config.tuning.*(it->second.member) = parseSizeStrict(value, key, it->second.minValue);
        return;
    }
}

bool isFlag(const std::string& arg) {
    return arg.size() > 2 && arg[0] == '-' && arg[1] == '-';
}
} // namespace

void EngineTuning::validate() const {
    if (!(iqrMultiplier > 0.0)) throw Tally::ConfigurationException("iqr_multiplier must be > 0");
    if (!(zScoreThreshold > 0.0)) throw Tally::ConfigurationException("zscore_threshold must be > 0");
    if (!(lofThreshold > 0.0)) throw Tally::ConfigurationException("lof_threshold must be > 0");
    if (lofNeighbors < 1) throw Tally::ConfigurationException("lof_neighbors must be >= 1");
    if (dateRatioThreshold <= 0.0 || dateRatioThreshold > 1.0) {
        throw Tally::ConfigurationException("date_ratio_threshold must be within (0,1]");
    }
    if (numericRatioThreshold <= 0.0 || numericRatioThreshold > 1.0) {
        throw Tally::ConfigurationException("numeric_ratio_threshold must be within (0,1]");
    }
    if (classifierSampleSize < 1) throw Tally::ConfigurationException("classifier_sample_size must be >= 1");
    if (booleanMaxDistinct < 1) throw Tally::ConfigurationException("boolean_max_distinct must be >= 1");
    if (pivotColumnWarningLimit < 1) throw Tally::ConfigurationException("pivot_column_warning_limit must be >= 1");
    if (outputDecimals < 0 || outputDecimals > 12) {
        throw Tally::ConfigurationException("output_decimals must be within [0,12]");
    }
    if (winsorizePercentile <= 0.0 || winsorizePercentile >= 0.5) {
        throw Tally::ConfigurationException("winsorize_percentile must be within (0,0.5)");
    }
    if (!(numericEpsilon > 0.0)) throw Tally::ConfigurationException("numeric_epsilon must be > 0");
}

TallyConfig TallyConfig::fromArgs(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            TallyConfig help;
            help.showHelp = true;
            return help;
        }
    }
    if (argc < 3 || isFlag(argv[1]) || isFlag(argv[2])) {
        throw Tally::ConfigurationException(kUsage);
    }

    TallyConfig config;
    // A config file is the base layer; flags on the command line override it.
    for (int i = 3; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            config = fromFile(argv[i + 1], config);
            break;
        }
    }
    config.datasetPath = argv[1];
    config.command = CommonUtils::toLower(argv[2]);

    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;
        if (arg == "--config" && hasValue) {
            ++i;
        } else if (arg == "--delimiter" && hasValue) {
            config.delimiter = parseDelimiter(argv[++i]);
        } else if (arg == "--group-by" && hasValue) {
            config.groupBy = argv[++i];
        } else if (arg == "--values" && hasValue) {
            config.valueColumns = CommonUtils::splitList(argv[++i]);
        } else if (arg == "--function" && hasValue) {
            applyFunctionList(config, argv[++i], "--function");
        } else if (arg == "--order-by" && hasValue) {
            config.orderBy = argv[++i];
        } else if (arg == "--order-dir" && hasValue) {
            config.orderDirection = CommonUtils::toLower(argv[++i]);
        } else if (arg == "--intent" && hasValue) {
            config.intent = argv[++i];
        } else if (arg == "--index" && hasValue) {
            config.indexColumn = argv[++i];
        } else if (arg == "--column" && hasValue) {
            config.outlierColumn = argv[++i];
        } else if (arg == "--method" && hasValue) {
            config.outlierMethod = CommonUtils::toLower(argv[++i]);
        } else if (arg == "--threshold" && hasValue) {
            config.outlierThreshold = parseDoubleStrict(argv[++i], "--threshold", 0.0);
            if (config.outlierThreshold <= 0.0) throw Tally::ConfigurationException("--threshold must be > 0");
        } else if (arg == "--strategy" && hasValue) {
            config.outlierStrategy = CommonUtils::toLower(argv[++i]);
        } else if (arg == "--strategy-value" && hasValue) {
            config.strategyValue = argv[++i];
        } else if (arg == "--output" && hasValue) {
            config.outputPath = argv[++i];
        } else if (arg == "--format" && hasValue) {
            config.outputFormat = CommonUtils::toLower(argv[++i]);
        } else if (arg == "--numeric-locale-hint" && hasValue) {
            config.numericLocaleHint = CommonUtils::toLower(argv[++i]);
        } else if (arg == "--datetime-locale-hint" && hasValue) {
            config.datetimeLocaleHint = CommonUtils::toLower(argv[++i]);
        } else if (arg == "--max-rows" && hasValue) {
            config.maxRows = parseSizeStrict(argv[++i], "--max-rows", 1);
        } else if (arg == "--preview-rows" && hasValue) {
            config.previewRows = parseSizeStrict(argv[++i], "--preview-rows", 0);
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else {
            throw Tally::ConfigurationException("Unknown or incomplete option '" + arg + "'. " + kUsage);
        }
    }

    config.validate();
    return config;
}

TallyConfig TallyConfig::fromFile(const std::string& configPath, const TallyConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Tally::ConfigurationException("Could not open config file: " + configPath);

    TallyConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Loose YAML (key: value) and loose JSON ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const Tally::TallyException& ex) {
            throw Tally::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    return config;
}

void TallyConfig::validate() const {
    if (datasetPath.empty()) {
        throw Tally::ConfigurationException("dataset path is required");
    }

    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
    };

    if (!isIn(command, {"classify", "summary", "aggregate", "pivot", "detect-outliers", "treat-outliers"})) {
        throw Tally::ConfigurationException(
            "command must be one of: classify, summary, aggregate, pivot, detect-outliers, treat-outliers");
    }
    if (command == "aggregate" && CommonUtils::trim(groupBy).empty()) {
        throw Tally::ConfigurationException("aggregate requires --group-by");
    }
    if (command == "pivot" && CommonUtils::trim(indexColumn).empty()) {
        throw Tally::ConfigurationException("pivot requires --index");
    }
    if (!isIn(orderDirection, {"asc", "desc"})) {
        throw Tally::ConfigurationException("order_dir must be asc or desc");
    }
    if (!isIn(outlierMethod, {"iqr", "zscore", "isolation_forest", "local_outlier_factor", "lof"})) {
        throw Tally::ConfigurationException(
            "method must be one of: iqr, zscore, isolation_forest, local_outlier_factor");
    }
    if (!isIn(outlierStrategy, {"remove", "cap", "winsorize", "transform", "impute", "mean", "median", "mode"})) {
        throw Tally::ConfigurationException(
            "strategy must be one of: remove, cap, winsorize, transform, impute, mean, median, mode");
    }
    if (outlierThreshold != -1.0 && !(outlierThreshold > 0.0)) {
        throw Tally::ConfigurationException("threshold must be > 0");
    }
    if (!isIn(outputFormat, {"", "json", "csv", "parquet"})) {
        throw Tally::ConfigurationException("format must be one of: json, csv, parquet");
    }
    if (!isIn(numericLocaleHint, {"auto", "us", "eu"})) {
        throw Tally::ConfigurationException("numeric_locale_hint must be one of: auto, us, eu");
    }
    if (!isIn(datetimeLocaleHint, {"auto", "dmy", "mdy"})) {
        throw Tally::ConfigurationException("datetime_locale_hint must be one of: auto, dmy, mdy");
    }
    if (delimiter == '\n' || delimiter == '\r' || delimiter == '"') {
        throw Tally::ConfigurationException("delimiter cannot be a quote or line break");
    }
    if (maxRows < 1) {
        throw Tally::ConfigurationException("max_rows must be >= 1");
    }
    tuning.validate();
}

std::string TallyConfig::usage() {
    return kUsage;
}
