#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

struct EngineTuning {
    // Tukey fence multiplier for the iqr method.
    double iqrMultiplier = 1.5;
    // Absolute z-score above which a value is flagged by the zscore method.
    double zScoreThreshold = 3.0;
    // Local outlier factor above which a value is flagged.
    double lofThreshold = 1.5;
    size_t lofNeighbors = 20;

    // Share of non-missing string values that must parse as dates for the date role.
    double dateRatioThreshold = 0.5;
    // Share of non-missing values that must parse as numbers for the numeric role.
    double numericRatioThreshold = 0.7;
    // Non-missing values inspected per column during classification.
    size_t classifierSampleSize = 1000;
    // Largest distinct-value count still considered a boolean flag.
    size_t booleanMaxDistinct = 2;

    // Estimated pivot output width that triggers a size warning.
    size_t pivotColumnWarningLimit = 1000;

    // Decimal places applied to every floating value in results.
    int outputDecimals = 2;
    // Lower tail for winsorize when no percentile is supplied; the upper tail mirrors it.
    double winsorizePercentile = 0.05;

    double numericEpsilon = 1e-12;

    void validate() const;
};

struct TallyConfig {
    std::string datasetPath;
    std::string command;
    char delimiter = ',';
    std::string numericLocaleHint = "auto";   // auto|us|eu
    std::string datetimeLocaleHint = "auto";  // auto|dmy|mdy

    // aggregate
    std::string groupBy;
    std::vector<std::string> valueColumns;
    std::unordered_map<std::string, std::string> functions;
    std::string orderBy;
    std::string orderDirection = "asc";
    std::string intent;

    // pivot
    std::string indexColumn;

    // outliers
    std::string outlierColumn;
    std::string outlierMethod = "iqr";
    double outlierThreshold = -1.0; // -1 => method default
    std::string outlierStrategy = "remove";
    std::string strategyValue;

    std::string outputPath;
    std::string outputFormat; // empty => inferred from outputPath extension
    size_t maxRows = 1000000;
    size_t previewRows = 20;
    bool verbose = false;
    bool showHelp = false;

    EngineTuning tuning;

    /**
     * @brief Builds a configuration from command line arguments.
     * @details Layout is `tally <dataset> <command> [--flag value ...]`; a `--config` file is applied first and
     *          explicit flags override it.
     * @throws Tally::ConfigurationException on unknown commands, malformed values or failed validation.
     */
    static TallyConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Applies a loose YAML/JSON key: value file on top of base.
     * @throws Tally::ConfigurationException naming the failing line.
     */
    static TallyConfig fromFile(const std::string& configPath, const TallyConfig& base);

    void validate() const;

    static std::string usage();
};
