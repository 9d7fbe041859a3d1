#pragma once
#include "DataTable.h"
#include "EngineConfig.h"
#include "OutlierBackend.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class OutlierMethod { IQR, ZSCORE, ISOLATION_FOREST, LOCAL_OUTLIER_FACTOR };

enum class TreatmentStrategy { REMOVE, CAP, WINSORIZE, TRANSFORM, IMPUTE };

std::string methodName(OutlierMethod method);

/// Accepts iqr, zscore (z_score), isolation_forest, local_outlier_factor (lof).
/// @throws Tally::InvalidInputException for anything else.
OutlierMethod parseOutlierMethod(const std::string& name);

std::string strategyName(TreatmentStrategy strategy);

struct OutlierRecord {
    size_t rowIndex = 0;
    std::string column;
    double value = 0.0;
    std::string method;
    std::optional<double> lowerBound;
    std::optional<double> upperBound;
    std::optional<double> score;  // z-score or backend score; unset for iqr
};

struct ColumnOutlierStats {
    std::string column;
    size_t count = 0;  // non-missing numeric values
    double mean = 0.0;
    double median = 0.0;
    double stddev = 0.0;
    double q1 = 0.0;
    double q3 = 0.0;
    double iqr = 0.0;
    double min = 0.0;
    double max = 0.0;
    double lowerBound = 0.0;
    double upperBound = 0.0;
    size_t outlierCount = 0;
};

struct DetectRequest {
    std::string column;  // empty => every quantitative column
    std::string method = "iqr";
    std::optional<double> threshold;
};

struct DetectResult {
    std::string method;
    double threshold = 0.0;
    std::vector<OutlierRecord> outliers;         // column order, then row order
    std::vector<ColumnOutlierStats> statistics;  // column order
    std::vector<std::pair<std::string, size_t>> outliersByColumn;
    size_t totalOutliers = 0;
    std::vector<std::string> warnings;
};

struct TreatRequest {
    std::string column;
    std::string method = "iqr";
    std::optional<double> threshold;
    std::string strategy = "remove";
    std::string strategyValue;
};

struct TreatResult {
    DataTable data;
    size_t rowsBefore = 0;
    size_t rowsAfter = 0;
    std::string strategy;
    size_t treatedCount = 0;
    std::vector<std::pair<std::string, size_t>> treatedByColumn;
    DetectResult detection;
    std::vector<std::string> warnings;
};

class OutlierEngine {
public:
    /**
     * @brief Flags outliers per numeric column and reports per-column statistics.
     * @details iqr flags values outside [Q1 - t*IQR, Q3 + t*IQR] with linear-interpolated quartiles; zscore flags
     *          |x - mean| / s > t with the sample standard deviation and flags nothing when s is zero. The
     *          remaining methods are served by backends. Statistics use non-missing values only; in auto mode
     *          columns without values are skipped with a warning.
     * @throws Tally::InvalidInputException for an unknown method or column, a non-numeric requested column,
     *         or a non-positive threshold.
     * @throws Tally::ComputationException when the method has no available backend, or the requested column
     *         has no numeric values.
     */
    static DetectResult detect(const DataTable& table,
                               const DetectRequest& request,
                               const EngineTuning& tuning = EngineTuning{},
                               const OutlierBackendSet& backends = OutlierBackendSet::withDefaults());

    /**
     * @brief Re-runs detection and returns a treated copy of the table.
     * @details remove drops the union of flagged rows; cap clamps flagged cells to the detected bounds;
     *          winsorize clamps flagged cells to the [p, 1 - p] percentiles (p from strategyValue, default 5%);
     *          transform applies log1p to a whole affected column when every value is positive, signed square
     *          root otherwise; impute replaces flagged cells with a statistic of the remaining values or a
     *          constant. mean, median and mode are accepted as impute shorthands.
     * @throws the detect exceptions, and Tally::InvalidInputException for an unknown strategy or strategy value.
     */
    static TreatResult treat(const DataTable& table,
                             const TreatRequest& request,
                             const EngineTuning& tuning = EngineTuning{},
                             const OutlierBackendSet& backends = OutlierBackendSet::withDefaults());
};
