#include "OutlierEngine.h"
#include "ColumnClassifier.h"
#include "CommonUtils.h"
#include "Statistics.h"
#include "TallyExceptions.h"
#include "ValueParser.h"

#include <algorithm>
#include <cmath>
#include <unordered_map>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
struct ObservedColumn {
    size_t columnIndex = 0;
    std::vector<size_t> rows;
    std::vector<double> values;
};

struct ColumnDetection {
    ColumnOutlierStats stats;
    std::vector<OutlierRecord> records;
};

enum class ImputeStat { MEAN, MEDIAN, MODE, MIN, MAX, CONSTANT };

ObservedColumn observe(const DataTable& table, size_t columnIndex) {
    ObservedColumn out;
    out.columnIndex = columnIndex;
    const auto& cells = table.columns()[columnIndex].cells;
    for (size_t row = 0; row < cells.size(); ++row) {
        if (CellUtils::isMissing(cells[row]) || CellUtils::kindOf(cells[row]) == CellKind::DATE) continue;
        const auto number = CellUtils::toNumber(cells[row]);
        if (!number.has_value()) continue;
        out.rows.push_back(row);
        out.values.push_back(*number);
    }
    return out;
}

size_t nonMissingCount(const std::vector<CellValue>& cells) {
    return static_cast<size_t>(std::count_if(cells.begin(), cells.end(), [](const CellValue& c) {
        return !CellUtils::isMissing(c);
    }));
}

double defaultThreshold(OutlierMethod method, const EngineTuning& tuning, const OutlierBackend* backend) {
    switch (method) {
        case OutlierMethod::IQR: return tuning.iqrMultiplier;
        case OutlierMethod::ZSCORE: return tuning.zScoreThreshold;
        default: break;
    }
    return backend ? backend->defaultThreshold(tuning) : 0.0;
}

ColumnDetection detectColumn(const ObservedColumn& observed,
                             const std::string& columnName,
                             OutlierMethod method,
                             double threshold,
                             const OutlierBackend* backend,
                             const EngineTuning& tuning) {
    ColumnDetection out;
    const NumericSummary summary = Statistics::summarize(observed.values);
    ColumnOutlierStats& stats = out.stats;
    stats.column = columnName;
    stats.count = summary.count;
    stats.mean = summary.mean;
    stats.median = summary.median;
    stats.stddev = summary.stddev;
    stats.q1 = summary.q1;
    stats.q3 = summary.q3;
    stats.iqr = summary.iqr;
    stats.min = summary.min;
    stats.max = summary.max;

    const std::string name = methodName(method);
    auto flag = [&](size_t i, std::optional<double> score) {
        OutlierRecord record;
        record.rowIndex = observed.rows[i];
        record.column = columnName;
        record.value = observed.values[i];
        record.method = name;
        record.lowerBound = stats.lowerBound;
        record.upperBound = stats.upperBound;
        record.score = score;
        out.records.push_back(std::move(record));
    };

    switch (method) {
        case OutlierMethod::IQR: {
            stats.lowerBound = summary.q1 - threshold * summary.iqr;
            stats.upperBound = summary.q3 + threshold * summary.iqr;
            for (size_t i = 0; i < observed.values.size(); ++i) {
                const double v = observed.values[i];
                if (v < stats.lowerBound || v > stats.upperBound) flag(i, std::nullopt);
            }
            break;
        }
        case OutlierMethod::ZSCORE: {
            stats.lowerBound = summary.mean - threshold * summary.stddev;
            stats.upperBound = summary.mean + threshold * summary.stddev;
            if (summary.stddev <= tuning.numericEpsilon) break;
            for (size_t i = 0; i < observed.values.size(); ++i) {
                const double z = (observed.values[i] - summary.mean) / summary.stddev;
                if (std::abs(z) > threshold) flag(i, z);
            }
            break;
        }
        case OutlierMethod::ISOLATION_FOREST:
        case OutlierMethod::LOCAL_OUTLIER_FACTOR: {
            const BackendVerdict verdict = backend->evaluate(observed.values, threshold, tuning);
            // Bounds are the inlier range, which is also what cap clamps to.
            bool anyInlier = false;
            double lo = 0.0;
            double hi = 0.0;
            for (size_t i = 0; i < observed.values.size(); ++i) {
                if (i < verdict.flags.size() && verdict.flags[i]) continue;
                const double v = observed.values[i];
                lo = anyInlier ? std::min(lo, v) : v;
                hi = anyInlier ? std::max(hi, v) : v;
                anyInlier = true;
            }
            stats.lowerBound = anyInlier ? lo : summary.min;
            stats.upperBound = anyInlier ? hi : summary.max;
            for (size_t i = 0; i < observed.values.size() && i < verdict.flags.size(); ++i) {
                if (verdict.flags[i]) flag(i, i < verdict.scores.size() ? std::optional<double>(verdict.scores[i]) : std::nullopt);
            }
            break;
        }
    }
    stats.outlierCount = out.records.size();
    return out;
}

TreatmentStrategy parseStrategy(const std::string& raw, std::optional<ImputeStat>& aliasStat) {
    const std::string s = CommonUtils::toLower(CommonUtils::trim(raw));
    if (s == "remove" || s == "drop") return TreatmentStrategy::REMOVE;
    if (s == "cap" || s == "clip") return TreatmentStrategy::CAP;
    if (s == "winsorize" || s == "winsorise") return TreatmentStrategy::WINSORIZE;
    if (s == "transform") return TreatmentStrategy::TRANSFORM;
    if (s == "impute") return TreatmentStrategy::IMPUTE;
    if (s == "mean") aliasStat = ImputeStat::MEAN;
    if (s == "median") aliasStat = ImputeStat::MEDIAN;
    if (s == "mode") aliasStat = ImputeStat::MODE;
    if (aliasStat.has_value()) return TreatmentStrategy::IMPUTE;
    throw Tally::InvalidInputException("Unknown outlier strategy '" + raw +
                                       "'. Use remove, cap, winsorize, transform, impute, mean, median or mode.");
}

ImputeStat parseImputeStat(const std::string& raw, double& constant) {
    const std::string s = CommonUtils::toLower(CommonUtils::trim(raw));
    if (s.empty() || s == "median") return ImputeStat::MEDIAN;
    if (s == "mean" || s == "average" || s == "avg") return ImputeStat::MEAN;
    if (s == "mode") return ImputeStat::MODE;
    if (s == "min") return ImputeStat::MIN;
    if (s == "max") return ImputeStat::MAX;
    if (ValueParser::parseNumber(s, constant)) return ImputeStat::CONSTANT;
    throw Tally::InvalidInputException("Unknown impute value '" + raw +
                                       "'. Use mean, median, mode, min, max or a number.");
}

double parseWinsorizePercentile(const std::string& raw, double fallback) {
    const std::string s = CommonUtils::trim(raw);
    if (s.empty()) return fallback;
    double p = 0.0;
    if (!ValueParser::parseNumber(s, p)) {
        throw Tally::InvalidInputException("Winsorize percentile '" + raw + "' is not a number.");
    }
    if (p >= 1.0) p /= 100.0;
    if (p <= 0.0 || p >= 0.5) {
        throw Tally::InvalidInputException("Winsorize percentile must be in (0, 50) percent, got '" + raw + "'.");
    }
    return p;
}

std::optional<double> remainingStat(ImputeStat stat, const std::vector<double>& remaining) {
    if (remaining.empty()) return std::nullopt;
    switch (stat) {
        case ImputeStat::MEAN: return Statistics::mean(remaining);
        case ImputeStat::MEDIAN: return CommonUtils::medianByNth(remaining);
        case ImputeStat::MODE: return Statistics::mode(remaining);
        case ImputeStat::MIN: return *std::min_element(remaining.begin(), remaining.end());
        case ImputeStat::MAX: return *std::max_element(remaining.begin(), remaining.end());
        case ImputeStat::CONSTANT: break;
    }
    return std::nullopt;
}

double signedSqrt(double v) {
    return v < 0.0 ? -std::sqrt(-v) : std::sqrt(v);
}
} // namespace

std::string methodName(OutlierMethod method) {
    switch (method) {
        case OutlierMethod::IQR: return "iqr";
        case OutlierMethod::ZSCORE: return "zscore";
        case OutlierMethod::ISOLATION_FOREST: return "isolation_forest";
        case OutlierMethod::LOCAL_OUTLIER_FACTOR: return "local_outlier_factor";
    }
    return "iqr";
}

OutlierMethod parseOutlierMethod(const std::string& name) {
    const std::string s = CommonUtils::toLower(CommonUtils::trim(name));
    if (s.empty() || s == "iqr") return OutlierMethod::IQR;
    if (s == "zscore" || s == "z_score" || s == "z-score") return OutlierMethod::ZSCORE;
    if (s == "isolation_forest" || s == "isolationforest") return OutlierMethod::ISOLATION_FOREST;
    if (s == "local_outlier_factor" || s == "lof") return OutlierMethod::LOCAL_OUTLIER_FACTOR;
    throw Tally::InvalidInputException("Unknown outlier method '" + name +
                                       "'. Use iqr, zscore, isolation_forest or local_outlier_factor.");
}

std::string strategyName(TreatmentStrategy strategy) {
    switch (strategy) {
        case TreatmentStrategy::REMOVE: return "remove";
        case TreatmentStrategy::CAP: return "cap";
        case TreatmentStrategy::WINSORIZE: return "winsorize";
        case TreatmentStrategy::TRANSFORM: return "transform";
        case TreatmentStrategy::IMPUTE: return "impute";
    }
    return "remove";
}

DetectResult OutlierEngine::detect(const DataTable& table,
                                   const DetectRequest& request,
                                   const EngineTuning& tuning,
                                   const OutlierBackendSet& backends) {
    DetectResult result;
    const OutlierMethod method = parseOutlierMethod(request.method);
    result.method = methodName(method);

    std::shared_ptr<const OutlierBackend> backend;
    if (method == OutlierMethod::ISOLATION_FOREST || method == OutlierMethod::LOCAL_OUTLIER_FACTOR) {
        backend = backends.find(result.method);
        if (!backend) {
            const std::vector<std::string> registered = backends.methods();
            throw Tally::ComputationException("Outlier method '" + result.method +
                                              "' needs a detection backend and none is registered. Registered: " +
                                              (registered.empty() ? std::string("none")
                                                                  : CommonUtils::joinList(registered)));
        }
        if (!backend->isAvailable()) {
            throw Tally::ComputationException("Outlier method '" + result.method + "' backend '" + backend->name() +
                                              "' is not available in this build.");
        }
    }

    if (request.threshold.has_value() && !(*request.threshold > 0.0 && std::isfinite(*request.threshold))) {
        throw Tally::InvalidInputException("Outlier threshold must be a positive number.");
    }
    result.threshold = request.threshold.value_or(defaultThreshold(method, tuning, backend.get()));

    std::vector<ObservedColumn> observedColumns;
    const std::string requested = CommonUtils::trim(request.column);
    const std::vector<std::string> siblings = table.columnNames();
    if (!requested.empty()) {
        const TableColumn& column = table.requireColumn(requested);
        const size_t columnIndex = static_cast<size_t>(table.findColumnIndex(column.name));
        const ColumnRole role = ColumnClassifier::classify(column.name, column.cells, siblings, tuning);
        ObservedColumn observed = observe(table, columnIndex);
        const size_t nonMissing = nonMissingCount(column.cells);
        if (nonMissing == 0) {
            throw Tally::ComputationException("Column \"" + column.name +
                                              "\" has no non-missing values; outlier statistics are undefined.");
        }
        const double numericShare = static_cast<double>(observed.values.size()) / static_cast<double>(nonMissing);
        if (role == ColumnRole::DATE || role == ColumnRole::BOOLEAN ||
            (!isQuantitativeRole(role) && numericShare < tuning.numericRatioThreshold)) {
            throw Tally::InvalidInputException("Column \"" + column.name + "\" is not numeric (role: " +
                                               roleName(role) + "); outlier detection needs numeric values.");
        }
        observedColumns.push_back(std::move(observed));
    } else {
        for (const auto& [name, role] : ColumnClassifier::classifyTable(table, tuning)) {
            if (!isQuantitativeRole(role)) continue;
            const size_t columnIndex = static_cast<size_t>(table.findColumnIndex(name));
            ObservedColumn observed = observe(table, columnIndex);
            if (observed.values.empty()) {
                result.warnings.push_back("Column \"" + name + "\" has no non-missing numeric values and was skipped.");
                continue;
            }
            observedColumns.push_back(std::move(observed));
        }
        if (observedColumns.empty()) {
            result.warnings.push_back("No numeric columns were found for outlier detection.");
        }
    }

    // Backends may throw, so they run on the calling thread.
    std::vector<ColumnDetection> detections(observedColumns.size());
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic) if (!backend)
    #endif
    for (size_t i = 0; i < observedColumns.size(); ++i) {
        const std::string& name = table.columns()[observedColumns[i].columnIndex].name;
        detections[i] = detectColumn(observedColumns[i], name, method, result.threshold, backend.get(), tuning);
    }

    for (auto& detection : detections) {
        result.outliersByColumn.emplace_back(detection.stats.column, detection.stats.outlierCount);
        result.totalOutliers += detection.stats.outlierCount;
        result.statistics.push_back(detection.stats);
        for (auto& record : detection.records) result.outliers.push_back(std::move(record));
    }
    return result;
}

TreatResult OutlierEngine::treat(const DataTable& table,
                                 const TreatRequest& request,
                                 const EngineTuning& tuning,
                                 const OutlierBackendSet& backends) {
    std::optional<ImputeStat> aliasStat;
    const TreatmentStrategy strategy = parseStrategy(request.strategy, aliasStat);

    double imputeConstant = 0.0;
    ImputeStat imputeStat = ImputeStat::MEDIAN;
    double winsorP = tuning.winsorizePercentile;
    if (strategy == TreatmentStrategy::IMPUTE) {
        imputeStat = aliasStat.has_value() ? *aliasStat : parseImputeStat(request.strategyValue, imputeConstant);
    } else if (strategy == TreatmentStrategy::WINSORIZE) {
        winsorP = parseWinsorizePercentile(request.strategyValue, tuning.winsorizePercentile);
    }

    DetectRequest detectRequest;
    detectRequest.column = request.column;
    detectRequest.method = request.method;
    detectRequest.threshold = request.threshold;

    TreatResult result;
    result.detection = detect(table, detectRequest, tuning, backends);
    result.warnings = result.detection.warnings;
    result.strategy = strategyName(strategy);
    result.rowsBefore = table.rowCount();
    result.data = table;

    // Flagged rows per column, rebuilt from the detection records.
    std::vector<std::vector<size_t>> flaggedRows(result.detection.statistics.size());
    std::unordered_map<std::string, size_t> statIndex;
    for (size_t i = 0; i < result.detection.statistics.size(); ++i) {
        statIndex[result.detection.statistics[i].column] = i;
    }
    for (const auto& record : result.detection.outliers) {
        flaggedRows[statIndex.at(record.column)].push_back(record.rowIndex);
    }

    if (strategy == TreatmentStrategy::REMOVE) {
        RowMask keep(table.rowCount(), 1);
        for (size_t i = 0; i < flaggedRows.size(); ++i) {
            for (size_t row : flaggedRows[i]) keep[row] = 0;
            result.treatedByColumn.emplace_back(result.detection.statistics[i].column, flaggedRows[i].size());
        }
        const size_t removed = static_cast<size_t>(std::count(keep.begin(), keep.end(), uint8_t{0}));
        result.data.removeRows(keep);
        result.treatedCount = removed;
    } else {
        for (size_t i = 0; i < flaggedRows.size(); ++i) {
            const ColumnOutlierStats& stats = result.detection.statistics[i];
            const auto& rows = flaggedRows[i];
            result.treatedByColumn.emplace_back(stats.column, rows.size());
            if (rows.empty()) continue;
            result.treatedCount += rows.size();

            const size_t col = static_cast<size_t>(table.findColumnIndex(stats.column));
            const ObservedColumn observed = observe(table, col);

            switch (strategy) {
                case TreatmentStrategy::CAP:
                    for (size_t row : rows) {
                        const double v = CellUtils::toNumber(table.at(row, col)).value_or(0.0);
                        result.data.set(row, col, CellValue{std::clamp(v, stats.lowerBound, stats.upperBound)});
                    }
                    break;

                case TreatmentStrategy::WINSORIZE: {
                    const double lo = Statistics::percentile(observed.values, winsorP);
                    const double hi = Statistics::percentile(observed.values, 1.0 - winsorP);
                    for (size_t row : rows) {
                        const double v = CellUtils::toNumber(table.at(row, col)).value_or(0.0);
                        result.data.set(row, col, CellValue{std::clamp(v, lo, hi)});
                    }
                    break;
                }

                case TreatmentStrategy::TRANSFORM: {
                    const bool allPositive = std::all_of(observed.values.begin(), observed.values.end(),
                                                         [](double v) { return v > 0.0; });
                    for (size_t k = 0; k < observed.rows.size(); ++k) {
                        const double v = observed.values[k];
                        result.data.set(observed.rows[k], col, CellValue{allPositive ? std::log1p(v) : signedSqrt(v)});
                    }
                    if (!allPositive) {
                        result.warnings.push_back("Column \"" + stats.column +
                                                  "\" has non-positive values; applied signed square root instead of log1p.");
                    }
                    break;
                }

                case TreatmentStrategy::IMPUTE: {
                    std::vector<bool> isFlagged(table.rowCount(), false);
                    for (size_t row : rows) isFlagged[row] = true;
                    std::vector<double> remaining;
                    for (size_t k = 0; k < observed.rows.size(); ++k) {
                        if (!isFlagged[observed.rows[k]]) remaining.push_back(observed.values[k]);
                    }

                    double replacement = imputeConstant;
                    if (imputeStat != ImputeStat::CONSTANT) {
                        auto value = remainingStat(imputeStat, remaining);
                        if (!value.has_value()) value = remainingStat(ImputeStat::MEDIAN, remaining);
                        if (!value.has_value()) {
                            result.warnings.push_back("Column \"" + stats.column +
                                                      "\" has no unflagged values; imputed 0.");
                        }
                        replacement = value.value_or(0.0);
                    }
                    for (size_t row : rows) result.data.set(row, col, CellValue{replacement});
                    break;
                }

                case TreatmentStrategy::REMOVE:
                    break;
            }
        }
    }

    result.data.roundFloating(tuning.outputDecimals);
    result.rowsAfter = result.data.rowCount();
    return result;
}
