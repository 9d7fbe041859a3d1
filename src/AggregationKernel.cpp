#include "AggregationKernel.h"
#include "CommonUtils.h"
#include "Statistics.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace {
constexpr long double kInt64Limit = 9.2e18L;

struct NumericView {
    std::vector<double> values;
    std::vector<int64_t> integers;
    bool allIntegral = true;
};

NumericView numericView(const std::vector<CellValue>& cells) {
    NumericView view;
    view.values.reserve(cells.size());
    for (const auto& cell : cells) {
        if (CellUtils::isMissing(cell) || CellUtils::kindOf(cell) == CellKind::DATE) continue;
        const auto number = CellUtils::toNumber(cell);
        if (!number.has_value()) continue;
        view.values.push_back(*number);
        if (CellUtils::kindOf(cell) == CellKind::INTEGER) {
            view.integers.push_back(std::get<int64_t>(cell));
        } else {
            view.allIntegral = false;
        }
    }
    if (view.values.empty()) view.allIntegral = false;
    return view;
}

CellValue real(double value, int decimals) {
    if (!std::isfinite(value)) return CellValue{};
    return CellValue{CommonUtils::roundTo(value, decimals)};
}

CellValue sumOf(const NumericView& view, int decimals) {
    if (view.allIntegral) {
        long double wide = 0.0L;
        for (int64_t v : view.integers) wide += static_cast<long double>(v);
        if (std::fabs(wide) >= kInt64Limit) return real(static_cast<double>(wide), decimals);
        int64_t total = 0;
        for (int64_t v : view.integers) total += v;
        return CellValue{total};
    }
    long double total = 0.0L;
    for (double v : view.values) total += static_cast<long double>(v);
    return real(static_cast<double>(total), decimals);
}

CellValue extremeOf(const std::vector<CellValue>& cells, const NumericView& view, bool wantMax, int decimals) {
    std::vector<CivilDate> dates;
    size_t nonMissing = 0;
    for (const auto& cell : cells) {
        if (CellUtils::isMissing(cell)) continue;
        ++nonMissing;
        if (CellUtils::kindOf(cell) == CellKind::DATE) dates.push_back(std::get<CivilDate>(cell));
    }
    if (!dates.empty() && dates.size() == nonMissing) {
        const auto it = wantMax ? std::max_element(dates.begin(), dates.end())
                                : std::min_element(dates.begin(), dates.end());
        return CellValue{*it};
    }

    if (view.values.empty()) return CellValue{};
    if (view.allIntegral) {
        const auto it = wantMax ? std::max_element(view.integers.begin(), view.integers.end())
                                : std::min_element(view.integers.begin(), view.integers.end());
        return CellValue{*it};
    }
    const auto it = wantMax ? std::max_element(view.values.begin(), view.values.end())
                            : std::min_element(view.values.begin(), view.values.end());
    return real(*it, decimals);
}

CellValue truthOf(const std::vector<CellValue>& cells, bool requireAll) {
    for (const auto& cell : cells) {
        if (CellUtils::isMissing(cell)) continue;
        const auto truth = CellUtils::toBoolean(cell);
        if (!truth.has_value()) continue;
        if (requireAll && !*truth) return CellValue{false};
        if (!requireAll && *truth) return CellValue{true};
    }
    return CellValue{requireAll};
}
} // namespace

namespace AggregationKernel {

CellValue apply(AggregationFunction function, const std::vector<CellValue>& cells, int decimals) {
    switch (function) {
        case AggregationFunction::COUNT: {
            const auto n = std::count_if(cells.begin(), cells.end(), [](const CellValue& c) {
                return !CellUtils::isMissing(c);
            });
            return CellValue{static_cast<int64_t>(n)};
        }
        case AggregationFunction::COUNT_DISTINCT: {
            std::unordered_set<std::string> keys;
            for (const auto& cell : cells) {
                if (!CellUtils::isMissing(cell)) keys.insert(CellUtils::toKey(cell));
            }
            return CellValue{static_cast<int64_t>(keys.size())};
        }
        case AggregationFunction::ANY:
            return truthOf(cells, false);
        case AggregationFunction::ALL:
            return truthOf(cells, true);
        default:
            break;
    }

    const NumericView view = numericView(cells);
    switch (function) {
        case AggregationFunction::SUM:
            if (view.values.empty()) return CellValue{int64_t{0}};
            return sumOf(view, decimals);
        case AggregationFunction::MIN:
            return extremeOf(cells, view, false, decimals);
        case AggregationFunction::MAX:
            return extremeOf(cells, view, true, decimals);
        default:
            break;
    }

    if (view.values.empty()) return CellValue{};
    switch (function) {
        case AggregationFunction::MEAN:
            return real(Statistics::mean(view.values), decimals);
        case AggregationFunction::MEDIAN:
            return real(CommonUtils::medianByNth(view.values), decimals);
        case AggregationFunction::STD:
            if (view.values.size() < 2) return CellValue{};
            return real(std::sqrt(Statistics::sampleVariance(view.values)), decimals);
        case AggregationFunction::VAR:
            if (view.values.size() < 2) return CellValue{};
            return real(Statistics::sampleVariance(view.values), decimals);
        case AggregationFunction::P90:
            return real(Statistics::percentile(view.values, 0.90), decimals);
        case AggregationFunction::P95:
            return real(Statistics::percentile(view.values, 0.95), decimals);
        case AggregationFunction::P99:
            return real(Statistics::percentile(view.values, 0.99), decimals);
        default:
            break;
    }
    return CellValue{};
}

std::vector<CellValue> gather(const std::vector<CellValue>& column, const std::vector<size_t>& rows) {
    std::vector<CellValue> out;
    out.reserve(rows.size());
    for (size_t row : rows) out.push_back(column[row]);
    return out;
}

} // namespace AggregationKernel
