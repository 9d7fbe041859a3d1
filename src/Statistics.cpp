#include "Statistics.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>
#include <map>

namespace {
std::vector<double> finiteOnly(const std::vector<double>& values) {
    std::vector<double> finite;
    finite.reserve(values.size());
    for (double value : values) {
        if (std::isfinite(value)) finite.push_back(value);
    }
    return finite;
}
} // namespace

NumericSummary Statistics::summarize(const std::vector<double>& values) {
    NumericSummary out;
    const std::vector<double> finite = finiteOnly(values);
    if (finite.empty()) return out;

    // Welford running moments.
    double mean = 0.0;
    double m2 = 0.0;
    double sum = 0.0;
    size_t count = 0;
    for (double value : finite) {
        ++count;
        sum += value;
        const double delta = value - mean;
        mean += delta / static_cast<double>(count);
        m2 += delta * (value - mean);
    }

    out.count = count;
    out.sum = sum;
    out.mean = mean;
    out.variance = (count > 1) ? (m2 / static_cast<double>(count - 1)) : 0.0;
    out.stddev = std::sqrt(out.variance);

    const auto mm = std::minmax_element(finite.begin(), finite.end());
    out.min = *mm.first;
    out.max = *mm.second;
    out.median = CommonUtils::medianByNth(finite);
    out.q1 = CommonUtils::quantileByNth(finite, 0.25);
    out.q3 = CommonUtils::quantileByNth(finite, 0.75);
    out.iqr = out.q3 - out.q1;
    out.mode = mode(finite);
    return out;
}

double Statistics::mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    long double total = 0.0L;
    for (double v : values) total += static_cast<long double>(v);
    return static_cast<double>(total / static_cast<long double>(values.size()));
}

double Statistics::sampleVariance(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    const double mu = mean(values);
    double ss = 0.0;
    for (double v : values) {
        const double d = v - mu;
        ss += d * d;
    }
    return ss / static_cast<double>(values.size() - 1);
}

double Statistics::mode(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    std::map<double, size_t> freq;
    for (double v : values) ++freq[v];
    size_t best = 0;
    double bestValue = values.front();
    for (const auto& [value, count] : freq) {
        if (count > best) {
            best = count;
            bestValue = value;
        }
    }
    return bestValue;
}

double Statistics::percentile(const std::vector<double>& values, double p) {
    return CommonUtils::quantileByNth(values, p);
}
