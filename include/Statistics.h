#pragma once
#include <cstddef>
#include <vector>

struct NumericSummary {
    size_t count = 0;
    double sum = 0.0;
    double mean = 0.0;
    double median = 0.0;
    double variance = 0.0;  // sample variance (n - 1), 0 for a single value
    double stddev = 0.0;
    double min = 0.0;
    double max = 0.0;
    double q1 = 0.0;
    double q3 = 0.0;
    double iqr = 0.0;
    double mode = 0.0;
};

namespace Statistics {
/**
 * @brief Summarizes finite values; non-finite entries are ignored.
 * @post count == 0 means every other field is zero and meaningless.
 */
NumericSummary summarize(const std::vector<double>& values);

double mean(const std::vector<double>& values);

/// Sample variance with n - 1 denominator; requires at least two values, otherwise returns 0.
double sampleVariance(const std::vector<double>& values);

/// Most frequent value; ties resolve to the smallest value.
double mode(const std::vector<double>& values);

/// Linear-interpolated percentile, p in [0, 1].
double percentile(const std::vector<double>& values, double p);
} // namespace Statistics
