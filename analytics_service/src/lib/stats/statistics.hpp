#pragma once

#include <vector>

namespace finance_analytics::stats {

// Standard deviations at or below this share of the mean magnitude are
// treated as zero
inline constexpr double kDegenerateEpsilon = 1e-12;

struct Moments {
    int count = 0;
    double mean = 0.0;
    // Sample standard deviation (n - 1), zero for fewer than two values
    double stddev = 0.0;
};

Moments ComputeMoments(const std::vector<double>& values);

bool IsDegenerate(const Moments& moments);

// stddev / mean, requires a positive mean
double CoefficientOfVariation(const Moments& moments);

struct LinearFit {
    double slope = 0.0;
    double intercept = 0.0;
    double r_squared = 0.0;
    // All observations equal: slope is zero and the fit is exact
    bool constant = false;

    double At(double x) const { return intercept + slope * x; }
};

// Ordinary least squares of values[i] against i. Requires at least two values.
LinearFit FitLine(const std::vector<double>& values);

}  // namespace finance_analytics::stats
