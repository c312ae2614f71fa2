#include "statistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace finance_analytics::stats {

Moments ComputeMoments(const std::vector<double>& values) {
    Moments out;
    double m2 = 0.0;
    // Welford update, stable for long series of similar amounts
    for (double value : values) {
        out.count += 1;
        double delta = value - out.mean;
        out.mean += delta / static_cast<double>(out.count);
        m2 += delta * (value - out.mean);
    }
    if (out.count > 1) {
        double var = m2 / static_cast<double>(out.count - 1);
        out.stddev = var > 0.0 ? std::sqrt(var) : 0.0;
    }
    return out;
}

bool IsDegenerate(const Moments& moments) {
    return moments.stddev <= kDegenerateEpsilon * std::max(1.0, std::fabs(moments.mean));
}

double CoefficientOfVariation(const Moments& moments) {
    if (moments.mean <= 0.0) {
        throw std::invalid_argument("Coefficient of variation requires a positive mean");
    }
    return moments.stddev / moments.mean;
}

LinearFit FitLine(const std::vector<double>& values) {
    const size_t n = values.size();
    if (n < 2) {
        throw std::invalid_argument("Linear fit requires at least two points");
    }

    double sum_x = 0.0, sum_y = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sum_x += static_cast<double>(i);
        sum_y += values[i];
    }
    const double mean_x = sum_x / static_cast<double>(n);
    const double mean_y = sum_y / static_cast<double>(n);

    double sxx = 0.0, sxy = 0.0, syy = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double dx = static_cast<double>(i) - mean_x;
        double dy = values[i] - mean_y;
        sxx += dx * dx;
        sxy += dx * dy;
        syy += dy * dy;
    }

    LinearFit fit;
    if (syy <= kDegenerateEpsilon * std::max(1.0, mean_y * mean_y) * static_cast<double>(n)) {
        fit.constant = true;
        fit.slope = 0.0;
        fit.intercept = mean_y;
        fit.r_squared = 1.0;
        return fit;
    }

    // sxx > 0 whenever n >= 2 since x takes distinct values
    fit.slope = sxy / sxx;
    fit.intercept = mean_y - fit.slope * mean_x;

    double ss_res = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double residual = values[i] - fit.At(static_cast<double>(i));
        ss_res += residual * residual;
    }
    fit.r_squared = std::clamp(1.0 - ss_res / syy, 0.0, 1.0);
    return fit;
}

}  // namespace finance_analytics::stats
