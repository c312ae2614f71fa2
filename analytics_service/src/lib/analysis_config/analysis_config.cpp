#include "analysis_config.hpp"

#include <cmath>

#include <fmt/format.h>

#include "analytics_errors/analytics_errors.hpp"

namespace finance_analytics {

namespace {

constexpr double kWeightsTotal = 100.0;
constexpr double kWeightsTolerance = 1e-6;

void RequireAtLeast(const char* name, int value, int minimum) {
    if (value < minimum) {
        throw InvalidConfigError(fmt::format("{} must be at least {}, got {}", name, minimum, value));
    }
}

void RequireAtMost(const char* name, int value, int maximum) {
    if (value > maximum) {
        throw InvalidConfigError(fmt::format("{} must be at most {}, got {}", name, maximum, value));
    }
}

void RequireWeight(const char* name, double value) {
    if (!std::isfinite(value) || value < 0.0) {
        throw InvalidConfigError(fmt::format("{} weight must be a non-negative number, got {}",
                                             name, value));
    }
}

}  // namespace

void ValidateConfig(const AnalysisConfig& config) {
    if (!std::isfinite(config.anomaly_threshold) || config.anomaly_threshold <= 0.0) {
        throw InvalidConfigError(fmt::format("anomaly_threshold must be positive, got {}",
                                             config.anomaly_threshold));
    }
    RequireAtLeast("window_months", config.window_months, 1);
    RequireAtLeast("horizon_months", config.horizon_months, 1);
    RequireAtMost("window_months", config.window_months, kMaxWindowMonths);
    RequireAtMost("horizon_months", config.horizon_months, kMaxHorizonMonths);
    RequireAtLeast("min_anomaly_samples", config.min_anomaly_samples, 2);
    RequireAtLeast("min_projection_points", config.min_projection_points, 2);
    RequireAtLeast("top_categories", config.top_categories, 1);

    RequireWeight("savings", config.weights.savings);
    RequireWeight("diversification", config.weights.diversification);
    RequireWeight("consistency", config.weights.consistency);
    const double total =
        config.weights.savings + config.weights.diversification + config.weights.consistency;
    if (std::fabs(total - kWeightsTotal) > kWeightsTolerance) {
        throw InvalidConfigError(fmt::format("score weights must sum to {}, got {}",
                                             kWeightsTotal, total));
    }
}

AnalysisConfig ApplyOptions(const AnalysisConfig& defaults,
                            const analytics::AnalysisOptions& options) {
    AnalysisConfig config = defaults;
    if (options.has_anomaly_threshold()) {
        config.anomaly_threshold = options.anomaly_threshold();
    }
    if (options.has_window_months()) {
        config.window_months = options.window_months();
    }
    if (options.has_horizon_months()) {
        config.horizon_months = options.horizon_months();
    }
    if (options.has_savings_weight()) {
        config.weights.savings = options.savings_weight();
    }
    if (options.has_diversification_weight()) {
        config.weights.diversification = options.diversification_weight();
    }
    if (options.has_consistency_weight()) {
        config.weights.consistency = options.consistency_weight();
    }
    if (options.has_reference_month()) {
        config.reference_month = YearMonth::Parse(options.reference_month());
    }
    if (options.has_min_anomaly_samples()) {
        config.min_anomaly_samples = options.min_anomaly_samples();
    }
    if (options.has_min_projection_points()) {
        config.min_projection_points = options.min_projection_points();
    }
    if (options.has_top_categories()) {
        config.top_categories = options.top_categories();
    }
    ValidateConfig(config);
    return config;
}

}  // namespace finance_analytics
