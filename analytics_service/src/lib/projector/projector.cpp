#include "projector.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

#include <fmt/format.h>

#include <userver/logging/log.hpp>

#include "analytics_errors/analytics_errors.hpp"
#include "stats/statistics.hpp"

namespace finance_analytics {

namespace {

constexpr int kMonthsPerYear = 12;
constexpr double kFlatSlope = 1e-9;

TrendDirection DirectionOf(double slope) {
    if (slope > kFlatSlope) return TrendDirection::kIncreasing;
    if (slope < -kFlatSlope) return TrendDirection::kDecreasing;
    return TrendDirection::kFlat;
}

}  // namespace

const char* ToString(TrendDirection direction) {
    switch (direction) {
        case TrendDirection::kIncreasing: return "increasing";
        case TrendDirection::kDecreasing: return "decreasing";
        case TrendDirection::kFlat: return "flat";
    }
    return "flat";
}

Projector::Projector(const AnalysisConfig& config)
    : config_(config) {
    ValidateConfig(config_);
}

ProjectionResult Projector::Project(const std::vector<MonthlyAggregate>& aggregates,
                                    const std::string& category,
                                    int horizon_months) const {
    if (horizon_months < 1 || horizon_months > kMaxHorizonMonths) {
        throw InvalidConfigError(fmt::format("horizon_months must be within [1, {}], got {}",
                                             kMaxHorizonMonths, horizon_months));
    }

    const CategorySeries series = TrendAnalyzer::Series(aggregates, category);
    const int points = static_cast<int>(series.values.size());
    if (points < config_.min_projection_points) {
        throw InsufficientHistoryError(category, points, config_.min_projection_points);
    }

    const stats::LinearFit fit = stats::FitLine(series.values);

    ProjectionResult result;
    result.category = category;
    result.flow = series.flow;
    result.first_projected_month = series.first_month.Plus(points);
    result.slope = fit.slope;
    result.intercept = fit.intercept;
    result.r_squared = fit.r_squared;
    result.history_points = points;
    result.trend = fit.constant ? TrendDirection::kFlat : DirectionOf(fit.slope);
    result.flat_history = fit.constant;
    result.sparse_history = points < kMeaningfulHistory;
    result.data_coverage = std::min(static_cast<double>(points) / kMonthsPerYear, 1.0);

    result.monthly.reserve(static_cast<size_t>(horizon_months));
    for (int step = 0; step < horizon_months; ++step) {
        // A falling trend may cross zero; amounts cannot
        result.monthly.push_back(std::max(0.0, fit.At(static_cast<double>(points + step))));
    }

    result.average_monthly =
        std::accumulate(result.monthly.begin(), result.monthly.end(), 0.0) / horizon_months;
    if (horizon_months >= kMonthsPerYear) {
        result.annual_total =
            std::accumulate(result.monthly.begin(), result.monthly.begin() + kMonthsPerYear, 0.0);
    } else {
        result.annual_total = result.average_monthly * kMonthsPerYear;
    }

    LOG_DEBUG() << "Projection for '" << category << "' (" << ToString(result.flow) << "): "
                << ToString(result.trend) << ", slope " << result.slope << ", R^2 "
                << result.r_squared << ", annual " << result.annual_total;
    return result;
}

std::vector<CategoryProjection> Projector::ProjectAll(
    const std::vector<MonthlyAggregate>& aggregates) const {
    std::vector<CategoryProjection> out;
    for (const auto& category : TrendAnalyzer::Categories(aggregates)) {
        CategoryProjection entry;
        entry.category = category;
        try {
            entry.projection = Project(aggregates, category, config_.horizon_months);
        } catch (const InsufficientHistoryError& e) {
            LOG_INFO() << "No projection: " << e.what();
            entry.insufficient_history = e.what();
        }
        out.push_back(std::move(entry));
    }
    return out;
}

}  // namespace finance_analytics
