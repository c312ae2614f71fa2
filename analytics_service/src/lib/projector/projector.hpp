#pragma once

#include <optional>
#include <string>
#include <vector>

#include "analysis_config/analysis_config.hpp"
#include "trend_analyzer/trend_analyzer.hpp"

namespace finance_analytics {

enum class TrendDirection {
    kIncreasing,
    kDecreasing,
    kFlat,
};

const char* ToString(TrendDirection direction);

struct ProjectionResult {
    std::string category;
    TransactionType flow = TransactionType::kExpense;
    YearMonth first_projected_month;
    // One value per horizon month, never negative
    std::vector<double> monthly;
    double annual_total = 0.0;
    double average_monthly = 0.0;
    double slope = 0.0;
    double intercept = 0.0;
    // Goodness of fit, left to the caller to interpret
    double r_squared = 0.0;
    int history_points = 0;
    TrendDirection trend = TrendDirection::kFlat;
    bool flat_history = false;
    // Fewer points than a meaningful slope needs
    bool sparse_history = false;
    // Share of a full year of history, capped at 1
    double data_coverage = 0.0;
};

// Outcome for one category of a multi-category run: either a projection or
// the reason it could not be produced
struct CategoryProjection {
    std::string category;
    std::optional<ProjectionResult> projection;
    std::string insufficient_history;
};

// Least-squares linear trend per category, extrapolated forward
class Projector {
public:
    static constexpr int kMeaningfulHistory = 6;

    explicit Projector(const AnalysisConfig& config);

    // Throws InsufficientHistoryError
    ProjectionResult Project(const std::vector<MonthlyAggregate>& aggregates,
                             const std::string& category,
                             int horizon_months) const;

    ProjectionResult Project(const std::vector<MonthlyAggregate>& aggregates,
                             const std::string& category) const {
        return Project(aggregates, category, config_.horizon_months);
    }

    std::vector<CategoryProjection> ProjectAll(const std::vector<MonthlyAggregate>& aggregates) const;

private:
    const AnalysisConfig config_;
};

}  // namespace finance_analytics
