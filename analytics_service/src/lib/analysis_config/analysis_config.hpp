#pragma once

#include <optional>

#include <analytics/analytics.pb.h>

#include "ledger/date.hpp"

namespace finance_analytics {

// Both come from requests; each window month costs one row per category
constexpr int kMaxWindowMonths = 1200;
constexpr int kMaxHorizonMonths = 120;

struct ScoreWeights {
    double savings = 40.0;
    double diversification = 30.0;
    double consistency = 30.0;
};

// Per-call analysis settings. Engines never keep a copy between calls.
struct AnalysisConfig {
    // Two standard deviations: about 95% coverage if amounts were normally
    // distributed. Spending is skewed, so treat this as a rule of thumb.
    double anomaly_threshold = 2.0;
    int window_months = 12;
    int horizon_months = 12;
    ScoreWeights weights;
    int min_anomaly_samples = 3;
    int min_projection_points = 2;
    int top_categories = 5;
    // Reporting period; the latest transaction month when empty
    std::optional<YearMonth> reference_month;
};

// Throws InvalidConfigError describing the first offending setting
void ValidateConfig(const AnalysisConfig& config);

// Returns defaults with every option present in the request applied, validated
AnalysisConfig ApplyOptions(const AnalysisConfig& defaults,
                            const analytics::AnalysisOptions& options);

}  // namespace finance_analytics
