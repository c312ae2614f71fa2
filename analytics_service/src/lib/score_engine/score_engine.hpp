#pragma once

#include <optional>
#include <string>
#include <vector>

#include "analysis_config/analysis_config.hpp"
#include "ledger/ledger_view.hpp"

namespace finance_analytics {

struct ScoreBreakdown {
    YearMonth month;
    // (income - expense) / income before clamping, empty without income
    std::optional<double> savings_rate;
    double savings_rate_score = 0.0;
    double diversification_score = 0.0;
    double consistency_score = 0.0;
    int total_score = 0;

    // Set when a factor fell back to its documented default
    bool savings_rate_undefined = false;
    bool diversification_default = false;
    bool consistency_default = false;

    std::vector<std::string> factors;
};

class ScoreEngine {
public:
    static constexpr double kNeutralFactor = 0.5;

    explicit ScoreEngine(const AnalysisConfig& config);

    // Scores the reference month, or the latest month with transactions.
    // Throws AnalyticsError for an empty ledger.
    ScoreBreakdown Score(const LedgerView& ledger) const;

    // 1 - normalized Herfindahl index of the expense shares, in [0, 1].
    // Categories without expense are ignored; empty when nothing was spent.
    static std::optional<double> Diversification(const std::vector<double>& category_expenses);

    // 1 / (1 + CV) of the monthly expense totals; empty for fewer than two
    // months or no spending at all
    static std::optional<double> Consistency(const std::vector<double>& monthly_expenses);

private:
    const AnalysisConfig config_;
};

}  // namespace finance_analytics
