#include "score_engine.hpp"

#include <algorithm>
#include <cmath>
#include <map>

#include <fmt/format.h>

#include <userver/logging/log.hpp>

#include "analytics_errors/analytics_errors.hpp"
#include "stats/statistics.hpp"

namespace finance_analytics {

namespace {

std::string SavingsNote(const std::optional<double>& rate) {
    if (!rate) return "No income recorded for the period";
    if (*rate >= 0.20) return "Excellent savings rate";
    if (*rate >= 0.10) return "Good savings rate";
    if (*rate >= 0.0) return "Low savings rate";
    return "Spending more than earning";
}

std::string DiversificationNote(const std::optional<double>& factor) {
    if (!factor) return "No expenses recorded for the period";
    if (*factor >= 2.0 / 3.0) return "Well diversified spending";
    if (*factor >= 1.0 / 3.0) return "Moderately diversified spending";
    return "Spending concentrated in few categories";
}

std::string ConsistencyNote(const std::optional<double>& factor) {
    if (!factor) return "Not enough history to judge consistency";
    if (*factor >= 0.8) return "Consistent monthly spending";
    if (*factor >= 0.5) return "Moderately variable monthly spending";
    return "Highly variable monthly spending";
}

}  // namespace

ScoreEngine::ScoreEngine(const AnalysisConfig& config)
    : config_(config) {
    ValidateConfig(config_);
}

std::optional<double> ScoreEngine::Diversification(const std::vector<double>& category_expenses) {
    double total = 0.0;
    int spenders = 0;
    for (double expense : category_expenses) {
        if (expense > 0.0) {
            total += expense;
            ++spenders;
        }
    }
    if (spenders == 0) {
        return std::nullopt;
    }
    if (spenders == 1) {
        return 0.0;
    }

    double hhi = 0.0;
    for (double expense : category_expenses) {
        if (expense > 0.0) {
            const double share = expense / total;
            hhi += share * share;
        }
    }
    const double floor = 1.0 / spenders;
    const double normalized = (hhi - floor) / (1.0 - floor);
    return std::clamp(1.0 - normalized, 0.0, 1.0);
}

std::optional<double> ScoreEngine::Consistency(const std::vector<double>& monthly_expenses) {
    if (monthly_expenses.size() < 2) {
        return std::nullopt;
    }
    const stats::Moments moments = stats::ComputeMoments(monthly_expenses);
    if (moments.mean <= 0.0) {
        return std::nullopt;
    }
    return 1.0 / (1.0 + stats::CoefficientOfVariation(moments));
}

ScoreBreakdown ScoreEngine::Score(const LedgerView& ledger) const {
    if (ledger.Empty()) {
        throw AnalyticsError("Cannot score an empty ledger");
    }

    ScoreBreakdown out;
    out.month = config_.reference_month ? *config_.reference_month : ledger.LatestMonth();

    double income = 0.0, expense = 0.0;
    std::map<std::string, double> expense_by_category;
    for (const auto* tx : ledger.InMonth(out.month)) {
        if (tx->type == TransactionType::kIncome) {
            income += tx->amount;
        } else {
            expense += tx->amount;
            expense_by_category[tx->category] += tx->amount;
        }
    }

    // Savings
    if (income > 0.0) {
        out.savings_rate = (income - expense) / income;
        out.savings_rate_score = std::clamp(*out.savings_rate, 0.0, 1.0) * config_.weights.savings;
    } else {
        out.savings_rate_undefined = true;
        out.savings_rate_score = 0.0;
    }

    // Diversification
    std::vector<double> shares;
    shares.reserve(expense_by_category.size());
    for (const auto& [category, total] : expense_by_category) {
        shares.push_back(total);
    }
    const auto diversification = Diversification(shares);
    out.diversification_default = !diversification.has_value();
    out.diversification_score =
        diversification.value_or(kNeutralFactor) * config_.weights.diversification;

    // Consistency over the trailing window, starting no earlier than the data
    const MonthRange window = ledger.Window(config_.window_months, out.month);
    const YearMonth start = std::max(window.first, ledger.FirstMonth());
    std::vector<double> monthly_expenses;
    if (start <= out.month) {
        const MonthRange history{start, out.month};
        monthly_expenses.assign(static_cast<size_t>(history.Size()), 0.0);
        for (const auto* tx : ledger.InRange(history)) {
            if (tx->type == TransactionType::kExpense) {
                monthly_expenses[static_cast<size_t>(start.MonthsUntil(tx->date.GetYearMonth()))] +=
                    tx->amount;
            }
        }
    }
    const auto consistency = Consistency(monthly_expenses);
    out.consistency_default = !consistency.has_value();
    out.consistency_score = consistency.value_or(kNeutralFactor) * config_.weights.consistency;

    const double total = out.savings_rate_score + out.diversification_score + out.consistency_score;
    out.total_score = static_cast<int>(std::clamp<long>(std::lround(total), 0, 100));

    out.factors.push_back(SavingsNote(out.savings_rate));
    out.factors.push_back(DiversificationNote(diversification));
    out.factors.push_back(ConsistencyNote(consistency));

    LOG_INFO() << fmt::format("Health score for {}: {} (savings {:.1f}, diversification {:.1f}, "
                              "consistency {:.1f})",
                              out.month.ToString(), out.total_score, out.savings_rate_score,
                              out.diversification_score, out.consistency_score);
    return out;
}

}  // namespace finance_analytics
