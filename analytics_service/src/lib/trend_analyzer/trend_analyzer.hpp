#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ledger/date.hpp"
#include "ledger/ledger_view.hpp"

namespace finance_analytics {

struct MonthlyAggregate {
    YearMonth month;
    std::string category;
    double total_income = 0.0;
    double total_expense = 0.0;
    int transaction_count = 0;

    double Total(TransactionType flow) const {
        return flow == TransactionType::kIncome ? total_income : total_expense;
    }
};

// Month-over-month change. An empty percent is the "no prior baseline" marker:
// the first period of a series, or a prior period with a zero total.
struct GrowthRate {
    YearMonth month;
    std::optional<double> percent;

    bool HasBaseline() const { return percent.has_value(); }
};

// Values of one category's dominant flow, one per month without gaps
struct CategorySeries {
    std::string category;
    TransactionType flow = TransactionType::kExpense;
    YearMonth first_month;
    std::vector<double> values;
};

class TrendAnalyzer {
public:
    // Aggregates grouped by month then category name. Each category active in
    // the window is reported for every month of it, zero-filled, so a
    // category's months are always contiguous.
    static std::vector<MonthlyAggregate> Aggregate(
        const LedgerView& ledger,
        int window_months,
        const std::optional<YearMonth>& reference = std::nullopt);

    static std::vector<GrowthRate> GrowthRates(
        const std::vector<MonthlyAggregate>& aggregates,
        const std::string& category);

    // Distinct categories in name order
    static std::vector<std::string> Categories(const std::vector<MonthlyAggregate>& aggregates);

    // Expense unless the category's income total is strictly larger
    static TransactionType DominantFlow(
        const std::vector<MonthlyAggregate>& aggregates,
        const std::string& category);

    // Series starting at the category's first month with activity. Months
    // before the category first appears are not history.
    static CategorySeries Series(
        const std::vector<MonthlyAggregate>& aggregates,
        const std::string& category);
};

}  // namespace finance_analytics
