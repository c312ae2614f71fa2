#pragma once

#include <string>
#include <vector>

#include "ledger/ledger_view.hpp"

namespace finance_analytics {

struct CategoryTotal {
    std::string category;
    double total = 0.0;
    // Fraction of the month's expenses
    double share = 0.0;
};

struct MonthlyInsights {
    YearMonth month;
    double total_income = 0.0;
    double total_expense = 0.0;
    double balance = 0.0;
    // Percent of income kept, zero when there was no income
    double savings_rate_percent = 0.0;
    std::vector<CategoryTotal> top_expense_categories;
    // Every category with expenses, largest first
    std::vector<CategoryTotal> expense_distribution;
};

struct BudgetStatus {
    std::string category;
    double budget = 0.0;
    double spent = 0.0;
    double remaining = 0.0;
    double utilization_percent = 0.0;
    bool over_budget = false;
};

MonthlyInsights ComputeInsights(const LedgerView& ledger, const YearMonth& month, int top_n);

// Categories with a positive monthly budget, in name order
std::vector<BudgetStatus> ComputeBudgetStatus(const LedgerView& ledger, const YearMonth& month);

}  // namespace finance_analytics
