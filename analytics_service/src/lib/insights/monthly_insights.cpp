#include "monthly_insights.hpp"

#include <algorithm>
#include <map>

#include "analytics_errors/analytics_errors.hpp"

namespace finance_analytics {

MonthlyInsights ComputeInsights(const LedgerView& ledger, const YearMonth& month, int top_n) {
    if (top_n < 1) {
        throw InvalidConfigError("top_categories must be at least 1, got " + std::to_string(top_n));
    }

    MonthlyInsights out;
    out.month = month;

    std::map<std::string, double> expenses;
    for (const auto* tx : ledger.InMonth(month)) {
        if (tx->type == TransactionType::kIncome) {
            out.total_income += tx->amount;
        } else {
            out.total_expense += tx->amount;
            expenses[tx->category] += tx->amount;
        }
    }
    out.balance = out.total_income - out.total_expense;
    if (out.total_income > 0.0) {
        out.savings_rate_percent = out.balance / out.total_income * 100.0;
    }

    for (const auto& [category, total] : expenses) {
        const double share = out.total_expense > 0.0 ? total / out.total_expense : 0.0;
        out.expense_distribution.push_back(CategoryTotal{category, total, share});
    }
    // Map order gives name order; stable sort keeps it for equal totals
    std::stable_sort(out.expense_distribution.begin(), out.expense_distribution.end(),
                     [](const CategoryTotal& lhs, const CategoryTotal& rhs) {
                         return lhs.total > rhs.total;
                     });

    const size_t top = std::min(out.expense_distribution.size(), static_cast<size_t>(top_n));
    out.top_expense_categories.assign(out.expense_distribution.begin(),
                                      out.expense_distribution.begin() + top);
    return out;
}

std::vector<BudgetStatus> ComputeBudgetStatus(const LedgerView& ledger, const YearMonth& month) {
    std::map<std::string, double> spent;
    for (const auto* tx : ledger.InMonth(month)) {
        if (tx->type == TransactionType::kExpense) {
            spent[tx->category] += tx->amount;
        }
    }

    std::vector<BudgetStatus> out;
    for (const auto& category : ledger.GetCategories()) {
        if (!category.monthly_budget || *category.monthly_budget <= 0.0) {
            continue;
        }
        BudgetStatus status;
        status.category = category.name;
        status.budget = *category.monthly_budget;
        auto it = spent.find(category.name);
        status.spent = it != spent.end() ? it->second : 0.0;
        status.remaining = status.budget - status.spent;
        status.utilization_percent = status.spent / status.budget * 100.0;
        status.over_budget = status.spent > status.budget;
        out.push_back(std::move(status));
    }
    std::sort(out.begin(), out.end(), [](const BudgetStatus& lhs, const BudgetStatus& rhs) {
        return lhs.category < rhs.category;
    });
    return out;
}

}  // namespace finance_analytics
