#include "ledger_view.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include <userver/logging/log.hpp>

#include "analysis_config/analysis_config.hpp"
#include "analytics_errors/analytics_errors.hpp"

namespace finance_analytics {

const char* ToString(TransactionType type) {
    switch (type) {
        case TransactionType::kIncome: return "income";
        case TransactionType::kExpense: return "expense";
    }
    return "expense";
}

LedgerView::LedgerView(std::vector<Transaction> transactions, std::vector<Category> categories)
    : transactions_(std::move(transactions))
    , categories_(std::move(categories)) {
    for (size_t i = 0; i < categories_.size(); ++i) {
        const auto& category = categories_[i];
        if (category.name.empty()) {
            throw InvalidLedgerError("Category with empty name");
        }
        if (category.monthly_budget &&
            (!std::isfinite(*category.monthly_budget) || *category.monthly_budget < 0.0)) {
            throw InvalidLedgerError("Negative or non-finite budget for category: " + category.name);
        }
        if (!category_index_.emplace(category.name, i).second) {
            throw InvalidLedgerError("Duplicate category: " + category.name);
        }
    }

    for (const auto& tx : transactions_) {
        if (category_index_.find(tx.category) == category_index_.end()) {
            throw UnresolvedCategoryError(tx.category);
        }
        if (!std::isfinite(tx.amount) || tx.amount < 0.0) {
            throw InvalidLedgerError(fmt::format(
                "Transaction {} has invalid amount {}", tx.id, tx.amount));
        }
    }

    std::stable_sort(transactions_.begin(), transactions_.end(),
                     [](const Transaction& lhs, const Transaction& rhs) {
                         if (lhs.date == rhs.date) return lhs.id < rhs.id;
                         return lhs.date < rhs.date;
                     });

    LOG_DEBUG() << "Ledger snapshot: " << transactions_.size() << " transactions, "
                << categories_.size() << " categories";
}

LedgerView LedgerView::FromSnapshot(const ledger::LedgerSnapshot& snapshot) {
    std::vector<Category> categories;
    categories.reserve(snapshot.categories_size());
    for (const auto& category : snapshot.categories()) {
        Category out;
        out.name = category.name();
        if (category.has_monthly_budget()) {
            out.monthly_budget = category.monthly_budget();
        }
        categories.push_back(std::move(out));
    }

    std::vector<Transaction> transactions;
    transactions.reserve(snapshot.transactions_size());
    for (const auto& tx : snapshot.transactions()) {
        Transaction out;
        out.id = tx.id();
        out.date = Date::Parse(tx.date());
        out.description = tx.description();
        out.category = tx.category();
        switch (tx.type()) {
            case ledger::Transaction::INCOME:
                out.type = TransactionType::kIncome;
                break;
            case ledger::Transaction::EXPENSE:
                out.type = TransactionType::kExpense;
                break;
            default:
                out.type = tx.amount() < 0.0 ? TransactionType::kExpense : TransactionType::kIncome;
                break;
        }
        out.amount = std::fabs(tx.amount());
        transactions.push_back(std::move(out));
    }

    return LedgerView(std::move(transactions), std::move(categories));
}

YearMonth LedgerView::FirstMonth() const {
    if (transactions_.empty()) {
        throw AnalyticsError("Ledger is empty");
    }
    return transactions_.front().date.GetYearMonth();
}

YearMonth LedgerView::LatestMonth() const {
    if (transactions_.empty()) {
        throw AnalyticsError("Ledger is empty");
    }
    return transactions_.back().date.GetYearMonth();
}

MonthRange LedgerView::Window(int window_months, const std::optional<YearMonth>& reference) const {
    if (window_months < 1 || window_months > kMaxWindowMonths) {
        throw InvalidConfigError(fmt::format("Window must span 1 to {} months, got {}",
                                             kMaxWindowMonths, window_months));
    }
    const YearMonth last = reference ? *reference : LatestMonth();
    return MonthRange{last.Plus(-(window_months - 1)), last};
}

std::vector<const Transaction*> LedgerView::InRange(const MonthRange& range) const {
    std::vector<const Transaction*> out;
    for (const auto& tx : transactions_) {
        if (range.Contains(tx.date.GetYearMonth())) {
            out.push_back(&tx);
        }
    }
    return out;
}

std::vector<const Transaction*> LedgerView::InMonth(const YearMonth& month) const {
    return InRange(MonthRange{month, month});
}

std::map<std::string, std::vector<const Transaction*>> LedgerView::GroupByCategory(
    const MonthRange& range) const {
    std::map<std::string, std::vector<const Transaction*>> groups;
    for (const auto* tx : InRange(range)) {
        groups[tx->category].push_back(tx);
    }
    return groups;
}

}  // namespace finance_analytics
