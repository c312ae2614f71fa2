#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <ledger/ledger.pb.h>

#include "ledger/date.hpp"

namespace finance_analytics {

enum class TransactionType {
    kIncome,
    kExpense,
};

const char* ToString(TransactionType type);

struct Transaction {
    int64_t id = 0;
    Date date;
    std::string description;
    // Magnitude, never negative; the direction is carried by type
    double amount = 0.0;
    std::string category;
    TransactionType type = TransactionType::kExpense;
};

struct Category {
    std::string name;
    std::optional<double> monthly_budget;
};

// Immutable, time-ordered snapshot of a ledger. Every transaction is
// guaranteed to reference a known category.
class LedgerView {
public:
    LedgerView(std::vector<Transaction> transactions, std::vector<Category> categories);

    // Applies the wire sign convention: with an unspecified type a negative
    // amount is an expense and a non-negative one is income
    static LedgerView FromSnapshot(const ledger::LedgerSnapshot& snapshot);

    const std::vector<Transaction>& GetTransactions() const { return transactions_; }
    const std::vector<Category>& GetCategories() const { return categories_; }

    bool Empty() const { return transactions_.empty(); }

    YearMonth FirstMonth() const;
    YearMonth LatestMonth() const;

    // Trailing window of window_months months ending at reference, or at the
    // latest transaction month when no reference is given
    MonthRange Window(int window_months, const std::optional<YearMonth>& reference) const;

    std::vector<const Transaction*> InRange(const MonthRange& range) const;
    std::vector<const Transaction*> InMonth(const YearMonth& month) const;

    // Category name -> transactions in the range, ordered by date
    std::map<std::string, std::vector<const Transaction*>> GroupByCategory(
        const MonthRange& range) const;

private:
    std::vector<Transaction> transactions_;
    std::vector<Category> categories_;
    std::unordered_map<std::string, size_t> category_index_;
};

}  // namespace finance_analytics
