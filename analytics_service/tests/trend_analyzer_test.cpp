#include <userver/utest/utest.hpp>

#include "ledger_fixtures.hpp"
#include "trend_analyzer/trend_analyzer.hpp"

namespace finance_analytics {

using test_utils::Expense;
using test_utils::Income;

namespace {

const MonthlyAggregate* Find(const std::vector<MonthlyAggregate>& aggregates,
                             const YearMonth& month, const std::string& category) {
    for (const auto& aggregate : aggregates) {
        if (aggregate.month == month && aggregate.category == category) {
            return &aggregate;
        }
    }
    return nullptr;
}

}  // namespace

TEST(TrendAnalyzerTest, ZeroFillsMissingMonths) {
    auto ledger = test_utils::MakeLedger({
        Expense(1, "2024-01-05", 120.0, "Food"),
        Expense(2, "2024-04-20", 80.0, "Food"),
    });

    const auto aggregates = TrendAnalyzer::Aggregate(ledger, 4);
    ASSERT_EQ(aggregates.size(), 4u);
    EXPECT_EQ(aggregates[0].month, (YearMonth{2024, 1}));
    EXPECT_DOUBLE_EQ(aggregates[0].total_expense, 120.0);
    EXPECT_EQ(aggregates[1].month, (YearMonth{2024, 2}));
    EXPECT_DOUBLE_EQ(aggregates[1].total_expense, 0.0);
    EXPECT_EQ(aggregates[1].transaction_count, 0);
    EXPECT_EQ(aggregates[2].month, (YearMonth{2024, 3}));
    EXPECT_EQ(aggregates[3].month, (YearMonth{2024, 4}));
    EXPECT_DOUBLE_EQ(aggregates[3].total_expense, 80.0);
}

TEST(TrendAnalyzerTest, ConservesTotals) {
    auto ledger = test_utils::MakeLedger({
        Income(1, "2024-01-01", 3000.0, "Salary"),
        Expense(2, "2024-01-03", 45.25, "Food"),
        Expense(3, "2024-01-19", 54.75, "Food"),
        Expense(4, "2024-02-02", 900.0, "Rent"),
        Income(5, "2024-02-01", 3000.0, "Salary"),
        Income(6, "2024-02-11", 15.0, "Food"),
    });

    const auto aggregates = TrendAnalyzer::Aggregate(ledger, 12);
    double income = 0.0, expense = 0.0;
    int count = 0;
    for (const auto& aggregate : aggregates) {
        income += aggregate.total_income;
        expense += aggregate.total_expense;
        count += aggregate.transaction_count;
    }
    EXPECT_DOUBLE_EQ(income, 6015.0);
    EXPECT_DOUBLE_EQ(expense, 1000.0);
    EXPECT_EQ(count, 6);

    const auto* food = Find(aggregates, YearMonth{2024, 1}, "Food");
    ASSERT_NE(food, nullptr);
    EXPECT_DOUBLE_EQ(food->total_expense, 100.0);
    EXPECT_EQ(food->transaction_count, 2);
}

TEST(TrendAnalyzerTest, OrdersByMonthThenCategory) {
    auto ledger = test_utils::MakeLedger({
        Expense(1, "2024-02-01", 10.0, "Transport"),
        Expense(2, "2024-01-01", 10.0, "Food"),
        Expense(3, "2024-01-02", 10.0, "Bills"),
    });

    const auto aggregates = TrendAnalyzer::Aggregate(ledger, 2);
    ASSERT_EQ(aggregates.size(), 6u);
    EXPECT_EQ(aggregates[0].category, "Bills");
    EXPECT_EQ(aggregates[1].category, "Food");
    EXPECT_EQ(aggregates[2].category, "Transport");
    EXPECT_EQ(aggregates[2].month, (YearMonth{2024, 1}));
    EXPECT_EQ(aggregates[3].month, (YearMonth{2024, 2}));
    EXPECT_EQ(TrendAnalyzer::Categories(aggregates),
              (std::vector<std::string>{"Bills", "Food", "Transport"}));
}

TEST(TrendAnalyzerTest, ExcludesTransactionsOutsideWindow) {
    auto ledger = test_utils::MakeLedger({
        Expense(1, "2022-12-31", 500.0, "Food"),
        Expense(2, "2023-01-01", 10.0, "Food"),
        Expense(3, "2023-12-31", 20.0, "Food"),
    });

    const auto aggregates = TrendAnalyzer::Aggregate(ledger, 12);
    ASSERT_EQ(aggregates.size(), 12u);
    EXPECT_EQ(aggregates.front().month, (YearMonth{2023, 1}));
    double expense = 0.0;
    for (const auto& aggregate : aggregates) {
        expense += aggregate.total_expense;
    }
    EXPECT_DOUBLE_EQ(expense, 30.0);
}

TEST(TrendAnalyzerTest, GrowthRatesMarkMissingBaseline) {
    auto transactions = test_utils::MonthlySeries("Food", YearMonth{2024, 1}, {100.0, 150.0, 0.0, 60.0});
    // Drop the zero month so it is zero-filled rather than a zero amount
    transactions.erase(transactions.begin() + 2);
    auto ledger = test_utils::MakeLedger(std::move(transactions));

    const auto aggregates = TrendAnalyzer::Aggregate(ledger, 4);
    const auto rates = TrendAnalyzer::GrowthRates(aggregates, "Food");
    ASSERT_EQ(rates.size(), 4u);
    EXPECT_FALSE(rates[0].HasBaseline());
    ASSERT_TRUE(rates[1].HasBaseline());
    EXPECT_NEAR(*rates[1].percent, 50.0, 1e-9);
    ASSERT_TRUE(rates[2].HasBaseline());
    EXPECT_NEAR(*rates[2].percent, -100.0, 1e-9);
    EXPECT_FALSE(rates[3].HasBaseline());
    EXPECT_EQ(rates[3].month, (YearMonth{2024, 4}));
}

TEST(TrendAnalyzerTest, UnknownCategoryHasNoGrowth) {
    auto ledger = test_utils::MakeLedger({Expense(1, "2024-01-05", 10.0, "Food")});
    const auto aggregates = TrendAnalyzer::Aggregate(ledger, 3);
    EXPECT_TRUE(TrendAnalyzer::GrowthRates(aggregates, "Travel").empty());
}

TEST(TrendAnalyzerTest, DominantFlowPrefersExpenseOnTie) {
    auto ledger = test_utils::MakeLedger({
        Income(1, "2024-01-01", 2000.0, "Salary"),
        Income(2, "2024-01-02", 50.0, "Refunds"),
        Expense(3, "2024-01-03", 50.0, "Refunds"),
    });
    const auto aggregates = TrendAnalyzer::Aggregate(ledger, 1);
    EXPECT_EQ(TrendAnalyzer::DominantFlow(aggregates, "Salary"), TransactionType::kIncome);
    EXPECT_EQ(TrendAnalyzer::DominantFlow(aggregates, "Refunds"), TransactionType::kExpense);
}

TEST(TrendAnalyzerTest, SeriesStartsAtFirstActiveMonth) {
    auto transactions = test_utils::MonthlySeries("Food", YearMonth{2024, 1}, {10.0, 20.0, 30.0, 40.0});
    auto gym = test_utils::MonthlySeries("Gym", YearMonth{2024, 3}, {25.0, 25.0}, TransactionType::kExpense, 100);
    transactions.insert(transactions.end(), gym.begin(), gym.end());
    auto ledger = test_utils::MakeLedger(std::move(transactions));

    const auto aggregates = TrendAnalyzer::Aggregate(ledger, 12);
    const CategorySeries series = TrendAnalyzer::Series(aggregates, "Gym");
    EXPECT_EQ(series.first_month, (YearMonth{2024, 3}));
    EXPECT_EQ(series.values, (std::vector<double>{25.0, 25.0}));
}

TEST(TrendAnalyzerTest, EmptyLedgerHasNoAggregates) {
    LedgerView ledger({}, {});
    EXPECT_TRUE(TrendAnalyzer::Aggregate(ledger, 12).empty());
}

}  // namespace finance_analytics
