#include "trend_analyzer.hpp"

#include <map>
#include <set>
#include <utility>

#include <userver/logging/log.hpp>

namespace finance_analytics {

std::vector<MonthlyAggregate> TrendAnalyzer::Aggregate(
    const LedgerView& ledger,
    int window_months,
    const std::optional<YearMonth>& reference) {
    if (ledger.Empty()) {
        return {};
    }

    const MonthRange range = ledger.Window(window_months, reference);

    std::set<std::string> categories;
    std::map<std::pair<int, std::string>, MonthlyAggregate> cells;
    for (const auto* tx : ledger.InRange(range)) {
        categories.insert(tx->category);
        auto& cell = cells[{tx->date.GetYearMonth().Index(), tx->category}];
        if (tx->type == TransactionType::kIncome) {
            cell.total_income += tx->amount;
        } else {
            cell.total_expense += tx->amount;
        }
        cell.transaction_count += 1;
    }

    std::vector<MonthlyAggregate> out;
    out.reserve(static_cast<size_t>(range.Size()) * categories.size());
    for (int i = 0; i < range.Size(); ++i) {
        const YearMonth month = range.first.Plus(i);
        for (const auto& category : categories) {
            MonthlyAggregate aggregate;
            auto it = cells.find({month.Index(), category});
            if (it != cells.end()) {
                aggregate = it->second;
            }
            aggregate.month = month;
            aggregate.category = category;
            out.push_back(std::move(aggregate));
        }
    }

    LOG_DEBUG() << "Aggregated " << categories.size() << " categories over "
                << range.first.ToString() << ".." << range.last.ToString();
    return out;
}

std::vector<GrowthRate> TrendAnalyzer::GrowthRates(
    const std::vector<MonthlyAggregate>& aggregates,
    const std::string& category) {
    const TransactionType flow = DominantFlow(aggregates, category);

    std::vector<GrowthRate> out;
    std::optional<double> previous;
    for (const auto& aggregate : aggregates) {
        if (aggregate.category != category) {
            continue;
        }
        const double current = aggregate.Total(flow);
        GrowthRate rate;
        rate.month = aggregate.month;
        if (previous && *previous != 0.0) {
            rate.percent = (current - *previous) / *previous * 100.0;
        }
        out.push_back(rate);
        previous = current;
    }
    return out;
}

std::vector<std::string> TrendAnalyzer::Categories(const std::vector<MonthlyAggregate>& aggregates) {
    std::set<std::string> names;
    for (const auto& aggregate : aggregates) {
        names.insert(aggregate.category);
    }
    return {names.begin(), names.end()};
}

TransactionType TrendAnalyzer::DominantFlow(
    const std::vector<MonthlyAggregate>& aggregates,
    const std::string& category) {
    double income = 0.0, expense = 0.0;
    for (const auto& aggregate : aggregates) {
        if (aggregate.category == category) {
            income += aggregate.total_income;
            expense += aggregate.total_expense;
        }
    }
    return income > expense ? TransactionType::kIncome : TransactionType::kExpense;
}

CategorySeries TrendAnalyzer::Series(
    const std::vector<MonthlyAggregate>& aggregates,
    const std::string& category) {
    CategorySeries series;
    series.category = category;
    series.flow = DominantFlow(aggregates, category);

    bool started = false;
    for (const auto& aggregate : aggregates) {
        if (aggregate.category != category) {
            continue;
        }
        if (!started) {
            if (aggregate.transaction_count == 0) {
                continue;
            }
            started = true;
            series.first_month = aggregate.month;
        }
        series.values.push_back(aggregate.Total(series.flow));
    }
    return series;
}

}  // namespace finance_analytics
