#include <userver/utest/utest.hpp>

#include <new>
#include <stdexcept>

#include <google/protobuf/util/message_differencer.h>

#include <analytics/analytics.pb.h>
#include <ledger/ledger.pb.h>

#include "analytics_errors/analytics_errors.hpp"
#include "report/report_builder.hpp"

namespace finance_analytics {

namespace {

void AddTransaction(ledger::LedgerSnapshot& snapshot, int64_t id, const std::string& date,
                    double amount, const std::string& category) {
    auto* tx = snapshot.add_transactions();
    tx->set_id(id);
    tx->set_date(date);
    tx->set_description(category);
    tx->set_amount(amount);
    tx->set_category(category);
}

// Six months of salary, rent and groceries with one unusual grocery bill
ledger::LedgerSnapshot HouseholdSnapshot() {
    ledger::LedgerSnapshot snapshot;
    snapshot.add_categories()->set_name("Salary");
    snapshot.add_categories()->set_name("Rent");
    auto* food = snapshot.add_categories();
    food->set_name("Food");
    food->set_monthly_budget(400.0);

    int64_t id = 1;
    for (int month = 1; month <= 6; ++month) {
        const std::string prefix = "2024-0" + std::to_string(month);
        AddTransaction(snapshot, id++, prefix + "-01", 3000.0, "Salary");
        AddTransaction(snapshot, id++, prefix + "-02", -1000.0, "Rent");
        for (int week = 0; week < 4; ++week) {
            AddTransaction(snapshot, id++, prefix + "-1" + std::to_string(week), -80.0 - week, "Food");
        }
    }
    AddTransaction(snapshot, id++, "2024-06-25", -900.0, "Food");
    return snapshot;
}

}  // namespace

TEST(ReportBuilderTest, BuildsFullReport) {
    const LedgerView ledger = LedgerView::FromSnapshot(HouseholdSnapshot());
    const ReportBuilder builder(ledger, AnalysisConfig{});

    const analytics::AnalysisReport report = builder.BuildReport("req-1");
    EXPECT_EQ(report.request_id(), "req-1");
    EXPECT_EQ(report.status(), analytics::AnalysisReport::OK);
    EXPECT_EQ(report.reference_month(), "2024-06");

    EXPECT_EQ(report.trends().last_month(), "2024-06");
    EXPECT_EQ(report.trends().trends_size(), 3);
    // 12 month window by three categories, zero-filled
    EXPECT_EQ(report.trends().aggregates_size(), 36);

    ASSERT_EQ(report.anomalies().flags_size(), 1);
    EXPECT_EQ(report.anomalies().flags(0).transaction().amount(), 900.0);
    EXPECT_EQ(report.anomalies().flags(0).transaction().category(), "Food");
    EXPECT_EQ(report.anomalies().flags(0).severity(), analytics::AnomalyFlag::HIGH);

    EXPECT_EQ(report.projections().horizon_months(), 12);
    ASSERT_EQ(report.projections().categories_size(), 3);
    for (const auto& category : report.projections().categories()) {
        ASSERT_TRUE(category.has_projection()) << category.category();
        // Six months of history ending in June
        EXPECT_EQ(category.projection().first_month(), "2024-07") << category.category();
        EXPECT_EQ(category.projection().monthly_size(), 12);
    }

    EXPECT_EQ(report.score().month(), "2024-06");
    EXPECT_GE(report.score().total_score(), 0);
    EXPECT_LE(report.score().total_score(), 100);
    EXPECT_EQ(report.score().factors_size(), 3);

    EXPECT_EQ(report.insights().month(), "2024-06");
    EXPECT_DOUBLE_EQ(report.insights().total_income(), 3000.0);
    ASSERT_GE(report.insights().top_expense_categories_size(), 1);
    EXPECT_EQ(report.insights().top_expense_categories(0).category(), "Food");

    ASSERT_EQ(report.budgets_size(), 1);
    EXPECT_EQ(report.budgets(0).category(), "Food");
    EXPECT_TRUE(report.budgets(0).over_budget());
}

TEST(ReportBuilderTest, GrowthMarksMissingBaseline) {
    const LedgerView ledger = LedgerView::FromSnapshot(HouseholdSnapshot());
    const analytics::TrendReport trends = ReportBuilder(ledger, AnalysisConfig{}).BuildTrends();

    for (const auto& trend : trends.trends()) {
        ASSERT_GT(trend.growth_size(), 0);
        // Window starts before the first transaction
        EXPECT_TRUE(trend.growth(0).no_prior_baseline());
        EXPECT_FALSE(trend.growth(0).has_percent());
    }
}

TEST(ReportBuilderTest, SameInputGivesSameReport) {
    const LedgerView ledger = LedgerView::FromSnapshot(HouseholdSnapshot());
    const ReportBuilder builder(ledger, AnalysisConfig{});

    const auto first = builder.BuildReport("req-2");
    const auto second = builder.BuildReport("req-2");
    EXPECT_TRUE(google::protobuf::util::MessageDifferencer::Equals(first, second));
}

TEST(ReportBuilderTest, EmptySnapshotIsNotAnError) {
    const LedgerView ledger = LedgerView::FromSnapshot(ledger::LedgerSnapshot{});
    const analytics::AnalysisReport report = ReportBuilder(ledger, AnalysisConfig{}).BuildReport("empty");
    EXPECT_EQ(report.status(), analytics::AnalysisReport::OK);
    EXPECT_TRUE(report.reference_month().empty());
    EXPECT_EQ(report.anomalies().flags_size(), 0);
    EXPECT_EQ(report.trends().aggregates_size(), 0);
}

TEST(ReportBuilderTest, UnresolvedCategoryIsRejected) {
    ledger::LedgerSnapshot snapshot;
    snapshot.add_categories()->set_name("Food");
    AddTransaction(snapshot, 1, "2024-01-03", -20.0, "Food");
    AddTransaction(snapshot, 2, "2024-01-04", -20.0, "Unknown");

    EXPECT_THROW(LedgerView::FromSnapshot(snapshot), UnresolvedCategoryError);
}

TEST(ReportBuilderTest, InvalidConfigIsRejected) {
    const LedgerView ledger = LedgerView::FromSnapshot(HouseholdSnapshot());
    AnalysisConfig config;
    config.window_months = 0;
    EXPECT_THROW(ReportBuilder{ledger, config}, InvalidConfigError);
}

TEST(ReportBuilderTest, ErrorReport) {
    const analytics::AnalysisReport report = MakeErrorReport("req-3", "ledger unavailable");
    EXPECT_EQ(report.request_id(), "req-3");
    EXPECT_EQ(report.status(), analytics::AnalysisReport::ERROR);
    EXPECT_EQ(report.error(), "ledger unavailable");
    EXPECT_FALSE(report.has_score());
}

TEST(ReportBuilderTest, EveryFailureBecomesErrorReport) {
    const auto ok = BuildReportOrError("req-4", [] {
        analytics::AnalysisReport report;
        report.set_request_id("req-4");
        report.set_status(analytics::AnalysisReport::OK);
        return report;
    });
    EXPECT_EQ(ok.status(), analytics::AnalysisReport::OK);

    const auto rejected = BuildReportOrError("req-5", []() -> analytics::AnalysisReport {
        throw InvalidConfigError("window_months must be at least 1, got 0");
    });
    EXPECT_EQ(rejected.request_id(), "req-5");
    EXPECT_EQ(rejected.status(), analytics::AnalysisReport::ERROR);
    EXPECT_EQ(rejected.error(), "window_months must be at least 1, got 0");

    const auto out_of_memory = BuildReportOrError("req-6", []() -> analytics::AnalysisReport {
        throw std::bad_alloc();
    });
    EXPECT_EQ(out_of_memory.request_id(), "req-6");
    EXPECT_EQ(out_of_memory.status(), analytics::AnalysisReport::ERROR);
    EXPECT_FALSE(out_of_memory.error().empty());

    const auto store_down = BuildReportOrError("req-7", []() -> analytics::AnalysisReport {
        throw std::runtime_error("connection refused");
    });
    EXPECT_EQ(store_down.status(), analytics::AnalysisReport::ERROR);
    EXPECT_EQ(store_down.error(), "connection refused");
}

}  // namespace finance_analytics
