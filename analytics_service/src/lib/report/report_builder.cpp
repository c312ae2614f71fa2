#include "report_builder.hpp"

#include <userver/logging/log.hpp>

#include "anomaly_detector/anomaly_detector.hpp"
#include "insights/monthly_insights.hpp"
#include "projector/projector.hpp"
#include "score_engine/score_engine.hpp"
#include "trend_analyzer/trend_analyzer.hpp"

namespace finance_analytics {

namespace {

ledger::Transaction::TransactionType ToProto(TransactionType type) {
    switch (type) {
        case TransactionType::kIncome: return ledger::Transaction::INCOME;
        case TransactionType::kExpense: return ledger::Transaction::EXPENSE;
    }
    return ledger::Transaction::TRANSACTION_TYPE_UNSPECIFIED;
}

void FillTransaction(const Transaction& tx, ledger::Transaction& out) {
    out.set_id(tx.id);
    out.set_date(tx.date.ToString());
    out.set_description(tx.description);
    out.set_amount(tx.amount);
    out.set_category(tx.category);
    out.set_type(ToProto(tx.type));
}

analytics::AnomalyFlag::Severity ToProto(Severity severity) {
    switch (severity) {
        case Severity::kLow: return analytics::AnomalyFlag::LOW;
        case Severity::kModerate: return analytics::AnomalyFlag::MODERATE;
        case Severity::kHigh: return analytics::AnomalyFlag::HIGH;
    }
    return analytics::AnomalyFlag::SEVERITY_UNSPECIFIED;
}

analytics::CategoryDistribution::Status ToProto(DistributionStatus status) {
    switch (status) {
        case DistributionStatus::kAnalyzed: return analytics::CategoryDistribution::ANALYZED;
        case DistributionStatus::kInsufficientSamples:
            return analytics::CategoryDistribution::INSUFFICIENT_SAMPLES;
        case DistributionStatus::kDegenerate:
            return analytics::CategoryDistribution::DEGENERATE_DISTRIBUTION;
    }
    return analytics::CategoryDistribution::STATUS_UNSPECIFIED;
}

analytics::Projection::Trend ToProto(TrendDirection direction) {
    switch (direction) {
        case TrendDirection::kIncreasing: return analytics::Projection::INCREASING;
        case TrendDirection::kDecreasing: return analytics::Projection::DECREASING;
        case TrendDirection::kFlat: return analytics::Projection::FLAT;
    }
    return analytics::Projection::TREND_UNSPECIFIED;
}

void FillProjection(const ProjectionResult& result, analytics::Projection& out) {
    out.set_category(result.category);
    out.set_flow(ToProto(result.flow));
    out.set_first_month(result.first_projected_month.ToString());
    for (double value : result.monthly) {
        out.add_monthly(value);
    }
    out.set_annual_total(result.annual_total);
    out.set_average_monthly(result.average_monthly);
    out.set_slope(result.slope);
    out.set_intercept(result.intercept);
    out.set_r_squared(result.r_squared);
    out.set_history_points(result.history_points);
    out.set_trend(ToProto(result.trend));
    out.set_flat_history(result.flat_history);
    out.set_sparse_history(result.sparse_history);
    out.set_data_coverage(result.data_coverage);
}

void FillCategoryTotal(const CategoryTotal& total, analytics::CategoryTotal& out) {
    out.set_category(total.category);
    out.set_total(total.total);
    out.set_share(total.share);
}

}  // namespace

ReportBuilder::ReportBuilder(const LedgerView& ledger, const AnalysisConfig& config)
    : ledger_(ledger)
    , config_(config) {
    ValidateConfig(config_);
}

analytics::TrendReport ReportBuilder::BuildTrends() const {
    analytics::TrendReport report;
    if (ledger_.Empty()) {
        return report;
    }

    const MonthRange range = ledger_.Window(config_.window_months, config_.reference_month);
    report.set_first_month(range.first.ToString());
    report.set_last_month(range.last.ToString());

    const auto aggregates =
        TrendAnalyzer::Aggregate(ledger_, config_.window_months, config_.reference_month);
    for (const auto& aggregate : aggregates) {
        auto* out = report.add_aggregates();
        out->set_month(aggregate.month.ToString());
        out->set_category(aggregate.category);
        out->set_total_income(aggregate.total_income);
        out->set_total_expense(aggregate.total_expense);
        out->set_transaction_count(aggregate.transaction_count);
    }

    for (const auto& category : TrendAnalyzer::Categories(aggregates)) {
        auto* trend = report.add_trends();
        trend->set_category(category);
        trend->set_flow(ToProto(TrendAnalyzer::DominantFlow(aggregates, category)));
        for (const auto& rate : TrendAnalyzer::GrowthRates(aggregates, category)) {
            auto* point = trend->add_growth();
            point->set_month(rate.month.ToString());
            if (rate.HasBaseline()) {
                point->set_percent(*rate.percent);
            } else {
                point->set_no_prior_baseline(true);
            }
        }
    }
    return report;
}

analytics::AnomalyReport ReportBuilder::BuildAnomalies() const {
    const AnomalyReport detected = AnomalyDetector(config_).Detect(ledger_);

    analytics::AnomalyReport report;
    report.set_threshold(detected.threshold);
    for (const auto& flag : detected.flags) {
        auto* out = report.add_flags();
        FillTransaction(flag.transaction, *out->mutable_transaction());
        out->set_category_mean(flag.category_mean);
        out->set_category_stddev(flag.category_stddev);
        out->set_z_score(flag.z_score);
        out->set_severity(ToProto(flag.severity));
    }
    for (const auto& distribution : detected.categories) {
        auto* out = report.add_categories();
        out->set_category(distribution.category);
        out->set_status(ToProto(distribution.status));
        out->set_sample_size(distribution.sample_size);
        out->set_mean(distribution.mean);
        out->set_stddev(distribution.stddev);
    }
    return report;
}

analytics::ProjectionReport ReportBuilder::BuildProjections() const {
    analytics::ProjectionReport report;
    report.set_horizon_months(config_.horizon_months);
    if (ledger_.Empty()) {
        return report;
    }

    const auto aggregates =
        TrendAnalyzer::Aggregate(ledger_, config_.window_months, config_.reference_month);
    for (const auto& entry : Projector(config_).ProjectAll(aggregates)) {
        auto* out = report.add_categories();
        out->set_category(entry.category);
        if (entry.projection) {
            FillProjection(*entry.projection, *out->mutable_projection());
        } else {
            out->set_insufficient_history(entry.insufficient_history);
        }
    }
    return report;
}

analytics::ScoreBreakdown ReportBuilder::BuildScore() const {
    const ScoreBreakdown score = ScoreEngine(config_).Score(ledger_);

    analytics::ScoreBreakdown out;
    out.set_month(score.month.ToString());
    if (score.savings_rate) {
        out.set_savings_rate(*score.savings_rate);
    }
    out.set_savings_rate_score(score.savings_rate_score);
    out.set_diversification_score(score.diversification_score);
    out.set_consistency_score(score.consistency_score);
    out.set_total_score(score.total_score);
    out.set_savings_rate_undefined(score.savings_rate_undefined);
    out.set_diversification_default(score.diversification_default);
    out.set_consistency_default(score.consistency_default);
    for (const auto& factor : score.factors) {
        out.add_factors(factor);
    }
    return out;
}

analytics::AnalysisReport ReportBuilder::BuildReport(const std::string& request_id) const {
    analytics::AnalysisReport report;
    report.set_request_id(request_id);
    report.set_status(analytics::AnalysisReport::OK);
    if (ledger_.Empty()) {
        LOG_INFO() << "Empty ledger for request " << request_id << ", nothing to analyse";
        return report;
    }

    const YearMonth month = config_.reference_month ? *config_.reference_month : ledger_.LatestMonth();
    report.set_reference_month(month.ToString());

    *report.mutable_trends() = BuildTrends();
    *report.mutable_anomalies() = BuildAnomalies();
    *report.mutable_projections() = BuildProjections();
    *report.mutable_score() = BuildScore();

    const MonthlyInsights insights = ComputeInsights(ledger_, month, config_.top_categories);
    auto* insights_out = report.mutable_insights();
    insights_out->set_month(insights.month.ToString());
    insights_out->set_total_income(insights.total_income);
    insights_out->set_total_expense(insights.total_expense);
    insights_out->set_balance(insights.balance);
    insights_out->set_savings_rate_percent(insights.savings_rate_percent);
    for (const auto& total : insights.top_expense_categories) {
        FillCategoryTotal(total, *insights_out->add_top_expense_categories());
    }
    for (const auto& total : insights.expense_distribution) {
        FillCategoryTotal(total, *insights_out->add_expense_distribution());
    }

    for (const auto& status : ComputeBudgetStatus(ledger_, month)) {
        auto* out = report.add_budgets();
        out->set_category(status.category);
        out->set_budget(status.budget);
        out->set_spent(status.spent);
        out->set_remaining(status.remaining);
        out->set_utilization_percent(status.utilization_percent);
        out->set_over_budget(status.over_budget);
    }

    LOG_INFO() << "Built analysis report " << request_id << " for " << month.ToString() << ": "
               << report.anomalies().flags_size() << " anomalies, score "
               << report.score().total_score();
    return report;
}

analytics::AnalysisReport MakeErrorReport(const std::string& request_id, const std::string& error) {
    analytics::AnalysisReport report;
    report.set_request_id(request_id);
    report.set_status(analytics::AnalysisReport::ERROR);
    report.set_error(error);
    return report;
}

}  // namespace finance_analytics
