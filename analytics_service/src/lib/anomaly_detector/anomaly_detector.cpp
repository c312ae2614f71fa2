#include "anomaly_detector.hpp"

#include <algorithm>
#include <cmath>

#include <userver/logging/log.hpp>

#include "stats/statistics.hpp"

namespace finance_analytics {

Severity SeverityFor(double z_score) {
    const double magnitude = std::fabs(z_score);
    if (magnitude >= 3.0) return Severity::kHigh;
    if (magnitude >= 2.0) return Severity::kModerate;
    return Severity::kLow;
}

const char* ToString(Severity severity) {
    switch (severity) {
        case Severity::kLow: return "low";
        case Severity::kModerate: return "moderate";
        case Severity::kHigh: return "high";
    }
    return "low";
}

AnomalyDetector::AnomalyDetector(const AnalysisConfig& config)
    : config_(config) {
    ValidateConfig(config_);
}

AnomalyReport AnomalyDetector::Detect(const LedgerView& ledger) const {
    AnomalyReport report;
    report.threshold = config_.anomaly_threshold;
    if (ledger.Empty()) {
        return report;
    }

    const MonthRange range = ledger.Window(config_.window_months, config_.reference_month);

    for (const auto& [category, transactions] : ledger.GroupByCategory(range)) {
        std::vector<const Transaction*> expenses;
        for (const auto* tx : transactions) {
            if (tx->type == TransactionType::kExpense) {
                expenses.push_back(tx);
            }
        }
        if (expenses.empty()) {
            continue;
        }

        std::vector<double> amounts;
        amounts.reserve(expenses.size());
        for (const auto* tx : expenses) {
            amounts.push_back(tx->amount);
        }
        const stats::Moments moments = stats::ComputeMoments(amounts);

        CategoryDistribution distribution;
        distribution.category = category;
        distribution.sample_size = moments.count;
        distribution.mean = moments.mean;
        distribution.stddev = moments.stddev;

        if (moments.count < config_.min_anomaly_samples) {
            distribution.status = DistributionStatus::kInsufficientSamples;
            LOG_DEBUG() << "Skipping anomaly detection for '" << category << "': "
                        << moments.count << " samples";
            report.categories.push_back(std::move(distribution));
            continue;
        }
        if (stats::IsDegenerate(moments)) {
            distribution.status = DistributionStatus::kDegenerate;
            LOG_DEBUG() << "Skipping anomaly detection for '" << category
                        << "': zero standard deviation";
            report.categories.push_back(std::move(distribution));
            continue;
        }

        for (const auto* tx : expenses) {
            const double z = (tx->amount - moments.mean) / moments.stddev;
            if (std::fabs(z) >= config_.anomaly_threshold) {
                const Severity severity = SeverityFor(z);
                LOG_DEBUG() << "Transaction " << tx->id << " in '" << category << "': z " << z
                            << ", " << ToString(severity);
                report.flags.push_back(AnomalyFlag{*tx, moments.mean, moments.stddev, z, severity});
            }
        }
        report.categories.push_back(std::move(distribution));
    }

    std::sort(report.flags.begin(), report.flags.end(),
              [](const AnomalyFlag& lhs, const AnomalyFlag& rhs) {
                  const double l = std::fabs(lhs.z_score);
                  const double r = std::fabs(rhs.z_score);
                  if (l != r) return l > r;
                  if (!(lhs.transaction.date == rhs.transaction.date)) {
                      return lhs.transaction.date < rhs.transaction.date;
                  }
                  return lhs.transaction.id < rhs.transaction.id;
              });

    if (!report.flags.empty()) {
        LOG_INFO() << "Detected " << report.flags.size() << " anomalous transactions (threshold "
                   << config_.anomaly_threshold << " sigma)";
    }
    return report;
}

}  // namespace finance_analytics
