#pragma once

#include <exception>
#include <string>

#include <analytics/analytics.pb.h>

#include <userver/logging/log.hpp>

#include "analysis_config/analysis_config.hpp"
#include "analytics_errors/analytics_errors.hpp"
#include "ledger/ledger_view.hpp"

namespace finance_analytics {

// Runs the analyses over one snapshot and renders the results as protobuf
// messages. The builder borrows the ledger; it must outlive the builder.
class ReportBuilder {
public:
    ReportBuilder(const LedgerView& ledger, const AnalysisConfig& config);

    analytics::TrendReport BuildTrends() const;
    analytics::AnomalyReport BuildAnomalies() const;
    analytics::ProjectionReport BuildProjections() const;
    analytics::ScoreBreakdown BuildScore() const;

    analytics::AnalysisReport BuildReport(const std::string& request_id) const;

private:
    const LedgerView& ledger_;
    const AnalysisConfig config_;
};

analytics::AnalysisReport MakeErrorReport(const std::string& request_id, const std::string& error);

// Runs build and answers every failure with an ERROR report, so a request
// always gets a reply
template <typename Build>
analytics::AnalysisReport BuildReportOrError(const std::string& request_id, Build build) {
    try {
        return build();
    } catch (const AnalyticsError& e) {
        LOG_WARNING() << "Analysis " << request_id << " rejected: " << e.what();
        return MakeErrorReport(request_id, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR() << "Analysis " << request_id << " failed: " << e.what();
        return MakeErrorReport(request_id, e.what());
    }
}

}  // namespace finance_analytics
