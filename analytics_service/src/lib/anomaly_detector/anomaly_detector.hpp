#pragma once

#include <string>
#include <vector>

#include "analysis_config/analysis_config.hpp"
#include "ledger/ledger_view.hpp"

namespace finance_analytics {

enum class Severity {
    kLow,
    kModerate,
    kHigh,
};

// Monotonic in |z|: HIGH from 3 sigma, MODERATE from 2 sigma, LOW below
Severity SeverityFor(double z_score);

const char* ToString(Severity severity);

struct AnomalyFlag {
    Transaction transaction;
    double category_mean = 0.0;
    double category_stddev = 0.0;
    double z_score = 0.0;
    Severity severity = Severity::kLow;
};

enum class DistributionStatus {
    kAnalyzed,
    kInsufficientSamples,
    kDegenerate,
};

struct CategoryDistribution {
    std::string category;
    DistributionStatus status = DistributionStatus::kAnalyzed;
    int sample_size = 0;
    double mean = 0.0;
    double stddev = 0.0;
};

struct AnomalyReport {
    double threshold = 0.0;
    // Strongest deviation first
    std::vector<AnomalyFlag> flags;
    // One entry per category with expenses in the window, in name order
    std::vector<CategoryDistribution> categories;
};

// Flags expenses whose z-score within their category reaches the threshold.
// Small or zero-spread categories are reported with a status instead of
// failing the run.
class AnomalyDetector {
public:
    explicit AnomalyDetector(const AnalysisConfig& config);

    AnomalyReport Detect(const LedgerView& ledger) const;

private:
    const AnalysisConfig config_;
};

}  // namespace finance_analytics
