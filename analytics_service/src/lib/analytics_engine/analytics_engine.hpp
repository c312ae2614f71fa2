#pragma once

// stdcpp
#include <memory>
#include <string_view>

// userver
#include <userver/components/component_base.hpp>
#include <userver/yaml_config/schema.hpp>

// models
#include <analytics/analytics.pb.h>

// self
#include "analysis_config/analysis_config.hpp"
#include "ledger/ledger_view.hpp"
#include "ledger_repository/ledger_repository.hpp"

namespace finance_analytics {

// Holds the service-wide analysis defaults and resolves the snapshot a
// request refers to. Shared by the gRPC service and the Kafka processor.
class AnalyticsEngineComponent final : public userver::components::ComponentBase {
public:
    static constexpr std::string_view kName = "analytics-engine";

    AnalyticsEngineComponent(
        const userver::components::ComponentConfig& config,
        const userver::components::ComponentContext& context);

    ~AnalyticsEngineComponent() override = default;

    static userver::yaml_config::Schema GetStaticConfigSchema();

    // Defaults with the request options applied. Throws InvalidConfigError.
    AnalysisConfig ResolveConfig(const analytics::AnalysisRequest& request) const;

    // Inline snapshot, or the stored ledger of request.account_id.
    // Throws InvalidLedgerError or LedgerUnavailableError.
    LedgerView LoadLedger(const analytics::AnalysisRequest& request) const;

private:
    AnalysisConfig defaults_;
    std::shared_ptr<LedgerRepository> repository_;
};

}  // namespace finance_analytics
