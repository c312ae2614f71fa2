#include "analytics_engine.hpp"

// userver
#include <userver/components/component_config.hpp>
#include <userver/components/component_context.hpp>
#include <userver/logging/log.hpp>
#include <userver/storages/postgres/component.hpp>
#include <userver/yaml_config/merge_schemas.hpp>

#include <fmt/format.h>

// self
#include "analytics_errors/analytics_errors.hpp"

namespace finance_analytics {

AnalyticsEngineComponent::AnalyticsEngineComponent(
    const userver::components::ComponentConfig& config,
    const userver::components::ComponentContext& context)
    : userver::components::ComponentBase{config, context} {
    defaults_.anomaly_threshold = config["anomaly-threshold"].As<double>(defaults_.anomaly_threshold);
    defaults_.window_months = config["window-months"].As<int>(defaults_.window_months);
    defaults_.horizon_months = config["horizon-months"].As<int>(defaults_.horizon_months);
    defaults_.weights.savings = config["savings-weight"].As<double>(defaults_.weights.savings);
    defaults_.weights.diversification =
        config["diversification-weight"].As<double>(defaults_.weights.diversification);
    defaults_.weights.consistency =
        config["consistency-weight"].As<double>(defaults_.weights.consistency);
    defaults_.min_anomaly_samples =
        config["min-anomaly-samples"].As<int>(defaults_.min_anomaly_samples);
    defaults_.min_projection_points =
        config["min-projection-points"].As<int>(defaults_.min_projection_points);
    defaults_.top_categories = config["top-categories"].As<int>(defaults_.top_categories);
    ValidateConfig(defaults_);

    const auto postgres_name = config["postgres-component"].As<std::string>("");
    if (!postgres_name.empty()) {
        try {
            auto& pg_component = context.FindComponent<userver::components::Postgres>(postgres_name);
            repository_ = std::make_shared<LedgerRepository>(pg_component.GetCluster());
            LOG_INFO() << "Ledger repository enabled on " << postgres_name;
        } catch (const std::exception& e) {
            LOG_WARNING() << "PostgreSQL not available, stored ledgers disabled: " << e.what();
            repository_ = nullptr;
        }
    }

    LOG_INFO() << fmt::format(
        "Analytics engine defaults: threshold {}, window {} months, horizon {} months, "
        "weights {}/{}/{}",
        defaults_.anomaly_threshold, defaults_.window_months, defaults_.horizon_months,
        defaults_.weights.savings, defaults_.weights.diversification, defaults_.weights.consistency);
}

AnalysisConfig AnalyticsEngineComponent::ResolveConfig(
    const analytics::AnalysisRequest& request) const {
    return ApplyOptions(defaults_, request.options());
}

LedgerView AnalyticsEngineComponent::LoadLedger(const analytics::AnalysisRequest& request) const {
    switch (request.source_case()) {
        case analytics::AnalysisRequest::kSnapshot:
            return LedgerView::FromSnapshot(request.snapshot());
        case analytics::AnalysisRequest::kAccountId:
            if (!repository_) {
                throw LedgerUnavailableError("Stored ledgers are not configured");
            }
            return LedgerView::FromSnapshot(repository_->LoadSnapshot(request.account_id()));
        default:
            throw InvalidLedgerError("Request carries neither a snapshot nor an account id");
    }
}

userver::yaml_config::Schema AnalyticsEngineComponent::GetStaticConfigSchema() {
    return userver::yaml_config::MergeSchemas<userver::components::ComponentBase>(R"(
type: object
description: Analysis defaults and ledger source
additionalProperties: false
properties:
    anomaly-threshold:
        type: number
        description: z-score from which an expense is flagged
        defaultDescription: '2.0'
    window-months:
        type: integer
        description: trailing analysis window in months
        defaultDescription: '12'
    horizon-months:
        type: integer
        description: number of months to project
        defaultDescription: '12'
    savings-weight:
        type: number
        description: score points for the savings rate factor
        defaultDescription: '40'
    diversification-weight:
        type: number
        description: score points for the diversification factor
        defaultDescription: '30'
    consistency-weight:
        type: number
        description: score points for the consistency factor
        defaultDescription: '30'
    min-anomaly-samples:
        type: integer
        description: expenses a category needs before it is checked for anomalies
        defaultDescription: '3'
    min-projection-points:
        type: integer
        description: monthly points a category needs before it is projected
        defaultDescription: '2'
    top-categories:
        type: integer
        description: number of top expense categories in monthly insights
        defaultDescription: '5'
    postgres-component:
        type: string
        description: name of the PostgreSQL component holding stored ledgers, empty to disable
        defaultDescription: ''
)");
}

}  // namespace finance_analytics
