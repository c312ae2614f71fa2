#include "analytics_service.hpp"

// userver
#include <userver/components/component_context.hpp>
#include <userver/logging/log.hpp>
#include <userver/yaml_config/merge_schemas.hpp>

#include <fmt/format.h>

// self
#include "analytics_errors/analytics_errors.hpp"
#include "ledger_repository/ledger_repository.hpp"

namespace finance_analytics {

AnalyticsService::AnalyticsService(const AnalyticsEngineComponent& engine)
    : engine_(engine) {}

template <typename Response, typename Build>
grpc::Status AnalyticsService::Run(std::string_view method,
                                   const analytics::AnalysisRequest& request,
                                   Response& response,
                                   Build build) const {
    LOG_INFO() << fmt::format("{}: request {}", method, request.request_id());
    try {
        const AnalysisConfig config = engine_.ResolveConfig(request);
        const LedgerView ledger = engine_.LoadLedger(request);
        response = build(ReportBuilder(ledger, config));
        return grpc::Status::OK;
    } catch (const InvalidConfigError& e) {
        LOG_WARNING() << fmt::format("{}: invalid options in {}: {}", method, request.request_id(), e.what());
        return grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, e.what()};
    } catch (const InvalidLedgerError& e) {
        LOG_WARNING() << fmt::format("{}: invalid ledger in {}: {}", method, request.request_id(), e.what());
        return grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, e.what()};
    } catch (const LedgerUnavailableError& e) {
        LOG_ERROR() << fmt::format("{}: {}", method, e.what());
        return grpc::Status{grpc::StatusCode::UNAVAILABLE, e.what()};
    } catch (const AnalyticsError& e) {
        LOG_WARNING() << fmt::format("{}: cannot analyse {}: {}", method, request.request_id(), e.what());
        return grpc::Status{grpc::StatusCode::FAILED_PRECONDITION, e.what()};
    } catch (const std::exception& e) {
        LOG_ERROR() << fmt::format("{}: request {} failed: {}", method, request.request_id(), e.what());
        return grpc::Status{grpc::StatusCode::INTERNAL, e.what()};
    }
}

AnalyticsService::AnalyzeResult AnalyticsService::Analyze(
    CallContext&,
    analytics::AnalysisRequest&& request) {
    analytics::AnalysisReport response;
    auto status = Run("Analyze", request, response, [&request](const ReportBuilder& builder) {
        return builder.BuildReport(request.request_id());
    });
    if (!status.ok()) {
        return status;
    }
    return response;
}

AnalyticsService::GetTrendsResult AnalyticsService::GetTrends(
    CallContext&,
    analytics::AnalysisRequest&& request) {
    analytics::TrendReport response;
    auto status = Run("GetTrends", request, response, [](const ReportBuilder& builder) {
        return builder.BuildTrends();
    });
    if (!status.ok()) {
        return status;
    }
    return response;
}

AnalyticsService::DetectAnomaliesResult AnalyticsService::DetectAnomalies(
    CallContext&,
    analytics::AnalysisRequest&& request) {
    analytics::AnomalyReport response;
    auto status = Run("DetectAnomalies", request, response, [](const ReportBuilder& builder) {
        return builder.BuildAnomalies();
    });
    if (!status.ok()) {
        return status;
    }
    return response;
}

AnalyticsService::ProjectCategoriesResult AnalyticsService::ProjectCategories(
    CallContext&,
    analytics::AnalysisRequest&& request) {
    analytics::ProjectionReport response;
    auto status = Run("ProjectCategories", request, response, [](const ReportBuilder& builder) {
        return builder.BuildProjections();
    });
    if (!status.ok()) {
        return status;
    }
    return response;
}

AnalyticsService::GetHealthScoreResult AnalyticsService::GetHealthScore(
    CallContext&,
    analytics::AnalysisRequest&& request) {
    analytics::ScoreBreakdown response;
    auto status = Run("GetHealthScore", request, response, [](const ReportBuilder& builder) {
        return builder.BuildScore();
    });
    if (!status.ok()) {
        return status;
    }
    return response;
}


AnalyticsServiceComponent::AnalyticsServiceComponent(
    const userver::components::ComponentConfig& config,
    const userver::components::ComponentContext& context)
    : userver::ugrpc::server::ServiceComponentBase(config, context)
    , _service(context.FindComponent<AnalyticsEngineComponent>()) {
    RegisterService(_service);
}

userver::yaml_config::Schema AnalyticsServiceComponent::GetStaticConfigSchema() {
    return userver::yaml_config::MergeSchemas<userver::ugrpc::server::ServiceComponentBase>(R"(
type: object
description: gRPC analytics service component
additionalProperties: false
properties: {}
)");
}

}  // namespace finance_analytics
