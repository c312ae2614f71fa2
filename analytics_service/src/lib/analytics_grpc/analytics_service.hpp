#pragma once

// stdcpp
#include <string_view>

// userver
#include <userver/ugrpc/server/service_component_base.hpp>
#include <userver/yaml_config/schema.hpp>

// grpc
#include <grpcpp/support/status.h>

// models
#include <analytics/analytics.pb.h>
#include <analytics/analytics_service.usrv.pb.hpp>

// self
#include "analytics_engine/analytics_engine.hpp"
#include "report/report_builder.hpp"

namespace finance_analytics {

class AnalyticsService final : public analytics::AnalyticsServiceBase {
public:
    explicit AnalyticsService(const AnalyticsEngineComponent& engine);

    AnalyzeResult Analyze(CallContext&, analytics::AnalysisRequest&& request) override;
    GetTrendsResult GetTrends(CallContext&, analytics::AnalysisRequest&& request) override;
    DetectAnomaliesResult DetectAnomalies(CallContext&, analytics::AnalysisRequest&& request) override;
    ProjectCategoriesResult ProjectCategories(CallContext&, analytics::AnalysisRequest&& request) override;
    GetHealthScoreResult GetHealthScore(CallContext&, analytics::AnalysisRequest&& request) override;

    ~AnalyticsService() override = default;

private:
    // Loads the ledger, applies the options and fills response via build.
    // Maps engine errors onto gRPC status codes.
    template <typename Response, typename Build>
    grpc::Status Run(std::string_view method,
                     const analytics::AnalysisRequest& request,
                     Response& response,
                     Build build) const;

    const AnalyticsEngineComponent& engine_;
};


class AnalyticsServiceComponent final : public userver::ugrpc::server::ServiceComponentBase {
public:
    static constexpr std::string_view kName = "analytics-grpc-service";

    AnalyticsServiceComponent(
        const userver::components::ComponentConfig& config,
        const userver::components::ComponentContext& context);

    static userver::yaml_config::Schema GetStaticConfigSchema();

    ~AnalyticsServiceComponent() override = default;

private:
    AnalyticsService _service;
};

}  // namespace finance_analytics
