#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <userver/components/component_base.hpp>
#include <userver/components/component_config.hpp>
#include <userver/components/component_context.hpp>
#include <userver/kafka/consumer_component.hpp>
#include <userver/kafka/consumer_scope.hpp>
#include <userver/kafka/producer_component.hpp>
#include <userver/yaml_config/schema.hpp>

#include <analytics/analytics.pb.h>

#include "analysis_processor/kafka_report_producer.hpp"
#include "analytics_engine/analytics_engine.hpp"

namespace finance_analytics {

// Consumes serialized AnalysisRequest messages and answers each one with an
// AnalysisReport on the response topic. Failed requests get an ERROR report.
class AnalysisProcessor final : public userver::components::ComponentBase {
public:
    static constexpr std::string_view kName = "analysis-processor";

    AnalysisProcessor(const userver::components::ComponentConfig& config,
                      const userver::components::ComponentContext& context);

    ~AnalysisProcessor() override;

    AnalysisProcessor(const AnalysisProcessor&) = delete;
    AnalysisProcessor& operator=(const AnalysisProcessor&) = delete;

    static userver::yaml_config::Schema GetStaticConfigSchema();

private:
    void ProcessMessage(const std::string& message);

    const AnalyticsEngineComponent& engine_;
    std::string response_topic_;
    std::unique_ptr<KafkaReportProducer> report_producer_;

    // Last member: stopped before the rest is destroyed
    userver::kafka::ConsumerScope consumer_scope_;
};

}  // namespace finance_analytics
