#include "analysis_processor.hpp"

#include <userver/kafka/message.hpp>
#include <userver/logging/log.hpp>
#include <userver/yaml_config/merge_schemas.hpp>

#include "report/report_builder.hpp"

namespace finance_analytics {

AnalysisProcessor::AnalysisProcessor(
    const userver::components::ComponentConfig& config,
    const userver::components::ComponentContext& context)
    : ComponentBase(config, context),
      engine_(context.FindComponent<AnalyticsEngineComponent>()),
      response_topic_(config["response_topic"].As<std::string>("AnalysisReports")),
      report_producer_(std::make_unique<KafkaReportProducer>(
          context.FindComponent<userver::kafka::ProducerComponent>("kafka-producer"))),
      consumer_scope_(
          context.FindComponent<userver::kafka::ConsumerComponent>("kafka-consumer").GetConsumer()) {
    LOG_INFO() << "AnalysisProcessor initialized. Response topic: " << response_topic_;
    consumer_scope_.Start([this](userver::kafka::MessageBatchView messages) {
        LOG_INFO() << "Received batch of " << messages.size() << " analysis requests";
        for (const auto& msg : messages) {
            try {
                std::string message_data(msg.GetPayload().begin(), msg.GetPayload().end());
                ProcessMessage(message_data);
            } catch (const std::exception& e) {
                LOG_ERROR() << "Error processing Kafka message from topic " << msg.GetTopic()
                            << ": " << e.what();
            }
        }
        consumer_scope_.AsyncCommit();
    });
    LOG_INFO() << "AnalysisProcessor consumer started";
}

AnalysisProcessor::~AnalysisProcessor() {
    LOG_INFO() << "AnalysisProcessor shutting down";
}

void AnalysisProcessor::ProcessMessage(const std::string& message) {
    analytics::AnalysisRequest request;
    if (!request.ParseFromString(message)) {
        LOG_ERROR() << "Failed to parse AnalysisRequest from message";
        report_producer_->SendReport(
            MakeErrorReport("", "Failed to parse AnalysisRequest from Kafka message"), response_topic_);
        return;
    }

    LOG_INFO() << "Processing analysis request: " << request.request_id();

    const analytics::AnalysisReport report =
        BuildReportOrError(request.request_id(), [this, &request] {
            const AnalysisConfig analysis_config = engine_.ResolveConfig(request);
            const LedgerView ledger = engine_.LoadLedger(request);
            return ReportBuilder(ledger, analysis_config).BuildReport(request.request_id());
        });

    report_producer_->SendReport(report, response_topic_);
}

userver::yaml_config::Schema AnalysisProcessor::GetStaticConfigSchema() {
    return userver::yaml_config::MergeSchemas<userver::components::ComponentBase>(R"(
type: object
description: Kafka analysis request processor
additionalProperties: false
properties:
    response_topic:
        type: string
        description: Kafka topic for outgoing analysis reports
        defaultDescription: AnalysisReports
)");
}

}  // namespace finance_analytics
