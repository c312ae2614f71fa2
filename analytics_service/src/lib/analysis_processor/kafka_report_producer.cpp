#include "kafka_report_producer.hpp"

#include <stdexcept>

#include <google/protobuf/util/json_util.h>

#include <userver/logging/log.hpp>

namespace finance_analytics {

KafkaReportProducer::KafkaReportProducer(userver::kafka::ProducerComponent& producer)
    : producer_(producer) {
}

void KafkaReportProducer::SendReport(const analytics::AnalysisReport& report, const std::string& topic) {
    std::string serialized_report;
    auto status = google::protobuf::util::MessageToJsonString(report, &serialized_report);
    if (!status.ok()) {
        throw std::runtime_error("Failed to serialize AnalysisReport to JSON: " +
                                 std::string(status.message()));
    }

    producer_.GetProducer().Send(topic, report.request_id(), serialized_report);
    LOG_INFO() << "Sent report to Kafka topic '" << topic << "' for request: " << report.request_id();
}

}  // namespace finance_analytics
