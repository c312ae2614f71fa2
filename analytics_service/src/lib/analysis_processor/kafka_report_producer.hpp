#pragma once

#include <string>

#include <userver/kafka/producer_component.hpp>
#include <analytics/analytics.pb.h>

namespace finance_analytics {

// Publishes reports as JSON keyed by request id
class KafkaReportProducer {
public:
    explicit KafkaReportProducer(userver::kafka::ProducerComponent& producer);

    // Throws on serialization or delivery failure
    void SendReport(const analytics::AnalysisReport& report, const std::string& topic);

private:
    userver::kafka::ProducerComponent& producer_;
};

}  // namespace finance_analytics
