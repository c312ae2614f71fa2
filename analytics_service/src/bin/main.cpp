// userver
#include <userver/clients/dns/component.hpp>
#include <userver/components/minimal_server_component_list.hpp>
#include <userver/kafka/consumer_component.hpp>
#include <userver/kafka/producer_component.hpp>
#include <userver/storages/postgres/component.hpp>
#include <userver/storages/secdist/component.hpp>
#include <userver/storages/secdist/provider_component.hpp>
#include <userver/testsuite/testsuite_support.hpp>
#include <userver/ugrpc/server/component_list.hpp>
#include <userver/utils/daemon_run.hpp>

// self
#include "analysis_processor/analysis_processor.hpp"
#include "analytics_engine/analytics_engine.hpp"
#include "analytics_grpc/analytics_service.hpp"

int main(int argc, char* argv[]) {
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    const auto component_list =
        userver::components::MinimalServerComponentList()
            .AppendComponentList(userver::ugrpc::server::MinimalComponentList())
            .Append<userver::clients::dns::Component>()
            .Append<userver::components::Secdist>()
            .Append<userver::components::DefaultSecdistProvider>()
            .Append<userver::components::TestsuiteSupport>()
            .Append<userver::components::Postgres>("postgres-db-1")
            .Append<userver::kafka::ConsumerComponent>("kafka-consumer")
            .Append<userver::kafka::ProducerComponent>("kafka-producer")
            .Append<finance_analytics::AnalyticsEngineComponent>()
            .Append<finance_analytics::AnalyticsServiceComponent>()
            .Append<finance_analytics::AnalysisProcessor>()
        ;

    return userver::utils::DaemonMain(argc, argv, component_list);
}
