#include "ingester/http_server.hpp"
#include "ingester/queue_producer.hpp"
#include "filter/telemetry_filter.hpp"
#include "config.hpp"
#include <iostream>
#include <memory>

int main() {
    try {
        // Load configuration from environment
        IngesterConfig config = IngesterConfig::fromEnv();

        // Compile the filter conditions once; any error stops startup
        std::shared_ptr<TelemetryFilter> filter;
        if (!config.filter_config_path.empty()) {
            filter = TelemetryFilter::fromFile(config.filter_config_path);
            std::cout << "Loaded filter configuration from " << config.filter_config_path
                      << " (logs: " << (filter->logs() ? "on" : "off")
                      << ", traces: " << (filter->traces() ? "on" : "off")
                      << ", metrics: " << (filter->metrics() ? "on" : "off") << ")" << std::endl;
        }

        std::shared_ptr<QueueProducer> queue_producer;
        if (!config.queue_brokers.empty()) {
            queue_producer = std::make_shared<QueueProducer>(config);
            if (!queue_producer->initialize()) {
                std::cerr << "Warning: Failed to initialize queue producer. Continuing without queue support." << std::endl;
                queue_producer.reset();
            }
        } else {
            std::cout << "KAFKA_BROKERS not set, filtered batches are only logged" << std::endl;
        }

        HttpServer server(queue_producer, filter);
        server.start(config.listen_host, config.listen_port);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        std::cerr << "Environment variables:" << std::endl;
        std::cerr << "  KAFKA_BROKERS - Comma-separated list of broker addresses (optional)" << std::endl;
        std::cerr << "  KAFKA_TOPIC_LOGS, KAFKA_TOPIC_TRACES, KAFKA_TOPIC_METRICS - Topic names (optional)" << std::endl;
        std::cerr << "  FILTER_CONFIG_PATH - JSON filter configuration (optional)" << std::endl;
        return 1;
    }
    return 0;
}
