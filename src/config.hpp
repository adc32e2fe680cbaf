#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <cstdlib>
#include <cstring>

struct IngesterConfig {
    std::string queue_brokers;  // empty: filter and log only
    std::string topic_logs = "otel-logs";
    std::string topic_traces = "otel-traces";
    std::string topic_metrics = "otel-metrics";
    int max_in_flight = 1000;
    int acks = -1;  // -1 means all replicas must acknowledge
    std::string compression_type = "snappy";
    int retry_backoff_ms = 100;
    int max_retries = 3;
    std::string listen_host = "0.0.0.0";
    int listen_port = 4318;
    std::string filter_config_path;  // optional JSON FilterConfig

    static IngesterConfig fromEnv() {
        IngesterConfig config;

        const char* brokers = std::getenv("KAFKA_BROKERS");
        if (brokers && strlen(brokers) > 0) {
            config.queue_brokers = brokers;
        }

        const char* topic_logs = std::getenv("KAFKA_TOPIC_LOGS");
        if (topic_logs && strlen(topic_logs) > 0) {
            config.topic_logs = topic_logs;
        }

        const char* topic_traces = std::getenv("KAFKA_TOPIC_TRACES");
        if (topic_traces && strlen(topic_traces) > 0) {
            config.topic_traces = topic_traces;
        }

        const char* topic_metrics = std::getenv("KAFKA_TOPIC_METRICS");
        if (topic_metrics && strlen(topic_metrics) > 0) {
            config.topic_metrics = topic_metrics;
        }

        const char* max_in_flight_str = std::getenv("MAX_IN_FLIGHT");
        if (max_in_flight_str) {
            config.max_in_flight = std::atoi(max_in_flight_str);
        }

        const char* acks_str = std::getenv("PRODUCER_ACKS");
        if (acks_str) {
            config.acks = std::atoi(acks_str);
        }

        const char* compression = std::getenv("PRODUCER_COMPRESSION");
        if (compression) {
            config.compression_type = compression;
        }

        const char* host = std::getenv("LISTEN_HOST");
        if (host && strlen(host) > 0) {
            config.listen_host = host;
        }

        const char* port = std::getenv("LISTEN_PORT");
        if (port && strlen(port) > 0) {
            config.listen_port = std::atoi(port);
        }

        const char* filter_path = std::getenv("FILTER_CONFIG_PATH");
        if (filter_path) {
            config.filter_config_path = filter_path;
        }

        return config;
    }
};

#endif // CONFIG_HPP
