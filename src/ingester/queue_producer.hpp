#ifndef QUEUE_PRODUCER_HPP
#define QUEUE_PRODUCER_HPP

#include "../config.hpp"
#include "telemetry_wrapper.pb.h"
#include <librdkafka/rdkafka.h>
#include <string>
#include <atomic>
#include <cstdint>
#include <memory>

enum class ProduceResult {
    SUCCESS,
    QUEUE_FULL,      // Return 503
    PERSISTENT_ERROR, // Return 500
    RETRYABLE_ERROR  // Can retry
};

// Counters updated from librdkafka's delivery report callback
struct DeliveryStats {
    std::atomic<int> in_flight{0};
    std::atomic<uint64_t> failed{0};
};

// Publishes filtered batches to one topic per signal
class QueueProducer {
public:
    QueueProducer(const IngesterConfig& config);
    ~QueueProducer();

    // Initialize the producer (must be called before produce)
    bool initialize();

    bool isReady() const { return producer_ != nullptr; }

    // Produce a wrapped batch to the topic of its telemetry type
    ProduceResult produce(const telemetry::v1::RawTelemetryMessage& message);

    int getInFlightCount() const { return delivery_.in_flight.load(); }

    // Messages the brokers rejected after they were queued
    uint64_t getFailedDeliveries() const { return delivery_.failed.load(); }

    // Check if we're at capacity (for backpressure)
    bool isAtCapacity() const {
        return delivery_.in_flight.load() >= config_.max_in_flight;
    }

    // Shutdown gracefully
    void shutdown();

private:
    IngesterConfig config_;

    rd_kafka_t* producer_;
    rd_kafka_topic_t* logs_topic_;
    rd_kafka_topic_t* traces_topic_;
    rd_kafka_topic_t* metrics_topic_;
    DeliveryStats delivery_;

    rd_kafka_topic_t* topicFor(telemetry::v1::TelemetryType type) const;
    ProduceResult produceWithRetry(rd_kafka_topic_t* topic, const std::string& serialized_data, int retry_count = 0);
};

#endif // QUEUE_PRODUCER_HPP
