#include "queue_producer.hpp"
#include <iostream>
#include <chrono>
#include <thread>
#include <librdkafka/rdkafka.h>

namespace {

bool setConf(rd_kafka_conf_t* conf, const char* name, const std::string& value) {
    char errstr[512];
    if (rd_kafka_conf_set(conf, name, value.c_str(), errstr, sizeof(errstr)) != RD_KAFKA_CONF_OK) {
        std::cerr << "Failed to set " << name << ": " << errstr << std::endl;
        return false;
    }
    return true;
}

void onDelivery(rd_kafka_t*, const rd_kafka_message_t* message, void* opaque) {
    auto* stats = static_cast<DeliveryStats*>(opaque);
    if (!stats) {
        return;
    }
    if (message->err != RD_KAFKA_RESP_ERR_NO_ERROR) {
        stats->failed.fetch_add(1);
        std::cerr << "Delivery to " << rd_kafka_topic_name(message->rkt) << " failed: "
                  << rd_kafka_err2str(message->err) << std::endl;
    }
    stats->in_flight.fetch_sub(1);
}

} // namespace

QueueProducer::QueueProducer(const IngesterConfig& config)
    : config_(config)
    , producer_(nullptr), logs_topic_(nullptr), traces_topic_(nullptr), metrics_topic_(nullptr)
{
}

QueueProducer::~QueueProducer() {
    shutdown();
}

bool QueueProducer::initialize() {
    char errstr[512];

    rd_kafka_conf_t* conf = rd_kafka_conf_new();

    if (!setConf(conf, "bootstrap.servers", config_.queue_brokers) ||
        !setConf(conf, "acks", std::to_string(config_.acks)) ||
        !setConf(conf, "compression.type", config_.compression_type) ||
        !setConf(conf, "retry.backoff.ms", std::to_string(config_.retry_backoff_ms)) ||
        !setConf(conf, "queue.buffering.max.messages", std::to_string(config_.max_in_flight)) ||
        !setConf(conf, "queue.buffering.max.kbytes", "1048576") ||  // 1GB
        !setConf(conf, "batch.num.messages", "1000") ||
        !setConf(conf, "linger.ms", "10") ||
        !setConf(conf, "enable.idempotence", "true")) {
        rd_kafka_conf_destroy(conf);
        return false;
    }

    rd_kafka_conf_set_dr_msg_cb(conf, onDelivery);
    rd_kafka_conf_set_opaque(conf, &delivery_);

    // rd_kafka_new takes ownership of conf on success only
    producer_ = rd_kafka_new(RD_KAFKA_PRODUCER, conf, errstr, sizeof(errstr));
    if (!producer_) {
        std::cerr << "Failed to create producer: " << errstr << std::endl;
        rd_kafka_conf_destroy(conf);
        return false;
    }

    logs_topic_ = rd_kafka_topic_new(producer_, config_.topic_logs.c_str(), rd_kafka_topic_conf_new());
    traces_topic_ = rd_kafka_topic_new(producer_, config_.topic_traces.c_str(), rd_kafka_topic_conf_new());
    metrics_topic_ = rd_kafka_topic_new(producer_, config_.topic_metrics.c_str(), rd_kafka_topic_conf_new());
    if (!logs_topic_ || !traces_topic_ || !metrics_topic_) {
        std::cerr << "Failed to create topic object: " << rd_kafka_err2str(rd_kafka_last_error()) << std::endl;
        shutdown();
        return false;
    }

    std::cout << "QueueProducer initialized with brokers: " << config_.queue_brokers
              << ", topics: " << config_.topic_logs << ", " << config_.topic_traces
              << ", " << config_.topic_metrics << std::endl;
    return true;
}

rd_kafka_topic_t* QueueProducer::topicFor(telemetry::v1::TelemetryType type) const {
    switch (type) {
        case telemetry::v1::OTEL_LOGS: return logs_topic_;
        case telemetry::v1::OTEL_TRACES: return traces_topic_;
        case telemetry::v1::OTEL_METRICS: return metrics_topic_;
        default: return nullptr;
    }
}

ProduceResult QueueProducer::produce(const telemetry::v1::RawTelemetryMessage& message) {
    if (!producer_) {
        return ProduceResult::PERSISTENT_ERROR;
    }
    rd_kafka_topic_t* topic = topicFor(message.telemetry_type());
    if (!topic) {
        std::cerr << "No topic for telemetry type " << message.telemetry_type() << std::endl;
        return ProduceResult::PERSISTENT_ERROR;
    }

    // Check backpressure
    if (isAtCapacity()) {
        return ProduceResult::QUEUE_FULL;
    }

    std::string serialized;
    if (!message.SerializeToString(&serialized)) {
        std::cerr << "Failed to serialize RawTelemetryMessage" << std::endl;
        return ProduceResult::PERSISTENT_ERROR;
    }

    // Increment in-flight count before producing
    delivery_.in_flight.fetch_add(1);

    // Produce with retry (will decrement counter on error)
    return produceWithRetry(topic, serialized, 0);
}

ProduceResult QueueProducer::produceWithRetry(rd_kafka_topic_t* topic, const std::string& serialized_data,
                                              int retry_count) {
    int ret = rd_kafka_produce(
        topic,
        RD_KAFKA_PARTITION_UA,  // Unassigned partition (let librdkafka choose)
        RD_KAFKA_MSG_F_COPY,    // Copy payload
        const_cast<void*>(static_cast<const void*>(serialized_data.data())),
        serialized_data.size(),
        nullptr,  // Key
        0,        // Key length
        nullptr   // Opaque (we use the global callback)
    );

    if (ret == -1) {
        rd_kafka_resp_err_t err = rd_kafka_last_error();

        if (err == RD_KAFKA_RESP_ERR__QUEUE_FULL) {
            // Don't retry queue full errors - return immediately
            delivery_.in_flight.fetch_sub(1);
            return ProduceResult::QUEUE_FULL;
        }

        // Retry retryable errors
        if (retry_count < config_.max_retries &&
            (err == RD_KAFKA_RESP_ERR_REQUEST_TIMED_OUT ||
             err == RD_KAFKA_RESP_ERR_BROKER_NOT_AVAILABLE ||
             err == RD_KAFKA_RESP_ERR_NETWORK_EXCEPTION)) {
            // Exponential backoff
            int backoff_ms = config_.retry_backoff_ms * (1 << retry_count);
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
            return produceWithRetry(topic, serialized_data, retry_count + 1);
        }

        // Non-retryable error or max retries exceeded
        std::cerr << "Kafka error (attempt " << (retry_count + 1) << "/" << (config_.max_retries + 1)
                  << "): " << rd_kafka_err2str(err) << std::endl;
        delivery_.in_flight.fetch_sub(1);
        return ProduceResult::PERSISTENT_ERROR;
    }

    // onDelivery decrements the in-flight count on completion
    rd_kafka_poll(producer_, 0);

    return ProduceResult::SUCCESS;
}

void QueueProducer::shutdown() {
    if (!producer_) {
        return;
    }

    // Flush any pending messages (wait up to 5 seconds)
    rd_kafka_resp_err_t err = rd_kafka_flush(producer_, 5000);
    if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
        std::cerr << "Warning: " << rd_kafka_outq_len(producer_)
                  << " messages were not delivered during shutdown" << std::endl;
    }
    rd_kafka_poll(producer_, 0);
    if (getFailedDeliveries() > 0) {
        std::cerr << "Warning: " << getFailedDeliveries() << " messages failed delivery" << std::endl;
    }

    for (rd_kafka_topic_t** topic : {&logs_topic_, &traces_topic_, &metrics_topic_}) {
        if (*topic) {
            rd_kafka_topic_destroy(*topic);
            *topic = nullptr;
        }
    }

    rd_kafka_destroy(producer_);
    producer_ = nullptr;
}
