#include "http_server.hpp"
#include "queue_producer.hpp"
#include "../filter/telemetry_filter.hpp"
#include "crow.h"
#include <chrono>
#include <iostream>
#include <cctype>
#include <zlib.h>
#include <google/protobuf/util/json_util.h>
#include "telemetry_wrapper.pb.h"
#include "opentelemetry/proto/collector/logs/v1/logs_service.pb.h"
#include "opentelemetry/proto/collector/metrics/v1/metrics_service.pb.h"
#include "opentelemetry/proto/collector/trace/v1/trace_service.pb.h"

using opentelemetry::proto::collector::logs::v1::ExportLogsServiceRequest;
using opentelemetry::proto::collector::logs::v1::ExportLogsServiceResponse;
using opentelemetry::proto::collector::metrics::v1::ExportMetricsServiceRequest;
using opentelemetry::proto::collector::metrics::v1::ExportMetricsServiceResponse;
using opentelemetry::proto::collector::trace::v1::ExportTraceServiceRequest;
using opentelemetry::proto::collector::trace::v1::ExportTraceServiceResponse;

static bool decompressGzip(const std::string &in, std::string &out) {
    if (in.empty()) { out.clear(); return true; }
    z_stream strm{};
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    strm.avail_in = static_cast<uInt>(in.size());

    // 16 + MAX_WBITS to enable gzip decoding with automatic header detection
    if (inflateInit2(&strm, 16 + MAX_WBITS) != Z_OK) {
        return false;
    }

    char buf[4096];
    int ret;
    do {
        strm.next_out = reinterpret_cast<Bytef*>(buf);
        strm.avail_out = sizeof(buf);
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&strm);
            return false;
        }
        size_t have = sizeof(buf) - strm.avail_out;
        out.append(buf, have);
    } while (ret != Z_STREAM_END);

    inflateEnd(&strm);
    return true;
}

static inline std::string to_lower_trimmed(const std::string &s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    size_t start = out.find_first_not_of(' ');
    size_t end = out.find_last_not_of(' ');
    if (start == std::string::npos) return std::string();
    return out.substr(start, end - start + 1);
}

static bool isJsonContentType(const std::string& content_type) {
    return content_type == "application/json" || content_type == "text/json";
}

static bool isSupportedContentType(const std::string& content_type) {
    return content_type == "application/x-protobuf" ||
           content_type == "application/protobuf" ||
           isJsonContentType(content_type);
}

static const char* signalName(telemetry::v1::TelemetryType type) {
    switch (type) {
        case telemetry::v1::OTEL_LOGS: return "logs";
        case telemetry::v1::OTEL_TRACES: return "traces";
        case telemetry::v1::OTEL_METRICS: return "metrics";
        default: return "unknown";
    }
}

// Decodes one export request, runs the signal's filter and forwards what
// is left. Filter may be null when the signal has no conditions.
template <typename Request, typename Response, typename Filter>
static crow::response handleExport(const crow::request& req, telemetry::v1::TelemetryType type,
                                   Filter* filter, const std::shared_ptr<QueueProducer>& queue_producer) {
    std::string content_type = req.get_header_value("Content-Type");
    // strip parameters like charset
    auto semipos = content_type.find(';');
    if (semipos != std::string::npos) content_type = content_type.substr(0, semipos);
    content_type = to_lower_trimmed(content_type);

    if (!isSupportedContentType(content_type)) {
        return crow::response(415, "Unsupported Media Type");
    }

    std::string body = req.body;
    std::string content_encoding = to_lower_trimmed(req.get_header_value("Content-Encoding"));
    if (content_encoding == "gzip") {
        std::string decompressed;
        if (!decompressGzip(req.body, decompressed)) {
            return crow::response(400, "Failed to decompress gzip payload");
        }
        body.swap(decompressed);
    }

    Request request;
    if (isJsonContentType(content_type)) {
        auto status = google::protobuf::util::JsonStringToMessage(body, &request);
        if (!status.ok()) {
            return crow::response(400, "Invalid JSON payload: " + status.ToString());
        }
    } else if (!request.ParseFromString(body)) {
        return crow::response(400, "Invalid Protobuf payload");
    }

    int64_t dropped = 0;
    bool skip = false;
    if (filter) {
        FilterResult result = filter->filter(request);
        dropped = result.dropped;
        if (result.status == FilterStatus::ERROR) {
            std::cerr << "Failed filtering " << signalName(type) << ": " << result.error << std::endl;
            return crow::response(500, "Internal Server Error: " + result.error);
        }
        skip = result.status == FilterStatus::SKIP_PROCESSING_DATA;
    }

    if (!skip) {
        telemetry::v1::RawTelemetryMessage wrapper;
        wrapper.set_content_type("application/x-protobuf");
        wrapper.set_telemetry_type(type);
        wrapper.set_received_at_unix_nano(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
        wrapper.set_dropped_records(dropped);
        if (!request.SerializeToString(wrapper.mutable_payload())) {
            return crow::response(500, "Failed to serialize filtered payload");
        }

        if (queue_producer) {
            // Check backpressure before attempting to produce
            if (queue_producer->isAtCapacity()) {
                return crow::response(429, "Too Many Requests: Queue is at capacity");
            }

            ProduceResult result = queue_producer->produce(wrapper);

            if (result == ProduceResult::QUEUE_FULL) {
                return crow::response(503, "Service Unavailable: Queue is full");
            } else if (result == ProduceResult::PERSISTENT_ERROR) {
                return crow::response(500, "Internal Server Error: Failed to queue message");
            } else if (result != ProduceResult::SUCCESS) {
                return crow::response(503, "Service Unavailable: Queue error");
            }
        } else {
            // Fallback: just log (for testing without queue)
            std::cout << "Received " << signalName(type) << " batch with content_type="
                      << content_type << ", payload_size=" << wrapper.payload().size()
                      << ", dropped=" << dropped << std::endl;
        }
    } else {
        std::cout << "Dropped entire " << signalName(type) << " batch (" << dropped << " records)" << std::endl;
    }

    Response resp_msg;
    std::string resp_body;
    if (!resp_msg.SerializeToString(&resp_body)) {
        return crow::response(500, "Failed to serialize response");
    }
    crow::response res(200, resp_body);
    res.add_header("Content-Type", "application/x-protobuf");
    return res;
}

HttpServer::HttpServer() : queue_producer_(nullptr), filter_(nullptr) {}

HttpServer::HttpServer(std::shared_ptr<QueueProducer> queue_producer, std::shared_ptr<TelemetryFilter> filter)
    : queue_producer_(std::move(queue_producer)), filter_(std::move(filter)) {}

void HttpServer::setupRoutes(crow::SimpleApp& app) {
    auto queue_producer = queue_producer_;  // Capture for lambda
    auto filter = filter_;

    // Health check endpoint for Kubernetes liveness probe
    CROW_ROUTE(app, "/health")
        ([](){
            return crow::response(200, "OK");
        });

    // Readiness check endpoint for Kubernetes readiness probe
    CROW_ROUTE(app, "/ready")
        ([queue_producer](){
            if (queue_producer && !queue_producer->isReady()) {
                return crow::response(503, "Queue producer not ready");
            }
            return crow::response(200, "OK");
        });

    CROW_ROUTE(app, "/v1/logs")
        .methods("POST"_method)
        ([queue_producer, filter](const crow::request& req){
            return handleExport<ExportLogsServiceRequest, ExportLogsServiceResponse>(
                req, telemetry::v1::OTEL_LOGS, filter ? filter->logs() : nullptr, queue_producer);
        });

    CROW_ROUTE(app, "/v1/traces")
        .methods("POST"_method)
        ([queue_producer, filter](const crow::request& req){
            return handleExport<ExportTraceServiceRequest, ExportTraceServiceResponse>(
                req, telemetry::v1::OTEL_TRACES, filter ? filter->traces() : nullptr, queue_producer);
        });

    CROW_ROUTE(app, "/v1/metrics")
        .methods("POST"_method)
        ([queue_producer, filter](const crow::request& req){
            return handleExport<ExportMetricsServiceRequest, ExportMetricsServiceResponse>(
                req, telemetry::v1::OTEL_METRICS, filter ? filter->metrics() : nullptr, queue_producer);
        });
}

void HttpServer::start(const std::string& host, int port) {
    crow::SimpleApp app;
    setupRoutes(app);

    std::cout << "OTLP filtering receiver is running at http://" << host << ":" << port << std::endl;
    app.bindaddr(host).port(port).multithreaded().run();
}
