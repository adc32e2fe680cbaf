#include "telemetry_filter.hpp"
#include <google/protobuf/util/json_util.h>
#include <fstream>
#include <sstream>

std::unique_ptr<TelemetryFilter> TelemetryFilter::fromJson(const std::string& json) {
    telemetry::filter::v1::FilterConfig config;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;
    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
        throw ottl::ConfigError("invalid filter configuration: " + status.ToString());
    }
    return fromConfig(config);
}

std::unique_ptr<TelemetryFilter> TelemetryFilter::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ottl::ConfigError("cannot open filter configuration " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str());
}

std::unique_ptr<TelemetryFilter> TelemetryFilter::fromConfig(const telemetry::filter::v1::FilterConfig& config) {
    // Validates the error mode even when no signal is configured
    ottl::parseErrorMode(config.error_mode());

    auto filter = std::make_unique<TelemetryFilter>();
    filter->logs_ = LogsFilter::fromConfig(config);
    filter->traces_ = TracesFilter::fromConfig(config);
    filter->metrics_ = MetricsFilter::fromConfig(config);
    return filter;
}
