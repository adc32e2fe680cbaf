#ifndef TELEMETRY_FILTER_HPP
#define TELEMETRY_FILTER_HPP

#include "filter_config.pb.h"
#include "logs_filter.hpp"
#include "metrics_filter.hpp"
#include "traces_filter.hpp"
#include <memory>
#include <string>

// Filters for all three signals, built from one FilterConfig. A signal
// without conditions has no filter and passes through unchanged.
class TelemetryFilter {
public:
    // Parses a JSON filter configuration. Throws ottl::ConfigError when the
    // document does not match FilterConfig or a condition fails to compile.
    static std::unique_ptr<TelemetryFilter> fromJson(const std::string& json);
    static std::unique_ptr<TelemetryFilter> fromFile(const std::string& path);
    static std::unique_ptr<TelemetryFilter> fromConfig(const telemetry::filter::v1::FilterConfig& config);

    LogsFilter* logs() const { return logs_.get(); }
    TracesFilter* traces() const { return traces_.get(); }
    MetricsFilter* metrics() const { return metrics_.get(); }

    bool empty() const { return !logs_ && !traces_ && !metrics_; }

private:
    std::unique_ptr<LogsFilter> logs_;
    std::unique_ptr<TracesFilter> traces_;
    std::unique_ptr<MetricsFilter> metrics_;
};

#endif // TELEMETRY_FILTER_HPP
