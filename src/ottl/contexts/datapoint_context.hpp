#ifndef OTTL_DATAPOINT_CONTEXT_HPP
#define OTTL_DATAPOINT_CONTEXT_HPP

#include "../functions.hpp"
#include "../parser.hpp"
#include "common.hpp"
#include "metric_paths.hpp"
#include <optional>
#include <variant>

namespace ottl {

// Evaluation context for one data point of any metric kind. The owning
// metric is reachable through `metric.*` paths.
class DataPointContext {
public:
    using NumberDataPoint = opentelemetry::proto::metrics::v1::NumberDataPoint;
    using HistogramDataPoint = opentelemetry::proto::metrics::v1::HistogramDataPoint;
    using ExponentialHistogramDataPoint = opentelemetry::proto::metrics::v1::ExponentialHistogramDataPoint;
    using SummaryDataPoint = opentelemetry::proto::metrics::v1::SummaryDataPoint;
    using DataPoint = std::variant<NumberDataPoint*, HistogramDataPoint*, ExponentialHistogramDataPoint*,
                                   SummaryDataPoint*>;

    static constexpr const char* kName = "datapoint";

    DataPointContext(DataPoint data_point, contexts::Metric* metric, contexts::InstrumentationScope* scope,
                     std::string* scope_schema_url, contexts::Resource* resource, std::string* resource_schema_url)
        : data_point_(data_point), metric_(metric), scope_(scope), scope_schema_url_(scope_schema_url),
          resource_(resource), resource_schema_url_(resource_schema_url) {}

    const DataPoint& dataPoint() const { return data_point_; }
    contexts::Metric* metric() const { return metric_; }
    contexts::InstrumentationScope* scope() const { return scope_; }
    std::string* scopeSchemaUrl() const { return scope_schema_url_; }
    contexts::Resource* resource() const { return resource_; }
    std::string* resourceSchemaUrl() const { return resource_schema_url_; }
    Map& cache() { return cache_; }

    static GetSetterPtr<DataPointContext> parsePath(const Path<DataPointContext>& path);
    // Metric symbols plus FLAG_NONE and FLAG_NO_RECORDED_VALUE
    static std::optional<int64_t> parseEnum(const std::string& symbol);
    static Parser<DataPointContext> newParser(FactoryMap<DataPointContext> functions);

private:
    DataPoint data_point_;
    contexts::Metric* metric_;
    contexts::InstrumentationScope* scope_;
    std::string* scope_schema_url_;
    contexts::Resource* resource_;
    std::string* resource_schema_url_;
    Map cache_;
};

} // namespace ottl

#endif // OTTL_DATAPOINT_CONTEXT_HPP
