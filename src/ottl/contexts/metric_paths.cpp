#include "metric_paths.hpp"

namespace ottl {
namespace contexts {

namespace {

using opentelemetry::proto::metrics::v1::AggregationTemporality;

const std::pair<const char*, MetricDataType> kDataTypes[] = {
    {"METRIC_DATA_TYPE_NONE", METRIC_DATA_TYPE_NONE},
    {"METRIC_DATA_TYPE_GAUGE", METRIC_DATA_TYPE_GAUGE},
    {"METRIC_DATA_TYPE_SUM", METRIC_DATA_TYPE_SUM},
    {"METRIC_DATA_TYPE_HISTOGRAM", METRIC_DATA_TYPE_HISTOGRAM},
    {"METRIC_DATA_TYPE_EXPONENTIAL_HISTOGRAM", METRIC_DATA_TYPE_EXPONENTIAL_HISTOGRAM},
    {"METRIC_DATA_TYPE_SUMMARY", METRIC_DATA_TYPE_SUMMARY},
};

} // namespace

MetricDataType metricDataType(const Metric& metric) {
    switch (metric.data_case()) {
        case Metric::kGauge:
            return METRIC_DATA_TYPE_GAUGE;
        case Metric::kSum:
            return METRIC_DATA_TYPE_SUM;
        case Metric::kHistogram:
            return METRIC_DATA_TYPE_HISTOGRAM;
        case Metric::kExponentialHistogram:
            return METRIC_DATA_TYPE_EXPONENTIAL_HISTOGRAM;
        case Metric::kSummary:
            return METRIC_DATA_TYPE_SUMMARY;
        case Metric::DATA_NOT_SET:
            break;
    }
    return METRIC_DATA_TYPE_NONE;
}

std::optional<int64_t> aggregationTemporality(const Metric& metric) {
    switch (metric.data_case()) {
        case Metric::kSum:
            return metric.sum().aggregation_temporality();
        case Metric::kHistogram:
            return metric.histogram().aggregation_temporality();
        case Metric::kExponentialHistogram:
            return metric.exponential_histogram().aggregation_temporality();
        default:
            return std::nullopt;
    }
}

bool setAggregationTemporality(Metric& metric, int64_t temporality) {
    auto value = static_cast<AggregationTemporality>(temporality);
    switch (metric.data_case()) {
        case Metric::kSum:
            metric.mutable_sum()->set_aggregation_temporality(value);
            return true;
        case Metric::kHistogram:
            metric.mutable_histogram()->set_aggregation_temporality(value);
            return true;
        case Metric::kExponentialHistogram:
            metric.mutable_exponential_histogram()->set_aggregation_temporality(value);
            return true;
        default:
            return false;
    }
}

std::optional<int64_t> parseMetricEnum(const std::string& symbol) {
    for (const auto& entry : kDataTypes) {
        if (symbol == entry.first) {
            return static_cast<int64_t>(entry.second);
        }
    }
    AggregationTemporality temporality;
    if (opentelemetry::proto::metrics::v1::AggregationTemporality_Parse(symbol, &temporality)) {
        return static_cast<int64_t>(temporality);
    }
    return std::nullopt;
}

} // namespace contexts
} // namespace ottl
