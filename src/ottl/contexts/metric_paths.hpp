#ifndef OTTL_CONTEXTS_METRIC_PATHS_HPP
#define OTTL_CONTEXTS_METRIC_PATHS_HPP

#include "common.hpp"
#include "opentelemetry/proto/metrics/v1/metrics.pb.h"
#include <optional>

// Metric fields, shared by the metric context and by `metric.*` paths of the
// data point context. K must expose metric().
namespace ottl {
namespace contexts {

using Metric = opentelemetry::proto::metrics::v1::Metric;

enum MetricDataType : int64_t {
    METRIC_DATA_TYPE_NONE = 0,
    METRIC_DATA_TYPE_GAUGE = 1,
    METRIC_DATA_TYPE_SUM = 2,
    METRIC_DATA_TYPE_HISTOGRAM = 3,
    METRIC_DATA_TYPE_EXPONENTIAL_HISTOGRAM = 4,
    METRIC_DATA_TYPE_SUMMARY = 5
};

MetricDataType metricDataType(const Metric& metric);

// Aggregation temporality of sums and histograms, empty for other kinds
std::optional<int64_t> aggregationTemporality(const Metric& metric);
// Returns false when the metric kind has no temporality
bool setAggregationTemporality(Metric& metric, int64_t temporality);

// METRIC_DATA_TYPE_* and AGGREGATION_TEMPORALITY_* symbols
std::optional<int64_t> parseMetricEnum(const std::string& symbol);

template <typename K>
GetSetterPtr<K> metricPathGetSetter(const Path<K>& path) {
    static const std::vector<std::string> valid = {"name", "description", "unit", "type",
                                                   "aggregation_temporality", "is_monotonic", "metadata"};
    const std::string& name = path.name();

    if (name == "metadata") {
        requireLast(path);
        return mapAccessor<K>(
            "metadata", [](K& tctx) { return tctx.metric()->mutable_metadata(); }, path.keys());
    }

    requireLeaf(path);
    if (name == "name") {
        return stringAccessor<K>(
            name, [](K& tctx) { return tctx.metric()->name(); },
            [](K& tctx, const std::string& v) { tctx.metric()->set_name(v); });
    }
    if (name == "description") {
        return stringAccessor<K>(
            name, [](K& tctx) { return tctx.metric()->description(); },
            [](K& tctx, const std::string& v) { tctx.metric()->set_description(v); });
    }
    if (name == "unit") {
        return stringAccessor<K>(
            name, [](K& tctx) { return tctx.metric()->unit(); },
            [](K& tctx, const std::string& v) { tctx.metric()->set_unit(v); });
    }
    if (name == "type") {
        return readOnly<K>([](const ExecContext&, K& tctx) {
            return Value(static_cast<int64_t>(metricDataType(*tctx.metric())));
        });
    }
    if (name == "aggregation_temporality") {
        return makeGetSetter<K>(
            [](const ExecContext&, K& tctx) {
                std::optional<int64_t> temporality = aggregationTemporality(*tctx.metric());
                return temporality ? Value(*temporality) : Value();
            },
            [](const ExecContext&, K& tctx, const Value& v) {
                setAggregationTemporality(*tctx.metric(), intForField(v, "aggregation_temporality"));
            });
    }
    if (name == "is_monotonic") {
        return makeGetSetter<K>(
            [](const ExecContext&, K& tctx) {
                Metric* metric = tctx.metric();
                return metric->has_sum() ? Value(metric->sum().is_monotonic()) : Value();
            },
            [](const ExecContext&, K& tctx, const Value& v) {
                bool monotonic = boolForField(v, "is_monotonic");
                Metric* metric = tctx.metric();
                if (metric->has_sum()) {
                    metric->mutable_sum()->set_is_monotonic(monotonic);
                }
            });
    }
    throw unknownPathError(name, path.text(), "metric", valid);
}

} // namespace contexts
} // namespace ottl

#endif // OTTL_CONTEXTS_METRIC_PATHS_HPP
