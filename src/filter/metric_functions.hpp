#ifndef METRIC_FUNCTIONS_HPP
#define METRIC_FUNCTIONS_HPP

#include "../ottl/contexts/metric_context.hpp"
#include "../ottl/funcs/converters.hpp"
#include <string>

// Converters available only to metric filter conditions. They look through
// every data point of the metric, whatever its kind.

// Calls fn with the attributes of each data point until it returns true
template <typename Fn>
bool anyDataPointAttributes(const ottl::contexts::Metric& metric, Fn fn) {
    auto scan = [&fn](const auto& points) {
        for (const auto& point : points) {
            if (fn(point.attributes())) {
                return true;
            }
        }
        return false;
    };
    switch (metric.data_case()) {
    case ottl::contexts::Metric::kGauge:
        return scan(metric.gauge().data_points());
    case ottl::contexts::Metric::kSum:
        return scan(metric.sum().data_points());
    case ottl::contexts::Metric::kHistogram:
        return scan(metric.histogram().data_points());
    case ottl::contexts::Metric::kExponentialHistogram:
        return scan(metric.exponential_histogram().data_points());
    case ottl::contexts::Metric::kSummary:
        return scan(metric.summary().data_points());
    default:
        return false;
    }
}

inline const opentelemetry::proto::common::v1::AnyValue* findAttribute(
    const google::protobuf::RepeatedPtrField<opentelemetry::proto::common::v1::KeyValue>& attributes,
    const std::string& key) {
    for (const auto& kv : attributes) {
        if (kv.key() == key) {
            return &kv.value();
        }
    }
    return nullptr;
}

inline ottl::FactoryPtr<ottl::MetricContext> newHasAttrKeyOnDatapointFactory() {
    using ottl::MetricContext;
    return ottl::makeFactory<MetricContext>(
        "HasAttrKeyOnDatapoint", {{"key", ottl::ArgKind::StringLiteral}},
        [](const ottl::FunctionContext&, const ottl::Arguments<MetricContext>& args) -> ottl::ExprFunc<MetricContext> {
            std::string key = args.stringLiteral("key");
            return [key](const ottl::ExecContext&, MetricContext& tctx) {
                return ottl::Value(anyDataPointAttributes(*tctx.metric(), [&key](const auto& attributes) {
                    return findAttribute(attributes, key) != nullptr;
                }));
            };
        });
}

// Matches string attributes only
inline ottl::FactoryPtr<ottl::MetricContext> newHasAttrOnDatapointFactory() {
    using ottl::MetricContext;
    return ottl::makeFactory<MetricContext>(
        "HasAttrOnDatapoint",
        {{"key", ottl::ArgKind::StringLiteral}, {"expected_val", ottl::ArgKind::StringLiteral}},
        [](const ottl::FunctionContext&, const ottl::Arguments<MetricContext>& args) -> ottl::ExprFunc<MetricContext> {
            std::string key = args.stringLiteral("key");
            std::string expected = args.stringLiteral("expected_val");
            return [key, expected](const ottl::ExecContext&, MetricContext& tctx) {
                return ottl::Value(anyDataPointAttributes(*tctx.metric(), [&](const auto& attributes) {
                    const auto* value = findAttribute(attributes, key);
                    return value != nullptr &&
                           value->value_case() == opentelemetry::proto::common::v1::AnyValue::kStringValue &&
                           value->string_value() == expected;
                }));
            };
        });
}

inline ottl::FactoryMap<ottl::MetricContext> metricFilterFunctions() {
    return ottl::mergeFactoryMaps(
        ottl::funcs::standardConverters<ottl::MetricContext>(),
        ottl::createFactoryMap<ottl::MetricContext>(
            {newHasAttrKeyOnDatapointFactory(), newHasAttrOnDatapointFactory()}));
}

#endif // METRIC_FUNCTIONS_HPP
