#include "metric_context.hpp"

namespace ottl {

GetSetterPtr<MetricContext> MetricContext::parsePath(const Path<MetricContext>& path) {
    if (path.name() == "cache") {
        return contexts::cachePathGetSetter(path);
    }
    if (auto parent = contexts::parentPathGetSetter(path)) {
        return parent;
    }
    return contexts::metricPathGetSetter(path);
}

std::optional<int64_t> MetricContext::parseEnum(const std::string& symbol) {
    return contexts::parseMetricEnum(symbol);
}

Parser<MetricContext> MetricContext::newParser(FactoryMap<MetricContext> functions) {
    return Parser<MetricContext>(std::move(functions), &MetricContext::parsePath, &MetricContext::parseEnum,
                                 kName);
}

} // namespace ottl
