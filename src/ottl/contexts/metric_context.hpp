#ifndef OTTL_METRIC_CONTEXT_HPP
#define OTTL_METRIC_CONTEXT_HPP

#include "../functions.hpp"
#include "../parser.hpp"
#include "common.hpp"
#include "metric_paths.hpp"
#include <optional>

namespace ottl {

// Evaluation context for one metric together with its scope and resource
class MetricContext {
public:
    static constexpr const char* kName = "metric";

    MetricContext(contexts::Metric* metric, contexts::InstrumentationScope* scope, std::string* scope_schema_url,
                  contexts::Resource* resource, std::string* resource_schema_url)
        : metric_(metric), scope_(scope), scope_schema_url_(scope_schema_url),
          resource_(resource), resource_schema_url_(resource_schema_url) {}

    contexts::Metric* metric() const { return metric_; }
    contexts::InstrumentationScope* scope() const { return scope_; }
    std::string* scopeSchemaUrl() const { return scope_schema_url_; }
    contexts::Resource* resource() const { return resource_; }
    std::string* resourceSchemaUrl() const { return resource_schema_url_; }
    Map& cache() { return cache_; }

    static GetSetterPtr<MetricContext> parsePath(const Path<MetricContext>& path);
    static std::optional<int64_t> parseEnum(const std::string& symbol);
    static Parser<MetricContext> newParser(FactoryMap<MetricContext> functions);

private:
    contexts::Metric* metric_;
    contexts::InstrumentationScope* scope_;
    std::string* scope_schema_url_;
    contexts::Resource* resource_;
    std::string* resource_schema_url_;
    Map cache_;
};

} // namespace ottl

#endif // OTTL_METRIC_CONTEXT_HPP
