#ifndef OTTL_SPAN_CONTEXT_HPP
#define OTTL_SPAN_CONTEXT_HPP

#include "../functions.hpp"
#include "../parser.hpp"
#include "common.hpp"
#include "span_paths.hpp"
#include <optional>

namespace ottl {

// Evaluation context for one span together with its scope and resource
class SpanContext {
public:
    static constexpr const char* kName = "span";

    SpanContext(contexts::Span* span, contexts::InstrumentationScope* scope, std::string* scope_schema_url,
                contexts::Resource* resource, std::string* resource_schema_url)
        : span_(span), scope_(scope), scope_schema_url_(scope_schema_url),
          resource_(resource), resource_schema_url_(resource_schema_url) {}

    contexts::Span* span() const { return span_; }
    contexts::InstrumentationScope* scope() const { return scope_; }
    std::string* scopeSchemaUrl() const { return scope_schema_url_; }
    contexts::Resource* resource() const { return resource_; }
    std::string* resourceSchemaUrl() const { return resource_schema_url_; }
    Map& cache() { return cache_; }

    static GetSetterPtr<SpanContext> parsePath(const Path<SpanContext>& path);
    static std::optional<int64_t> parseEnum(const std::string& symbol);
    static Parser<SpanContext> newParser(FactoryMap<SpanContext> functions);

private:
    contexts::Span* span_;
    contexts::InstrumentationScope* scope_;
    std::string* scope_schema_url_;
    contexts::Resource* resource_;
    std::string* resource_schema_url_;
    Map cache_;
};

} // namespace ottl

#endif // OTTL_SPAN_CONTEXT_HPP
