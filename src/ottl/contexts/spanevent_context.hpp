#ifndef OTTL_SPANEVENT_CONTEXT_HPP
#define OTTL_SPANEVENT_CONTEXT_HPP

#include "../functions.hpp"
#include "../parser.hpp"
#include "common.hpp"
#include "span_paths.hpp"
#include <optional>

namespace ottl {

// Evaluation context for one span event. The owning span is reachable
// through `span.*` paths.
class SpanEventContext {
public:
    using SpanEvent = opentelemetry::proto::trace::v1::Span::Event;

    static constexpr const char* kName = "spanevent";

    SpanEventContext(SpanEvent* event, int64_t event_index, contexts::Span* span,
                     contexts::InstrumentationScope* scope, std::string* scope_schema_url,
                     contexts::Resource* resource, std::string* resource_schema_url)
        : event_(event), event_index_(event_index), span_(span), scope_(scope), scope_schema_url_(scope_schema_url),
          resource_(resource), resource_schema_url_(resource_schema_url) {}

    SpanEvent* spanEvent() const { return event_; }
    int64_t eventIndex() const { return event_index_; }
    contexts::Span* span() const { return span_; }
    contexts::InstrumentationScope* scope() const { return scope_; }
    std::string* scopeSchemaUrl() const { return scope_schema_url_; }
    contexts::Resource* resource() const { return resource_; }
    std::string* resourceSchemaUrl() const { return resource_schema_url_; }
    Map& cache() { return cache_; }

    static GetSetterPtr<SpanEventContext> parsePath(const Path<SpanEventContext>& path);
    static std::optional<int64_t> parseEnum(const std::string& symbol);
    static Parser<SpanEventContext> newParser(FactoryMap<SpanEventContext> functions);

private:
    SpanEvent* event_;
    int64_t event_index_;
    contexts::Span* span_;
    contexts::InstrumentationScope* scope_;
    std::string* scope_schema_url_;
    contexts::Resource* resource_;
    std::string* resource_schema_url_;
    Map cache_;
};

} // namespace ottl

#endif // OTTL_SPANEVENT_CONTEXT_HPP
