#include "span_context.hpp"

namespace ottl {

GetSetterPtr<SpanContext> SpanContext::parsePath(const Path<SpanContext>& path) {
    if (path.name() == "cache") {
        return contexts::cachePathGetSetter(path);
    }
    if (auto parent = contexts::parentPathGetSetter(path)) {
        return parent;
    }
    return contexts::spanPathGetSetter(path);
}

std::optional<int64_t> SpanContext::parseEnum(const std::string& symbol) {
    return contexts::parseSpanEnum(symbol);
}

Parser<SpanContext> SpanContext::newParser(FactoryMap<SpanContext> functions) {
    return Parser<SpanContext>(std::move(functions), &SpanContext::parsePath, &SpanContext::parseEnum, kName);
}

} // namespace ottl
