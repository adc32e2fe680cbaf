#include "spanevent_context.hpp"

namespace ottl {

using contexts::intAccessor;
using contexts::stringAccessor;
using contexts::timeAccessor;

GetSetterPtr<SpanEventContext> SpanEventContext::parsePath(const Path<SpanEventContext>& path) {
    static const std::vector<std::string> valid = {
        "cache", "resource", "instrumentation_scope", "span", "time_unix_nano", "time", "name",
        "attributes", "dropped_attributes_count", "event_index"};
    const std::string& name = path.name();

    if (name == "cache") {
        return contexts::cachePathGetSetter(path);
    }
    if (auto parent = contexts::parentPathGetSetter(path)) {
        return parent;
    }
    if (name == "span") {
        requireNoKeys(path);
        if (!path.next()) {
            throw ConfigError("path \"" + path.text() + "\" must name a field of span");
        }
        return contexts::spanPathGetSetter(*path.next());
    }
    if (name == "attributes") {
        requireLast(path);
        return contexts::mapAccessor<SpanEventContext>(
            "attributes", [](SpanEventContext& tctx) { return tctx.spanEvent()->mutable_attributes(); },
            path.keys());
    }

    requireLeaf(path);
    if (name == "time_unix_nano") {
        return intAccessor<SpanEventContext>(
            name, [](SpanEventContext& tctx) { return tctx.spanEvent()->time_unix_nano(); },
            [](SpanEventContext& tctx, int64_t v) {
                tctx.spanEvent()->set_time_unix_nano(static_cast<uint64_t>(v));
            });
    }
    if (name == "time") {
        return timeAccessor<SpanEventContext>(
            name, [](SpanEventContext& tctx) { return tctx.spanEvent()->time_unix_nano(); },
            [](SpanEventContext& tctx, uint64_t v) { tctx.spanEvent()->set_time_unix_nano(v); });
    }
    if (name == "name") {
        return stringAccessor<SpanEventContext>(
            name, [](SpanEventContext& tctx) { return tctx.spanEvent()->name(); },
            [](SpanEventContext& tctx, const std::string& v) { tctx.spanEvent()->set_name(v); });
    }
    if (name == "dropped_attributes_count") {
        return intAccessor<SpanEventContext>(
            name, [](SpanEventContext& tctx) { return tctx.spanEvent()->dropped_attributes_count(); },
            [](SpanEventContext& tctx, int64_t v) {
                tctx.spanEvent()->set_dropped_attributes_count(static_cast<uint32_t>(v));
            });
    }
    if (name == "event_index") {
        return contexts::readOnly<SpanEventContext>(
            [](const ExecContext&, SpanEventContext& tctx) { return Value(tctx.eventIndex()); });
    }
    throw unknownPathError(name, path.text(), kName, valid);
}

std::optional<int64_t> SpanEventContext::parseEnum(const std::string& symbol) {
    return contexts::parseSpanEnum(symbol);
}

Parser<SpanEventContext> SpanEventContext::newParser(FactoryMap<SpanEventContext> functions) {
    return Parser<SpanEventContext>(std::move(functions), &SpanEventContext::parsePath,
                                    &SpanEventContext::parseEnum, kName);
}

} // namespace ottl
