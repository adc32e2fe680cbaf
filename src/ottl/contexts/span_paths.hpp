#ifndef OTTL_CONTEXTS_SPAN_PATHS_HPP
#define OTTL_CONTEXTS_SPAN_PATHS_HPP

#include "common.hpp"
#include "opentelemetry/proto/trace/v1/trace.pb.h"
#include <optional>

// Span fields, shared by the span context and by `span.*` paths of the span
// event context. K must expose span().
namespace ottl {
namespace contexts {

using Span = opentelemetry::proto::trace::v1::Span;

// Short kind names used by `kind.string`
const char* spanKindName(int kind);
std::optional<int> spanKindFromName(const std::string& name);
// Enum names used by `kind.deprecated_string`
std::optional<int> spanKindFromEnumName(const std::string& name);

// SPAN_KIND_* and STATUS_CODE_* symbols
std::optional<int64_t> parseSpanEnum(const std::string& symbol);

template <typename K>
GetSetterPtr<K> spanKindPath(const Path<K>& path) {
    requireNoKeys(path);
    const Path<K>* next = path.next();
    if (!next) {
        return intAccessor<K>(
            "kind", [](K& tctx) { return tctx.span()->kind(); },
            [](K& tctx, int64_t v) { tctx.span()->set_kind(static_cast<Span::SpanKind>(v)); });
    }
    requireLeaf(*next);
    if (next->name() == "string") {
        return makeGetSetter<K>(
            [](const ExecContext&, K& tctx) { return Value(std::string(spanKindName(tctx.span()->kind()))); },
            [](const ExecContext&, K& tctx, const Value& v) {
                std::string name = stringForField(v, "kind.string");
                std::optional<int> kind = spanKindFromName(name);
                if (!kind) {
                    throw EvalError("unknown span kind \"" + name + "\"");
                }
                tctx.span()->set_kind(static_cast<Span::SpanKind>(*kind));
            });
    }
    if (next->name() == "deprecated_string") {
        return makeGetSetter<K>(
            [](const ExecContext&, K& tctx) { return Value(Span::SpanKind_Name(tctx.span()->kind())); },
            [](const ExecContext&, K& tctx, const Value& v) {
                std::string name = stringForField(v, "kind.deprecated_string");
                std::optional<int> kind = spanKindFromEnumName(name);
                if (!kind) {
                    throw EvalError("unknown span kind \"" + name + "\"");
                }
                tctx.span()->set_kind(static_cast<Span::SpanKind>(*kind));
            });
    }
    throw unknownPathError(next->name(), path.text(), "kind", {"string", "deprecated_string"});
}

template <typename K>
GetSetterPtr<K> spanStatusPath(const Path<K>& path) {
    requireNoKeys(path);
    const Path<K>* next = path.next();
    if (!next) {
        throw ConfigError("path \"" + path.text() + "\" must name a field of status");
    }
    requireLeaf(*next);
    if (next->name() == "code") {
        return intAccessor<K>(
            "status.code", [](K& tctx) { return tctx.span()->status().code(); },
            [](K& tctx, int64_t v) {
                tctx.span()->mutable_status()->set_code(
                    static_cast<opentelemetry::proto::trace::v1::Status::StatusCode>(v));
            });
    }
    if (next->name() == "message") {
        return stringAccessor<K>(
            "status.message", [](K& tctx) { return tctx.span()->status().message(); },
            [](K& tctx, const std::string& v) { tctx.span()->mutable_status()->set_message(v); });
    }
    throw unknownPathError(next->name(), path.text(), "status", {"code", "message"});
}

template <typename K>
GetSetterPtr<K> spanPathGetSetter(const Path<K>& path) {
    static const std::vector<std::string> valid = {
        "trace_id", "span_id", "parent_span_id", "trace_state", "name", "kind",
        "start_time_unix_nano", "end_time_unix_nano", "start_time", "end_time", "attributes",
        "dropped_attributes_count", "dropped_events_count", "dropped_links_count", "status", "flags"};
    const std::string& name = path.name();

    if (name == "trace_id") {
        return idAccessor(path, [](K& tctx) { return tctx.span()->mutable_trace_id(); }, 16);
    }
    if (name == "span_id") {
        return idAccessor(path, [](K& tctx) { return tctx.span()->mutable_span_id(); }, 8);
    }
    if (name == "parent_span_id") {
        return idAccessor(path, [](K& tctx) { return tctx.span()->mutable_parent_span_id(); }, 8);
    }
    if (name == "kind") {
        return spanKindPath(path);
    }
    if (name == "status") {
        return spanStatusPath(path);
    }
    if (name == "attributes") {
        requireLast(path);
        return mapAccessor<K>(
            "attributes", [](K& tctx) { return tctx.span()->mutable_attributes(); }, path.keys());
    }

    requireLeaf(path);
    if (name == "trace_state") {
        return stringAccessor<K>(
            name, [](K& tctx) { return tctx.span()->trace_state(); },
            [](K& tctx, const std::string& v) { tctx.span()->set_trace_state(v); });
    }
    if (name == "name") {
        return stringAccessor<K>(
            name, [](K& tctx) { return tctx.span()->name(); },
            [](K& tctx, const std::string& v) { tctx.span()->set_name(v); });
    }
    if (name == "start_time_unix_nano") {
        return intAccessor<K>(
            name, [](K& tctx) { return tctx.span()->start_time_unix_nano(); },
            [](K& tctx, int64_t v) { tctx.span()->set_start_time_unix_nano(static_cast<uint64_t>(v)); });
    }
    if (name == "end_time_unix_nano") {
        return intAccessor<K>(
            name, [](K& tctx) { return tctx.span()->end_time_unix_nano(); },
            [](K& tctx, int64_t v) { tctx.span()->set_end_time_unix_nano(static_cast<uint64_t>(v)); });
    }
    if (name == "start_time") {
        return timeAccessor<K>(
            name, [](K& tctx) { return tctx.span()->start_time_unix_nano(); },
            [](K& tctx, uint64_t v) { tctx.span()->set_start_time_unix_nano(v); });
    }
    if (name == "end_time") {
        return timeAccessor<K>(
            name, [](K& tctx) { return tctx.span()->end_time_unix_nano(); },
            [](K& tctx, uint64_t v) { tctx.span()->set_end_time_unix_nano(v); });
    }
    if (name == "dropped_attributes_count") {
        return intAccessor<K>(
            name, [](K& tctx) { return tctx.span()->dropped_attributes_count(); },
            [](K& tctx, int64_t v) { tctx.span()->set_dropped_attributes_count(static_cast<uint32_t>(v)); });
    }
    if (name == "dropped_events_count") {
        return intAccessor<K>(
            name, [](K& tctx) { return tctx.span()->dropped_events_count(); },
            [](K& tctx, int64_t v) { tctx.span()->set_dropped_events_count(static_cast<uint32_t>(v)); });
    }
    if (name == "dropped_links_count") {
        return intAccessor<K>(
            name, [](K& tctx) { return tctx.span()->dropped_links_count(); },
            [](K& tctx, int64_t v) { tctx.span()->set_dropped_links_count(static_cast<uint32_t>(v)); });
    }
    if (name == "flags") {
        return intAccessor<K>(
            name, [](K& tctx) { return tctx.span()->flags(); },
            [](K& tctx, int64_t v) { tctx.span()->set_flags(static_cast<uint32_t>(v)); });
    }
    throw unknownPathError(name, path.text(), "span", valid);
}

} // namespace contexts
} // namespace ottl

#endif // OTTL_CONTEXTS_SPAN_PATHS_HPP
