#include "log_context.hpp"

namespace ottl {

namespace {

using contexts::intAccessor;
using contexts::stringAccessor;
using contexts::timeAccessor;

using LogRecord = LogContext::LogRecord;

const std::vector<std::string>& validLogPaths() {
    static const std::vector<std::string> valid = {
        "cache", "resource", "instrumentation_scope", "time_unix_nano", "observed_time_unix_nano",
        "time", "observed_time", "severity_number", "severity_text", "body", "attributes",
        "dropped_attributes_count", "flags", "trace_id", "span_id", "event_name"};
    return valid;
}

GetSetterPtr<LogContext> bodyPath(const Path<LogContext>& path) {
    if (const Path<LogContext>* next = path.next()) {
        requireLeaf(*next);
        if (next->name() != "string" || !path.keys().empty()) {
            throw unknownPathError(next->name(), path.text(), "body", {"string"});
        }
        return makeGetSetter<LogContext>(
            [](const ExecContext&, LogContext& tctx) {
                LogRecord* record = tctx.logRecord();
                if (!record->has_body()) {
                    return Value(std::string());
                }
                return Value(toStringLike(fromAnyValue(record->mutable_body())).value_or(std::string()));
            },
            [](const ExecContext&, LogContext& tctx, const Value& v) {
                tctx.logRecord()->mutable_body()->set_string_value(contexts::stringForField(v, "body.string"));
            });
    }

    std::vector<Key<LogContext>> keys = path.keys();
    if (keys.empty()) {
        return makeGetSetter<LogContext>(
            [](const ExecContext&, LogContext& tctx) {
                LogRecord* record = tctx.logRecord();
                return record->has_body() ? fromAnyValue(record->mutable_body()) : Value();
            },
            [](const ExecContext&, LogContext& tctx, const Value& v) {
                checkStorable(v);
                toAnyValue(v, tctx.logRecord()->mutable_body());
            });
    }
    return makeGetSetter<LogContext>(
        [keys](const ExecContext& ctx, LogContext& tctx) {
            LogRecord* record = tctx.logRecord();
            if (!record->has_body()) {
                return Value();
            }
            return getIndexedAnyValue(*record->mutable_body(), resolveKeys(keys, ctx, tctx));
        },
        [keys](const ExecContext& ctx, LogContext& tctx, const Value& v) {
            setIndexedAnyValue(*tctx.logRecord()->mutable_body(), resolveKeys(keys, ctx, tctx), v);
        });
}

} // namespace

GetSetterPtr<LogContext> LogContext::parsePath(const Path<LogContext>& path) {
    const std::string& name = path.name();

    if (name == "cache") {
        return contexts::cachePathGetSetter(path);
    }
    if (auto parent = contexts::parentPathGetSetter(path)) {
        return parent;
    }
    if (name == "body") {
        return bodyPath(path);
    }
    if (name == "attributes") {
        requireLast(path);
        return contexts::mapAccessor<LogContext>(
            "attributes", [](LogContext& tctx) { return tctx.logRecord()->mutable_attributes(); }, path.keys());
    }
    if (name == "trace_id") {
        return contexts::idAccessor(
            path, [](LogContext& tctx) { return tctx.logRecord()->mutable_trace_id(); }, 16);
    }
    if (name == "span_id") {
        return contexts::idAccessor(
            path, [](LogContext& tctx) { return tctx.logRecord()->mutable_span_id(); }, 8);
    }

    requireLeaf(path);
    if (name == "time_unix_nano") {
        return intAccessor<LogContext>(
            name, [](LogContext& tctx) { return tctx.logRecord()->time_unix_nano(); },
            [](LogContext& tctx, int64_t v) { tctx.logRecord()->set_time_unix_nano(static_cast<uint64_t>(v)); });
    }
    if (name == "observed_time_unix_nano") {
        return intAccessor<LogContext>(
            name, [](LogContext& tctx) { return tctx.logRecord()->observed_time_unix_nano(); },
            [](LogContext& tctx, int64_t v) {
                tctx.logRecord()->set_observed_time_unix_nano(static_cast<uint64_t>(v));
            });
    }
    if (name == "time") {
        return timeAccessor<LogContext>(
            name, [](LogContext& tctx) { return tctx.logRecord()->time_unix_nano(); },
            [](LogContext& tctx, uint64_t v) { tctx.logRecord()->set_time_unix_nano(v); });
    }
    if (name == "observed_time") {
        return timeAccessor<LogContext>(
            name, [](LogContext& tctx) { return tctx.logRecord()->observed_time_unix_nano(); },
            [](LogContext& tctx, uint64_t v) { tctx.logRecord()->set_observed_time_unix_nano(v); });
    }
    if (name == "severity_number") {
        return intAccessor<LogContext>(
            name, [](LogContext& tctx) { return tctx.logRecord()->severity_number(); },
            [](LogContext& tctx, int64_t v) {
                tctx.logRecord()->set_severity_number(
                    static_cast<opentelemetry::proto::logs::v1::SeverityNumber>(v));
            });
    }
    if (name == "severity_text") {
        return stringAccessor<LogContext>(
            name, [](LogContext& tctx) { return tctx.logRecord()->severity_text(); },
            [](LogContext& tctx, const std::string& v) { tctx.logRecord()->set_severity_text(v); });
    }
    if (name == "dropped_attributes_count") {
        return intAccessor<LogContext>(
            name, [](LogContext& tctx) { return tctx.logRecord()->dropped_attributes_count(); },
            [](LogContext& tctx, int64_t v) {
                tctx.logRecord()->set_dropped_attributes_count(static_cast<uint32_t>(v));
            });
    }
    if (name == "flags") {
        return intAccessor<LogContext>(
            name, [](LogContext& tctx) { return tctx.logRecord()->flags(); },
            [](LogContext& tctx, int64_t v) { tctx.logRecord()->set_flags(static_cast<uint32_t>(v)); });
    }
    if (name == "event_name") {
        return stringAccessor<LogContext>(
            name, [](LogContext& tctx) { return tctx.logRecord()->event_name(); },
            [](LogContext& tctx, const std::string& v) { tctx.logRecord()->set_event_name(v); });
    }
    throw unknownPathError(name, path.text(), kName, validLogPaths());
}

std::optional<int64_t> LogContext::parseEnum(const std::string& symbol) {
    opentelemetry::proto::logs::v1::SeverityNumber value;
    if (opentelemetry::proto::logs::v1::SeverityNumber_Parse(symbol, &value)) {
        return static_cast<int64_t>(value);
    }
    return std::nullopt;
}

Parser<LogContext> LogContext::newParser(FactoryMap<LogContext> functions) {
    return Parser<LogContext>(std::move(functions), &LogContext::parsePath, &LogContext::parseEnum, kName);
}

} // namespace ottl
