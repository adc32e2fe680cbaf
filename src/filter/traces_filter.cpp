#include "traces_filter.hpp"
#include "../ottl/funcs/converters.hpp"

using opentelemetry::proto::collector::trace::v1::ExportTraceServiceRequest;
using opentelemetry::proto::trace::v1::ResourceSpans;
using opentelemetry::proto::trace::v1::ScopeSpans;
using opentelemetry::proto::trace::v1::Span;

namespace {

const std::vector<std::string> kTraceLevels = {"resource", "scope", "span", "spanevent"};

TracesFilter::Stage stageForContext(const std::string& context, const std::vector<std::string>& conditions,
                                    ottl::ErrorMode error_mode) {
    TracesFilter::Stage stage;
    if (context == "resource") {
        stage.resource = buildBoolExpr(conditions, ottl::funcs::standardConverters<ottl::ResourceContext>(),
                                       error_mode);
    } else if (context == "scope") {
        stage.scope = buildBoolExpr(conditions, ottl::funcs::standardConverters<ottl::ScopeContext>(),
                                    error_mode);
    } else if (context == "span") {
        stage.span = buildBoolExpr(conditions, ottl::funcs::standardConverters<ottl::SpanContext>(), error_mode);
    } else {
        stage.spanevent = buildBoolExpr(conditions, ottl::funcs::standardConverters<ottl::SpanEventContext>(),
                                        error_mode);
    }
    return stage;
}

} // namespace

TracesFilter::TracesFilter(std::vector<Stage> stages) : stages_(std::move(stages)) {}

std::unique_ptr<TracesFilter> TracesFilter::fromConfig(const telemetry::filter::v1::FilterConfig& config) {
    ottl::ErrorMode error_mode = ottl::parseErrorMode(config.error_mode());
    const auto& traces = config.traces();
    bool has_lists = traces.resource_size() > 0 || traces.span_size() > 0 || traces.spanevent_size() > 0;
    bool has_groups = config.trace_conditions_size() > 0;
    if (has_lists && has_groups) {
        throw ottl::ConfigError("cannot use both traces and trace_conditions in the same filter configuration");
    }

    std::vector<Stage> stages;
    if (has_lists) {
        Stage stage;
        std::vector<std::string> resource(traces.resource().begin(), traces.resource().end());
        std::vector<std::string> span(traces.span().begin(), traces.span().end());
        std::vector<std::string> spanevent(traces.spanevent().begin(), traces.spanevent().end());
        stage.resource = buildBoolExpr(resource, ottl::funcs::standardConverters<ottl::ResourceContext>(),
                                       error_mode);
        stage.span = buildBoolExpr(span, ottl::funcs::standardConverters<ottl::SpanContext>(), error_mode);
        stage.spanevent = buildBoolExpr(spanevent, ottl::funcs::standardConverters<ottl::SpanEventContext>(),
                                        error_mode);
        stages.push_back(std::move(stage));
    }
    for (const auto& group : config.trace_conditions()) {
        std::vector<std::string> conditions(group.conditions().begin(), group.conditions().end());
        if (conditions.empty()) {
            continue;
        }
        std::string context = group.context().empty() ? inferContext(conditions, kTraceLevels)
                                                      : normalizeContext(group.context(), kTraceLevels);
        stages.push_back(stageForContext(context, conditions, error_mode));
    }
    if (stages.empty()) {
        return nullptr;
    }
    return std::make_unique<TracesFilter>(std::move(stages));
}

FilterResult TracesFilter::filter(ExportTraceServiceRequest& request, const ottl::ExecContext& ctx) {
    FilterResult result;
    int64_t before = countSpans(request);

    for (const auto& stage : stages_) {
        applyStage(stage, request, ctx, result);
    }

    result.dropped = before - countSpans(request);
    dropped_count_.fetch_add(static_cast<uint64_t>(result.dropped));

    if (result.status == FilterStatus::ERROR) {
        return result;
    }
    if (request.resource_spans_size() == 0) {
        result.status = FilterStatus::SKIP_PROCESSING_DATA;
    }
    return result;
}

void TracesFilter::applyStage(const Stage& stage, ExportTraceServiceRequest& request,
                              const ottl::ExecContext& ctx, FilterResult& result) const {
    ottl::removeIf(request.mutable_resource_spans(), [&](ResourceSpans& resource_spans) {
        ottl::contexts::Resource* resource = resource_spans.mutable_resource();
        std::string* resource_schema_url = resource_spans.mutable_schema_url();

        ottl::ResourceContext resource_ctx(resource, resource_schema_url);
        if (shouldDrop(stage.resource, ctx, resource_ctx, result)) {
            return true;
        }

        ottl::removeIf(resource_spans.mutable_scope_spans(), [&](ScopeSpans& scope_spans) {
            ottl::contexts::InstrumentationScope* scope = scope_spans.mutable_scope();
            std::string* scope_schema_url = scope_spans.mutable_schema_url();

            ottl::ScopeContext scope_ctx(scope, scope_schema_url, resource, resource_schema_url);
            if (shouldDrop(stage.scope, ctx, scope_ctx, result)) {
                return true;
            }

            ottl::removeIf(scope_spans.mutable_spans(), [&](Span& span) {
                ottl::SpanContext span_ctx(&span, scope, scope_schema_url, resource, resource_schema_url);
                if (shouldDrop(stage.span, ctx, span_ctx, result)) {
                    return true;
                }
                if (stage.spanevent) {
                    int64_t index = 0;
                    ottl::removeIf(span.mutable_events(), [&](Span::Event& event) {
                        ottl::SpanEventContext event_ctx(&event, index++, &span, scope, scope_schema_url, resource,
                                                         resource_schema_url);
                        return shouldDrop(stage.spanevent, ctx, event_ctx, result);
                    });
                }
                return false;
            });
            return scope_spans.spans_size() == 0;
        });
        return resource_spans.scope_spans_size() == 0;
    });
}

int64_t countSpans(const ExportTraceServiceRequest& request) {
    int64_t count = 0;
    for (const auto& resource_spans : request.resource_spans()) {
        for (const auto& scope_spans : resource_spans.scope_spans()) {
            count += scope_spans.spans_size();
        }
    }
    return count;
}
