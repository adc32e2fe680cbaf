#ifndef TRACES_FILTER_HPP
#define TRACES_FILTER_HPP

#include "filter_common.hpp"
#include "filter_config.pb.h"
#include "../ottl/contexts/resource_context.hpp"
#include "../ottl/contexts/scope_context.hpp"
#include "../ottl/contexts/span_context.hpp"
#include "../ottl/contexts/spanevent_context.hpp"
#include "opentelemetry/proto/collector/trace/v1/trace_service.pb.h"
#include <atomic>
#include <memory>
#include <vector>

// Drops resources, scopes, spans and span events matching the configured
// conditions. A span whose events were removed is kept; scopes left without
// spans and resources left without scopes are removed.
class TracesFilter {
public:
    struct Stage {
        ottl::BoolExprPtr<ottl::ResourceContext> resource;
        ottl::BoolExprPtr<ottl::ScopeContext> scope;
        ottl::BoolExprPtr<ottl::SpanContext> span;
        ottl::BoolExprPtr<ottl::SpanEventContext> spanevent;
    };

    explicit TracesFilter(std::vector<Stage> stages);

    // Returns nullptr when no condition is configured
    static std::unique_ptr<TracesFilter> fromConfig(const telemetry::filter::v1::FilterConfig& config);

    FilterResult filter(opentelemetry::proto::collector::trace::v1::ExportTraceServiceRequest& request,
                        const ottl::ExecContext& ctx = ottl::ExecContext());

    uint64_t getDroppedCount() const { return dropped_count_.load(); }

private:
    std::vector<Stage> stages_;
    std::atomic<uint64_t> dropped_count_{0};

    void applyStage(const Stage& stage,
                    opentelemetry::proto::collector::trace::v1::ExportTraceServiceRequest& request,
                    const ottl::ExecContext& ctx, FilterResult& result) const;
};

int64_t countSpans(const opentelemetry::proto::collector::trace::v1::ExportTraceServiceRequest& request);

#endif // TRACES_FILTER_HPP
