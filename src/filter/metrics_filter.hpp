#ifndef METRICS_FILTER_HPP
#define METRICS_FILTER_HPP

#include "filter_common.hpp"
#include "filter_config.pb.h"
#include "../ottl/contexts/datapoint_context.hpp"
#include "../ottl/contexts/metric_context.hpp"
#include "../ottl/contexts/resource_context.hpp"
#include "../ottl/contexts/scope_context.hpp"
#include "opentelemetry/proto/collector/metrics/v1/metrics_service.pb.h"
#include <atomic>
#include <memory>
#include <vector>

// Drops resources, scopes, metrics and data points matching the configured
// conditions. A metric left without data points is removed, as are scopes
// left without metrics and resources left without scopes.
class MetricsFilter {
public:
    struct Stage {
        ottl::BoolExprPtr<ottl::ResourceContext> resource;
        ottl::BoolExprPtr<ottl::ScopeContext> scope;
        ottl::BoolExprPtr<ottl::MetricContext> metric;
        ottl::BoolExprPtr<ottl::DataPointContext> datapoint;
    };

    explicit MetricsFilter(std::vector<Stage> stages);

    // Returns nullptr when no condition is configured
    static std::unique_ptr<MetricsFilter> fromConfig(const telemetry::filter::v1::FilterConfig& config);

    FilterResult filter(opentelemetry::proto::collector::metrics::v1::ExportMetricsServiceRequest& request,
                        const ottl::ExecContext& ctx = ottl::ExecContext());

    uint64_t getDroppedCount() const { return dropped_count_.load(); }

private:
    std::vector<Stage> stages_;
    std::atomic<uint64_t> dropped_count_{0};

    void applyStage(const Stage& stage,
                    opentelemetry::proto::collector::metrics::v1::ExportMetricsServiceRequest& request,
                    const ottl::ExecContext& ctx, FilterResult& result) const;
};

int64_t countDataPoints(const opentelemetry::proto::collector::metrics::v1::ExportMetricsServiceRequest& request);

#endif // METRICS_FILTER_HPP
