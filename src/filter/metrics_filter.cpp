#include "metrics_filter.hpp"
#include "metric_functions.hpp"

using opentelemetry::proto::collector::metrics::v1::ExportMetricsServiceRequest;
using opentelemetry::proto::metrics::v1::Metric;
using opentelemetry::proto::metrics::v1::ResourceMetrics;
using opentelemetry::proto::metrics::v1::ScopeMetrics;

namespace {

const std::vector<std::string> kMetricLevels = {"resource", "scope", "metric", "datapoint"};

MetricsFilter::Stage stageForContext(const std::string& context, const std::vector<std::string>& conditions,
                                     ottl::ErrorMode error_mode) {
    MetricsFilter::Stage stage;
    if (context == "resource") {
        stage.resource = buildBoolExpr(conditions, ottl::funcs::standardConverters<ottl::ResourceContext>(),
                                       error_mode);
    } else if (context == "scope") {
        stage.scope = buildBoolExpr(conditions, ottl::funcs::standardConverters<ottl::ScopeContext>(),
                                    error_mode);
    } else if (context == "metric") {
        stage.metric = buildBoolExpr(conditions, metricFilterFunctions(), error_mode);
    } else {
        stage.datapoint = buildBoolExpr(conditions, ottl::funcs::standardConverters<ottl::DataPointContext>(),
                                        error_mode);
    }
    return stage;
}

int64_t countMetricDataPoints(const Metric& metric) {
    switch (metric.data_case()) {
    case Metric::kGauge:
        return metric.gauge().data_points_size();
    case Metric::kSum:
        return metric.sum().data_points_size();
    case Metric::kHistogram:
        return metric.histogram().data_points_size();
    case Metric::kExponentialHistogram:
        return metric.exponential_histogram().data_points_size();
    case Metric::kSummary:
        return metric.summary().data_points_size();
    default:
        return 0;
    }
}

} // namespace

MetricsFilter::MetricsFilter(std::vector<Stage> stages) : stages_(std::move(stages)) {}

std::unique_ptr<MetricsFilter> MetricsFilter::fromConfig(const telemetry::filter::v1::FilterConfig& config) {
    ottl::ErrorMode error_mode = ottl::parseErrorMode(config.error_mode());
    const auto& metrics = config.metrics();
    bool has_lists = metrics.resource_size() > 0 || metrics.metric_size() > 0 || metrics.datapoint_size() > 0;
    bool has_groups = config.metric_conditions_size() > 0;
    if (has_lists && has_groups) {
        throw ottl::ConfigError("cannot use both metrics and metric_conditions in the same filter configuration");
    }

    std::vector<Stage> stages;
    if (has_lists) {
        Stage stage;
        std::vector<std::string> resource(metrics.resource().begin(), metrics.resource().end());
        std::vector<std::string> metric(metrics.metric().begin(), metrics.metric().end());
        std::vector<std::string> datapoint(metrics.datapoint().begin(), metrics.datapoint().end());
        stage.resource = buildBoolExpr(resource, ottl::funcs::standardConverters<ottl::ResourceContext>(),
                                       error_mode);
        stage.metric = buildBoolExpr(metric, metricFilterFunctions(), error_mode);
        stage.datapoint = buildBoolExpr(datapoint, ottl::funcs::standardConverters<ottl::DataPointContext>(),
                                        error_mode);
        stages.push_back(std::move(stage));
    }
    for (const auto& group : config.metric_conditions()) {
        std::vector<std::string> conditions(group.conditions().begin(), group.conditions().end());
        if (conditions.empty()) {
            continue;
        }
        std::string context = group.context().empty() ? inferContext(conditions, kMetricLevels)
                                                      : normalizeContext(group.context(), kMetricLevels);
        stages.push_back(stageForContext(context, conditions, error_mode));
    }
    if (stages.empty()) {
        return nullptr;
    }
    return std::make_unique<MetricsFilter>(std::move(stages));
}

FilterResult MetricsFilter::filter(ExportMetricsServiceRequest& request, const ottl::ExecContext& ctx) {
    FilterResult result;
    int64_t before = countDataPoints(request);

    for (const auto& stage : stages_) {
        applyStage(stage, request, ctx, result);
    }

    result.dropped = before - countDataPoints(request);
    dropped_count_.fetch_add(static_cast<uint64_t>(result.dropped));

    if (result.status == FilterStatus::ERROR) {
        return result;
    }
    if (request.resource_metrics_size() == 0) {
        result.status = FilterStatus::SKIP_PROCESSING_DATA;
    }
    return result;
}

void MetricsFilter::applyStage(const Stage& stage, ExportMetricsServiceRequest& request,
                               const ottl::ExecContext& ctx, FilterResult& result) const {
    ottl::removeIf(request.mutable_resource_metrics(), [&](ResourceMetrics& resource_metrics) {
        ottl::contexts::Resource* resource = resource_metrics.mutable_resource();
        std::string* resource_schema_url = resource_metrics.mutable_schema_url();

        ottl::ResourceContext resource_ctx(resource, resource_schema_url);
        if (shouldDrop(stage.resource, ctx, resource_ctx, result)) {
            return true;
        }

        ottl::removeIf(resource_metrics.mutable_scope_metrics(), [&](ScopeMetrics& scope_metrics) {
            ottl::contexts::InstrumentationScope* scope = scope_metrics.mutable_scope();
            std::string* scope_schema_url = scope_metrics.mutable_schema_url();

            ottl::ScopeContext scope_ctx(scope, scope_schema_url, resource, resource_schema_url);
            if (shouldDrop(stage.scope, ctx, scope_ctx, result)) {
                return true;
            }

            ottl::removeIf(scope_metrics.mutable_metrics(), [&](Metric& metric) {
                ottl::MetricContext metric_ctx(&metric, scope, scope_schema_url, resource, resource_schema_url);
                if (shouldDrop(stage.metric, ctx, metric_ctx, result)) {
                    return true;
                }
                if (!stage.datapoint) {
                    return false;
                }
                auto drop_point = [&](auto& point) {
                    ottl::DataPointContext point_ctx(&point, &metric, scope, scope_schema_url, resource,
                                                     resource_schema_url);
                    return shouldDrop(stage.datapoint, ctx, point_ctx, result);
                };
                switch (metric.data_case()) {
                case Metric::kGauge:
                    ottl::removeIf(metric.mutable_gauge()->mutable_data_points(), drop_point);
                    break;
                case Metric::kSum:
                    ottl::removeIf(metric.mutable_sum()->mutable_data_points(), drop_point);
                    break;
                case Metric::kHistogram:
                    ottl::removeIf(metric.mutable_histogram()->mutable_data_points(), drop_point);
                    break;
                case Metric::kExponentialHistogram:
                    ottl::removeIf(metric.mutable_exponential_histogram()->mutable_data_points(), drop_point);
                    break;
                case Metric::kSummary:
                    ottl::removeIf(metric.mutable_summary()->mutable_data_points(), drop_point);
                    break;
                default:
                    return false;
                }
                return countMetricDataPoints(metric) == 0;
            });
            return scope_metrics.metrics_size() == 0;
        });
        return resource_metrics.scope_metrics_size() == 0;
    });
}

int64_t countDataPoints(const ExportMetricsServiceRequest& request) {
    int64_t count = 0;
    for (const auto& resource_metrics : request.resource_metrics()) {
        for (const auto& scope_metrics : resource_metrics.scope_metrics()) {
            for (const auto& metric : scope_metrics.metrics()) {
                count += countMetricDataPoints(metric);
            }
        }
    }
    return count;
}
