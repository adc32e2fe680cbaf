#ifndef LOGS_FILTER_HPP
#define LOGS_FILTER_HPP

#include "filter_common.hpp"
#include "filter_config.pb.h"
#include "../ottl/contexts/log_context.hpp"
#include "../ottl/contexts/resource_context.hpp"
#include "../ottl/contexts/scope_context.hpp"
#include "opentelemetry/proto/collector/logs/v1/logs_service.pb.h"
#include <atomic>
#include <memory>
#include <vector>

// Drops resources, scopes and log records matching the configured conditions.
// Scopes left without records and resources left without scopes are removed.
class LogsFilter {
public:
    // One pass over the batch. Levels without conditions are skipped.
    struct Stage {
        ottl::BoolExprPtr<ottl::ResourceContext> resource;
        ottl::BoolExprPtr<ottl::ScopeContext> scope;
        ottl::BoolExprPtr<ottl::LogContext> log_record;
    };

    explicit LogsFilter(std::vector<Stage> stages);

    // Builds the stages from `logs` or from `log_conditions`. Using both is
    // a configuration error. Returns nullptr when no condition is configured.
    static std::unique_ptr<LogsFilter> fromConfig(const telemetry::filter::v1::FilterConfig& config);

    FilterResult filter(opentelemetry::proto::collector::logs::v1::ExportLogsServiceRequest& request,
                        const ottl::ExecContext& ctx = ottl::ExecContext());

    uint64_t getDroppedCount() const { return dropped_count_.load(); }

private:
    std::vector<Stage> stages_;
    std::atomic<uint64_t> dropped_count_{0};

    void applyStage(const Stage& stage,
                    opentelemetry::proto::collector::logs::v1::ExportLogsServiceRequest& request,
                    const ottl::ExecContext& ctx, FilterResult& result) const;
};

int64_t countLogRecords(const opentelemetry::proto::collector::logs::v1::ExportLogsServiceRequest& request);

#endif // LOGS_FILTER_HPP
