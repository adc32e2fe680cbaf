#include "logs_filter.hpp"
#include "../ottl/funcs/converters.hpp"

using opentelemetry::proto::collector::logs::v1::ExportLogsServiceRequest;
using opentelemetry::proto::logs::v1::LogRecord;
using opentelemetry::proto::logs::v1::ResourceLogs;
using opentelemetry::proto::logs::v1::ScopeLogs;

namespace {

const std::vector<std::string> kLogLevels = {"resource", "scope", "log"};

LogsFilter::Stage stageForContext(const std::string& context, const std::vector<std::string>& conditions,
                                  ottl::ErrorMode error_mode) {
    LogsFilter::Stage stage;
    if (context == "resource") {
        stage.resource = buildBoolExpr(conditions, ottl::funcs::standardConverters<ottl::ResourceContext>(),
                                       error_mode);
    } else if (context == "scope") {
        stage.scope = buildBoolExpr(conditions, ottl::funcs::standardConverters<ottl::ScopeContext>(),
                                    error_mode);
    } else {
        stage.log_record = buildBoolExpr(conditions, ottl::funcs::standardConverters<ottl::LogContext>(),
                                         error_mode);
    }
    return stage;
}

} // namespace

LogsFilter::LogsFilter(std::vector<Stage> stages) : stages_(std::move(stages)) {}

std::unique_ptr<LogsFilter> LogsFilter::fromConfig(const telemetry::filter::v1::FilterConfig& config) {
    ottl::ErrorMode error_mode = ottl::parseErrorMode(config.error_mode());
    const auto& logs = config.logs();
    bool has_lists = logs.resource_size() > 0 || logs.log_record_size() > 0;
    bool has_groups = config.log_conditions_size() > 0;
    if (has_lists && has_groups) {
        throw ottl::ConfigError("cannot use both logs and log_conditions in the same filter configuration");
    }

    std::vector<Stage> stages;
    if (has_lists) {
        Stage stage;
        std::vector<std::string> resource(logs.resource().begin(), logs.resource().end());
        std::vector<std::string> log_record(logs.log_record().begin(), logs.log_record().end());
        stage.resource = buildBoolExpr(resource, ottl::funcs::standardConverters<ottl::ResourceContext>(),
                                       error_mode);
        stage.log_record = buildBoolExpr(log_record, ottl::funcs::standardConverters<ottl::LogContext>(),
                                         error_mode);
        stages.push_back(std::move(stage));
    }
    for (const auto& group : config.log_conditions()) {
        std::vector<std::string> conditions(group.conditions().begin(), group.conditions().end());
        if (conditions.empty()) {
            continue;
        }
        std::string context = group.context().empty() ? inferContext(conditions, kLogLevels)
                                                      : normalizeContext(group.context(), kLogLevels);
        stages.push_back(stageForContext(context, conditions, error_mode));
    }
    if (stages.empty()) {
        return nullptr;
    }
    return std::make_unique<LogsFilter>(std::move(stages));
}

FilterResult LogsFilter::filter(ExportLogsServiceRequest& request, const ottl::ExecContext& ctx) {
    FilterResult result;
    int64_t before = countLogRecords(request);

    for (const auto& stage : stages_) {
        applyStage(stage, request, ctx, result);
    }

    result.dropped = before - countLogRecords(request);
    dropped_count_.fetch_add(static_cast<uint64_t>(result.dropped));

    if (result.status == FilterStatus::ERROR) {
        return result;
    }
    if (request.resource_logs_size() == 0) {
        result.status = FilterStatus::SKIP_PROCESSING_DATA;
    }
    return result;
}

void LogsFilter::applyStage(const Stage& stage, ExportLogsServiceRequest& request,
                            const ottl::ExecContext& ctx, FilterResult& result) const {
    ottl::removeIf(request.mutable_resource_logs(), [&](ResourceLogs& resource_logs) {
        ottl::contexts::Resource* resource = resource_logs.mutable_resource();
        std::string* resource_schema_url = resource_logs.mutable_schema_url();

        ottl::ResourceContext resource_ctx(resource, resource_schema_url);
        if (shouldDrop(stage.resource, ctx, resource_ctx, result)) {
            return true;
        }

        ottl::removeIf(resource_logs.mutable_scope_logs(), [&](ScopeLogs& scope_logs) {
            ottl::contexts::InstrumentationScope* scope = scope_logs.mutable_scope();
            std::string* scope_schema_url = scope_logs.mutable_schema_url();

            ottl::ScopeContext scope_ctx(scope, scope_schema_url, resource, resource_schema_url);
            if (shouldDrop(stage.scope, ctx, scope_ctx, result)) {
                return true;
            }
            if (stage.log_record) {
                ottl::removeIf(scope_logs.mutable_log_records(), [&](LogRecord& record) {
                    ottl::LogContext log_ctx(&record, scope, scope_schema_url, resource, resource_schema_url);
                    return shouldDrop(stage.log_record, ctx, log_ctx, result);
                });
            }
            return scope_logs.log_records_size() == 0;
        });
        return resource_logs.scope_logs_size() == 0;
    });
}

int64_t countLogRecords(const ExportLogsServiceRequest& request) {
    int64_t count = 0;
    for (const auto& resource_logs : request.resource_logs()) {
        for (const auto& scope_logs : resource_logs.scope_logs()) {
            count += scope_logs.log_records_size();
        }
    }
    return count;
}
