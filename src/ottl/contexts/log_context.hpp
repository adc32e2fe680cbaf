#ifndef OTTL_LOG_CONTEXT_HPP
#define OTTL_LOG_CONTEXT_HPP

#include "../functions.hpp"
#include "../parser.hpp"
#include "common.hpp"
#include "opentelemetry/proto/logs/v1/logs.pb.h"
#include <optional>

namespace ottl {

// Evaluation context for one log record together with its scope and resource
class LogContext {
public:
    using LogRecord = opentelemetry::proto::logs::v1::LogRecord;

    static constexpr const char* kName = "log";

    LogContext(LogRecord* record, contexts::InstrumentationScope* scope, std::string* scope_schema_url,
               contexts::Resource* resource, std::string* resource_schema_url)
        : record_(record), scope_(scope), scope_schema_url_(scope_schema_url),
          resource_(resource), resource_schema_url_(resource_schema_url) {}

    LogRecord* logRecord() const { return record_; }
    contexts::InstrumentationScope* scope() const { return scope_; }
    std::string* scopeSchemaUrl() const { return scope_schema_url_; }
    contexts::Resource* resource() const { return resource_; }
    std::string* resourceSchemaUrl() const { return resource_schema_url_; }
    Map& cache() { return cache_; }

    static GetSetterPtr<LogContext> parsePath(const Path<LogContext>& path);
    // SEVERITY_NUMBER_* symbols
    static std::optional<int64_t> parseEnum(const std::string& symbol);
    static Parser<LogContext> newParser(FactoryMap<LogContext> functions);

private:
    LogRecord* record_;
    contexts::InstrumentationScope* scope_;
    std::string* scope_schema_url_;
    contexts::Resource* resource_;
    std::string* resource_schema_url_;
    Map cache_;
};

} // namespace ottl

#endif // OTTL_LOG_CONTEXT_HPP
