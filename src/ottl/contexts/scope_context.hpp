#ifndef OTTL_SCOPE_CONTEXT_HPP
#define OTTL_SCOPE_CONTEXT_HPP

#include "../functions.hpp"
#include "../parser.hpp"
#include "common.hpp"

namespace ottl {

// Evaluation context for one instrumentation scope and its resource
class ScopeContext {
public:
    static constexpr const char* kName = "scope";

    ScopeContext(contexts::InstrumentationScope* scope, std::string* scope_schema_url,
                 contexts::Resource* resource, std::string* resource_schema_url)
        : scope_(scope), scope_schema_url_(scope_schema_url),
          resource_(resource), resource_schema_url_(resource_schema_url) {}

    contexts::InstrumentationScope* scope() const { return scope_; }
    std::string* scopeSchemaUrl() const { return scope_schema_url_; }
    contexts::Resource* resource() const { return resource_; }
    std::string* resourceSchemaUrl() const { return resource_schema_url_; }
    Map& cache() { return cache_; }

    static GetSetterPtr<ScopeContext> parsePath(const Path<ScopeContext>& path);
    static Parser<ScopeContext> newParser(FactoryMap<ScopeContext> functions);

private:
    contexts::InstrumentationScope* scope_;
    std::string* scope_schema_url_;
    contexts::Resource* resource_;
    std::string* resource_schema_url_;
    Map cache_;
};

} // namespace ottl

#endif // OTTL_SCOPE_CONTEXT_HPP
