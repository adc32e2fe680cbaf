#ifndef OTTL_RESOURCE_CONTEXT_HPP
#define OTTL_RESOURCE_CONTEXT_HPP

#include "../functions.hpp"
#include "../parser.hpp"
#include "common.hpp"

namespace ottl {

// Evaluation context for one resource
class ResourceContext {
public:
    static constexpr const char* kName = "resource";

    ResourceContext(contexts::Resource* resource, std::string* schema_url)
        : resource_(resource), schema_url_(schema_url) {}

    contexts::Resource* resource() const { return resource_; }
    std::string* resourceSchemaUrl() const { return schema_url_; }
    Map& cache() { return cache_; }

    static GetSetterPtr<ResourceContext> parsePath(const Path<ResourceContext>& path);
    static Parser<ResourceContext> newParser(FactoryMap<ResourceContext> functions);

private:
    contexts::Resource* resource_;
    std::string* schema_url_;
    Map cache_;
};

} // namespace ottl

#endif // OTTL_RESOURCE_CONTEXT_HPP
