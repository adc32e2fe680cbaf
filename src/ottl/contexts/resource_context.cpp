#include "resource_context.hpp"

namespace ottl {

GetSetterPtr<ResourceContext> ResourceContext::parsePath(const Path<ResourceContext>& path) {
    if (path.name() == "cache") {
        return contexts::cachePathGetSetter(path);
    }
    return contexts::resourcePathGetSetter(path);
}

Parser<ResourceContext> ResourceContext::newParser(FactoryMap<ResourceContext> functions) {
    return Parser<ResourceContext>(std::move(functions), &ResourceContext::parsePath, nullptr, kName);
}

} // namespace ottl
