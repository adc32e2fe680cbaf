#include "scope_context.hpp"

namespace ottl {

GetSetterPtr<ScopeContext> ScopeContext::parsePath(const Path<ScopeContext>& path) {
    if (path.name() == "cache") {
        return contexts::cachePathGetSetter(path);
    }
    if (path.name() == "resource") {
        return contexts::parentPathGetSetter(path);
    }
    // Paths qualified with the long scope name
    if (path.name() == "instrumentation_scope") {
        requireNoKeys(path);
        if (!path.next()) {
            throw ConfigError("path \"" + path.text() + "\" must name a field of instrumentation_scope");
        }
        return contexts::scopePathGetSetter(*path.next());
    }
    return contexts::scopePathGetSetter(path);
}

Parser<ScopeContext> ScopeContext::newParser(FactoryMap<ScopeContext> functions) {
    return Parser<ScopeContext>(std::move(functions), &ScopeContext::parsePath, nullptr, kName);
}

} // namespace ottl
