#ifndef OTTL_FUNCS_CATALOG_HPP
#define OTTL_FUNCS_CATALOG_HPP

#include "converters.hpp"
#include "editors.hpp"

namespace ottl {
namespace funcs {

// Every editor and converter, for transform statements
template <typename K>
FactoryMap<K> standardFunctions() {
    std::vector<FactoryPtr<K>> factories = editorFactories<K>();
    for (auto& factory : converterFactories<K>()) {
        factories.push_back(std::move(factory));
    }
    return createFactoryMap<K>(factories);
}

} // namespace funcs
} // namespace ottl

#endif // OTTL_FUNCS_CATALOG_HPP
