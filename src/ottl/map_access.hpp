#ifndef OTTL_MAP_ACCESS_HPP
#define OTTL_MAP_ACCESS_HPP

#include "value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ottl {

// A key after evaluation for one record: a map key or a list index
struct ResolvedKey {
    std::optional<std::string> string;
    int64_t index = 0;

    bool isString() const { return string.has_value(); }
    std::string describe() const { return string ? "\"" + *string + "\"" : std::to_string(index); }
};

// Reads map[keys...]. A missing map key yields nil; an index outside a list
// raises EvalError; indexing a value of the wrong kind raises TypeError.
Value getMapValue(Map& map, const std::vector<ResolvedKey>& keys);

// Writes map[keys...] = value, creating missing map entries and turning
// empty values into maps along the way. The map is left untouched when the
// value cannot be stored.
void setMapValue(Map& map, const std::vector<ResolvedKey>& keys, const Value& value);

// Same traversal rooted at a single AnyValue (a log body, for example)
Value getIndexedAnyValue(AnyValue& root, const std::vector<ResolvedKey>& keys);
void setIndexedAnyValue(AnyValue& root, const std::vector<ResolvedKey>& keys, const Value& value);

// Indexing applied to an already evaluated value (converter results)
Value indexValue(const Value& base, const std::vector<ResolvedKey>& keys);

// Raises TypeError for values that have no AnyValue representation
void checkStorable(const Value& value);

} // namespace ottl

#endif // OTTL_MAP_ACCESS_HPP
