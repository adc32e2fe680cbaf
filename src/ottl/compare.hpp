#ifndef OTTL_COMPARE_HPP
#define OTTL_COMPARE_HPP

#include "grammar.hpp"
#include "value.hpp"

namespace ottl {

// Evaluates `left op right`. Never throws: values of kinds that cannot be
// compared are unequal and not ordered.
bool compareValues(const Value& left, const Value& right, CompareOp op);

// Deep equality. Map key order is irrelevant; slice order is significant.
bool valuesEqual(const Value& left, const Value& right);
bool anyValuesEqual(const AnyValue& left, const AnyValue& right);

} // namespace ottl

#endif // OTTL_COMPARE_HPP
