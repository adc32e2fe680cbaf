#ifndef OTTL_MATH_HPP
#define OTTL_MATH_HPP

#include "grammar.hpp"
#include "value.hpp"

namespace ottl {

// int op int stays int64; any float operand promotes to float64. Time and
// duration operands support time - time, time +/- duration and
// duration +/- duration. Division by zero raises EvalError; unsupported
// operand kinds raise TypeError naming both kinds.
Value applyMath(const Value& left, MathOp op, const Value& right);

Value negate(const Value& value);

} // namespace ottl

#endif // OTTL_MATH_HPP
