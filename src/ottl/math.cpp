#include "math.hpp"
#include "errors.hpp"
#include <cstdint>

namespace ottl {

namespace {

[[noreturn]] void unsupported(const Value& left, MathOp op, const Value& right) {
    throw TypeError(std::string("unsupported types for math operation: ") + left.typeName() +
                    " " + mathOpSymbol(op) + " " + right.typeName());
}

// Wrapping arithmetic, computed on unsigned operands
int64_t intOp(int64_t l, MathOp op, int64_t r) {
    uint64_t ul = static_cast<uint64_t>(l);
    uint64_t ur = static_cast<uint64_t>(r);
    switch (op) {
        case MathOp::Add: return static_cast<int64_t>(ul + ur);
        case MathOp::Sub: return static_cast<int64_t>(ul - ur);
        case MathOp::Mul: return static_cast<int64_t>(ul * ur);
        case MathOp::Div:
            if (r == 0) {
                throw EvalError("attempted to divide by 0");
            }
            if (l == INT64_MIN && r == -1) {
                return l;
            }
            return l / r;
    }
    return 0;
}

double floatOp(double l, MathOp op, double r) {
    switch (op) {
        case MathOp::Add: return l + r;
        case MathOp::Sub: return l - r;
        case MathOp::Mul: return l * r;
        case MathOp::Div:
            if (r == 0) {
                throw EvalError("attempted to divide by 0");
            }
            return l / r;
    }
    return 0;
}

} // namespace

Value applyMath(const Value& left, MathOp op, const Value& right) {
    switch (left.type()) {
        case Value::Type::Time:
            if (right.is(Value::Type::Time) && op == MathOp::Sub) {
                return Value(left.getTime() - right.getTime());
            }
            if (right.is(Value::Type::Duration)) {
                if (op == MathOp::Add) return Value(left.getTime() + right.getDuration());
                if (op == MathOp::Sub) return Value(left.getTime() - right.getDuration());
            }
            unsupported(left, op, right);
        case Value::Type::Duration:
            if (right.is(Value::Type::Duration)) {
                if (op == MathOp::Add) return Value(left.getDuration() + right.getDuration());
                if (op == MathOp::Sub) return Value(left.getDuration() - right.getDuration());
            }
            unsupported(left, op, right);
        case Value::Type::Int:
            if (right.is(Value::Type::Int)) {
                return Value(intOp(left.getInt(), op, right.getInt()));
            }
            if (right.is(Value::Type::Double)) {
                return Value(floatOp(static_cast<double>(left.getInt()), op, right.getDouble()));
            }
            unsupported(left, op, right);
        case Value::Type::Double:
            if (right.is(Value::Type::Double)) {
                return Value(floatOp(left.getDouble(), op, right.getDouble()));
            }
            if (right.is(Value::Type::Int)) {
                return Value(floatOp(left.getDouble(), op, static_cast<double>(right.getInt())));
            }
            unsupported(left, op, right);
        default:
            unsupported(left, op, right);
    }
}

Value negate(const Value& value) {
    switch (value.type()) {
        case Value::Type::Int:
            return Value(static_cast<int64_t>(0 - static_cast<uint64_t>(value.getInt())));
        case Value::Type::Double:
            return Value(-value.getDouble());
        case Value::Type::Duration:
            return Value(-value.getDuration());
        default:
            throw TypeError(std::string("unsupported type for negation: ") + value.typeName());
    }
}

} // namespace ottl
