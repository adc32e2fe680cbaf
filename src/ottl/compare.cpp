#include "compare.hpp"

namespace ottl {

namespace {

template <typename T>
bool compareOrdered(const T& left, const T& right, CompareOp op) {
    switch (op) {
        case CompareOp::Eq: return left == right;
        case CompareOp::Ne: return left != right;
        case CompareOp::Lt: return left < right;
        case CompareOp::Lte: return left <= right;
        case CompareOp::Gt: return left > right;
        case CompareOp::Gte: return left >= right;
    }
    return false;
}

bool compareEquality(bool equal, CompareOp op) {
    if (op == CompareOp::Eq) return equal;
    if (op == CompareOp::Ne) return !equal;
    return false;
}

bool mapsEqual(const Map& left, const Map& right) {
    if (left.size() != right.size()) {
        return false;
    }
    for (const auto& kv : left) {
        const AnyValue* match = nullptr;
        for (const auto& other : right) {
            if (other.key() == kv.key()) {
                match = &other.value();
                break;
            }
        }
        if (!match || !anyValuesEqual(kv.value(), *match)) {
            return false;
        }
    }
    return true;
}

bool slicesEqual(const Slice& left, const Slice& right) {
    if (left.size() != right.size()) {
        return false;
    }
    for (int i = 0; i < left.size(); ++i) {
        if (!anyValuesEqual(left.Get(i), right.Get(i))) {
            return false;
        }
    }
    return true;
}

bool isNumber(const Value& v) {
    return v.is(Value::Type::Int) || v.is(Value::Type::Double);
}

double asDouble(const Value& v) {
    return v.is(Value::Type::Int) ? static_cast<double>(v.getInt()) : v.getDouble();
}

} // namespace

bool anyValuesEqual(const AnyValue& left, const AnyValue& right) {
    if (left.value_case() != right.value_case()) {
        return false;
    }
    switch (left.value_case()) {
        case AnyValue::kStringValue: return left.string_value() == right.string_value();
        case AnyValue::kBoolValue: return left.bool_value() == right.bool_value();
        case AnyValue::kIntValue: return left.int_value() == right.int_value();
        case AnyValue::kDoubleValue: return left.double_value() == right.double_value();
        case AnyValue::kBytesValue: return left.bytes_value() == right.bytes_value();
        case AnyValue::kArrayValue:
            return slicesEqual(left.array_value().values(), right.array_value().values());
        case AnyValue::kKvlistValue:
            return mapsEqual(left.kvlist_value().values(), right.kvlist_value().values());
        default:
            return true;
    }
}

bool valuesEqual(const Value& left, const Value& right) {
    return compareValues(left, right, CompareOp::Eq);
}

bool compareValues(const Value& left, const Value& right, CompareOp op) {
    if (left.isNil() || right.isNil()) {
        return compareEquality(left.isNil() && right.isNil(), op);
    }

    if (isNumber(left) && isNumber(right)) {
        if (left.is(Value::Type::Int) && right.is(Value::Type::Int)) {
            return compareOrdered(left.getInt(), right.getInt(), op);
        }
        return compareOrdered(asDouble(left), asDouble(right), op);
    }

    if (left.type() != right.type()) {
        return op == CompareOp::Ne;
    }

    switch (left.type()) {
        case Value::Type::String:
            return compareOrdered(left.getString(), right.getString(), op);
        case Value::Type::Bytes:
            return compareOrdered(left.getBytes(), right.getBytes(), op);
        case Value::Type::Bool:
            return compareEquality(left.getBool() == right.getBool(), op);
        case Value::Type::Map:
            return compareEquality(mapsEqual(*left.getMap(), *right.getMap()), op);
        case Value::Type::Slice:
            return compareEquality(slicesEqual(*left.getSlice(), *right.getSlice()), op);
        case Value::Type::Time:
            return compareOrdered(left.getTime(), right.getTime(), op);
        case Value::Type::Duration:
            return compareOrdered(left.getDuration(), right.getDuration(), op);
        default:
            return op == CompareOp::Ne;
    }
}

} // namespace ottl
