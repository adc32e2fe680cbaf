#include "map_access.hpp"
#include "errors.hpp"

namespace ottl {

namespace {

const char* anyTypeName(const AnyValue& value) {
    switch (value.value_case()) {
        case AnyValue::kStringValue: return "string";
        case AnyValue::kBoolValue: return "bool";
        case AnyValue::kIntValue: return "int64";
        case AnyValue::kDoubleValue: return "float64";
        case AnyValue::kBytesValue: return "bytes";
        case AnyValue::kArrayValue: return "slice";
        case AnyValue::kKvlistValue: return "map";
        default: return "nil";
    }
}

AnyValue* sliceElement(Slice& slice, const ResolvedKey& key) {
    if (key.index < 0 || key.index >= slice.size()) {
        throw EvalError("index " + std::to_string(key.index) + " out of bounds for slice of length " +
                        std::to_string(slice.size()));
    }
    return slice.Mutable(static_cast<int>(key.index));
}

// Walks keys[first..] from `current`. Returns nullptr when a map key is missing.
AnyValue* traverse(AnyValue* current, const std::vector<ResolvedKey>& keys, size_t first) {
    for (size_t i = first; i < keys.size() && current; ++i) {
        const ResolvedKey& key = keys[i];
        if (key.isString()) {
            if (current->value_case() != AnyValue::kKvlistValue) {
                throw TypeError(std::string("type ") + anyTypeName(*current) +
                                " does not support string indexing");
            }
            current = findKey(*current->mutable_kvlist_value()->mutable_values(), *key.string);
        } else {
            if (current->value_case() != AnyValue::kArrayValue) {
                throw TypeError(std::string("type ") + anyTypeName(*current) +
                                " does not support int indexing");
            }
            current = sliceElement(*current->mutable_array_value()->mutable_values(), key);
        }
    }
    return current;
}

// Like traverse, but creates missing map entries. Every check runs before
// the first mutation so a failing write leaves the tree unchanged.
AnyValue* traverseForWrite(AnyValue* current, const std::vector<ResolvedKey>& keys, size_t first) {
    AnyValue* probe = current;
    for (size_t i = first; i < keys.size(); ++i) {
        const ResolvedKey& key = keys[i];
        if (!probe) {
            // Below a missing entry only maps get created
            if (!key.isString()) {
                throw TypeError("type nil does not support int indexing");
            }
            continue;
        }
        if (key.isString()) {
            if (probe->value_case() == AnyValue::kKvlistValue) {
                probe = findKey(*probe->mutable_kvlist_value()->mutable_values(), *key.string);
            } else if (probe->value_case() == AnyValue::VALUE_NOT_SET) {
                probe = nullptr;
            } else {
                throw TypeError(std::string("type ") + anyTypeName(*probe) +
                                " does not support string indexing");
            }
        } else {
            if (probe->value_case() != AnyValue::kArrayValue) {
                throw TypeError(std::string("type ") + anyTypeName(*probe) +
                                " does not support int indexing");
            }
            probe = sliceElement(*probe->mutable_array_value()->mutable_values(), key);
        }
    }

    for (size_t i = first; i < keys.size(); ++i) {
        const ResolvedKey& key = keys[i];
        if (key.isString()) {
            Map* map = current->mutable_kvlist_value()->mutable_values();
            AnyValue* next = findKey(*map, *key.string);
            current = next ? next : putEmpty(*map, *key.string);
        } else {
            current = current->mutable_array_value()->mutable_values()->Mutable(static_cast<int>(key.index));
        }
    }
    return current;
}

void requireStringKey(const std::vector<ResolvedKey>& keys) {
    if (keys.empty() || !keys.front().isString()) {
        throw TypeError("non-string indexing is not supported on maps");
    }
}

} // namespace

void checkStorable(const Value& value) {
    if (value.is(Value::Type::Time) || value.is(Value::Type::Duration)) {
        throw TypeError(std::string("unsupported value type ") + value.typeName() +
                        " for a telemetry field");
    }
}

Value getMapValue(Map& map, const std::vector<ResolvedKey>& keys) {
    requireStringKey(keys);
    AnyValue* found = findKey(map, *keys.front().string);
    if (!found) {
        return Value();
    }
    AnyValue* target = traverse(found, keys, 1);
    return target ? fromAnyValue(target) : Value();
}

void setMapValue(Map& map, const std::vector<ResolvedKey>& keys, const Value& value) {
    requireStringKey(keys);
    checkStorable(value);

    AnyValue* found = findKey(map, *keys.front().string);
    if (!found) {
        // Validate the remaining keys against an empty value first
        AnyValue empty;
        traverseForWrite(&empty, keys, 1);
        found = putEmpty(map, *keys.front().string);
    }
    AnyValue* target = traverseForWrite(found, keys, 1);
    toAnyValue(value, target);
}

Value getIndexedAnyValue(AnyValue& root, const std::vector<ResolvedKey>& keys) {
    AnyValue* target = traverse(&root, keys, 0);
    return target ? fromAnyValue(target) : Value();
}

void setIndexedAnyValue(AnyValue& root, const std::vector<ResolvedKey>& keys, const Value& value) {
    checkStorable(value);
    AnyValue* target = traverseForWrite(&root, keys, 0);
    toAnyValue(value, target);
}

Value indexValue(const Value& base, const std::vector<ResolvedKey>& keys) {
    if (keys.empty()) {
        return base;
    }
    const ResolvedKey& key = keys.front();
    AnyValue* current = nullptr;
    if (base.is(Value::Type::Map)) {
        if (!key.isString()) {
            throw TypeError("map values can only be indexed by string keys");
        }
        current = findKey(*base.getMap(), *key.string);
    } else if (base.is(Value::Type::Slice)) {
        if (key.isString()) {
            throw TypeError("slice values can only be indexed by int keys");
        }
        current = sliceElement(*base.getSlice(), key);
    } else {
        throw TypeError(std::string("type ") + base.typeName() + " does not support indexing");
    }
    if (!current) {
        return Value();
    }
    AnyValue* target = traverse(current, keys, 1);
    if (!target) {
        return Value();
    }

    // The base may be a temporary owned by the caller; detach containers from it
    Value result = fromAnyValue(target);
    if (result.is(Value::Type::Map)) {
        return Value::owned(Map(*result.getMap()));
    }
    if (result.is(Value::Type::Slice)) {
        return Value::owned(Slice(*result.getSlice()));
    }
    return result;
}

} // namespace ottl
