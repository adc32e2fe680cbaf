#include "editors.hpp"

namespace ottl {
namespace funcs {

namespace {

void flattenInto(const Map& map, Map& result, std::string prefix, int64_t depth, int64_t max_depth) {
    if (!prefix.empty()) {
        prefix += ".";
    }
    for (const auto& kv : map) {
        const AnyValue& value = kv.value();
        std::string key = prefix + kv.key();
        if (value.value_case() == AnyValue::kKvlistValue && depth < max_depth) {
            flattenInto(value.kvlist_value().values(), result, key, depth + 1, max_depth);
        } else if (value.value_case() == AnyValue::kArrayValue && depth < max_depth) {
            const Slice& items = value.array_value().values();
            for (int i = 0; i < items.size(); ++i) {
                std::string item_key = key + "." + std::to_string(i);
                if (items.Get(i).value_case() == AnyValue::kKvlistValue && depth + 1 < max_depth) {
                    flattenInto(items.Get(i).kvlist_value().values(), result, item_key, depth + 2, max_depth);
                } else {
                    putEmpty(result, item_key)->CopyFrom(items.Get(i));
                }
            }
        } else {
            putEmpty(result, key)->CopyFrom(value);
        }
    }
}

} // namespace

MergeStrategy parseMergeStrategy(const std::string& text) {
    if (text == "insert") return MergeStrategy::Insert;
    if (text == "update") return MergeStrategy::Update;
    if (text == "upsert") return MergeStrategy::Upsert;
    throw ConfigError("invalid value for strategy, " + text + ", must be 'insert', 'update' or 'upsert'");
}

void limitMap(Map& map, int64_t limit, const std::set<std::string>& priority_keys) {
    if (map.size() <= limit) {
        return;
    }
    int64_t count = 0;
    for (const auto& key : priority_keys) {
        if (findKey(map, key)) {
            ++count;
        }
    }
    removeIf(&map, [&](const KeyValue& kv) {
        if (priority_keys.count(kv.key())) {
            return false;
        }
        if (count < limit) {
            ++count;
            return false;
        }
        return true;
    });
}

void truncateMap(Map& map, int64_t limit) {
    for (auto& kv : map) {
        AnyValue* value = kv.mutable_value();
        if (value->value_case() == AnyValue::kStringValue &&
            value->string_value().size() > static_cast<size_t>(limit)) {
            value->set_string_value(truncateUtf8(value->string_value(), static_cast<size_t>(limit)));
        }
    }
}

Map flattenMap(const Map& map, const std::string& prefix, int64_t depth) {
    Map result;
    flattenInto(map, result, prefix, 0, depth);
    return result;
}

void mergeMaps(Map& target, const Map& source, MergeStrategy strategy) {
    for (const auto& kv : source) {
        AnyValue* existing = findKey(target, kv.key());
        switch (strategy) {
            case MergeStrategy::Insert:
                if (!existing) {
                    putEmpty(target, kv.key())->CopyFrom(kv.value());
                }
                break;
            case MergeStrategy::Update:
                if (existing) {
                    existing->CopyFrom(kv.value());
                }
                break;
            case MergeStrategy::Upsert:
                putEmpty(target, kv.key())->CopyFrom(kv.value());
                break;
        }
    }
}

Slice appendValues(const Value& target, const std::vector<Value>& values) {
    Slice result;
    if (target.is(Value::Type::Slice)) {
        result = *target.getSlice();
    } else if (!target.isNil()) {
        toAnyValue(target, result.Add());
    }
    for (const auto& value : values) {
        toAnyValue(value, result.Add());
    }
    return result;
}

} // namespace funcs
} // namespace ottl
