#ifndef OTTL_CONTEXTS_COMMON_HPP
#define OTTL_CONTEXTS_COMMON_HPP

#include "../coercion.hpp"
#include "../errors.hpp"
#include "../getters.hpp"
#include "../map_access.hpp"
#include "../path.hpp"
#include "opentelemetry/proto/common/v1/common.pb.h"
#include "opentelemetry/proto/resource/v1/resource.pb.h"
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

// Accessor builders shared by the per-signal transform contexts. They are
// templated on the context type K and reach the telemetry through K's
// accessors: resource(), scope(), resourceSchemaUrl(), scopeSchemaUrl()
// and cache().
namespace ottl {
namespace contexts {

using Resource = opentelemetry::proto::resource::v1::Resource;
using InstrumentationScope = opentelemetry::proto::common::v1::InstrumentationScope;

inline Time timeFromNanos(uint64_t nanos) {
    return Time(Duration(static_cast<int64_t>(nanos)));
}

inline uint64_t nanosFromTime(Time time) {
    return static_cast<uint64_t>(time.time_since_epoch().count());
}

// Values accepted by typed field setters. Nil resets the field.
inline int64_t intForField(const Value& value, const std::string& field) {
    if (value.isNil()) return 0;
    if (!value.is(Value::Type::Int)) {
        throw TypeError("field " + field + " expects int64 but got " + value.typeName());
    }
    return value.getInt();
}

inline double doubleForField(const Value& value, const std::string& field) {
    if (value.isNil()) return 0;
    if (value.is(Value::Type::Int)) return static_cast<double>(value.getInt());
    if (!value.is(Value::Type::Double)) {
        throw TypeError("field " + field + " expects float64 but got " + value.typeName());
    }
    return value.getDouble();
}

inline std::string stringForField(const Value& value, const std::string& field) {
    if (value.isNil()) return std::string();
    if (!value.is(Value::Type::String)) {
        throw TypeError("field " + field + " expects string but got " + value.typeName());
    }
    return value.getString();
}

inline bool boolForField(const Value& value, const std::string& field) {
    if (value.isNil()) return false;
    if (!value.is(Value::Type::Bool)) {
        throw TypeError("field " + field + " expects bool but got " + value.typeName());
    }
    return value.getBool();
}

inline uint64_t nanosForField(const Value& value, const std::string& field) {
    if (value.isNil()) return 0;
    if (!value.is(Value::Type::Time)) {
        throw TypeError("field " + field + " expects time but got " + value.typeName());
    }
    return nanosFromTime(value.getTime());
}

template <typename K, typename Get, typename Set>
GetSetterPtr<K> intAccessor(const std::string& field, Get get, Set set) {
    return makeGetSetter<K>(
        [get](const ExecContext&, K& tctx) { return Value(static_cast<int64_t>(get(tctx))); },
        [set, field](const ExecContext&, K& tctx, const Value& v) { set(tctx, intForField(v, field)); });
}

template <typename K, typename Get, typename Set>
GetSetterPtr<K> doubleAccessor(const std::string& field, Get get, Set set) {
    return makeGetSetter<K>(
        [get](const ExecContext&, K& tctx) { return Value(static_cast<double>(get(tctx))); },
        [set, field](const ExecContext&, K& tctx, const Value& v) { set(tctx, doubleForField(v, field)); });
}

template <typename K, typename Get, typename Set>
GetSetterPtr<K> stringAccessor(const std::string& field, Get get, Set set) {
    return makeGetSetter<K>(
        [get](const ExecContext&, K& tctx) { return Value(std::string(get(tctx))); },
        [set, field](const ExecContext&, K& tctx, const Value& v) { set(tctx, stringForField(v, field)); });
}

template <typename K, typename Get, typename Set>
GetSetterPtr<K> boolAccessor(const std::string& field, Get get, Set set) {
    return makeGetSetter<K>(
        [get](const ExecContext&, K& tctx) { return Value(static_cast<bool>(get(tctx))); },
        [set, field](const ExecContext&, K& tctx, const Value& v) { set(tctx, boolForField(v, field)); });
}

// Time view over a unix-nanosecond field
template <typename K, typename Get, typename Set>
GetSetterPtr<K> timeAccessor(const std::string& field, Get get, Set set) {
    return makeGetSetter<K>(
        [get](const ExecContext&, K& tctx) { return Value(timeFromNanos(get(tctx))); },
        [set, field](const ExecContext&, K& tctx, const Value& v) { set(tctx, nanosForField(v, field)); });
}

template <typename K>
GetSetterPtr<K> readOnly(GetFn<K> get) {
    return makeGetSetter<K>(std::move(get), nullptr);
}

// A `repeated KeyValue` field, either whole or indexed by the path keys.
// Setting the whole map accepts only map values.
template <typename K, typename Access>
GetSetterPtr<K> mapAccessor(const std::string& field, Access access, const std::vector<Key<K>>& keys) {
    if (keys.empty()) {
        return makeGetSetter<K>(
            [access](const ExecContext&, K& tctx) { return Value::borrowed(access(tctx)); },
            [access, field](const ExecContext&, K& tctx, const Value& v) {
                if (!v.is(Value::Type::Map)) {
                    throw TypeError("field " + field + " expects map but got " + v.typeName());
                }
                Map copy(*v.getMap());
                access(tctx)->Swap(&copy);
            });
    }
    return makeGetSetter<K>(
        [access, keys](const ExecContext& ctx, K& tctx) {
            return getMapValue(*access(tctx), resolveKeys(keys, ctx, tctx));
        },
        [access, keys](const ExecContext& ctx, K& tctx, const Value& v) {
            setMapValue(*access(tctx), resolveKeys(keys, ctx, tctx), v);
        });
}

// A trace or span id held in a bytes field, with an optional `.string`
// segment exposing it as lowercase hex
template <typename K, typename Access>
GetSetterPtr<K> idAccessor(const Path<K>& path, Access access, size_t width) {
    requireNoKeys(path);
    std::string field = path.name();
    if (const Path<K>* next = path.next()) {
        requireLeaf(*next);
        if (next->name() != "string") {
            throw unknownPathError(next->name(), path.text(), field, {"string"});
        }
        return makeGetSetter<K>(
            [access](const ExecContext&, K& tctx) {
                const std::string& raw = *access(tctx);
                if (raw.empty()) return Value(std::string());
                return Value(bytesToHex(raw));
            },
            [access, width, field](const ExecContext&, K& tctx, const Value& v) {
                std::string hex = stringForField(v, field + ".string");
                if (hex.size() != width * 2) {
                    throw EvalError(field + ".string must be " + std::to_string(width * 2) +
                                    " hex characters");
                }
                std::string raw;
                for (size_t i = 0; i < hex.size(); i += 2) {
                    int hi = std::isxdigit(static_cast<unsigned char>(hex[i]));
                    int lo = std::isxdigit(static_cast<unsigned char>(hex[i + 1]));
                    if (!hi || !lo) {
                        throw EvalError(field + ".string is not valid hex: " + hex);
                    }
                    raw += static_cast<char>(std::stoi(hex.substr(i, 2), nullptr, 16));
                }
                *access(tctx) = raw;
            });
    }
    return makeGetSetter<K>(
        [access](const ExecContext&, K& tctx) {
            const std::string& raw = *access(tctx);
            return Value(Bytes(raw.begin(), raw.end()));
        },
        [access, width, field](const ExecContext&, K& tctx, const Value& v) {
            if (v.isNil()) {
                access(tctx)->clear();
                return;
            }
            if (!v.is(Value::Type::Bytes) || v.getBytes().size() != width) {
                throw TypeError(field + " expects " + std::to_string(width) + " bytes but got " + v.typeName());
            }
            const Bytes& bytes = v.getBytes();
            access(tctx)->assign(bytes.begin(), bytes.end());
        });
}

template <typename K>
GetSetterPtr<K> cachePathGetSetter(const Path<K>& path) {
    requireLast(path);
    return mapAccessor<K>("cache", [](K& tctx) { return &tctx.cache(); }, path.keys());
}

// Paths below `resource`
template <typename K>
GetSetterPtr<K> resourcePathGetSetter(const Path<K>& path) {
    static const std::vector<std::string> valid = {"attributes", "dropped_attributes_count", "schema_url"};
    const std::string& name = path.name();
    if (name == "attributes") {
        requireLast(path);
        return mapAccessor<K>("resource.attributes",
                              [](K& tctx) { return tctx.resource()->mutable_attributes(); }, path.keys());
    }
    if (name == "dropped_attributes_count") {
        requireLeaf(path);
        return intAccessor<K>(
            "resource.dropped_attributes_count",
            [](K& tctx) { return tctx.resource()->dropped_attributes_count(); },
            [](K& tctx, int64_t v) { tctx.resource()->set_dropped_attributes_count(static_cast<uint32_t>(v)); });
    }
    if (name == "schema_url") {
        requireLeaf(path);
        return stringAccessor<K>(
            "resource.schema_url",
            [](K& tctx) { return *tctx.resourceSchemaUrl(); },
            [](K& tctx, const std::string& v) { *tctx.resourceSchemaUrl() = v; });
    }
    throw unknownPathError(name, path.text(), "resource", valid);
}

// Paths below `instrumentation_scope` or `scope`
template <typename K>
GetSetterPtr<K> scopePathGetSetter(const Path<K>& path) {
    static const std::vector<std::string> valid = {"name", "version", "attributes", "dropped_attributes_count",
                                                   "schema_url"};
    const std::string& name = path.name();
    if (name == "name") {
        requireLeaf(path);
        return stringAccessor<K>(
            "scope.name", [](K& tctx) { return tctx.scope()->name(); },
            [](K& tctx, const std::string& v) { tctx.scope()->set_name(v); });
    }
    if (name == "version") {
        requireLeaf(path);
        return stringAccessor<K>(
            "scope.version", [](K& tctx) { return tctx.scope()->version(); },
            [](K& tctx, const std::string& v) { tctx.scope()->set_version(v); });
    }
    if (name == "attributes") {
        requireLast(path);
        return mapAccessor<K>("scope.attributes",
                              [](K& tctx) { return tctx.scope()->mutable_attributes(); }, path.keys());
    }
    if (name == "dropped_attributes_count") {
        requireLeaf(path);
        return intAccessor<K>(
            "scope.dropped_attributes_count",
            [](K& tctx) { return tctx.scope()->dropped_attributes_count(); },
            [](K& tctx, int64_t v) { tctx.scope()->set_dropped_attributes_count(static_cast<uint32_t>(v)); });
    }
    if (name == "schema_url") {
        requireLeaf(path);
        return stringAccessor<K>(
            "scope.schema_url", [](K& tctx) { return *tctx.scopeSchemaUrl(); },
            [](K& tctx, const std::string& v) { *tctx.scopeSchemaUrl() = v; });
    }
    throw unknownPathError(name, path.text(), "instrumentation_scope", valid);
}

// `resource.*` and `instrumentation_scope.*` / `scope.*` from a record context.
// Returns nullptr when the path does not start with either.
template <typename K>
GetSetterPtr<K> parentPathGetSetter(const Path<K>& path) {
    const std::string& name = path.name();
    if (name != "resource" && name != "instrumentation_scope" && name != "scope") {
        return nullptr;
    }
    requireNoKeys(path);
    if (!path.next()) {
        throw ConfigError("path \"" + path.text() + "\" must name a field of " + name);
    }
    if (name == "resource") {
        return resourcePathGetSetter(*path.next());
    }
    return scopePathGetSetter(*path.next());
}

} // namespace contexts
} // namespace ottl

#endif // OTTL_CONTEXTS_COMMON_HPP
