#ifndef OTTL_PATH_HPP
#define OTTL_PATH_HPP

#include "errors.hpp"
#include "getters.hpp"
#include "map_access.hpp"
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace ottl {

// One `[...]` index of a path segment: a static string or int, or a
// sub-expression evaluated for each record
template <typename K>
class Key {
public:
    static Key fromString(std::string key) {
        Key k;
        k.static_.string = std::move(key);
        return k;
    }

    static Key fromInt(int64_t index) {
        Key k;
        k.static_.index = index;
        return k;
    }

    static Key fromGetter(GetterPtr<K> getter) {
        Key k;
        k.getter_ = std::move(getter);
        return k;
    }

    bool isStatic() const { return !getter_; }

    ResolvedKey resolve(const ExecContext& ctx, K& tctx) const {
        if (!getter_) {
            return static_;
        }
        Value v = getter_->get(ctx, tctx);
        ResolvedKey resolved;
        if (v.is(Value::Type::String)) {
            resolved.string = v.getString();
        } else if (v.is(Value::Type::Int)) {
            resolved.index = v.getInt();
        } else {
            throw TypeError(std::string("key expression must produce a string or int64 but got ") +
                            v.typeName());
        }
        return resolved;
    }

private:
    ResolvedKey static_;
    GetterPtr<K> getter_;
};

template <typename K>
std::vector<ResolvedKey> resolveKeys(const std::vector<Key<K>>& keys, const ExecContext& ctx, K& tctx) {
    std::vector<ResolvedKey> resolved;
    resolved.reserve(keys.size());
    for (const auto& key : keys) {
        resolved.push_back(key.resolve(ctx, tctx));
    }
    return resolved;
}

// A path expression after its context qualifier has been removed:
// a chain of named segments, each carrying its own keys
template <typename K>
class Path {
public:
    Path(std::string name, std::vector<Key<K>> keys, std::shared_ptr<const Path> next, std::string text)
        : name_(std::move(name)), keys_(std::move(keys)), next_(std::move(next)), text_(std::move(text)) {}

    const std::string& name() const { return name_; }
    const std::vector<Key<K>>& keys() const { return keys_; }
    const Path* next() const { return next_.get(); }

    // Source text of the whole path
    const std::string& text() const { return text_; }

private:
    std::string name_;
    std::vector<Key<K>> keys_;
    std::shared_ptr<const Path> next_;
    std::string text_;
};

// Error for a segment that the context does not know
inline ConfigError unknownPathError(const std::string& segment, const std::string& path,
                                    const std::string& context,
                                    const std::vector<std::string>& valid) {
    std::ostringstream oss;
    oss << "segment \"" << segment << "\" from path \"" << path
        << "\" is not a valid path for the " << context << " context; valid paths are: ";
    for (size_t i = 0; i < valid.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << valid[i];
    }
    return ConfigError(oss.str());
}

template <typename K>
void requireNoKeys(const Path<K>& path) {
    if (!path.keys().empty()) {
        throw ConfigError("path \"" + path.text() + "\": segment \"" + path.name() +
                          "\" does not support keys");
    }
}

template <typename K>
void requireLast(const Path<K>& path) {
    if (path.next()) {
        throw ConfigError("path \"" + path.text() + "\": segment \"" + path.name() +
                          "\" has no field \"" + path.next()->name() + "\"");
    }
}

// Terminal segment without keys
template <typename K>
void requireLeaf(const Path<K>& path) {
    requireNoKeys(path);
    requireLast(path);
}

} // namespace ottl

#endif // OTTL_PATH_HPP
