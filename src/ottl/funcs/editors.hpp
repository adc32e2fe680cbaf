#ifndef OTTL_FUNCS_EDITORS_HPP
#define OTTL_FUNCS_EDITORS_HPP

#include "../errors.hpp"
#include "../functions.hpp"
#include "../map_access.hpp"
#include "pattern.hpp"
#include <limits>
#include <set>
#include <string>
#include <vector>

// Editors: statement-level functions that mutate the telemetry in place.
// Each returns nil.
namespace ottl {
namespace funcs {

enum class MergeStrategy { Insert, Update, Upsert };

MergeStrategy parseMergeStrategy(const std::string& text);

// Keeps at most `limit` entries. Present priority keys always survive; the
// remaining slots go to the first other keys in order.
void limitMap(Map& map, int64_t limit, const std::set<std::string>& priority_keys);

// Truncates string values longer than `limit` bytes
void truncateMap(Map& map, int64_t limit);

// Nested maps are joined with "." and list elements by index, up to `depth`
// levels. Deeper values are kept as they are.
Map flattenMap(const Map& map, const std::string& prefix, int64_t depth);

void mergeMaps(Map& target, const Map& source, MergeStrategy strategy);

// `target` as a list (nil becomes empty, a scalar becomes a single element)
// with `values` appended
Slice appendValues(const Value& target, const std::vector<Value>& values);

// The text a replacement function is applied to. Set for the duration of
// one call through Scope, per thread.
template <typename K>
class ReplacementTextGetter : public Getter<K> {
public:
    class Scope {
    public:
        explicit Scope(const std::string& text) : previous_(current_) { current_ = &text; }
        ~Scope() { current_ = previous_; }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        const std::string* previous_;
    };

    Value get(const ExecContext&, K&) const override { return current_ ? Value(*current_) : Value(); }

private:
    static inline thread_local const std::string* current_ = nullptr;
};

// The replacement half of the replace_* editors: the replacement string,
// an optional converter applied to it, and an optional `%s` format
template <typename K>
class Replacer {
public:
    explicit Replacer(const Arguments<K>& args) : replacement_(args.stringGetter("replacement")) {
        if (args.has("function")) {
            FunctionGetter<K> function = args.function("function");
            function_name_ = function.name();
            // Fails now when the converter cannot take a single string
            function_ = function.get({std::make_shared<ReplacementTextGetter<K>>()});
        }
        if (args.has("replacement_format")) {
            format_ = args.stringGetter("replacement_format");
            has_format_ = true;
            if (format_.isLiteral() && !isReplacementFormat(format_.literalValue())) {
                throw ConfigError("replacement_format must contain exactly one %s");
            }
        }
    }

    std::string replacement(const ExecContext& ctx, K& tctx) const { return replacement_.get(ctx, tctx); }

    // Final text for one already expanded replacement
    std::string produce(const ExecContext& ctx, K& tctx, const std::string& expanded) const {
        std::string result = expanded;
        if (function_) {
            Value out;
            {
                typename ReplacementTextGetter<K>::Scope scope(expanded);
                out = function_(ctx, tctx);
            }
            std::optional<std::string> text = toStringLike(out);
            if (!text) {
                throw EvalError("replacement function " + function_name_ + " returned nil");
            }
            result = *text;
        }
        if (has_format_) {
            std::string format = format_.get(ctx, tctx);
            if (!isReplacementFormat(format)) {
                throw EvalError("replacement_format must contain exactly one %s");
            }
            result = applyReplacementFormat(format, result);
        }
        return result;
    }

    // Replaces every match of `re` in `input`
    std::string replaceRegex(const ExecContext& ctx, K& tctx, const RE2& re, const std::string& input) const {
        std::string templ = replacement(ctx, tctx);
        return replaceEachMatch(re, input, [&](const Captures& match) {
            return produce(ctx, tctx, expandCaptures(templ, match));
        });
    }

private:
    StringGetter<K> replacement_;
    ExprFunc<K> function_;
    std::string function_name_;
    StringGetter<K> format_;
    bool has_format_ = false;
};

inline ArgsSchema replaceSchema(std::vector<ArgSpec> head) {
    head.push_back({"replacement", ArgKind::StringGetter});
    head.push_back({"function", ArgKind::Function, true});
    head.push_back({"replacement_format", ArgKind::StringGetter, true});
    return head;
}

template <typename K>
FactoryPtr<K> newSetFactory() {
    return makeFactory<K>(
        "set", {{"target", ArgKind::GetSetter}, {"value", ArgKind::Getter}},
        [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
            GetSetterPtr<K> target = args.getSetter("target");
            GetterPtr<K> value = args.getter("value");
            return [target, value](const ExecContext& ctx, K& tctx) {
                Value v = value->get(ctx, tctx);
                // Setting nil leaves the target untouched
                if (!v.isNil()) {
                    target->set(ctx, tctx, v);
                }
                return Value();
            };
        });
}

template <typename K>
FactoryPtr<K> newDeleteKeyFactory() {
    return makeFactory<K>(
        "delete_key", {{"target", ArgKind::MapGetter}, {"key", ArgKind::StringGetter}},
        [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
            MapGetter<K> target = args.mapGetter("target");
            StringGetter<K> key = args.stringGetter("key");
            return [target, key](const ExecContext& ctx, K& tctx) {
                Value map = target.get(ctx, tctx);
                removeKey(*map.getMap(), key.get(ctx, tctx));
                return Value();
            };
        });
}

template <typename K>
FactoryPtr<K> newDeleteMatchingKeysFactory() {
    return makeFactory<K>(
        "delete_matching_keys", {{"target", ArgKind::MapGetter}, {"pattern", ArgKind::StringLiteral}},
        [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
            MapGetter<K> target = args.mapGetter("target");
            RegexPtr pattern = compileRegex(args.stringLiteral("pattern"));
            return [target, pattern](const ExecContext& ctx, K& tctx) {
                Value map = target.get(ctx, tctx);
                removeIf(map.getMap(), [&pattern](const KeyValue& kv) {
                    return containsMatch(*pattern, kv.key());
                });
                return Value();
            };
        });
}

template <typename K>
FactoryPtr<K> newKeepKeysFactory() {
    return makeFactory<K>(
        "keep_keys", {{"target", ArgKind::MapGetter}, {"keys", ArgKind::StringList}},
        [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
            MapGetter<K> target = args.mapGetter("target");
            const std::vector<std::string>& list = args.stringList("keys");
            std::set<std::string> keys(list.begin(), list.end());
            return [target, keys](const ExecContext& ctx, K& tctx) {
                Value map = target.get(ctx, tctx);
                removeIf(map.getMap(), [&keys](const KeyValue& kv) { return keys.count(kv.key()) == 0; });
                return Value();
            };
        });
}

template <typename K>
FactoryPtr<K> newKeepMatchingKeysFactory() {
    return makeFactory<K>(
        "keep_matching_keys", {{"target", ArgKind::MapGetter}, {"pattern", ArgKind::StringLiteral}},
        [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
            MapGetter<K> target = args.mapGetter("target");
            RegexPtr pattern = compileRegex(args.stringLiteral("pattern"));
            return [target, pattern](const ExecContext& ctx, K& tctx) {
                Value map = target.get(ctx, tctx);
                removeIf(map.getMap(), [&pattern](const KeyValue& kv) {
                    return !containsMatch(*pattern, kv.key());
                });
                return Value();
            };
        });
}

template <typename K>
FactoryPtr<K> newLimitFactory() {
    return makeFactory<K>(
        "limit",
        {{"target", ArgKind::MapGetter}, {"limit", ArgKind::IntLiteral}, {"priority_keys", ArgKind::StringList}},
        [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
            MapGetter<K> target = args.mapGetter("target");
            int64_t limit = args.intLiteral("limit");
            const std::vector<std::string>& list = args.stringList("priority_keys");
            if (limit < 0) {
                throw ConfigError("invalid limit for limit function, " + std::to_string(limit) +
                                  " cannot be negative");
            }
            if (static_cast<int64_t>(list.size()) > limit) {
                throw ConfigError("invalid limit for limit function, " + std::to_string(limit) +
                                  " cannot be less than number of priority attributes " +
                                  std::to_string(list.size()));
            }
            std::set<std::string> priority(list.begin(), list.end());
            return [target, limit, priority](const ExecContext& ctx, K& tctx) {
                Value map = target.get(ctx, tctx);
                limitMap(*map.getMap(), limit, priority);
                return Value();
            };
        });
}

template <typename K>
FactoryPtr<K> newTruncateAllFactory() {
    return makeFactory<K>(
        "truncate_all", {{"target", ArgKind::MapGetter}, {"limit", ArgKind::IntLiteral}},
        [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
            MapGetter<K> target = args.mapGetter("target");
            int64_t limit = args.intLiteral("limit");
            if (limit < 0) {
                throw ConfigError("invalid limit for truncate_all function, " + std::to_string(limit) +
                                  " cannot be negative");
            }
            return [target, limit](const ExecContext& ctx, K& tctx) {
                Value map = target.get(ctx, tctx);
                truncateMap(*map.getMap(), limit);
                return Value();
            };
        });
}

template <typename K>
FactoryPtr<K> newReplacePatternFactory() {
    return makeFactory<K>(
        "replace_pattern", replaceSchema({{"target", ArgKind::GetSetter}, {"regex", ArgKind::StringLiteral}}),
        [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
            GetSetterPtr<K> target = args.getSetter("target");
            RegexPtr regex = compileRegex(args.stringLiteral("regex"));
            Replacer<K> replacer(args);
            return [target, regex, replacer](const ExecContext& ctx, K& tctx) {
                Value original = target->get(ctx, tctx);
                if (!original.is(Value::Type::String)) {
                    return Value();
                }
                const std::string& text = original.getString();
                if (!containsMatch(*regex, text)) {
                    return Value();
                }
                target->set(ctx, tctx, Value(replacer.replaceRegex(ctx, tctx, *regex, text)));
                return Value();
            };
        });
}

template <typename K>
FactoryPtr<K> newReplaceAllPatternsFactory() {
    return makeFactory<K>(
        "replace_all_patterns",
        replaceSchema({{"target", ArgKind::MapGetter}, {"mode", ArgKind::StringLiteral},
                       {"regex", ArgKind::StringLiteral}}),
        [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
            MapGetter<K> target = args.mapGetter("target");
            std::string mode = args.stringLiteral("mode");
            if (mode != "key" && mode != "value") {
                throw ConfigError("invalid mode " + mode + ", must be either 'key' or 'value'");
            }
            bool keys = mode == "key";
            RegexPtr regex = compileRegex(args.stringLiteral("regex"));
            Replacer<K> replacer(args);
            return [target, keys, regex, replacer](const ExecContext& ctx, K& tctx) {
                Value value = target.get(ctx, tctx);
                Map* map = value.getMap();
                Map updated;
                for (const KeyValue& kv : *map) {
                    std::string key = kv.key();
                    AnyValue entry = kv.value();
                    try {
                        if (keys && containsMatch(*regex, key)) {
                            key = replacer.replaceRegex(ctx, tctx, *regex, key);
                        } else if (!keys && entry.value_case() == AnyValue::kStringValue &&
                                   containsMatch(*regex, entry.string_value())) {
                            entry.set_string_value(replacer.replaceRegex(ctx, tctx, *regex, entry.string_value()));
                        }
                    } catch (const Error&) {
                        // the entry is kept unchanged
                    }
                    putEmpty(updated, key)->Swap(&entry);
                }
                map->Swap(&updated);
                return Value();
            };
        });
}

template <typename K>
FactoryPtr<K> newReplaceMatchFactory() {
    return makeFactory<K>(
        "replace_match", replaceSchema({{"target", ArgKind::GetSetter}, {"pattern", ArgKind::StringLiteral}}),
        [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
            GetSetterPtr<K> target = args.getSetter("target");
            RegexPtr glob = compileGlob(args.stringLiteral("pattern"));
            Replacer<K> replacer(args);
            return [target, glob, replacer](const ExecContext& ctx, K& tctx) {
                Value original = target->get(ctx, tctx);
                if (!original.is(Value::Type::String) || !matchesWhole(*glob, original.getString())) {
                    return Value();
                }
                target->set(ctx, tctx, Value(replacer.produce(ctx, tctx, replacer.replacement(ctx, tctx))));
                return Value();
            };
        });
}

template <typename K>
FactoryPtr<K> newReplaceAllMatchesFactory() {
    return makeFactory<K>(
        "replace_all_matches", replaceSchema({{"target", ArgKind::MapGetter}, {"pattern", ArgKind::StringLiteral}}),
        [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
            MapGetter<K> target = args.mapGetter("target");
            RegexPtr glob = compileGlob(args.stringLiteral("pattern"));
            Replacer<K> replacer(args);
            return [target, glob, replacer](const ExecContext& ctx, K& tctx) {
                Value value = target.get(ctx, tctx);
                std::string replacement;
                bool produced = false;
                for (auto& kv : *value.getMap()) {
                    AnyValue* entry = kv.mutable_value();
                    if (entry->value_case() != AnyValue::kStringValue ||
                        !matchesWhole(*glob, entry->string_value())) {
                        continue;
                    }
                    if (!produced) {
                        replacement = replacer.produce(ctx, tctx, replacer.replacement(ctx, tctx));
                        produced = true;
                    }
                    entry->set_string_value(replacement);
                }
                return Value();
            };
        });
}

template <typename K>
FactoryPtr<K> newFlattenFactory() {
    return makeFactory<K>(
        "flatten",
        {{"target", ArgKind::MapGetter}, {"prefix", ArgKind::StringLiteral, true},
         {"depth", ArgKind::IntLiteral, true}},
        [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
            MapGetter<K> target = args.mapGetter("target");
            std::string prefix = args.has("prefix") ? args.stringLiteral("prefix") : std::string();
            int64_t depth = std::numeric_limits<int64_t>::max();
            if (args.has("depth")) {
                depth = args.intLiteral("depth");
                if (depth < 0) {
                    throw ConfigError("invalid depth for flatten function, " + std::to_string(depth) +
                                      " cannot be negative");
                }
            }
            return [target, prefix, depth](const ExecContext& ctx, K& tctx) {
                Value value = target.get(ctx, tctx);
                Map flat = flattenMap(*value.getMap(), prefix, depth);
                value.getMap()->Swap(&flat);
                return Value();
            };
        });
}

template <typename K>
FactoryPtr<K> newMergeMapsFactory() {
    return makeFactory<K>(
        "merge_maps",
        {{"target", ArgKind::MapGetter}, {"source", ArgKind::MapGetter}, {"strategy", ArgKind::StringLiteral}},
        [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
            MapGetter<K> target = args.mapGetter("target");
            MapGetter<K> source = args.mapGetter("source");
            MergeStrategy strategy = parseMergeStrategy(args.stringLiteral("strategy"));
            return [target, source, strategy](const ExecContext& ctx, K& tctx) {
                Value into = target.get(ctx, tctx);
                Value from = source.get(ctx, tctx);
                // Copy first: source may alias target
                Map copy(*from.getMap());
                mergeMaps(*into.getMap(), copy, strategy);
                return Value();
            };
        });
}

template <typename K>
FactoryPtr<K> newAppendFactory() {
    return makeFactory<K>(
        "append",
        {{"target", ArgKind::GetSetter}, {"value", ArgKind::Getter, true}, {"values", ArgKind::GetterList, true}},
        [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
            GetSetterPtr<K> target = args.getSetter("target");
            GetterPtr<K> value;
            std::vector<GetterPtr<K>> values;
            if (args.has("value")) {
                value = args.getter("value");
            }
            if (args.has("values")) {
                values = args.getterList("values");
            }
            if (!value && !args.has("values")) {
                throw ConfigError("at least one of the optional arguments ('value' or 'values') must be provided");
            }
            return [target, value, values](const ExecContext& ctx, K& tctx) {
                std::vector<Value> appended;
                if (value) {
                    appended.push_back(value->get(ctx, tctx));
                }
                for (const auto& getter : values) {
                    appended.push_back(getter->get(ctx, tctx));
                }
                Slice result = appendValues(target->get(ctx, tctx), appended);
                target->set(ctx, tctx, Value::owned(std::move(result)));
                return Value();
            };
        });
}

template <typename K>
std::vector<FactoryPtr<K>> editorFactories() {
    return {newSetFactory<K>(),
            newDeleteKeyFactory<K>(),
            newDeleteMatchingKeysFactory<K>(),
            newKeepKeysFactory<K>(),
            newKeepMatchingKeysFactory<K>(),
            newLimitFactory<K>(),
            newTruncateAllFactory<K>(),
            newReplacePatternFactory<K>(),
            newReplaceAllPatternsFactory<K>(),
            newReplaceMatchFactory<K>(),
            newReplaceAllMatchesFactory<K>(),
            newFlattenFactory<K>(),
            newMergeMapsFactory<K>(),
            newAppendFactory<K>()};
}

template <typename K>
FactoryMap<K> standardEditors() {
    return createFactoryMap<K>(editorFactories<K>());
}

} // namespace funcs
} // namespace ottl

#endif // OTTL_FUNCS_EDITORS_HPP
