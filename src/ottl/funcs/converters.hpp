#ifndef OTTL_FUNCS_CONVERTERS_HPP
#define OTTL_FUNCS_CONVERTERS_HPP

#include "../errors.hpp"
#include "../functions.hpp"
#include "pattern.hpp"
#include <limits>
#include <string>
#include <vector>

// Converters: pure functions usable inside values and conditions
namespace ottl {
namespace funcs {

// 64-bit FNV-1a
int64_t fnvHash(const std::string& text);

// Go duration text such as "1h2m3.5s" or "-300ms". Raises EvalError.
Duration parseDuration(const std::string& text);

// Validates a strptime-style layout (`%Y-%m-%dT%H:%M:%S%z` and friends).
// Raises ConfigError for unknown directives.
void validateTimeFormat(const std::string& format);

// Parses `text` with a validated layout. Without `%z` the time is UTC.
Time parseTime(const std::string& text, const std::string& format);

// Sorts a list, keeping element kinds: numbers numerically, strings and
// bools natively, mixed lists by their string form
Slice sortSlice(const Slice& slice, bool descending);

Slice splitString(const std::string& text, const std::string& delimiter);

// A JSON object or array as a map or list
Value parseJson(const std::string& text);

int64_t lengthOf(const Value& value);

std::string toLowerCase(std::string text);
std::string toUpperCase(std::string text);

template <typename K, typename Typed, typename Fn>
ExprFunc<K> applyTo(Typed getter, Fn fn) {
    return [getter, fn](const ExecContext& ctx, K& tctx) { return fn(getter.get(ctx, tctx)); };
}

template <typename K>
FactoryPtr<K> newTypeCheckFactory(const std::string& name, Value::Type type) {
    return makeFactory<K>(name, {{"value", ArgKind::Getter}},
                          [type](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
                              GetterPtr<K> value = args.getter("value");
                              return [value, type](const ExecContext& ctx, K& tctx) {
                                  try {
                                      return Value(value->get(ctx, tctx).is(type));
                                  } catch (const TypeError&) {
                                      return Value(false);
                                  }
                              };
                          });
}

template <typename K>
FactoryPtr<K> newIsMatchFactory() {
    return makeFactory<K>(
        "IsMatch", {{"target", ArgKind::StringLikeGetter}, {"pattern", ArgKind::StringLiteral}},
        [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
            RegexPtr pattern = compileRegex(args.stringLiteral("pattern"));
            return applyTo<K>(args.stringLikeGetter("target"), [pattern](const std::optional<std::string>& text) {
                return Value(text.has_value() && containsMatch(*pattern, *text));
            });
        });
}

template <typename K>
FactoryPtr<K> newStringFactory() {
    return makeFactory<K>("String", {{"value", ArgKind::StringLikeGetter}},
                          [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
                              return applyTo<K>(args.stringLikeGetter("value"),
                                                [](const std::optional<std::string>& v) {
                                                    return v ? Value(*v) : Value();
                                                });
                          });
}

template <typename K>
FactoryPtr<K> newIntFactory() {
    return makeFactory<K>("Int", {{"value", ArgKind::IntLikeGetter}},
                          [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
                              return applyTo<K>(args.intLikeGetter("value"), [](const std::optional<int64_t>& v) {
                                  return v ? Value(*v) : Value();
                              });
                          });
}

template <typename K>
FactoryPtr<K> newDoubleFactory() {
    return makeFactory<K>("Double", {{"value", ArgKind::FloatLikeGetter}},
                          [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
                              return applyTo<K>(args.floatLikeGetter("value"), [](const std::optional<double>& v) {
                                  return v ? Value(*v) : Value();
                              });
                          });
}

template <typename K>
FactoryPtr<K> newBoolFactory() {
    return makeFactory<K>("Bool", {{"value", ArgKind::BoolLikeGetter}},
                          [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
                              return applyTo<K>(args.boolLikeGetter("value"), [](const std::optional<bool>& v) {
                                  return v ? Value(*v) : Value();
                              });
                          });
}

template <typename K>
FactoryPtr<K> newConcatFactory() {
    return makeFactory<K>(
        "Concat", {{"vals", ArgKind::StringLikeGetterList}, {"delimiter", ArgKind::StringLiteral}},
        [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
            std::vector<StringLikeGetter<K>> vals = args.stringLikeGetterList("vals");
            std::string delimiter = args.stringLiteral("delimiter");
            return [vals, delimiter](const ExecContext& ctx, K& tctx) {
                std::string out;
                for (size_t i = 0; i < vals.size(); ++i) {
                    if (i > 0) {
                        out += delimiter;
                    }
                    std::optional<std::string> text = vals[i].get(ctx, tctx);
                    out += text ? *text : "<nil>";
                }
                return Value(out);
            };
        });
}

template <typename K>
FactoryPtr<K> newSplitFactory() {
    return makeFactory<K>(
        "Split", {{"target", ArgKind::StringGetter}, {"delimiter", ArgKind::StringLiteral}},
        [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
            std::string delimiter = args.stringLiteral("delimiter");
            return applyTo<K>(args.stringGetter("target"), [delimiter](const std::string& text) {
                return Value::owned(splitString(text, delimiter));
            });
        });
}

template <typename K>
FactoryPtr<K> newSubstringFactory() {
    return makeFactory<K>(
        "Substring",
        {{"target", ArgKind::StringGetter}, {"start", ArgKind::IntGetter}, {"length", ArgKind::IntGetter}},
        [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
            StringGetter<K> target = args.stringGetter("target");
            IntGetter<K> start = args.intGetter("start");
            IntGetter<K> length = args.intGetter("length");
            if (start.isLiteral() && start.literalValue() < 0) {
                throw ConfigError("invalid start for substring function, " +
                                  std::to_string(start.literalValue()) + " cannot be negative");
            }
            if (length.isLiteral() && length.literalValue() <= 0) {
                throw ConfigError("invalid length for substring function, " +
                                  std::to_string(length.literalValue()) + " cannot be negative or zero");
            }
            return [target, start, length](const ExecContext& ctx, K& tctx) {
                int64_t from = start.get(ctx, tctx);
                int64_t count = length.get(ctx, tctx);
                if (from < 0 || count <= 0) {
                    throw EvalError("invalid range for substring function, start " + std::to_string(from) +
                                    " length " + std::to_string(count));
                }
                std::string text = target.get(ctx, tctx);
                if (count > static_cast<int64_t>(text.size()) || from > static_cast<int64_t>(text.size()) - count) {
                    throw EvalError("invalid range for substring function, start " + std::to_string(from) +
                                    " length " + std::to_string(count) +
                                    " cannot be greater than the length of target string(" +
                                    std::to_string(text.size()) + ")");
                }
                return Value(text.substr(static_cast<size_t>(from), static_cast<size_t>(count)));
            };
        });
}

template <typename K>
FactoryPtr<K> newLenFactory() {
    return makeFactory<K>("Len", {{"target", ArgKind::Getter}},
                          [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
                              GetterPtr<K> target = args.getter("target");
                              return [target](const ExecContext& ctx, K& tctx) {
                                  return Value(lengthOf(target->get(ctx, tctx)));
                              };
                          });
}

template <typename K>
FactoryPtr<K> newCaseFactory(const std::string& name, std::string (*convert)(std::string)) {
    return makeFactory<K>(name, {{"target", ArgKind::StringGetter}},
                          [convert](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
                              return applyTo<K>(args.stringGetter("target"), [convert](const std::string& text) {
                                  return Value(convert(text));
                              });
                          });
}

template <typename K>
FactoryPtr<K> newHexFactory() {
    return makeFactory<K>("Hex", {{"value", ArgKind::ByteSliceLikeGetter}},
                          [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
                              return applyTo<K>(args.byteSliceLikeGetter("value"),
                                                [](const std::optional<Bytes>& bytes) {
                                                    return Value(bytes ? bytesToHex(*bytes) : std::string());
                                                });
                          });
}

template <typename K>
FactoryPtr<K> newBase64DecodeFactory() {
    return makeFactory<K>("Base64Decode", {{"value", ArgKind::StringGetter}},
                          [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
                              return applyTo<K>(args.stringGetter("value"), [](const std::string& text) {
                                  std::string decoded;
                                  if (!base64Decode(text, decoded)) {
                                      throw EvalError("illegal base64 data: " + text);
                                  }
                                  return Value(decoded);
                              });
                          });
}

template <typename K>
FactoryPtr<K> newFnvFactory() {
    return makeFactory<K>("FNV", {{"target", ArgKind::StringGetter}},
                          [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
                              return applyTo<K>(args.stringGetter("target"),
                                                [](const std::string& text) { return Value(fnvHash(text)); });
                          });
}

template <typename K>
FactoryPtr<K> newParseJsonFactory() {
    return makeFactory<K>("ParseJSON", {{"target", ArgKind::StringGetter}},
                          [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
                              return applyTo<K>(args.stringGetter("target"),
                                                [](const std::string& text) { return parseJson(text); });
                          });
}

template <typename K>
FactoryPtr<K> newSortFactory() {
    return makeFactory<K>(
        "Sort", {{"target", ArgKind::Getter}, {"order", ArgKind::StringLiteral, true}},
        [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
            GetterPtr<K> target = args.getter("target");
            std::string order = args.has("order") ? args.stringLiteral("order") : std::string("asc");
            if (order != "asc" && order != "desc") {
                throw ConfigError("invalid arguments: " + order + ". Order should be either \"asc\" or \"desc\"");
            }
            bool descending = order == "desc";
            return [target, descending](const ExecContext& ctx, K& tctx) {
                Value value = target->get(ctx, tctx);
                if (!value.is(Value::Type::Slice)) {
                    throw TypeError(std::string("sort with unsupported type: ") + value.typeName());
                }
                return Value::owned(sortSlice(*value.getSlice(), descending));
            };
        });
}

template <typename K>
FactoryPtr<K> newNowFactory() {
    return makeFactory<K>("Now", {}, [](const FunctionContext&, const Arguments<K>&) -> ExprFunc<K> {
        return [](const ExecContext& ctx, K&) { return Value(ctx.now()); };
    });
}

template <typename K>
FactoryPtr<K> newDurationFactory() {
    return makeFactory<K>("Duration", {{"duration", ArgKind::StringGetter}},
                          [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
                              return applyTo<K>(args.stringGetter("duration"),
                                                [](const std::string& text) { return Value(parseDuration(text)); });
                          });
}

template <typename K>
FactoryPtr<K> newTimeFactory() {
    return makeFactory<K>(
        "Time", {{"time", ArgKind::StringGetter}, {"format", ArgKind::StringLiteral}},
        [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
            std::string format = args.stringLiteral("format");
            validateTimeFormat(format);
            return applyTo<K>(args.stringGetter("time"), [format](const std::string& text) {
                return Value(parseTime(text, format));
            });
        });
}

template <typename K>
FactoryPtr<K> newUnixFactory() {
    return makeFactory<K>(
        "Unix", {{"seconds", ArgKind::IntGetter}, {"nanoseconds", ArgKind::IntGetter, true}},
        [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
            IntGetter<K> seconds = args.intGetter("seconds");
            IntGetter<K> nanoseconds;
            bool has_nanos = args.has("nanoseconds");
            if (has_nanos) {
                nanoseconds = args.intGetter("nanoseconds");
            }
            return [seconds, nanoseconds, has_nanos](const ExecContext& ctx, K& tctx) {
                int64_t secs = seconds.get(ctx, tctx);
                int64_t extra = has_nanos ? nanoseconds.get(ctx, tctx) : 0;
                constexpr int64_t kNanosPerSecond = 1000000000;
                constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
                constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
                if (secs > kMax / kNanosPerSecond || secs < kMin / kNanosPerSecond) {
                    throw EvalError("time out of range for Unix function, seconds " + std::to_string(secs));
                }
                int64_t nanos = secs * kNanosPerSecond;
                if ((extra > 0 && nanos > kMax - extra) || (extra < 0 && nanos < kMin - extra)) {
                    throw EvalError("time out of range for Unix function, nanoseconds " + std::to_string(extra));
                }
                return Value(Time(Duration(nanos + extra)));
            };
        });
}

template <typename K>
FactoryPtr<K> newUnixNanoFactory() {
    return makeFactory<K>("UnixNano", {{"time", ArgKind::TimeGetter}},
                          [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
                              return applyTo<K>(args.timeGetter("time"), [](Time time) {
                                  return Value(static_cast<int64_t>(time.time_since_epoch().count()));
                              });
                          });
}

template <typename K>
FactoryPtr<K> newUnixSecondsFactory() {
    return makeFactory<K>("UnixSeconds", {{"time", ArgKind::TimeGetter}},
                          [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
                              return applyTo<K>(args.timeGetter("time"), [](Time time) {
                                  return Value(static_cast<int64_t>(
                                      std::chrono::floor<std::chrono::seconds>(time).time_since_epoch().count()));
                              });
                          });
}

template <typename K>
FactoryPtr<K> newNanosecondsFactory() {
    return makeFactory<K>("Nanoseconds", {{"duration", ArgKind::DurationGetter}},
                          [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
                              return applyTo<K>(args.durationGetter("duration"), [](Duration d) {
                                  return Value(static_cast<int64_t>(d.count()));
                              });
                          });
}

template <typename K>
FactoryPtr<K> newSecondsFactory() {
    return makeFactory<K>("Seconds", {{"duration", ArgKind::DurationGetter}},
                          [](const FunctionContext&, const Arguments<K>& args) -> ExprFunc<K> {
                              return applyTo<K>(args.durationGetter("duration"), [](Duration d) {
                                  return Value(std::chrono::duration<double>(d).count());
                              });
                          });
}

template <typename K>
std::vector<FactoryPtr<K>> converterFactories() {
    return {newTypeCheckFactory<K>("IsString", Value::Type::String),
            newTypeCheckFactory<K>("IsInt", Value::Type::Int),
            newTypeCheckFactory<K>("IsDouble", Value::Type::Double),
            newTypeCheckFactory<K>("IsBool", Value::Type::Bool),
            newTypeCheckFactory<K>("IsMap", Value::Type::Map),
            newTypeCheckFactory<K>("IsList", Value::Type::Slice),
            newIsMatchFactory<K>(),
            newStringFactory<K>(),
            newIntFactory<K>(),
            newDoubleFactory<K>(),
            newBoolFactory<K>(),
            newConcatFactory<K>(),
            newSplitFactory<K>(),
            newSubstringFactory<K>(),
            newLenFactory<K>(),
            newCaseFactory<K>("ToLowerCase", &toLowerCase),
            newCaseFactory<K>("ToUpperCase", &toUpperCase),
            newHexFactory<K>(),
            newBase64DecodeFactory<K>(),
            newFnvFactory<K>(),
            newParseJsonFactory<K>(),
            newSortFactory<K>(),
            newNowFactory<K>(),
            newDurationFactory<K>(),
            newTimeFactory<K>(),
            newUnixFactory<K>(),
            newUnixNanoFactory<K>(),
            newUnixSecondsFactory<K>(),
            newNanosecondsFactory<K>(),
            newSecondsFactory<K>()};
}

template <typename K>
FactoryMap<K> standardConverters() {
    return createFactoryMap<K>(converterFactories<K>());
}

} // namespace funcs
} // namespace ottl

#endif // OTTL_FUNCS_CONVERTERS_HPP
