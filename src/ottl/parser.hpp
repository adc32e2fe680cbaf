#ifndef OTTL_PARSER_HPP
#define OTTL_PARSER_HPP

#include "compare.hpp"
#include "errors.hpp"
#include "functions.hpp"
#include "getters.hpp"
#include "grammar.hpp"
#include "map_access.hpp"
#include "math.hpp"
#include "path.hpp"
#include "statements.hpp"
#include <cctype>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ottl {

// Compiles statement and condition text into Getters, ExprFuncs and
// BoolExprFuncs over the transform context K. All validation happens here;
// the compiled artifacts only fail on per-record data.
template <typename K>
class Parser {
public:
    using PathParser = std::function<GetSetterPtr<K>(const Path<K>&)>;
    using EnumParser = std::function<std::optional<int64_t>(const std::string&)>;

    Parser(FactoryMap<K> functions, PathParser path_parser, EnumParser enum_parser, std::string context_name)
        : functions_(std::move(functions)),
          path_parser_(std::move(path_parser)),
          enum_parser_(std::move(enum_parser)),
          context_name_(std::move(context_name)) {}

    const std::string& contextName() const { return context_name_; }

    Statement<K> parseStatement(const std::string& text) const {
        return compileStatement(parseStatementSyntax(text), text);
    }

    std::vector<Statement<K>> parseStatements(const std::vector<std::string>& texts) const {
        std::vector<Statement<K>> statements;
        for (const auto& text : texts) {
            statements.push_back(parseStatement(text));
        }
        return statements;
    }

    Statement<K> compileStatement(const ast::Statement& syntax, const std::string& text) const {
        ExprFunc<K> function = newFunctionCall(syntax.editor.function, syntax.editor.arguments, true);
        BoolExprFunc<K> condition;
        if (syntax.where) {
            condition = newBoolExpr(*syntax.where);
        }
        return Statement<K>(std::move(function), std::move(condition), text);
    }

    Condition<K> parseCondition(const std::string& text) const {
        return compileCondition(parseConditionSyntax(text), text);
    }

    std::vector<Condition<K>> parseConditions(const std::vector<std::string>& texts) const {
        std::vector<Condition<K>> conditions;
        for (const auto& text : texts) {
            conditions.push_back(parseCondition(text));
        }
        return conditions;
    }

    Condition<K> compileCondition(const ast::BooleanExpression& syntax, const std::string& text) const {
        return Condition<K>(newBoolExpr(syntax), text);
    }

    // Compiles a standalone value such as `Concat([a, b], "-")`
    GetterPtr<K> parseValueExpression(const std::string& text) const {
        return newGetter(parseValueSyntax(text));
    }

private:
    ExprFunc<K> newFunctionCall(const std::string& name, const std::vector<ast::Argument>& args,
                                bool editor) const {
        auto it = functions_.find(name);
        if (it == functions_.end()) {
            throw ConfigError(std::string(editor ? "undefined editor" : "undefined function") +
                              " \"" + name + "\" in the " + context_name_ + " context");
        }
        const FactoryPtr<K>& factory = it->second;
        const ArgsSchema& schema = factory->arguments();

        Arguments<K> bound(schema);
        bool named = false;
        size_t positional = 0;
        for (const auto& arg : args) {
            size_t index = 0;
            if (!arg.name.empty()) {
                named = true;
                index = schema.size();
                for (size_t i = 0; i < schema.size(); ++i) {
                    if (schema[i].name == arg.name) {
                        index = i;
                        break;
                    }
                }
                if (index == schema.size()) {
                    throw ConfigError("function \"" + name + "\" has no parameter named \"" + arg.name + "\"");
                }
                if (bound.isBound(index)) {
                    throw ConfigError("function \"" + name + "\": duplicate argument \"" + arg.name + "\"");
                }
            } else {
                if (named) {
                    throw ConfigError("function \"" + name + "\": unnamed argument used after named argument");
                }
                if (positional >= schema.size()) {
                    throw ConfigError("too many arguments to function \"" + name + "\": expected at most " +
                                      std::to_string(schema.size()) + ", got " + std::to_string(args.size()));
                }
                index = positional++;
            }
            bound.bind(index, bindArgument(schema[index], arg, name));
        }

        for (size_t i = 0; i < schema.size(); ++i) {
            if (!schema[i].optional && !bound.isBound(i)) {
                throw ConfigError("missing required argument \"" + schema[i].name + "\" for function \"" +
                                  name + "\"");
            }
        }

        try {
            return factory->create(FunctionContext{context_name_}, bound);
        } catch (const ConfigError& e) {
            throw ConfigError("invalid arguments to function \"" + name + "\": " + e.what());
        }
    }

    BoundArg<K> bindArgument(const ArgSpec& spec, const ast::Argument& arg, const std::string& function) const {
        const ast::Value& value = *arg.value;
        BoundArg<K> bound;
        bound.kind = spec.kind;

        auto mismatch = [&]() {
            return ConfigError("argument \"" + spec.name + "\" of function \"" + function + "\" must be a " +
                               argKindName(spec.kind));
        };

        switch (spec.kind) {
            case ArgKind::GetSetter:
                if (value.kind != ast::Value::Kind::Math || value.math->kind != ast::MathExpression::Kind::Path) {
                    throw mismatch();
                }
                bound.get_setter = newPath(*value.math->path);
                if (!bound.get_setter->writable()) {
                    throw ConfigError("path \"" + value.math->path->text + "\" is read-only and cannot be the " +
                                      "target of function \"" + function + "\"");
                }
                bound.getter = bound.get_setter;
                break;
            case ArgKind::StringLiteral:
                if (value.kind != ast::Value::Kind::String) {
                    throw mismatch();
                }
                bound.string = value.string;
                break;
            case ArgKind::IntLiteral:
                if (value.kind != ast::Value::Kind::Math || value.math->kind != ast::MathExpression::Kind::Int) {
                    throw mismatch();
                }
                bound.integer = value.math->int_value;
                break;
            case ArgKind::FloatLiteral:
                if (value.kind != ast::Value::Kind::Math) {
                    throw mismatch();
                }
                if (value.math->kind == ast::MathExpression::Kind::Float) {
                    bound.number = value.math->float_value;
                } else if (value.math->kind == ast::MathExpression::Kind::Int) {
                    bound.number = static_cast<double>(value.math->int_value);
                } else {
                    throw mismatch();
                }
                break;
            case ArgKind::BoolLiteral:
                if (value.kind != ast::Value::Kind::Bool) {
                    throw mismatch();
                }
                bound.boolean = value.boolean;
                break;
            case ArgKind::StringList:
                if (value.kind != ast::Value::Kind::List) {
                    throw mismatch();
                }
                for (const auto& item : value.list) {
                    if (item.kind != ast::Value::Kind::String) {
                        throw mismatch();
                    }
                    bound.strings.push_back(item.string);
                }
                break;
            case ArgKind::GetterList:
            case ArgKind::StringLikeGetterList:
                if (value.kind != ast::Value::Kind::List) {
                    throw mismatch();
                }
                for (const auto& item : value.list) {
                    bound.getters.push_back(newGetter(item));
                }
                break;
            case ArgKind::Enum:
                if (value.kind != ast::Value::Kind::Enum) {
                    throw mismatch();
                }
                bound.integer = parseEnum(value.string);
                break;
            case ArgKind::Function: {
                if (arg.symbol.empty()) {
                    throw mismatch();
                }
                auto it = functions_.find(arg.symbol);
                if (it == functions_.end()) {
                    throw ConfigError("undefined function \"" + arg.symbol + "\" passed as argument \"" +
                                      spec.name + "\" of function \"" + function + "\"");
                }
                bound.function = it->second;
                bound.function_context = FunctionContext{context_name_};
                break;
            }
            default:
                bound.getter = newGetter(value);
                break;
        }
        return bound;
    }

    int64_t parseEnum(const std::string& symbol) const {
        std::optional<int64_t> value = enum_parser_ ? enum_parser_(symbol) : std::nullopt;
        if (!value) {
            throw ConfigError("enum symbol \"" + symbol + "\" not found in the " + context_name_ + " context");
        }
        return *value;
    }

    GetterPtr<K> newGetter(const ast::Value& value) const {
        switch (value.kind) {
            case ast::Value::Kind::Nil:
                return makeLiteral<K>(Value());
            case ast::Value::Kind::String:
                return makeLiteral<K>(Value(value.string));
            case ast::Value::Kind::Bytes:
                return makeLiteral<K>(Value(Bytes(value.bytes)));
            case ast::Value::Kind::Bool:
                return makeLiteral<K>(Value(value.boolean));
            case ast::Value::Kind::Enum:
                return makeLiteral<K>(Value(parseEnum(value.string)));
            case ast::Value::Kind::Map:
                return newMapGetter(value);
            case ast::Value::Kind::List:
                return newListGetter(value);
            case ast::Value::Kind::Math:
                return newMathGetter(*value.math);
        }
        throw ConfigError("unsupported value");
    }

    using Entries = std::vector<std::pair<std::string, GetterPtr<K>>>;

    // `value_of` evaluates one element getter
    template <typename ValueOf>
    static Value buildMap(const Entries& entries, const ValueOf& value_of) {
        Map map;
        for (const auto& entry : entries) {
            Value v = value_of(entry.second);
            checkStorable(v);
            KeyValue* kv = map.Add();
            kv->set_key(entry.first);
            toAnyValue(v, kv->mutable_value());
        }
        return Value::owned(std::move(map));
    }

    template <typename ValueOf>
    static Value buildSlice(const std::vector<GetterPtr<K>>& items, const ValueOf& value_of) {
        Slice slice;
        for (const auto& item : items) {
            Value v = value_of(item);
            checkStorable(v);
            toAnyValue(v, slice.Add());
        }
        return Value::owned(std::move(slice));
    }

    static Value literalOf(const GetterPtr<K>& getter) { return *getter->literal(); }

    GetterPtr<K> newMapGetter(const ast::Value& value) const {
        Entries entries;
        bool all_literal = true;
        for (const auto& entry : value.map) {
            GetterPtr<K> getter = newGetter(entry.value);
            all_literal = all_literal && getter->literal() != nullptr;
            entries.emplace_back(entry.key, std::move(getter));
        }
        if (all_literal) {
            return makeLiteral<K>(buildMap(entries, &Parser::literalOf));
        }
        return makeGetter<K>([entries](const ExecContext& ctx, K& tctx) {
            return buildMap(entries, [&ctx, &tctx](const GetterPtr<K>& g) { return g->get(ctx, tctx); });
        });
    }

    GetterPtr<K> newListGetter(const ast::Value& value) const {
        std::vector<GetterPtr<K>> items;
        bool all_literal = true;
        for (const auto& item : value.list) {
            GetterPtr<K> getter = newGetter(item);
            all_literal = all_literal && getter->literal() != nullptr;
            items.push_back(std::move(getter));
        }
        if (all_literal) {
            return makeLiteral<K>(buildSlice(items, &Parser::literalOf));
        }
        return makeGetter<K>([items](const ExecContext& ctx, K& tctx) {
            return buildSlice(items, [&ctx, &tctx](const GetterPtr<K>& g) { return g->get(ctx, tctx); });
        });
    }

    GetterPtr<K> newMathGetter(const ast::MathExpression& expr) const {
        switch (expr.kind) {
            case ast::MathExpression::Kind::Int:
                return makeLiteral<K>(Value(expr.int_value));
            case ast::MathExpression::Kind::Float:
                return makeLiteral<K>(Value(expr.float_value));
            case ast::MathExpression::Kind::Path:
                return newPath(*expr.path);
            case ast::MathExpression::Kind::Converter:
                return newConverterGetter(*expr.converter);
            case ast::MathExpression::Kind::Negate: {
                GetterPtr<K> operand = newMathGetter(*expr.left);
                return makeGetter<K>([operand](const ExecContext& ctx, K& tctx) {
                    return negate(operand->get(ctx, tctx));
                });
            }
            case ast::MathExpression::Kind::Binary: {
                GetterPtr<K> left = newMathGetter(*expr.left);
                GetterPtr<K> right = newMathGetter(*expr.right);
                MathOp op = expr.op;
                return makeGetter<K>([left, op, right](const ExecContext& ctx, K& tctx) {
                    return applyMath(left->get(ctx, tctx), op, right->get(ctx, tctx));
                });
            }
        }
        throw ConfigError("unsupported math expression");
    }

    GetterPtr<K> newConverterGetter(const ast::Converter& converter) const {
        ExprFunc<K> function = newFunctionCall(converter.function, converter.arguments, false);
        std::vector<Key<K>> keys = newKeys(converter.keys);
        if (keys.empty()) {
            return makeGetter<K>(function);
        }
        return makeGetter<K>([function, keys](const ExecContext& ctx, K& tctx) {
            Value result = function(ctx, tctx);
            return indexValue(result, resolveKeys(keys, ctx, tctx));
        });
    }

    std::vector<Key<K>> newKeys(const std::vector<ast::Key>& keys) const {
        std::vector<Key<K>> result;
        for (const auto& key : keys) {
            if (key.string) {
                result.push_back(Key<K>::fromString(*key.string));
            } else if (key.integer) {
                result.push_back(Key<K>::fromInt(*key.integer));
            } else {
                result.push_back(Key<K>::fromGetter(newMathGetter(*key.expression)));
            }
        }
        return result;
    }

    GetSetterPtr<K> newPath(const ast::Path& syntax) const {
        const std::vector<ast::Field>& fields = syntax.fields;
        size_t first = 0;
        // A leading qualifier naming this context is dropped
        if (fields.size() > 1 && fields[0].name == context_name_ && fields[0].keys.empty()) {
            first = 1;
        }
        std::shared_ptr<const Path<K>> path;
        for (size_t i = fields.size(); i-- > first;) {
            path = std::make_shared<const Path<K>>(fields[i].name, newKeys(fields[i].keys), path, syntax.text);
        }
        return path_parser_(*path);
    }

    BoolExprFunc<K> newBoolExpr(const ast::BooleanExpression& expr) const {
        std::vector<BoolExprFunc<K>> terms;
        for (const auto& term : expr.terms) {
            terms.push_back(newTerm(term));
        }
        if (terms.size() == 1) {
            return terms.front();
        }
        return [terms](const ExecContext& ctx, K& tctx) {
            for (const auto& term : terms) {
                if (term(ctx, tctx)) {
                    return true;
                }
            }
            return false;
        };
    }

    BoolExprFunc<K> newTerm(const ast::Term& term) const {
        std::vector<BoolExprFunc<K>> values;
        for (const auto& value : term.values) {
            values.push_back(newBooleanValue(value));
        }
        if (values.size() == 1) {
            return values.front();
        }
        return [values](const ExecContext& ctx, K& tctx) {
            for (const auto& value : values) {
                if (!value(ctx, tctx)) {
                    return false;
                }
            }
            return true;
        };
    }

    BoolExprFunc<K> newBooleanValue(const ast::BooleanValue& value) const {
        BoolExprFunc<K> result;
        switch (value.kind) {
            case ast::BooleanValue::Kind::Constant: {
                bool constant = value.constant;
                result = [constant](const ExecContext&, K&) { return constant; };
                break;
            }
            case ast::BooleanValue::Kind::Comparison: {
                GetterPtr<K> left = newGetter(value.comparison.left);
                GetterPtr<K> right = newGetter(value.comparison.right);
                CompareOp op = value.comparison.op;
                result = [left, op, right](const ExecContext& ctx, K& tctx) {
                    return compareValues(left->get(ctx, tctx), right->get(ctx, tctx), op);
                };
                break;
            }
            case ast::BooleanValue::Kind::Converter: {
                GetterPtr<K> converter = newConverterGetter(*value.converter);
                std::string name = value.converter->function;
                result = [converter, name](const ExecContext& ctx, K& tctx) {
                    Value v = converter->get(ctx, tctx);
                    if (!v.is(Value::Type::Bool)) {
                        throw TypeError("converter " + name + " must return a bool but returned " + v.typeName());
                    }
                    return v.getBool();
                };
                break;
            }
            case ast::BooleanValue::Kind::Subexpression:
                result = newBoolExpr(*value.subexpression);
                break;
        }
        if (value.negate) {
            return [result](const ExecContext& ctx, K& tctx) { return !result(ctx, tctx); };
        }
        return result;
    }

    FactoryMap<K> functions_;
    PathParser path_parser_;
    EnumParser enum_parser_;
    std::string context_name_;
};

} // namespace ottl

#endif // OTTL_PARSER_HPP
