#ifndef OTTL_FUNCTIONS_HPP
#define OTTL_FUNCTIONS_HPP

#include "errors.hpp"
#include "getters.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ottl {

// Semantic type of a function parameter. Decides how the binder turns the
// parsed argument into a bound value.
enum class ArgKind {
    Getter,
    GetSetter,              // must be a path
    StringGetter,
    StringLikeGetter,
    IntGetter,
    IntLikeGetter,
    FloatGetter,
    FloatLikeGetter,
    BoolGetter,
    BoolLikeGetter,
    MapGetter,
    SliceGetter,
    TimeGetter,
    DurationGetter,
    ByteSliceLikeGetter,
    StringLiteral,
    IntLiteral,
    FloatLiteral,
    BoolLiteral,
    StringList,             // list literal of strings
    GetterList,
    StringLikeGetterList,
    Enum,
    Function                // name of another converter
};

const char* argKindName(ArgKind kind);

inline bool isGetterKind(ArgKind kind) {
    return kind >= ArgKind::Getter && kind <= ArgKind::ByteSliceLikeGetter && kind != ArgKind::GetSetter;
}

struct ArgSpec {
    std::string name;
    ArgKind kind;
    bool optional = false;
};

using ArgsSchema = std::vector<ArgSpec>;

template <typename K>
using ExprFunc = std::function<Value(const ExecContext&, K&)>;

// Passed to factories when a function is instantiated
struct FunctionContext {
    std::string context_name;
};

template <typename K>
class Factory;

template <typename K>
using FactoryPtr = std::shared_ptr<const Factory<K>>;

// A function referenced by name as an argument of another function
template <typename K>
class FunctionGetter;

template <typename K>
struct BoundArg {
    ArgKind kind = ArgKind::Getter;
    GetterPtr<K> getter;
    GetSetterPtr<K> get_setter;
    std::string string;
    int64_t integer = 0;
    double number = 0;
    bool boolean = false;
    std::vector<std::string> strings;
    std::vector<GetterPtr<K>> getters;
    FactoryPtr<K> function;
    FunctionContext function_context;
};

// Bound arguments of one invocation, addressed by parameter name
template <typename K>
class Arguments {
public:
    explicit Arguments(ArgsSchema schema)
        : schema_(std::move(schema)), values_(schema_.size()) {}

    const ArgsSchema& schema() const { return schema_; }

    void bind(size_t index, BoundArg<K> arg) { values_.at(index) = std::move(arg); }
    bool isBound(size_t index) const { return values_.at(index).has_value(); }

    bool has(const std::string& name) const { return values_[indexOf(name)].has_value(); }

    GetterPtr<K> getter(const std::string& name) const { return require(name).getter; }
    GetSetterPtr<K> getSetter(const std::string& name) const { return require(name).get_setter; }

    StringGetter<K> stringGetter(const std::string& name) const { return StringGetter<K>(getter(name)); }
    StringLikeGetter<K> stringLikeGetter(const std::string& name) const {
        return StringLikeGetter<K>(getter(name));
    }
    IntGetter<K> intGetter(const std::string& name) const { return IntGetter<K>(getter(name)); }
    IntLikeGetter<K> intLikeGetter(const std::string& name) const { return IntLikeGetter<K>(getter(name)); }
    FloatGetter<K> floatGetter(const std::string& name) const { return FloatGetter<K>(getter(name)); }
    FloatLikeGetter<K> floatLikeGetter(const std::string& name) const {
        return FloatLikeGetter<K>(getter(name));
    }
    BoolGetter<K> boolGetter(const std::string& name) const { return BoolGetter<K>(getter(name)); }
    BoolLikeGetter<K> boolLikeGetter(const std::string& name) const { return BoolLikeGetter<K>(getter(name)); }
    MapGetter<K> mapGetter(const std::string& name) const { return MapGetter<K>(getter(name)); }
    SliceGetter<K> sliceGetter(const std::string& name) const { return SliceGetter<K>(getter(name)); }
    TimeGetter<K> timeGetter(const std::string& name) const { return TimeGetter<K>(getter(name)); }
    DurationGetter<K> durationGetter(const std::string& name) const { return DurationGetter<K>(getter(name)); }
    ByteSliceLikeGetter<K> byteSliceLikeGetter(const std::string& name) const {
        return ByteSliceLikeGetter<K>(getter(name));
    }

    const std::string& stringLiteral(const std::string& name) const { return require(name).string; }
    int64_t intLiteral(const std::string& name) const { return require(name).integer; }
    double floatLiteral(const std::string& name) const { return require(name).number; }
    bool boolLiteral(const std::string& name) const { return require(name).boolean; }
    const std::vector<std::string>& stringList(const std::string& name) const { return require(name).strings; }
    const std::vector<GetterPtr<K>>& getterList(const std::string& name) const { return require(name).getters; }
    std::vector<StringLikeGetter<K>> stringLikeGetterList(const std::string& name) const {
        std::vector<StringLikeGetter<K>> result;
        for (const auto& g : require(name).getters) {
            result.emplace_back(g);
        }
        return result;
    }
    int64_t enumValue(const std::string& name) const { return require(name).integer; }
    FunctionGetter<K> function(const std::string& name) const {
        const BoundArg<K>& arg = require(name);
        return FunctionGetter<K>(arg.function_context, arg.function);
    }

private:
    size_t indexOf(const std::string& name) const {
        for (size_t i = 0; i < schema_.size(); ++i) {
            if (schema_[i].name == name) {
                return i;
            }
        }
        throw ConfigError("function has no parameter \"" + name + "\"");
    }

    const BoundArg<K>& require(const std::string& name) const {
        const auto& value = values_[indexOf(name)];
        if (!value) {
            throw ConfigError("argument \"" + name + "\" was not provided");
        }
        return *value;
    }

    ArgsSchema schema_;
    std::vector<std::optional<BoundArg<K>>> values_;
};

// Builds one function instance from bound arguments. Factories are
// registered once and are immutable.
template <typename K>
class Factory {
public:
    virtual ~Factory() = default;

    virtual const std::string& name() const = 0;
    virtual const ArgsSchema& arguments() const = 0;
    virtual ExprFunc<K> create(const FunctionContext& fctx, const Arguments<K>& args) const = 0;
};

template <typename K>
class StandardFactory : public Factory<K> {
public:
    using CreateFn = std::function<ExprFunc<K>(const FunctionContext&, const Arguments<K>&)>;

    StandardFactory(std::string name, ArgsSchema schema, CreateFn create)
        : name_(std::move(name)), schema_(std::move(schema)), create_(std::move(create)) {}

    const std::string& name() const override { return name_; }
    const ArgsSchema& arguments() const override { return schema_; }

    ExprFunc<K> create(const FunctionContext& fctx, const Arguments<K>& args) const override {
        return create_(fctx, args);
    }

private:
    std::string name_;
    ArgsSchema schema_;
    CreateFn create_;
};

template <typename K>
FactoryPtr<K> makeFactory(std::string name, ArgsSchema schema,
                          typename StandardFactory<K>::CreateFn create) {
    return std::make_shared<StandardFactory<K>>(std::move(name), std::move(schema), std::move(create));
}

template <typename K>
using FactoryMap = std::map<std::string, FactoryPtr<K>>;

// Indexes factories by name. Rejects duplicate names, duplicate parameter
// names and optional parameters placed before required ones.
template <typename K>
FactoryMap<K> createFactoryMap(const std::vector<FactoryPtr<K>>& factories) {
    FactoryMap<K> result;
    for (const auto& factory : factories) {
        const std::string& name = factory->name();
        if (result.count(name)) {
            throw ConfigError("duplicate function \"" + name + "\"");
        }
        bool seen_optional = false;
        std::set<std::string> params;
        for (const auto& spec : factory->arguments()) {
            if (!params.insert(spec.name).second) {
                throw ConfigError("function \"" + name + "\" declares parameter \"" + spec.name + "\" twice");
            }
            if (spec.optional) {
                seen_optional = true;
            } else if (seen_optional) {
                throw ConfigError("function \"" + name + "\": required parameter \"" + spec.name +
                                  "\" follows an optional parameter");
            }
        }
        result.emplace(name, factory);
    }
    return result;
}

template <typename K>
FactoryMap<K> mergeFactoryMaps(FactoryMap<K> base, const FactoryMap<K>& extra) {
    for (const auto& entry : extra) {
        if (!base.emplace(entry.first, entry.second).second) {
            throw ConfigError("duplicate function \"" + entry.first + "\"");
        }
    }
    return base;
}

template <typename K>
class FunctionGetter {
public:
    FunctionGetter() = default;
    FunctionGetter(FunctionContext fctx, FactoryPtr<K> factory)
        : fctx_(std::move(fctx)), factory_(std::move(factory)) {}

    const std::string& name() const { return factory_->name(); }

    // Instantiates the function with positional getter arguments. Every
    // parameter of the referenced function must accept a getter.
    ExprFunc<K> get(const std::vector<GetterPtr<K>>& args) const {
        const ArgsSchema& schema = factory_->arguments();
        if (args.size() > schema.size()) {
            throw ConfigError("too many arguments for function \"" + name() + "\"");
        }
        Arguments<K> bound(schema);
        for (size_t i = 0; i < schema.size(); ++i) {
            if (!isGetterKind(schema[i].kind)) {
                throw ConfigError("function \"" + name() + "\" cannot be invoked indirectly: parameter \"" +
                                  schema[i].name + "\" is a " + argKindName(schema[i].kind));
            }
            if (i < args.size()) {
                BoundArg<K> arg;
                arg.kind = schema[i].kind;
                arg.getter = args[i];
                bound.bind(i, std::move(arg));
            } else if (!schema[i].optional) {
                throw ConfigError("missing required argument \"" + schema[i].name + "\" for function \"" +
                                  name() + "\"");
            }
        }
        return factory_->create(fctx_, bound);
    }

    // Number of required parameters of the referenced function
    size_t requiredArguments() const {
        size_t count = 0;
        for (const auto& spec : factory_->arguments()) {
            if (!spec.optional) ++count;
        }
        return count;
    }

private:
    FunctionContext fctx_;
    FactoryPtr<K> factory_;
};

} // namespace ottl

#endif // OTTL_FUNCTIONS_HPP
