#ifndef OTTL_GETTERS_HPP
#define OTTL_GETTERS_HPP

#include "coercion.hpp"
#include "errors.hpp"
#include "exec_context.hpp"
#include "value.hpp"
#include <functional>
#include <memory>
#include <optional>

namespace ottl {

// Reads a Value from the transform context K. Getters are immutable once
// built and are shared across threads.
template <typename K>
class Getter {
public:
    virtual ~Getter() = default;

    virtual Value get(const ExecContext& ctx, K& tctx) const = 0;

    // Non-null when the getter always yields the same value
    virtual const Value* literal() const { return nullptr; }
};

template <typename K>
using GetterPtr = std::shared_ptr<const Getter<K>>;

template <typename K>
class Setter {
public:
    virtual ~Setter() = default;

    virtual void set(const ExecContext& ctx, K& tctx, const Value& value) const = 0;
};

template <typename K>
class GetSetter : public Getter<K>, public Setter<K> {
public:
    // False for read-only paths, which cannot be the target of an editor
    virtual bool writable() const { return true; }
};

template <typename K>
using GetSetterPtr = std::shared_ptr<const GetSetter<K>>;

template <typename K>
using GetFn = std::function<Value(const ExecContext&, K&)>;

template <typename K>
using SetFn = std::function<void(const ExecContext&, K&, const Value&)>;

template <typename K>
class StandardGetter : public Getter<K> {
public:
    explicit StandardGetter(GetFn<K> get) : get_(std::move(get)) {}

    Value get(const ExecContext& ctx, K& tctx) const override { return get_(ctx, tctx); }

private:
    GetFn<K> get_;
};

template <typename K>
class StandardGetSetter : public GetSetter<K> {
public:
    StandardGetSetter(GetFn<K> get, SetFn<K> set) : get_(std::move(get)), set_(std::move(set)) {}

    Value get(const ExecContext& ctx, K& tctx) const override { return get_(ctx, tctx); }

    void set(const ExecContext& ctx, K& tctx, const Value& value) const override {
        if (!set_) {
            throw TypeError("path is read-only");
        }
        set_(ctx, tctx, value);
    }

    bool writable() const override { return static_cast<bool>(set_); }

private:
    GetFn<K> get_;
    SetFn<K> set_;
};

template <typename K>
GetSetterPtr<K> makeGetSetter(GetFn<K> get, SetFn<K> set) {
    return std::make_shared<StandardGetSetter<K>>(std::move(get), std::move(set));
}

template <typename K>
GetterPtr<K> makeGetter(GetFn<K> get) {
    return std::make_shared<StandardGetter<K>>(std::move(get));
}

template <typename K>
class LiteralGetter : public Getter<K> {
public:
    explicit LiteralGetter(Value value) : value_(std::move(value)) {}

    Value get(const ExecContext&, K&) const override { return value_; }
    const Value* literal() const override { return &value_; }

private:
    Value value_;
};

template <typename K>
GetterPtr<K> makeLiteral(Value value) {
    return std::make_shared<LiteralGetter<K>>(std::move(value));
}

// A getter viewed through one of the conversions of coercion.hpp
template <typename K, typename R, R (*Convert)(const Value&)>
class TypedGetter {
public:
    TypedGetter() = default;
    explicit TypedGetter(GetterPtr<K> getter) : getter_(std::move(getter)) {}

    R get(const ExecContext& ctx, K& tctx) const { return Convert(getter_->get(ctx, tctx)); }

    bool isLiteral() const { return getter_ && getter_->literal() != nullptr; }

    // Only valid when isLiteral()
    R literalValue() const { return Convert(*getter_->literal()); }

    const GetterPtr<K>& getter() const { return getter_; }

private:
    GetterPtr<K> getter_;
};

template <typename K> using StringGetter = TypedGetter<K, std::string, &expectString>;
template <typename K> using IntGetter = TypedGetter<K, int64_t, &expectInt>;
template <typename K> using FloatGetter = TypedGetter<K, double, &expectDouble>;
template <typename K> using BoolGetter = TypedGetter<K, bool, &expectBool>;
template <typename K> using MapGetter = TypedGetter<K, Value, &expectMap>;
template <typename K> using SliceGetter = TypedGetter<K, Value, &expectSlice>;
template <typename K> using TimeGetter = TypedGetter<K, Time, &expectTime>;
template <typename K> using DurationGetter = TypedGetter<K, Duration, &expectDuration>;

template <typename K>
using StringLikeGetter = TypedGetter<K, std::optional<std::string>, &toStringLike>;
template <typename K>
using IntLikeGetter = TypedGetter<K, std::optional<int64_t>, &toIntLike>;
template <typename K>
using FloatLikeGetter = TypedGetter<K, std::optional<double>, &toFloatLike>;
template <typename K>
using BoolLikeGetter = TypedGetter<K, std::optional<bool>, &toBoolLike>;
template <typename K>
using ByteSliceLikeGetter = TypedGetter<K, std::optional<Bytes>, &toByteSliceLike>;

} // namespace ottl

#endif // OTTL_GETTERS_HPP
