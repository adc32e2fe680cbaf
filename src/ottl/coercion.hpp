#ifndef OTTL_COERCION_HPP
#define OTTL_COERCION_HPP

#include "value.hpp"
#include <optional>
#include <string>

namespace ottl {

// Strict conversions: the value must already have the expected kind,
// otherwise TypeError ("expected string but got int64"). Nil is a TypeError.
std::string expectString(const Value& value);
int64_t expectInt(const Value& value);
double expectDouble(const Value& value);
bool expectBool(const Value& value);
Value expectMap(const Value& value);
Value expectSlice(const Value& value);
Time expectTime(const Value& value);
Duration expectDuration(const Value& value);

// Coercing conversions. Nil and strings that do not parse map to an empty
// optional. Kinds with no meaningful conversion raise TypeError.
std::optional<std::string> toStringLike(const Value& value);
// Strings must be base-10 integers; "2.0" is not an int. Floats are
// truncated; NaN and floats outside the int64 range are empty.
std::optional<int64_t> toIntLike(const Value& value);
std::optional<double> toFloatLike(const Value& value);
// Strings other than 1, t, T, TRUE, true, True and their false
// counterparts raise EvalError
std::optional<bool> toBoolLike(const Value& value);
std::optional<Bytes> toByteSliceLike(const Value& value);

// Full-string parsers shared with the converters. They reject leading or
// trailing garbage and out-of-range values.
bool parseInt64(const std::string& text, int64_t& out);
bool parseDouble(const std::string& text, double& out);
bool parseBool(const std::string& text, bool& out);

} // namespace ottl

#endif // OTTL_COERCION_HPP
