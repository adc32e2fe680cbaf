#include "coercion.hpp"
#include "errors.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>

namespace ottl {

namespace {

[[noreturn]] void throwExpected(const char* expected, const Value& value) {
    throw TypeError(std::string("expected ") + expected + " but got " + value.typeName());
}

void appendBigEndian(Bytes& out, uint64_t bits, int width) {
    for (int i = width - 1; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>((bits >> (i * 8)) & 0xFF));
    }
}

} // namespace

std::string expectString(const Value& value) {
    if (!value.is(Value::Type::String)) {
        throwExpected("string", value);
    }
    return value.getString();
}

int64_t expectInt(const Value& value) {
    if (!value.is(Value::Type::Int)) {
        throwExpected("int64", value);
    }
    return value.getInt();
}

double expectDouble(const Value& value) {
    if (!value.is(Value::Type::Double)) {
        throwExpected("float64", value);
    }
    return value.getDouble();
}

bool expectBool(const Value& value) {
    if (!value.is(Value::Type::Bool)) {
        throwExpected("bool", value);
    }
    return value.getBool();
}

Value expectMap(const Value& value) {
    if (!value.is(Value::Type::Map)) {
        throwExpected("map", value);
    }
    return value;
}

Value expectSlice(const Value& value) {
    if (!value.is(Value::Type::Slice)) {
        throwExpected("slice", value);
    }
    return value;
}

Time expectTime(const Value& value) {
    if (!value.is(Value::Type::Time)) {
        throwExpected("time", value);
    }
    return value.getTime();
}

Duration expectDuration(const Value& value) {
    if (!value.is(Value::Type::Duration)) {
        throwExpected("duration", value);
    }
    return value.getDuration();
}

bool parseInt64(const std::string& text, int64_t& out) {
    if (text.empty() || std::isspace(static_cast<unsigned char>(text[0]))) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || end != text.c_str() + text.size()) {
        return false;
    }
    out = static_cast<int64_t>(parsed);
    return true;
}

bool parseDouble(const std::string& text, double& out) {
    if (text.empty() || std::isspace(static_cast<unsigned char>(text[0]))) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    double parsed = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        return false;
    }
    if (errno == ERANGE && std::isinf(parsed)) {
        return false;
    }
    out = parsed;
    return true;
}

bool parseBool(const std::string& text, bool& out) {
    if (text == "1" || text == "t" || text == "T" || text == "TRUE" ||
        text == "true" || text == "True") {
        out = true;
        return true;
    }
    if (text == "0" || text == "f" || text == "F" || text == "FALSE" ||
        text == "false" || text == "False") {
        out = false;
        return true;
    }
    return false;
}

std::optional<std::string> toStringLike(const Value& value) {
    switch (value.type()) {
        case Value::Type::Nil:
            return std::nullopt;
        case Value::Type::String:
            return value.getString();
        case Value::Type::Bytes:
            return bytesToHex(value.getBytes());
        case Value::Type::Map:
        case Value::Type::Slice:
            return toJson(value);
        default:
            return toDisplayString(value);
    }
}

std::optional<int64_t> toIntLike(const Value& value) {
    switch (value.type()) {
        case Value::Type::Nil:
            return std::nullopt;
        case Value::Type::Int:
            return value.getInt();
        case Value::Type::Double: {
            // NaN and values outside the int64 range have no integer form
            double d = value.getDouble();
            if (!(d >= -9223372036854775808.0 && d < 9223372036854775808.0)) {
                return std::nullopt;
            }
            return static_cast<int64_t>(d);
        }
        case Value::Type::Bool:
            return value.getBool() ? 1 : 0;
        case Value::Type::String: {
            int64_t parsed = 0;
            if (!parseInt64(value.getString(), parsed)) {
                return std::nullopt;
            }
            return parsed;
        }
        default:
            throw TypeError(std::string("unsupported type: ") + value.typeName());
    }
}

std::optional<double> toFloatLike(const Value& value) {
    switch (value.type()) {
        case Value::Type::Nil:
            return std::nullopt;
        case Value::Type::Double:
            return value.getDouble();
        case Value::Type::Int:
            return static_cast<double>(value.getInt());
        case Value::Type::Bool:
            return value.getBool() ? 1.0 : 0.0;
        case Value::Type::String: {
            double parsed = 0;
            if (!parseDouble(value.getString(), parsed)) {
                return std::nullopt;
            }
            return parsed;
        }
        default:
            throw TypeError(std::string("unsupported type: ") + value.typeName());
    }
}

std::optional<bool> toBoolLike(const Value& value) {
    switch (value.type()) {
        case Value::Type::Nil:
            return std::nullopt;
        case Value::Type::Bool:
            return value.getBool();
        case Value::Type::Int:
            return value.getInt() != 0;
        case Value::Type::Double:
            return value.getDouble() != 0.0;
        case Value::Type::String: {
            bool parsed = false;
            if (!parseBool(value.getString(), parsed)) {
                throw EvalError("invalid syntax for bool: \"" + value.getString() + "\"");
            }
            return parsed;
        }
        default:
            throw TypeError(std::string("unsupported type: ") + value.typeName());
    }
}

std::optional<Bytes> toByteSliceLike(const Value& value) {
    switch (value.type()) {
        case Value::Type::Nil:
            return std::nullopt;
        case Value::Type::Bytes:
            return value.getBytes();
        case Value::Type::String: {
            const std::string& s = value.getString();
            return Bytes(s.begin(), s.end());
        }
        case Value::Type::Int: {
            Bytes out;
            appendBigEndian(out, static_cast<uint64_t>(value.getInt()), 8);
            return out;
        }
        case Value::Type::Double: {
            double d = value.getDouble();
            uint64_t bits = 0;
            std::memcpy(&bits, &d, sizeof(bits));
            Bytes out;
            appendBigEndian(out, bits, 8);
            return out;
        }
        case Value::Type::Bool:
            return Bytes{static_cast<uint8_t>(value.getBool() ? 1 : 0)};
        default:
            throw TypeError(std::string("unsupported type: ") + value.typeName());
    }
}

} // namespace ottl
