#include "value.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>

namespace ottl {

Value Value::borrowed(Map* map) {
    Value v;
    v.data_ = MapRef(map, [](Map*) {});
    return v;
}

Value Value::borrowed(Slice* slice) {
    Value v;
    v.data_ = SliceRef(slice, [](Slice*) {});
    return v;
}

Value Value::owned(Map map) {
    Value v;
    v.data_ = std::make_shared<Map>(std::move(map));
    return v;
}

Value Value::owned(Slice slice) {
    Value v;
    v.data_ = std::make_shared<Slice>(std::move(slice));
    return v;
}

const char* Value::typeName(Type type) {
    switch (type) {
        case Type::Nil: return "nil";
        case Type::String: return "string";
        case Type::Int: return "int64";
        case Type::Double: return "float64";
        case Type::Bool: return "bool";
        case Type::Bytes: return "bytes";
        case Type::Map: return "map";
        case Type::Slice: return "slice";
        case Type::Time: return "time";
        case Type::Duration: return "duration";
    }
    return "unknown";
}

Value fromAnyValue(AnyValue* value) {
    switch (value->value_case()) {
        case AnyValue::kStringValue:
            return Value(value->string_value());
        case AnyValue::kBoolValue:
            return Value(value->bool_value());
        case AnyValue::kIntValue:
            return Value(static_cast<int64_t>(value->int_value()));
        case AnyValue::kDoubleValue:
            return Value(value->double_value());
        case AnyValue::kBytesValue: {
            const std::string& raw = value->bytes_value();
            return Value(Bytes(raw.begin(), raw.end()));
        }
        case AnyValue::kArrayValue:
            return Value::borrowed(value->mutable_array_value()->mutable_values());
        case AnyValue::kKvlistValue:
            return Value::borrowed(value->mutable_kvlist_value()->mutable_values());
        default:
            return Value();
    }
}

void toAnyValue(const Value& value, AnyValue* target) {
    switch (value.type()) {
        case Value::Type::Nil:
            target->Clear();
            break;
        case Value::Type::String:
            target->set_string_value(value.getString());
            break;
        case Value::Type::Int:
            target->set_int_value(value.getInt());
            break;
        case Value::Type::Double:
            target->set_double_value(value.getDouble());
            break;
        case Value::Type::Bool:
            target->set_bool_value(value.getBool());
            break;
        case Value::Type::Bytes: {
            const Bytes& bytes = value.getBytes();
            target->set_bytes_value(std::string(bytes.begin(), bytes.end()));
            break;
        }
        case Value::Type::Map: {
            // Copy before touching the target: the source may live inside it
            Map copy(*value.getMap());
            target->mutable_kvlist_value()->mutable_values()->Swap(&copy);
            break;
        }
        case Value::Type::Slice: {
            Slice copy(*value.getSlice());
            target->mutable_array_value()->mutable_values()->Swap(&copy);
            break;
        }
        case Value::Type::Time:
        case Value::Type::Duration:
            throw TypeError(std::string("unsupported value type ") + value.typeName() +
                            " for a telemetry field");
    }
}

AnyValue* findKey(Map& map, const std::string& key) {
    for (auto& kv : map) {
        if (kv.key() == key) {
            return kv.mutable_value();
        }
    }
    return nullptr;
}

AnyValue* putEmpty(Map& map, const std::string& key) {
    AnyValue* existing = findKey(map, key);
    if (existing) {
        existing->Clear();
        return existing;
    }
    KeyValue* kv = map.Add();
    kv->set_key(key);
    return kv->mutable_value();
}

bool removeKey(Map& map, const std::string& key) {
    return removeIf(&map, [&key](const KeyValue& kv) { return kv.key() == key; }) > 0;
}

std::string bytesToHex(const std::string& bytes) {
    std::ostringstream oss;
    for (unsigned char c : bytes) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }
    return oss.str();
}

std::string bytesToHex(const Bytes& bytes) {
    return bytesToHex(std::string(bytes.begin(), bytes.end()));
}

std::string base64Encode(const std::string& input) {
    static const char* alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve((input.size() + 2) / 3 * 4);
    size_t i = 0;
    for (; i + 2 < input.size(); i += 3) {
        uint32_t n = (static_cast<uint8_t>(input[i]) << 16) |
                     (static_cast<uint8_t>(input[i + 1]) << 8) |
                     static_cast<uint8_t>(input[i + 2]);
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += alphabet[(n >> 6) & 0x3F];
        out += alphabet[n & 0x3F];
    }
    size_t rest = input.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint8_t>(input[i]) << 16;
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint8_t>(input[i]) << 16) |
                     (static_cast<uint8_t>(input[i + 1]) << 8);
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += alphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

bool base64Decode(const std::string& input, std::string& output) {
    auto decodeChar = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    };

    if (input.size() % 4 != 0) {
        return false;
    }
    output.clear();
    for (size_t i = 0; i < input.size(); i += 4) {
        int values[4];
        int padding = 0;
        for (int j = 0; j < 4; ++j) {
            char c = input[i + j];
            if (c == '=') {
                // Padding is only valid in the last two positions of the last group
                if (i + 4 != input.size() || j < 2) {
                    return false;
                }
                values[j] = 0;
                ++padding;
            } else {
                if (padding > 0) {
                    return false;
                }
                values[j] = decodeChar(c);
                if (values[j] < 0) {
                    return false;
                }
            }
        }
        uint32_t n = (values[0] << 18) | (values[1] << 12) | (values[2] << 6) | values[3];
        output += static_cast<char>((n >> 16) & 0xFF);
        if (padding < 2) output += static_cast<char>((n >> 8) & 0xFF);
        if (padding < 1) output += static_cast<char>(n & 0xFF);
    }
    return true;
}

std::string formatDouble(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "+Inf" : "-Inf";
    }

    // Shortest representation that reads back to the same double
    char buf[64];
    int precision = 1;
    for (; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
        if (std::strtod(buf, nullptr) == value) {
            break;
        }
    }
    std::string text(buf);
    auto e = text.find('e');
    if (e == std::string::npos) {
        return text;
    }

    // Expand exponent notation into plain decimal digits
    int exponent = std::atoi(text.c_str() + e + 1);
    int decimals = std::max(0, precision - 1 - exponent);
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    return std::string(buf);
}

std::string formatTime(Time time) {
    auto nanos = time.time_since_epoch().count();
    int64_t seconds = nanos / 1000000000;
    int64_t fraction = nanos % 1000000000;
    if (fraction < 0) {
        fraction += 1000000000;
        seconds -= 1;
    }

    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (fraction != 0) {
        std::ostringstream frac;
        frac << std::setw(9) << std::setfill('0') << fraction;
        std::string digits = frac.str();
        digits.erase(digits.find_last_not_of('0') + 1);
        oss << "." << digits;
    }
    oss << "Z";
    return oss.str();
}

namespace {

std::string formatFraction(uint64_t value, uint64_t unit, int digits) {
    std::string out = std::to_string(value / unit);
    uint64_t rest = value % unit;
    if (rest == 0) {
        return out;
    }
    std::ostringstream frac;
    frac << std::setw(digits) << std::setfill('0') << rest;
    std::string text = frac.str();
    text.erase(text.find_last_not_of('0') + 1);
    return out + "." + text;
}

void writeJsonString(std::ostringstream& oss, const std::string& s) {
    oss << '"';
    for (unsigned char c : s) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    oss << '"';
}

void writeJson(std::ostringstream& oss, const AnyValue& value);

void writeJsonMap(std::ostringstream& oss, const Map& map) {
    std::map<std::string, const AnyValue*> sorted;
    for (const auto& kv : map) {
        sorted.emplace(kv.key(), &kv.value());
    }
    oss << '{';
    bool first = true;
    for (const auto& entry : sorted) {
        if (!first) oss << ',';
        first = false;
        writeJsonString(oss, entry.first);
        oss << ':';
        writeJson(oss, *entry.second);
    }
    oss << '}';
}

void writeJsonSlice(std::ostringstream& oss, const Slice& slice) {
    oss << '[';
    for (int i = 0; i < slice.size(); ++i) {
        if (i > 0) oss << ',';
        writeJson(oss, slice.Get(i));
    }
    oss << ']';
}

void writeJsonDouble(std::ostringstream& oss, double value) {
    if (std::isnan(value) || std::isinf(value)) {
        oss << "null";
    } else {
        oss << formatDouble(value);
    }
}

void writeJson(std::ostringstream& oss, const AnyValue& value) {
    switch (value.value_case()) {
        case AnyValue::kStringValue:
            writeJsonString(oss, value.string_value());
            break;
        case AnyValue::kBoolValue:
            oss << (value.bool_value() ? "true" : "false");
            break;
        case AnyValue::kIntValue:
            oss << value.int_value();
            break;
        case AnyValue::kDoubleValue:
            writeJsonDouble(oss, value.double_value());
            break;
        case AnyValue::kBytesValue:
            writeJsonString(oss, base64Encode(value.bytes_value()));
            break;
        case AnyValue::kArrayValue:
            writeJsonSlice(oss, value.array_value().values());
            break;
        case AnyValue::kKvlistValue:
            writeJsonMap(oss, value.kvlist_value().values());
            break;
        default:
            oss << "null";
    }
}

} // namespace

std::string formatDuration(Duration duration) {
    int64_t n = duration.count();
    if (n == 0) {
        return "0s";
    }
    bool negative = n < 0;
    uint64_t u = negative ? 0 - static_cast<uint64_t>(n) : static_cast<uint64_t>(n);

    std::string out;
    if (u < 1000ULL) {
        out = std::to_string(u) + "ns";
    } else if (u < 1000000ULL) {
        out = formatFraction(u, 1000ULL, 3) + "\xC2\xB5s";
    } else if (u < 1000000000ULL) {
        out = formatFraction(u, 1000000ULL, 6) + "ms";
    } else {
        uint64_t hours = u / 3600000000000ULL;
        u %= 3600000000000ULL;
        uint64_t minutes = u / 60000000000ULL;
        u %= 60000000000ULL;
        out = formatFraction(u, 1000000000ULL, 9) + "s";
        if (hours > 0) {
            out = std::to_string(hours) + "h" + std::to_string(minutes) + "m" + out;
        } else if (minutes > 0) {
            out = std::to_string(minutes) + "m" + out;
        }
    }
    return negative ? "-" + out : out;
}

std::string toJson(const AnyValue& value) {
    std::ostringstream oss;
    writeJson(oss, value);
    return oss.str();
}

std::string toJson(const Map& map) {
    std::ostringstream oss;
    writeJsonMap(oss, map);
    return oss.str();
}

std::string toJson(const Slice& slice) {
    std::ostringstream oss;
    writeJsonSlice(oss, slice);
    return oss.str();
}

std::string toJson(const Value& value) {
    std::ostringstream oss;
    switch (value.type()) {
        case Value::Type::Nil:
            oss << "null";
            break;
        case Value::Type::String:
            writeJsonString(oss, value.getString());
            break;
        case Value::Type::Int:
            oss << value.getInt();
            break;
        case Value::Type::Double:
            writeJsonDouble(oss, value.getDouble());
            break;
        case Value::Type::Bool:
            oss << (value.getBool() ? "true" : "false");
            break;
        case Value::Type::Bytes: {
            const Bytes& bytes = value.getBytes();
            writeJsonString(oss, base64Encode(std::string(bytes.begin(), bytes.end())));
            break;
        }
        case Value::Type::Map:
            writeJsonMap(oss, *value.getMap());
            break;
        case Value::Type::Slice:
            writeJsonSlice(oss, *value.getSlice());
            break;
        case Value::Type::Time:
            writeJsonString(oss, formatTime(value.getTime()));
            break;
        case Value::Type::Duration:
            oss << value.getDuration().count();
            break;
    }
    return oss.str();
}

std::string toDisplayString(const Value& value) {
    switch (value.type()) {
        case Value::Type::Nil: return "<nil>";
        case Value::Type::String: return value.getString();
        case Value::Type::Int: return std::to_string(value.getInt());
        case Value::Type::Double: return formatDouble(value.getDouble());
        case Value::Type::Bool: return value.getBool() ? "true" : "false";
        case Value::Type::Bytes: return bytesToHex(value.getBytes());
        case Value::Type::Time: return formatTime(value.getTime());
        case Value::Type::Duration: return formatDuration(value.getDuration());
        default: return toJson(value);
    }
}

} // namespace ottl
