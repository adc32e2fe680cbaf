#include "converters.hpp"
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace ottl {
namespace funcs {

namespace {

const char* const kMonths[] = {"January", "February", "March", "April", "May", "June", "July",
                               "August", "September", "October", "November", "December"};
const char* const kWeekdays[] = {"Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"};

const std::string kTimeDirectives = "YymbhBdeaAHIpMSfLzZj%";

// Days since 1970-01-01 of a proleptic Gregorian date
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool isLeapYear(int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned daysInMonth(int64_t y, unsigned m) {
    static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return m == 2 && isLeapYear(y) ? 29 : days[m - 1];
}

class TimeScanner {
public:
    TimeScanner(const std::string& text, const std::string& format) : text_(text), format_(format) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw EvalError("cannot parse \"" + text_ + "\" with format \"" + format_ + "\": " + what);
    }

    int64_t number(size_t min_digits, size_t max_digits, const char* what) {
        size_t start = pos_;
        while (pos_ < text_.size() && pos_ - start < max_digits &&
               std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
        if (pos_ - start < min_digits) {
            fail(std::string("expected ") + what);
        }
        return std::stoll(text_.substr(start, pos_ - start));
    }

    // Fraction digits as nanoseconds
    int64_t fraction(size_t max_digits) {
        size_t start = pos_;
        int64_t nanos = 0;
        while (pos_ < text_.size() && pos_ - start < max_digits &&
               std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            nanos = nanos * 10 + (text_[pos_] - '0');
            ++pos_;
        }
        if (pos_ == start) {
            fail("expected fractional seconds");
        }
        for (size_t i = pos_ - start; i < 9; ++i) {
            nanos *= 10;
        }
        return nanos;
    }

    // Index of the matching name, accepting full names and 3-letter prefixes
    int name(const char* const* names, size_t count, const char* what) {
        for (size_t i = 0; i < count; ++i) {
            std::string full = names[i];
            for (const std::string& candidate : {full, full.substr(0, 3)}) {
                if (text_.size() - pos_ >= candidate.size() &&
                    std::equal(candidate.begin(), candidate.end(), text_.begin() + static_cast<long>(pos_),
                               [](char a, char b) {
                                   return std::tolower(static_cast<unsigned char>(a)) ==
                                          std::tolower(static_cast<unsigned char>(b));
                               })) {
                    pos_ += candidate.size();
                    return static_cast<int>(i);
                }
            }
        }
        fail(std::string("expected ") + what);
    }

    void literal(char c) {
        if (pos_ >= text_.size() || text_[pos_] != c) {
            fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    // Offset east of UTC in seconds
    int64_t zoneOffset() {
        if (pos_ < text_.size() && (text_[pos_] == 'Z' || text_[pos_] == 'z')) {
            ++pos_;
            return 0;
        }
        if (pos_ >= text_.size() || (text_[pos_] != '+' && text_[pos_] != '-')) {
            fail("expected time zone offset");
        }
        int sign = text_[pos_++] == '-' ? -1 : 1;
        int64_t hours = number(2, 2, "zone hours");
        if (pos_ < text_.size() && text_[pos_] == ':') {
            ++pos_;
        }
        int64_t minutes = number(2, 2, "zone minutes");
        return sign * (hours * 3600 + minutes * 60);
    }

    void zoneName() {
        size_t start = pos_;
        while (pos_ < text_.size() && std::isalpha(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
        std::string zone = text_.substr(start, pos_ - start);
        if (zone != "UTC" && zone != "GMT" && zone != "Z") {
            fail("unsupported time zone \"" + zone + "\"");
        }
    }

    void skipSpaces() {
        while (pos_ < text_.size() && text_[pos_] == ' ') {
            ++pos_;
        }
    }

    bool done() const { return pos_ == text_.size(); }

private:
    const std::string& text_;
    const std::string& format_;
    size_t pos_ = 0;
};

// Scalar form of a list element used by mixed-kind sorting
std::string sortKey(const AnyValue& value) {
    AnyValue copy(value);
    std::optional<std::string> text = toStringLike(fromAnyValue(&copy));
    return text.value_or(std::string());
}

double numericValue(const AnyValue& value) {
    return value.value_case() == AnyValue::kIntValue ? static_cast<double>(value.int_value()) : value.double_value();
}

void fromProtobufValue(const google::protobuf::Value& in, AnyValue* out) {
    switch (in.kind_case()) {
        case google::protobuf::Value::kNumberValue:
            out->set_double_value(in.number_value());
            break;
        case google::protobuf::Value::kStringValue:
            out->set_string_value(in.string_value());
            break;
        case google::protobuf::Value::kBoolValue:
            out->set_bool_value(in.bool_value());
            break;
        case google::protobuf::Value::kStructValue: {
            Map* map = out->mutable_kvlist_value()->mutable_values();
            std::vector<std::string> keys;
            for (const auto& field : in.struct_value().fields()) {
                keys.push_back(field.first);
            }
            std::sort(keys.begin(), keys.end());
            for (const auto& key : keys) {
                KeyValue* kv = map->Add();
                kv->set_key(key);
                fromProtobufValue(in.struct_value().fields().at(key), kv->mutable_value());
            }
            break;
        }
        case google::protobuf::Value::kListValue: {
            Slice* slice = out->mutable_array_value()->mutable_values();
            for (const auto& item : in.list_value().values()) {
                fromProtobufValue(item, slice->Add());
            }
            break;
        }
        default:
            out->Clear();
    }
}

} // namespace

int64_t fnvHash(const std::string& text) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return static_cast<int64_t>(hash);
}

Duration parseDuration(const std::string& text) {
    auto invalid = [&text]() { return EvalError("invalid duration \"" + text + "\""); };
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }
    if (text.substr(pos) == "0") {
        return Duration(0);
    }
    if (pos == text.size()) {
        throw invalid();
    }
    long double total = 0;
    while (pos < text.size()) {
        size_t start = pos;
        long double whole = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            whole = whole * 10 + (text[pos] - '0');
            ++pos;
        }
        bool has_whole = pos > start;
        long double frac = 0;
        bool has_frac = false;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            long double scale = 0.1L;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                frac += (text[pos] - '0') * scale;
                scale /= 10;
                has_frac = true;
                ++pos;
            }
        }
        if (!has_whole && !has_frac) {
            throw invalid();
        }
        size_t unit_start = pos;
        while (pos < text.size() && text[pos] != '.' && !std::isdigit(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        std::string unit = text.substr(unit_start, pos - unit_start);
        long double nanos;
        if (unit == "ns") {
            nanos = 1;
        } else if (unit == "us" || unit == "\xC2\xB5s" || unit == "\xCE\xBCs") {
            nanos = 1e3L;
        } else if (unit == "ms") {
            nanos = 1e6L;
        } else if (unit == "s") {
            nanos = 1e9L;
        } else if (unit == "m") {
            nanos = 60e9L;
        } else if (unit == "h") {
            nanos = 3600e9L;
        } else {
            throw unit.empty() ? EvalError("missing unit in duration \"" + text + "\"")
                               : EvalError("unknown unit \"" + unit + "\" in duration \"" + text + "\"");
        }
        total += (whole + frac) * nanos;
        if (total > static_cast<long double>(std::numeric_limits<int64_t>::max())) {
            throw invalid();
        }
    }
    int64_t count = static_cast<int64_t>(std::llround(total));
    return Duration(negative ? -count : count);
}

void validateTimeFormat(const std::string& format) {
    if (format.empty()) {
        throw ConfigError("format cannot be empty");
    }
    for (size_t i = 0; i < format.size(); ++i) {
        if (format[i] != '%') {
            continue;
        }
        if (i + 1 >= format.size() || kTimeDirectives.find(format[i + 1]) == std::string::npos) {
            throw ConfigError("unsupported directive in time format \"" + format + "\"");
        }
        ++i;
    }
}

Time parseTime(const std::string& text, const std::string& format) {
    TimeScanner scan(text, format);
    int64_t year = 1970;
    unsigned month = 1;
    unsigned day = 1;
    int64_t day_of_year = 0;
    int64_t hour = 0;
    int64_t minute = 0;
    int64_t second = 0;
    int64_t nanos = 0;
    int64_t offset = 0;
    bool pm = false;
    bool twelve_hour = false;

    for (size_t i = 0; i < format.size(); ++i) {
        char c = format[i];
        if (c != '%') {
            scan.literal(c);
            continue;
        }
        char directive = format[++i];
        switch (directive) {
            case 'Y': year = scan.number(4, 4, "year"); break;
            case 'y': {
                int64_t yy = scan.number(2, 2, "year");
                year = yy >= 69 ? 1900 + yy : 2000 + yy;
                break;
            }
            case 'm': month = static_cast<unsigned>(scan.number(1, 2, "month")); break;
            case 'b':
            case 'h':
            case 'B': month = static_cast<unsigned>(scan.name(kMonths, 12, "month name") + 1); break;
            case 'd': day = static_cast<unsigned>(scan.number(1, 2, "day")); break;
            case 'e':
                scan.skipSpaces();
                day = static_cast<unsigned>(scan.number(1, 2, "day"));
                break;
            case 'a':
            case 'A': scan.name(kWeekdays, 7, "weekday name"); break;
            case 'H': hour = scan.number(1, 2, "hour"); break;
            case 'I':
                hour = scan.number(1, 2, "hour");
                twelve_hour = true;
                break;
            case 'p': {
                static const char* const kPeriods[] = {"AM", "PM"};
                pm = scan.name(kPeriods, 2, "AM or PM") == 1;
                break;
            }
            case 'M': minute = scan.number(1, 2, "minute"); break;
            case 'S': second = scan.number(1, 2, "second"); break;
            case 'f': nanos = scan.fraction(9); break;
            case 'L': nanos = scan.fraction(3); break;
            case 'z': offset = scan.zoneOffset(); break;
            case 'Z': scan.zoneName(); break;
            case 'j': day_of_year = scan.number(3, 3, "day of year"); break;
            case '%': scan.literal('%'); break;
            default: scan.fail("unsupported directive");
        }
    }
    if (!scan.done()) {
        scan.fail("extra text");
    }
    if (twelve_hour) {
        if (hour < 1 || hour > 12) {
            scan.fail("hour out of range");
        }
        hour = hour % 12 + (pm ? 12 : 0);
    }
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month) || hour > 23 || minute > 59 ||
        second > 59) {
        scan.fail("value out of range");
    }
    int64_t days = daysFromCivil(year, month, day);
    if (day_of_year > 0) {
        if (day_of_year > (isLeapYear(year) ? 366 : 365)) {
            scan.fail("day of year out of range");
        }
        days = daysFromCivil(year, 1, 1) + day_of_year - 1;
    }
    int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset;
    return Time(Duration(seconds * 1000000000LL + nanos));
}

Slice sortSlice(const Slice& slice, bool descending) {
    std::vector<const AnyValue*> items;
    bool numeric = true;
    bool strings = true;
    bool bools = true;
    for (const auto& item : slice) {
        items.push_back(&item);
        AnyValue::ValueCase kind = item.value_case();
        numeric = numeric && (kind == AnyValue::kIntValue || kind == AnyValue::kDoubleValue);
        strings = strings && kind == AnyValue::kStringValue;
        bools = bools && kind == AnyValue::kBoolValue;
    }

    auto ordered = [descending](auto less) {
        return [descending, less](const AnyValue* a, const AnyValue* b) {
            return descending ? less(*b, *a) : less(*a, *b);
        };
    };
    if (numeric) {
        std::stable_sort(items.begin(), items.end(), ordered([](const AnyValue& a, const AnyValue& b) {
            return numericValue(a) < numericValue(b);
        }));
    } else if (strings) {
        std::stable_sort(items.begin(), items.end(), ordered([](const AnyValue& a, const AnyValue& b) {
            return a.string_value() < b.string_value();
        }));
    } else if (bools) {
        std::stable_sort(items.begin(), items.end(), ordered([](const AnyValue& a, const AnyValue& b) {
            return !a.bool_value() && b.bool_value();
        }));
    } else {
        std::vector<std::pair<std::string, const AnyValue*>> keyed;
        for (const AnyValue* item : items) {
            keyed.emplace_back(sortKey(*item), item);
        }
        std::stable_sort(keyed.begin(), keyed.end(), [descending](const auto& a, const auto& b) {
            return descending ? b.first < a.first : a.first < b.first;
        });
        for (size_t i = 0; i < keyed.size(); ++i) {
            items[i] = keyed[i].second;
        }
    }

    Slice result;
    for (const AnyValue* item : items) {
        result.Add()->CopyFrom(*item);
    }
    return result;
}

Slice splitString(const std::string& text, const std::string& delimiter) {
    Slice result;
    if (delimiter.empty()) {
        // One element per UTF-8 sequence
        for (size_t i = 0; i < text.size();) {
            size_t len = 1;
            while (i + len < text.size() && (static_cast<unsigned char>(text[i + len]) & 0xC0) == 0x80) {
                ++len;
            }
            result.Add()->set_string_value(text.substr(i, len));
            i += len;
        }
        return result;
    }
    size_t start = 0;
    while (true) {
        size_t found = text.find(delimiter, start);
        if (found == std::string::npos) {
            result.Add()->set_string_value(text.substr(start));
            break;
        }
        result.Add()->set_string_value(text.substr(start, found - start));
        start = found + delimiter.size();
    }
    return result;
}

Value parseJson(const std::string& text) {
    google::protobuf::Value parsed;
    auto status = google::protobuf::util::JsonStringToMessage(text, &parsed);
    if (!status.ok()) {
        throw EvalError("could not parse JSON: " + status.ToString());
    }
    AnyValue value;
    fromProtobufValue(parsed, &value);
    if (value.value_case() == AnyValue::kKvlistValue) {
        Map map;
        map.Swap(value.mutable_kvlist_value()->mutable_values());
        return Value::owned(std::move(map));
    }
    if (value.value_case() == AnyValue::kArrayValue) {
        Slice slice;
        slice.Swap(value.mutable_array_value()->mutable_values());
        return Value::owned(std::move(slice));
    }
    throw EvalError("could not convert parsed value to a JSON object or array: " + text);
}

int64_t lengthOf(const Value& value) {
    switch (value.type()) {
        case Value::Type::String:
            return static_cast<int64_t>(value.getString().size());
        case Value::Type::Bytes:
            return static_cast<int64_t>(value.getBytes().size());
        case Value::Type::Map:
            return value.getMap()->size();
        case Value::Type::Slice:
            return value.getSlice()->size();
        default:
            throw TypeError(std::string("Len of unsupported type ") + value.typeName());
    }
}

std::string toLowerCase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string toUpperCase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

} // namespace funcs
} // namespace ottl
