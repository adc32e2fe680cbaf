#ifndef OTTL_VALUE_HPP
#define OTTL_VALUE_HPP

#include "opentelemetry/proto/common/v1/common.pb.h"
#include <google/protobuf/repeated_field.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace ottl {

using AnyValue = opentelemetry::proto::common::v1::AnyValue;
using KeyValue = opentelemetry::proto::common::v1::KeyValue;
using Map = google::protobuf::RepeatedPtrField<KeyValue>;
using Slice = google::protobuf::RepeatedPtrField<AnyValue>;
using Bytes = std::vector<uint8_t>;
using Duration = std::chrono::nanoseconds;
using Time = std::chrono::time_point<std::chrono::system_clock, Duration>;

// A single value flowing through an expression.
//
// Map and Slice values either borrow a container that lives inside the
// telemetry being evaluated (editors mutate it in place) or own a detached
// copy (literals and converter results).
class Value {
public:
    enum class Type { Nil, String, Int, Double, Bool, Bytes, Map, Slice, Time, Duration };

    Value() = default;
    Value(std::nullptr_t) {}
    Value(std::string v) : data_(std::move(v)) {}
    Value(const char* v) : data_(std::string(v)) {}
    Value(int64_t v) : data_(v) {}
    Value(int v) : data_(static_cast<int64_t>(v)) {}
    Value(double v) : data_(v) {}
    Value(bool v) : data_(v) {}
    Value(Bytes v) : data_(std::move(v)) {}
    Value(Time v) : data_(v) {}
    Value(Duration v) : data_(v) {}

    static Value borrowed(Map* map);
    static Value borrowed(Slice* slice);
    static Value owned(Map map);
    static Value owned(Slice slice);

    Type type() const { return static_cast<Type>(data_.index()); }
    bool isNil() const { return type() == Type::Nil; }
    bool is(Type t) const { return type() == t; }

    const std::string& getString() const { return std::get<std::string>(data_); }
    int64_t getInt() const { return std::get<int64_t>(data_); }
    double getDouble() const { return std::get<double>(data_); }
    bool getBool() const { return std::get<bool>(data_); }
    const Bytes& getBytes() const { return std::get<Bytes>(data_); }
    Map* getMap() const { return std::get<MapRef>(data_).get(); }
    Slice* getSlice() const { return std::get<SliceRef>(data_).get(); }
    Time getTime() const { return std::get<Time>(data_); }
    Duration getDuration() const { return std::get<Duration>(data_); }

    const char* typeName() const { return typeName(type()); }
    static const char* typeName(Type type);

private:
    using MapRef = std::shared_ptr<Map>;
    using SliceRef = std::shared_ptr<Slice>;

    // Alternative order matches Type
    std::variant<std::monostate, std::string, int64_t, double, bool, Bytes,
                 MapRef, SliceRef, Time, Duration> data_;
};

// Read an AnyValue. Nested kvlist and array values are borrowed, so the
// result must not outlive `value`.
Value fromAnyValue(AnyValue* value);

// Store `value` into `target`, replacing its previous content. Maps and
// slices are deep-copied. Time and Duration cannot be represented and raise
// TypeError.
void toAnyValue(const Value& value, AnyValue* target);

// Map helpers over repeated KeyValue. Lookups return the first entry with
// the key.
AnyValue* findKey(Map& map, const std::string& key);
AnyValue* putEmpty(Map& map, const std::string& key);
bool removeKey(Map& map, const std::string& key);

// Removes the entries matching `pred` keeping the order of the others.
// Returns the number of removed entries.
template <typename T, typename Pred>
int removeIf(google::protobuf::RepeatedPtrField<T>* field, Pred pred) {
    int kept = 0;
    for (int i = 0; i < field->size(); ++i) {
        if (pred(*field->Mutable(i))) {
            continue;
        }
        if (i != kept) {
            field->SwapElements(i, kept);
        }
        ++kept;
    }
    int removed = field->size() - kept;
    if (removed > 0) {
        field->DeleteSubrange(kept, removed);
    }
    return removed;
}

// Text helpers shared by the coercions and the string converters
std::string bytesToHex(const std::string& bytes);
std::string bytesToHex(const Bytes& bytes);
std::string base64Encode(const std::string& input);
// Returns false on malformed input
bool base64Decode(const std::string& input, std::string& output);
std::string formatDouble(double value);
std::string formatTime(Time time);
std::string formatDuration(Duration duration);

// JSON rendering with sorted keys
std::string toJson(const Value& value);
std::string toJson(const AnyValue& value);
std::string toJson(const Map& map);
std::string toJson(const Slice& slice);

// Human-readable rendering used in error messages and by Concat
std::string toDisplayString(const Value& value);

} // namespace ottl

#endif // OTTL_VALUE_HPP
