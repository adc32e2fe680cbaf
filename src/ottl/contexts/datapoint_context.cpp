#include "datapoint_context.hpp"
#include <type_traits>

namespace ottl {

namespace {

using NumberDataPoint = DataPointContext::NumberDataPoint;
using HistogramDataPoint = DataPointContext::HistogramDataPoint;
using ExponentialHistogramDataPoint = DataPointContext::ExponentialHistogramDataPoint;
using SummaryDataPoint = DataPointContext::SummaryDataPoint;
using Buckets = ExponentialHistogramDataPoint::Buckets;

template <typename T, typename P>
constexpr bool isPoint() {
    return std::is_same<std::remove_pointer_t<std::decay_t<P>>, T>::value;
}

// Field present on every data point kind
template <typename Get, typename Set>
GetSetterPtr<DataPointContext> commonField(Get get, Set set) {
    return makeGetSetter<DataPointContext>(
        [get](const ExecContext&, DataPointContext& tctx) {
            return std::visit([&get](auto* point) { return get(*point); }, tctx.dataPoint());
        },
        [set](const ExecContext&, DataPointContext& tctx, const Value& v) {
            std::visit([&set, &v](auto* point) { set(*point, v); }, tctx.dataPoint());
        });
}

// Field of a single data point kind T. Other kinds read nil and ignore writes.
template <typename T, typename Get, typename Set>
GetSetterPtr<DataPointContext> pointField(Get get, Set set) {
    return makeGetSetter<DataPointContext>(
        [get](const ExecContext&, DataPointContext& tctx) {
            T* const* point = std::get_if<T*>(&tctx.dataPoint());
            return point ? get(**point) : Value();
        },
        [set](const ExecContext&, DataPointContext& tctx, const Value& v) {
            T* const* point = std::get_if<T*>(&tctx.dataPoint());
            if (point) {
                set(**point, v);
            }
        });
}

template <typename Field>
Value intList(const Field& field) {
    Slice slice;
    for (auto item : field) {
        slice.Add()->set_int_value(static_cast<int64_t>(item));
    }
    return Value::owned(std::move(slice));
}

template <typename Field>
Value doubleList(const Field& field) {
    Slice slice;
    for (double item : field) {
        slice.Add()->set_double_value(item);
    }
    return Value::owned(std::move(slice));
}

template <typename Field>
void setIntList(Field* field, const Value& v, const std::string& name) {
    if (v.isNil()) {
        field->Clear();
        return;
    }
    const Slice& items = *expectSlice(v).getSlice();
    Field result;
    for (const auto& item : items) {
        if (item.value_case() != AnyValue::kIntValue) {
            throw TypeError("field " + name + " expects a list of int64");
        }
        result.Add(static_cast<typename Field::value_type>(item.int_value()));
    }
    field->Swap(&result);
}

void setDoubleList(google::protobuf::RepeatedField<double>* field, const Value& v, const std::string& name) {
    if (v.isNil()) {
        field->Clear();
        return;
    }
    const Slice& items = *expectSlice(v).getSlice();
    google::protobuf::RepeatedField<double> result;
    for (const auto& item : items) {
        if (item.value_case() == AnyValue::kDoubleValue) {
            result.Add(item.double_value());
        } else if (item.value_case() == AnyValue::kIntValue) {
            result.Add(static_cast<double>(item.int_value()));
        } else {
            throw TypeError("field " + name + " expects a list of float64");
        }
    }
    field->Swap(&result);
}

// Quantiles as a list of {"quantile": q, "value": v} maps
Value quantileList(const SummaryDataPoint& point) {
    Slice slice;
    for (const auto& q : point.quantile_values()) {
        Map* entry = slice.Add()->mutable_kvlist_value()->mutable_values();
        KeyValue* quantile = entry->Add();
        quantile->set_key("quantile");
        quantile->mutable_value()->set_double_value(q.quantile());
        KeyValue* value = entry->Add();
        value->set_key("value");
        value->mutable_value()->set_double_value(q.value());
    }
    return Value::owned(std::move(slice));
}

double quantileField(Map& entry, const std::string& key) {
    AnyValue* value = findKey(entry, key);
    if (!value) {
        throw TypeError("quantile_values entries need a \"" + key + "\" key");
    }
    Value v = fromAnyValue(value);
    return contexts::doubleForField(v, "quantile_values." + key);
}

void setQuantileList(SummaryDataPoint& point, const Value& v) {
    google::protobuf::RepeatedPtrField<SummaryDataPoint::ValueAtQuantile> result;
    if (!v.isNil()) {
        Slice items(*expectSlice(v).getSlice());
        for (auto& item : items) {
            if (item.value_case() != AnyValue::kKvlistValue) {
                throw TypeError("field quantile_values expects a list of maps");
            }
            Map* entry = item.mutable_kvlist_value()->mutable_values();
            SummaryDataPoint::ValueAtQuantile* q = result.Add();
            q->set_quantile(quantileField(*entry, "quantile"));
            q->set_value(quantileField(*entry, "value"));
        }
    }
    point.mutable_quantile_values()->Swap(&result);
}

GetSetterPtr<DataPointContext> bucketsPath(const Path<DataPointContext>& path) {
    requireNoKeys(path);
    const Path<DataPointContext>* next = path.next();
    if (!next) {
        throw ConfigError("path \"" + path.text() + "\" must name a field of " + path.name());
    }
    requireLeaf(*next);
    bool positive = path.name() == "positive";
    auto buckets = [positive](ExponentialHistogramDataPoint& point) {
        return positive ? point.mutable_positive() : point.mutable_negative();
    };
    std::string field = path.name() + "." + next->name();
    if (next->name() == "offset") {
        return pointField<ExponentialHistogramDataPoint>(
            [buckets](ExponentialHistogramDataPoint& point) {
                return Value(static_cast<int64_t>(buckets(point)->offset()));
            },
            [buckets, field](ExponentialHistogramDataPoint& point, const Value& v) {
                buckets(point)->set_offset(static_cast<int32_t>(contexts::intForField(v, field)));
            });
    }
    if (next->name() == "bucket_counts") {
        return pointField<ExponentialHistogramDataPoint>(
            [buckets](ExponentialHistogramDataPoint& point) { return intList(buckets(point)->bucket_counts()); },
            [buckets, field](ExponentialHistogramDataPoint& point, const Value& v) {
                setIntList(buckets(point)->mutable_bucket_counts(), v, field);
            });
    }
    throw unknownPathError(next->name(), path.text(), path.name(), {"offset", "bucket_counts"});
}

const std::vector<std::string>& validDataPointPaths() {
    static const std::vector<std::string> valid = {
        "cache", "resource", "instrumentation_scope", "metric", "attributes", "start_time_unix_nano",
        "time_unix_nano", "start_time", "time", "value_double", "value_int", "flags", "count", "sum",
        "bucket_counts", "explicit_bounds", "scale", "zero_count", "positive", "negative", "quantile_values"};
    return valid;
}

} // namespace

GetSetterPtr<DataPointContext> DataPointContext::parsePath(const Path<DataPointContext>& path) {
    using contexts::intForField;
    const std::string& name = path.name();

    if (name == "cache") {
        return contexts::cachePathGetSetter(path);
    }
    if (auto parent = contexts::parentPathGetSetter(path)) {
        return parent;
    }
    if (name == "metric") {
        requireNoKeys(path);
        if (!path.next()) {
            throw ConfigError("path \"" + path.text() + "\" must name a field of metric");
        }
        return contexts::metricPathGetSetter(*path.next());
    }
    if (name == "attributes") {
        requireLast(path);
        return contexts::mapAccessor<DataPointContext>(
            "attributes",
            [](DataPointContext& tctx) {
                return std::visit([](auto* point) { return point->mutable_attributes(); }, tctx.dataPoint());
            },
            path.keys());
    }
    if (name == "positive" || name == "negative") {
        return bucketsPath(path);
    }

    requireLeaf(path);
    if (name == "start_time_unix_nano") {
        return commonField(
            [](auto& point) { return Value(static_cast<int64_t>(point.start_time_unix_nano())); },
            [](auto& point, const Value& v) {
                point.set_start_time_unix_nano(static_cast<uint64_t>(intForField(v, "start_time_unix_nano")));
            });
    }
    if (name == "time_unix_nano") {
        return commonField(
            [](auto& point) { return Value(static_cast<int64_t>(point.time_unix_nano())); },
            [](auto& point, const Value& v) {
                point.set_time_unix_nano(static_cast<uint64_t>(intForField(v, "time_unix_nano")));
            });
    }
    if (name == "start_time") {
        return commonField(
            [](auto& point) { return Value(contexts::timeFromNanos(point.start_time_unix_nano())); },
            [](auto& point, const Value& v) {
                point.set_start_time_unix_nano(contexts::nanosForField(v, "start_time"));
            });
    }
    if (name == "time") {
        return commonField(
            [](auto& point) { return Value(contexts::timeFromNanos(point.time_unix_nano())); },
            [](auto& point, const Value& v) { point.set_time_unix_nano(contexts::nanosForField(v, "time")); });
    }
    if (name == "flags") {
        return commonField(
            [](auto& point) { return Value(static_cast<int64_t>(point.flags())); },
            [](auto& point, const Value& v) { point.set_flags(static_cast<uint32_t>(intForField(v, "flags"))); });
    }
    if (name == "value_double") {
        return pointField<NumberDataPoint>(
            [](NumberDataPoint& point) { return Value(point.as_double()); },
            [](NumberDataPoint& point, const Value& v) {
                point.set_as_double(contexts::doubleForField(v, "value_double"));
            });
    }
    if (name == "value_int") {
        return pointField<NumberDataPoint>(
            [](NumberDataPoint& point) { return Value(static_cast<int64_t>(point.as_int())); },
            [](NumberDataPoint& point, const Value& v) { point.set_as_int(intForField(v, "value_int")); });
    }
    if (name == "count") {
        return makeGetSetter<DataPointContext>(
            [](const ExecContext&, DataPointContext& tctx) {
                return std::visit(
                    [](auto* point) {
                        if constexpr (isPoint<NumberDataPoint, decltype(point)>()) {
                            return Value();
                        } else {
                            return Value(static_cast<int64_t>(point->count()));
                        }
                    },
                    tctx.dataPoint());
            },
            [](const ExecContext&, DataPointContext& tctx, const Value& v) {
                uint64_t count = static_cast<uint64_t>(intForField(v, "count"));
                std::visit(
                    [count](auto* point) {
                        if constexpr (!isPoint<NumberDataPoint, decltype(point)>()) {
                            point->set_count(count);
                        }
                    },
                    tctx.dataPoint());
            });
    }
    if (name == "sum") {
        return makeGetSetter<DataPointContext>(
            [](const ExecContext&, DataPointContext& tctx) {
                return std::visit(
                    [](auto* point) {
                        if constexpr (isPoint<NumberDataPoint, decltype(point)>()) {
                            return Value();
                        } else {
                            return Value(point->sum());
                        }
                    },
                    tctx.dataPoint());
            },
            [](const ExecContext&, DataPointContext& tctx, const Value& v) {
                double sum = contexts::doubleForField(v, "sum");
                std::visit(
                    [sum](auto* point) {
                        if constexpr (!isPoint<NumberDataPoint, decltype(point)>()) {
                            point->set_sum(sum);
                        }
                    },
                    tctx.dataPoint());
            });
    }
    if (name == "bucket_counts") {
        return pointField<HistogramDataPoint>(
            [](HistogramDataPoint& point) { return intList(point.bucket_counts()); },
            [](HistogramDataPoint& point, const Value& v) {
                setIntList(point.mutable_bucket_counts(), v, "bucket_counts");
            });
    }
    if (name == "explicit_bounds") {
        return pointField<HistogramDataPoint>(
            [](HistogramDataPoint& point) { return doubleList(point.explicit_bounds()); },
            [](HistogramDataPoint& point, const Value& v) {
                setDoubleList(point.mutable_explicit_bounds(), v, "explicit_bounds");
            });
    }
    if (name == "scale") {
        return pointField<ExponentialHistogramDataPoint>(
            [](ExponentialHistogramDataPoint& point) { return Value(static_cast<int64_t>(point.scale())); },
            [](ExponentialHistogramDataPoint& point, const Value& v) {
                point.set_scale(static_cast<int32_t>(intForField(v, "scale")));
            });
    }
    if (name == "zero_count") {
        return pointField<ExponentialHistogramDataPoint>(
            [](ExponentialHistogramDataPoint& point) { return Value(static_cast<int64_t>(point.zero_count())); },
            [](ExponentialHistogramDataPoint& point, const Value& v) {
                point.set_zero_count(static_cast<uint64_t>(intForField(v, "zero_count")));
            });
    }
    if (name == "quantile_values") {
        return pointField<SummaryDataPoint>([](SummaryDataPoint& point) { return quantileList(point); },
                                            [](SummaryDataPoint& point, const Value& v) {
                                                setQuantileList(point, v);
                                            });
    }
    throw unknownPathError(name, path.text(), kName, validDataPointPaths());
}

std::optional<int64_t> DataPointContext::parseEnum(const std::string& symbol) {
    if (symbol == "FLAG_NONE") {
        return 0;
    }
    if (symbol == "FLAG_NO_RECORDED_VALUE") {
        return 1;
    }
    return contexts::parseMetricEnum(symbol);
}

Parser<DataPointContext> DataPointContext::newParser(FactoryMap<DataPointContext> functions) {
    return Parser<DataPointContext>(std::move(functions), &DataPointContext::parsePath,
                                    &DataPointContext::parseEnum, kName);
}

} // namespace ottl
