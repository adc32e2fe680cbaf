#include <gtest/gtest.h>
#include "ottl/contexts/datapoint_context.hpp"
#include "ottl/contexts/log_context.hpp"
#include "ottl/contexts/metric_context.hpp"
#include "ottl/contexts/resource_context.hpp"
#include "ottl/contexts/scope_context.hpp"
#include "ottl/contexts/span_context.hpp"
#include "ottl/contexts/spanevent_context.hpp"
#include "ottl/errors.hpp"
#include "ottl/funcs/catalog.hpp"

using namespace ottl;

namespace {

template <typename K>
bool check(const std::string& condition, K& tctx) {
    ExecContext ctx;
    return K::newParser(funcs::standardConverters<K>()).parseCondition(condition).eval(ctx, tctx);
}

template <typename K>
void apply(const std::string& statement, K& tctx) {
    ExecContext ctx;
    K::newParser(funcs::standardFunctions<K>()).parseStatement(statement).execute(ctx, tctx);
}

template <typename K>
Value eval(const std::string& expression, K& tctx) {
    ExecContext ctx;
    return K::newParser(funcs::standardConverters<K>()).parseValueExpression(expression)->get(ctx, tctx);
}

template <typename K>
void expectRejected(const std::string& text) {
    EXPECT_THROW(K::newParser(funcs::standardFunctions<K>()).parseStatement(text), ConfigError) << text;
}

void addAttribute(Map* attrs, const std::string& key, const std::string& value) {
    KeyValue* kv = attrs->Add();
    kv->set_key(key);
    kv->mutable_value()->set_string_value(value);
}

std::string rawId(size_t width) {
    std::string id;
    for (size_t i = 1; i <= width; ++i) {
        id.push_back(static_cast<char>(i));
    }
    return id;
}

// Shared resource and scope for every signal
class ContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        addAttribute(resource.mutable_attributes(), "service.name", "checkout");
        scope.set_name("io.opentelemetry.lib");
        scope.set_version("1.2.0");
        addAttribute(scope.mutable_attributes(), "scope.attr", "on");
        resource_schema_url = "https://opentelemetry.io/schemas/1.21.0";
    }

    contexts::Resource resource;
    contexts::InstrumentationScope scope;
    std::string resource_schema_url;
    std::string scope_schema_url;
};

} // namespace

// Resource and scope contexts
TEST_F(ContextTest, ResourceContextPaths) {
    ResourceContext tctx(&resource, &resource_schema_url);
    EXPECT_TRUE(check(R"(attributes["service.name"] == "checkout")", tctx));
    EXPECT_TRUE(check(R"(resource.attributes["service.name"] == "checkout")", tctx));
    EXPECT_TRUE(check("dropped_attributes_count == 0", tctx));
    EXPECT_TRUE(check(R"(schema_url == "https://opentelemetry.io/schemas/1.21.0")", tctx));

    apply(R"(set(attributes["env"], "prod"))", tctx);
    ASSERT_NE(findKey(*resource.mutable_attributes(), "env"), nullptr);

    apply(R"(set(schema_url, "https://example.com/s"))", tctx);
    EXPECT_EQ(resource_schema_url, "https://example.com/s");

    expectRejected<ResourceContext>(R"(set(name, "x"))");
}

TEST_F(ContextTest, ScopeContextPaths) {
    ScopeContext tctx(&scope, &scope_schema_url, &resource, &resource_schema_url);
    EXPECT_TRUE(check(R"(name == "io.opentelemetry.lib")", tctx));
    EXPECT_TRUE(check(R"(scope.version == "1.2.0")", tctx));
    EXPECT_TRUE(check(R"(instrumentation_scope.attributes["scope.attr"] == "on")", tctx));
    EXPECT_TRUE(check(R"(resource.attributes["service.name"] == "checkout")", tctx));

    apply(R"(set(version, "2.0.0"))", tctx);
    EXPECT_EQ(scope.version(), "2.0.0");

    expectRejected<ScopeContext>(R"(set(body, "x"))");
}

// Log context
class LogContextTest : public ContextTest {
protected:
    void SetUp() override {
        ContextTest::SetUp();
        record.mutable_body()->set_string_value("user logged in");
        record.set_severity_number(opentelemetry::proto::logs::v1::SEVERITY_NUMBER_INFO);
        record.set_severity_text("INFO");
        record.set_time_unix_nano(1700000000000000000ULL);
        record.set_trace_id(rawId(16));
        addAttribute(record.mutable_attributes(), "http.method", "GET");
    }

    LogContext makeContext() {
        return LogContext(&record, &scope, &scope_schema_url, &resource, &resource_schema_url);
    }

    LogContext::LogRecord record;
};

TEST_F(LogContextTest, ReadsRecordFields) {
    LogContext tctx = makeContext();
    EXPECT_TRUE(check(R"(body == "user logged in")", tctx));
    EXPECT_TRUE(check(R"(log.body == "user logged in")", tctx));
    EXPECT_TRUE(check(R"(severity_text == "INFO")", tctx));
    EXPECT_TRUE(check("severity_number == SEVERITY_NUMBER_INFO", tctx));
    EXPECT_TRUE(check("severity_number < SEVERITY_NUMBER_WARN", tctx));
    EXPECT_TRUE(check(R"(attributes["http.method"] == "GET")", tctx));
    EXPECT_TRUE(check(R"(attributes["missing"] == nil)", tctx));
    EXPECT_TRUE(check("time_unix_nano == 1700000000000000000", tctx));
    EXPECT_TRUE(check("UnixSeconds(time) == 1700000000", tctx));
}

TEST_F(LogContextTest, ReadsParentFields) {
    LogContext tctx = makeContext();
    EXPECT_TRUE(check(R"(resource.attributes["service.name"] == "checkout")", tctx));
    EXPECT_TRUE(check(R"(instrumentation_scope.name == "io.opentelemetry.lib")", tctx));
    EXPECT_TRUE(check(R"(scope.version == "1.2.0")", tctx));
    EXPECT_TRUE(check(R"(resource.schema_url == "https://opentelemetry.io/schemas/1.21.0")", tctx));
}

TEST_F(LogContextTest, AbsentSeverityReadsZero) {
    record.clear_severity_number();
    LogContext tctx = makeContext();
    EXPECT_TRUE(check("severity_number == 0", tctx));
    EXPECT_TRUE(check("severity_number == SEVERITY_NUMBER_UNSPECIFIED", tctx));
}

TEST_F(LogContextTest, TraceIdAsHexString) {
    LogContext tctx = makeContext();
    EXPECT_TRUE(check(R"(trace_id.string == "0102030405060708090a0b0c0d0e0f10")", tctx));
    EXPECT_TRUE(check(R"(span_id.string == "")", tctx));

    apply(R"(set(span_id.string, "a1a2a3a4a5a6a7a8"))", tctx);
    EXPECT_EQ(record.span_id(), std::string("\xa1\xa2\xa3\xa4\xa5\xa6\xa7\xa8"));

    ExecContext ctx;
    auto bad = LogContext::newParser(funcs::standardFunctions<LogContext>())
                   .parseStatement(R"(set(span_id.string, "abc"))");
    EXPECT_THROW(bad.execute(ctx, tctx), EvalError);
}

TEST_F(LogContextTest, WritesRecordFields) {
    LogContext tctx = makeContext();
    apply(R"(set(severity_text, "WARN"))", tctx);
    apply("set(severity_number, SEVERITY_NUMBER_WARN)", tctx);
    apply(R"(set(attributes["http.status_code"], 200))", tctx);
    apply(R"(set(resource.attributes["env"], "prod"))", tctx);
    apply(R"(set(instrumentation_scope.name, "renamed"))", tctx);

    EXPECT_EQ(record.severity_text(), "WARN");
    EXPECT_EQ(record.severity_number(), opentelemetry::proto::logs::v1::SEVERITY_NUMBER_WARN);
    ASSERT_NE(findKey(*record.mutable_attributes(), "http.status_code"), nullptr);
    EXPECT_EQ(findKey(*record.mutable_attributes(), "http.status_code")->int_value(), 200);
    ASSERT_NE(findKey(*resource.mutable_attributes(), "env"), nullptr);
    EXPECT_EQ(scope.name(), "renamed");
}

TEST_F(LogContextTest, StructuredBody) {
    LogContext tctx = makeContext();
    apply(R"(set(body, {"user": {"id": 7}, "tags": ["a", "b"]}))", tctx);
    EXPECT_TRUE(check(R"(body["user"]["id"] == 7)", tctx));
    EXPECT_TRUE(check(R"(body["tags"][1] == "b")", tctx));
    EXPECT_TRUE(check(R"(IsMap(body))", tctx));

    apply(R"(set(body["user"]["name"], "ann"))", tctx);
    EXPECT_TRUE(check(R"(body["user"]["name"] == "ann")", tctx));

    // Indexing the string body is a type error
    record.mutable_body()->set_string_value("text");
    EXPECT_THROW(eval(R"(body["user"])", tctx), TypeError);
    EXPECT_EQ(eval("body.string", tctx).getString(), "text");
}

TEST_F(LogContextTest, CacheIsPerContext) {
    LogContext tctx = makeContext();
    apply(R"(set(cache["seen"], true))", tctx);
    EXPECT_TRUE(check(R"(cache["seen"] == true)", tctx));

    LogContext other = makeContext();
    EXPECT_TRUE(check(R"(cache["seen"] == nil)", other));
}

TEST_F(LogContextTest, TimeFieldsAcceptTimesOnly) {
    LogContext tctx = makeContext();
    apply("set(time, Unix(1))", tctx);
    EXPECT_EQ(record.time_unix_nano(), 1000000000ULL);

    ExecContext ctx;
    auto bad = LogContext::newParser(funcs::standardFunctions<LogContext>()).parseStatement("set(time, 5)");
    EXPECT_THROW(bad.execute(ctx, tctx), TypeError);
}

TEST_F(LogContextTest, RejectsUnknownPaths) {
    expectRejected<LogContext>(R"(set(colour, "red"))");
    expectRejected<LogContext>(R"(set(body.nope, "x"))");
    expectRejected<LogContext>(R"(set(resource, "x"))");
    expectRejected<LogContext>(R"(set(resource.name, "x"))");
    expectRejected<LogContext>(R"(set(severity_number["x"], 1))");
    expectRejected<LogContext>(R"(set(attributes.nested, 1))");
    expectRejected<LogContext>(R"(set(severity_number, SEVERITY_NUMBER_LOUD))");
}

TEST_F(LogContextTest, UnknownPathErrorListsValidPaths) {
    try {
        LogContext::newParser(funcs::standardConverters<LogContext>()).parseCondition(R"(colour == "red")");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("\"colour\""), std::string::npos);
        EXPECT_NE(message.find("severity_number"), std::string::npos);
    }
}

// Span and span event contexts
class SpanContextTest : public ContextTest {
protected:
    void SetUp() override {
        ContextTest::SetUp();
        span.set_name("GET /cart");
        span.set_trace_id(rawId(16));
        span.set_span_id(rawId(8));
        span.set_kind(contexts::Span::SPAN_KIND_SERVER);
        span.mutable_status()->set_code(opentelemetry::proto::trace::v1::Status::STATUS_CODE_ERROR);
        span.set_start_time_unix_nano(1000);
        span.set_end_time_unix_nano(5000);
        addAttribute(span.mutable_attributes(), "http.route", "/cart");
        auto* first = span.add_events();
        first->set_name("start");
        auto* second = span.add_events();
        second->set_name("exception");
        addAttribute(second->mutable_attributes(), "exception.type", "IOError");
    }

    contexts::Span span;
};

TEST_F(SpanContextTest, ReadsSpanFields) {
    SpanContext tctx(&span, &scope, &scope_schema_url, &resource, &resource_schema_url);
    EXPECT_TRUE(check(R"(name == "GET /cart")", tctx));
    EXPECT_TRUE(check(R"(span.name == "GET /cart")", tctx));
    EXPECT_TRUE(check("kind == SPAN_KIND_SERVER", tctx));
    EXPECT_TRUE(check(R"(kind.string == "Server")", tctx));
    EXPECT_TRUE(check(R"(kind.deprecated_string == "SPAN_KIND_SERVER")", tctx));
    EXPECT_TRUE(check("status.code == STATUS_CODE_ERROR", tctx));
    EXPECT_TRUE(check(R"(span_id.string == "0102030405060708")", tctx));
    EXPECT_TRUE(check("end_time_unix_nano - start_time_unix_nano == 4000", tctx));
    EXPECT_TRUE(check("Nanoseconds(end_time - start_time) == 4000", tctx));
    EXPECT_TRUE(check(R"(attributes["http.route"] == "/cart")", tctx));
}

TEST_F(SpanContextTest, WritesSpanFields) {
    SpanContext tctx(&span, &scope, &scope_schema_url, &resource, &resource_schema_url);
    apply(R"(set(kind.string, "Client"))", tctx);
    EXPECT_EQ(span.kind(), contexts::Span::SPAN_KIND_CLIENT);
    apply(R"(set(status.message, "boom"))", tctx);
    EXPECT_EQ(span.status().message(), "boom");
    apply("set(parent_span_id, 0x0807060504030201)", tctx);
    EXPECT_EQ(span.parent_span_id(), std::string("\x08\x07\x06\x05\x04\x03\x02\x01"));

    ExecContext ctx;
    auto parser = SpanContext::newParser(funcs::standardFunctions<SpanContext>());
    EXPECT_THROW(parser.parseStatement("set(trace_id, 0x0102)").execute(ctx, tctx), TypeError);
    EXPECT_THROW(parser.parseStatement(R"(set(kind.string, "Sideways"))").execute(ctx, tctx), EvalError);
}

TEST_F(SpanContextTest, RejectsUnknownSpanPaths) {
    expectRejected<SpanContext>(R"(set(status, "x"))");
    expectRejected<SpanContext>(R"(set(status.colour, "x"))");
    expectRejected<SpanContext>(R"(set(kind.name, "x"))");
    expectRejected<SpanContext>(R"(set(body, "x"))");
}

TEST_F(SpanContextTest, SpanEventPaths) {
    SpanEventContext tctx(span.mutable_events(1), 1, &span, &scope, &scope_schema_url, &resource,
                          &resource_schema_url);
    EXPECT_TRUE(check(R"(name == "exception")", tctx));
    EXPECT_TRUE(check(R"(spanevent.name == "exception")", tctx));
    EXPECT_TRUE(check(R"(attributes["exception.type"] == "IOError")", tctx));
    EXPECT_TRUE(check(R"(span.name == "GET /cart")", tctx));
    EXPECT_TRUE(check("span.kind == SPAN_KIND_SERVER", tctx));
    EXPECT_TRUE(check("event_index == 1", tctx));
    EXPECT_TRUE(check(R"(resource.attributes["service.name"] == "checkout")", tctx));

    apply(R"(set(span.attributes["error"], true))", tctx);
    ASSERT_NE(findKey(*span.mutable_attributes(), "error"), nullptr);

    expectRejected<SpanEventContext>("set(event_index, 2)");
    expectRejected<SpanEventContext>(R"(set(span, "x"))");
}

// Metric and data point contexts
class MetricContextTest : public ContextTest {
protected:
    void SetUp() override {
        ContextTest::SetUp();
        sum.set_name("http.requests");
        sum.set_unit("1");
        sum.mutable_sum()->set_is_monotonic(true);
        sum.mutable_sum()->set_aggregation_temporality(
            opentelemetry::proto::metrics::v1::AGGREGATION_TEMPORALITY_CUMULATIVE);
        auto* point = sum.mutable_sum()->add_data_points();
        point->set_as_int(5);
        point->set_flags(1);
        addAttribute(point->mutable_attributes(), "host", "a");

        histogram.set_name("latency");
        auto* hp = histogram.mutable_histogram()->add_data_points();
        hp->set_count(3);
        hp->set_sum(4.5);
        hp->add_bucket_counts(1);
        hp->add_bucket_counts(2);
        hp->add_explicit_bounds(1.0);

        exponential.set_name("sizes");
        auto* ep = exponential.mutable_exponential_histogram()->add_data_points();
        ep->set_scale(2);
        ep->mutable_positive()->set_offset(-1);
        ep->mutable_positive()->add_bucket_counts(4);

        summary.set_name("quantiles");
        auto* sp = summary.mutable_summary()->add_data_points();
        sp->set_count(10);
        auto* q = sp->add_quantile_values();
        q->set_quantile(0.5);
        q->set_value(12);
    }

    DataPointContext pointContext(contexts::Metric& metric, DataPointContext::DataPoint point) {
        return DataPointContext(point, &metric, &scope, &scope_schema_url, &resource, &resource_schema_url);
    }

    contexts::Metric sum;
    contexts::Metric histogram;
    contexts::Metric exponential;
    contexts::Metric summary;
};

TEST_F(MetricContextTest, MetricPaths) {
    MetricContext tctx(&sum, &scope, &scope_schema_url, &resource, &resource_schema_url);
    EXPECT_TRUE(check(R"(name == "http.requests")", tctx));
    EXPECT_TRUE(check(R"(metric.unit == "1")", tctx));
    EXPECT_TRUE(check("type == METRIC_DATA_TYPE_SUM", tctx));
    EXPECT_TRUE(check("aggregation_temporality == AGGREGATION_TEMPORALITY_CUMULATIVE", tctx));
    EXPECT_TRUE(check("is_monotonic == true", tctx));

    MetricContext gauge_ctx(&histogram, &scope, &scope_schema_url, &resource, &resource_schema_url);
    EXPECT_TRUE(check("type == METRIC_DATA_TYPE_HISTOGRAM", gauge_ctx));
    EXPECT_TRUE(check("is_monotonic == nil", gauge_ctx));

    apply(R"(set(description, "total requests"))", tctx);
    EXPECT_EQ(sum.description(), "total requests");
    apply("set(aggregation_temporality, AGGREGATION_TEMPORALITY_DELTA)", tctx);
    EXPECT_EQ(sum.sum().aggregation_temporality(), opentelemetry::proto::metrics::v1::AGGREGATION_TEMPORALITY_DELTA);

    expectRejected<MetricContext>("set(type, 1)");
    expectRejected<MetricContext>(R"(set(attributes["x"], 1))");
}

TEST_F(MetricContextTest, NumberDataPointPaths) {
    DataPointContext tctx = pointContext(sum, sum.mutable_sum()->mutable_data_points(0));
    EXPECT_TRUE(check("value_int == 5", tctx));
    EXPECT_TRUE(check(R"(attributes["host"] == "a")", tctx));
    EXPECT_TRUE(check(R"(metric.name == "http.requests")", tctx));
    EXPECT_TRUE(check("metric.type == METRIC_DATA_TYPE_SUM", tctx));
    EXPECT_TRUE(check("flags == FLAG_NO_RECORDED_VALUE", tctx));
    EXPECT_TRUE(check("count == nil", tctx));
    EXPECT_TRUE(check("bucket_counts == nil", tctx));

    apply("set(value_double, 2.5)", tctx);
    EXPECT_DOUBLE_EQ(sum.sum().data_points(0).as_double(), 2.5);
    apply(R"(set(attributes["host"], "b"))", tctx);
    EXPECT_TRUE(check(R"(datapoint.attributes["host"] == "b")", tctx));
}

TEST_F(MetricContextTest, HistogramDataPointPaths) {
    DataPointContext tctx = pointContext(histogram, histogram.mutable_histogram()->mutable_data_points(0));
    EXPECT_TRUE(check("count == 3", tctx));
    EXPECT_TRUE(check("sum == 4.5", tctx));
    EXPECT_TRUE(check("bucket_counts == [1, 2]", tctx));
    EXPECT_TRUE(check("explicit_bounds == [1.0]", tctx));
    EXPECT_TRUE(check("value_int == nil", tctx));

    apply("set(explicit_bounds, [1, 2.5])", tctx);
    ASSERT_EQ(histogram.histogram().data_points(0).explicit_bounds_size(), 2);
    EXPECT_DOUBLE_EQ(histogram.histogram().data_points(0).explicit_bounds(1), 2.5);

    ExecContext ctx;
    auto parser = DataPointContext::newParser(funcs::standardFunctions<DataPointContext>());
    EXPECT_THROW(parser.parseStatement(R"(set(bucket_counts, ["x"]))").execute(ctx, tctx), TypeError);
}

TEST_F(MetricContextTest, ExponentialHistogramAndSummaryPaths) {
    DataPointContext exp_ctx =
        pointContext(exponential, exponential.mutable_exponential_histogram()->mutable_data_points(0));
    EXPECT_TRUE(check("scale == 2", exp_ctx));
    EXPECT_TRUE(check("positive.offset == -1", exp_ctx));
    EXPECT_TRUE(check("positive.bucket_counts == [4]", exp_ctx));
    EXPECT_TRUE(check("negative.bucket_counts == []", exp_ctx));

    DataPointContext summary_ctx = pointContext(summary, summary.mutable_summary()->mutable_data_points(0));
    EXPECT_TRUE(check("count == 10", summary_ctx));
    EXPECT_TRUE(check("Len(quantile_values) == 1", summary_ctx));
    EXPECT_TRUE(check(R"(quantile_values == [{"quantile": 0.5, "value": 12.0}])", summary_ctx));

    expectRejected<DataPointContext>("set(positive, 1)");
    expectRejected<DataPointContext>("set(positive.scale, 1)");
}
