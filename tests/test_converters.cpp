#include <gtest/gtest.h>
#include "ottl/errors.hpp"
#include "ottl/funcs/converters.hpp"
#include "test_record.hpp"

using namespace ottl;

namespace {

class FixedClock : public Clock {
public:
    explicit FixedClock(Time time) : time_(time) {}
    Time now() const override { return time_; }

private:
    Time time_;
};

class ConverterTest : public ::testing::Test {
protected:
    Value eval(const std::string& expression) { return evalValue(expression, record); }

    void expectConfigError(const std::string& expression) {
        EXPECT_THROW(newTestParser().parseValueExpression(expression), ConfigError) << expression;
    }

    TestRecord record;
};

} // namespace

TEST_F(ConverterTest, TypeChecks) {
    record.name = "svc";
    EXPECT_TRUE(eval("IsString(name)").getBool());
    EXPECT_FALSE(eval("IsString(1)").getBool());
    EXPECT_TRUE(eval("IsInt(1)").getBool());
    EXPECT_FALSE(eval("IsInt(1.0)").getBool());
    EXPECT_TRUE(eval("IsDouble(1.0)").getBool());
    EXPECT_TRUE(eval("IsBool(false)").getBool());
    EXPECT_TRUE(eval("IsMap(attributes)").getBool());
    EXPECT_TRUE(eval("IsList([1, 2])").getBool());
    EXPECT_FALSE(eval(R"(IsList(attributes["missing"]))").getBool());
}

// A getter that fails with a type error makes the check false
TEST_F(ConverterTest, TypeChecksOnFailingGetter) {
    EXPECT_FALSE(eval("IsInt(severity)").getBool());
    EXPECT_FALSE(eval("IsString(severity)").getBool());
    EXPECT_FALSE(eval("IsMap(severity)").getBool());
    record.severity = 9;
    EXPECT_TRUE(eval("IsInt(severity)").getBool());
}

TEST_F(ConverterTest, IsMatch) {
    record.name = "GET /users";
    EXPECT_TRUE(eval(R"(IsMatch(name, "^GET "))").getBool());
    EXPECT_FALSE(eval(R"(IsMatch(name, "^POST"))").getBool());
    EXPECT_FALSE(eval(R"(IsMatch(attributes["missing"], ".*"))").getBool());
    EXPECT_TRUE(eval(R"(IsMatch(123, "^1"))").getBool());
    expectConfigError(R"(IsMatch(name, "[a-"))");
}

TEST_F(ConverterTest, IsMatchOnLargeValues) {
    record.name = "a" + std::string(200000, 'x') + "b";
    EXPECT_TRUE(eval(R"(IsMatch(name, "^a.*b$"))").getBool());
    EXPECT_FALSE(eval(R"(IsMatch(name, "^a.*c$"))").getBool());
    EXPECT_TRUE(eval(R"(IsMatch(name, "(x|y)+b"))").getBool());
}

TEST_F(ConverterTest, Coercions) {
    EXPECT_EQ(eval("String(1.5)").getString(), "1.5");
    EXPECT_EQ(eval("String(true)").getString(), "true");
    EXPECT_TRUE(eval(R"(String(attributes["missing"]))").isNil());

    EXPECT_EQ(eval(R"(Int("12"))").getInt(), 12);
    EXPECT_EQ(eval("Int(3.9)").getInt(), 3);
    EXPECT_EQ(eval("Int(true)").getInt(), 1);
    EXPECT_TRUE(eval(R"(Int("abc"))").isNil());

    EXPECT_DOUBLE_EQ(eval(R"(Double("1.5"))").getDouble(), 1.5);
    EXPECT_DOUBLE_EQ(eval("Double(2)").getDouble(), 2.0);
    EXPECT_TRUE(eval(R"(Double("x"))").isNil());

    EXPECT_TRUE(eval(R"(Bool("true"))").getBool());
    EXPECT_FALSE(eval("Bool(0)").getBool());
    EXPECT_THROW(eval(R"(Bool("maybe"))"), EvalError);
    EXPECT_TRUE(eval(R"(Bool(attributes["missing"]))").isNil());
    EXPECT_TRUE(eval("Int(1.0e30)").isNil());
}

TEST_F(ConverterTest, CoercionOfMapIsTypeError) {
    EXPECT_THROW(eval("Int(attributes)"), TypeError);
}

TEST_F(ConverterTest, Concat) {
    EXPECT_EQ(eval(R"(Concat(["a", nil, 1], "-"))").getString(), "a-<nil>-1");
    EXPECT_EQ(eval(R"(Concat([], ","))").getString(), "");
}

TEST_F(ConverterTest, Split) {
    EXPECT_EQ(toJson(eval(R"(Split("a,b,,c", ","))")), R"(["a","b","","c"])");
    EXPECT_EQ(toJson(eval(R"(Split("abc", ""))")), R"(["a","b","c"])");
    EXPECT_EQ(toJson(eval(R"(Split("", ","))")), R"([""])");
}

TEST_F(ConverterTest, Substring) {
    EXPECT_EQ(eval(R"(Substring("hello", 1, 3))").getString(), "ell");
    EXPECT_THROW(eval(R"(Substring("hello", 3, 5))"), EvalError);
    expectConfigError(R"(Substring("hello", -1, 2))");
    expectConfigError(R"(Substring("hello", 0, 0))");
}

TEST_F(ConverterTest, SubstringRangeCheckedAtRuntime) {
    putEmpty(record.attributes, "len")->set_int_value(0);
    EXPECT_THROW(eval(R"(Substring("hello", 0, attributes["len"]))"), EvalError);

    putEmpty(record.attributes, "len")->set_int_value(9223372036854775807LL);
    EXPECT_THROW(eval(R"(Substring("hello", 2, attributes["len"]))"), EvalError);
    putEmpty(record.attributes, "start")->set_int_value(9223372036854775807LL);
    EXPECT_THROW(eval(R"(Substring("hello", attributes["start"], 2))"), EvalError);
}

TEST_F(ConverterTest, Len) {
    runStatement(R"(set(attributes, {"a": 1, "b": 2}))", record);
    EXPECT_EQ(eval(R"(Len("four"))").getInt(), 4);
    EXPECT_EQ(eval("Len(attributes)").getInt(), 2);
    EXPECT_EQ(eval("Len([1, 2, 3])").getInt(), 3);
    EXPECT_THROW(eval("Len(12)"), TypeError);
}

TEST_F(ConverterTest, CaseConversion) {
    EXPECT_EQ(eval(R"(ToLowerCase("MiXeD"))").getString(), "mixed");
    EXPECT_EQ(eval(R"(ToUpperCase("MiXeD"))").getString(), "MIXED");
}

TEST_F(ConverterTest, Hex) {
    EXPECT_EQ(eval(R"(Hex("ab"))").getString(), "6162");
    EXPECT_EQ(eval("Hex(1)").getString(), "0000000000000001");
    EXPECT_EQ(eval("Hex(0x0aff)").getString(), "0aff");
}

TEST_F(ConverterTest, Base64Decode) {
    EXPECT_EQ(eval(R"(Base64Decode("aGVsbG8="))").getString(), "hello");
    EXPECT_THROW(eval(R"(Base64Decode("!!"))"), EvalError);
}

TEST_F(ConverterTest, Fnv) {
    EXPECT_EQ(eval(R"(FNV("a"))").getInt(), static_cast<int64_t>(0xaf63dc4c8601ec8cULL));
    EXPECT_EQ(eval(R"(FNV(""))").getInt(), static_cast<int64_t>(14695981039346656037ULL));
}

TEST_F(ConverterTest, ParseJson) {
    Value parsed = eval(R"(ParseJSON("{\"b\": [true, \"x\"], \"a\": 1}"))");
    ASSERT_TRUE(parsed.is(Value::Type::Map));
    EXPECT_EQ(toJson(parsed), R"({"a":1,"b":[true,"x"]})");

    Value list = eval(R"(ParseJSON("[1, 2]"))");
    EXPECT_TRUE(list.is(Value::Type::Slice));

    EXPECT_THROW(eval(R"(ParseJSON("42"))"), EvalError);
    EXPECT_THROW(eval(R"(ParseJSON("{not json"))"), EvalError);
}

TEST_F(ConverterTest, ParseJsonIntoAttributes) {
    record.name = R"({"user": {"id": "u1"}})";
    runStatement(R"(merge_maps(attributes, ParseJSON(name), "upsert"))", record);
    EXPECT_EQ(toJson(record.attributes), R"({"user":{"id":"u1"}})");
}

TEST_F(ConverterTest, Sort) {
    EXPECT_EQ(toJson(eval("Sort([3, 1, 2.5])")), "[1,2.5,3]");
    EXPECT_EQ(toJson(eval(R"(Sort(["b", "c", "a"], "desc"))")), R"(["c","b","a"])");
    EXPECT_EQ(toJson(eval("Sort([true, false])")), "[false,true]");
    EXPECT_EQ(toJson(eval(R"(Sort(["b", 1, "a"]))")), R"([1,"a","b"])");
    EXPECT_THROW(eval(R"(Sort("text"))"), TypeError);
    expectConfigError(R"(Sort([1], "up"))");
}

TEST_F(ConverterTest, Duration) {
    EXPECT_EQ(eval(R"(Nanoseconds(Duration("1h2m3.5s")))").getInt(), 3723500000000LL);
    EXPECT_EQ(eval(R"(Nanoseconds(Duration("-300ms")))").getInt(), -300000000LL);
    EXPECT_DOUBLE_EQ(eval(R"(Seconds(Duration("1500ms")))").getDouble(), 1.5);
    EXPECT_THROW(eval(R"(Duration("10"))"), EvalError);
    EXPECT_THROW(eval(R"(Duration("5 days"))"), EvalError);
}

TEST_F(ConverterTest, TimeParsing) {
    EXPECT_EQ(eval(R"(UnixSeconds(Time("2023-05-26T12:34:56Z", "%Y-%m-%dT%H:%M:%S%z")))").getInt(),
              1685104496);
    EXPECT_EQ(eval(R"(UnixSeconds(Time("2023-05-26 14:34:56 +02:00", "%Y-%m-%d %H:%M:%S %z")))").getInt(),
              1685104496);
    EXPECT_EQ(eval(R"(UnixNano(Time("26/May/2023:12:34:56.250", "%d/%b/%Y:%H:%M:%S.%L")))").getInt(),
              1685104496250000000LL);
    EXPECT_THROW(eval(R"(Time("2023-02-30", "%Y-%m-%d"))"), EvalError);
    EXPECT_THROW(eval(R"(Time("2023-05-26", "%Y/%m/%d"))"), EvalError);
    expectConfigError(R"(Time("x", "%Q"))");
    expectConfigError(R"(Time("x", ""))");
}

TEST_F(ConverterTest, UnixBuildsTimes) {
    EXPECT_EQ(eval("UnixNano(Unix(5, 7))").getInt(), 5000000007LL);
    EXPECT_EQ(eval("UnixSeconds(Unix(1700000000))").getInt(), 1700000000);
    EXPECT_EQ(eval("UnixNano(Unix(-1, 500))").getInt(), -999999500LL);
}

TEST_F(ConverterTest, UnixRejectsTimesOutsideInt64) {
    EXPECT_THROW(eval("Unix(9223372037)"), EvalError);
    EXPECT_THROW(eval("Unix(-9223372037)"), EvalError);
    EXPECT_THROW(eval("Unix(9223372036, 900000000)"), EvalError);
    EXPECT_EQ(eval("UnixNano(Unix(9223372036, 854775807))").getInt(), 9223372036854775807LL);
}

TEST_F(ConverterTest, TimeArithmetic) {
    EXPECT_EQ(eval("Nanoseconds(Unix(10) - Unix(4))").getInt(), 6000000000LL);
    EXPECT_EQ(eval(R"(UnixSeconds(Unix(10) + Duration("1m")))").getInt(), 70);
}

TEST_F(ConverterTest, NowReadsExecutionClock) {
    FixedClock clock(Time(Duration(1700000000123456789LL)));
    ExecContext ctx(clock);
    auto getter = newTestParser().parseValueExpression("UnixNano(Now())");
    EXPECT_EQ(getter->get(ctx, record).getInt(), 1700000000123456789LL);

    auto condition = newTestParser().parseCondition(R"(Now() - Unix(1700000000) < Duration("1s"))");
    EXPECT_TRUE(condition.eval(ctx, record));
}

TEST_F(ConverterTest, TimeWrongTypeIsTypeError) {
    EXPECT_THROW(eval(R"(UnixNano("2023"))"), TypeError);
}
