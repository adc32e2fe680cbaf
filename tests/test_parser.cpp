#include <gtest/gtest.h>
#include "ottl/errors.hpp"
#include "ottl/parser.hpp"
#include "test_record.hpp"
#include <algorithm>
#include <cctype>

using namespace ottl;

namespace {

// Echo(value, suffix?) returns value, or value as a string followed by suffix
FactoryPtr<TestRecord> newEchoFactory() {
    return makeFactory<TestRecord>(
        "Echo", {{"value", ArgKind::Getter}, {"suffix", ArgKind::StringLiteral, true}},
        [](const FunctionContext&, const Arguments<TestRecord>& args) -> ExprFunc<TestRecord> {
            GetterPtr<TestRecord> value = args.getter("value");
            std::optional<std::string> suffix;
            if (args.has("suffix")) {
                suffix = args.stringLiteral("suffix");
            }
            return [value, suffix](const ExecContext& ctx, TestRecord& r) {
                Value v = value->get(ctx, r);
                if (!suffix) {
                    return v;
                }
                return Value(toStringLike(v).value_or("") + *suffix);
            };
        });
}

FactoryPtr<TestRecord> newUpperFactory() {
    return makeFactory<TestRecord>(
        "Upper", {{"value", ArgKind::StringGetter}},
        [](const FunctionContext&, const Arguments<TestRecord>& args) -> ExprFunc<TestRecord> {
            StringGetter<TestRecord> value = args.stringGetter("value");
            return [value](const ExecContext& ctx, TestRecord& r) {
                std::string s = value.get(ctx, r);
                std::transform(s.begin(), s.end(), s.begin(),
                               [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
                return Value(s);
            };
        });
}

// Apply(fn, value) calls the converter named by fn with value
FactoryPtr<TestRecord> newApplyFactory() {
    return makeFactory<TestRecord>(
        "Apply", {{"fn", ArgKind::Function}, {"value", ArgKind::Getter}},
        [](const FunctionContext&, const Arguments<TestRecord>& args) -> ExprFunc<TestRecord> {
            ExprFunc<TestRecord> call = args.function("fn").get({args.getter("value")});
            return call;
        });
}

FactoryPtr<TestRecord> newPickFactory() {
    return makeFactory<TestRecord>(
        "Pick", {{"values", ArgKind::StringList}, {"index", ArgKind::IntLiteral}},
        [](const FunctionContext&, const Arguments<TestRecord>& args) -> ExprFunc<TestRecord> {
            std::vector<std::string> values = args.stringList("values");
            int64_t index = args.intLiteral("index");
            if (index < 0 || index >= static_cast<int64_t>(values.size())) {
                throw ConfigError("index out of range");
            }
            std::string picked = values[static_cast<size_t>(index)];
            return [picked](const ExecContext&, TestRecord&) { return Value(picked); };
        });
}

FactoryPtr<TestRecord> newLevelFactory() {
    return makeFactory<TestRecord>(
        "Level", {{"level", ArgKind::Enum}},
        [](const FunctionContext&, const Arguments<TestRecord>& args) -> ExprFunc<TestRecord> {
            int64_t level = args.enumValue("level");
            return [level](const ExecContext&, TestRecord&) { return Value(level); };
        });
}

Parser<TestRecord> customParser() {
    FactoryMap<TestRecord> custom = createFactoryMap<TestRecord>(
        {newEchoFactory(), newUpperFactory(), newApplyFactory(), newPickFactory(), newLevelFactory()});
    return newTestParser(mergeFactoryMaps(funcs::standardEditors<TestRecord>(), custom));
}

Value evalCustom(const std::string& text, TestRecord& record) {
    ExecContext ctx;
    return customParser().parseValueExpression(text)->get(ctx, record);
}

} // namespace

// Statements
TEST(ParserTest, StatementRunsEditorWhenWhereClauseHolds) {
    TestRecord record;
    record.name = "checkout";
    EXPECT_TRUE(runStatement(R"(set(attributes["svc"], name) where name == "checkout")", record));
    ASSERT_NE(findKey(record.attributes, "svc"), nullptr);
    EXPECT_EQ(findKey(record.attributes, "svc")->string_value(), "checkout");
}

TEST(ParserTest, StatementSkipsEditorWhenWhereClauseFails) {
    TestRecord record;
    record.name = "cart";
    EXPECT_FALSE(runStatement(R"(set(attributes["svc"], name) where name == "checkout")", record));
    EXPECT_EQ(record.attributes.size(), 0);
}

TEST(ParserTest, SetCreatesNestedMaps) {
    TestRecord record;
    runStatement(R"(set(attributes["http"]["status"], 200))", record);
    EXPECT_EQ(evalValue(R"(attributes["http"]["status"])", record).getInt(), 200);
}

TEST(ParserTest, KeyExpressionsAreEvaluatedPerRecord) {
    TestRecord record;
    record.name = "a";
    putEmpty(record.attributes, "a")->set_string_value("first");
    putEmpty(record.attributes, "b")->set_string_value("second");
    EXPECT_EQ(evalValue("attributes[name]", record).getString(), "first");
    record.name = "b";
    EXPECT_EQ(evalValue("attributes[name]", record).getString(), "second");
}

TEST(ParserTest, ContextQualifierIsStripped) {
    TestRecord record;
    record.name = "qualified";
    EXPECT_EQ(evalValue("record.name", record).getString(), "qualified");
}

TEST(ParserTest, UnknownPathIsRejected) {
    try {
        newTestParser().parseCondition(R"(colour == "red")");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("colour"), std::string::npos);
    }
}

TEST(ParserTest, ReadOnlyPathCannotBeEditorTarget) {
    EXPECT_THROW(newTestParser().parseStatement(R"(set(id, "x"))"), ConfigError);
    // Reading it is fine
    TestRecord record;
    EXPECT_TRUE(evalCondition(R"(id == "record-1")", record));
}

TEST(ParserTest, UnknownEditorAndConverter) {
    try {
        newTestParser().parseStatement(R"(explode(attributes))");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("undefined editor \"explode\""), std::string::npos);
    }
    EXPECT_THROW(newTestParser().parseCondition(R"(Explode(name))"), ConfigError);
}

TEST(ParserTest, ParseErrorsAreConfigErrors) {
    EXPECT_THROW(newTestParser().parseStatement(R"(set(name, "x)"), ConfigError);
}

// Argument binding
TEST(BinderTest, BindsPositionalArguments) {
    TestRecord record;
    EXPECT_EQ(evalCustom(R"(Echo("a", "!"))", record).getString(), "a!");
    EXPECT_EQ(evalCustom(R"(Echo(42))", record).getInt(), 42);
}

TEST(BinderTest, BindsNamedArgumentsInAnyOrder) {
    TestRecord record;
    EXPECT_EQ(evalCustom(R"(Echo(suffix = "?", value = "b"))", record).getString(), "b?");
}

TEST(BinderTest, RejectsPositionalAfterNamed) {
    EXPECT_THROW(customParser().parseValueExpression(R"(Echo(value = "a", "!"))"), ConfigError);
}

TEST(BinderTest, RejectsTooManyArguments) {
    try {
        customParser().parseValueExpression(R"(Echo("a", "b", "c"))");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("too many arguments"), std::string::npos);
    }
}

TEST(BinderTest, RejectsMissingRequiredArgument) {
    EXPECT_THROW(customParser().parseValueExpression(R"(Echo(suffix = "!"))"), ConfigError);
}

TEST(BinderTest, RejectsUnknownAndDuplicateParameterNames) {
    EXPECT_THROW(customParser().parseValueExpression(R"(Echo(prefix = "a"))"), ConfigError);
    EXPECT_THROW(customParser().parseValueExpression(R"(Echo(value = "a", value = "b"))"), ConfigError);
}

TEST(BinderTest, LiteralParametersRejectExpressions) {
    EXPECT_THROW(customParser().parseValueExpression(R"(Echo("a", name))"), ConfigError);
    EXPECT_THROW(customParser().parseValueExpression(R"(Pick(["a", 1], 0))"), ConfigError);
    EXPECT_THROW(customParser().parseValueExpression(R"(Pick(["a"], 1 + 0))"), ConfigError);
}

TEST(BinderTest, FactoryConfigErrorsNameTheFunction) {
    try {
        customParser().parseValueExpression(R"(Pick(["a"], 5))");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("invalid arguments to function \"Pick\""), std::string::npos);
    }
}

TEST(BinderTest, BindsNegativeIntLiteral) {
    EXPECT_THROW(customParser().parseValueExpression(R"(Pick(["a"], -1))"), ConfigError);
}

TEST(BinderTest, ResolvesEnumSymbols) {
    TestRecord record;
    EXPECT_EQ(evalCustom("Level(LEVEL_HIGH)", record).getInt(), 3);
    EXPECT_THROW(customParser().parseValueExpression("Level(LEVEL_EXTREME)"), ConfigError);
    EXPECT_THROW(customParser().parseValueExpression(R"(Level("LEVEL_HIGH"))"), ConfigError);
}

TEST(BinderTest, PassesFunctionsByName) {
    TestRecord record;
    record.name = "shout";
    EXPECT_EQ(evalCustom("Apply(Upper, name)", record).getString(), "SHOUT");
    EXPECT_THROW(customParser().parseValueExpression("Apply(Missing, name)"), ConfigError);
    EXPECT_THROW(customParser().parseValueExpression(R"(Apply("Upper", name))"), ConfigError);
}

TEST(BinderTest, IndexesConverterResults) {
    TestRecord record;
    putEmpty(record.attributes, "k")->set_string_value("v");
    EXPECT_EQ(evalCustom(R"(Echo(attributes)["k"])", record).getString(), "v");
    EXPECT_TRUE(evalCustom(R"(Echo(attributes)["missing"])", record).isNil());
}

// Registry
TEST(RegistryTest, RejectsDuplicateFunctionNames) {
    EXPECT_THROW(createFactoryMap<TestRecord>({newEchoFactory(), newEchoFactory()}), ConfigError);
    FactoryMap<TestRecord> echo = createFactoryMap<TestRecord>({newEchoFactory()});
    EXPECT_THROW(mergeFactoryMaps(echo, echo), ConfigError);
}

TEST(RegistryTest, RejectsOptionalParameterBeforeRequired) {
    auto bad = makeFactory<TestRecord>(
        "Bad", {{"a", ArgKind::Getter, true}, {"b", ArgKind::Getter}},
        [](const FunctionContext&, const Arguments<TestRecord>&) -> ExprFunc<TestRecord> {
            return [](const ExecContext&, TestRecord&) { return Value(); };
        });
    EXPECT_THROW(createFactoryMap<TestRecord>({bad}), ConfigError);
}

TEST(RegistryTest, RejectsRepeatedParameterNames) {
    auto bad = makeFactory<TestRecord>(
        "Bad", {{"a", ArgKind::Getter}, {"a", ArgKind::Getter}},
        [](const FunctionContext&, const Arguments<TestRecord>&) -> ExprFunc<TestRecord> {
            return [](const ExecContext&, TestRecord&) { return Value(); };
        });
    EXPECT_THROW(createFactoryMap<TestRecord>({bad}), ConfigError);
}

// Expressions
TEST(ExpressionTest, EvaluatesMath) {
    TestRecord record;
    EXPECT_EQ(evalValue("-(2 * 3) + 10", record).getInt(), 4);
    EXPECT_DOUBLE_EQ(evalValue("1 + 0.5", record).getDouble(), 1.5);
    EXPECT_THROW(evalValue("1 / 0", record), EvalError);
    EXPECT_THROW(evalValue(R"("a" + 1)", record), TypeError);
}

TEST(ExpressionTest, LiteralContainersAreFolded) {
    auto parser = newTestParser();
    EXPECT_NE(parser.parseValueExpression(R"({"a": 1, "b": ["x", 2]})")->literal(), nullptr);
    EXPECT_EQ(parser.parseValueExpression("[name]")->literal(), nullptr);

    TestRecord record;
    record.name = "n";
    Value list = evalValue(R"(["a", name, 3])", record);
    ASSERT_TRUE(list.is(Value::Type::Slice));
    ASSERT_EQ(list.getSlice()->size(), 3);
    EXPECT_EQ(list.getSlice()->Get(1).string_value(), "n");
    EXPECT_EQ(list.getSlice()->Get(2).int_value(), 3);
}

TEST(ExpressionTest, ComparisonsFollowValueRules) {
    TestRecord record;
    record.name = "x";
    EXPECT_TRUE(evalCondition("1 == 1.0", record));
    EXPECT_TRUE(evalCondition("2 > 1.5", record));
    EXPECT_FALSE(evalCondition(R"("1" == 1)", record));
    EXPECT_TRUE(evalCondition(R"(attributes["missing"] == nil)", record));
    EXPECT_TRUE(evalCondition(R"(name != nil)", record));
    EXPECT_TRUE(evalCondition(R"("abc" < "abd")", record));
}

TEST(ExpressionTest, BooleanOperatorsShortCircuit) {
    TestRecord record;
    // severity is unset and would fail if evaluated
    EXPECT_TRUE(evalCondition("true or severity > 1", record));
    EXPECT_FALSE(evalCondition("false and severity > 1", record));
    EXPECT_THROW(evalCondition("severity > 1", record), TypeError);
    EXPECT_TRUE(evalCondition("not (false or false)", record));
}

TEST(ExpressionTest, EnumsCompareAsIntegers) {
    TestRecord record;
    record.severity = 3;
    EXPECT_TRUE(evalCondition("severity == LEVEL_HIGH", record));
    EXPECT_TRUE(evalCondition("severity > LEVEL_LOW", record));
    EXPECT_THROW(newTestParser().parseCondition("severity == LEVEL_UNKNOWN"), ConfigError);
}

TEST(ExpressionTest, ConverterInBooleanPositionMustReturnBool) {
    TestRecord record;
    record.name = "x";
    EXPECT_THROW(evalCondition("Len(name)", record), TypeError);
}
