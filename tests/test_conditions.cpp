#include <gtest/gtest.h>
#include "ottl/errors.hpp"
#include "ottl/statements.hpp"
#include "test_record.hpp"

using namespace ottl;

namespace {

ConditionSequence<TestRecord> conditions(const std::vector<std::string>& texts, ErrorMode mode,
                                         LogicOperation op = LogicOperation::Or) {
    return ConditionSequence<TestRecord>(newTestParser().parseConditions(texts), mode, op);
}

StatementSequence<TestRecord> statements(const std::vector<std::string>& texts, ErrorMode mode) {
    return StatementSequence<TestRecord>(newTestParser().parseStatements(texts), mode);
}

} // namespace

TEST(ErrorModeTest, ParsesNames) {
    EXPECT_EQ(parseErrorMode("ignore"), ErrorMode::Ignore);
    EXPECT_EQ(parseErrorMode("SILENT"), ErrorMode::Silent);
    EXPECT_EQ(parseErrorMode("Propagate"), ErrorMode::Propagate);
    EXPECT_EQ(parseErrorMode(""), ErrorMode::Propagate);
    EXPECT_THROW(parseErrorMode("loud"), ConfigError);
    EXPECT_STREQ(errorModeName(ErrorMode::Silent), "silent");
}

TEST(ConditionSequenceTest, OrStopsAtFirstMatch) {
    TestRecord record;
    record.name = "a";
    ExecContext ctx;
    // The failing severity condition is never reached
    EXPECT_TRUE(conditions({R"(name == "a")", "severity > 1"}, ErrorMode::Propagate).eval(ctx, record));
    EXPECT_FALSE(conditions({R"(name == "b")", R"(name == "c")"}, ErrorMode::Propagate).eval(ctx, record));
}

TEST(ConditionSequenceTest, AndNeedsEveryCondition) {
    TestRecord record;
    record.name = "a";
    record.severity = 5;
    ExecContext ctx;
    EXPECT_TRUE(conditions({R"(name == "a")", "severity == 5"}, ErrorMode::Propagate, LogicOperation::And)
                    .eval(ctx, record));
    EXPECT_FALSE(conditions({R"(name == "a")", "severity == 4"}, ErrorMode::Propagate, LogicOperation::And)
                     .eval(ctx, record));
}

TEST(ConditionSequenceTest, EmptySequenceIsFalse) {
    TestRecord record;
    ExecContext ctx;
    EXPECT_FALSE(conditions({}, ErrorMode::Propagate).eval(ctx, record));
    EXPECT_FALSE(conditions({}, ErrorMode::Propagate, LogicOperation::And).eval(ctx, record));
}

TEST(ConditionSequenceTest, PropagateWrapsTheError) {
    TestRecord record;
    ExecContext ctx;
    auto sequence = conditions({"severity < LEVEL_HIGH"}, ErrorMode::Propagate);
    try {
        sequence.eval(ctx, record);
        FAIL() << "expected EvalError";
    } catch (const EvalError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("failed to eval condition: severity < LEVEL_HIGH"), std::string::npos) << message;
        EXPECT_NE(message.find("severity is not set"), std::string::npos) << message;
    }
}

TEST(ConditionSequenceTest, IgnoreTreatsFailureAsFalse) {
    TestRecord record;
    ExecContext ctx;
    EXPECT_FALSE(conditions({"severity < LEVEL_HIGH"}, ErrorMode::Ignore).eval(ctx, record));
    EXPECT_FALSE(conditions({"severity < LEVEL_HIGH"}, ErrorMode::Silent).eval(ctx, record));

    record.name = "x";
    EXPECT_TRUE(conditions({"severity < LEVEL_HIGH", R"(name == "x")"}, ErrorMode::Ignore).eval(ctx, record));
    EXPECT_FALSE(conditions({R"(name == "x")", "severity < LEVEL_HIGH"}, ErrorMode::Silent, LogicOperation::And)
                     .eval(ctx, record));
}

TEST(ConditionSequenceTest, EvaluatesAfterSeverityIsSet) {
    TestRecord record;
    record.severity = 1;
    ExecContext ctx;
    EXPECT_TRUE(conditions({"severity < LEVEL_HIGH"}, ErrorMode::Propagate).eval(ctx, record));
}

TEST(StatementSequenceTest, RunsInOrder) {
    TestRecord record;
    ExecContext ctx;
    statements({R"(set(name, "first"))", R"(set(attributes["copy"], name))", R"(set(name, "second"))"},
               ErrorMode::Propagate)
        .execute(ctx, record);
    EXPECT_EQ(record.name, "second");
    EXPECT_EQ(toJson(record.attributes), R"({"copy":"first"})");
}

TEST(StatementSequenceTest, WhereClauseGuardsEachStatement) {
    TestRecord record;
    record.name = "keep";
    ExecContext ctx;
    statements({R"(set(attributes["a"], 1) where name == "keep")", R"(set(attributes["b"], 2) where name == "drop")"},
               ErrorMode::Propagate)
        .execute(ctx, record);
    EXPECT_EQ(toJson(record.attributes), R"({"a":1})");
}

TEST(StatementSequenceTest, ErrorModes) {
    const std::vector<std::string> texts = {R"(set(attributes["before"], true))", "set(name, severity)",
                                            R"(set(attributes["after"], true))"};
    ExecContext ctx;

    TestRecord propagated;
    EXPECT_THROW(statements(texts, ErrorMode::Propagate).execute(ctx, propagated), EvalError);
    EXPECT_EQ(toJson(propagated.attributes), R"({"before":true})");

    TestRecord ignored;
    statements(texts, ErrorMode::Ignore).execute(ctx, ignored);
    EXPECT_EQ(toJson(ignored.attributes), R"({"after":true,"before":true})");

    TestRecord silenced;
    statements(texts, ErrorMode::Silent).execute(ctx, silenced);
    EXPECT_EQ(toJson(silenced.attributes), R"({"after":true,"before":true})");
}

TEST(StatementSequenceTest, WrongTypeWriteFailsTheStatement) {
    TestRecord record;
    record.severity = 3;
    ExecContext ctx;
    EXPECT_THROW(statements({"set(name, severity)"}, ErrorMode::Propagate).execute(ctx, record), EvalError);
    EXPECT_EQ(record.name, "");
}
