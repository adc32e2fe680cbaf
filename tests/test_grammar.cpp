#include <gtest/gtest.h>
#include "ottl/errors.hpp"
#include "ottl/grammar.hpp"
#include "ottl/lexer.hpp"
#include <limits>

using namespace ottl;

TEST(LexerTest, SplitsStatementIntoTokens) {
    auto tokens = tokenize(R"(set(attributes["a"], 1.5))");
    std::vector<TokenType> expected = {
        TokenType::Identifier, TokenType::LParen, TokenType::Identifier, TokenType::LBracket,
        TokenType::String, TokenType::RBracket, TokenType::Comma, TokenType::Float,
        TokenType::RParen, TokenType::End};
    ASSERT_EQ(tokens.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(tokens[i].type, expected[i]) << "token " << i;
    }
    EXPECT_EQ(tokens[4].text, "a");
    EXPECT_EQ(tokens[4].offset, 15u);
    EXPECT_EQ(tokens[7].text, "1.5");
}

TEST(LexerTest, EmptyInputYieldsOnlyEnd) {
    auto tokens = tokenize("   ");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, TokenType::End);
}

TEST(LexerTest, ComparisonOperators) {
    auto tokens = tokenize("a == b != c <= d >= e < f > g = h");
    std::vector<std::string> ops;
    for (const auto& t : tokens) {
        if (t.type == TokenType::Compare || t.type == TokenType::Assign) {
            ops.push_back(t.text);
        }
    }
    EXPECT_EQ(ops, (std::vector<std::string>{"==", "!=", "<=", ">=", "<", ">", "="}));
}

TEST(LexerTest, UnescapesStrings) {
    auto tokens = tokenize(R"("a\"b\\c\n")");
    ASSERT_EQ(tokens[0].type, TokenType::String);
    EXPECT_EQ(tokens[0].text, "a\"b\\c\n");
}

TEST(LexerTest, BytesLiteralKeepsHexDigits) {
    auto tokens = tokenize("0xDEADbeef");
    ASSERT_EQ(tokens[0].type, TokenType::Bytes);
    EXPECT_EQ(tokens[0].text, "DEADbeef");
}

TEST(LexerTest, RejectsMalformedInput) {
    EXPECT_THROW(tokenize("0xabc"), ParseError);
    EXPECT_THROW(tokenize(R"("bad \q escape")"), ParseError);
    EXPECT_THROW(tokenize("a ! b"), ParseError);
    EXPECT_THROW(tokenize("a ; b"), ParseError);
    EXPECT_THROW(tokenize("12abc"), ParseError);
}

TEST(LexerTest, UnterminatedStringReportsOffsetOfOpeningQuote) {
    try {
        tokenize(R"(set(x, "abc))");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.offset(), 7u);
        EXPECT_NE(std::string(e.what()).find("unterminated string"), std::string::npos);
    }
}

// Statements
TEST(GrammarTest, ParsesEditorWithArguments) {
    auto stmt = parseStatementSyntax(R"(set(attributes["k"], "v"))");
    EXPECT_EQ(stmt.editor.function, "set");
    ASSERT_EQ(stmt.editor.arguments.size(), 2u);
    EXPECT_EQ(stmt.where, nullptr);

    const ast::Value& target = *stmt.editor.arguments[0].value;
    ASSERT_EQ(target.kind, ast::Value::Kind::Math);
    ASSERT_EQ(target.math->kind, ast::MathExpression::Kind::Path);
    const ast::Path& path = *target.math->path;
    ASSERT_EQ(path.fields.size(), 1u);
    EXPECT_EQ(path.fields[0].name, "attributes");
    ASSERT_EQ(path.fields[0].keys.size(), 1u);
    EXPECT_EQ(path.fields[0].keys[0].string, std::optional<std::string>("k"));
    EXPECT_EQ(path.text, R"(attributes["k"])");

    const ast::Value& value = *stmt.editor.arguments[1].value;
    EXPECT_EQ(value.kind, ast::Value::Kind::String);
    EXPECT_EQ(value.string, "v");
}

TEST(GrammarTest, ParsesNamedArguments) {
    auto stmt = parseStatementSyntax(R"(limit(attributes, limit = 3, priority_keys = ["a"]))");
    ASSERT_EQ(stmt.editor.arguments.size(), 3u);
    EXPECT_TRUE(stmt.editor.arguments[0].name.empty());
    EXPECT_EQ(stmt.editor.arguments[1].name, "limit");
    EXPECT_EQ(stmt.editor.arguments[2].name, "priority_keys");
    EXPECT_EQ(stmt.editor.arguments[2].value->kind, ast::Value::Kind::List);
}

TEST(GrammarTest, ParsesWhereClauseIntoTermsOfConjunctions) {
    auto stmt = parseStatementSyntax(
        R"(set(attributes["x"], 1) where name == "a" and not IsMatch(body, "x") or severity_number > 3)");
    ASSERT_NE(stmt.where, nullptr);
    ASSERT_EQ(stmt.where->terms.size(), 2u);

    const auto& first = stmt.where->terms[0];
    ASSERT_EQ(first.values.size(), 2u);
    EXPECT_EQ(first.values[0].kind, ast::BooleanValue::Kind::Comparison);
    EXPECT_EQ(first.values[0].comparison.op, CompareOp::Eq);
    EXPECT_EQ(first.values[1].kind, ast::BooleanValue::Kind::Converter);
    EXPECT_TRUE(first.values[1].negate);
    EXPECT_EQ(first.values[1].converter->function, "IsMatch");

    const auto& second = stmt.where->terms[1];
    ASSERT_EQ(second.values.size(), 1u);
    EXPECT_EQ(second.values[0].comparison.op, CompareOp::Gt);
}

TEST(GrammarTest, RejectsConverterAsStatement) {
    try {
        parseStatementSyntax(R"(Concat(["a"], ""))");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_NE(std::string(e.what()).find("converter Concat cannot be used as a statement"),
                  std::string::npos);
        EXPECT_EQ(e.offset(), 0u);
    }
}

TEST(GrammarTest, RejectsIndexedEditor) {
    EXPECT_THROW(parseStatementSyntax(R"(set(attributes, {})[0])"), ParseError);
}

TEST(GrammarTest, RejectsEditorUsedAsValue) {
    EXPECT_THROW(parseStatementSyntax(R"(set(attributes["a"], lower(body)))"), ParseError);
}

TEST(GrammarTest, RejectsTrailingTokens) {
    EXPECT_THROW(parseStatementSyntax(R"(set(name, "a") name)"), ParseError);
    EXPECT_THROW(parseConditionSyntax(R"(name == "a" name)"), ParseError);
}

TEST(GrammarTest, ParseErrorCarriesOffsetOfOffendingToken) {
    try {
        parseConditionSyntax(R"(name == )");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.offset(), 8u);
        EXPECT_EQ(e.text(), "name == ");
    }
}

// Conditions
TEST(GrammarTest, ParsesBooleanConstantsAndSubexpressions) {
    auto expr = parseConditionSyntax(R"(true and (name == "a" or false))");
    ASSERT_EQ(expr.terms.size(), 1u);
    const auto& values = expr.terms[0].values;
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(values[0].kind, ast::BooleanValue::Kind::Constant);
    EXPECT_TRUE(values[0].constant);
    ASSERT_EQ(values[1].kind, ast::BooleanValue::Kind::Subexpression);
    EXPECT_EQ(values[1].subexpression->terms.size(), 2u);
}

TEST(GrammarTest, ParenthesizedMathIsAComparisonOperand) {
    auto expr = parseConditionSyntax("(1 + 2) * 3 == 9");
    ASSERT_EQ(expr.terms[0].values.size(), 1u);
    const auto& cmp = expr.terms[0].values[0];
    ASSERT_EQ(cmp.kind, ast::BooleanValue::Kind::Comparison);
    ASSERT_EQ(cmp.comparison.left.kind, ast::Value::Kind::Math);
    EXPECT_EQ(cmp.comparison.left.math->op, MathOp::Mul);
}

// Values
TEST(GrammarTest, MultiplicationBindsTighterThanAddition) {
    auto v = parseValueSyntax("1 + 2 * 3");
    ASSERT_EQ(v.kind, ast::Value::Kind::Math);
    ASSERT_EQ(v.math->kind, ast::MathExpression::Kind::Binary);
    EXPECT_EQ(v.math->op, MathOp::Add);
    EXPECT_EQ(v.math->left->kind, ast::MathExpression::Kind::Int);
    ASSERT_EQ(v.math->right->kind, ast::MathExpression::Kind::Binary);
    EXPECT_EQ(v.math->right->op, MathOp::Mul);
}

TEST(GrammarTest, FoldsNegativeLiterals) {
    auto v = parseValueSyntax("-5");
    ASSERT_EQ(v.math->kind, ast::MathExpression::Kind::Int);
    EXPECT_EQ(v.math->int_value, -5);

    auto min = parseValueSyntax("-9223372036854775808");
    EXPECT_EQ(min.math->int_value, std::numeric_limits<int64_t>::min());

    auto f = parseValueSyntax("-2.5");
    ASSERT_EQ(f.math->kind, ast::MathExpression::Kind::Float);
    EXPECT_DOUBLE_EQ(f.math->float_value, -2.5);

    auto negated = parseValueSyntax("-attributes[\"n\"]");
    EXPECT_EQ(negated.math->kind, ast::MathExpression::Kind::Negate);
}

TEST(GrammarTest, RejectsOutOfRangeInteger) {
    EXPECT_THROW(parseValueSyntax("9223372036854775808"), ParseError);
}

TEST(GrammarTest, ParsesLiterals) {
    EXPECT_EQ(parseValueSyntax("nil").kind, ast::Value::Kind::Nil);
    EXPECT_TRUE(parseValueSyntax("true").boolean);
    EXPECT_EQ(parseValueSyntax("SEVERITY_NUMBER_INFO").kind, ast::Value::Kind::Enum);

    auto bytes = parseValueSyntax("0xdead");
    ASSERT_EQ(bytes.kind, ast::Value::Kind::Bytes);
    EXPECT_EQ(bytes.bytes, (std::vector<uint8_t>{0xde, 0xad}));

    auto map = parseValueSyntax(R"({"a": 1, "b": [1, "x"], "c": {}})");
    ASSERT_EQ(map.kind, ast::Value::Kind::Map);
    ASSERT_EQ(map.map.size(), 3u);
    EXPECT_EQ(map.map[1].key, "b");
    EXPECT_EQ(map.map[1].value.list.size(), 2u);
    EXPECT_EQ(map.map[2].value.kind, ast::Value::Kind::Map);
}

TEST(GrammarTest, ParsesConverterWithIndexKeys) {
    auto v = parseValueSyntax(R"(ParseJSON(body)["items"][0])");
    ASSERT_EQ(v.math->kind, ast::MathExpression::Kind::Converter);
    const auto& conv = *v.math->converter;
    EXPECT_EQ(conv.function, "ParseJSON");
    ASSERT_EQ(conv.keys.size(), 2u);
    EXPECT_EQ(conv.keys[0].string, std::optional<std::string>("items"));
    EXPECT_EQ(conv.keys[1].integer, std::optional<int64_t>(0));
}

TEST(GrammarTest, ExpressionKeysAreKeptUnevaluated) {
    auto v = parseValueSyntax(R"(attributes[resource.attributes["k"]])");
    const auto& key = v.math->path->fields[0].keys[0];
    EXPECT_FALSE(key.string.has_value());
    EXPECT_FALSE(key.integer.has_value());
    ASSERT_NE(key.expression, nullptr);
    EXPECT_EQ(key.expression->kind, ast::MathExpression::Kind::Path);
}

TEST(GrammarTest, RejectsUppercasePathSegment) {
    EXPECT_THROW(parseValueSyntax("resource.Attributes"), ParseError);
}

// Path roots
TEST(GrammarTest, CollectsPathRootsFromConditions) {
    auto expr = parseConditionSyntax(
        R"(resource.attributes["a"] == "b" and IsMatch(attributes[name], "x") or Len([body]) > 0)");
    EXPECT_EQ(collectPathRoots(expr), (std::set<std::string>{"resource", "attributes", "name", "body"}));
}

TEST(GrammarTest, CollectsPathRootsFromStatements) {
    auto stmt = parseStatementSyntax(
        R"(set(span.attributes["a"], resource.attributes["b"]) where scope.name == "lib")");
    EXPECT_EQ(collectPathRoots(stmt), (std::set<std::string>{"span", "resource", "scope"}));
}

TEST(GrammarTest, LiteralsHaveNoPathRoots) {
    auto expr = parseConditionSyntax(R"("a" == "b" or true)");
    EXPECT_TRUE(collectPathRoots(expr).empty());
}
