#include <gtest/gtest.h>
#include "ottl/errors.hpp"
#include "ottl/funcs/editors.hpp"
#include "test_record.hpp"

using namespace ottl;

namespace {

class EditorTest : public ::testing::Test {
protected:
    void givenAttributes(const std::string& literal) {
        runStatement("set(attributes, " + literal + ")", record);
    }

    std::string attributes() const { return toJson(record.attributes); }

    void expectConfigError(const std::string& statement) {
        EXPECT_THROW(newTestParser().parseStatement(statement), ConfigError) << statement;
    }

    TestRecord record;
};

} // namespace

// set
TEST_F(EditorTest, SetNilLeavesTargetUntouched) {
    record.name = "keep";
    runStatement("set(name, nil)", record);
    EXPECT_EQ(record.name, "keep");

    runStatement(R"(set(attributes["copy"], attributes["missing"]))", record);
    EXPECT_EQ(findKey(record.attributes, "copy"), nullptr);
}

TEST_F(EditorTest, SetReplacesWholeMap) {
    givenAttributes(R"({"a": 1})");
    givenAttributes(R"({"b": "x"})");
    EXPECT_EQ(attributes(), R"({"b":"x"})");
}

TEST_F(EditorTest, SetMapValueFromOtherKey) {
    givenAttributes(R"({"src": {"n": 1}})");
    runStatement(R"(set(attributes["dst"], attributes["src"]))", record);
    EXPECT_EQ(attributes(), R"({"dst":{"n":1},"src":{"n":1}})");
}

// delete and keep
TEST_F(EditorTest, DeleteKey) {
    givenAttributes(R"({"a": 1, "b": 2})");
    runStatement(R"(delete_key(attributes, "a"))", record);
    EXPECT_EQ(attributes(), R"({"b":2})");
    runStatement(R"(delete_key(attributes, "missing"))", record);
    EXPECT_EQ(attributes(), R"({"b":2})");
}

TEST_F(EditorTest, DeleteMatchingKeys) {
    givenAttributes(R"({"http.method": "GET", "http.path": "/", "user": "u"})");
    runStatement(R"(delete_matching_keys(attributes, "^http\\."))", record);
    EXPECT_EQ(attributes(), R"({"user":"u"})");
    expectConfigError(R"(delete_matching_keys(attributes, "(unclosed"))");
}

TEST_F(EditorTest, KeepKeys) {
    givenAttributes(R"({"a": 1, "b": 2, "c": 3})");
    runStatement(R"(keep_keys(attributes, ["a", "c", "z"]))", record);
    EXPECT_EQ(attributes(), R"({"a":1,"c":3})");

    runStatement("keep_keys(attributes, [])", record);
    EXPECT_EQ(record.attributes.size(), 0);
}

TEST_F(EditorTest, KeepMatchingKeys) {
    givenAttributes(R"({"k8s.pod": "p", "k8s.node": "n", "host": "h"})");
    runStatement(R"(keep_matching_keys(attributes, "^k8s"))", record);
    EXPECT_EQ(attributes(), R"({"k8s.node":"n","k8s.pod":"p"})");
}

TEST_F(EditorTest, EditorsRequireMapTargets) {
    record.name = "text";
    ExecContext ctx;
    auto statement = newTestParser().parseStatement(R"(delete_key(name, "a"))");
    EXPECT_THROW(statement.execute(ctx, record), TypeError);
}

// limit
TEST_F(EditorTest, LimitKeepsPriorityKeysFirst) {
    givenAttributes(R"({"k1": "v1", "k2": "v2", "k3": "v3"})");
    runStatement(R"(limit(attributes, 2, ["k1"]))", record);
    ASSERT_EQ(record.attributes.size(), 2);
    EXPECT_NE(findKey(record.attributes, "k1"), nullptr);
    EXPECT_TRUE((findKey(record.attributes, "k2") != nullptr) != (findKey(record.attributes, "k3") != nullptr));
}

TEST_F(EditorTest, LimitKeepsPriorityKeyListedLast) {
    givenAttributes(R"({"a": 1, "b": 2, "c": 3, "d": 4})");
    runStatement(R"(limit(attributes, 2, ["d"]))", record);
    ASSERT_EQ(record.attributes.size(), 2);
    EXPECT_NE(findKey(record.attributes, "d"), nullptr);
}

TEST_F(EditorTest, LimitLeavesSmallMapsAlone) {
    givenAttributes(R"({"a": 1})");
    runStatement("limit(attributes, 3, [])", record);
    EXPECT_EQ(attributes(), R"({"a":1})");
    runStatement("limit(attributes, 0, [])", record);
    EXPECT_EQ(record.attributes.size(), 0);
}

TEST_F(EditorTest, LimitValidatesArguments) {
    expectConfigError("limit(attributes, -1, [])");
    expectConfigError(R"(limit(attributes, 1, ["a", "b"]))");
    expectConfigError(R"(limit(attributes, "2", []))");
}

// truncate_all
TEST_F(EditorTest, TruncateAllShortensStringsOnly) {
    givenAttributes(R"({"s": "abcdef", "short": "ab", "n": 123456})");
    runStatement("truncate_all(attributes, 3)", record);
    EXPECT_EQ(attributes(), R"({"n":123456,"s":"abc","short":"ab"})");
    expectConfigError("truncate_all(attributes, -1)");
}

TEST_F(EditorTest, TruncateAllDoesNotSplitUtf8) {
    putEmpty(record.attributes, "s")->set_string_value("h\xC3\xA9llo");
    runStatement("truncate_all(attributes, 2)", record);
    EXPECT_EQ(findKey(record.attributes, "s")->string_value(), "h");
}

// replace_*
TEST_F(EditorTest, ReplacePatternExpandsCaptures) {
    record.name = "user 123 id 45";
    runStatement(R"x(replace_pattern(name, "([0-9]+)", "<$1>"))x", record);
    EXPECT_EQ(record.name, "user <123> id <45>");
}

TEST_F(EditorTest, ReplacePatternWithFunctionAndFormat) {
    record.name = "token=abc";
    runStatement(R"(replace_pattern(name, "abc", "xyz", ToUpperCase))", record);
    EXPECT_EQ(record.name, "token=XYZ");

    record.name = "id 7";
    runStatement(R"(replace_pattern(name, "[0-9]+", "N", replacement_format = "<%s>"))", record);
    EXPECT_EQ(record.name, "id <N>");
}

TEST_F(EditorTest, ReplacePatternAppliesFunctionToEachMatch) {
    record.name = "ab 12 cd";
    runStatement(R"(replace_pattern(name, "[a-z]+", "${0}", ToUpperCase))", record);
    EXPECT_EQ(record.name, "AB 12 CD");
}

TEST_F(EditorTest, ReplacePatternHandlesEmptyMatches) {
    record.name = "abc";
    runStatement(R"(replace_pattern(name, "x*", "-"))", record);
    EXPECT_EQ(record.name, "-a-b-c-");

    record.name = "xxa";
    runStatement(R"(replace_pattern(name, "x*", "-"))", record);
    EXPECT_EQ(record.name, "-a-");
}

TEST_F(EditorTest, ReplacePatternValidatesArguments) {
    expectConfigError(R"(replace_pattern(name, "(", "x"))");
    expectConfigError(R"(replace_pattern(name, "a", "b", replacement_format = "no placeholder"))");
    expectConfigError(R"(replace_pattern(name, "a", "b", NoSuchFunction))");
}

TEST_F(EditorTest, ReplacePatternIgnoresNonStrings) {
    givenAttributes(R"({"n": 5})");
    runStatement(R"(replace_pattern(attributes["n"], "5", "6"))", record);
    EXPECT_EQ(attributes(), R"({"n":5})");
}

TEST_F(EditorTest, ReplaceAllPatternsOnValuesAndKeys) {
    givenAttributes(R"({"db.password": "secret-1", "db.user": "admin", "count": 1})");
    runStatement(R"(replace_all_patterns(attributes, "value", "secret-[0-9]", "***"))", record);
    EXPECT_EQ(attributes(), R"({"count":1,"db.password":"***","db.user":"admin"})");

    runStatement(R"(replace_all_patterns(attributes, "key", "^db\\.", "database."))", record);
    EXPECT_EQ(attributes(), R"({"count":1,"database.password":"***","database.user":"admin"})");

    expectConfigError(R"(replace_all_patterns(attributes, "both", "a", "b"))");
}

// Group numbers beyond the pattern expand to nothing and leave other entries alone
TEST_F(EditorTest, ReplaceAllPatternsWithUnknownGroup) {
    givenAttributes(R"({"a": "keep-me", "b": "xyz"})");
    runStatement(R"(replace_all_patterns(attributes, "value", "x(y)z", "$99999999999999999999999"))", record);
    EXPECT_EQ(attributes(), R"({"a":"keep-me","b":""})");

    givenAttributes(R"({"a": "keep-me", "b": "xyz"})");
    runStatement(R"(replace_all_patterns(attributes, "value", "x(y)z", "[${1}]"))", record);
    EXPECT_EQ(attributes(), R"({"a":"keep-me","b":"[y]"})");
}

TEST_F(EditorTest, PatternsOnLargeValues) {
    std::string large = "a" + std::string(200000, 'x') + "b";
    putEmpty(record.attributes, "payload")->set_string_value(large);
    putEmpty(record.attributes, "other")->set_string_value("ab");

    runStatement(R"(replace_all_matches(attributes, "a*b", "matched"))", record);
    EXPECT_EQ(attributes(), R"({"other":"matched","payload":"matched"})");

    record.name = large;
    runStatement(R"(replace_pattern(name, "x+", "-"))", record);
    EXPECT_EQ(record.name, "a-b");

    putEmpty(record.attributes, large)->set_string_value("v");
    runStatement(R"(delete_matching_keys(attributes, "^a.*b$"))", record);
    EXPECT_EQ(attributes(), R"({"other":"matched","payload":"matched"})");
}

TEST_F(EditorTest, ReplaceMatchUsesGlob) {
    record.name = "GET /users/42";
    runStatement(R"(replace_match(name, "GET /users/*", "GET /users/{id}"))", record);
    EXPECT_EQ(record.name, "GET /users/{id}");

    record.name = "POST /users/42";
    runStatement(R"(replace_match(name, "GET /users/*", "GET /users/{id}"))", record);
    EXPECT_EQ(record.name, "POST /users/42");
}

TEST_F(EditorTest, ReplaceAllMatchesRewritesMatchingValues) {
    givenAttributes(R"({"http.method": "GET", "http.path": "/a/1/b/2"})");
    runStatement(R"(replace_all_matches(attributes, "/a/*/b/*", "/a/{x}/b/{y}"))", record);
    EXPECT_EQ(findKey(record.attributes, "http.path")->string_value(), "/a/{x}/b/{y}");
    EXPECT_EQ(findKey(record.attributes, "http.method")->string_value(), "GET");
}

TEST_F(EditorTest, GlobClassesAndEscapes) {
    givenAttributes(R"({"a": "file1.txt", "b": "fileX.txt", "c": "file?.txt"})");
    runStatement(R"(replace_all_matches(attributes, "file[0-9].txt", "digit"))", record);
    runStatement(R"(replace_all_matches(attributes, "file\\?.txt", "literal"))", record);
    EXPECT_EQ(attributes(), R"({"a":"digit","b":"fileX.txt","c":"literal"})");
    expectConfigError(R"(replace_all_matches(attributes, "file[0-9", "x"))");
}

// flatten
TEST_F(EditorTest, FlattenJoinsNestedKeys) {
    givenAttributes(R"({"a": {"b": 1, "c": [10, 20]}})");
    runStatement("flatten(attributes)", record);
    EXPECT_EQ(attributes(), R"({"a.b":1,"a.c.0":10,"a.c.1":20})");
}

TEST_F(EditorTest, FlattenWithPrefixAndDepth) {
    givenAttributes(R"({"a": {"b": {"c": 1}}, "d": 2})");
    runStatement(R"(flatten(attributes, "p", 1))", record);
    EXPECT_EQ(attributes(), R"({"p.a.b":{"c":1},"p.d":2})");
}

TEST_F(EditorTest, FlattenDepthZeroOnlyAddsPrefix) {
    givenAttributes(R"({"a": {"b": 1}})");
    runStatement(R"(flatten(attributes, depth = 0, prefix = "x"))", record);
    EXPECT_EQ(attributes(), R"({"x.a":{"b":1}})");
    expectConfigError(R"(flatten(attributes, "p", -1))");
}

TEST_F(EditorTest, FlattenMapsInsideLists) {
    givenAttributes(R"({"items": [{"id": 1}, {"id": 2}]})");
    runStatement("flatten(attributes)", record);
    EXPECT_EQ(attributes(), R"({"items.0.id":1,"items.1.id":2})");
}

// merge_maps
TEST_F(EditorTest, MergeMapsStrategies) {
    givenAttributes(R"({"a": 1, "b": 2})");
    runStatement(R"(merge_maps(attributes, {"b": 20, "c": 30}, "insert"))", record);
    EXPECT_EQ(attributes(), R"({"a":1,"b":2,"c":30})");

    runStatement(R"(merge_maps(attributes, {"a": 10, "z": 0}, "update"))", record);
    EXPECT_EQ(attributes(), R"({"a":10,"b":2,"c":30})");

    runStatement(R"(merge_maps(attributes, {"b": 200, "y": 1}, "upsert"))", record);
    EXPECT_EQ(attributes(), R"({"a":10,"b":200,"c":30,"y":1})");

    expectConfigError(R"(merge_maps(attributes, {}, "replace"))");
}

TEST_F(EditorTest, MergeMapsIntoItself) {
    givenAttributes(R"({"a": 1})");
    runStatement(R"(merge_maps(attributes, attributes, "upsert"))", record);
    EXPECT_EQ(attributes(), R"({"a":1})");
}

// append
TEST_F(EditorTest, AppendCreatesAndExtendsLists) {
    runStatement(R"(append(attributes["tags"], "a"))", record);
    EXPECT_EQ(attributes(), R"({"tags":["a"]})");

    runStatement(R"(append(attributes["tags"], values = ["b", 3]))", record);
    EXPECT_EQ(attributes(), R"({"tags":["a","b",3]})");
}

TEST_F(EditorTest, AppendToScalarMakesList) {
    givenAttributes(R"({"v": "x"})");
    runStatement(R"(append(attributes["v"], "y"))", record);
    EXPECT_EQ(attributes(), R"({"v":["x","y"]})");
}

TEST_F(EditorTest, AppendNeedsAValue) {
    expectConfigError(R"(append(attributes["tags"]))");
}
