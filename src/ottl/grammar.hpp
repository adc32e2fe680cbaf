#ifndef OTTL_GRAMMAR_HPP
#define OTTL_GRAMMAR_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ottl {

enum class CompareOp { Eq, Ne, Lt, Lte, Gt, Gte };

enum class MathOp { Add, Sub, Mul, Div };

const char* compareOpSymbol(CompareOp op);
const char* mathOpSymbol(MathOp op);

// Syntax tree produced by the grammar parser. It is only used while
// statements are being compiled.
namespace ast {

struct Value;
struct MathExpression;
struct Converter;
struct BooleanExpression;

struct Key {
    std::optional<std::string> string;
    std::optional<int64_t> integer;
    // Evaluated per record: a path, converter or math expression
    std::shared_ptr<MathExpression> expression;
};

struct Field {
    std::string name;
    std::vector<Key> keys;
};

struct Path {
    std::vector<Field> fields;
    // Source text, for error messages
    std::string text;
};

struct Argument {
    std::string name;  // empty for positional arguments
    std::shared_ptr<Value> value;
    // Set when the argument is a bare uppercase identifier; the binder
    // decides between an enum symbol and a function name
    std::string symbol;
    size_t offset = 0;
};

struct Converter {
    std::string function;
    std::vector<Argument> arguments;
    std::vector<Key> keys;
    size_t offset = 0;
};

struct Editor {
    std::string function;
    std::vector<Argument> arguments;
    size_t offset = 0;
};

struct MathExpression {
    enum class Kind { Int, Float, Path, Converter, Binary, Negate };

    Kind kind = Kind::Int;
    int64_t int_value = 0;
    double float_value = 0;
    std::shared_ptr<Path> path;
    std::shared_ptr<Converter> converter;
    MathOp op = MathOp::Add;
    std::shared_ptr<MathExpression> left;   // also the operand of Negate
    std::shared_ptr<MathExpression> right;
};

struct MapEntry;

struct Value {
    enum class Kind { Nil, String, Bytes, Bool, Enum, Map, List, Math };

    Kind kind = Kind::Nil;
    std::string string;  // string content or enum symbol
    std::vector<uint8_t> bytes;
    bool boolean = false;
    std::vector<MapEntry> map;
    std::vector<Value> list;
    std::shared_ptr<MathExpression> math;
};

struct MapEntry {
    std::string key;
    Value value;
};

struct Comparison {
    Value left;
    CompareOp op = CompareOp::Eq;
    Value right;
};

struct BooleanValue {
    enum class Kind { Comparison, Constant, Converter, Subexpression };

    Kind kind = Kind::Constant;
    bool negate = false;
    Comparison comparison;
    bool constant = false;
    std::shared_ptr<Converter> converter;
    std::shared_ptr<BooleanExpression> subexpression;
};

// Terms are OR-ed, values within a term are AND-ed
struct Term {
    std::vector<BooleanValue> values;
};

struct BooleanExpression {
    std::vector<Term> terms;
};

struct Statement {
    Editor editor;
    std::shared_ptr<BooleanExpression> where;
};

} // namespace ast

// Entry points. All of them throw ParseError.
ast::Statement parseStatementSyntax(const std::string& text);
ast::BooleanExpression parseConditionSyntax(const std::string& text);
ast::Value parseValueSyntax(const std::string& text);

// First field name of every path used anywhere in the tree. Used to infer
// the context of a group of conditions from qualifiers like `resource.`
std::set<std::string> collectPathRoots(const ast::BooleanExpression& expr);
std::set<std::string> collectPathRoots(const ast::Statement& statement);

} // namespace ottl

#endif // OTTL_GRAMMAR_HPP
