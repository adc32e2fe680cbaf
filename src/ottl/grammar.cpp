#include "grammar.hpp"
#include "coercion.hpp"
#include "errors.hpp"
#include "lexer.hpp"
#include <cctype>

namespace ottl {

const char* compareOpSymbol(CompareOp op) {
    switch (op) {
        case CompareOp::Eq: return "==";
        case CompareOp::Ne: return "!=";
        case CompareOp::Lt: return "<";
        case CompareOp::Lte: return "<=";
        case CompareOp::Gt: return ">";
        case CompareOp::Gte: return ">=";
    }
    return "?";
}

const char* mathOpSymbol(MathOp op) {
    switch (op) {
        case MathOp::Add: return "+";
        case MathOp::Sub: return "-";
        case MathOp::Mul: return "*";
        case MathOp::Div: return "/";
    }
    return "?";
}

namespace {

bool isUpper(const std::string& ident) {
    return !ident.empty() && std::isupper(static_cast<unsigned char>(ident[0]));
}

bool isKeyword(const std::string& ident) {
    return ident == "where" || ident == "and" || ident == "or" || ident == "not" ||
           ident == "true" || ident == "false" || ident == "nil";
}

// Recursive descent over the token stream. Boolean values are ambiguous
// between comparisons and parenthesized sub-expressions, so that choice
// backtracks.
class GrammarParser {
public:
    explicit GrammarParser(const std::string& text) : text_(text), tokens_(tokenize(text)) {}

    ast::Statement statement() {
        ast::Statement stmt;
        const Token& name = peek();
        if (name.type != TokenType::Identifier || peek(1).type != TokenType::LParen) {
            fail("statement must start with an editor invocation");
        }
        if (isUpper(name.text)) {
            fail("converter " + name.text + " cannot be used as a statement; "
                 "editor names must start with a lowercase letter");
        }
        stmt.editor.function = name.text;
        stmt.editor.offset = name.offset;
        advance();
        stmt.editor.arguments = arguments();
        if (peek().type == TokenType::LBracket) {
            fail("editor " + stmt.editor.function + " cannot be indexed");
        }
        if (acceptKeyword("where")) {
            stmt.where = std::make_shared<ast::BooleanExpression>(booleanExpression());
        }
        expectEnd();
        return stmt;
    }

    ast::BooleanExpression condition() {
        ast::BooleanExpression expr = booleanExpression();
        expectEnd();
        return expr;
    }

    ast::Value standaloneValue() {
        ast::Value v = value();
        expectEnd();
        return v;
    }

private:
    const Token& peek(size_t ahead = 0) const {
        size_t idx = pos_ + ahead;
        if (idx >= tokens_.size()) {
            return tokens_.back();
        }
        return tokens_[idx];
    }

    const Token& advance() {
        const Token& t = tokens_[pos_];
        if (pos_ + 1 < tokens_.size()) {
            ++pos_;
        }
        return t;
    }

    [[noreturn]] void fail(const std::string& message) const {
        throw ParseError(message, text_, peek().offset);
    }

    const Token& expect(TokenType type) {
        if (peek().type != type) {
            fail(std::string("expected ") + tokenTypeName(type) + " but found " + describe(peek()));
        }
        return advance();
    }

    void expectEnd() {
        if (peek().type != TokenType::End) {
            fail("unexpected " + describe(peek()));
        }
    }

    static std::string describe(const Token& t) {
        if (t.type == TokenType::End) {
            return tokenTypeName(t.type);
        }
        return std::string(tokenTypeName(t.type)) + " \"" + t.text + "\"";
    }

    bool peekKeyword(const char* word, size_t ahead = 0) const {
        const Token& t = peek(ahead);
        return t.type == TokenType::Identifier && t.text == word;
    }

    bool acceptKeyword(const char* word) {
        if (peekKeyword(word)) {
            advance();
            return true;
        }
        return false;
    }

    ast::BooleanExpression booleanExpression() {
        ast::BooleanExpression expr;
        expr.terms.push_back(term());
        while (acceptKeyword("or")) {
            expr.terms.push_back(term());
        }
        return expr;
    }

    ast::Term term() {
        ast::Term t;
        t.values.push_back(booleanValue());
        while (acceptKeyword("and")) {
            t.values.push_back(booleanValue());
        }
        return t;
    }

    ast::BooleanValue booleanValue() {
        ast::BooleanValue result;
        result.negate = acceptKeyword("not");

        size_t save = pos_;
        bool saw_compare = false;
        try {
            ast::Value left = value();
            if (peek().type == TokenType::Compare) {
                saw_compare = true;
                result.kind = ast::BooleanValue::Kind::Comparison;
                result.comparison.left = std::move(left);
                result.comparison.op = compareOp(advance().text);
                result.comparison.right = value();
                return result;
            }
        } catch (const ParseError&) {
            // Once an operator was seen the right operand is what failed
            if (saw_compare) {
                throw;
            }
        }
        pos_ = save;

        const Token& t = peek();
        if (peekKeyword("true") || peekKeyword("false")) {
            result.kind = ast::BooleanValue::Kind::Constant;
            result.constant = advance().text == "true";
            return result;
        }
        if (t.type == TokenType::Identifier && isUpper(t.text) && peek(1).type == TokenType::LParen) {
            result.kind = ast::BooleanValue::Kind::Converter;
            result.converter = converter();
            return result;
        }
        if (t.type == TokenType::LParen) {
            advance();
            result.kind = ast::BooleanValue::Kind::Subexpression;
            result.subexpression = std::make_shared<ast::BooleanExpression>(booleanExpression());
            expect(TokenType::RParen);
            return result;
        }
        fail("expected a boolean value but found " + describe(t));
    }

    static CompareOp compareOp(const std::string& symbol) {
        if (symbol == "==") return CompareOp::Eq;
        if (symbol == "!=") return CompareOp::Ne;
        if (symbol == "<") return CompareOp::Lt;
        if (symbol == "<=") return CompareOp::Lte;
        if (symbol == ">") return CompareOp::Gt;
        return CompareOp::Gte;
    }

    ast::Value value() {
        ast::Value v;
        const Token& t = peek();
        switch (t.type) {
            case TokenType::String:
                v.kind = ast::Value::Kind::String;
                v.string = advance().text;
                return v;
            case TokenType::Bytes: {
                v.kind = ast::Value::Kind::Bytes;
                const std::string& hex = advance().text;
                for (size_t i = 0; i < hex.size(); i += 2) {
                    v.bytes.push_back(static_cast<uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
                }
                return v;
            }
            case TokenType::LBrace:
                return mapLiteral();
            case TokenType::LBracket:
                return listLiteral();
            case TokenType::Identifier:
                if (t.text == "nil") {
                    advance();
                    v.kind = ast::Value::Kind::Nil;
                    return v;
                }
                if (t.text == "true" || t.text == "false") {
                    v.kind = ast::Value::Kind::Bool;
                    v.boolean = advance().text == "true";
                    return v;
                }
                if (isUpper(t.text) && peek(1).type != TokenType::LParen) {
                    v.kind = ast::Value::Kind::Enum;
                    v.string = advance().text;
                    return v;
                }
                break;
            default:
                break;
        }
        v.kind = ast::Value::Kind::Math;
        v.math = mathExpression();
        return v;
    }

    ast::Value mapLiteral() {
        ast::Value v;
        v.kind = ast::Value::Kind::Map;
        expect(TokenType::LBrace);
        while (peek().type != TokenType::RBrace) {
            ast::MapEntry entry;
            entry.key = expect(TokenType::String).text;
            expect(TokenType::Colon);
            entry.value = value();
            v.map.push_back(std::move(entry));
            if (peek().type != TokenType::Comma) {
                break;
            }
            advance();
        }
        expect(TokenType::RBrace);
        return v;
    }

    ast::Value listLiteral() {
        ast::Value v;
        v.kind = ast::Value::Kind::List;
        expect(TokenType::LBracket);
        if (peek().type != TokenType::RBracket) {
            v.list.push_back(value());
            while (peek().type == TokenType::Comma) {
                advance();
                v.list.push_back(value());
            }
        }
        expect(TokenType::RBracket);
        return v;
    }

    std::shared_ptr<ast::MathExpression> mathExpression() {
        auto left = mathTerm();
        while (peek().type == TokenType::Plus || peek().type == TokenType::Minus) {
            auto node = std::make_shared<ast::MathExpression>();
            node->kind = ast::MathExpression::Kind::Binary;
            node->op = advance().type == TokenType::Plus ? MathOp::Add : MathOp::Sub;
            node->left = left;
            node->right = mathTerm();
            left = node;
        }
        return left;
    }

    std::shared_ptr<ast::MathExpression> mathTerm() {
        auto left = unary();
        while (peek().type == TokenType::Star || peek().type == TokenType::Slash) {
            auto node = std::make_shared<ast::MathExpression>();
            node->kind = ast::MathExpression::Kind::Binary;
            node->op = advance().type == TokenType::Star ? MathOp::Mul : MathOp::Div;
            node->left = left;
            node->right = unary();
            left = node;
        }
        return left;
    }

    std::shared_ptr<ast::MathExpression> unary() {
        if (peek().type == TokenType::Plus) {
            advance();
            return unary();
        }
        if (peek().type != TokenType::Minus) {
            return primary();
        }
        advance();

        // Negative literals are folded so that the minimum int64 stays representable
        if (peek().type == TokenType::Int) {
            const Token& t = advance();
            auto node = std::make_shared<ast::MathExpression>();
            node->kind = ast::MathExpression::Kind::Int;
            if (!parseInt64("-" + t.text, node->int_value)) {
                throw ParseError("integer literal out of range", text_, t.offset);
            }
            return node;
        }
        if (peek().type == TokenType::Float) {
            auto node = primary();
            node->float_value = -node->float_value;
            return node;
        }

        auto operand = unary();
        if (operand->kind == ast::MathExpression::Kind::Int) {
            // Wraps like runtime negation; - -9223372036854775808 stays the minimum
            operand->int_value = static_cast<int64_t>(0 - static_cast<uint64_t>(operand->int_value));
            return operand;
        }
        if (operand->kind == ast::MathExpression::Kind::Float) {
            operand->float_value = -operand->float_value;
            return operand;
        }
        auto node = std::make_shared<ast::MathExpression>();
        node->kind = ast::MathExpression::Kind::Negate;
        node->left = operand;
        return node;
    }

    std::shared_ptr<ast::MathExpression> primary() {
        const Token& t = peek();
        auto node = std::make_shared<ast::MathExpression>();
        switch (t.type) {
            case TokenType::Int:
                node->kind = ast::MathExpression::Kind::Int;
                if (!parseInt64(t.text, node->int_value)) {
                    fail("integer literal out of range");
                }
                advance();
                return node;
            case TokenType::Float:
                node->kind = ast::MathExpression::Kind::Float;
                if (!parseDouble(t.text, node->float_value)) {
                    fail("invalid float literal");
                }
                advance();
                return node;
            case TokenType::LParen: {
                advance();
                auto inner = mathExpression();
                expect(TokenType::RParen);
                return inner;
            }
            case TokenType::Identifier:
                if (isKeyword(t.text)) {
                    fail("unexpected keyword \"" + t.text + "\"");
                }
                if (isUpper(t.text)) {
                    if (peek(1).type != TokenType::LParen) {
                        fail("enum " + t.text + " cannot be used in a math expression");
                    }
                    node->kind = ast::MathExpression::Kind::Converter;
                    node->converter = converter();
                    return node;
                }
                if (peek(1).type == TokenType::LParen) {
                    fail("editor " + t.text + " cannot be used as a value; "
                         "converter names must start with an uppercase letter");
                }
                node->kind = ast::MathExpression::Kind::Path;
                node->path = path();
                return node;
            default:
                fail("expected a value but found " + describe(t));
        }
    }

    std::shared_ptr<ast::Path> path() {
        auto p = std::make_shared<ast::Path>();
        size_t start = peek().offset;
        size_t end = start;
        while (true) {
            const Token& name = expect(TokenType::Identifier);
            if (isUpper(name.text) || isKeyword(name.text)) {
                throw ParseError("invalid path segment \"" + name.text + "\"", text_, name.offset);
            }
            ast::Field field;
            field.name = name.text;
            end = name.offset + name.length;
            field.keys = keys(end);
            p->fields.push_back(std::move(field));
            if (peek().type != TokenType::Dot) {
                break;
            }
            advance();
        }
        p->text = text_.substr(start, end - start);
        return p;
    }

    std::vector<ast::Key> keys(size_t& end) {
        std::vector<ast::Key> result;
        while (peek().type == TokenType::LBracket) {
            advance();
            ast::Key key;
            if (peek().type == TokenType::String && peek(1).type == TokenType::RBracket) {
                key.string = advance().text;
            } else {
                auto expr = mathExpression();
                if (expr->kind == ast::MathExpression::Kind::Int) {
                    key.integer = expr->int_value;
                } else if (expr->kind == ast::MathExpression::Kind::Float) {
                    fail("keys must be strings, integers or expressions");
                } else {
                    key.expression = expr;
                }
            }
            const Token& close = expect(TokenType::RBracket);
            end = close.offset + close.length;
            result.push_back(std::move(key));
        }
        return result;
    }

    std::shared_ptr<ast::Converter> converter() {
        auto c = std::make_shared<ast::Converter>();
        const Token& name = expect(TokenType::Identifier);
        c->function = name.text;
        c->offset = name.offset;
        c->arguments = arguments();
        size_t end = 0;
        c->keys = keys(end);
        return c;
    }

    std::vector<ast::Argument> arguments() {
        std::vector<ast::Argument> args;
        expect(TokenType::LParen);
        if (peek().type == TokenType::RParen) {
            advance();
            return args;
        }
        while (true) {
            args.push_back(argument());
            if (peek().type != TokenType::Comma) {
                break;
            }
            advance();
        }
        expect(TokenType::RParen);
        return args;
    }

    ast::Argument argument() {
        ast::Argument arg;
        arg.offset = peek().offset;
        if (peek().type == TokenType::Identifier && peek(1).type == TokenType::Assign) {
            arg.name = advance().text;
            advance();
        }
        const Token& t = peek();
        if (t.type == TokenType::Identifier && isUpper(t.text) &&
            peek(1).type != TokenType::LParen) {
            arg.symbol = t.text;
        }
        arg.value = std::make_shared<ast::Value>(value());
        return arg;
    }

    const std::string& text_;
    std::vector<Token> tokens_;
    size_t pos_ = 0;
};

void collectValue(const ast::Value& value, std::set<std::string>& roots);
void collectBoolean(const ast::BooleanExpression& expr, std::set<std::string>& roots);

void collectKeys(const std::vector<ast::Key>& keys, std::set<std::string>& roots);

void collectMath(const ast::MathExpression& expr, std::set<std::string>& roots) {
    switch (expr.kind) {
        case ast::MathExpression::Kind::Path:
            roots.insert(expr.path->fields.front().name);
            for (const auto& field : expr.path->fields) {
                collectKeys(field.keys, roots);
            }
            break;
        case ast::MathExpression::Kind::Converter:
            for (const auto& arg : expr.converter->arguments) {
                collectValue(*arg.value, roots);
            }
            collectKeys(expr.converter->keys, roots);
            break;
        case ast::MathExpression::Kind::Binary:
            collectMath(*expr.left, roots);
            collectMath(*expr.right, roots);
            break;
        case ast::MathExpression::Kind::Negate:
            collectMath(*expr.left, roots);
            break;
        default:
            break;
    }
}

void collectKeys(const std::vector<ast::Key>& keys, std::set<std::string>& roots) {
    for (const auto& key : keys) {
        if (key.expression) {
            collectMath(*key.expression, roots);
        }
    }
}

void collectValue(const ast::Value& value, std::set<std::string>& roots) {
    switch (value.kind) {
        case ast::Value::Kind::Math:
            collectMath(*value.math, roots);
            break;
        case ast::Value::Kind::List:
            for (const auto& item : value.list) {
                collectValue(item, roots);
            }
            break;
        case ast::Value::Kind::Map:
            for (const auto& entry : value.map) {
                collectValue(entry.value, roots);
            }
            break;
        default:
            break;
    }
}

void collectBoolean(const ast::BooleanExpression& expr, std::set<std::string>& roots) {
    for (const auto& term : expr.terms) {
        for (const auto& value : term.values) {
            switch (value.kind) {
                case ast::BooleanValue::Kind::Comparison:
                    collectValue(value.comparison.left, roots);
                    collectValue(value.comparison.right, roots);
                    break;
                case ast::BooleanValue::Kind::Converter: {
                    ast::MathExpression wrapper;
                    wrapper.kind = ast::MathExpression::Kind::Converter;
                    wrapper.converter = value.converter;
                    collectMath(wrapper, roots);
                    break;
                }
                case ast::BooleanValue::Kind::Subexpression:
                    collectBoolean(*value.subexpression, roots);
                    break;
                default:
                    break;
            }
        }
    }
}

} // namespace

ast::Statement parseStatementSyntax(const std::string& text) {
    GrammarParser parser(text);
    return parser.statement();
}

ast::BooleanExpression parseConditionSyntax(const std::string& text) {
    GrammarParser parser(text);
    return parser.condition();
}

ast::Value parseValueSyntax(const std::string& text) {
    GrammarParser parser(text);
    return parser.standaloneValue();
}

std::set<std::string> collectPathRoots(const ast::BooleanExpression& expr) {
    std::set<std::string> roots;
    collectBoolean(expr, roots);
    return roots;
}

std::set<std::string> collectPathRoots(const ast::Statement& statement) {
    std::set<std::string> roots;
    for (const auto& arg : statement.editor.arguments) {
        collectValue(*arg.value, roots);
    }
    if (statement.where) {
        collectBoolean(*statement.where, roots);
    }
    return roots;
}

} // namespace ottl
