#ifndef OTTL_LEXER_HPP
#define OTTL_LEXER_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace ottl {

enum class TokenType {
    End,
    Identifier,
    String,
    Int,
    Float,
    Bytes,
    LParen,
    RParen,
    LBracket,
    RBracket,
    LBrace,
    RBrace,
    Comma,
    Dot,
    Colon,
    Assign,
    Compare,  // == != < <= > >=
    Plus,
    Minus,
    Star,
    Slash
};

struct Token {
    TokenType type;
    // Identifier name, unescaped string content, number or hex digits, operator
    std::string text;
    size_t offset;
    size_t length;
};

// Splits statement text into tokens. The result always ends with an End token.
// Throws ParseError on characters that cannot start a token, unterminated
// strings and invalid escapes.
std::vector<Token> tokenize(const std::string& text);

const char* tokenTypeName(TokenType type);

} // namespace ottl

#endif // OTTL_LEXER_HPP
