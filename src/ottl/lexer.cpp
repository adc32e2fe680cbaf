#include "lexer.hpp"
#include "errors.hpp"
#include <cctype>

namespace ottl {

namespace {

bool isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace

const char* tokenTypeName(TokenType type) {
    switch (type) {
        case TokenType::End: return "end of input";
        case TokenType::Identifier: return "identifier";
        case TokenType::String: return "string";
        case TokenType::Int: return "int";
        case TokenType::Float: return "float";
        case TokenType::Bytes: return "bytes";
        case TokenType::LParen: return "\"(\"";
        case TokenType::RParen: return "\")\"";
        case TokenType::LBracket: return "\"[\"";
        case TokenType::RBracket: return "\"]\"";
        case TokenType::LBrace: return "\"{\"";
        case TokenType::RBrace: return "\"}\"";
        case TokenType::Comma: return "\",\"";
        case TokenType::Dot: return "\".\"";
        case TokenType::Colon: return "\":\"";
        case TokenType::Assign: return "\"=\"";
        case TokenType::Compare: return "comparison operator";
        case TokenType::Plus: return "\"+\"";
        case TokenType::Minus: return "\"-\"";
        case TokenType::Star: return "\"*\"";
        case TokenType::Slash: return "\"/\"";
    }
    return "token";
}

std::vector<Token> tokenize(const std::string& text) {
    std::vector<Token> tokens;
    size_t i = 0;
    const size_t n = text.size();

    auto push = [&tokens](TokenType type, std::string value, size_t start, size_t end) {
        tokens.push_back(Token{type, std::move(value), start, end - start});
    };

    while (i < n) {
        char c = text[i];
        size_t start = i;

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        if (isIdentStart(c)) {
            while (i < n && isIdentChar(text[i])) ++i;
            push(TokenType::Identifier, text.substr(start, i - start), start, i);
            continue;
        }

        if (c == '0' && i + 1 < n && (text[i + 1] == 'x' || text[i + 1] == 'X')) {
            i += 2;
            while (i < n && std::isxdigit(static_cast<unsigned char>(text[i]))) ++i;
            std::string digits = text.substr(start + 2, i - start - 2);
            if (digits.empty() || digits.size() % 2 != 0) {
                throw ParseError("invalid bytes literal", text, start);
            }
            push(TokenType::Bytes, digits, start, i);
            continue;
        }

        if (isDigit(c)) {
            bool is_float = false;
            while (i < n && isDigit(text[i])) ++i;
            if (i + 1 < n && text[i] == '.' && isDigit(text[i + 1])) {
                is_float = true;
                ++i;
                while (i < n && isDigit(text[i])) ++i;
            }
            if (i < n && (text[i] == 'e' || text[i] == 'E')) {
                size_t j = i + 1;
                if (j < n && (text[j] == '+' || text[j] == '-')) ++j;
                if (j < n && isDigit(text[j])) {
                    is_float = true;
                    i = j;
                    while (i < n && isDigit(text[i])) ++i;
                }
            }
            if (i < n && isIdentStart(text[i])) {
                throw ParseError("invalid number literal", text, start);
            }
            push(is_float ? TokenType::Float : TokenType::Int, text.substr(start, i - start), start, i);
            continue;
        }

        if (c == '"') {
            std::string value;
            ++i;
            bool closed = false;
            while (i < n) {
                char ch = text[i];
                if (ch == '"') {
                    closed = true;
                    ++i;
                    break;
                }
                if (ch == '\\') {
                    if (i + 1 >= n) break;
                    char esc = text[i + 1];
                    switch (esc) {
                        case '"': value += '"'; break;
                        case '\\': value += '\\'; break;
                        case 'n': value += '\n'; break;
                        case 't': value += '\t'; break;
                        case 'r': value += '\r'; break;
                        case '/': value += '/'; break;
                        default:
                            throw ParseError(std::string("invalid escape sequence \\") + esc, text, i);
                    }
                    i += 2;
                    continue;
                }
                value += ch;
                ++i;
            }
            if (!closed) {
                throw ParseError("unterminated string", text, start);
            }
            push(TokenType::String, value, start, i);
            continue;
        }

        switch (c) {
            case '(': push(TokenType::LParen, "(", start, ++i); continue;
            case ')': push(TokenType::RParen, ")", start, ++i); continue;
            case '[': push(TokenType::LBracket, "[", start, ++i); continue;
            case ']': push(TokenType::RBracket, "]", start, ++i); continue;
            case '{': push(TokenType::LBrace, "{", start, ++i); continue;
            case '}': push(TokenType::RBrace, "}", start, ++i); continue;
            case ',': push(TokenType::Comma, ",", start, ++i); continue;
            case '.': push(TokenType::Dot, ".", start, ++i); continue;
            case ':': push(TokenType::Colon, ":", start, ++i); continue;
            case '+': push(TokenType::Plus, "+", start, ++i); continue;
            case '-': push(TokenType::Minus, "-", start, ++i); continue;
            case '*': push(TokenType::Star, "*", start, ++i); continue;
            case '/': push(TokenType::Slash, "/", start, ++i); continue;
            default: break;
        }

        if (c == '=' || c == '!' || c == '<' || c == '>') {
            bool followed_by_eq = i + 1 < n && text[i + 1] == '=';
            if (c == '=') {
                if (followed_by_eq) {
                    i += 2;
                    push(TokenType::Compare, "==", start, i);
                } else {
                    push(TokenType::Assign, "=", start, ++i);
                }
                continue;
            }
            if (c == '!') {
                if (!followed_by_eq) {
                    throw ParseError("unexpected character '!'", text, start);
                }
                i += 2;
                push(TokenType::Compare, "!=", start, i);
                continue;
            }
            i += followed_by_eq ? 2 : 1;
            push(TokenType::Compare, text.substr(start, i - start), start, i);
            continue;
        }

        throw ParseError(std::string("unexpected character '") + c + "'", text, start);
    }

    tokens.push_back(Token{TokenType::End, "", n, 0});
    return tokens;
}

} // namespace ottl
