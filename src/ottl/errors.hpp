#ifndef OTTL_ERRORS_HPP
#define OTTL_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <cstddef>

namespace ottl {

// Base class of every error raised by the expression engine
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Raised while statements and conditions are being compiled: unknown paths,
// unknown functions, bad arguments, invalid literals
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message) : Error(message) {}
};

// Syntax error in statement text, with the byte offset of the offending token
class ParseError : public ConfigError {
public:
    ParseError(const std::string& message, const std::string& text, size_t offset)
        : ConfigError("unable to parse OTTL expression \"" + text + "\": " + message +
                      " (at offset " + std::to_string(offset) + ")"),
          text_(text), offset_(offset) {}

    const std::string& text() const { return text_; }
    size_t offset() const { return offset_; }

private:
    std::string text_;
    size_t offset_;
};

// A strict getter observed a value of the wrong kind
class TypeError : public Error {
public:
    explicit TypeError(const std::string& message) : Error(message) {}
};

// Domain failure while evaluating one record (division by zero, index out of
// range, invalid encoding)
class EvalError : public Error {
public:
    explicit EvalError(const std::string& message) : Error(message) {}
};

} // namespace ottl

#endif // OTTL_ERRORS_HPP
