#ifndef OTTL_ERROR_MODE_HPP
#define OTTL_ERROR_MODE_HPP

#include <string>

namespace ottl {

// What a sequence does when one of its statements or conditions fails
enum class ErrorMode {
    Ignore,     // log the error and continue
    Propagate,  // stop and surface the error
    Silent      // continue without logging
};

// Accepts "ignore", "propagate" and "silent" in any case. An empty string
// selects Propagate. Anything else raises ConfigError.
ErrorMode parseErrorMode(const std::string& text);

const char* errorModeName(ErrorMode mode);

} // namespace ottl

#endif // OTTL_ERROR_MODE_HPP
