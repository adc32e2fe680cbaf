#include "error_mode.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>

namespace ottl {

ErrorMode parseErrorMode(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower.empty() || lower == "propagate") {
        return ErrorMode::Propagate;
    }
    if (lower == "ignore") {
        return ErrorMode::Ignore;
    }
    if (lower == "silent") {
        return ErrorMode::Silent;
    }
    throw ConfigError("unknown error mode \"" + text + "\"; expected ignore, propagate or silent");
}

const char* errorModeName(ErrorMode mode) {
    switch (mode) {
        case ErrorMode::Ignore: return "ignore";
        case ErrorMode::Propagate: return "propagate";
        case ErrorMode::Silent: return "silent";
    }
    return "unknown";
}

} // namespace ottl
