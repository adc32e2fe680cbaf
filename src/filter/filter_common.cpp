#include "filter_common.hpp"
#include <algorithm>

std::string normalizeContext(const std::string& context, const std::vector<std::string>& levels) {
    std::string name = context == "instrumentation_scope" ? "scope" : context;
    if (std::find(levels.begin(), levels.end(), name) == levels.end()) {
        std::string valid;
        for (const auto& level : levels) {
            if (!valid.empty()) valid += ", ";
            valid += level;
        }
        throw ottl::ConfigError("unknown context \"" + context + "\", expected one of: " + valid);
    }
    return name;
}

std::string inferContext(const std::vector<std::string>& conditions, const std::vector<std::string>& levels) {
    int best = -1;
    for (const auto& condition : conditions) {
        for (const auto& root : ottl::collectPathRoots(ottl::parseConditionSyntax(condition))) {
            std::string name = root == "instrumentation_scope" ? "scope" : root;
            auto it = std::find(levels.begin(), levels.end(), name);
            if (it != levels.end()) {
                best = std::max(best, static_cast<int>(it - levels.begin()));
            }
        }
    }
    if (best < 0) {
        throw ottl::ConfigError("unable to infer a context from conditions, qualify a path with one of the "
                                "context names or set the group's context");
    }
    return levels[static_cast<size_t>(best)];
}
