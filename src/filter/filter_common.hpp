#ifndef FILTER_COMMON_HPP
#define FILTER_COMMON_HPP

#include "../ottl/error_mode.hpp"
#include "../ottl/errors.hpp"
#include "../ottl/exec_context.hpp"
#include "../ottl/grammar.hpp"
#include "../ottl/parser.hpp"
#include "../ottl/statements.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

enum class FilterStatus {
    OK,
    SKIP_PROCESSING_DATA,  // Every resource was removed, nothing to forward
    ERROR                  // Evaluation failed under the propagate error mode
};

struct FilterResult {
    FilterStatus status = FilterStatus::OK;
    int64_t dropped = 0;
    std::string error;  // First evaluation error, set with ERROR
};

// Compiles the conditions of one level into a single OR-combined BoolExpr.
// Returns nullptr when there are no conditions.
template <typename K>
ottl::BoolExprPtr<K> buildBoolExpr(const std::vector<std::string>& conditions,
                                   const ottl::FactoryMap<K>& functions,
                                   ottl::ErrorMode error_mode) {
    if (conditions.empty()) {
        return nullptr;
    }
    ottl::Parser<K> parser = K::newParser(functions);
    return std::make_shared<ottl::ConditionSequence<K>>(parser.parseConditions(conditions), error_mode,
                                                        ottl::LogicOperation::Or);
}

// Evaluates a drop condition for one element. A failure keeps the element
// and is remembered in `result`.
template <typename K>
bool shouldDrop(const ottl::BoolExprPtr<K>& expr, const ottl::ExecContext& ctx, K& tctx, FilterResult& result) {
    if (!expr) {
        return false;
    }
    try {
        return expr->eval(ctx, tctx);
    } catch (const ottl::Error& e) {
        if (result.error.empty()) {
            result.error = e.what();
        }
        result.status = FilterStatus::ERROR;
        return false;
    }
}

// Picks the context of a condition group from the qualifiers its paths use.
// `levels` lists the signal's contexts from the outermost to the innermost;
// the innermost level used wins. Raises ConfigError when no path is qualified.
std::string inferContext(const std::vector<std::string>& conditions, const std::vector<std::string>& levels);

// Maps `instrumentation_scope` to `scope` and rejects names outside `levels`
std::string normalizeContext(const std::string& context, const std::vector<std::string>& levels);

#endif // FILTER_COMMON_HPP
