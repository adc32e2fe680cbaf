#ifndef OTTL_STATEMENTS_HPP
#define OTTL_STATEMENTS_HPP

#include "error_mode.hpp"
#include "errors.hpp"
#include "functions.hpp"
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace ottl {

template <typename K>
using BoolExprFunc = std::function<bool(const ExecContext&, K&)>;

// A compiled `editor(...) where ...` statement
template <typename K>
class Statement {
public:
    Statement(ExprFunc<K> function, BoolExprFunc<K> condition, std::string text)
        : function_(std::move(function)), condition_(std::move(condition)), text_(std::move(text)) {}

    // Runs the editor when the where-clause holds. Returns whether it ran.
    bool execute(const ExecContext& ctx, K& tctx) const {
        if (condition_ && !condition_(ctx, tctx)) {
            return false;
        }
        function_(ctx, tctx);
        return true;
    }

    const std::string& text() const { return text_; }

private:
    ExprFunc<K> function_;
    BoolExprFunc<K> condition_;
    std::string text_;
};

// A compiled boolean expression
template <typename K>
class Condition {
public:
    Condition(BoolExprFunc<K> condition, std::string text)
        : condition_(std::move(condition)), text_(std::move(text)) {}

    bool eval(const ExecContext& ctx, K& tctx) const { return condition_(ctx, tctx); }

    const std::string& text() const { return text_; }

private:
    BoolExprFunc<K> condition_;
    std::string text_;
};

// Predicate over one transform context
template <typename K>
class BoolExpr {
public:
    virtual ~BoolExpr() = default;

    virtual bool eval(const ExecContext& ctx, K& tctx) const = 0;
};

template <typename K>
using BoolExprPtr = std::shared_ptr<const BoolExpr<K>>;

enum class LogicOperation { And, Or };

// Evaluates conditions in order under an ErrorMode. With Or the first true
// condition wins; with And the first false (or failed) condition loses. A
// failed condition counts as false unless the mode is Propagate, in which
// case the error is raised.
template <typename K>
class ConditionSequence : public BoolExpr<K> {
public:
    ConditionSequence(std::vector<Condition<K>> conditions, ErrorMode error_mode,
                      LogicOperation logic_op = LogicOperation::Or)
        : conditions_(std::move(conditions)), error_mode_(error_mode), logic_op_(logic_op) {}

    bool eval(const ExecContext& ctx, K& tctx) const override {
        bool at_least_one_match = false;
        for (const auto& condition : conditions_) {
            bool match = false;
            try {
                match = condition.eval(ctx, tctx);
            } catch (const Error& e) {
                if (error_mode_ == ErrorMode::Propagate) {
                    throw EvalError("failed to eval condition: " + condition.text() + ": " + e.what());
                }
                if (error_mode_ == ErrorMode::Ignore) {
                    std::cerr << "failed to eval condition, ignoring: " << condition.text()
                              << ": " << e.what() << std::endl;
                }
                if (logic_op_ == LogicOperation::And) {
                    return false;
                }
                continue;
            }
            if (match) {
                if (logic_op_ == LogicOperation::Or) {
                    return true;
                }
                at_least_one_match = true;
            } else if (logic_op_ == LogicOperation::And) {
                return false;
            }
        }
        return at_least_one_match;
    }

    size_t size() const { return conditions_.size(); }

private:
    std::vector<Condition<K>> conditions_;
    ErrorMode error_mode_;
    LogicOperation logic_op_;
};

// Executes statements in order under an ErrorMode
template <typename K>
class StatementSequence {
public:
    StatementSequence(std::vector<Statement<K>> statements, ErrorMode error_mode)
        : statements_(std::move(statements)), error_mode_(error_mode) {}

    void execute(const ExecContext& ctx, K& tctx) const {
        for (const auto& statement : statements_) {
            try {
                statement.execute(ctx, tctx);
            } catch (const Error& e) {
                if (error_mode_ == ErrorMode::Propagate) {
                    throw EvalError("failed to execute statement: " + statement.text() + ": " + e.what());
                }
                if (error_mode_ == ErrorMode::Ignore) {
                    std::cerr << "failed to execute statement, ignoring: " << statement.text()
                              << ": " << e.what() << std::endl;
                }
            }
        }
    }

    size_t size() const { return statements_.size(); }

private:
    std::vector<Statement<K>> statements_;
    ErrorMode error_mode_;
};

} // namespace ottl

#endif // OTTL_STATEMENTS_HPP
