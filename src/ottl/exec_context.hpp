#ifndef OTTL_EXEC_CONTEXT_HPP
#define OTTL_EXEC_CONTEXT_HPP

#include "value.hpp"
#include <chrono>

namespace ottl {

// Source of the current time for Now() and time-based converters
class Clock {
public:
    virtual ~Clock() = default;
    virtual Time now() const = 0;
};

class SystemClock : public Clock {
public:
    Time now() const override {
        return std::chrono::time_point_cast<Duration>(std::chrono::system_clock::now());
    }

    static const SystemClock& instance() {
        static const SystemClock clock;
        return clock;
    }
};

// Host context threaded through every evaluation. Evaluation never mutates it.
class ExecContext {
public:
    ExecContext() : clock_(&SystemClock::instance()) {}
    explicit ExecContext(const Clock& clock) : clock_(&clock) {}

    Time now() const { return clock_->now(); }

private:
    const Clock* clock_;
};

} // namespace ottl

#endif // OTTL_EXEC_CONTEXT_HPP
