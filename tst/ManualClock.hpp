#ifndef MANUAL_CLOCK_H
#define MANUAL_CLOCK_H

#include <chrono>
#include <memory>
#include <mutex>
#include "common/Types.hpp"

// Test clock that only moves when told to. Copies of clock() share state.
class ManualClock {
public:
    explicit ManualClock(zlock::Timestamp start = zlock::Timestamp{std::chrono::seconds{1'700'000'000L}})
        : state {std::make_shared<State>(start)} {}

    zlock::Clock clock() const {
        return [s = state] {
            std::lock_guard lock {s->m};
            return s->now;
        };
    }

    void advance(std::chrono::microseconds d) {
        std::lock_guard lock {state->m};
        state->now += d;
    }

    zlock::Timestamp now() const {
        std::lock_guard lock {state->m};
        return state->now;
    }
private:
    struct State {
        explicit State(zlock::Timestamp t) : now {t} {}
        std::mutex m;
        zlock::Timestamp now;
    };
    std::shared_ptr<State> state;
};

#endif // MANUAL_CLOCK_H
