// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * ZLock a distributed lock manager for conditional-write stores.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#ifndef LOCK_COORDINATOR_H
#define LOCK_COORDINATOR_H

#include <chrono>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include "common/Canceller.hpp"
#include "common/Error.hpp"
#include "common/FullJitter.hpp"
#include "common/RetryPolicy.hpp"
#include "common/Types.hpp"
#include "common/Util.hpp"
#include "lock/LockOptions.hpp"
#include "lock/LockStrategy.hpp"

namespace zlock {

enum class LockState : char {
    Idle,
    Acquiring,
    Held,
    Releasing,
    Done,
    Failed
};

std::string toString(LockState state);

template<typename T>
struct RunOutcome {
    T result;
    LockHandle handle;
    int attempts;
    // Set when release did not complete cleanly (LockLost or release budget spent).
    std::optional<Error> releaseWarning;
    LockState finalState;
    // Cancelled error when an abort arrived while the lock was held. Release
    // has already been attempted by the time it is reported.
    std::optional<Error> cancellation;
};

template<typename F>
using OperationResultT = std::conditional_t<
    std::is_void_v<std::invoke_result_t<F&>>,
    std::monostate,
    std::invoke_result_t<F&>>;

// Runs an operation under a lock: acquire with backoff, invoke, release on
// every exit path. One instance may serve concurrent invocations.
class LockCoordinator {
public:
    using TransitionListener = std::function<void(const LockIdentity&, LockState, LockState)>;

    struct Acquired {
        LockHandle handle;
        int attempts;
    };

    explicit LockCoordinator(LockStrategy& s, Clock c = systemClock());
    LockCoordinator(const LockCoordinator&) = delete;
    LockCoordinator& operator=(const LockCoordinator&) = delete;

    // Not thread-safe; set before the first run.
    void setTransitionListener(TransitionListener l);

    // The operation's return value and exceptions pass through unmodified.
    // Throws std::invalid_argument for invalid options.
    template<typename F>
    std::expected<RunOutcome<OperationResultT<F>>, Error> run(
        const LockIdentity& identity,
        const std::string& ownerHint,
        const LockOptions& options,
        F&& operation,
        const Canceller* canceller = nullptr);

    std::expected<Acquired, Error> acquire(const LockRequest& request, const RetryPolicy& policy, const Canceller* canceller = nullptr);
    std::optional<Error> release(const LockHandle& handle, int attempts);
    std::expected<std::monostate, Error> forceUnlock(const LockIdentity& identity);
    // With no ttl given, the ttl recorded by the holder is used.
    std::expected<LockStatus, Error> status(const LockIdentity& identity, std::optional<std::chrono::microseconds> ttl = std::nullopt) const;

private:
    // Releases on destruction unless release() ran, covering the exception path.
    class HeldLock {
    public:
        HeldLock(LockCoordinator& c, LockHandle h, int attempts, LockState& s);
        HeldLock(const HeldLock&) = delete;
        HeldLock& operator=(const HeldLock&) = delete;
        ~HeldLock();
        std::optional<Error> release();
    private:
        LockCoordinator& coordinator;
        LockHandle handle;
        int releaseAttempts;
        LockState& state;
        bool released;
    };

    std::expected<Acquired, Error> acquireTracked(const LockRequest& request, const RetryPolicy& policy, const Canceller* canceller, LockState& state);
    std::optional<Acquired> adopt(const LockRequest& request) const;
    bool recordGone(const LockIdentity& identity) const;
    void transition(const LockIdentity& identity, LockState& current, LockState next) const;
    static Error budgetExhausted(const LockRequest& request, const Error& last, int attempts);

    LockStrategy& strategy;
    Clock clock;
    FullJitter fullJitter;
    TransitionListener listener;
};

template<typename F>
std::expected<RunOutcome<OperationResultT<F>>, Error> LockCoordinator::run(
    const LockIdentity& identity,
    const std::string& ownerHint,
    const LockOptions& options,
    F&& operation,
    const Canceller* canceller) {
    using R = OperationResultT<F>;
    options.validate();
    LockState state = LockState::Idle;
    const LockRequest request{identity, makeOwnerId(ownerHint), options.ttl, options.stalePolicy, options.operation};
    auto acquired = acquireTracked(request, options.retry, canceller, state);
    if (!acquired.has_value()) {
        return std::unexpected {acquired.error()};
    }
    HeldLock held{*this, acquired->handle, options.releaseAttempts, state};
    R result = [&]() -> R {
        if constexpr (std::is_void_v<std::invoke_result_t<F&>>) {
            std::invoke(operation);
            return std::monostate{};
        } else {
            return std::invoke(operation);
        }
    }();
    auto warning = held.release();
    std::optional<Error> cancellation;
    if (canceller != nullptr && canceller->cancelled()) {
        const auto released = warning.has_value() ? "; releasing the lock failed" : "; the lock was released";
        cancellation = Error{ErrorCode::Cancelled, "Cancelled while holding lock on '" + identity + "'" + released, identity};
    }
    return RunOutcome<R>{
        std::move(result),
        acquired->handle,
        acquired->attempts,
        std::move(warning),
        state,
        std::move(cancellation)
    };
}

} // namespace zlock

#endif // LOCK_COORDINATOR_H
