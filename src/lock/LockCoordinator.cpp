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
#include "lock/LockCoordinator.hpp"
#include "common/Error.hpp"
#include "common/ExponentialBackoff.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace zlock {

namespace {

constexpr std::chrono::milliseconds releaseRetryDelay {50};

} // namespace

std::string toString(LockState state) {
    switch (state) {
        case LockState::Idle: return "Idle";
        case LockState::Acquiring: return "Acquiring";
        case LockState::Held: return "Held";
        case LockState::Releasing: return "Releasing";
        case LockState::Done: return "Done";
        case LockState::Failed: return "Failed";
    }
    std::unreachable();
}

LockCoordinator::LockCoordinator(LockStrategy& s, Clock c)
    : strategy {s},
      clock {std::move(c)},
      fullJitter {},
      listener {} {}

void LockCoordinator::setTransitionListener(TransitionListener l) {
    listener = std::move(l);
}

void LockCoordinator::transition(const LockIdentity& identity, LockState& current, LockState next) const {
    spdlog::debug("Lock '{}': {} -> {}", identity, toString(current), toString(next));
    const auto previous = current;
    current = next;
    if (listener) {
        listener(identity, previous, next);
    }
}

std::expected<LockCoordinator::Acquired, Error> LockCoordinator::acquire(const LockRequest& request, const RetryPolicy& policy, const Canceller* canceller) {
    LockState state = LockState::Idle;
    return acquireTracked(request, policy, canceller, state);
}

std::expected<LockCoordinator::Acquired, Error> LockCoordinator::acquireTracked(const LockRequest& request, const RetryPolicy& policy, const Canceller* canceller, LockState& state) {
    transition(request.identity, state, LockState::Acquiring);
    const ExponentialBackoff backoff {policy};
    const auto start = std::chrono::steady_clock::now();
    const Error cancelled {ErrorCode::Cancelled, "Cancelled while acquiring lock on '" + request.identity + "'", request.identity};
    bool sawTransient = false;
    int attempt = 0;
    while (true) {
        if (canceller != nullptr && canceller->cancelled()) {
            transition(request.identity, state, LockState::Failed);
            return std::unexpected {cancelled};
        }
        ++attempt;
        auto handle = strategy.acquire(request);
        if (handle.has_value()) {
            transition(request.identity, state, LockState::Held);
            return Acquired{handle.value(), attempt};
        }
        const auto err = handle.error();
        // A put whose reply was lost may still have landed. The owner is unique
        // to this invocation, so a record carrying it is ours.
        if (err.code == ErrorCode::AlreadyLocked && sawTransient && err.owner == request.owner) {
            if (auto adopted = adopt(request); adopted.has_value()) {
                adopted->attempts = attempt;
                transition(request.identity, state, LockState::Held);
                return adopted.value();
            }
        }
        if (!isRetriable("acquire", err.code)) {
            transition(request.identity, state, LockState::Failed);
            return std::unexpected {err};
        }
        sawTransient = sawTransient || err.code == ErrorCode::Transient;
        const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
        const auto delay = backoff.nextDelay(attempt, elapsed);
        if (!delay.has_value()) {
            transition(request.identity, state, LockState::Failed);
            return std::unexpected {budgetExhausted(request, err, attempt)};
        }
        const auto wait = fullJitter.jitter(delay.value());
        spdlog::info("Lock '{}' not acquired ({}) on attempt {}, retrying in {}", request.identity, toString(err.code), attempt, formatDuration(wait));
        if (canceller != nullptr) {
            if (!canceller->sleepFor(wait)) {
                transition(request.identity, state, LockState::Failed);
                return std::unexpected {cancelled};
            }
        } else {
            std::this_thread::sleep_for(wait);
        }
    }
}

std::optional<LockCoordinator::Acquired> LockCoordinator::adopt(const LockRequest& request) const {
    auto record = strategy.inspect(request.identity);
    if (!record.has_value() || record->owner != request.owner) {
        return std::nullopt;
    }
    spdlog::warn("Adopting lock '{}' created by an earlier attempt whose reply was lost", request.identity);
    return Acquired{LockHandle{request.identity, request.owner, record->acquiredAt, record->fencingToken, request.ttl}, 0};
}

// Only an absent record counts; a record under another token means the lock
// really changed hands.
bool LockCoordinator::recordGone(const LockIdentity& identity) const {
    auto record = strategy.inspect(identity);
    return !record.has_value() && record.error().code == ErrorCode::NotFound;
}

Error LockCoordinator::budgetExhausted(const LockRequest& request, const Error& last, int attempts) {
    const auto tries = " (gave up after " + std::to_string(attempts) + " attempts)";
    if (last.code == ErrorCode::AlreadyLocked && !last.owner.empty() && last.acquiredAt.has_value()) {
        return Error{
            ErrorCode::BudgetExhausted,
            "Resource '" + request.identity + "' is locked by '" + last.owner + "' since " + formatTimestamp(last.acquiredAt.value())
                + "; if the holder is gone run 'zlock force-unlock " + request.identity + "'" + tries,
            request.identity,
            last.owner,
            last.acquiredAt
        };
    }
    return Error{
        ErrorCode::BudgetExhausted,
        "Could not acquire lock on '" + request.identity + "': " + last.what + tries,
        request.identity
    };
}

std::optional<Error> LockCoordinator::release(const LockHandle& handle, int attempts) {
    bool sawTransient = false;
    for (int i = 1; i <= attempts; ++i) {
        auto released = strategy.release(handle);
        if (released.has_value()) {
            return std::nullopt;
        }
        const auto& err = released.error();
        if (err.code == ErrorCode::LockLost && sawTransient && recordGone(handle.identity)) {
            spdlog::info("Lock '{}' was released by an earlier attempt whose reply was lost", handle.identity);
            return std::nullopt;
        }
        sawTransient = sawTransient || err.code == ErrorCode::Transient;
        if (!isRetriable("release", err.code) || i == attempts) {
            spdlog::warn("Release of lock '{}' failed: {}", handle.identity, err.what);
            return err;
        }
        spdlog::warn("Release of lock '{}' failed ({}), retrying", handle.identity, err.what);
        std::this_thread::sleep_for(releaseRetryDelay * i);
    }
    return Error{ErrorCode::InvalidArg, "Release attempts must be >= 1", handle.identity};
}

std::expected<std::monostate, Error> LockCoordinator::forceUnlock(const LockIdentity& identity) {
    spdlog::warn("Force unlock requested for '{}'", identity);
    return strategy.forceRelease(identity);
}

std::expected<LockStatus, Error> LockCoordinator::status(const LockIdentity& identity, std::optional<std::chrono::microseconds> ttl) const {
    auto record = strategy.inspect(identity);
    if (!record.has_value()) {
        if (record.error().code == ErrorCode::NotFound) {
            return LockStatus{};
        }
        return std::unexpected {record.error()};
    }
    const auto age = std::chrono::duration_cast<std::chrono::microseconds>(clock() - record->acquiredAt);
    const auto limit = ttl.has_value() ? ttl : record->ttl;
    return LockStatus{
        true,
        record.value(),
        age,
        limit.has_value() && age > limit.value()
    };
}

LockCoordinator::HeldLock::HeldLock(LockCoordinator& c, LockHandle h, int attempts, LockState& s)
    : coordinator {c},
      handle {std::move(h)},
      releaseAttempts {attempts},
      state {s},
      released {false} {}

std::optional<Error> LockCoordinator::HeldLock::release() {
    if (released) {
        return std::nullopt;
    }
    released = true;
    coordinator.transition(handle.identity, state, LockState::Releasing);
    auto warning = coordinator.release(handle, releaseAttempts);
    coordinator.transition(handle.identity, state, warning.has_value() ? LockState::Failed : LockState::Done);
    return warning;
}

LockCoordinator::HeldLock::~HeldLock() {
    if (released) {
        return;
    }
    try {
        if (auto warning = release(); warning.has_value()) {
            spdlog::error("Release after failed operation on '{}': {}", handle.identity, warning->what);
        }
    } catch (const std::exception& e) {
        spdlog::error("Release after failed operation on '{}' threw: {}", handle.identity, e.what());
    }
}

} // namespace zlock
