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
#ifndef LOCK_STRATEGY_H
#define LOCK_STRATEGY_H

#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "lock/LockOptions.hpp"

namespace zlock {

class ObjectStore;
class LedgerStore;

struct LockRequest {
    LockIdentity identity;
    Owner owner;
    std::optional<std::chrono::microseconds> ttl;
    StalePolicy stalePolicy = StalePolicy::Report;
    std::string operation;
};

// One way of keeping a durable lock record in a backend. Every error leaving
// an implementation is already classified into the lock taxonomy.
class LockStrategy {
public:
    virtual ~LockStrategy() = default;

    // AlreadyLocked, StaleLock or Transient on failure.
    virtual std::expected<LockHandle, Error> acquire(const LockRequest& request) = 0;
    // LockLost when the record is gone or was re-created by someone else.
    virtual std::expected<std::monostate, Error> release(const LockHandle& handle) = 0;
    // Deletes whatever record exists, ignoring fencing. NotFound when free.
    virtual std::expected<std::monostate, Error> forceRelease(const LockIdentity& identity) = 0;
    virtual std::expected<LockRecord, Error> inspect(const LockIdentity& identity) const = 0;
    virtual std::string name() const = 0;
};

Error classifyBackendError(const Error& error, const LockIdentity& identity);
Error alreadyLockedError(const LockRecord& holder);
Error staleLockError(const LockRecord& holder, std::chrono::microseconds age);
Error lockLostError(const LockHandle& handle, const std::string& detail);

bool isStale(const LockRecord& record, std::optional<std::chrono::microseconds> ttl, Timestamp now);

// Throws std::invalid_argument if the store the strategy needs is missing.
std::unique_ptr<LockStrategy> makeLockStrategy(StrategyKind kind, ObjectStore* objects, LedgerStore* ledger, Clock clock = systemClock());

} // namespace zlock

#endif // LOCK_STRATEGY_H
