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
#include "lock/LockStrategy.hpp"
#include "lock/ObjectConditionalLock.hpp"
#include "lock/LedgerLock.hpp"
#include "common/Error.hpp"
#include "common/Util.hpp"
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace zlock {

Error classifyBackendError(const Error& error, const LockIdentity& identity) {
    switch (error.code) {
        case ErrorCode::InvalidArg:
            return Error{ErrorCode::InvalidArg, error.what, identity};
        case ErrorCode::NotFound:
            return Error{ErrorCode::NotFound, "No lock held on '" + identity + "'", identity};
        case ErrorCode::PreconditionFailed:
        case ErrorCode::AlreadyExists:
        case ErrorCode::VersionMismatch:
            return Error{ErrorCode::AlreadyLocked, "Lock on '" + identity + "' is held: " + error.what, identity};
        default:
            return Error{ErrorCode::Transient, "Backend error (" + toString(error.code) + "): " + error.what, identity};
    }
}

Error alreadyLockedError(const LockRecord& holder) {
    return Error{
        ErrorCode::AlreadyLocked,
        "Lock on '" + holder.identity + "' is held by '" + holder.owner + "' since " + formatTimestamp(holder.acquiredAt),
        holder.identity,
        holder.owner,
        holder.acquiredAt
    };
}

Error staleLockError(const LockRecord& holder, std::chrono::microseconds age) {
    return Error{
        ErrorCode::StaleLock,
        "Lock on '" + holder.identity + "' held by '" + holder.owner + "' since " + formatTimestamp(holder.acquiredAt)
            + " is stale (age " + formatDuration(age) + "); run 'zlock force-unlock " + holder.identity + "' if the holder is gone",
        holder.identity,
        holder.owner,
        holder.acquiredAt
    };
}

Error lockLostError(const LockHandle& handle, const std::string& detail) {
    return Error{
        ErrorCode::LockLost,
        "Lock on '" + handle.identity + "' is no longer held by '" + handle.owner + "' (token " + handle.fencingToken
            + "): " + detail + "; the protected operation may have overlapped with another holder",
        handle.identity
    };
}

bool isStale(const LockRecord& record, std::optional<std::chrono::microseconds> ttl, Timestamp now) {
    if (!ttl.has_value()) {
        return false;
    }
    return now - record.acquiredAt > ttl.value();
}

std::unique_ptr<LockStrategy> makeLockStrategy(StrategyKind kind, ObjectStore* objects, LedgerStore* ledger, Clock clock) {
    switch (kind) {
        case StrategyKind::ObjectConditional:
            if (objects == nullptr) {
                throw std::invalid_argument("Object conditional strategy needs an object store.");
            }
            return std::make_unique<ObjectConditionalLock>(*objects, std::move(clock));
        case StrategyKind::Ledger:
            if (ledger == nullptr) {
                throw std::invalid_argument("Ledger strategy needs a ledger store.");
            }
            return std::make_unique<LedgerLock>(*ledger, std::move(clock));
    }
    std::unreachable();
}

} // namespace zlock
