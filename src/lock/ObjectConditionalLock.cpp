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
#include "lock/ObjectConditionalLock.hpp"
#include "lock/RecordCodec.hpp"
#include "common/Error.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <expected>
#include <string>
#include <utility>

namespace zlock {

ObjectConditionalLock::ObjectConditionalLock(ObjectStore& s, Clock c) : store {s}, clock {std::move(c)} {}

std::expected<std::string, Error> ObjectConditionalLock::createMarker(const LockRequest& request, Timestamp now) {
    return store.conditionalPut(markerKey(request.identity), encodeMarker(request, now), PutCondition::ifAbsent());
}

std::expected<LockHandle, Error> ObjectConditionalLock::acquire(const LockRequest& request) {
    const auto now = truncateToMicros(clock());
    auto created = createMarker(request, now);
    if (created.has_value()) {
        spdlog::info("Acquired lock '{}' as '{}' (token {})", request.identity, request.owner, created.value());
        return LockHandle{request.identity, request.owner, now, created.value(), request.ttl};
    }
    if (created.error().code != ErrorCode::PreconditionFailed) {
        return std::unexpected {classifyBackendError(created.error(), request.identity)};
    }

    auto existing = store.get(markerKey(request.identity));
    if (!existing.has_value()) {
        if (existing.error().code == ErrorCode::NotFound) {
            return std::unexpected {Error{ErrorCode::AlreadyLocked, "Lock on '" + request.identity + "' changed hands while acquiring", request.identity}};
        }
        return std::unexpected {classifyBackendError(existing.error(), request.identity)};
    }
    const auto holder = decodeMarker(request.identity, existing.value());
    if (!isStale(holder, request.ttl, now)) {
        return std::unexpected {alreadyLockedError(holder)};
    }
    const auto age = std::chrono::duration_cast<std::chrono::microseconds>(now - holder.acquiredAt);
    if (request.stalePolicy == StalePolicy::Report) {
        return std::unexpected {staleLockError(holder, age)};
    }
    spdlog::warn("Reclaiming stale lock '{}' held by '{}' (age {})", request.identity, holder.owner, formatDuration(age));
    return reclaim(request, holder, now);
}

// The stale marker is removed only if it is still the exact version we read,
// then recreated with fail-if-exists. Losing either race is plain contention.
std::expected<LockHandle, Error> ObjectConditionalLock::reclaim(const LockRequest& request, const LockRecord& stale, Timestamp now) {
    auto removed = store.conditionalDelete(markerKey(request.identity), stale.fencingToken);
    if (!removed.has_value()) {
        if (removed.error().code == ErrorCode::PreconditionFailed) {
            return std::unexpected {Error{ErrorCode::AlreadyLocked, "Stale lock on '" + request.identity + "' was replaced by another client", request.identity}};
        }
        if (removed.error().code != ErrorCode::NotFound) {
            return std::unexpected {classifyBackendError(removed.error(), request.identity)};
        }
    }
    auto created = createMarker(request, now);
    if (created.has_value()) {
        spdlog::info("Acquired lock '{}' as '{}' after reclaiming it from '{}' (token {})", request.identity, request.owner, stale.owner, created.value());
        return LockHandle{request.identity, request.owner, now, created.value(), request.ttl};
    }
    if (created.error().code == ErrorCode::PreconditionFailed) {
        return std::unexpected {Error{ErrorCode::AlreadyLocked, "Lost the race for reclaimed lock '" + request.identity + "'", request.identity}};
    }
    return std::unexpected {classifyBackendError(created.error(), request.identity)};
}

std::expected<std::monostate, Error> ObjectConditionalLock::release(const LockHandle& handle) {
    auto removed = store.conditionalDelete(markerKey(handle.identity), handle.fencingToken);
    if (removed.has_value()) {
        spdlog::info("Released lock '{}' held by '{}'", handle.identity, handle.owner);
        return {};
    }
    const auto& e = removed.error();
    if (e.code == ErrorCode::PreconditionFailed || e.code == ErrorCode::NotFound) {
        spdlog::warn("Lock '{}' was lost before release: {}", handle.identity, e.what);
        return std::unexpected {lockLostError(handle, e.what)};
    }
    return std::unexpected {classifyBackendError(e, handle.identity)};
}

std::expected<std::monostate, Error> ObjectConditionalLock::forceRelease(const LockIdentity& identity) {
    auto removed = store.erase(markerKey(identity));
    if (!removed.has_value()) {
        return std::unexpected {classifyBackendError(removed.error(), identity)};
    }
    spdlog::warn("Force released lock '{}'", identity);
    return {};
}

std::expected<LockRecord, Error> ObjectConditionalLock::inspect(const LockIdentity& identity) const {
    auto existing = store.get(markerKey(identity));
    if (!existing.has_value()) {
        return std::unexpected {classifyBackendError(existing.error(), identity)};
    }
    return decodeMarker(identity, existing.value());
}

std::string ObjectConditionalLock::name() const {
    return "object";
}

} // namespace zlock
