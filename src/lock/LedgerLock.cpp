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
#include "lock/LedgerLock.hpp"
#include "lock/RecordCodec.hpp"
#include "common/Error.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace zlock {

namespace {

constexpr int forceReleaseTries = 3;

std::optional<uint64_t> parseVersion(const FencingToken& token) {
    uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), v);
    if (ec != std::errc{} || ptr != token.data() + token.size()) {
        return std::nullopt;
    }
    return v;
}

} // namespace

LedgerLock::LedgerLock(LedgerStore& l, Clock c) : ledger {l}, clock {std::move(c)} {}

std::expected<LockHandle, Error> LedgerLock::acquire(const LockRequest& request) {
    const auto now = truncateToMicros(clock());
    auto inserted = ledger.insertIfAbsent(request.identity, encodeRow(request, now));
    if (inserted.has_value()) {
        spdlog::info("Acquired lock '{}' as '{}' (version {})", request.identity, request.owner, inserted.value());
        return LockHandle{request.identity, request.owner, now, std::to_string(inserted.value()), request.ttl};
    }
    if (inserted.error().code != ErrorCode::AlreadyExists) {
        return std::unexpected {classifyBackendError(inserted.error(), request.identity)};
    }

    auto existing = ledger.get(request.identity);
    if (!existing.has_value()) {
        if (existing.error().code == ErrorCode::NotFound) {
            return std::unexpected {Error{ErrorCode::AlreadyLocked, "Lock on '" + request.identity + "' changed hands while acquiring", request.identity}};
        }
        return std::unexpected {classifyBackendError(existing.error(), request.identity)};
    }
    const auto holder = decodeRow(existing.value(), now);
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

std::expected<LockHandle, Error> LedgerLock::reclaim(const LockRequest& request, const LockRecord& stale, Timestamp now) {
    auto version = parseVersion(stale.fencingToken);
    if (!version.has_value()) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "Ledger row '" + request.identity + "' has a malformed version", request.identity}};
    }
    auto removed = ledger.deleteIfVersion(request.identity, version.value());
    if (!removed.has_value()) {
        if (removed.error().code == ErrorCode::VersionMismatch) {
            return std::unexpected {Error{ErrorCode::AlreadyLocked, "Stale lock on '" + request.identity + "' was replaced by another client", request.identity}};
        }
        if (removed.error().code != ErrorCode::NotFound) {
            return std::unexpected {classifyBackendError(removed.error(), request.identity)};
        }
    }
    auto inserted = ledger.insertIfAbsent(request.identity, encodeRow(request, now));
    if (inserted.has_value()) {
        spdlog::info("Acquired lock '{}' as '{}' after reclaiming it from '{}' (version {})", request.identity, request.owner, stale.owner, inserted.value());
        return LockHandle{request.identity, request.owner, now, std::to_string(inserted.value()), request.ttl};
    }
    if (inserted.error().code == ErrorCode::AlreadyExists) {
        return std::unexpected {Error{ErrorCode::AlreadyLocked, "Lost the race for reclaimed lock '" + request.identity + "'", request.identity}};
    }
    return std::unexpected {classifyBackendError(inserted.error(), request.identity)};
}

std::expected<std::monostate, Error> LedgerLock::release(const LockHandle& handle) {
    auto version = parseVersion(handle.fencingToken);
    if (!version.has_value()) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "Fencing token '" + handle.fencingToken + "' is not a ledger version", handle.identity}};
    }
    auto removed = ledger.deleteIfVersion(handle.identity, version.value());
    if (removed.has_value()) {
        spdlog::info("Released lock '{}' held by '{}'", handle.identity, handle.owner);
        return {};
    }
    const auto& e = removed.error();
    if (e.code == ErrorCode::VersionMismatch || e.code == ErrorCode::NotFound) {
        spdlog::warn("Lock '{}' was lost before release: {}", handle.identity, e.what);
        return std::unexpected {lockLostError(handle, e.what)};
    }
    return std::unexpected {classifyBackendError(e, handle.identity)};
}

// The ledger has no unconditional delete, so delete whatever version is
// current, re-reading when it moves underneath.
std::expected<std::monostate, Error> LedgerLock::forceRelease(const LockIdentity& identity) {
    for (int i = 0; i < forceReleaseTries; ++i) {
        auto row = ledger.get(identity);
        if (!row.has_value()) {
            return std::unexpected {classifyBackendError(row.error(), identity)};
        }
        auto removed = ledger.deleteIfVersion(identity, row->version);
        if (removed.has_value()) {
            spdlog::warn("Force released lock '{}' (version {})", identity, row->version);
            return {};
        }
        if (removed.error().code != ErrorCode::VersionMismatch) {
            return std::unexpected {classifyBackendError(removed.error(), identity)};
        }
    }
    return std::unexpected {Error{ErrorCode::Transient, "Lock on '" + identity + "' kept changing during force release", identity}};
}

std::expected<LockRecord, Error> LedgerLock::inspect(const LockIdentity& identity) const {
    auto row = ledger.get(identity);
    if (!row.has_value()) {
        return std::unexpected {classifyBackendError(row.error(), identity)};
    }
    return decodeRow(row.value(), truncateToMicros(clock()));
}

std::expected<std::vector<LockRecord>, Error> LedgerLock::list() const {
    auto rows = ledger.list();
    if (!rows.has_value()) {
        return std::unexpected {classifyBackendError(rows.error(), "")};
    }
    const auto now = truncateToMicros(clock());
    std::vector<LockRecord> records;
    records.reserve(rows->size());
    for (const auto& row : rows.value()) {
        records.push_back(decodeRow(row, now));
    }
    return records;
}

std::string LedgerLock::name() const {
    return "ledger";
}

} // namespace zlock
