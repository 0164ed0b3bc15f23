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
#include "lock/RecordCodec.hpp"
#include "common/Util.hpp"
#include "proto/lock.pb.h"
#include <spdlog/spdlog.h>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace zlock {

namespace {

std::optional<int64_t> parseInt(const LedgerFields& fields, const std::string& name) {
    auto i = fields.find(name);
    if (i == fields.end()) {
        return std::nullopt;
    }
    int64_t v = 0;
    const auto& s = i->second;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return v;
}

std::optional<std::chrono::microseconds> ttlFromMicros(int64_t micros) {
    if (micros <= 0) {
        return std::nullopt;
    }
    return std::chrono::microseconds{micros};
}

} // namespace

std::string markerKey(const LockIdentity& identity) {
    return identity + markerSuffix;
}

std::string encodeMarker(const LockRequest& request, Timestamp acquiredAt) {
    proto::LockRecordBody body;
    body.set_owner(request.owner);
    body.set_acquired_at_micros(toMicros(acquiredAt));
    body.set_operation(request.operation);
    body.set_ttl_micros(request.ttl.has_value() ? request.ttl->count() : 0);
    return body.SerializeAsString();
}

LockRecord decodeMarker(const LockIdentity& identity, const StoredObject& object) {
    proto::LockRecordBody body;
    if (!body.ParseFromString(object.body) || body.owner().empty()) {
        spdlog::warn("Marker for '{}' is not a lock record, reporting store metadata", identity);
        return LockRecord{identity, unreadableOwner, object.createdAt, "", std::nullopt, object.token};
    }
    return LockRecord{
        identity,
        body.owner(),
        fromMicros(body.acquired_at_micros()),
        body.operation(),
        ttlFromMicros(body.ttl_micros()),
        object.token
    };
}

LedgerFields encodeRow(const LockRequest& request, Timestamp acquiredAt) {
    return LedgerFields{
        {"owner", request.owner},
        {"acquired_at", std::to_string(toMicros(acquiredAt))},
        {"operation", request.operation},
        {"ttl", std::to_string(request.ttl.has_value() ? request.ttl->count() : 0)},
    };
}

LockRecord decodeRow(const LedgerRow& row, Timestamp observedAt) {
    auto owner = row.fields.find("owner");
    auto acquiredAt = parseInt(row.fields, "acquired_at");
    auto operation = row.fields.find("operation");
    if (!acquiredAt.has_value()) {
        spdlog::warn("Ledger row '{}' has no readable acquired_at, treating it as fresh", row.key);
    }
    return LockRecord{
        row.key,
        owner != row.fields.end() ? owner->second : unreadableOwner,
        acquiredAt.has_value() ? fromMicros(acquiredAt.value()) : observedAt,
        operation != row.fields.end() ? operation->second : "",
        ttlFromMicros(parseInt(row.fields, "ttl").value_or(0)),
        std::to_string(row.version)
    };
}

} // namespace zlock
