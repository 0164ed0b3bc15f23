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
#ifndef TYPES_HPP
#define TYPES_HPP

#include <string>
#include <chrono>
#include <optional>
#include <functional>

namespace zlock {

using Timestamp = std::chrono::system_clock::time_point;
using Clock = std::function<Timestamp()>;

// Names the protected resource. Equal identities share one marker.
using LockIdentity = std::string;
using Owner = std::string;
using FencingToken = std::string;

Clock systemClock();

struct LockHandle {
    LockIdentity identity;
    Owner owner;
    Timestamp acquiredAt;
    FencingToken fencingToken;
    std::optional<std::chrono::microseconds> ttl;

    bool operator==(const LockHandle& other) const = default;
};

// The backend-resident marker as seen by a reader.
struct LockRecord {
    LockIdentity identity;
    Owner owner;
    Timestamp acquiredAt;
    std::string operation;
    std::optional<std::chrono::microseconds> ttl;
    FencingToken fencingToken;

    bool operator==(const LockRecord& other) const = default;
};

struct LockStatus {
    bool held = false;
    std::optional<LockRecord> record;
    std::chrono::microseconds age {0};
    bool ageExceedsTtl = false;
};

} // namespace zlock

#endif // TYPES_HPP
