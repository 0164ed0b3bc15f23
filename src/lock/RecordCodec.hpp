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
#ifndef RECORD_CODEC_H
#define RECORD_CODEC_H

#include <string>
#include "common/Types.hpp"
#include "lock/LockStrategy.hpp"
#include "storage/ObjectStore.hpp"
#include "storage/LedgerStore.hpp"

namespace zlock {

inline constexpr auto markerSuffix = ".zlock";
inline constexpr auto unreadableOwner = "<unreadable>";

// Key of the marker object guarding identity.
std::string markerKey(const LockIdentity& identity);

std::string encodeMarker(const LockRequest& request, Timestamp acquiredAt);
LockRecord decodeMarker(const LockIdentity& identity, const StoredObject& object);

LedgerFields encodeRow(const LockRequest& request, Timestamp acquiredAt);
// observedAt stands in for an unreadable acquired_at, so such a row never
// counts as stale.
LockRecord decodeRow(const LedgerRow& row, Timestamp observedAt);

} // namespace zlock

#endif // RECORD_CODEC_H
