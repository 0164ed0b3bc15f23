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
#ifndef LEDGER_LOCK_H
#define LEDGER_LOCK_H

#include <expected>
#include <string>
#include <variant>
#include <vector>
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "lock/LockStrategy.hpp"
#include "storage/LedgerStore.hpp"

namespace zlock {

// Lock held as a ledger row inserted if absent. The row version is the
// fencing token. Unlike the object strategy, held locks can be listed.
class LedgerLock final : public LockStrategy {
public:
    explicit LedgerLock(LedgerStore& l, Clock c = systemClock());
    std::expected<LockHandle, Error> acquire(const LockRequest& request) override;
    std::expected<std::monostate, Error> release(const LockHandle& handle) override;
    std::expected<std::monostate, Error> forceRelease(const LockIdentity& identity) override;
    std::expected<LockRecord, Error> inspect(const LockIdentity& identity) const override;
    std::string name() const override;
    std::expected<std::vector<LockRecord>, Error> list() const;
private:
    std::expected<LockHandle, Error> reclaim(const LockRequest& request, const LockRecord& stale, Timestamp now);
    LedgerStore& ledger;
    Clock clock;
};

} // namespace zlock

#endif // LEDGER_LOCK_H
