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
#ifndef IN_MEMORY_LEDGER_STORE_H
#define IN_MEMORY_LEDGER_STORE_H

#include <string>
#include <map>
#include <shared_mutex>
#include <mutex>
#include <cstdint>
#include <expected>
#include <vector>
#include "common/Error.hpp"
#include "storage/LedgerStore.hpp"

namespace zlock {

class InMemoryLedgerStore : public LedgerStore {
public:
    InMemoryLedgerStore();
    std::expected<uint64_t, Error> insertIfAbsent(const std::string& rowKey, const LedgerFields& fields) override;
    std::expected<std::monostate, Error> deleteIfVersion(const std::string& rowKey, uint64_t version) override;
    std::expected<LedgerRow, Error> get(const std::string& rowKey) const override;
    std::expected<std::vector<LedgerRow>, Error> list() const override;
    size_t size() const;
private:
    std::map<std::string, LedgerRow> rows;
    uint64_t lastVersion;
    mutable std::shared_mutex m;
};

} // namespace zlock

#endif // IN_MEMORY_LEDGER_STORE_H
