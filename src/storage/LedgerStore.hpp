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
#ifndef LEDGER_STORE_HPP
#define LEDGER_STORE_HPP

#include "common/Error.hpp"
#include <cstdint>
#include <expected>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace zlock {

using LedgerFields = std::map<std::string, std::string>;

struct LedgerRow {
    std::string key;
    LedgerFields fields;
    uint64_t version = 0;
};

// Table-like store keyed by row, with a version column used for fencing.
class LedgerStore {
public:
    virtual ~LedgerStore() = default;

    // Returns the row version, or AlreadyExists.
    virtual std::expected<uint64_t, Error> insertIfAbsent(const std::string& rowKey, const LedgerFields& fields) = 0;
    // VersionMismatch or NotFound on failure.
    virtual std::expected<std::monostate, Error> deleteIfVersion(const std::string& rowKey, uint64_t version) = 0;
    virtual std::expected<LedgerRow, Error> get(const std::string& rowKey) const = 0;
    virtual std::expected<std::vector<LedgerRow>, Error> list() const = 0;
};

} // namespace zlock

#endif // LEDGER_STORE_HPP
