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
#include "storage/InMemoryLedgerStore.hpp"
#include <expected>
#include <string>
#include <shared_mutex>
#include <mutex>
#include <vector>
#include "common/Error.hpp"

namespace zlock {

InMemoryLedgerStore::InMemoryLedgerStore() : rows{}, lastVersion{0}, m{} {}

std::expected<uint64_t, Error> InMemoryLedgerStore::insertIfAbsent(const std::string& rowKey, const LedgerFields& fields) {
    const std::unique_lock lock {m};
    if (rows.contains(rowKey)) {
        return std::unexpected {Error {ErrorCode::AlreadyExists, "Row already exists", rowKey}};
    }
    const auto version = ++lastVersion;
    rows.emplace(rowKey, LedgerRow{rowKey, fields, version});
    return version;
}

std::expected<std::monostate, Error> InMemoryLedgerStore::deleteIfVersion(const std::string& rowKey, uint64_t version) {
    const std::unique_lock lock {m};
    auto i = rows.find(rowKey);
    if (i == rows.end()) {
        return std::unexpected {Error {ErrorCode::NotFound, "Row not found", rowKey}};
    }
    if (i->second.version != version) {
        return std::unexpected {Error {ErrorCode::VersionMismatch, "Version mismatch: expected " + std::to_string(version) + " but row is at " + std::to_string(i->second.version), rowKey}};
    }
    rows.erase(i);
    return {};
}

std::expected<LedgerRow, Error> InMemoryLedgerStore::get(const std::string& rowKey) const {
    const std::shared_lock lock {m};
    auto i = rows.find(rowKey);
    if (i == rows.end()) {
        return std::unexpected {Error {ErrorCode::NotFound, "Row not found", rowKey}};
    }
    return i->second;
}

std::expected<std::vector<LedgerRow>, Error> InMemoryLedgerStore::list() const {
    const std::shared_lock lock {m};
    std::vector<LedgerRow> result;
    result.reserve(rows.size());
    for (const auto& [key, row] : rows) {
        result.push_back(row);
    }
    return result;
}

size_t InMemoryLedgerStore::size() const {
    const std::shared_lock lock {m};
    return rows.size();
}

} // namespace zlock
