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
#ifndef IN_MEMORY_OBJECT_STORE_H
#define IN_MEMORY_OBJECT_STORE_H

#include <string>
#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <cstdint>
#include <expected>
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "storage/ObjectStore.hpp"

namespace zlock {

class InMemoryObjectStore : public ObjectStore {
public:
    explicit InMemoryObjectStore(Clock c = systemClock());
    std::expected<std::string, Error> conditionalPut(const std::string& key, const std::string& body, const PutCondition& condition) override;
    std::expected<std::monostate, Error> conditionalDelete(const std::string& key, const std::string& token) override;
    std::expected<StoredObject, Error> get(const std::string& key) const override;
    std::expected<std::monostate, Error> erase(const std::string& key) override;
    size_t size() const;
private:
    std::string nextToken();
    std::unordered_map<std::string, StoredObject> store;
    uint64_t generation;
    Clock clock;
    mutable std::shared_mutex m;
};

} // namespace zlock

#endif // IN_MEMORY_OBJECT_STORE_H
