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
#ifndef OBJECT_STORE_HPP
#define OBJECT_STORE_HPP

#include "common/Types.hpp"
#include "common/Error.hpp"
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace zlock {

struct StoredObject {
    std::string body;
    // Precondition token of this object version.
    std::string token;
    Timestamp createdAt;
};

struct PutCondition {
    bool failIfExists = false;
    std::optional<std::string> ifMatch;

    static PutCondition ifAbsent() {
        return PutCondition{true, std::nullopt};
    }
    static PutCondition ifTokenMatches(std::string token) {
        return PutCondition{false, std::move(token)};
    }
    static PutCondition always() {
        return PutCondition{};
    }
};

// Key/object storage with atomic conditional writes. conditionalPut must be
// strongly consistent: two racing writers with failIfExists never both win.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Returns the new object's token, or PreconditionFailed.
    virtual std::expected<std::string, Error> conditionalPut(const std::string& key, const std::string& body, const PutCondition& condition) = 0;
    // PreconditionFailed when the token does not match, NotFound when absent.
    virtual std::expected<std::monostate, Error> conditionalDelete(const std::string& key, const std::string& token) = 0;
    virtual std::expected<StoredObject, Error> get(const std::string& key) const = 0;
    virtual std::expected<std::monostate, Error> erase(const std::string& key) = 0;
};

} // namespace zlock

#endif // OBJECT_STORE_HPP
