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
#include "storage/InMemoryObjectStore.hpp"
#include <expected>
#include <string>
#include <shared_mutex>
#include <mutex>
#include <utility>
#include "common/Error.hpp"
#include "common/Types.hpp"

namespace zlock {

InMemoryObjectStore::InMemoryObjectStore(Clock c) : store{}, generation{0}, clock{std::move(c)}, m{} {}

// Tokens are drawn from one counter so a re-created key never repeats a token.
std::string InMemoryObjectStore::nextToken() {
    return "g" + std::to_string(++generation);
}

std::expected<std::string, Error> InMemoryObjectStore::conditionalPut(const std::string& key, const std::string& body, const PutCondition& condition) {
    const std::unique_lock lock {m};
    auto i = store.find(key);
    if (i != store.end()) {
        if (condition.failIfExists) {
            return std::unexpected {Error {ErrorCode::PreconditionFailed, "Object already exists", key}};
        }
        if (condition.ifMatch.has_value() && condition.ifMatch.value() != i->second.token) {
            return std::unexpected {Error {ErrorCode::PreconditionFailed, "Token mismatch: expected " + condition.ifMatch.value() + " but object is at " + i->second.token, key}};
        }
        i->second = StoredObject{body, nextToken(), clock()};
        return i->second.token;
    }
    if (condition.ifMatch.has_value()) {
        return std::unexpected {Error {ErrorCode::PreconditionFailed, "Object does not exist, cannot match token " + condition.ifMatch.value(), key}};
    }
    auto token = nextToken();
    store.emplace(key, StoredObject{body, token, clock()});
    return token;
}

std::expected<std::monostate, Error> InMemoryObjectStore::conditionalDelete(const std::string& key, const std::string& token) {
    const std::unique_lock lock {m};
    auto i = store.find(key);
    if (i == store.end()) {
        return std::unexpected {Error {ErrorCode::NotFound, "Object not found", key}};
    }
    if (i->second.token != token) {
        return std::unexpected {Error {ErrorCode::PreconditionFailed, "Token mismatch: expected " + token + " but object is at " + i->second.token, key}};
    }
    store.erase(i);
    return {};
}

std::expected<StoredObject, Error> InMemoryObjectStore::get(const std::string& key) const {
    const std::shared_lock lock {m};
    auto i = store.find(key);
    if (i == store.end()) {
        return std::unexpected {Error {ErrorCode::NotFound, "Object not found", key}};
    }
    return i->second;
}

std::expected<std::monostate, Error> InMemoryObjectStore::erase(const std::string& key) {
    const std::unique_lock lock {m};
    if (store.erase(key) == 0) {
        return std::unexpected {Error {ErrorCode::NotFound, "Object not found", key}};
    }
    return {};
}

size_t InMemoryObjectStore::size() const {
    const std::shared_lock lock {m};
    return store.size();
}

} // namespace zlock
