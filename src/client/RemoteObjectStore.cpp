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
#include "client/RemoteObjectStore.hpp"
#include "common/Util.hpp"
#include "proto/store.pb.h"
#include <expected>
#include <string>

namespace zlock {

RemoteObjectStore::RemoteObjectStore(const Config& c) : service {c} {}

std::expected<std::string, Error> RemoteObjectStore::conditionalPut(const std::string& key, const std::string& body, const PutCondition& condition) {
    store::ConditionalPutRequest request;
    request.set_key(key);
    request.set_body(body);
    request.set_fail_if_exists(condition.failIfExists);
    if (condition.ifMatch.has_value()) {
        request.set_if_match(condition.ifMatch.value());
    }
    store::ConditionalPutReply reply;
    auto t = service.call(&store::ObjectStoreService::Stub::conditionalPut, request, reply);
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    return reply.token();
}

std::expected<std::monostate, Error> RemoteObjectStore::conditionalDelete(const std::string& key, const std::string& token) {
    store::ConditionalDeleteRequest request;
    request.set_key(key);
    request.set_token(token);
    store::ConditionalDeleteReply reply;
    return service.call(&store::ObjectStoreService::Stub::conditionalDelete, request, reply);
}

std::expected<StoredObject, Error> RemoteObjectStore::get(const std::string& key) const {
    store::GetObjectRequest request;
    request.set_key(key);
    store::GetObjectReply reply;
    auto t = service.call(&store::ObjectStoreService::Stub::get, request, reply);
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    return StoredObject{reply.body(), reply.token(), fromMicros(reply.created_at_micros())};
}

std::expected<std::monostate, Error> RemoteObjectStore::erase(const std::string& key) {
    store::EraseObjectRequest request;
    request.set_key(key);
    store::EraseObjectReply reply;
    return service.call(&store::ObjectStoreService::Stub::erase, request, reply);
}

} // namespace zlock
