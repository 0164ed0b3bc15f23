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
#include "server/ObjectStoreServiceImpl.hpp"
#include "common/ErrorConverter.hpp"
#include "common/Error.hpp"
#include "common/Util.hpp"
#include "proto/store.pb.h"
#include <grpcpp/support/status.h>
#include <optional>
#include <string>
#include <tuple>

namespace zlock {

ObjectStoreServiceImpl::ObjectStoreServiceImpl(ObjectStore& s)
    : objects {s} {}

grpc::Status ObjectStoreServiceImpl::conditionalPut(
    grpc::ServerContext* context,
    const store::ConditionalPutRequest* request,
    store::ConditionalPutReply* reply) {
    std::ignore = context;
    PutCondition condition{request->fail_if_exists(), std::nullopt};
    if (request->has_if_match()) {
        condition.ifMatch = request->if_match();
    }
    auto token = objects.conditionalPut(request->key(), request->body(), condition);
    if (!token.has_value()) {
        return toGrpcStatus(token.error());
    }
    reply->set_token(token.value());
    return grpc::Status::OK;
}

grpc::Status ObjectStoreServiceImpl::conditionalDelete(
    grpc::ServerContext* context,
    const store::ConditionalDeleteRequest* request,
    store::ConditionalDeleteReply* reply) {
    std::ignore = context;
    std::ignore = reply;
    return toGrpcStatus(objects.conditionalDelete(request->key(), request->token()));
}

grpc::Status ObjectStoreServiceImpl::get(
    grpc::ServerContext* context,
    const store::GetObjectRequest* request,
    store::GetObjectReply* reply) {
    std::ignore = context;
    auto object = objects.get(request->key());
    if (!object.has_value()) {
        return toGrpcStatus(object.error());
    }
    reply->set_body(object->body);
    reply->set_token(object->token);
    reply->set_created_at_micros(toMicros(object->createdAt));
    return grpc::Status::OK;
}

grpc::Status ObjectStoreServiceImpl::erase(
    grpc::ServerContext* context,
    const store::EraseObjectRequest* request,
    store::EraseObjectReply* reply) {
    std::ignore = context;
    std::ignore = reply;
    return toGrpcStatus(objects.erase(request->key()));
}

} // namespace zlock
