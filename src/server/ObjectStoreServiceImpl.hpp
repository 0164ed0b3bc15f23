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
#ifndef SRC_SERVER_OBJECTSTORESERVICEIMPL_HPP
#define SRC_SERVER_OBJECTSTORESERVICEIMPL_HPP

#include <grpcpp/grpcpp.h>
#include "proto/store.grpc.pb.h"
#include "storage/ObjectStore.hpp"

namespace zlock {

class ObjectStoreServiceImpl final : public store::ObjectStoreService::Service {
public:
    explicit ObjectStoreServiceImpl(ObjectStore& s);
    grpc::Status conditionalPut(
        grpc::ServerContext* context,
        const store::ConditionalPutRequest* request,
        store::ConditionalPutReply* reply) override;
    grpc::Status conditionalDelete(
        grpc::ServerContext* context,
        const store::ConditionalDeleteRequest* request,
        store::ConditionalDeleteReply* reply) override;
    grpc::Status get(
        grpc::ServerContext* context,
        const store::GetObjectRequest* request,
        store::GetObjectReply* reply) override;
    grpc::Status erase(
        grpc::ServerContext* context,
        const store::EraseObjectRequest* request,
        store::EraseObjectReply* reply) override;
private:
    ObjectStore& objects;
};

} // namespace zlock

#endif // SRC_SERVER_OBJECTSTORESERVICEIMPL_HPP
