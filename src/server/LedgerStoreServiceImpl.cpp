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
#include "server/LedgerStoreServiceImpl.hpp"
#include "common/ErrorConverter.hpp"
#include "common/Error.hpp"
#include "proto/store.pb.h"
#include <grpcpp/support/status.h>
#include <tuple>

namespace zlock {

namespace {

void toProto(const LedgerRow& row, store::LedgerRow* out) {
    out->set_key(row.key);
    out->mutable_fields()->insert(row.fields.begin(), row.fields.end());
    out->set_version(row.version);
}

} // namespace

LedgerStoreServiceImpl::LedgerStoreServiceImpl(LedgerStore& s)
    : ledger {s} {}

grpc::Status LedgerStoreServiceImpl::insertIfAbsent(
    grpc::ServerContext* context,
    const store::InsertIfAbsentRequest* request,
    store::InsertIfAbsentReply* reply) {
    std::ignore = context;
    const LedgerFields fields{request->fields().begin(), request->fields().end()};
    auto version = ledger.insertIfAbsent(request->key(), fields);
    if (!version.has_value()) {
        return toGrpcStatus(version.error());
    }
    reply->set_version(version.value());
    return grpc::Status::OK;
}

grpc::Status LedgerStoreServiceImpl::deleteIfVersion(
    grpc::ServerContext* context,
    const store::DeleteIfVersionRequest* request,
    store::DeleteIfVersionReply* reply) {
    std::ignore = context;
    std::ignore = reply;
    return toGrpcStatus(ledger.deleteIfVersion(request->key(), request->version()));
}

grpc::Status LedgerStoreServiceImpl::get(
    grpc::ServerContext* context,
    const store::GetRowRequest* request,
    store::GetRowReply* reply) {
    std::ignore = context;
    auto row = ledger.get(request->key());
    if (!row.has_value()) {
        return toGrpcStatus(row.error());
    }
    toProto(row.value(), reply->mutable_row());
    return grpc::Status::OK;
}

grpc::Status LedgerStoreServiceImpl::list(
    grpc::ServerContext* context,
    const store::ListRowsRequest* request,
    store::ListRowsReply* reply) {
    std::ignore = context;
    std::ignore = request;
    auto rows = ledger.list();
    if (!rows.has_value()) {
        return toGrpcStatus(rows.error());
    }
    for (const auto& row : rows.value()) {
        toProto(row, reply->add_rows());
    }
    return grpc::Status::OK;
}

} // namespace zlock
