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
#include "common/ErrorConverter.hpp"
#include "common/Error.hpp"
#include "common/Util.hpp"
#include "proto/error.pb.h"
#include <google/protobuf/any.pb.h>
#include <grpcpp/support/status.h>
#include <algorithm>
#include <array>
#include <optional>
#include <stdexcept>

namespace zlock {

namespace {

struct CodeMapping {
    ErrorCode code;
    grpc::StatusCode status;
};

// Reverse lookups take the first row carrying a status.
constexpr std::array<CodeMapping, 10> codeMappings {{
    {ErrorCode::NotFound, grpc::StatusCode::NOT_FOUND},
    {ErrorCode::InvalidArg, grpc::StatusCode::INVALID_ARGUMENT},
    {ErrorCode::PreconditionFailed, grpc::StatusCode::FAILED_PRECONDITION},
    {ErrorCode::VersionMismatch, grpc::StatusCode::FAILED_PRECONDITION},
    {ErrorCode::AlreadyExists, grpc::StatusCode::ALREADY_EXISTS},
    {ErrorCode::Unavailable, grpc::StatusCode::UNAVAILABLE},
    {ErrorCode::Transient, grpc::StatusCode::UNAVAILABLE},
    {ErrorCode::Timeout, grpc::StatusCode::DEADLINE_EXCEEDED},
    {ErrorCode::Cancelled, grpc::StatusCode::CANCELLED},
    {ErrorCode::Internal, grpc::StatusCode::INTERNAL}
}};

ErrorCode fromGrpcStatusCode(grpc::StatusCode status) {
    const auto it = std::ranges::find(codeMappings, status, &CodeMapping::status);
    return it == codeMappings.end() ? ErrorCode::Unknown : it->code;
}

} // namespace

grpc::StatusCode toGrpcStatusCode(const ErrorCode& code) {
    const auto it = std::ranges::find(codeMappings, code, &CodeMapping::code);
    return it == codeMappings.end() ? grpc::StatusCode::UNKNOWN : it->status;
}

std::expected<std::monostate, Error> toExpected(const grpc::Status& status) {
    if (status.ok()) {
        return {};
    }
    return std::unexpected {toError(status)};
}

// The whole Error rides in the status details; peers that drop them fall
// back to the status code.
grpc::Status toGrpcStatus(const Error& error) {
    proto::ErrorDetails details;
    details.set_code(static_cast<proto::ErrorCode>(error.code));
    details.set_what(error.what);
    details.set_key(error.key);
    details.set_owner(error.owner);
    if (error.acquiredAt.has_value()) {
        details.set_acquired_at_micros(toMicros(error.acquiredAt.value()));
    }
    google::protobuf::Any packed;
    packed.PackFrom(details);
    return grpc::Status(toGrpcStatusCode(error.code), toString(error.code), packed.SerializeAsString());
}

Error toError(const grpc::Status& status) {
    if (status.ok()) {
        throw std::logic_error("Cannot convert OK status to error");
    }
    proto::ErrorDetails details;
    google::protobuf::Any packed;
    if (!packed.ParseFromString(status.error_details()) || !packed.UnpackTo(&details)) {
        return Error(fromGrpcStatusCode(status.error_code()), status.error_message());
    }
    std::optional<Timestamp> at;
    if (details.has_acquired_at_micros()) {
        at = fromMicros(details.acquired_at_micros());
    }
    return Error(static_cast<ErrorCode>(details.code()), details.what(), details.key(), details.owner(), at);
}

} // namespace zlock
