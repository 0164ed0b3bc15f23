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
#include "common/Error.hpp"
#include "common/Util.hpp"
#include <utility>
#include <string>
#include <ostream>
#include <optional>
#include <unordered_set>
#include <unordered_map>

namespace zlock {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArg: return "InvalidArgument";
        case ErrorCode::AlreadyLocked: return "AlreadyLocked";
        case ErrorCode::StaleLock: return "StaleLock";
        case ErrorCode::Transient: return "Transient";
        case ErrorCode::LockLost: return "LockLost";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::BudgetExhausted: return "BudgetExhausted";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::PreconditionFailed: return "PreconditionFailed";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::VersionMismatch: return "VersionMismatch";
        case ErrorCode::Unavailable: return "Unavailable";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Internal: return "Internal";
        case ErrorCode::Unknown: return "Unknown";
    }
    std::unreachable();
}

const std::unordered_map<std::string, std::unordered_set<ErrorCode, ErrorCodeHash>> retriableErrorCodes = {
    {"acquire", {
        ErrorCode::AlreadyLocked,
        ErrorCode::Transient,
    }},
    {"release", {
        ErrorCode::Transient,
    }},
    {"default", {
        ErrorCode::Transient,
    }}
};

bool isRetriable(const std::string& op, const ErrorCode& code) {
    auto it = retriableErrorCodes.find(op);
    if (it != retriableErrorCodes.end()) {
        return it->second.contains(code);
    }
    return retriableErrorCodes.at("default").contains(code);
}

Error::Error(const ErrorCode& c, std::string w, std::string k, std::string o, std::optional<Timestamp> at)
    : code {c}, what {std::move(w)}, key {std::move(k)}, owner {std::move(o)}, acquiredAt {at} {}
Error::Error(const ErrorCode& c, std::string w, std::string k)
    : code {c}, what {std::move(w)}, key {std::move(k)}, owner {}, acquiredAt {} {}
Error::Error(const ErrorCode& c, std::string w) : code {c}, what {std::move(w)}, key {}, owner {}, acquiredAt {} {}
Error::Error(const ErrorCode& c) : code {c}, what {toString(c)}, key {}, owner {}, acquiredAt {} {}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    os << error.code << ": " << error.what;
    if (!error.owner.empty()) {
        os << " (holder " << error.owner;
        if (error.acquiredAt.has_value()) {
            os << " since " << formatTimestamp(error.acquiredAt.value());
        }
        os << ")";
    }
    return os;
}

} // namespace zlock
