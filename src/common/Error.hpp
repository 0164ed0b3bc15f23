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
#ifndef SRC_COMMON_ERROR_HPP
#define SRC_COMMON_ERROR_HPP

#include <string>
#include <ostream>
#include <optional>
#include <unordered_set>
#include <unordered_map>
#include <functional>
#include <type_traits>
#include "common/Types.hpp"

namespace zlock {

enum class ErrorCode {
    OK = 0,
    InvalidArg = 1,
    // Lock level
    AlreadyLocked = 2,
    StaleLock = 3,
    Transient = 4,
    LockLost = 5,
    NotFound = 6,
    BudgetExhausted = 7,
    Cancelled = 8,
    // Backend level, never surfaced past a strategy
    PreconditionFailed = 9,
    AlreadyExists = 10,
    VersionMismatch = 11,
    Unavailable = 12,
    Timeout = 13,
    Internal = 14,
    Unknown = 128
};

struct ErrorCodeHash {
    std::size_t operator()(const ErrorCode& code) const noexcept {
        return std::hash<std::underlying_type_t<ErrorCode>>{}(static_cast<std::underlying_type_t<ErrorCode>>(code));
    }
};

extern const std::unordered_map<std::string, std::unordered_set<ErrorCode, ErrorCodeHash>> retriableErrorCodes;
bool isRetriable(const std::string& op, const ErrorCode& code);

std::ostream& operator<<(std::ostream& os, const ErrorCode& code);

std::string toString(const ErrorCode& code);

struct Error {
    ErrorCode code;
    std::string what;
    // Lock identity or store key the error refers to.
    std::string key;
    // Current holder, when the error is about contention.
    std::string owner;
    std::optional<Timestamp> acquiredAt;

    Error(const ErrorCode& c, std::string w);
    Error(const ErrorCode& c, std::string w, std::string k);
    Error(const ErrorCode& c, std::string w, std::string k, std::string o, std::optional<Timestamp> at);
    explicit Error(const ErrorCode& c);
};

std::ostream& operator<<(std::ostream& os, const Error& error);

} // namespace zlock

#endif // SRC_COMMON_ERROR_HPP
