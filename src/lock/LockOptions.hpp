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
#ifndef LOCK_OPTIONS_H
#define LOCK_OPTIONS_H

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include "common/Error.hpp"
#include "common/RetryPolicy.hpp"

namespace zlock {

enum class StrategyKind : char {
    ObjectConditional,
    Ledger
};

// What acquire does when the existing record is older than the ttl.
enum class StalePolicy : char {
    Report,
    Reclaim
};

std::string toString(StrategyKind kind);
std::string toString(StalePolicy policy);
std::expected<StrategyKind, Error> parseStrategyKind(const std::string& text);

RetryPolicy defaultRetryPolicy();

struct LockOptions {
    StrategyKind strategy = StrategyKind::ObjectConditional;
    std::optional<std::chrono::microseconds> ttl;
    RetryPolicy retry = defaultRetryPolicy();
    StalePolicy stalePolicy = StalePolicy::Report;
    // Free text stored with the record, e.g. "apply".
    std::string operation;
    int releaseAttempts = 3;

    // Throws std::invalid_argument.
    void validate() const;
};

} // namespace zlock

#endif // LOCK_OPTIONS_H
