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
#include "lock/LockOptions.hpp"
#include "common/RetryPolicy.hpp"
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace zlock {

std::string toString(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::ObjectConditional: return "object";
        case StrategyKind::Ledger: return "ledger";
    }
    std::unreachable();
}

std::string toString(StalePolicy policy) {
    switch (policy) {
        case StalePolicy::Report: return "report";
        case StalePolicy::Reclaim: return "reclaim";
    }
    std::unreachable();
}

std::expected<StrategyKind, Error> parseStrategyKind(const std::string& text) {
    if (text == "object" || text == "object-conditional") {
        return StrategyKind::ObjectConditional;
    }
    if (text == "ledger") {
        return StrategyKind::Ledger;
    }
    return std::unexpected {Error{ErrorCode::InvalidArg, "Unknown strategy '" + text + "' (use object or ledger)"}};
}

RetryPolicy defaultRetryPolicy() {
    return RetryPolicy{
        std::chrono::milliseconds{100},
        2.0,
        std::chrono::seconds{10},
        10,
        std::nullopt
    };
}

void LockOptions::validate() const {
    if (ttl.has_value() && ttl.value() <= std::chrono::microseconds::zero()) {
        throw std::invalid_argument("TTL must be > zero.");
    }
    if (releaseAttempts < 1) {
        throw std::invalid_argument("Release attempts must be >= 1.");
    }
}

} // namespace zlock
