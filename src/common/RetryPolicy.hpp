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
#ifndef RETRY_POLICY_H
#define RETRY_POLICY_H

#include <chrono>
#include <optional>

namespace zlock {

// Budget for acquire retries. At least one of maxAttempts and maxElapsed
// must be set so that no wait is unbounded.
struct RetryPolicy {
    RetryPolicy(
        std::chrono::microseconds base,
        double factor,
        std::chrono::microseconds max,
        std::optional<int> attempts,
        std::optional<std::chrono::microseconds> elapsed
    );
    std::chrono::microseconds baseDelay;
    double backoffFactor;
    std::chrono::microseconds maxDelay;
    std::optional<int> maxAttempts;
    std::optional<std::chrono::microseconds> maxElapsed;
};

} // namespace zlock

#endif // RETRY_POLICY_H
