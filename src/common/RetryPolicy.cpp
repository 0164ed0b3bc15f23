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
#include "common/RetryPolicy.hpp"
#include <stdexcept>
#include <chrono>
#include <optional>

namespace zlock {

RetryPolicy::RetryPolicy(
    std::chrono::microseconds base,
    double factor,
    std::chrono::microseconds max,
    std::optional<int> attempts,
    std::optional<std::chrono::microseconds> elapsed)
    : baseDelay(base),
      backoffFactor(factor),
      maxDelay(max),
      maxAttempts(attempts),
      maxElapsed(elapsed) {
    if (base < std::chrono::microseconds::zero()) {
        throw std::invalid_argument("Base delay must be >= zero.");
    }
    if (max < std::chrono::microseconds::zero()) {
        throw std::invalid_argument("Max delay must be >= zero.");
    }
    if (max < base) {
        throw std::invalid_argument("Max delay must be >= base delay.");
    }
    if (!(factor >= 1.0)) {
        throw std::invalid_argument("Backoff factor must be >= 1.");
    }
    if (attempts.has_value() && attempts.value() < 1) {
        throw std::invalid_argument("Max attempts must be >= 1.");
    }
    if (elapsed.has_value() && elapsed.value() < std::chrono::microseconds::zero()) {
        throw std::invalid_argument("Max elapsed time must be >= zero.");
    }
    if (!attempts.has_value() && !elapsed.has_value()) {
        throw std::invalid_argument("Either max attempts or max elapsed time must be set.");
    }
}

} // namespace zlock
