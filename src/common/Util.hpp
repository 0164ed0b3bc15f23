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
#ifndef ZLOCK_UTIL_H
#define ZLOCK_UTIL_H

#include <random>
#include <array>
#include <algorithm>
#include <functional>
#include <string>
#include <chrono>
#include <cstdint>
#include <expected>
#include "common/Types.hpp"
#include "common/Error.hpp"

namespace zlock {

template <typename T = std::mt19937>
auto random_generator() -> T {
    auto constexpr seed_bytes = sizeof(typename T::result_type) * T::state_size;
    auto constexpr seed_len = seed_bytes / sizeof(std::seed_seq::result_type);
    auto seed = std::array<std::seed_seq::result_type, seed_len>();
    auto dev = std::random_device();
    std::generate_n(begin(seed), seed_len, std::ref(dev));
    auto seed_seq = std::seed_seq(begin(seed), end(seed));
    return T{seed_seq};
}

std::string generate_random_alphanumeric_string(std::size_t len);

// <hint or hostname>:<pid>:<nonce>. A fresh nonce per call keeps two
// invocations inside one process apart.
Owner makeOwnerId(const std::string& hint = "");

std::string localHostname();

int64_t toMicros(Timestamp t);
Timestamp fromMicros(int64_t micros);

// Drops sub-microsecond precision so a timestamp survives a trip through a record.
Timestamp truncateToMicros(Timestamp t);

// ISO-8601 UTC, microsecond precision.
std::string formatTimestamp(Timestamp t);

std::string formatDuration(std::chrono::microseconds d);

// Accepts <number><unit> with unit one of us, ms, s, m, h.
std::expected<std::chrono::microseconds, Error> parseDuration(const std::string& text);

} // namespace zlock

#endif // ZLOCK_UTIL_H
