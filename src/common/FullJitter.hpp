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
#ifndef FULL_JITTER_H
#define FULL_JITTER_H

#include <random>
#include <chrono>
#include <mutex>

namespace zlock {

// Draws a wait uniformly from [0, v] so that contending clients spread out.
class FullJitter {
public:
    FullJitter();
    explicit FullJitter(std::mt19937::result_type seed);
    std::chrono::microseconds jitter(const std::chrono::microseconds v);
private:
    std::mt19937 rng;
    std::mutex m;
};

} // namespace zlock

#endif // FULL_JITTER_H
