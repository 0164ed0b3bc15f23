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
#include "common/Canceller.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

namespace zlock {

static_assert(std::atomic<bool>::is_always_lock_free);

void Canceller::cancel() noexcept {
    stopped.store(true, std::memory_order_release);
}

void Canceller::reset() noexcept {
    stopped.store(false, std::memory_order_release);
}

bool Canceller::cancelled() const noexcept {
    return stopped.load(std::memory_order_acquire);
}

bool Canceller::sleepFor(std::chrono::microseconds d) const {
    auto remaining = d;
    while (!cancelled() && remaining > std::chrono::microseconds::zero()) {
        auto step = std::min<std::chrono::microseconds>(remaining, std::chrono::microseconds{1000});
        std::this_thread::sleep_for(step);
        remaining -= step;
    }
    return !cancelled();
}

} // namespace zlock
