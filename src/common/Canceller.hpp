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
#ifndef CANCELLER_H
#define CANCELLER_H

#include <atomic>
#include <chrono>

namespace zlock {

// Caller-side abort flag. cancel() only touches a lock-free atomic, so it is
// safe to call from a signal handler.
class Canceller {
public:
    Canceller() = default;
    Canceller(const Canceller&) = delete;
    Canceller& operator=(const Canceller&) = delete;
    void cancel() noexcept;
    void reset() noexcept;
    [[nodiscard]] bool cancelled() const noexcept;
    // Sleeps for d in short steps. Returns false if cancelled before d elapsed.
    bool sleepFor(std::chrono::microseconds d) const;
private:
    std::atomic<bool> stopped{false};
};

} // namespace zlock

#endif // CANCELLER_H
