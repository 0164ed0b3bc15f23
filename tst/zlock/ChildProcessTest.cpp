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
#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include "common/Canceller.hpp"
#include "common/Error.hpp"
#include "zlock/ChildProcess.hpp"

using zlock::Canceller;
using zlock::runChild;

TEST(ChildProcessTest, PassesExitCodeThrough) {
    const Canceller canceller;
    EXPECT_EQ(runChild({"true"}, canceller).value(), 0);
    EXPECT_EQ(runChild({"false"}, canceller).value(), 1);
    EXPECT_EQ(runChild({"sh", "-c", "exit 42"}, canceller).value(), 42);
}

TEST(ChildProcessTest, MissingCommandIs127) {
    const Canceller canceller;
    EXPECT_EQ(runChild({"zlock-no-such-command-here"}, canceller).value(), zlock::exitCommandNotFound);
}

TEST(ChildProcessTest, EmptyCommandIsInvalid) {
    const Canceller canceller;
    auto r = runChild({}, canceller);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, zlock::ErrorCode::InvalidArg);
}

TEST(ChildProcessTest, CancelTerminatesChild) {
    Canceller canceller;
    std::thread stopper([&canceller] {
        std::this_thread::sleep_for(std::chrono::milliseconds{100L});
        canceller.cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    auto r = runChild({"sleep", "30"}, canceller);
    stopper.join();
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 128 + 15);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{10L});
}
