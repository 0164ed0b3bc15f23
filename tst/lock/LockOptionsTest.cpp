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
#include <stdexcept>
#include "common/Error.hpp"
#include "lock/LockOptions.hpp"

using namespace std::chrono_literals;
using zlock::LockOptions;
using zlock::StalePolicy;
using zlock::StrategyKind;

TEST(LockOptionsTest, Defaults) {
    const LockOptions options;
    EXPECT_EQ(options.strategy, StrategyKind::ObjectConditional);
    EXPECT_EQ(options.stalePolicy, StalePolicy::Report);
    EXPECT_FALSE(options.ttl.has_value());
    EXPECT_EQ(options.releaseAttempts, 3);
    EXPECT_EQ(options.retry.baseDelay, 100ms);
    EXPECT_EQ(options.retry.backoffFactor, 2.0);
    EXPECT_EQ(options.retry.maxDelay, 10s);
    EXPECT_EQ(options.retry.maxAttempts, 10);
    EXPECT_FALSE(options.retry.maxElapsed.has_value());
    EXPECT_NO_THROW(options.validate());
}

TEST(LockOptionsTest, NonPositiveTtlRejected) {
    LockOptions options;
    options.ttl = 0s;
    EXPECT_THROW(options.validate(), std::invalid_argument);
    options.ttl = -1s;
    EXPECT_THROW(options.validate(), std::invalid_argument);
}

TEST(LockOptionsTest, ReleaseAttemptsMustBePositive) {
    LockOptions options;
    options.releaseAttempts = 0;
    EXPECT_THROW(options.validate(), std::invalid_argument);
}

TEST(LockOptionsTest, ParseStrategy) {
    EXPECT_EQ(zlock::parseStrategyKind("object").value(), StrategyKind::ObjectConditional);
    EXPECT_EQ(zlock::parseStrategyKind("object-conditional").value(), StrategyKind::ObjectConditional);
    EXPECT_EQ(zlock::parseStrategyKind("ledger").value(), StrategyKind::Ledger);
    auto bad = zlock::parseStrategyKind("dynamo");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, zlock::ErrorCode::InvalidArg);
}

TEST(LockOptionsTest, Names) {
    EXPECT_EQ(zlock::toString(StrategyKind::Ledger), "ledger");
    EXPECT_EQ(zlock::toString(StalePolicy::Reclaim), "reclaim");
}
