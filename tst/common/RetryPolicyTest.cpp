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
#include <optional>
#include <stdexcept>
#include "common/RetryPolicy.hpp"

using zlock::RetryPolicy;

TEST(RetryPolicyTest, ValidConstruction) {
    const RetryPolicy policy(
        std::chrono::milliseconds{100L},
        2.0,
        std::chrono::seconds{10L},
        10,
        std::chrono::minutes{1L}
    );
    EXPECT_EQ(policy.baseDelay, std::chrono::milliseconds{100L});
    EXPECT_EQ(policy.backoffFactor, 2.0);
    EXPECT_EQ(policy.maxDelay, std::chrono::seconds{10L});
    EXPECT_EQ(policy.maxAttempts, 10);
    EXPECT_EQ(policy.maxElapsed, std::chrono::minutes{1L});
}

TEST(RetryPolicyTest, AttemptsOnlyIsEnough) {
    EXPECT_NO_THROW(RetryPolicy(std::chrono::microseconds{0L}, 1.0, std::chrono::microseconds{0L}, 1, std::nullopt));
}

TEST(RetryPolicyTest, ElapsedOnlyIsEnough) {
    EXPECT_NO_THROW(RetryPolicy(std::chrono::microseconds{100L}, 1.5, std::chrono::microseconds{100L}, std::nullopt, std::chrono::seconds{5L}));
}

TEST(RetryPolicyTest, NoBudgetThrows) {
    EXPECT_THROW(
        RetryPolicy(std::chrono::microseconds{100L}, 2.0, std::chrono::microseconds{1000L}, std::nullopt, std::nullopt),
        std::invalid_argument
    );
}

TEST(RetryPolicyTest, NegativeBaseDelayThrows) {
    EXPECT_THROW(
        RetryPolicy(std::chrono::microseconds{-100}, 2.0, std::chrono::microseconds{1000L}, 3, std::nullopt),
        std::invalid_argument
    );
}

TEST(RetryPolicyTest, MaxBelowBaseThrows) {
    EXPECT_THROW(
        RetryPolicy(std::chrono::microseconds{1000L}, 2.0, std::chrono::microseconds{100L}, 3, std::nullopt),
        std::invalid_argument
    );
}

TEST(RetryPolicyTest, FactorBelowOneThrows) {
    EXPECT_THROW(
        RetryPolicy(std::chrono::microseconds{100L}, 0.5, std::chrono::microseconds{1000L}, 3, std::nullopt),
        std::invalid_argument
    );
}

TEST(RetryPolicyTest, ZeroAttemptsThrows) {
    EXPECT_THROW(
        RetryPolicy(std::chrono::microseconds{100L}, 2.0, std::chrono::microseconds{1000L}, 0, std::nullopt),
        std::invalid_argument
    );
}

TEST(RetryPolicyTest, NegativeElapsedThrows) {
    EXPECT_THROW(
        RetryPolicy(std::chrono::microseconds{100L}, 2.0, std::chrono::microseconds{1000L}, std::nullopt, std::chrono::microseconds{-1}),
        std::invalid_argument
    );
}
