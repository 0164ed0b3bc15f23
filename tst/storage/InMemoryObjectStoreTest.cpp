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
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include "storage/InMemoryObjectStore.hpp"
#include "common/Error.hpp"
#include "ManualClock.hpp"

using zlock::ErrorCode;
using zlock::InMemoryObjectStore;
using zlock::PutCondition;

class InMemoryObjectStoreTest : public ::testing::Test {
protected:
    ManualClock manualClock {};
    InMemoryObjectStore store {manualClock.clock()};
};

TEST_F(InMemoryObjectStoreTest, PutIfAbsentThenGet) {
    auto token = store.conditionalPut("a", "body", PutCondition::ifAbsent());
    ASSERT_TRUE(token.has_value());
    auto object = store.get("a");
    ASSERT_TRUE(object.has_value());
    EXPECT_EQ(object->body, "body");
    EXPECT_EQ(object->token, token.value());
    EXPECT_EQ(object->createdAt, manualClock.now());
    EXPECT_EQ(store.size(), 1);
}

TEST_F(InMemoryObjectStoreTest, PutIfAbsentFailsWhenPresent) {
    ASSERT_TRUE(store.conditionalPut("a", "one", PutCondition::ifAbsent()).has_value());
    auto second = store.conditionalPut("a", "two", PutCondition::ifAbsent());
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, ErrorCode::PreconditionFailed);
    EXPECT_EQ(store.get("a")->body, "one");
}

TEST_F(InMemoryObjectStoreTest, IfMatchReplacesOnlyMatchingVersion) {
    auto first = store.conditionalPut("a", "one", PutCondition::ifAbsent());
    ASSERT_TRUE(first.has_value());
    auto stale = store.conditionalPut("a", "x", PutCondition::ifTokenMatches("nope"));
    ASSERT_FALSE(stale.has_value());
    EXPECT_EQ(stale.error().code, ErrorCode::PreconditionFailed);
    auto second = store.conditionalPut("a", "two", PutCondition::ifTokenMatches(first.value()));
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(second.value(), first.value());
    EXPECT_EQ(store.get("a")->body, "two");
}

TEST_F(InMemoryObjectStoreTest, IfMatchOnMissingKeyFails) {
    auto r = store.conditionalPut("a", "x", PutCondition::ifTokenMatches("g1"));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::PreconditionFailed);
}

TEST_F(InMemoryObjectStoreTest, UnconditionalPutOverwrites) {
    ASSERT_TRUE(store.conditionalPut("a", "one", PutCondition::always()).has_value());
    ASSERT_TRUE(store.conditionalPut("a", "two", PutCondition::always()).has_value());
    EXPECT_EQ(store.get("a")->body, "two");
}

TEST_F(InMemoryObjectStoreTest, ConditionalDeleteChecksToken) {
    auto token = store.conditionalPut("a", "one", PutCondition::ifAbsent());
    ASSERT_TRUE(token.has_value());
    auto wrong = store.conditionalDelete("a", "g999");
    ASSERT_FALSE(wrong.has_value());
    EXPECT_EQ(wrong.error().code, ErrorCode::PreconditionFailed);
    EXPECT_TRUE(store.conditionalDelete("a", token.value()).has_value());
    auto missing = store.conditionalDelete("a", token.value());
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST_F(InMemoryObjectStoreTest, TokensNeverRepeatAfterRecreate) {
    auto first = store.conditionalPut("a", "one", PutCondition::ifAbsent());
    ASSERT_TRUE(store.erase("a").has_value());
    auto second = store.conditionalPut("a", "one", PutCondition::ifAbsent());
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(first.value(), second.value());
}

TEST_F(InMemoryObjectStoreTest, EraseAndGetMissing) {
    EXPECT_EQ(store.erase("none").error().code, ErrorCode::NotFound);
    EXPECT_EQ(store.get("none").error().code, ErrorCode::NotFound);
}

TEST_F(InMemoryObjectStoreTest, ConcurrentPutIfAbsentHasOneWinner) {
    constexpr int writers = 16;
    std::atomic<int> wins {0};
    std::vector<std::thread> threads;
    for (int i = 0; i < writers; ++i) {
        threads.emplace_back([this, &wins, i] {
            if (store.conditionalPut("contended", std::to_string(i), PutCondition::ifAbsent()).has_value()) {
                ++wins;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(wins.load(), 1);
}
