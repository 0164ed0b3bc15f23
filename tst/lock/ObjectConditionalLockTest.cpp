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
#include <expected>
#include <string>
#include <variant>
#include "common/Error.hpp"
#include "lock/ObjectConditionalLock.hpp"
#include "lock/RecordCodec.hpp"
#include "storage/InMemoryObjectStore.hpp"
#include "ManualClock.hpp"

using zlock::Error;
using zlock::ErrorCode;
using zlock::LockRequest;
using zlock::ObjectConditionalLock;
using zlock::PutCondition;
using zlock::StalePolicy;
using zlock::StoredObject;

namespace {

// Fails every call the way an unreachable store would.
class UnreachableObjectStore : public zlock::ObjectStore {
public:
    std::expected<std::string, Error> conditionalPut(const std::string&, const std::string&, const PutCondition&) override {
        return std::unexpected {Error{ErrorCode::Unavailable, "connection refused"}};
    }
    std::expected<std::monostate, Error> conditionalDelete(const std::string&, const std::string&) override {
        return std::unexpected {Error{ErrorCode::Timeout, "deadline exceeded"}};
    }
    std::expected<StoredObject, Error> get(const std::string&) const override {
        return std::unexpected {Error{ErrorCode::Unavailable, "connection refused"}};
    }
    std::expected<std::monostate, Error> erase(const std::string&) override {
        return std::unexpected {Error{ErrorCode::Unavailable, "connection refused"}};
    }
};

} // namespace

class ObjectConditionalLockTest : public ::testing::Test {
protected:
    ManualClock manualClock {};
    zlock::InMemoryObjectStore store {manualClock.clock()};
    ObjectConditionalLock lock {store, manualClock.clock()};
};

TEST_F(ObjectConditionalLockTest, MarkerLivesAtSuffixedKey) {
    auto handle = lock.acquire(LockRequest{"envA", "hostX", std::nullopt, StalePolicy::Report, ""});
    ASSERT_TRUE(handle.has_value());
    auto marker = store.get("envA.zlock");
    ASSERT_TRUE(marker.has_value());
    EXPECT_EQ(marker->token, handle->fencingToken);
    EXPECT_FALSE(store.get("envA").has_value());
    EXPECT_EQ(lock.name(), "object");
}

TEST_F(ObjectConditionalLockTest, UnreadableMarkerReportsStoreMetadata) {
    ASSERT_TRUE(store.conditionalPut(zlock::markerKey("envA"), "garbage", PutCondition::ifAbsent()).has_value());
    auto record = lock.inspect("envA");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->owner, zlock::unreadableOwner);
    EXPECT_EQ(record->acquiredAt, manualClock.now());

    auto blocked = lock.acquire(LockRequest{"envA", "hostX", std::nullopt, StalePolicy::Report, ""});
    ASSERT_FALSE(blocked.has_value());
    EXPECT_EQ(blocked.error().code, ErrorCode::AlreadyLocked);
}

TEST_F(ObjectConditionalLockTest, ReplacedMarkerIsFreshContention) {
    auto old = lock.acquire(LockRequest{"envA", "hostX", std::chrono::minutes{1}, StalePolicy::Report, ""});
    ASSERT_TRUE(old.has_value());
    manualClock.advance(std::chrono::minutes{2});
    // Someone else already replaced the stale marker; our view of it is outdated.
    ASSERT_TRUE(store.conditionalPut(zlock::markerKey("envA"), "x", PutCondition::ifTokenMatches(old->fencingToken)).has_value());
    auto r = lock.acquire(LockRequest{"envA", "hostY", std::chrono::minutes{1}, StalePolicy::Reclaim, ""});
    // The replaced marker is unreadable and created now, so it is not stale.
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::AlreadyLocked);
}

TEST(ObjectConditionalLockBackendTest, UnreachableStoreIsTransient) {
    UnreachableObjectStore store;
    ObjectConditionalLock lock {store};
    auto acquired = lock.acquire(LockRequest{"envA", "hostX", std::nullopt, StalePolicy::Report, ""});
    ASSERT_FALSE(acquired.has_value());
    EXPECT_EQ(acquired.error().code, ErrorCode::Transient);

    const zlock::LockHandle handle {"envA", "hostX", zlock::Timestamp{}, "g1", std::nullopt};
    EXPECT_EQ(lock.release(handle).error().code, ErrorCode::Transient);
    EXPECT_EQ(lock.inspect("envA").error().code, ErrorCode::Transient);
}
