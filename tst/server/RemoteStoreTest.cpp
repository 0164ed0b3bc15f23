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
#include <memory>
#include <string>
#include "client/Config.hpp"
#include "client/RemoteLedgerStore.hpp"
#include "client/RemoteObjectStore.hpp"
#include "common/Error.hpp"
#include "common/Util.hpp"
#include "lock/LedgerLock.hpp"
#include "lock/LockCoordinator.hpp"
#include "lock/ObjectConditionalLock.hpp"
#include "server/LedgerStoreServiceImpl.hpp"
#include "server/ObjectStoreServiceImpl.hpp"
#include "server/RPCServer.hpp"
#include "storage/InMemoryLedgerStore.hpp"
#include "storage/InMemoryObjectStore.hpp"

using namespace std::chrono_literals;
using zlock::ErrorCode;
using zlock::LockRequest;
using zlock::PutCondition;
using zlock::StalePolicy;

using StoreServer = zlock::RPCServer<zlock::ObjectStoreServiceImpl, zlock::LedgerStoreServiceImpl>;

class RemoteStoreTest : public ::testing::Test {
protected:
    zlock::InMemoryObjectStore objects {};
    zlock::InMemoryLedgerStore ledger {};
    zlock::ObjectStoreServiceImpl objectService {objects};
    zlock::LedgerStoreServiceImpl ledgerService {ledger};
    std::unique_ptr<StoreServer> server;
    std::unique_ptr<zlock::Config> config;

    void SetUp() override {
        server = std::make_unique<StoreServer>("127.0.0.1:0", objectService, ledgerService);
        config = std::make_unique<zlock::Config>("127.0.0.1:" + std::to_string(server->port()), 2000ms, 2000ms);
    }

    void TearDown() override {
        if (server) {
            server->shutdown();
        }
    }
};

TEST_F(RemoteStoreTest, ObjectCallsReachTheStore) {
    zlock::RemoteObjectStore remote {*config};
    auto token = remote.conditionalPut("k", "body", PutCondition::ifAbsent());
    ASSERT_TRUE(token.has_value()) << token.error();
    EXPECT_EQ(objects.get("k")->token, token.value());

    auto again = remote.conditionalPut("k", "other", PutCondition::ifAbsent());
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::PreconditionFailed);

    auto object = remote.get("k");
    ASSERT_TRUE(object.has_value());
    EXPECT_EQ(object->body, "body");
    EXPECT_EQ(object->createdAt, zlock::truncateToMicros(objects.get("k")->createdAt));

    EXPECT_EQ(remote.conditionalDelete("k", "bogus").error().code, ErrorCode::PreconditionFailed);
    EXPECT_TRUE(remote.conditionalDelete("k", token.value()).has_value());
    EXPECT_EQ(remote.get("k").error().code, ErrorCode::NotFound);
    EXPECT_EQ(remote.erase("k").error().code, ErrorCode::NotFound);
}

TEST_F(RemoteStoreTest, LedgerCallsReachTheStore) {
    zlock::RemoteLedgerStore remote {*config};
    auto version = remote.insertIfAbsent("envA", zlock::LedgerFields{{"owner", "hostX"}});
    ASSERT_TRUE(version.has_value()) << version.error();
    EXPECT_EQ(remote.insertIfAbsent("envA", {}).error().code, ErrorCode::AlreadyExists);

    auto row = remote.get("envA");
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->fields.at("owner"), "hostX");
    EXPECT_EQ(row->version, version.value());

    auto rows = remote.list();
    ASSERT_TRUE(rows.has_value());
    EXPECT_EQ(rows->size(), 1);

    EXPECT_EQ(remote.deleteIfVersion("envA", version.value() + 1).error().code, ErrorCode::VersionMismatch);
    EXPECT_TRUE(remote.deleteIfVersion("envA", version.value()).has_value());
    EXPECT_EQ(remote.get("envA").error().code, ErrorCode::NotFound);
}

TEST_F(RemoteStoreTest, ObjectLockScenarioOverTheWire) {
    zlock::RemoteObjectStore remote {*config};
    zlock::ObjectConditionalLock lock {remote};
    auto t1 = lock.acquire(LockRequest{"envA", "hostX", 10min, StalePolicy::Report, "apply"});
    ASSERT_TRUE(t1.has_value()) << t1.error();

    auto blocked = lock.acquire(LockRequest{"envA", "hostY", 10min, StalePolicy::Report, "apply"});
    ASSERT_FALSE(blocked.has_value());
    EXPECT_EQ(blocked.error().code, ErrorCode::AlreadyLocked);
    EXPECT_EQ(blocked.error().owner, "hostX");

    auto record = lock.inspect("envA");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->acquiredAt, t1->acquiredAt);

    ASSERT_TRUE(lock.release(t1.value()).has_value());
    EXPECT_TRUE(lock.acquire(LockRequest{"envA", "hostY", 10min, StalePolicy::Report, "apply"}).has_value());
}

TEST_F(RemoteStoreTest, LedgerCoordinatorOverTheWire) {
    zlock::RemoteLedgerStore remote {*config};
    zlock::LedgerLock lock {remote};
    zlock::LockCoordinator coordinator {lock};
    zlock::LockOptions options;
    options.strategy = zlock::StrategyKind::Ledger;
    options.retry = zlock::RetryPolicy{1ms, 2.0, 10ms, 3, std::nullopt};

    auto outcome = coordinator.run("envA", "hostX", options, [&] {
        return lock.list().value().size();
    });
    ASSERT_TRUE(outcome.has_value()) << outcome.error();
    EXPECT_EQ(outcome->result, 1u);
    EXPECT_FALSE(outcome->releaseWarning.has_value());
    EXPECT_EQ(ledger.size(), 0);
}

TEST(RemoteStoreUnreachableTest, UnreachableEndpointIsTransient) {
    const zlock::Config config {"127.0.0.1:1", 200ms, 200ms};
    zlock::RemoteObjectStore remote {config};
    auto direct = remote.get("k");
    ASSERT_FALSE(direct.has_value());
    EXPECT_EQ(direct.error().code, ErrorCode::Unavailable);

    zlock::ObjectConditionalLock lock {remote};
    auto acquired = lock.acquire(LockRequest{"envA", "hostX", std::nullopt, StalePolicy::Report, ""});
    ASSERT_FALSE(acquired.has_value());
    EXPECT_EQ(acquired.error().code, ErrorCode::Transient);
}
