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
#include <string>
#include <thread>
#include <vector>
#include "storage/InMemoryLedgerStore.hpp"
#include "common/Error.hpp"

using zlock::ErrorCode;
using zlock::InMemoryLedgerStore;
using zlock::LedgerFields;

TEST(InMemoryLedgerStoreTest, InsertThenGet) {
    InMemoryLedgerStore ledger;
    auto version = ledger.insertIfAbsent("envA", LedgerFields{{"owner", "hostX"}});
    ASSERT_TRUE(version.has_value());
    auto row = ledger.get("envA");
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->key, "envA");
    EXPECT_EQ(row->fields.at("owner"), "hostX");
    EXPECT_EQ(row->version, version.value());
}

TEST(InMemoryLedgerStoreTest, InsertFailsWhenPresent) {
    InMemoryLedgerStore ledger;
    ASSERT_TRUE(ledger.insertIfAbsent("envA", {}).has_value());
    auto again = ledger.insertIfAbsent("envA", {});
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::AlreadyExists);
}

TEST(InMemoryLedgerStoreTest, DeleteChecksVersion) {
    InMemoryLedgerStore ledger;
    auto version = ledger.insertIfAbsent("envA", {});
    ASSERT_TRUE(version.has_value());
    auto wrong = ledger.deleteIfVersion("envA", version.value() + 1);
    ASSERT_FALSE(wrong.has_value());
    EXPECT_EQ(wrong.error().code, ErrorCode::VersionMismatch);
    EXPECT_TRUE(ledger.deleteIfVersion("envA", version.value()).has_value());
    EXPECT_EQ(ledger.deleteIfVersion("envA", version.value()).error().code, ErrorCode::NotFound);
    EXPECT_EQ(ledger.get("envA").error().code, ErrorCode::NotFound);
}

TEST(InMemoryLedgerStoreTest, VersionsNeverRepeat) {
    InMemoryLedgerStore ledger;
    auto first = ledger.insertIfAbsent("envA", {});
    ASSERT_TRUE(ledger.deleteIfVersion("envA", first.value()).has_value());
    auto second = ledger.insertIfAbsent("envA", {});
    ASSERT_TRUE(second.has_value());
    EXPECT_GT(second.value(), first.value());
}

TEST(InMemoryLedgerStoreTest, ListReturnsAllRows) {
    InMemoryLedgerStore ledger;
    ASSERT_TRUE(ledger.insertIfAbsent("b", {}).has_value());
    ASSERT_TRUE(ledger.insertIfAbsent("a", {}).has_value());
    auto rows = ledger.list();
    ASSERT_TRUE(rows.has_value());
    ASSERT_EQ(rows->size(), 2);
    EXPECT_EQ(rows->at(0).key, "a");
    EXPECT_EQ(rows->at(1).key, "b");
    EXPECT_EQ(ledger.size(), 2);
}

TEST(InMemoryLedgerStoreTest, ConcurrentInsertHasOneWinner) {
    InMemoryLedgerStore ledger;
    std::atomic<int> wins {0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&ledger, &wins, i] {
            if (ledger.insertIfAbsent("contended", LedgerFields{{"owner", std::to_string(i)}}).has_value()) {
                ++wins;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(wins.load(), 1);
}
