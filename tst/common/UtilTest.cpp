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
#include <cctype>
#include <chrono>
#include <string>
#include "common/Error.hpp"
#include "common/Util.hpp"

using namespace std::chrono;
using zlock::ErrorCode;

TEST(UtilTest, RandomStringHasRequestedLength) {
    const auto s = zlock::generate_random_alphanumeric_string(16);
    EXPECT_EQ(s.size(), 16);
    for (const char c : s) {
        EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(c)));
    }
}

TEST(UtilTest, OwnerIdsAreUniquePerCall) {
    const auto a = zlock::makeOwnerId("hostX");
    const auto b = zlock::makeOwnerId("hostX");
    EXPECT_NE(a, b);
    EXPECT_EQ(a.rfind("hostX:", 0), 0);
}

TEST(UtilTest, OwnerIdDefaultsToHostname) {
    const auto id = zlock::makeOwnerId();
    EXPECT_EQ(id.rfind(zlock::localHostname() + ":", 0), 0);
}

TEST(UtilTest, TruncateDropsSubMicroseconds) {
    const zlock::Timestamp t {nanoseconds{1'700'000'000'123'456'789LL}};
    const auto truncated = zlock::truncateToMicros(t);
    EXPECT_EQ(zlock::toMicros(truncated), 1'700'000'000'123'456LL);
    EXPECT_EQ(zlock::fromMicros(zlock::toMicros(truncated)), truncated);
}

TEST(UtilTest, FormatTimestamp) {
    EXPECT_EQ(zlock::formatTimestamp(zlock::fromMicros(1'700'000'000'123'456LL)), "2023-11-14T22:13:20.123456Z");
}

TEST(UtilTest, FormatDuration) {
    EXPECT_EQ(zlock::formatDuration(minutes{10}), "10m");
    EXPECT_EQ(zlock::formatDuration(hours{2}), "2h");
    EXPECT_EQ(zlock::formatDuration(milliseconds{1500}), "1500ms");
    EXPECT_EQ(zlock::formatDuration(microseconds{7}), "7us");
    EXPECT_EQ(zlock::formatDuration(microseconds{0}), "0us");
}

TEST(UtilTest, ParseDurationUnits) {
    EXPECT_EQ(zlock::parseDuration("250us").value(), microseconds{250});
    EXPECT_EQ(zlock::parseDuration("100ms").value(), milliseconds{100});
    EXPECT_EQ(zlock::parseDuration("30s").value(), seconds{30});
    EXPECT_EQ(zlock::parseDuration("10m").value(), minutes{10});
    EXPECT_EQ(zlock::parseDuration("1h").value(), hours{1});
    EXPECT_EQ(zlock::parseDuration("0").value(), microseconds{0});
}

TEST(UtilTest, ParseDurationRejectsGarbage) {
    for (const auto* text : {"", "ms", "10", "10d", "-5s", "1.5s", "9999999999s"}) {
        const auto d = zlock::parseDuration(text);
        ASSERT_FALSE(d.has_value()) << text;
        EXPECT_EQ(d.error().code, ErrorCode::InvalidArg);
    }
}
