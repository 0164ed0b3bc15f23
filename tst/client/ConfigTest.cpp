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
#include <cstdlib>
#include <stdexcept>
#include "client/Config.hpp"

using zlock::Config;

TEST(ConfigTest, ValidConfig) {
    const Config c {"localhost:50061", std::chrono::milliseconds{500L}, std::chrono::milliseconds{250L}};
    EXPECT_EQ(c.address, "localhost:50061");
    EXPECT_EQ(c.rpcTimeout, std::chrono::milliseconds{500L});
    EXPECT_EQ(c.channelTimeout, std::chrono::milliseconds{250L});
}

TEST(ConfigTest, EmptyAddressThrows) {
    EXPECT_THROW(Config{""}, std::invalid_argument);
}

TEST(ConfigTest, NonPositiveTimeoutThrows) {
    EXPECT_THROW((Config{"localhost:1", std::chrono::milliseconds{0L}}), std::invalid_argument);
    EXPECT_THROW((Config{"localhost:1", std::chrono::milliseconds{10L}, std::chrono::milliseconds{-1}}), std::invalid_argument);
}

TEST(ConfigTest, EndpointFromEnvironment) {
    ::setenv("ZLOCK_ENDPOINT", "store.internal:7000", 1);
    EXPECT_EQ(Config::endpointFromEnvironment(), "store.internal:7000");
    ::setenv("ZLOCK_ENDPOINT", "", 1);
    EXPECT_EQ(Config::endpointFromEnvironment(), zlock::defaultEndpoint);
    ::unsetenv("ZLOCK_ENDPOINT");
    EXPECT_EQ(Config::endpointFromEnvironment(), zlock::defaultEndpoint);
}
