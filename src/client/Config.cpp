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
#include "client/Config.hpp"
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

namespace zlock {

Config::Config(std::string a, std::chrono::milliseconds rpc, std::chrono::milliseconds channel)
    : address {std::move(a)},
      rpcTimeout {rpc},
      channelTimeout {channel} {
    if (address.empty()) {
        throw std::invalid_argument("Config: No address provided");
    }
    if (rpcTimeout <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Config: rpcTimeout must be positive");
    }
    if (channelTimeout <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Config: channelTimeout must be positive");
    }
}

std::string Config::endpointFromEnvironment() {
    const char* env = std::getenv("ZLOCK_ENDPOINT");
    if (env == nullptr || *env == '\0') {
        return defaultEndpoint;
    }
    return env;
}

} // namespace zlock
