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
#ifndef ZLOCK_COMMAND_SUPPORT_H
#define ZLOCK_COMMAND_SUPPORT_H

#include <chrono>
#include <expected>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "client/Config.hpp"
#include "common/Error.hpp"
#include "lock/LockCoordinator.hpp"
#include "lock/LockOptions.hpp"

namespace zlock {

// Lock could not be acquired or the run was cancelled (EX_TEMPFAIL).
constexpr int exitLockUnavailable = 75;
constexpr int exitFailure = 1;

struct ClientArgs {
    std::string endpoint = Config::endpointFromEnvironment();
    std::string strategy = "object";
    std::string rpcTimeout = "2s";
    bool verbose = false;
};

struct RunArgs {
    std::string identity;
    std::string ttl;
    // 0 lifts the attempt limit; --max-elapsed must then bound the retries.
    int maxAttempts = 10;
    std::string maxElapsed;
    std::string backoffBase = "100ms";
    double backoffFactor = 2.0;
    std::string backoffCap = "10s";
    bool reclaimStale = false;
    std::string owner;
    std::string operation;
    std::vector<std::string> command;
};

struct StatusArgs {
    std::string identity;
    std::string ttl;
};

struct ForceUnlockArgs {
    std::string identity;
};

using RunResult = std::expected<RunOutcome<std::expected<int, Error>>, Error>;

// Empty text is nullopt. Throws std::invalid_argument naming flag.
std::optional<std::chrono::microseconds> optionalDuration(const std::string& text, const std::string& flag);
std::chrono::microseconds requiredDuration(const std::string& text, const std::string& flag);

// Throws std::invalid_argument.
StrategyKind strategyKind(const ClientArgs& client);

std::expected<LockOptions, Error> toLockOptions(const ClientArgs& client, const RunArgs& args);

int exitCodeFor(const Error& error);

// Writes diagnostics to err and picks the process exit code of `zlock run`.
int reportRunResult(const RunResult& result, std::ostream& err);

} // namespace zlock

#endif // ZLOCK_COMMAND_SUPPORT_H
