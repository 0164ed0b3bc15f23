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
#include "zlock/Commands.hpp"
#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>
#include <spdlog/spdlog.h>
#include <memory>

int main(int argc, char** argv) {
    CLI::App app{"ZLock: run commands under a distributed lock"};

    auto client = std::make_shared<zlock::ClientArgs>();
    auto exitCode = std::make_shared<int>(0);

    app.add_option("--endpoint", client->endpoint, "Store service address (default $ZLOCK_ENDPOINT or localhost:50061)");
    app.add_option("--strategy", client->strategy, "Lock backend: object or ledger");
    app.add_option("--rpc-timeout", client->rpcTimeout, "Deadline for each store call");
    app.add_flag("-v,--verbose", client->verbose, "Log retries and state transitions");

    zlock::addRunCommand(&app, client, exitCode);
    zlock::addStatusCommand(&app, client, exitCode);
    zlock::addForceUnlockCommand(&app, client, exitCode);
    zlock::addListCommand(&app, client, exitCode);

    app.require_subcommand(1);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int code = app.exit(e);
        spdlog::shutdown();
        return code;
    }
    spdlog::shutdown();
    return *exitCode;
}
