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
#include "common/Logging.hpp"
#include "server/LedgerStoreServiceImpl.hpp"
#include "server/ObjectStoreServiceImpl.hpp"
#include "server/RPCServer.hpp"
#include "storage/InMemoryLedgerStore.hpp"
#include "storage/InMemoryObjectStore.hpp"
#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <optional>
#include <string>
#include <thread>

namespace {

std::atomic<bool> stopRequested {false};

void onTerminationSignal(int) {
    stopRequested.store(true);
}

} // namespace

using namespace zlock;

int main(int argc, char** argv) {
    CLI::App app{"ZLock store daemon: in-memory object and ledger stores over gRPC"};
    std::string listen {"0.0.0.0:50061"};
    std::string logFile;
    bool verbose = false;
    app.add_option("--listen", listen, "Address to serve on");
    app.add_option("--log-file", logFile, "Also write logs to this rotating file");
    app.add_flag("-v,--verbose", verbose, "Debug logging");
    CLI11_PARSE(app, argc, argv);

    initLogging("zlockd", verbose ? spdlog::level::debug : spdlog::level::info,
                logFile.empty() ? std::nullopt : std::optional<std::string>{logFile});

    struct sigaction action {};
    action.sa_handler = onTerminationSignal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    int code = 0;
    try {
        InMemoryObjectStore objects {};
        InMemoryLedgerStore ledger {};
        ObjectStoreServiceImpl objectService {objects};
        LedgerStoreServiceImpl ledgerService {ledger};
        RPCServer<ObjectStoreServiceImpl, LedgerStoreServiceImpl> server {listen, objectService, ledgerService};
        while (!stopRequested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        spdlog::info("Shutting down, {} marker(s) and {} row(s) held", objects.size(), ledger.size());
        server.shutdown();
    } catch (const std::exception& e) {
        spdlog::error("zlockd: {}", e.what());
        code = 1;
    }
    spdlog::shutdown();
    return code;
}
