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
#include "client/RemoteLedgerStore.hpp"
#include "client/RemoteObjectStore.hpp"
#include "common/Canceller.hpp"
#include "common/Logging.hpp"
#include "common/Util.hpp"
#include "lock/LedgerLock.hpp"
#include "lock/LockCoordinator.hpp"
#include "lock/LockStrategy.hpp"
#include "zlock/ChildProcess.hpp"
#include "zlock/CommandSupport.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace zlock {

namespace {

std::atomic<Canceller*> activeCanceller {nullptr};

void onTerminationSignal(int) {
    if (auto* c = activeCanceller.load(); c != nullptr) {
        c->cancel();
    }
}

// Routes SIGINT/SIGTERM to a canceller for the lifetime of the scope.
class SignalScope {
public:
    explicit SignalScope(Canceller& canceller) {
        activeCanceller.store(&canceller);
        struct sigaction action {};
        action.sa_handler = onTerminationSignal;
        sigemptyset(&action.sa_mask);
        sigaction(SIGINT, &action, &previousInt);
        sigaction(SIGTERM, &action, &previousTerm);
    }
    SignalScope(const SignalScope&) = delete;
    SignalScope& operator=(const SignalScope&) = delete;
    ~SignalScope() {
        sigaction(SIGINT, &previousInt, nullptr);
        sigaction(SIGTERM, &previousTerm, nullptr);
        activeCanceller.store(nullptr);
    }
private:
    struct sigaction previousInt {};
    struct sigaction previousTerm {};
};

// Remote stores plus the strategy chosen on the command line. Not movable:
// the stores keep a reference to config.
class Backend {
public:
    Backend(const ClientArgs& args, StrategyKind kind)
        : config {args.endpoint, std::chrono::duration_cast<std::chrono::milliseconds>(requiredDuration(args.rpcTimeout, "--rpc-timeout"))} {
        if (kind == StrategyKind::ObjectConditional) {
            objects = std::make_unique<RemoteObjectStore>(config);
        } else {
            ledger = std::make_unique<RemoteLedgerStore>(config);
        }
        lockStrategy = makeLockStrategy(kind, objects.get(), ledger.get());
        spdlog::debug("Using {} strategy against {}", lockStrategy->name(), config.address);
    }
    Backend(const Backend&) = delete;
    Backend& operator=(const Backend&) = delete;

    LockStrategy& strategy() {
        return *lockStrategy;
    }
    LedgerStore* ledgerStore() {
        return ledger.get();
    }
private:
    Config config;
    std::unique_ptr<ObjectStore> objects;
    std::unique_ptr<LedgerStore> ledger;
    std::unique_ptr<LockStrategy> lockStrategy;
};

void startLogging(const ClientArgs& client) {
    initLogging("zlock", client.verbose ? spdlog::level::debug : spdlog::level::warn);
}

void printRecord(const LockRecord& record) {
    std::cout << "identity:    " << record.identity << '\n'
              << "owner:       " << record.owner << '\n'
              << "acquired at: " << formatTimestamp(record.acquiredAt) << '\n';
    if (!record.operation.empty()) {
        std::cout << "operation:   " << record.operation << '\n';
    }
    if (record.ttl.has_value()) {
        std::cout << "ttl:         " << formatDuration(record.ttl.value()) << '\n';
    }
}

} // namespace

int runCommand(const ClientArgs& client, const RunArgs& args) {
    auto options = toLockOptions(client, args);
    if (!options.has_value()) {
        std::cerr << "zlock: " << options.error() << '\n';
        return exitFailure;
    }
    try {
        Backend backend {client, options->strategy};
        Canceller canceller;
        const SignalScope signals {canceller};
        LockCoordinator coordinator {backend.strategy()};
        const auto result = coordinator.run(
            args.identity,
            args.owner,
            options.value(),
            [&]() { return runChild(args.command, canceller); },
            &canceller);
        return reportRunResult(result, std::cerr);
    } catch (const std::invalid_argument& e) {
        std::cerr << "zlock: " << e.what() << '\n';
        return exitFailure;
    }
}

int statusCommand(const ClientArgs& client, const StatusArgs& args) {
    try {
        Backend backend {client, strategyKind(client)};
        LockCoordinator coordinator {backend.strategy()};
        auto status = coordinator.status(args.identity, optionalDuration(args.ttl, "--ttl"));
        if (!status.has_value()) {
            std::cerr << "zlock: " << status.error() << '\n';
            return exitFailure;
        }
        if (!status->held) {
            std::cout << args.identity << " is free\n";
            return 0;
        }
        printRecord(status->record.value());
        std::cout << "age:         " << formatDuration(status->age) << '\n';
        if (status->ageExceedsTtl) {
            std::cout << "stale:       yes, run 'zlock force-unlock " << args.identity << "' if the holder is gone\n";
        }
        return 0;
    } catch (const std::invalid_argument& e) {
        std::cerr << "zlock: " << e.what() << '\n';
        return exitFailure;
    }
}

int forceUnlockCommand(const ClientArgs& client, const ForceUnlockArgs& args) {
    try {
        Backend backend {client, strategyKind(client)};
        LockCoordinator coordinator {backend.strategy()};
        auto r = coordinator.forceUnlock(args.identity);
        if (!r.has_value()) {
            std::cerr << "zlock: " << r.error() << '\n';
            return exitFailure;
        }
        std::cout << "Released " << args.identity << '\n';
        return 0;
    } catch (const std::invalid_argument& e) {
        std::cerr << "zlock: " << e.what() << '\n';
        return exitFailure;
    }
}

int listCommand(const ClientArgs& client) {
    try {
        Backend backend {client, strategyKind(client)};
        if (backend.ledgerStore() == nullptr) {
            std::cerr << "zlock: list requires --strategy ledger\n";
            return exitFailure;
        }
        const LedgerLock ledger {*backend.ledgerStore()};
        auto records = ledger.list();
        if (!records.has_value()) {
            std::cerr << "zlock: " << records.error() << '\n';
            return exitFailure;
        }
        for (const auto& record : records.value()) {
            std::cout << record.identity << '\t' << record.owner << '\t' << formatTimestamp(record.acquiredAt) << '\t' << record.operation << '\n';
        }
        return 0;
    } catch (const std::invalid_argument& e) {
        std::cerr << "zlock: " << e.what() << '\n';
        return exitFailure;
    }
}

CLI::App* addRunCommand(CLI::App* app, std::shared_ptr<ClientArgs> client, std::shared_ptr<int> exitCode) {
    CLI::App* cmd = app->add_subcommand("run", "Run a command while holding a lock");
    auto args = std::make_shared<RunArgs>();

    cmd->add_option("identity", args->identity, "Name of the protected resource")->required();
    cmd->add_option("--ttl", args->ttl, "Age after which a held lock counts as stale (e.g. 10m)");
    cmd->add_option("--max-attempts", args->maxAttempts, "Acquire attempts before giving up, 0 for no limit (needs --max-elapsed)")
        ->check(CLI::NonNegativeNumber);
    cmd->add_option("--max-elapsed", args->maxElapsed, "Total time to keep trying to acquire");
    cmd->add_option("--backoff-base", args->backoffBase, "First retry delay");
    cmd->add_option("--backoff-factor", args->backoffFactor, "Growth factor between retry delays");
    cmd->add_option("--backoff-cap", args->backoffCap, "Largest retry delay");
    cmd->add_flag("--reclaim-stale", args->reclaimStale, "Take over locks older than --ttl instead of reporting them");
    cmd->add_option("--owner", args->owner, "Owner prefix recorded with the lock (default: hostname)");
    cmd->add_option("--operation", args->operation, "Description stored with the lock");
    cmd->add_option("command", args->command, "Command to run, after --")->required();

    cmd->callback([client, args, exitCode] {
        startLogging(*client);
        *exitCode = runCommand(*client, *args);
    });
    return cmd;
}

CLI::App* addStatusCommand(CLI::App* app, std::shared_ptr<ClientArgs> client, std::shared_ptr<int> exitCode) {
    CLI::App* cmd = app->add_subcommand("status", "Show who holds a lock");
    auto args = std::make_shared<StatusArgs>();

    cmd->add_option("identity", args->identity, "Name of the protected resource")->required();
    cmd->add_option("--ttl", args->ttl, "Judge staleness against this age instead of the holder's ttl");

    cmd->callback([client, args, exitCode] {
        startLogging(*client);
        *exitCode = statusCommand(*client, *args);
    });
    return cmd;
}

CLI::App* addForceUnlockCommand(CLI::App* app, std::shared_ptr<ClientArgs> client, std::shared_ptr<int> exitCode) {
    CLI::App* cmd = app->add_subcommand("force-unlock", "Delete a lock regardless of its holder");
    auto args = std::make_shared<ForceUnlockArgs>();

    cmd->add_option("identity", args->identity, "Name of the protected resource")->required();

    cmd->callback([client, args, exitCode] {
        startLogging(*client);
        *exitCode = forceUnlockCommand(*client, *args);
    });
    return cmd;
}

CLI::App* addListCommand(CLI::App* app, std::shared_ptr<ClientArgs> client, std::shared_ptr<int> exitCode) {
    CLI::App* cmd = app->add_subcommand("list", "List held locks (ledger strategy only)");

    cmd->callback([client, exitCode] {
        startLogging(*client);
        *exitCode = listCommand(*client);
    });
    return cmd;
}

} // namespace zlock
