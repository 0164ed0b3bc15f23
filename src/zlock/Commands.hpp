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
#ifndef ZLOCK_COMMANDS_H
#define ZLOCK_COMMANDS_H

#include <CLI/App.hpp>
#include <memory>
#include "zlock/CommandSupport.hpp"

namespace zlock {

// Each subcommand stores its process exit code into *exitCode.
CLI::App* addRunCommand(CLI::App* app, std::shared_ptr<ClientArgs> client, std::shared_ptr<int> exitCode);
CLI::App* addStatusCommand(CLI::App* app, std::shared_ptr<ClientArgs> client, std::shared_ptr<int> exitCode);
CLI::App* addForceUnlockCommand(CLI::App* app, std::shared_ptr<ClientArgs> client, std::shared_ptr<int> exitCode);
CLI::App* addListCommand(CLI::App* app, std::shared_ptr<ClientArgs> client, std::shared_ptr<int> exitCode);

int runCommand(const ClientArgs& client, const RunArgs& args);
int statusCommand(const ClientArgs& client, const StatusArgs& args);
int forceUnlockCommand(const ClientArgs& client, const ForceUnlockArgs& args);
int listCommand(const ClientArgs& client);

} // namespace zlock

#endif // ZLOCK_COMMANDS_H
