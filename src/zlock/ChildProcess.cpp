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
#include "zlock/ChildProcess.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace zlock {

namespace {

constexpr std::chrono::milliseconds pollInterval {10};

int exitCodeOf(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

} // namespace

std::expected<int, Error> runChild(const std::vector<std::string>& argv, const Canceller& canceller) {
    if (argv.empty()) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "No command given"}};
    }
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        return std::unexpected {Error{ErrorCode::Internal, std::string{"fork failed: "} + std::strerror(errno)}};
    }
    if (pid == 0) {
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        execvp(args[0], args.data());
        _exit(exitCommandNotFound);
    }
    spdlog::debug("Started '{}' as pid {}", argv.front(), pid);

    bool forwarded = false;
    while (true) {
        int status = 0;
        const pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            const int code = exitCodeOf(status);
            spdlog::debug("pid {} exited with {}", pid, code);
            return code;
        }
        if (r < 0 && errno != EINTR) {
            return std::unexpected {Error{ErrorCode::Internal, std::string{"waitpid failed: "} + std::strerror(errno)}};
        }
        if (!forwarded && canceller.cancelled()) {
            spdlog::warn("Cancellation requested, sending SIGTERM to pid {}", pid);
            kill(pid, SIGTERM);
            forwarded = true;
        }
        std::this_thread::sleep_for(pollInterval);
    }
}

} // namespace zlock
