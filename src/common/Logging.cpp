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
#include <memory>
#include <vector>
#include "spdlog/async.h"
#include "spdlog/async_logger.h"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

namespace zlock {

void initLogging(const std::string& name, spdlog::level::level_enum level, const std::optional<std::string>& file) {
    spdlog::init_thread_pool(8192, 1);
    std::vector<spdlog::sink_ptr> sinks {std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
    if (file.has_value()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file.value(), 1024 * 1024 * 5, 3));
    }
    const auto asyncLogger = std::make_shared<spdlog::async_logger>(
        name, sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::overrun_oldest);
    asyncLogger->set_level(level);
    spdlog::register_logger(asyncLogger);
    spdlog::set_default_logger(asyncLogger);
}

} // namespace zlock
