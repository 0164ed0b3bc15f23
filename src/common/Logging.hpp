#ifndef LOGGING_H
#define LOGGING_H

#include <optional>
#include <string>
#include <spdlog/common.h>

namespace zlock {

// Installs an async default logger writing to stderr, plus a rotating file
// sink when a path is given. Call spdlog::shutdown() before exit.
void initLogging(const std::string& name, spdlog::level::level_enum level, const std::optional<std::string>& file = std::nullopt);

} // namespace zlock

#endif // LOGGING_H
