#ifndef CHILD_PROCESS_H
#define CHILD_PROCESS_H

#include <expected>
#include <string>
#include <vector>
#include "common/Canceller.hpp"
#include "common/Error.hpp"

namespace zlock {

constexpr int exitCommandNotFound = 127;

// Runs argv[0] with PATH lookup and waits for it. Once the canceller fires
// the child gets SIGTERM, and the wait continues until it exits.
// Returns the exit status, 128 + signal for a signalled child.
std::expected<int, Error> runChild(const std::vector<std::string>& argv, const Canceller& canceller);

} // namespace zlock

#endif // CHILD_PROCESS_H
