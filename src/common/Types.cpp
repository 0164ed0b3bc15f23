#include "common/Types.hpp"
#include <chrono>

namespace zlock {

Clock systemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

} // namespace zlock
