#include "common/FullJitter.hpp"
#include <chrono>
#include <stdexcept>
#include <random>
#include <mutex>
#include "common/Util.hpp"

namespace zlock {

FullJitter::FullJitter() : rng(random_generator()) {}

FullJitter::FullJitter(std::mt19937::result_type seed) : rng(seed) {}

std::chrono::microseconds FullJitter::jitter(const std::chrono::microseconds v) {
    if (v < std::chrono::microseconds(0)) {
        throw std::invalid_argument("Negative duration is not supported");
    }
    std::uniform_int_distribution<std::chrono::microseconds::rep> dist(0, v.count());
    const std::lock_guard lock {m};
    return std::chrono::microseconds(dist(rng));
}

} // namespace zlock
