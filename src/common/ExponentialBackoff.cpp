#include "common/ExponentialBackoff.hpp"
#include "common/RetryPolicy.hpp"

#include <algorithm>
#include <optional>
#include <chrono>
#include <cmath>
#include <spdlog/spdlog.h>

namespace zlock {

ExponentialBackoff::ExponentialBackoff(const RetryPolicy p)
    : policy {p} {}

std::optional<std::chrono::microseconds> ExponentialBackoff::nextDelay(int attempt, std::chrono::microseconds elapsed) const {
    if (policy.maxAttempts.has_value() && attempt >= policy.maxAttempts.value()) {
        return std::nullopt;
    }
    if (policy.maxElapsed.has_value() && elapsed >= policy.maxElapsed.value()) {
        return std::nullopt;
    }
    const auto exponent = static_cast<double>(std::max(attempt, 1) - 1);
    const auto raw = static_cast<double>(policy.baseDelay.count()) * std::pow(policy.backoffFactor, exponent);
    const auto cap = static_cast<double>(policy.maxDelay.count());
    auto delay = std::chrono::microseconds{static_cast<std::chrono::microseconds::rep>(std::min(raw, cap))};
    if (policy.maxElapsed.has_value()) {
        delay = std::min(delay, policy.maxElapsed.value() - elapsed);
    }
    spdlog::debug("ExponentialBackoff: Attempt {}, delay: {}us, maxDelay: {}us", attempt, delay.count(), policy.maxDelay.count());
    return delay;
}

} // namespace zlock
