#ifndef EXPONENTIAL_BACKOFF_H
#define EXPONENTIAL_BACKOFF_H

#include "common/RetryPolicy.hpp"
#include <optional>
#include <chrono>

namespace zlock {

class ExponentialBackoff {
public:
    explicit ExponentialBackoff(const RetryPolicy policy);
    // attempt counts the acquire attempts already made (>= 1). Returns the
    // delay to wait before the next one, or nullopt once the budget is spent.
    [[nodiscard]] std::optional<std::chrono::microseconds> nextDelay(int attempt, std::chrono::microseconds elapsed) const;
private:
    RetryPolicy policy;
};

} // namespace zlock

#endif // EXPONENTIAL_BACKOFF_H
