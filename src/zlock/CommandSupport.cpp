#include "zlock/CommandSupport.hpp"
#include "common/RetryPolicy.hpp"
#include "common/Util.hpp"
#include <stdexcept>

namespace zlock {

std::optional<std::chrono::microseconds> optionalDuration(const std::string& text, const std::string& flag) {
    if (text.empty()) {
        return std::nullopt;
    }
    auto d = parseDuration(text);
    if (!d.has_value()) {
        throw std::invalid_argument(flag + ": " + d.error().what);
    }
    return d.value();
}

std::chrono::microseconds requiredDuration(const std::string& text, const std::string& flag) {
    auto d = optionalDuration(text, flag);
    if (!d.has_value()) {
        throw std::invalid_argument(flag + ": value required");
    }
    return d.value();
}

StrategyKind strategyKind(const ClientArgs& client) {
    auto kind = parseStrategyKind(client.strategy);
    if (!kind.has_value()) {
        throw std::invalid_argument(kind.error().what);
    }
    return kind.value();
}

std::expected<LockOptions, Error> toLockOptions(const ClientArgs& client, const RunArgs& args) {
    if (args.maxAttempts < 0) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "--max-attempts must be >= 0"}};
    }
    if (args.maxAttempts == 0 && args.maxElapsed.empty()) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "--max-attempts 0 needs --max-elapsed to bound the retries"}};
    }
    try {
        LockOptions options {
            strategyKind(client),
            optionalDuration(args.ttl, "--ttl"),
            RetryPolicy{
                requiredDuration(args.backoffBase, "--backoff-base"),
                args.backoffFactor,
                requiredDuration(args.backoffCap, "--backoff-cap"),
                args.maxAttempts > 0 ? std::optional<int>{args.maxAttempts} : std::nullopt,
                optionalDuration(args.maxElapsed, "--max-elapsed")
            },
            args.reclaimStale ? StalePolicy::Reclaim : StalePolicy::Report,
            args.operation,
            3
        };
        options.validate();
        return options;
    } catch (const std::invalid_argument& e) {
        return std::unexpected {Error{ErrorCode::InvalidArg, e.what()}};
    }
}

int exitCodeFor(const Error& error) {
    switch (error.code) {
        case ErrorCode::AlreadyLocked:
        case ErrorCode::StaleLock:
        case ErrorCode::BudgetExhausted:
        case ErrorCode::Cancelled:
        case ErrorCode::Transient:
            return exitLockUnavailable;
        default:
            return exitFailure;
    }
}

int reportRunResult(const RunResult& result, std::ostream& err) {
    if (!result.has_value()) {
        err << "zlock: " << result.error() << '\n';
        return exitCodeFor(result.error());
    }
    if (result->releaseWarning.has_value()) {
        err << "zlock: warning: " << result->releaseWarning.value() << '\n';
    }
    if (result->cancellation.has_value()) {
        err << "zlock: " << result->cancellation.value() << '\n';
        return exitCodeFor(result->cancellation.value());
    }
    if (!result->result.has_value()) {
        err << "zlock: " << result->result.error() << '\n';
        return exitFailure;
    }
    return result->result.value();
}

} // namespace zlock
