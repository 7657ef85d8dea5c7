#pragma once

/**
 * @file RetryController.h
 * @brief Bounded retries with exponential backoff around a session attempt
 */

#include "Logger.h"
#include "MetricsCollector.h"
#include "Result.h"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace NetLink {

struct RetryPolicy {
    int maxAttempts{3};
    std::chrono::milliseconds baseDelay{2000};

    /// base * 2^(attempt-1): 2s, 4s, 8s ... for the default base
    std::chrono::milliseconds delayForAttempt(int attempt) const;
};

/**
 * @brief Runs an attempt closure until it succeeds, fails fatally or the bound is hit
 *
 * Only connection-category errors are retried. After maxAttempts
 * retryable failures the last error is returned with the attempt count
 * appended to its message.
 */
class RetryController {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using RetryObserver = std::function<void(int attempt, const nlk::Error& error,
                                             std::chrono::milliseconds delay)>;

    explicit RetryController(RetryPolicy policy = RetryPolicy{}, Sleeper sleeper = nullptr);

    template<typename T>
    nlk::Result<T> run(const std::function<nlk::Result<T>(int attempt)>& attempt);

    void setRetryObserver(RetryObserver observer) { observer_ = std::move(observer); }

    const RetryPolicy& policy() const { return policy_; }
    int attempts() const { return attempts_; }
    std::chrono::milliseconds totalDelay() const { return totalDelay_; }
    const std::optional<nlk::Error>& lastError() const { return lastError_; }

private:
    RetryPolicy policy_;
    Sleeper sleeper_;
    RetryObserver observer_;
    int attempts_{0};
    std::chrono::milliseconds totalDelay_{0};
    std::optional<nlk::Error> lastError_;

    /// Decide what to do after a failed attempt; returns true to try again
    bool handleFailure(int attempt, const nlk::Error& error);
};

template<typename T>
nlk::Result<T> RetryController::run(const std::function<nlk::Result<T>(int attempt)>& attempt) {
    attempts_ = 0;
    totalDelay_ = std::chrono::milliseconds{0};
    lastError_.reset();

    const int maxAttempts = policy_.maxAttempts < 1 ? 1 : policy_.maxAttempts;
    for (int current = 1; current <= maxAttempts; ++current) {
        attempts_ = current;
        nlk::Result<T> result = attempt(current);
        if (result.ok()) {
            return result;
        }
        lastError_ = result.error();
        if (!handleFailure(current, result.error())) {
            if (result.error().retryable()) {
                return nlk::Error{result.error().code,
                    result.error().message + " (gave up after " + std::to_string(current) + " attempts)"};
            }
            return result;
        }
    }
    return nlk::Error{nlk::ErrorCode::InternalError, "Retry loop exited without a result"};
}

} // namespace NetLink
