#include "RetryController.h"
#include <thread>

namespace NetLink {

std::chrono::milliseconds RetryPolicy::delayForAttempt(int attempt) const {
    if (attempt < 1) attempt = 1;
    // Cap the shift so a silly maxAttempts cannot overflow
    int shift = attempt - 1 > 20 ? 20 : attempt - 1;
    return baseDelay * (int64_t{1} << shift);
}

RetryController::RetryController(RetryPolicy policy, Sleeper sleeper)
    : policy_(policy)
    , sleeper_(std::move(sleeper))
{
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

bool RetryController::handleFailure(int attempt, const nlk::Error& error) {
    auto& logger = Logger::instance();

    if (!error.retryable()) {
        logger.log(LogLevel::ERROR, "Attempt " + std::to_string(attempt) + " failed with " +
                   nlk::errorCategoryToString(error.category()) + " error, not retrying: " + error.message,
                   "RetryController");
        return false;
    }

    if (attempt >= policy_.maxAttempts) {
        logger.log(LogLevel::ERROR, "Attempt " + std::to_string(attempt) + "/" +
                   std::to_string(policy_.maxAttempts) + " failed, giving up: " + error.message,
                   "RetryController");
        return false;
    }

    auto delay = policy_.delayForAttempt(attempt);
    logger.log(LogLevel::WARN, "Attempt " + std::to_string(attempt) + "/" +
               std::to_string(policy_.maxAttempts) + " failed: " + error.message +
               ", retrying in " + std::to_string(delay.count()) + "ms", "RetryController");

    MetricsCollector::instance().incrementRetryAttempts();
    if (observer_) {
        observer_(attempt, error, delay);
    }

    sleeper_(delay);
    totalDelay_ += delay;
    return true;
}

} // namespace NetLink
