#pragma once
#include <algorithm>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include "logging/logger.hpp"

/**
 * @brief Exponential backoff schedule: base * 2^(attempt-1), capped at max
 */
struct BackoffPolicy
{
    int max_attempts = 3;
    int base_ms = 1000;
    int max_ms = 30000;

    int delayForAttempt(int attempt) const
    {
        if (attempt < 1 || base_ms <= 0)
            return 0;
        long long delay = base_ms;
        for (int i = 1; i < attempt && delay < max_ms; ++i)
        {
            delay *= 2;
        }
        return static_cast<int>(std::min<long long>(delay, max_ms));
    }
};

class ErrorRecovery
{
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /**
     * @brief Run func(attempt) until it succeeds, should_retry rejects the result, or attempts run out
     *
     * func receives the 1-based attempt number. The last result is returned
     * whether or not it succeeded; the caller inspects it.
     */
    template <typename Func, typename RetryPredicate>
    static auto retryWithBackoff(Func func, const BackoffPolicy &policy, const std::string &operation_name,
                                 RetryPredicate should_retry, const Sleeper &sleeper = defaultSleeper())
        -> decltype(func(1))
    {
        int max_attempts = std::max(1, policy.max_attempts);
        for (int attempt = 1;; ++attempt)
        {
            auto result = func(attempt);
            if (!should_retry(result))
            {
                return result;
            }
            if (attempt >= max_attempts)
            {
                Logger::error("Operation '" + operation_name + "' failed after " +
                              std::to_string(max_attempts) + " attempts");
                return result;
            }

            int delay_ms = policy.delayForAttempt(attempt);
            Logger::warn("Operation '" + operation_name + "' failed, retrying in " +
                         std::to_string(delay_ms) + "ms (attempt " + std::to_string(attempt) +
                         "/" + std::to_string(max_attempts) + ")");
            sleeper(std::chrono::milliseconds(delay_ms));
        }
    }

    static Sleeper defaultSleeper()
    {
        return [](std::chrono::milliseconds delay)
        { std::this_thread::sleep_for(delay); };
    }
};
