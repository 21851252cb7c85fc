#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <string>
#include <type_traits>

#include "config.hpp"
#include "result.hpp"
#include "logging.hpp"

namespace supervisor {

    // Blocking wait used between attempts and between cycles; tests inject a recorder
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    struct RetryPolicy {
        int max_attempts = 3;
        std::chrono::milliseconds initial_delay{500};
        double multiplier = 2.0;
        std::chrono::milliseconds max_delay{8000};

        static RetryPolicy fromConfig(const core::RetryConfig& config);

        // Wait after the `failed_attempt`-th failure (1-based): initial * multiplier^(n-1), capped
        std::chrono::milliseconds delayAfter(int failed_attempt) const;
    };

    // Runs `operation` (returning a core::Result) until it succeeds, fails with a
    // non-retryable kind, or the attempt bound is reached. Exhaustion yields a single
    // error of the last kind; the caller treats it as "skip this cycle".
    template<typename Operation>
    auto withRetry(const RetryPolicy& policy, const Sleeper& sleep, const std::string& what,
                   Operation&& operation) -> std::invoke_result_t<Operation&>
    {
        using ResultType = std::invoke_result_t<Operation&>;
        auto logger = core::logging::getLogger();
        const int attempts = std::max(1, policy.max_attempts);

        for (int attempt = 1; ; ++attempt) {
            ResultType result = operation();
            if (result.ok()) {
                if (attempt > 1) {
                    logger->info("{} succeeded on attempt {}/{}.", what, attempt, attempts);
                }
                return result;
            }

            const core::Error& error = result.error();
            if (!core::isRetryable(error.kind)) {
                logger->warn("{} failed ({}), not retried: {}", what, core::errorKindToString(error.kind), error.message);
                return result;
            }
            if (attempt >= attempts) {
                logger->warn("{} failed after {} attempts: {}", what, attempts, error.message);
                return ResultType(core::Error{error.kind,
                    what + " failed after " + std::to_string(attempts) + " attempts: " + error.message});
            }

            auto delay = policy.delayAfter(attempt);
            logger->warn("{} attempt {}/{} failed ({}): {}. Retrying in {} ms.", what, attempt, attempts,
                         core::errorKindToString(error.kind), error.message, delay.count());
            if (sleep) {
                sleep(delay);
            }
        }
    }

} // namespace supervisor
