#include "retry.hpp"
#include <cmath>

namespace supervisor {

    RetryPolicy RetryPolicy::fromConfig(const core::RetryConfig& config) {
        RetryPolicy policy;
        policy.max_attempts = config.max_attempts;
        policy.initial_delay = std::chrono::milliseconds(config.initial_delay_ms);
        policy.multiplier = config.multiplier;
        policy.max_delay = std::chrono::milliseconds(config.max_delay_ms);
        return policy;
    }

    std::chrono::milliseconds RetryPolicy::delayAfter(int failed_attempt) const {
        if (failed_attempt < 1) {
            failed_attempt = 1;
        }
        double delay_ms = static_cast<double>(initial_delay.count()) * std::pow(multiplier, failed_attempt - 1);
        double cap_ms = static_cast<double>(max_delay.count());
        if (delay_ms > cap_ms) {
            delay_ms = cap_ms;
        }
        return std::chrono::milliseconds(static_cast<long long>(delay_ms));
    }

} // namespace supervisor
