#pragma once

#include "resilience/ResilienceConfig.hpp"
#include <chrono>
#include <cstdlib>
#include <string>

namespace matchmaking::settings {

/**
 * @brief Параметры breaker'а, ретраев и таймаута удалённых вызовов
 *
 * Читает из ENV:
 * - BREAKER_FAILURE_THRESHOLD (default: 5)
 * - BREAKER_RESET_TIMEOUT_SECONDS (default: 60)
 * - RETRY_MAX_ATTEMPTS (default: 3)
 * - RETRY_BASE_DELAY_MS (default: 1000)
 * - RETRY_MAX_DELAY_MS (default: 10000)
 * - DEPENDENCY_CALL_TIMEOUT_MS (default: 5000)
 * - DEPENDENCY_CALL_WORKERS (default: 8)
 */
class ResilienceSettings {
public:
    ResilienceSettings() {
        failureThreshold_ = getIntOrDefault("BREAKER_FAILURE_THRESHOLD", 5);
        resetTimeoutSeconds_ = getIntOrDefault("BREAKER_RESET_TIMEOUT_SECONDS", 60);
        maxAttempts_ = getIntOrDefault("RETRY_MAX_ATTEMPTS", 3);
        baseDelayMs_ = getIntOrDefault("RETRY_BASE_DELAY_MS", 1000);
        maxDelayMs_ = getIntOrDefault("RETRY_MAX_DELAY_MS", 10000);
        callTimeoutMs_ = getIntOrDefault("DEPENDENCY_CALL_TIMEOUT_MS", 5000);
        callWorkers_ = getIntOrDefault("DEPENDENCY_CALL_WORKERS", 8);
    }

    int getFailureThreshold() const { return failureThreshold_; }
    int getResetTimeoutSeconds() const { return resetTimeoutSeconds_; }
    int getMaxAttempts() const { return maxAttempts_; }
    int getBaseDelayMs() const { return baseDelayMs_; }
    int getMaxDelayMs() const { return maxDelayMs_; }
    int getCallTimeoutMs() const { return callTimeoutMs_; }
    int getCallWorkers() const { return callWorkers_; }

    resilience::ResilienceConfig toConfig() const {
        resilience::ResilienceConfig config;
        config.breaker.failureThreshold = failureThreshold_;
        config.breaker.resetTimeout = std::chrono::seconds(resetTimeoutSeconds_);
        config.retry.maxAttempts = maxAttempts_;
        config.retry.baseDelay = std::chrono::milliseconds(baseDelayMs_);
        config.retry.maxDelay = std::chrono::milliseconds(maxDelayMs_);
        config.callTimeout = std::chrono::milliseconds(callTimeoutMs_);
        config.callWorkers = callWorkers_;
        return config;
    }

private:
    int failureThreshold_;
    int resetTimeoutSeconds_;
    int maxAttempts_;
    int baseDelayMs_;
    int maxDelayMs_;
    int callTimeoutMs_;
    int callWorkers_;

    static int getIntOrDefault(const char* name, int defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::stoi(value) : defaultValue;
    }
};

} // namespace matchmaking::settings
